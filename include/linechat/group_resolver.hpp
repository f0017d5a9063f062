#ifndef LINECHAT_GROUP_RESOLVER_HPP
#define LINECHAT_GROUP_RESOLVER_HPP

#include <memory>
#include <vector>

#include <linechat/message.hpp>

namespace linechat
{
    class IPersistenceGateway;
    class PresenceRegistry;
    class Session;

    /**
     * @brief Turns a group id into its members that are online right now.
     *
     * Membership is read from the gateway on every call (no cache). Members
     * without a live session are left out silently; gateway failures
     * propagate to the caller.
     */
    class GroupResolver
    {
    public:
        GroupResolver(std::shared_ptr<IPersistenceGateway> gateway,
                      std::shared_ptr<PresenceRegistry> registry);

        [[nodiscard]] std::vector<std::shared_ptr<Session>> resolve(GroupId groupId) const;

    private:
        std::shared_ptr<IPersistenceGateway> gateway_;
        std::shared_ptr<PresenceRegistry> registry_;
    };

} // namespace linechat

#endif // LINECHAT_GROUP_RESOLVER_HPP
