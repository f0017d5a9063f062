#ifndef LINECHAT_ROUTER_HPP
#define LINECHAT_ROUTER_HPP

#include <memory>
#include <optional>
#include <string>

#include <linechat/group_resolver.hpp>
#include <linechat/message.hpp>

namespace linechat
{
    class IPersistenceGateway;
    class PresenceRegistry;
    class Session;
    struct ChatMetrics;

    /**
     * @brief Delivers chat messages to live sessions and logs them durably.
     *
     * Delivery is at-most-once and never waits on the log write; logging
     * failures are reported in the server log only.
     */
    class MessageRouter
    {
    public:
        MessageRouter(std::shared_ptr<IPersistenceGateway> gateway,
                      std::shared_ptr<PresenceRegistry> registry,
                      std::shared_ptr<ChatMetrics> metrics = nullptr);

        /// Dispatch on the message target.
        void route(const Session &sender, const ChatMessage &msg);

        /// Push to the target if online; log against its durable id (or none).
        void route_private(const Session &sender,
                           const std::string &targetUsername,
                           const std::string &content,
                           Clock::time_point timestamp = Clock::now());

        /// Push to every online member; log once against the group.
        void route_group(const Session &sender,
                         GroupId groupId,
                         const std::string &content,
                         Clock::time_point timestamp = Clock::now());

        /// Durable roster (USER lines + USER_END) to every online session.
        void broadcast_roster();

    private:
        void log_message(const Session &sender,
                         std::optional<UserId> recipientId,
                         std::optional<GroupId> groupId,
                         const std::string &content,
                         Clock::time_point timestamp);

        std::shared_ptr<IPersistenceGateway> gateway_;
        std::shared_ptr<PresenceRegistry> registry_;
        std::shared_ptr<ChatMetrics> metrics_;
        GroupResolver resolver_;
    };

} // namespace linechat

#endif // LINECHAT_ROUTER_HPP
