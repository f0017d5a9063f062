#include <linechat/group_resolver.hpp>

#include <linechat/PersistenceGateway.hpp>
#include <linechat/presence.hpp>

namespace linechat
{
    GroupResolver::GroupResolver(std::shared_ptr<IPersistenceGateway> gateway,
                                 std::shared_ptr<PresenceRegistry> registry)
        : gateway_(std::move(gateway)), registry_(std::move(registry))
    {
    }

    std::vector<std::shared_ptr<Session>> GroupResolver::resolve(GroupId groupId) const
    {
        const auto members = gateway_->group_member_ids(groupId);

        std::vector<std::shared_ptr<Session>> out;
        if (members.empty())
            return out;

        for (auto &entry : registry_->snapshot())
        {
            if (members.count(entry.userId) != 0)
                out.push_back(std::move(entry.session));
        }
        return out;
    }

} // namespace linechat
