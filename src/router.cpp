#include <linechat/router.hpp>

#include <linechat/Metrics.hpp>
#include <linechat/PersistenceGateway.hpp>
#include <linechat/presence.hpp>
#include <linechat/protocol.hpp>
#include <linechat/session.hpp>

#include <vix/utils/Logger.hpp>

#include <type_traits>

namespace linechat
{
    using Logger = vix::utils::Logger;

    static Logger &logger = Logger::getInstance();

    MessageRouter::MessageRouter(std::shared_ptr<IPersistenceGateway> gateway,
                                 std::shared_ptr<PresenceRegistry> registry,
                                 std::shared_ptr<ChatMetrics> metrics)
        : gateway_(gateway),
          registry_(registry),
          metrics_(std::move(metrics)),
          resolver_(std::move(gateway), std::move(registry))
    {
    }

    void MessageRouter::route(const Session &sender, const ChatMessage &msg)
    {
        std::visit(
            [&](const auto &target)
            {
                using T = std::decay_t<decltype(target)>;
                if constexpr (std::is_same_v<T, ToUser>)
                {
                    route_private(sender, target.username, msg.content, msg.timestamp);
                }
                else
                {
                    route_group(sender, target.groupId, msg.content, msg.timestamp);
                }
            },
            msg.target);
    }

    void MessageRouter::route_private(const Session &sender,
                                      const std::string &targetUsername,
                                      const std::string &content,
                                      Clock::time_point timestamp)
    {
        if (!sender.authenticated())
        {
            logger.log(Logger::Level::WARN,
                       "[chat][Router] Dropping private message from unauthenticated session");
            return;
        }

        if (metrics_)
            metrics_->private_messages_total++;

        if (auto target = registry_->lookup(targetUsername))
        {
            target->send_line(reply::incoming_private(sender.username(), content));
            if (metrics_)
                metrics_->pushes_total++;
        }
        else
        {
            logger.log(Logger::Level::DEBUG,
                       "[chat][Router] {} is offline, message from {} stored only",
                       targetUsername, sender.username());
        }

        // recipient id comes from durable storage, not presence
        std::optional<UserId> recipientId;
        try
        {
            recipientId = gateway_->find_user_id(targetUsername);
        }
        catch (const std::exception &e)
        {
            if (metrics_)
                metrics_->errors_total++;
            logger.log(Logger::Level::WARN,
                       "[chat][Router] Cannot resolve recipient {}: {}", targetUsername, e.what());
        }

        log_message(sender, recipientId, std::nullopt, content, timestamp);
    }

    void MessageRouter::route_group(const Session &sender,
                                    GroupId groupId,
                                    const std::string &content,
                                    Clock::time_point timestamp)
    {
        if (!sender.authenticated())
        {
            logger.log(Logger::Level::WARN,
                       "[chat][Router] Dropping group message from unauthenticated session");
            return;
        }

        if (metrics_)
            metrics_->group_messages_total++;

        std::vector<std::shared_ptr<Session>> members;
        try
        {
            members = resolver_.resolve(groupId);
        }
        catch (const std::exception &e)
        {
            if (metrics_)
                metrics_->errors_total++;
            logger.log(Logger::Level::WARN,
                       "[chat][Router] Cannot resolve group {}: {}", groupId, e.what());
        }

        const std::string line = reply::incoming_group(groupId, sender.username(), content);
        for (const auto &member : members)
        {
            member->send_line(line);
        }

        if (metrics_)
            metrics_->pushes_total += members.size();

        logger.log(Logger::Level::DEBUG,
                   "[chat][Router] Group {} message from {} pushed to {} session(s)",
                   groupId, sender.username(), members.size());

        log_message(sender, std::nullopt, groupId, content, timestamp);
    }

    void MessageRouter::broadcast_roster()
    {
        std::vector<std::string> usernames;
        try
        {
            usernames = gateway_->all_usernames();
        }
        catch (const std::exception &e)
        {
            if (metrics_)
                metrics_->errors_total++;
            logger.log(Logger::Level::WARN,
                       "[chat][Router] Roster broadcast skipped: {}", e.what());
            return;
        }

        const auto lines = reply::roster(usernames);

        // snapshot() releases the registry lock before any write is queued
        const auto online = registry_->snapshot();
        for (const auto &entry : online)
        {
            entry.session->send_lines(lines);
        }

        if (metrics_)
            metrics_->pushes_total += online.size();
    }

    void MessageRouter::log_message(const Session &sender,
                                    std::optional<UserId> recipientId,
                                    std::optional<GroupId> groupId,
                                    const std::string &content,
                                    Clock::time_point timestamp)
    {
        try
        {
            gateway_->save_message(*sender.user_id(), recipientId, groupId, content, timestamp);
        }
        catch (const std::exception &e)
        {
            if (metrics_)
                metrics_->errors_total++;
            logger.log(Logger::Level::WARN,
                       "[chat][Router] Failed to log message from {}: {}",
                       sender.username(), e.what());
        }
    }

} // namespace linechat
