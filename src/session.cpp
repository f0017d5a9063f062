#include <linechat/session.hpp>

#include <linechat/Metrics.hpp>
#include <linechat/PersistenceGateway.hpp>
#include <linechat/presence.hpp>
#include <linechat/router.hpp>

namespace linechat
{
    static vix::utils::Logger &logger = vix::utils::Logger::getInstance();

    const char *to_string(SessionState state) noexcept
    {
        switch (state)
        {
        case SessionState::Unauthenticated:
            return "unauthenticated";
        case SessionState::Authenticated:
            return "authenticated";
        case SessionState::Closed:
            return "closed";
        }
        return "unknown";
    }

    Session::Session(SessionContext ctx)
        : ctx_(std::move(ctx)), state_(SessionState::Unauthenticated), userId_(), username_()
    {
    }

    bool Session::handle_line(std::string_view line)
    {
        if (state() == SessionState::Closed)
            return false;

        if (ctx_.metrics)
            ctx_.metrics->lines_in_total++;

        Command cmd = parse_command(line);

        if (!authenticated() && requires_auth(cmd))
        {
            send_line(reply::NotAuthenticated);
            return true;
        }

        return std::visit([this](const auto &c)
                          { return on_command(c); },
                          cmd);
    }

    void Session::send_line(std::string_view line)
    {
        std::string payload;
        payload.reserve(line.size() + 1);
        payload.append(line);
        payload.push_back('\n');
        deliver(std::move(payload));
    }

    void Session::send_lines(const std::vector<std::string> &lines)
    {
        std::string payload;
        for (const auto &line : lines)
        {
            payload += line;
            payload.push_back('\n');
        }

        if (!payload.empty())
            deliver(std::move(payload));
    }

    void Session::finish()
    {
        // Closed and unregistered in one step, as seen by any other thread
        SessionState previous = SessionState::Closed;
        ctx_.registry->unregister_session(*this, [this, &previous]
                                          { previous = state_.exchange(SessionState::Closed); });

        if (previous == SessionState::Closed)
            return;

        if (previous == SessionState::Authenticated)
        {
            logger.log(Logger::Level::INFO,
                       "[chat][Session] {} went offline", username_);
            ctx_.router->broadcast_roster();
        }
    }

    void Session::count_error() noexcept
    {
        if (ctx_.metrics)
            ctx_.metrics->errors_total++;
    }

    // ───────────────────────── Accounts ─────────────────────────

    bool Session::on_command(const RegisterCommand &cmd)
    {
        if (authenticated())
        {
            send_line(reply::AlreadyAuthenticated);
            return true;
        }

        try
        {
            const bool ok = ctx_.gateway->register_user(cmd.username, cmd.password);
            send_line(ok ? reply::RegisterOk : reply::RegisterFail);

            if (ok)
            {
                logger.log(Logger::Level::INFO,
                           "[chat][Session] Registered account {}", cmd.username);
            }
        }
        catch (const std::exception &e)
        {
            count_error();
            logger.log(Logger::Level::WARN,
                       "[chat][Session] REGISTER failed: {}", e.what());
            send_line(reply::RegisterFail);
        }
        return true;
    }

    bool Session::on_command(const LoginCommand &cmd)
    {
        if (authenticated())
        {
            send_line(reply::AlreadyAuthenticated);
            return true;
        }

        std::optional<UserId> id;
        try
        {
            id = ctx_.gateway->authenticate(cmd.username, cmd.password);
        }
        catch (const std::exception &e)
        {
            count_error();
            logger.log(Logger::Level::WARN,
                       "[chat][Session] LOGIN failed: {}", e.what());
            send_line(reply::LoginFail);
            return true;
        }

        if (!id)
        {
            send_line(reply::LoginFail);
            return true;
        }

        // LOGIN_OK is queued before anyone can find this session in the registry
        const bool admitted = ctx_.registry->register_session(
            cmd.username, *id, shared_from_this(),
            [this, &cmd, &id]
            {
                if (state_.load() != SessionState::Unauthenticated)
                    return false;

                userId_ = id;
                username_ = cmd.username;
                state_.store(SessionState::Authenticated);
                send_line(reply::login_ok(*id, cmd.username));
                return true;
            });

        if (!admitted)
        {
            logger.log(Logger::Level::INFO,
                       "[chat][Session] LOGIN refused, {} is already online", cmd.username);
            send_line(reply::LoginFail);
            return true;
        }

        if (ctx_.metrics)
            ctx_.metrics->logins_total++;

        logger.log(Logger::Level::INFO,
                   "[chat][Session] {} logged in (id={})", username_, *userId_);

        ctx_.router->broadcast_roster();
        return true;
    }

    bool Session::on_command(const LogoutCommand &)
    {
        logger.log(Logger::Level::DEBUG, "[chat][Session] LOGOUT from {}", username_);
        return false;
    }

    bool Session::on_command(const GetUsersCommand &)
    {
        try
        {
            send_lines(reply::roster(ctx_.gateway->all_usernames()));
        }
        catch (const std::exception &e)
        {
            count_error();
            logger.log(Logger::Level::WARN,
                       "[chat][Session] GET_USERS failed: {}", e.what());
            send_line(reply::UserFail);
        }
        return true;
    }

    // ───────────────────────── Messaging ─────────────────────────

    bool Session::on_command(const SendCommand &cmd)
    {
        ChatMessage msg;
        msg.senderId = *userId_;
        msg.target = cmd.target;
        msg.content = cmd.content;
        msg.timestamp = Clock::now();

        ctx_.router->route(*this, msg);
        return true;
    }

    bool Session::on_command(const PrivateHistoryCommand &cmd)
    {
        try
        {
            auto other = ctx_.gateway->find_user_id(cmd.otherUsername);
            if (!other)
            {
                send_line(reply::PrivateHistoryFail);
                return true;
            }

            std::vector<std::string> lines;
            for (const auto &text : ctx_.gateway->private_history(*userId_, *other, ctx_.historyLimit))
                lines.push_back(reply::private_history_line(text));
            lines.emplace_back(reply::PrivateHistoryEnd);

            send_lines(lines);
        }
        catch (const std::exception &e)
        {
            count_error();
            logger.log(Logger::Level::WARN,
                       "[chat][Session] HISTORY_PRIVATE failed: {}", e.what());
            send_line(reply::PrivateHistoryFail);
        }
        return true;
    }

    bool Session::on_command(const GroupHistoryCommand &cmd)
    {
        try
        {
            std::vector<std::string> lines;
            for (const auto &text : ctx_.gateway->group_history(cmd.groupId, ctx_.historyLimit))
                lines.push_back(reply::group_history_line(text));
            lines.emplace_back(reply::GroupHistoryEnd);

            send_lines(lines);
        }
        catch (const std::exception &e)
        {
            count_error();
            logger.log(Logger::Level::WARN,
                       "[chat][Session] HISTORY_GROUP failed: {}", e.what());
            send_line(reply::GroupHistoryFail);
        }
        return true;
    }

    // ───────────────────────── Groups ─────────────────────────

    bool Session::on_command(const CreateGroupCommand &cmd)
    {
        if (cmd.name.empty())
        {
            send_line(reply::CreateGroupFail);
            return true;
        }

        try
        {
            // two independent calls, no atomicity between them
            const GroupId id = ctx_.gateway->create_group(cmd.name, *userId_);
            ctx_.gateway->add_member(*userId_, id);

            logger.log(Logger::Level::INFO,
                       "[chat][Session] {} created group {} ({})", username_, id, cmd.name);
            send_line(reply::create_group_ok(id));
        }
        catch (const std::exception &e)
        {
            count_error();
            logger.log(Logger::Level::WARN,
                       "[chat][Session] CREATE_GROUP failed: {}", e.what());
            send_line(reply::CreateGroupFail);
        }
        return true;
    }

    bool Session::on_command(const JoinGroupCommand &cmd)
    {
        try
        {
            ctx_.gateway->add_member(*userId_, cmd.groupId);
            send_line(reply::join_group_ok(cmd.groupId));
        }
        catch (const std::exception &e)
        {
            count_error();
            logger.log(Logger::Level::WARN,
                       "[chat][Session] JOIN_GROUP {} failed: {}", cmd.groupId, e.what());
            send_line(reply::JoinGroupFail);
        }
        return true;
    }

    // ───────────────────────── Protocol errors ─────────────────────────

    bool Session::on_command(const MalformedCommand &cmd)
    {
        logger.log(Logger::Level::DEBUG, "[chat][Session] Malformed {} line", cmd.verb);
        send_line(failure_reply(cmd));
        return true;
    }

    bool Session::on_command(const UnknownCommand &cmd)
    {
        logger.log(Logger::Level::DEBUG, "[chat][Session] Unknown command '{}'", cmd.verb);
        send_line(reply::UnknownVerb);
        return true;
    }

    bool Session::on_command(const EmptyCommand &)
    {
        return true;
    }

} // namespace linechat
