#ifndef LINECHAT_SESSION_HPP
#define LINECHAT_SESSION_HPP

/**
 * @file session.hpp
 * @brief Per-connection protocol state machine.
 *
 * Responsibilities:
 *  - Parse each inbound line into a Command and dispatch it.
 *  - Enforce Unauthenticated -> Authenticated -> Closed (no way back).
 *  - Register in the PresenceRegistry on LOGIN, unregister on close.
 *  - Map gateway failures to the command's *_FAIL reply.
 *
 * The transport is supplied by a subclass through deliver(); TcpSession is
 * the Boost.Asio one. handle_line() and finish() are called from the
 * connection's own strand only; send_line() may be called from any thread.
 */

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <linechat/message.hpp>
#include <linechat/protocol.hpp>
#include <vix/utils/Logger.hpp>

namespace linechat
{
    class IPersistenceGateway;
    class PresenceRegistry;
    class MessageRouter;
    struct ChatMetrics;

    enum class SessionState
    {
        Unauthenticated,
        Authenticated,
        Closed
    };

    [[nodiscard]] const char *to_string(SessionState state) noexcept;

    /// Shared collaborators handed to every session.
    struct SessionContext
    {
        std::shared_ptr<IPersistenceGateway> gateway;
        std::shared_ptr<PresenceRegistry> registry;
        std::shared_ptr<MessageRouter> router;
        std::shared_ptr<ChatMetrics> metrics;
        std::size_t historyLimit = 1000;
    };

    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        explicit Session(SessionContext ctx);
        virtual ~Session() = default;

        Session(const Session &) = delete;
        Session &operator=(const Session &) = delete;

        /// Process one line (terminator stripped). Returns false once the
        /// connection must be closed (LOGOUT, or already closed).
        bool handle_line(std::string_view line);

        /// Queue one line for the client; '\n' is appended.
        void send_line(std::string_view line);

        /// Queue several lines as one unit so no other push lands in between.
        void send_lines(const std::vector<std::string> &lines);

        /// Closed transition: unregister, roster broadcast. Runs once.
        void finish();

        [[nodiscard]] SessionState state() const noexcept { return state_.load(); }
        [[nodiscard]] bool authenticated() const noexcept { return state() == SessionState::Authenticated; }

        /// Identity; set once on LOGIN before the session becomes visible.
        [[nodiscard]] std::optional<UserId> user_id() const { return userId_; }
        [[nodiscard]] const std::string &username() const noexcept { return username_; }

    protected:
        /// Hand a ready-to-write payload (one or more '\n'-terminated lines)
        /// to the transport. Called from any thread.
        virtual void deliver(std::string payload) = 0;

        [[nodiscard]] const SessionContext &context() const noexcept { return ctx_; }

    private:
        bool on_command(const RegisterCommand &cmd);
        bool on_command(const LoginCommand &cmd);
        bool on_command(const SendCommand &cmd);
        bool on_command(const CreateGroupCommand &cmd);
        bool on_command(const JoinGroupCommand &cmd);
        bool on_command(const PrivateHistoryCommand &cmd);
        bool on_command(const GroupHistoryCommand &cmd);
        bool on_command(const GetUsersCommand &cmd);
        bool on_command(const LogoutCommand &cmd);
        bool on_command(const MalformedCommand &cmd);
        bool on_command(const UnknownCommand &cmd);
        bool on_command(const EmptyCommand &cmd);

        void count_error() noexcept;

    private:
        SessionContext ctx_;
        std::atomic<SessionState> state_{SessionState::Unauthenticated};
        std::optional<UserId> userId_;
        std::string username_;

        using Logger = vix::utils::Logger;
    };

} // namespace linechat

#endif // LINECHAT_SESSION_HPP
