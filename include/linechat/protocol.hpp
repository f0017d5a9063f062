#ifndef LINECHAT_PROTOCOL_HPP
#define LINECHAT_PROTOCOL_HPP

/**
 * @file protocol.hpp
 * @brief Line protocol: command parsing and server reply formatting.
 *
 * Wire format (one command per line, UTF-8):
 *
 *   VERB|field|remainder
 *
 * The line is split on '|' into at most three parts. Credentials use
 * `username::password` in the first field; MSG carries its target in the
 * first field (`TO::bob` or `GROUP::42`) and the content in the remainder,
 * which may itself contain '|'.
 *
 * Public API :
 *   - parse_command(line)  -> Command (closed variant, never throws)
 *   - requires_auth(cmd)   -> whether the command needs a logged-in session
 *   - failure_reply(cmd)   -> the reply line for a malformed command
 *   - reply::*             -> builders for every server line
 */

#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <linechat/message.hpp>

namespace linechat
{
    struct RegisterCommand
    {
        std::string username;
        std::string password;
    };

    struct LoginCommand
    {
        std::string username;
        std::string password;
    };

    struct SendCommand
    {
        MessageTarget target;
        std::string content;
    };

    struct CreateGroupCommand
    {
        std::string name;
    };

    struct JoinGroupCommand
    {
        GroupId groupId = 0;
    };

    struct PrivateHistoryCommand
    {
        std::string otherUsername;
    };

    struct GroupHistoryCommand
    {
        GroupId groupId = 0;
    };

    struct GetUsersCommand
    {
    };

    struct LogoutCommand
    {
    };

    /// A known verb whose fields could not be parsed.
    struct MalformedCommand
    {
        std::string verb;
    };

    struct UnknownCommand
    {
        std::string verb;
    };

    /// Blank line; ignored by the session.
    struct EmptyCommand
    {
    };

    using Command = std::variant<RegisterCommand,
                                 LoginCommand,
                                 SendCommand,
                                 CreateGroupCommand,
                                 JoinGroupCommand,
                                 PrivateHistoryCommand,
                                 GroupHistoryCommand,
                                 GetUsersCommand,
                                 LogoutCommand,
                                 MalformedCommand,
                                 UnknownCommand,
                                 EmptyCommand>;

    /// Parse one inbound line (without its terminator).
    [[nodiscard]] Command parse_command(std::string_view line);

    /// True for every command except REGISTER, LOGIN and blank lines
    /// (malformed REGISTER/LOGIN lines are answered without authentication).
    [[nodiscard]] bool requires_auth(const Command &cmd);

    /// Reply line sent back for a MalformedCommand.
    [[nodiscard]] std::string failure_reply(const MalformedCommand &cmd);

    namespace reply
    {
        inline constexpr std::string_view RegisterOk = "REGISTER_OK";
        inline constexpr std::string_view RegisterFail = "REGISTER_FAIL";
        inline constexpr std::string_view LoginFail = "LOGIN_FAIL";
        inline constexpr std::string_view CreateGroupFail = "CREATE_GROUP_FAIL";
        inline constexpr std::string_view JoinGroupFail = "JOIN_GROUP_FAIL";
        inline constexpr std::string_view PrivateHistoryEnd = "HISTORY_PRIVATE_END";
        inline constexpr std::string_view PrivateHistoryFail = "HISTORY_PRIVATE_FAIL";
        inline constexpr std::string_view GroupHistoryEnd = "HISTORY_GROUP_END";
        inline constexpr std::string_view GroupHistoryFail = "HISTORY_GROUP_FAIL";
        inline constexpr std::string_view UserEnd = "USER_END";
        inline constexpr std::string_view UserFail = "USER_FAIL";
        inline constexpr std::string_view NotAuthenticated = "ERR|Not authenticated";
        inline constexpr std::string_view AlreadyAuthenticated = "ERR|Already authenticated";
        inline constexpr std::string_view UnknownVerb = "ERR|Unknown command";
        inline constexpr std::string_view ServerFull = "ERR|Server full";

        std::string login_ok(UserId id, std::string_view username);
        std::string create_group_ok(GroupId id);
        std::string join_group_ok(GroupId id);
        std::string incoming_private(std::string_view sender, std::string_view content);
        std::string incoming_group(GroupId id, std::string_view sender, std::string_view content);
        std::string private_history_line(std::string_view text);
        std::string group_history_line(std::string_view text);
        std::string user(std::string_view username);

        /// USER|name for each entry followed by USER_END.
        std::vector<std::string> roster(const std::vector<std::string> &usernames);
    } // namespace reply

} // namespace linechat

#endif // LINECHAT_PROTOCOL_HPP
