#include <linechat/protocol.hpp>

#include <charconv>
#include <optional>
#include <type_traits>

namespace linechat
{
    namespace
    {
        constexpr std::string_view kCredentialSeparator = "::";
        constexpr std::string_view kToPrefix = "TO::";
        constexpr std::string_view kGroupPrefix = "GROUP::";

        struct Parts
        {
            std::string_view verb;
            std::string_view field;
            std::string_view rest;
            bool hasField = false;
        };

        // VERB|field|rest, the remainder keeps any further '|'.
        Parts split_line(std::string_view line)
        {
            Parts p;
            auto first = line.find('|');
            if (first == std::string_view::npos)
            {
                p.verb = line;
                return p;
            }

            p.verb = line.substr(0, first);
            p.hasField = true;

            auto tail = line.substr(first + 1);
            auto second = tail.find('|');
            if (second == std::string_view::npos)
            {
                p.field = tail;
            }
            else
            {
                p.field = tail.substr(0, second);
                p.rest = tail.substr(second + 1);
            }
            return p;
        }

        std::optional<GroupId> parse_group_id(std::string_view s)
        {
            if (s.empty())
                return std::nullopt;

            GroupId value = 0;
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
            if (ec != std::errc{} || ptr != s.data() + s.size() || value < 0)
                return std::nullopt;

            return value;
        }

        template <typename Credentials>
        Command parse_credentials(std::string_view verb, const Parts &p)
        {
            auto sep = p.field.find(kCredentialSeparator);
            if (!p.hasField || sep == std::string_view::npos || sep == 0)
                return MalformedCommand{std::string{verb}};

            Credentials c;
            c.username = std::string{p.field.substr(0, sep)};
            c.password = std::string{p.field.substr(sep + kCredentialSeparator.size())};
            return c;
        }

        Command parse_send(const Parts &p)
        {
            if (p.field.substr(0, kToPrefix.size()) == kToPrefix)
            {
                auto username = p.field.substr(kToPrefix.size());
                if (username.empty())
                    return MalformedCommand{"MSG"};

                return SendCommand{ToUser{std::string{username}}, std::string{p.rest}};
            }

            if (p.field.substr(0, kGroupPrefix.size()) == kGroupPrefix)
            {
                auto id = parse_group_id(p.field.substr(kGroupPrefix.size()));
                if (!id)
                    return MalformedCommand{"MSG"};

                return SendCommand{ToGroup{*id}, std::string{p.rest}};
            }

            return MalformedCommand{"MSG"};
        }
    } // namespace

    Command parse_command(std::string_view line)
    {
        if (line.find_first_not_of(" \t") == std::string_view::npos)
            return EmptyCommand{};

        const Parts p = split_line(line);
        const std::string_view verb = p.verb;

        if (verb == "REGISTER")
            return parse_credentials<RegisterCommand>(verb, p);

        if (verb == "LOGIN")
            return parse_credentials<LoginCommand>(verb, p);

        if (verb == "MSG")
            return parse_send(p);

        if (verb == "CREATE_GROUP")
            return CreateGroupCommand{std::string{p.field}};

        if (verb == "JOIN_GROUP" || verb == "HISTORY_GROUP")
        {
            auto id = parse_group_id(p.field);
            if (!id)
                return MalformedCommand{std::string{verb}};

            if (verb == "JOIN_GROUP")
                return JoinGroupCommand{*id};
            return GroupHistoryCommand{*id};
        }

        if (verb == "HISTORY_PRIVATE")
        {
            if (p.field.empty())
                return MalformedCommand{std::string{verb}};
            return PrivateHistoryCommand{std::string{p.field}};
        }

        if (verb == "GET_USERS")
            return GetUsersCommand{};

        if (verb == "LOGOUT")
            return LogoutCommand{};

        return UnknownCommand{std::string{verb}};
    }

    bool requires_auth(const Command &cmd)
    {
        return std::visit(
            [](const auto &c) -> bool
            {
                using T = std::decay_t<decltype(c)>;
                if constexpr (std::is_same_v<T, RegisterCommand> ||
                              std::is_same_v<T, LoginCommand> ||
                              std::is_same_v<T, EmptyCommand>)
                {
                    return false;
                }
                else if constexpr (std::is_same_v<T, MalformedCommand>)
                {
                    return c.verb != "REGISTER" && c.verb != "LOGIN";
                }
                else
                {
                    return true;
                }
            },
            cmd);
    }

    std::string failure_reply(const MalformedCommand &cmd)
    {
        if (cmd.verb == "REGISTER")
            return std::string{reply::RegisterFail};
        if (cmd.verb == "LOGIN")
            return std::string{reply::LoginFail};
        if (cmd.verb == "JOIN_GROUP")
            return std::string{reply::JoinGroupFail};
        if (cmd.verb == "HISTORY_GROUP")
            return std::string{reply::GroupHistoryFail};
        if (cmd.verb == "HISTORY_PRIVATE")
            return std::string{reply::PrivateHistoryFail};

        return "ERR|Malformed " + cmd.verb;
    }

    namespace reply
    {
        std::string login_ok(UserId id, std::string_view username)
        {
            std::string out = "LOGIN_OK|";
            out += std::to_string(id);
            out += '|';
            out += username;
            return out;
        }

        std::string create_group_ok(GroupId id)
        {
            return "CREATE_GROUP_OK|" + std::to_string(id);
        }

        std::string join_group_ok(GroupId id)
        {
            return "JOIN_GROUP_OK|" + std::to_string(id);
        }

        std::string incoming_private(std::string_view sender, std::string_view content)
        {
            std::string out = "INCOMING_PRIVATE|";
            out += sender;
            out += '|';
            out += content;
            return out;
        }

        std::string incoming_group(GroupId id, std::string_view sender, std::string_view content)
        {
            std::string out = "INCOMING_GROUP|";
            out += std::to_string(id);
            out += '|';
            out += sender;
            out += '|';
            out += content;
            return out;
        }

        std::string private_history_line(std::string_view text)
        {
            return "HISTORY_PRIVATE_LINE|" + std::string{text};
        }

        std::string group_history_line(std::string_view text)
        {
            return "HISTORY_GROUP_LINE|" + std::string{text};
        }

        std::string user(std::string_view username)
        {
            return "USER|" + std::string{username};
        }

        std::vector<std::string> roster(const std::vector<std::string> &usernames)
        {
            std::vector<std::string> lines;
            lines.reserve(usernames.size() + 1);
            for (const auto &name : usernames)
                lines.push_back(user(name));
            lines.emplace_back(UserEnd);
            return lines;
        }
    } // namespace reply

} // namespace linechat
