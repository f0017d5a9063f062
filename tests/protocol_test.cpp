#include <gtest/gtest.h>

#include <linechat/protocol.hpp>

using namespace linechat;

TEST(ProtocolParse, RegisterSplitsCredentials)
{
    auto cmd = parse_command("REGISTER|alice::secret");
    const auto *reg = std::get_if<RegisterCommand>(&cmd);
    ASSERT_NE(reg, nullptr);
    EXPECT_EQ(reg->username, "alice");
    EXPECT_EQ(reg->password, "secret");
}

TEST(ProtocolParse, PasswordKeepsLaterSeparators)
{
    auto cmd = parse_command("LOGIN|alice::p::w");
    const auto *login = std::get_if<LoginCommand>(&cmd);
    ASSERT_NE(login, nullptr);
    EXPECT_EQ(login->username, "alice");
    EXPECT_EQ(login->password, "p::w");
}

TEST(ProtocolParse, CredentialsWithoutSeparatorAreMalformed)
{
    for (const char *line : {"REGISTER|alicesecret", "REGISTER", "LOGIN|::pw"})
    {
        auto cmd = parse_command(line);
        const auto *bad = std::get_if<MalformedCommand>(&cmd);
        ASSERT_NE(bad, nullptr) << line;
        EXPECT_FALSE(requires_auth(cmd)) << line;
    }

    EXPECT_EQ(failure_reply(MalformedCommand{"REGISTER"}), "REGISTER_FAIL");
    EXPECT_EQ(failure_reply(MalformedCommand{"LOGIN"}), "LOGIN_FAIL");
}

TEST(ProtocolParse, PrivateMessageContentMayContainPipes)
{
    auto cmd = parse_command("MSG|TO::bob|a|b|c");
    const auto *send = std::get_if<SendCommand>(&cmd);
    ASSERT_NE(send, nullptr);

    const auto *to = std::get_if<ToUser>(&send->target);
    ASSERT_NE(to, nullptr);
    EXPECT_EQ(to->username, "bob");
    EXPECT_EQ(send->content, "a|b|c");
}

TEST(ProtocolParse, GroupMessage)
{
    auto cmd = parse_command("MSG|GROUP::42|hi all");
    const auto *send = std::get_if<SendCommand>(&cmd);
    ASSERT_NE(send, nullptr);

    const auto *group = std::get_if<ToGroup>(&send->target);
    ASSERT_NE(group, nullptr);
    EXPECT_EQ(group->groupId, 42);
    EXPECT_EQ(send->content, "hi all");
}

TEST(ProtocolParse, MessageWithoutContentIsEmpty)
{
    auto cmd = parse_command("MSG|TO::bob");
    const auto *send = std::get_if<SendCommand>(&cmd);
    ASSERT_NE(send, nullptr);
    EXPECT_TRUE(send->content.empty());
}

TEST(ProtocolParse, BadMessageTargets)
{
    for (const char *line : {"MSG|GROUP::x|hi", "MSG|GROUP::|hi", "MSG|TO::|hi", "MSG|bob|hi", "MSG"})
    {
        auto cmd = parse_command(line);
        const auto *bad = std::get_if<MalformedCommand>(&cmd);
        ASSERT_NE(bad, nullptr) << line;
        EXPECT_EQ(failure_reply(*bad), "ERR|Malformed MSG");
    }
}

TEST(ProtocolParse, GroupIdsMustBeNumeric)
{
    auto join = parse_command("JOIN_GROUP|12");
    ASSERT_TRUE(std::holds_alternative<JoinGroupCommand>(join));
    EXPECT_EQ(std::get<JoinGroupCommand>(join).groupId, 12);

    auto history = parse_command("HISTORY_GROUP|7");
    ASSERT_TRUE(std::holds_alternative<GroupHistoryCommand>(history));
    EXPECT_EQ(std::get<GroupHistoryCommand>(history).groupId, 7);

    auto badJoin = parse_command("JOIN_GROUP|twelve");
    ASSERT_TRUE(std::holds_alternative<MalformedCommand>(badJoin));
    EXPECT_EQ(failure_reply(std::get<MalformedCommand>(badJoin)), "JOIN_GROUP_FAIL");

    auto badHistory = parse_command("HISTORY_GROUP|7x");
    ASSERT_TRUE(std::holds_alternative<MalformedCommand>(badHistory));
    EXPECT_EQ(failure_reply(std::get<MalformedCommand>(badHistory)), "HISTORY_GROUP_FAIL");
}

TEST(ProtocolParse, SimpleVerbs)
{
    EXPECT_TRUE(std::holds_alternative<GetUsersCommand>(parse_command("GET_USERS")));
    EXPECT_TRUE(std::holds_alternative<LogoutCommand>(parse_command("LOGOUT")));
    EXPECT_TRUE(std::holds_alternative<EmptyCommand>(parse_command("")));
    EXPECT_TRUE(std::holds_alternative<EmptyCommand>(parse_command("   ")));

    auto create = parse_command("CREATE_GROUP|friends");
    ASSERT_TRUE(std::holds_alternative<CreateGroupCommand>(create));
    EXPECT_EQ(std::get<CreateGroupCommand>(create).name, "friends");

    auto history = parse_command("HISTORY_PRIVATE|bob");
    ASSERT_TRUE(std::holds_alternative<PrivateHistoryCommand>(history));
    EXPECT_EQ(std::get<PrivateHistoryCommand>(history).otherUsername, "bob");
}

TEST(ProtocolParse, UnknownVerb)
{
    auto cmd = parse_command("PING|x");
    ASSERT_TRUE(std::holds_alternative<UnknownCommand>(cmd));
    EXPECT_EQ(std::get<UnknownCommand>(cmd).verb, "PING");

    // verbs are case sensitive
    EXPECT_TRUE(std::holds_alternative<UnknownCommand>(parse_command("logout")));
}

TEST(ProtocolParse, OnlyAccountCommandsSkipAuthentication)
{
    EXPECT_FALSE(requires_auth(parse_command("REGISTER|a::b")));
    EXPECT_FALSE(requires_auth(parse_command("LOGIN|a::b")));
    EXPECT_FALSE(requires_auth(parse_command("")));

    EXPECT_TRUE(requires_auth(parse_command("MSG|TO::bob|hi")));
    EXPECT_TRUE(requires_auth(parse_command("MSG|nowhere")));
    EXPECT_TRUE(requires_auth(parse_command("GET_USERS")));
    EXPECT_TRUE(requires_auth(parse_command("LOGOUT")));
    EXPECT_TRUE(requires_auth(parse_command("JOIN_GROUP|x")));
    EXPECT_TRUE(requires_auth(parse_command("WHATEVER")));
}

TEST(ProtocolReply, Builders)
{
    EXPECT_EQ(reply::login_ok(3, "alice"), "LOGIN_OK|3|alice");
    EXPECT_EQ(reply::create_group_ok(5), "CREATE_GROUP_OK|5");
    EXPECT_EQ(reply::join_group_ok(5), "JOIN_GROUP_OK|5");
    EXPECT_EQ(reply::incoming_private("alice", "a|b"), "INCOMING_PRIVATE|alice|a|b");
    EXPECT_EQ(reply::incoming_group(7, "alice", "hi"), "INCOMING_GROUP|7|alice|hi");
    EXPECT_EQ(reply::private_history_line("[x] a: b"), "HISTORY_PRIVATE_LINE|[x] a: b");
    EXPECT_EQ(reply::group_history_line("[x] a: b"), "HISTORY_GROUP_LINE|[x] a: b");

    const std::vector<std::string> expected{"USER|alice", "USER|bob", "USER_END"};
    EXPECT_EQ(reply::roster({"alice", "bob"}), expected);
    EXPECT_EQ(reply::roster({}), std::vector<std::string>{"USER_END"});
}
