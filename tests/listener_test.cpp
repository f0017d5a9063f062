#include <gtest/gtest.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <linechat/server.hpp>
#include <linechat/tcp_session.hpp>

#include "test_support.hpp"

using namespace linechat;
using linechat::test::LineClient;

namespace
{
    ServerConfig loopback_config()
    {
        ServerConfig cfg;
        cfg.port = 0;
        cfg.ioThreads = 2;
        cfg.maxSessions = 8;
        cfg.maxLineLength = 1024;
        cfg.databasePath = ":memory:";
        return cfg;
    }

    template <typename Pred>
    bool wait_for(Pred pred)
    {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (pred())
                return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return pred();
    }

    /// Uses up every descriptor but one; undone on destruction.
    class DescriptorSqueeze
    {
    public:
        DescriptorSqueeze()
        {
            ::getrlimit(RLIMIT_NOFILE, &original_);

            rlimit lowered = original_;
            lowered.rlim_cur = std::min<rlim_t>(original_.rlim_cur, 512);
            ::setrlimit(RLIMIT_NOFILE, &lowered);

            for (;;)
            {
                int fd = ::open("/dev/null", O_RDONLY);
                if (fd < 0)
                    break;
                held_.push_back(fd);
            }

            if (!held_.empty())
            {
                ::close(held_.back());
                held_.pop_back();
            }
        }

        ~DescriptorSqueeze() { release(); }

        void release()
        {
            for (int fd : held_)
                ::close(fd);
            held_.clear();
            ::setrlimit(RLIMIT_NOFILE, &original_);
        }

        bool exhausted() const { return !held_.empty(); }

    private:
        rlimit original_{};
        std::vector<int> held_;
    };

    int raw_connect(unsigned short port)
    {
        int fd = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0)
            return -1;

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        if (::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0)
        {
            ::close(fd);
            return -1;
        }

        timeval timeout{5, 0};
        ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
        return fd;
    }

    std::string raw_read_line(int fd)
    {
        std::string line;
        char c = 0;
        while (::recv(fd, &c, 1, 0) == 1 && c != '\n')
            line.push_back(c);
        return line;
    }

    void sign_up(LineClient &client, const std::string &name)
    {
        client.send("REGISTER|" + name + "::pw");
        ASSERT_EQ(client.read_line(), std::optional<std::string>("REGISTER_OK"));
        client.send("LOGIN|" + name + "::pw");
        auto ok = client.read_line();
        ASSERT_TRUE(ok.has_value());
        EXPECT_EQ(ok->rfind("LOGIN_OK|", 0), 0u) << *ok;
    }
}

class ListenerTest : public ::testing::Test
{
protected:
    void start(ServerConfig cfg = loopback_config())
    {
        server = std::make_unique<Server>(cfg, std::make_shared<SqliteGateway>(":memory:"));
        server->start();
    }

    void TearDown() override
    {
        if (server)
            server->stop();
    }

    std::unique_ptr<Server> server;
};

TEST_F(ListenerTest, PrivateMessageBetweenTwoClients)
{
    start();
    LineClient alice(server->port());
    LineClient bob(server->port());

    sign_up(alice, "alice");
    sign_up(bob, "bob");

    alice.send("MSG|TO::bob|hello over tcp");
    EXPECT_EQ(bob.read_until_prefix("INCOMING_PRIVATE|"),
              std::optional<std::string>("INCOMING_PRIVATE|alice|hello over tcp"));

    // the roster broadcast from bob's login reached alice as well
    alice.send("GET_USERS");
    EXPECT_EQ(alice.read_until_prefix("USER|bob"), std::optional<std::string>("USER|bob"));
}

TEST_F(ListenerTest, CarriageReturnsAreStripped)
{
    start();
    LineClient client(server->port());

    client.send_raw("REGISTER|carol::pw\r\n");
    EXPECT_EQ(client.read_line(), std::optional<std::string>("REGISTER_OK"));

    client.send_raw("LOGIN|carol::pw\r\n");
    EXPECT_EQ(client.read_until_prefix("LOGIN_OK|"),
              std::optional<std::string>("LOGIN_OK|1|carol"));
}

TEST_F(ListenerTest, UnauthenticatedCommandIsRejected)
{
    start();
    LineClient client(server->port());

    client.send("GET_USERS");
    EXPECT_EQ(client.read_line(), std::optional<std::string>("ERR|Not authenticated"));
}

TEST_F(ListenerTest, LogoutClosesConnectionAndClearsPresence)
{
    start();
    LineClient client(server->port());
    sign_up(client, "alice");
    ASSERT_TRUE(wait_for([&] { return server->registry().lookup("alice") != nullptr; }));

    client.send("LOGOUT");
    EXPECT_FALSE(client.read_until_prefix("NEVER").has_value());
    EXPECT_TRUE(wait_for([&] { return server->registry().lookup("alice") == nullptr; }));
}

TEST_F(ListenerTest, DisconnectClearsPresence)
{
    start();
    {
        LineClient client(server->port());
        sign_up(client, "alice");
        client.close();
    }

    EXPECT_TRUE(wait_for([&] { return server->registry().lookup("alice") == nullptr; }));

    LineClient again(server->port());
    again.send("LOGIN|alice::pw");
    auto line = again.read_line();
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(line->rfind("LOGIN_OK|", 0), 0u);
}

TEST_F(ListenerTest, ServerFullWhenCapReached)
{
    auto cfg = loopback_config();
    cfg.maxSessions = 1;
    start(cfg);

    LineClient first(server->port());
    first.send("REGISTER|alice::pw");
    ASSERT_EQ(first.read_line(), std::optional<std::string>("REGISTER_OK"));

    LineClient second(server->port());
    EXPECT_EQ(second.read_line(), std::optional<std::string>("ERR|Server full"));
    EXPECT_FALSE(second.read_line().has_value());

    // the first connection is unaffected
    first.send("LOGIN|alice::pw");
    EXPECT_EQ(first.read_until_prefix("LOGIN_OK|"), std::optional<std::string>("LOGIN_OK|1|alice"));
    EXPECT_EQ(server->metrics().connections_rejected_total.load(), 1u);
}

TEST_F(ListenerTest, SlotIsReleasedOnDisconnect)
{
    auto cfg = loopback_config();
    cfg.maxSessions = 1;
    start(cfg);

    {
        LineClient first(server->port());
        first.send("REGISTER|alice::pw");
        ASSERT_EQ(first.read_line(), std::optional<std::string>("REGISTER_OK"));
        first.close();
    }

    ASSERT_TRUE(wait_for([&] { return server->metrics().connections_active.load() == 0; }));

    LineClient second(server->port());
    second.send("LOGIN|alice::pw");
    auto line = second.read_line();
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(line->rfind("LOGIN_OK|", 0), 0u);
}

TEST_F(ListenerTest, OverlongLineClosesConnection)
{
    start();
    LineClient client(server->port());

    client.send_raw(std::string(4096, 'x'));
    EXPECT_FALSE(client.read_line().has_value());
}

TEST_F(ListenerTest, AcceptFailuresBackOffAndRecover)
{
    start();
    const unsigned short port = server->port();

    DescriptorSqueeze squeeze;
    ASSERT_TRUE(squeeze.exhausted());

    // takes the last descriptor, so the server side accept() hits EMFILE
    const int fd = raw_connect(port);
    ASSERT_GE(fd, 0) << std::strerror(errno);

    ASSERT_TRUE(wait_for([&] { return server->metrics().accept_errors_total.load() > 0; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_LE(server->metrics().accept_errors_total.load(), 10u);

    squeeze.release();

    const std::string hello = "REGISTER|dana::pw\n";
    ASSERT_EQ(::send(fd, hello.data(), hello.size(), 0), static_cast<ssize_t>(hello.size()));
    EXPECT_EQ(raw_read_line(fd), "REGISTER_OK");
    ::close(fd);
}

TEST(SessionCap, BoundedByDescriptorLimit)
{
    EXPECT_EQ(session_cap_for_fd_limit(1024, 1024), 960u);
    EXPECT_EQ(session_cap_for_fd_limit(0, 1024), 960u);
    EXPECT_EQ(session_cap_for_fd_limit(100, 4096), 100u);
    EXPECT_EQ(session_cap_for_fd_limit(10, 32), 1u);
}

TEST(SessionCap, UnlimitedDescriptorsKeepRequest)
{
    EXPECT_EQ(session_cap_for_fd_limit(500, 0), 500u);
    EXPECT_EQ(session_cap_for_fd_limit(0, 0), 0u);
}

TEST(Keepalive, ProbesSilentPeers)
{
    boost::asio::io_context ioc;
    tcp::acceptor acceptor(ioc, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    tcp::socket client(ioc);
    client.connect(acceptor.local_endpoint());
    tcp::socket accepted = acceptor.accept();

    boost::system::error_code ec;
    configure_keepalive(accepted, std::chrono::seconds(30), ec);
    ASSERT_FALSE(ec) << ec.message();

    boost::asio::socket_base::keep_alive enabled;
    accepted.get_option(enabled);
    EXPECT_TRUE(enabled.value());

    int idle = 0;
    socklen_t len = sizeof(idle);
    ASSERT_EQ(::getsockopt(accepted.native_handle(), IPPROTO_TCP, TCP_KEEPIDLE, &idle, &len), 0);
    EXPECT_EQ(idle, 30);

    int interval = 0;
    len = sizeof(interval);
    ASSERT_EQ(::getsockopt(accepted.native_handle(), IPPROTO_TCP, TCP_KEEPINTVL, &interval, &len), 0);
    EXPECT_EQ(interval, 5);
}

TEST(Keepalive, ZeroIdleLeavesSocketAlone)
{
    boost::asio::io_context ioc;
    tcp::acceptor acceptor(ioc, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    tcp::socket client(ioc);
    client.connect(acceptor.local_endpoint());
    tcp::socket accepted = acceptor.accept();

    boost::system::error_code ec;
    configure_keepalive(accepted, std::chrono::seconds(0), ec);
    EXPECT_FALSE(ec);

    boost::asio::socket_base::keep_alive enabled;
    accepted.get_option(enabled);
    EXPECT_FALSE(enabled.value());
}
