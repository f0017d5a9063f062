#ifndef LINECHAT_TCP_SESSION_HPP
#define LINECHAT_TCP_SESSION_HPP

/**
 * @file tcp_session.hpp
 * @brief Boost.Asio transport for one chat connection.
 *
 * Responsibilities:
 *  - Read '\n'-terminated lines and feed them to Session::handle_line().
 *  - Keep one outbound write queue; pushes from other threads are posted
 *    onto this connection's strand.
 *  - Turn EOF, read/write errors and oversized lines into the Closed
 *    transition, then release the socket once queued writes are flushed.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/system/error_code.hpp>

#include <linechat/session.hpp>

namespace linechat
{
    namespace net = boost::asio;
    using tcp = net::ip::tcp;

    /**
     * @brief Turn on TCP keepalive so a silently dead peer is dropped.
     *
     * The first probe goes out after `idle` without traffic, then 3 probes
     * `idle / 6` apart (at least 1 s). An idle of 0 leaves the socket as is.
     */
    void configure_keepalive(tcp::socket &socket,
                             std::chrono::seconds idle,
                             boost::system::error_code &ec);

    /**
     * @brief Holds one unit of the listener's connection budget.
     *
     * Released on destruction, i.e. once the last handler referencing the
     * session has completed.
     */
    class ConnectionSlot
    {
    public:
        ConnectionSlot() = default;
        ConnectionSlot(std::shared_ptr<std::atomic<std::size_t>> counter,
                       std::shared_ptr<ChatMetrics> metrics);
        ~ConnectionSlot();

        ConnectionSlot(ConnectionSlot &&other) noexcept;
        ConnectionSlot &operator=(ConnectionSlot &&other) noexcept;
        ConnectionSlot(const ConnectionSlot &) = delete;
        ConnectionSlot &operator=(const ConnectionSlot &) = delete;

    private:
        void release() noexcept;

        std::shared_ptr<std::atomic<std::size_t>> counter_;
        std::shared_ptr<ChatMetrics> metrics_;
    };

    class TcpSession : public Session
    {
    public:
        /// `socket` must be bound to a strand executor.
        TcpSession(tcp::socket socket,
                   SessionContext ctx,
                   std::size_t maxLineLength,
                   ConnectionSlot slot = ConnectionSlot{});

        ~TcpSession() override;

        /// Start the read loop.
        void run();

    protected:
        void deliver(std::string payload) override;

    private:
        void do_read();
        void on_read(const boost::system::error_code &ec, std::size_t bytes);

        void do_enqueue(std::string payload);
        void do_write_next();
        void on_write_complete(const boost::system::error_code &ec, std::size_t bytes);

        void terminate();
        void shutdown_socket();

        std::shared_ptr<TcpSession> self();

    private:
        tcp::socket socket_;
        net::streambuf inbox_;
        std::string remote_;

        std::deque<std::string> writeQueue_;
        bool writeInProgress_ = false;
        bool closing_ = false;

        ConnectionSlot slot_;

        using Logger = vix::utils::Logger;
    };

} // namespace linechat

#endif // LINECHAT_TCP_SESSION_HPP
