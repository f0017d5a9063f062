#ifndef LINECHAT_LISTENER_HPP
#define LINECHAT_LISTENER_HPP

/**
 * @file listener.hpp
 * @brief Accept loop for the chat server.
 *
 * This component:
 *  - owns the io_context and its I/O threads
 *  - accepts TCP connections, each on its own strand
 *  - creates a TcpSession per client, or answers `ERR|Server full` when the
 *    connection cap is reached
 *  - backs off after a failed accept (e.g. out of descriptors) instead of
 *    retrying immediately
 */

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>

#include <linechat/config.hpp>
#include <linechat/session.hpp>
#include <vix/utils/Logger.hpp>

namespace linechat
{
    namespace net = boost::asio;
    using tcp = net::ip::tcp;

    /**
     * @brief Connection cap that still leaves file descriptors for the process.
     *
     * Each session holds one descriptor; `fdLimit` is the soft RLIMIT_NOFILE
     * (0 when unlimited or unknown). A request of 0 (no cap) is bounded too,
     * so the capacity reply is sent before accept() starts failing.
     */
    [[nodiscard]] std::size_t session_cap_for_fd_limit(std::size_t requested, std::size_t fdLimit);

    class Listener
    {
    public:
        /// Binds immediately; throws std::system_error when the port is unavailable.
        Listener(const ServerConfig &cfg, SessionContext ctx);

        ~Listener();

        Listener(const Listener &) = delete;
        Listener &operator=(const Listener &) = delete;

        /// Start accepting connections and running io_context_ in background threads.
        void run();

        /// Cooperative async stop: close acceptor and stop io_context_.
        void stop_async();

        /// Join all I/O threads.
        void join_threads();

        bool is_stop_requested() const { return stopRequested_.load(); }

        /// Bound port (differs from the configured one when that was 0).
        [[nodiscard]] unsigned short local_port() const;

        [[nodiscard]] std::size_t active_connections() const { return active_->load(); }

    private:
        void init_acceptor(unsigned short port);
        void start_accept();
        void retry_accept_later();
        void on_accept(const boost::system::error_code &ec, tcp::socket socket);
        void start_io_threads();
        void handle_client(tcp::socket socket);
        void reject_client(tcp::socket socket);

        std::size_t compute_io_thread_count() const;

    private:
        ServerConfig cfg_;
        SessionContext ctx_;

        std::shared_ptr<net::io_context> ioContext_;
        std::unique_ptr<tcp::acceptor> acceptor_;
        std::unique_ptr<net::steady_timer> acceptRetry_;
        std::vector<std::thread> ioThreads_;

        std::shared_ptr<std::atomic<std::size_t>> active_;
        std::atomic<bool> stopRequested_{false};

        using Logger = vix::utils::Logger;
    };

} // namespace linechat

#endif // LINECHAT_LISTENER_HPP
