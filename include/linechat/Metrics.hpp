#ifndef LINECHAT_METRICS_HPP
#define LINECHAT_METRICS_HPP

/**
 * @file Metrics.hpp
 * @brief Lightweight Prometheus-style counters for the chat server.
 *
 * Typical usage
 * -------------
 * @code{.cpp}
 * auto metrics = std::make_shared<linechat::ChatMetrics>();
 *
 * linechat::MetricsExporter exporter(metrics, "0.0.0.0", 9100);
 * exporter.start();
 * // ...
 * exporter.stop();
 * @endcode
 */

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

namespace linechat
{
    /**
     * @struct ChatMetrics
     * @brief Aggregated counters for connection and routing activity.
     *
     * All fields are 64-bit atomics and can be incremented from any I/O thread
     * without external synchronization.
     */
    struct ChatMetrics
    {
        std::atomic<std::uint64_t> connections_total{0};
        std::atomic<std::uint64_t> connections_active{0};
        std::atomic<std::uint64_t> connections_rejected_total{0};
        std::atomic<std::uint64_t> accept_errors_total{0};
        std::atomic<std::uint64_t> logins_total{0};
        std::atomic<std::uint64_t> lines_in_total{0};
        std::atomic<std::uint64_t> private_messages_total{0};
        std::atomic<std::uint64_t> group_messages_total{0};
        std::atomic<std::uint64_t> pushes_total{0};
        std::atomic<std::uint64_t> errors_total{0};

        /// Prometheus text exposition format (v0.0.4).
        [[nodiscard]] std::string render_prometheus() const;
    };

    /**
     * @brief HTTP endpoint serving `GET /metrics`; any other request is 404.
     *
     * The acceptor is bound in the constructor (port 0 picks an ephemeral
     * port) and served from one background thread between start() and stop().
     */
    class MetricsExporter
    {
    public:
        /// @throws std::system_error when the address cannot be bound.
        MetricsExporter(std::shared_ptr<ChatMetrics> metrics,
                        const std::string &address = "0.0.0.0",
                        std::uint16_t port = 9100);

        ~MetricsExporter();

        MetricsExporter(const MetricsExporter &) = delete;
        MetricsExporter &operator=(const MetricsExporter &) = delete;

        void start();

        /// Closes the acceptor and joins the serving thread. Idempotent.
        void stop();

        [[nodiscard]] unsigned short port() const;

    private:
        void do_accept();

        std::shared_ptr<ChatMetrics> metrics_;
        boost::asio::io_context ioc_{1};
        boost::asio::ip::tcp::acceptor acceptor_;
        boost::asio::steady_timer retry_;
        std::thread thread_;
    };

} // namespace linechat

#endif // LINECHAT_METRICS_HPP
