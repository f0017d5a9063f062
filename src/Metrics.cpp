#include <linechat/Metrics.hpp>

#include <chrono>
#include <sstream>
#include <system_error>

#include <vix/utils/Logger.hpp>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace linechat
{
    using tcp = boost::asio::ip::tcp;
    namespace bb = boost::beast;
    namespace http = bb::http;
    namespace net = boost::asio;

    using Logger = vix::utils::Logger;

    namespace
    {
        [[nodiscard]] bool is_metrics_request(const http::request<http::string_body> &req) noexcept
        {
            return (req.method() == http::verb::get && req.target() == "/metrics");
        }

        void write_metric(std::ostringstream &os,
                          const char *name,
                          const char *type,
                          const char *help,
                          const std::atomic<std::uint64_t> &value)
        {
            os << "# HELP " << name << ' ' << help << "\n"
               << "# TYPE " << name << ' ' << type << "\n"
               << name << ' ' << value.load() << "\n\n";
        }

        constexpr auto kAcceptBackoff = std::chrono::milliseconds(100);

        /// One scrape: read a request, answer it, close.
        class ScrapeConnection : public std::enable_shared_from_this<ScrapeConnection>
        {
        public:
            ScrapeConnection(tcp::socket socket, std::shared_ptr<ChatMetrics> metrics)
                : socket_(std::move(socket)), metrics_(std::move(metrics))
            {
            }

            void run()
            {
                auto self = shared_from_this();
                http::async_read(socket_, buffer_, req_,
                                 [self](const boost::system::error_code &ec, std::size_t)
                                 { self->on_read(ec); });
            }

        private:
            void on_read(const boost::system::error_code &ec)
            {
                if (ec)
                {
                    Logger::getInstance().log(Logger::Level::DEBUG,
                                              "[chat][Metrics] read error ({})", ec.message());
                    close();
                    return;
                }

                res_.version(req_.version());
                res_.set(http::field::server, "linechat-metrics");
                res_.set(http::field::cache_control, "no-store");
                res_.set(http::field::connection, "close");

                if (is_metrics_request(req_))
                {
                    res_.result(http::status::ok);
                    res_.set(http::field::content_type, "text/plain; version=0.0.4; charset=utf-8");
                    res_.body() = metrics_->render_prometheus();
                }
                else
                {
                    res_.result(http::status::not_found);
                    res_.set(http::field::content_type, "text/plain; charset=utf-8");
                    res_.body() = "Not Found\n";
                }
                res_.prepare_payload();

                auto self = shared_from_this();
                http::async_write(socket_, res_,
                                  [self](const boost::system::error_code &wec, std::size_t)
                                  {
                                      if (wec)
                                      {
                                          Logger::getInstance().log(Logger::Level::DEBUG,
                                                                    "[chat][Metrics] write error ({})",
                                                                    wec.message());
                                      }
                                      self->close();
                                  });
            }

            void close()
            {
                boost::system::error_code ignore;
                socket_.shutdown(tcp::socket::shutdown_send, ignore);
                socket_.close(ignore);
            }

            tcp::socket socket_;
            std::shared_ptr<ChatMetrics> metrics_;
            bb::flat_buffer buffer_;
            http::request<http::string_body> req_;
            http::response<http::string_body> res_;
        };
    } // namespace

    std::string ChatMetrics::render_prometheus() const
    {
        std::ostringstream os;

        write_metric(os, "linechat_connections_total", "counter",
                     "Total TCP connections accepted", connections_total);
        write_metric(os, "linechat_connections_active", "gauge",
                     "Current open chat connections", connections_active);
        write_metric(os, "linechat_connections_rejected_total", "counter",
                     "Connections refused because the session cap was reached",
                     connections_rejected_total);
        write_metric(os, "linechat_accept_errors_total", "counter",
                     "Failed accept() calls on the chat listener", accept_errors_total);
        write_metric(os, "linechat_logins_total", "counter",
                     "Successful LOGIN commands", logins_total);
        write_metric(os, "linechat_lines_in_total", "counter",
                     "Command lines received from clients", lines_in_total);
        write_metric(os, "linechat_private_messages_total", "counter",
                     "Private messages routed", private_messages_total);
        write_metric(os, "linechat_group_messages_total", "counter",
                     "Group messages routed", group_messages_total);
        write_metric(os, "linechat_pushes_total", "counter",
                     "Lines pushed to recipient sessions", pushes_total);
        write_metric(os, "linechat_errors_total", "counter",
                     "Gateway and connection errors", errors_total);

        return os.str();
    }

    // ───────────────────────── MetricsExporter ─────────────────────────

    MetricsExporter::MetricsExporter(std::shared_ptr<ChatMetrics> metrics,
                                     const std::string &address,
                                     std::uint16_t port)
        : metrics_(std::move(metrics)), acceptor_(ioc_), retry_(ioc_)
    {
        tcp::endpoint ep{net::ip::make_address(address), port};
        boost::system::error_code ec;

        acceptor_.open(ep.protocol(), ec);
        if (ec)
            throw std::system_error(ec, "metrics open");

        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec)
            throw std::system_error(ec, "metrics reuse_address");

        acceptor_.bind(ep, ec);
        if (ec)
            throw std::system_error(ec, "metrics bind");

        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec)
            throw std::system_error(ec, "metrics listen");

        Logger::getInstance().log(Logger::Level::INFO,
                                  "[chat][Metrics] listening {}:{} (GET /metrics)",
                                  address, this->port());
    }

    MetricsExporter::~MetricsExporter()
    {
        stop();
    }

    unsigned short MetricsExporter::port() const
    {
        boost::system::error_code ec;
        auto ep = acceptor_.local_endpoint(ec);
        return ec ? 0 : ep.port();
    }

    void MetricsExporter::start()
    {
        if (thread_.joinable())
            return;

        do_accept();
        thread_ = std::thread([this]
                              {
                                  try
                                  {
                                      ioc_.run();
                                  }
                                  catch (const std::exception &e)
                                  {
                                      Logger::getInstance().log(Logger::Level::ERROR,
                                                                "[chat][Metrics] exporter stopped ({})",
                                                                e.what());
                                  } });
    }

    void MetricsExporter::stop()
    {
        ioc_.stop();

        if (thread_.joinable())
            thread_.join();

        // no handler can run past this point
        boost::system::error_code ignore;
        acceptor_.close(ignore);
    }

    void MetricsExporter::do_accept()
    {
        acceptor_.async_accept(
            [this](const boost::system::error_code &ec, tcp::socket socket)
            {
                if (ec == net::error::operation_aborted)
                    return;

                if (ec)
                {
                    Logger::getInstance().log(Logger::Level::DEBUG,
                                              "[chat][Metrics] accept error ({})", ec.message());

                    retry_.expires_after(kAcceptBackoff);
                    retry_.async_wait([this](const boost::system::error_code &wec)
                                      {
                                          if (!wec)
                                              do_accept(); });
                    return;
                }

                std::make_shared<ScrapeConnection>(std::move(socket), metrics_)->run();
                do_accept();
            });
    }

} // namespace linechat
