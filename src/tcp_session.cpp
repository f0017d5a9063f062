#include <linechat/tcp_session.hpp>

#include <linechat/Metrics.hpp>

#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>

#include <algorithm>
#include <cerrno>

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

namespace linechat
{
    static vix::utils::Logger &logger = vix::utils::Logger::getInstance();

    void configure_keepalive(tcp::socket &socket,
                             std::chrono::seconds idle,
                             boost::system::error_code &ec)
    {
        ec.clear();
        if (idle.count() <= 0)
            return;

        socket.set_option(net::socket_base::keep_alive(true), ec);
        if (ec)
            return;

        const int idleSeconds = static_cast<int>(idle.count());
        const int interval = std::max(1, idleSeconds / 6);
        const int probes = 3;

        const auto fd = socket.native_handle();
        if (::setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &idleSeconds, sizeof(idleSeconds)) != 0 ||
            ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &interval, sizeof(interval)) != 0 ||
            ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &probes, sizeof(probes)) != 0)
        {
            ec.assign(errno, boost::system::system_category());
        }
    }

    // ───────────────────────── ConnectionSlot ─────────────────────────

    ConnectionSlot::ConnectionSlot(std::shared_ptr<std::atomic<std::size_t>> counter,
                                   std::shared_ptr<ChatMetrics> metrics)
        : counter_(std::move(counter)), metrics_(std::move(metrics))
    {
        if (counter_)
            counter_->fetch_add(1);
        if (metrics_)
            metrics_->connections_active++;
    }

    ConnectionSlot::~ConnectionSlot()
    {
        release();
    }

    ConnectionSlot::ConnectionSlot(ConnectionSlot &&other) noexcept
        : counter_(std::move(other.counter_)), metrics_(std::move(other.metrics_))
    {
    }

    ConnectionSlot &ConnectionSlot::operator=(ConnectionSlot &&other) noexcept
    {
        if (this != &other)
        {
            release();
            counter_ = std::move(other.counter_);
            metrics_ = std::move(other.metrics_);
        }
        return *this;
    }

    void ConnectionSlot::release() noexcept
    {
        if (counter_)
        {
            counter_->fetch_sub(1);
            counter_.reset();
        }
        if (metrics_)
        {
            metrics_->connections_active--;
            metrics_.reset();
        }
    }

    // ───────────────────────── TcpSession ─────────────────────────

    TcpSession::TcpSession(tcp::socket socket,
                           SessionContext ctx,
                           std::size_t maxLineLength,
                           ConnectionSlot slot)
        : Session(std::move(ctx)),
          socket_(std::move(socket)),
          inbox_(maxLineLength),
          remote_(),
          writeQueue_(),
          writeInProgress_(false),
          closing_(false),
          slot_(std::move(slot))
    {
        boost::system::error_code ec;
        socket_.set_option(tcp::no_delay(true), ec);

        auto ep = socket_.remote_endpoint(ec);
        remote_ = ec ? std::string("unknown") : ep.address().to_string() + ":" + std::to_string(ep.port());
    }

    TcpSession::~TcpSession()
    {
        logger.log(Logger::Level::DEBUG, "[chat][TcpSession] {} released", remote_);
    }

    std::shared_ptr<TcpSession> TcpSession::self()
    {
        return std::static_pointer_cast<TcpSession>(shared_from_this());
    }

    void TcpSession::run()
    {
        logger.log(Logger::Level::INFO, "[chat][TcpSession] Connection from {}", remote_);
        do_read();
    }

    void TcpSession::do_read()
    {
        auto self = this->self();

        net::async_read_until(
            socket_,
            inbox_,
            '\n',
            [this, self](const boost::system::error_code &ec, std::size_t bytes)
            {
                on_read(ec, bytes);
            });
    }

    void TcpSession::on_read(const boost::system::error_code &ec, std::size_t bytes)
    {
        if (ec)
        {
            if (ec == net::error::eof || ec == net::error::connection_reset)
            {
                logger.log(Logger::Level::INFO,
                           "[chat][TcpSession] {} closed by client", remote_);
            }
            else if (ec == net::error::not_found)
            {
                logger.log(Logger::Level::WARN,
                           "[chat][TcpSession] {} sent a line over {} bytes, closing",
                           remote_, inbox_.max_size());
            }
            else if (ec != net::error::operation_aborted)
            {
                logger.log(Logger::Level::WARN,
                           "[chat][TcpSession] {} read error: {}", remote_, ec.message());
            }

            terminate();
            return;
        }

        auto begin = net::buffers_begin(inbox_.data());
        std::string line(begin, begin + static_cast<std::ptrdiff_t>(bytes));
        inbox_.consume(bytes);

        while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
            line.pop_back();

        if (!handle_line(line))
        {
            terminate();
            return;
        }

        do_read();
    }

    void TcpSession::deliver(std::string payload)
    {
        auto self = this->self();

        net::post(
            socket_.get_executor(),
            [self, payload = std::move(payload)]() mutable
            {
                self->do_enqueue(std::move(payload));
            });
    }

    void TcpSession::do_enqueue(std::string payload)
    {
        if (closing_)
            return;

        writeQueue_.push_back(std::move(payload));

        if (!writeInProgress_)
        {
            do_write_next();
        }
    }

    void TcpSession::do_write_next()
    {
        if (writeQueue_.empty())
        {
            writeInProgress_ = false;
            if (closing_)
                shutdown_socket();
            return;
        }

        writeInProgress_ = true;

        auto self = this->self();

        // front stays queued until the write completes; it owns the buffer
        net::async_write(
            socket_,
            net::buffer(writeQueue_.front()),
            [this, self](const boost::system::error_code &ec, std::size_t bytes)
            {
                on_write_complete(ec, bytes);
            });
    }

    void TcpSession::on_write_complete(const boost::system::error_code &ec, std::size_t bytes)
    {
        if (ec)
        {
            if (ec != net::error::operation_aborted)
            {
                logger.log(Logger::Level::WARN,
                           "[chat][TcpSession] {} write error: {}", remote_, ec.message());
                if (context().metrics)
                    context().metrics->errors_total++;
            }

            writeQueue_.clear();
            writeInProgress_ = false;
            terminate();
            return;
        }

        logger.log(Logger::Level::DEBUG,
                   "[chat][TcpSession] Sent {} bytes to {}", bytes, remote_);

        writeQueue_.pop_front();
        do_write_next();
    }

    void TcpSession::terminate()
    {
        finish();

        // queued lines written before closing_ was set are still flushed
        closing_ = true;
        if (!writeInProgress_)
            shutdown_socket();
    }

    void TcpSession::shutdown_socket()
    {
        if (!socket_.is_open())
            return;

        boost::system::error_code ignore;
        socket_.shutdown(tcp::socket::shutdown_both, ignore);
        socket_.close(ignore);
    }

} // namespace linechat
