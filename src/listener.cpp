#include <linechat/listener.hpp>

#include <linechat/Metrics.hpp>
#include <linechat/protocol.hpp>
#include <linechat/tcp_session.hpp>

#include <algorithm>
#include <chrono>
#include <string>
#include <system_error>

#include <sys/resource.h>

#include <boost/asio/strand.hpp>
#include <boost/asio/write.hpp>

namespace linechat
{
    static vix::utils::Logger &logger = vix::utils::Logger::getInstance();

    namespace
    {
        // listener, SQLite, logger, metrics exporter, reactor internals
        constexpr std::size_t kReservedFds = 64;

        constexpr auto kAcceptBackoff = std::chrono::milliseconds(100);

        std::size_t current_fd_limit()
        {
            rlimit rl{};
            if (::getrlimit(RLIMIT_NOFILE, &rl) != 0 || rl.rlim_cur == RLIM_INFINITY)
                return 0;
            return static_cast<std::size_t>(rl.rlim_cur);
        }
    } // namespace

    std::size_t session_cap_for_fd_limit(std::size_t requested, std::size_t fdLimit)
    {
        if (fdLimit == 0)
            return requested;

        const std::size_t usable = (fdLimit > kReservedFds) ? fdLimit - kReservedFds : 1;
        if (requested == 0 || requested > usable)
            return usable;
        return requested;
    }

    Listener::Listener(const ServerConfig &cfg, SessionContext ctx)
        : cfg_(cfg),
          ctx_(std::move(ctx)),
          ioContext_(std::make_shared<net::io_context>()),
          acceptor_(nullptr),
          ioThreads_(),
          active_(std::make_shared<std::atomic<std::size_t>>(0)),
          stopRequested_(false)
    {
        const std::size_t cap = session_cap_for_fd_limit(cfg_.maxSessions, current_fd_limit());
        if (cap != cfg_.maxSessions)
        {
            logger.log(Logger::Level::WARN,
                       "[chat][Listener] maxSessions {} exceeds the descriptor limit, using {}",
                       cfg_.maxSessions, cap);
            cfg_.maxSessions = cap;
        }

        init_acceptor(cfg_.port);
        acceptRetry_ = std::make_unique<net::steady_timer>(*ioContext_);

        logger.log(Logger::Level::INFO,
                   "[chat][Listener] Config -> maxSessions={} maxLineLength={} historyLimit={}",
                   cfg_.maxSessions,
                   cfg_.maxLineLength,
                   cfg_.historyLimit);
    }

    Listener::~Listener()
    {
        if (!stopRequested_.load())
            stop_async();
        join_threads();
    }

    void Listener::init_acceptor(unsigned short port)
    {
        acceptor_ = std::make_unique<tcp::acceptor>(*ioContext_);
        boost::system::error_code ec;

        tcp::endpoint endpoint(tcp::v4(), port);
        acceptor_->open(endpoint.protocol(), ec);
        if (ec)
            throw std::system_error(ec, "open acceptor");

        acceptor_->set_option(net::socket_base::reuse_address(true), ec);
        if (ec)
            throw std::system_error(ec, "reuse_address");

        acceptor_->bind(endpoint, ec);
        if (ec)
            throw std::system_error(ec, "bind acceptor");

        acceptor_->listen(net::socket_base::max_listen_connections, ec);
        if (ec)
            throw std::system_error(ec, "listen acceptor");

        logger.log(Logger::Level::INFO,
                   "[chat][Listener] Listening on port {}", local_port());
    }

    unsigned short Listener::local_port() const
    {
        boost::system::error_code ec;
        auto ep = acceptor_->local_endpoint(ec);
        return ec ? 0 : ep.port();
    }

    void Listener::run()
    {
        start_accept();
        start_io_threads();
    }

    void Listener::start_accept()
    {
        acceptor_->async_accept(
            net::make_strand(*ioContext_),
            [this](const boost::system::error_code &ec, tcp::socket socket)
            {
                on_accept(ec, std::move(socket));
            });
    }

    void Listener::on_accept(const boost::system::error_code &ec, tcp::socket socket)
    {
        if (stopRequested_)
            return;

        if (ec)
        {
            // accept failures are never fatal, but EMFILE would fire again at once
            if (ctx_.metrics)
                ctx_.metrics->accept_errors_total++;
            logger.log(Logger::Level::WARN,
                       "[chat][Listener] Accept failed: {}, retrying in {} ms",
                       ec.message(), kAcceptBackoff.count());
            retry_accept_later();
            return;
        }

        handle_client(std::move(socket));
        start_accept();
    }

    void Listener::retry_accept_later()
    {
        acceptRetry_->expires_after(kAcceptBackoff);
        acceptRetry_->async_wait(
            [this](const boost::system::error_code &ec)
            {
                if (ec || stopRequested_)
                    return;
                start_accept();
            });
    }

    void Listener::handle_client(tcp::socket socket)
    {
        if (ctx_.metrics)
            ctx_.metrics->connections_total++;

        // accepts are serialized, so check-then-acquire cannot overshoot
        if (cfg_.maxSessions != 0 && active_->load() >= cfg_.maxSessions)
        {
            reject_client(std::move(socket));
            return;
        }

        boost::system::error_code ec;
        configure_keepalive(socket, cfg_.keepAliveIdle, ec);
        if (ec)
        {
            logger.log(Logger::Level::WARN,
                       "[chat][Listener] Could not enable keepalive: {}", ec.message());
        }

        auto session = std::make_shared<TcpSession>(
            std::move(socket),
            ctx_,
            cfg_.maxLineLength,
            ConnectionSlot(active_, ctx_.metrics));

        session->run();
    }

    void Listener::reject_client(tcp::socket socket)
    {
        if (ctx_.metrics)
            ctx_.metrics->connections_rejected_total++;

        logger.log(Logger::Level::WARN,
                   "[chat][Listener] Session cap ({}) reached, refusing connection",
                   cfg_.maxSessions);

        auto sock = std::make_shared<tcp::socket>(std::move(socket));
        auto payload = std::make_shared<std::string>(std::string(reply::ServerFull) + "\n");

        net::async_write(
            *sock,
            net::buffer(*payload),
            [sock, payload](const boost::system::error_code &, std::size_t)
            {
                boost::system::error_code ignore;
                sock->shutdown(tcp::socket::shutdown_both, ignore);
                sock->close(ignore);
            });
    }

    std::size_t Listener::compute_io_thread_count() const
    {
        if (cfg_.ioThreads != 0)
            return cfg_.ioThreads;

        const unsigned int hc = std::thread::hardware_concurrency();
        const unsigned int v = (hc != 0u) ? (hc / 2u) : 1u;
        return static_cast<std::size_t>(std::max(1u, v));
    }

    void Listener::start_io_threads()
    {
        const std::size_t n = compute_io_thread_count();
        ioThreads_.reserve(n);

        for (std::size_t i = 0; i < n; ++i)
        {
            ioThreads_.emplace_back(
                [this, i]()
                {
                    try
                    {
                        ioContext_->run();
                    }
                    catch (const std::exception &e)
                    {
                        logger.log(Logger::Level::ERROR,
                                   "[chat][Listener] IO thread {} error: {}", i, e.what());
                    }

                    logger.log(Logger::Level::INFO,
                               "[chat][Listener] IO thread {} finished", i);
                });
        }
    }

    void Listener::stop_async()
    {
        stopRequested_.store(true);

        if (acceptor_ && acceptor_->is_open())
        {
            boost::system::error_code ec;
            acceptor_->close(ec);
        }

        ioContext_->stop();
    }

    void Listener::join_threads()
    {
        for (auto &t : ioThreads_)
        {
            if (t.joinable())
                t.join();
        }
        ioThreads_.clear();
    }

} // namespace linechat
