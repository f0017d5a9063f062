#include <linechat/server.hpp>

#include <linechat/SqliteGateway.hpp>

#include <chrono>
#include <csignal>

#include <boost/asio/signal_set.hpp>

#include <vix/utils/Logger.hpp>

namespace linechat
{
    using Logger = vix::utils::Logger;

    static Logger &logger = Logger::getInstance();

    Server::Server(vix::config::Config &cfg, std::shared_ptr<IPersistenceGateway> gateway)
        : Server(ServerConfig::from_core(cfg), std::move(gateway))
    {
    }

    Server::Server(const ServerConfig &cfg, std::shared_ptr<IPersistenceGateway> gateway)
        : cfg_(cfg),
          gateway_(gateway ? std::move(gateway)
                           : std::make_shared<SqliteGateway>(cfg.databasePath)),
          registry_(std::make_shared<PresenceRegistry>()),
          metrics_(std::make_shared<ChatMetrics>()),
          router_(std::make_shared<MessageRouter>(gateway_, registry_, metrics_)),
          listener_(nullptr)
    {
        SessionContext ctx;
        ctx.gateway = gateway_;
        ctx.registry = registry_;
        ctx.router = router_;
        ctx.metrics = metrics_;
        ctx.historyLimit = cfg_.historyLimit;

        listener_ = std::make_unique<Listener>(cfg_, std::move(ctx));
    }

    void Server::start()
    {
        if (started_)
            return;
        started_ = true;

        logger.log(Logger::Level::INFO, "[chat] start() called on port {}", port());

        if (cfg_.metricsEnabled)
        {
            try
            {
                exporter_ = std::make_unique<MetricsExporter>(metrics_, "0.0.0.0", cfg_.metricsPort);
                exporter_->start();
            }
            catch (const std::exception &e)
            {
                // the chat service keeps running without its exporter
                logger.log(Logger::Level::ERROR,
                           "[chat] Metrics exporter unavailable: {}", e.what());
            }
        }

        listener_->run();
    }

    void Server::stop()
    {
        listener_->stop_async();
        listener_->join_threads();

        if (exporter_)
            exporter_->stop();
    }

    void Server::listen_blocking()
    {
        net::io_context signals_ctx;
        net::signal_set signals(signals_ctx, SIGINT, SIGTERM);
        signals.async_wait(
            [this](const boost::system::error_code &ec, int signo)
            {
                if (ec)
                    return;
                logger.log(Logger::Level::INFO, "[chat] Signal {} received, stopping", signo);
                listener_->stop_async();
            });

        start();

        while (!listener_->is_stop_requested())
            signals_ctx.run_for(std::chrono::seconds(1));

        stop();
    }

} // namespace linechat
