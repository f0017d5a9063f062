#ifndef LINECHAT_SERVER_HPP
#define LINECHAT_SERVER_HPP

#include <memory>

#include <vix/config/Config.hpp>

#include <linechat/config.hpp>
#include <linechat/listener.hpp>
#include <linechat/Metrics.hpp>
#include <linechat/PersistenceGateway.hpp>
#include <linechat/presence.hpp>
#include <linechat/router.hpp>

namespace linechat
{
    /**
     * @brief Chat server: wires gateway, presence, router, metrics and listener.
     *
     * When no gateway is given, a SqliteGateway is opened on
     * `ServerConfig::databasePath`.
     */
    class Server
    {
    public:
        Server(vix::config::Config &cfg,
               std::shared_ptr<IPersistenceGateway> gateway = nullptr);

        explicit Server(const ServerConfig &cfg,
                        std::shared_ptr<IPersistenceGateway> gateway = nullptr);

        Server(const Server &) = delete;
        Server &operator=(const Server &) = delete;

        void start();

        void stop();

        /// start(), then block until SIGINT/SIGTERM or stop().
        void listen_blocking();

        [[nodiscard]] unsigned short port() const { return listener_->local_port(); }

        [[nodiscard]] const ServerConfig &config() const noexcept { return cfg_; }
        [[nodiscard]] PresenceRegistry &registry() noexcept { return *registry_; }
        [[nodiscard]] ChatMetrics &metrics() noexcept { return *metrics_; }

    private:
        ServerConfig cfg_;
        std::shared_ptr<IPersistenceGateway> gateway_;
        std::shared_ptr<PresenceRegistry> registry_;
        std::shared_ptr<ChatMetrics> metrics_;
        std::shared_ptr<MessageRouter> router_;
        std::unique_ptr<Listener> listener_;
        std::unique_ptr<MetricsExporter> exporter_;
        bool started_ = false;
    };

} // namespace linechat

#endif // LINECHAT_SERVER_HPP
