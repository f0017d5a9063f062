#include <linechat/config.hpp>

#include <algorithm>
#include <stdexcept>

#include <vix/utils/Logger.hpp>

namespace linechat
{
    namespace
    {
        std::uint16_t checked_port(int v, const char *key)
        {
            if (v < 1024 || v > 65535)
            {
                vix::utils::Logger::getInstance().log(vix::utils::Logger::Level::ERROR,
                                                      "[chat][Config] {} = {} out of range (1024-65535)", key, v);
                throw std::invalid_argument(std::string("Invalid port for ") + key);
            }
            return static_cast<std::uint16_t>(v);
        }
    } // namespace

    ServerConfig ServerConfig::from_core(const vix::config::Config &core)
    {
        ServerConfig cfg;

        if (core.has("chat.port"))
        {
            cfg.port = checked_port(core.getInt("chat.port", cfg.port), "chat.port");
        }

        if (core.has("chat.max_sessions"))
        {
            auto v = core.getInt("chat.max_sessions", static_cast<int>(cfg.maxSessions));
            cfg.maxSessions = static_cast<std::size_t>(std::max(0, v));
        }

        if (core.has("chat.max_line_length"))
        {
            auto v = core.getInt("chat.max_line_length", static_cast<int>(cfg.maxLineLength));
            cfg.maxLineLength = static_cast<std::size_t>(std::max(1024, v)); // min 1 KiB
        }

        if (core.has("chat.history_limit"))
        {
            auto v = core.getInt("chat.history_limit", static_cast<int>(cfg.historyLimit));
            cfg.historyLimit = static_cast<std::size_t>(std::max(1, v));
        }

        if (core.has("chat.io_threads"))
        {
            auto v = core.getInt("chat.io_threads", 0);
            cfg.ioThreads = static_cast<std::size_t>(std::max(0, v));
        }

        if (core.has("chat.keepalive_idle_seconds"))
        {
            auto v = core.getInt("chat.keepalive_idle_seconds",
                                 static_cast<int>(cfg.keepAliveIdle.count()));
            cfg.keepAliveIdle = std::chrono::seconds(std::max(0, v));
        }

        if (core.has("chat.database_path"))
        {
            cfg.databasePath = core.getString("chat.database_path", cfg.databasePath);
        }

        if (core.has("metrics.enabled"))
        {
            cfg.metricsEnabled = core.getBool("metrics.enabled", cfg.metricsEnabled);
        }

        if (core.has("metrics.port"))
        {
            cfg.metricsPort = checked_port(core.getInt("metrics.port", cfg.metricsPort), "metrics.port");
        }

        return cfg;
    }

} // namespace linechat
