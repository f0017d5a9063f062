#ifndef LINECHAT_CONFIG_HPP
#define LINECHAT_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Chat server configuration.
 *
 * @details
 * Wraps the core `vix::config::Config` (JSON file) into a strongly-typed
 * structure used by the listener, sessions and storage.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include <vix/config/Config.hpp>

namespace linechat
{
    /**
     * @struct ServerConfig
     * @brief Tunables controlling the chat server.
     */
    struct ServerConfig
    {
        /// TCP port the listener binds (0 = ephemeral, tests only).
        std::uint16_t port = 9000;

        /// Maximum concurrent connections; 0 disables the cap.
        std::size_t maxSessions = 1024;

        /// Longest accepted command line in bytes; longer lines close the connection.
        std::size_t maxLineLength = 64 * 1024; // 64 KiB

        /// Lines returned by HISTORY_PRIVATE / HISTORY_GROUP.
        std::size_t historyLimit = 1000;

        /// I/O threads; 0 = hardware_concurrency / 2 (at least 1).
        std::size_t ioThreads = 0;

        /// TCP keepalive idle time before probing a silent peer; 0 disables.
        /// Bounds how long a half-open connection keeps its username online.
        std::chrono::seconds keepAliveIdle{60};

        /// SQLite database file (or ":memory:").
        std::string databasePath = "linechat.db";

        bool metricsEnabled = false;
        std::uint16_t metricsPort = 9100;

        /**
         * @brief Build a ServerConfig from the core Vix config.
         *
         * Expected keys (optional):
         *  - chat.port            (int, 1024-65535)
         *  - chat.max_sessions    (int, 0 = unlimited)
         *  - chat.max_line_length (int, bytes, min 1 KiB)
         *  - chat.history_limit   (int, min 1)
         *  - chat.io_threads      (int)
         *  - chat.keepalive_idle_seconds (int, 0 = off)
         *  - chat.database_path   (string)
         *  - metrics.enabled      (bool)
         *  - metrics.port         (int)
         *
         * @throws std::invalid_argument when a port is out of range.
         */
        static ServerConfig from_core(const vix::config::Config &core);
    };

} // namespace linechat

#endif // LINECHAT_CONFIG_HPP
