#pragma once

//
// linechat umbrella header
//
// Usage:
//   #include <linechat.hpp>
//
// This pulls in the main building blocks:
//
//   - linechat::Server             → wiring + blocking entry point
//   - linechat::Listener           → accept loop with a connection cap
//   - linechat::Session            → per-connection protocol state machine
//   - linechat::TcpSession         → Boost.Asio transport for a Session
//   - linechat::PresenceRegistry   → who is online
//   - linechat::MessageRouter      → private / group delivery + logging
//   - linechat::IPersistenceGateway / SqliteGateway → durable storage
//

#include <linechat/config.hpp>
#include <linechat/message.hpp>
#include <linechat/protocol.hpp>
#include <linechat/PersistenceGateway.hpp>
#include <linechat/SqliteGateway.hpp>
#include <linechat/presence.hpp>
#include <linechat/group_resolver.hpp>
#include <linechat/router.hpp>
#include <linechat/session.hpp>
#include <linechat/tcp_session.hpp>
#include <linechat/listener.hpp>
#include <linechat/Metrics.hpp>
#include <linechat/server.hpp>
