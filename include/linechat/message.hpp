#ifndef LINECHAT_MESSAGE_HPP
#define LINECHAT_MESSAGE_HPP

/**
 * @file message.hpp
 * @brief Identifiers and the ephemeral chat message routed by the core.
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>

namespace linechat
{
    using UserId = std::int64_t;
    using GroupId = std::int64_t;

    using Clock = std::chrono::system_clock;

    /// Private target, addressed by username.
    struct ToUser
    {
        std::string username;
    };

    /// Group target, addressed by durable group id.
    struct ToGroup
    {
        GroupId groupId = 0;
    };

    using MessageTarget = std::variant<ToUser, ToGroup>;

    /// Built per send and dropped after routing; durability lives in the gateway.
    struct ChatMessage
    {
        UserId senderId = 0;
        MessageTarget target;
        std::string content;
        Clock::time_point timestamp = Clock::now();
    };

} // namespace linechat

#endif // LINECHAT_MESSAGE_HPP
