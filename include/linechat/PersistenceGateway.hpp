#ifndef LINECHAT_PERSISTENCE_GATEWAY_HPP
#define LINECHAT_PERSISTENCE_GATEWAY_HPP

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include <linechat/message.hpp>

namespace linechat
{
    /// Thrown by gateway implementations when the backing store fails.
    class PersistenceError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief Durable storage consumed by the chat core.
     *
     * Designed to be implemented with SQLite, MySQL, Postgres, etc.
     *
     * Expected semantics:
     *  - every call is self-contained and safe to issue concurrently with
     *    other calls; there are no transactions across calls.
     *  - register_user() returns false when the username is taken.
     *  - private_history() / group_history() return at most `limit` formatted
     *    lines "[YYYY-MM-DD HH:MM:SS] sender: content", the most recent ones,
     *    ordered oldest-first.
     *  - failures of the backing store are reported as PersistenceError.
     */
    class IPersistenceGateway
    {
    public:
        virtual ~IPersistenceGateway() = default;

        virtual std::optional<UserId> authenticate(const std::string &username,
                                                   const std::string &password) = 0;

        virtual bool register_user(const std::string &username,
                                   const std::string &password) = 0;

        /// Durable lookup, independent of presence.
        virtual std::optional<UserId> find_user_id(const std::string &username) = 0;

        virtual void save_message(UserId senderId,
                                  std::optional<UserId> recipientId,
                                  std::optional<GroupId> groupId,
                                  const std::string &content,
                                  Clock::time_point timestamp) = 0;

        virtual std::vector<std::string> private_history(UserId userA,
                                                         UserId userB,
                                                         std::size_t limit) = 0;

        virtual std::vector<std::string> group_history(GroupId groupId,
                                                       std::size_t limit) = 0;

        virtual std::vector<std::string> all_usernames() = 0;

        virtual GroupId create_group(const std::string &name, UserId ownerId) = 0;

        /// Idempotent; fails when the user or group does not exist.
        virtual void add_member(UserId userId, GroupId groupId) = 0;

        virtual std::unordered_set<UserId> group_member_ids(GroupId groupId) = 0;
    };

} // namespace linechat

#endif // LINECHAT_PERSISTENCE_GATEWAY_HPP
