#ifndef LINECHAT_PRESENCE_HPP
#define LINECHAT_PRESENCE_HPP

/**
 * @file presence.hpp
 * @brief Authoritative map of online usernames to their live Session.
 *
 * Critical section: one mutex covers register / unregister / lookup /
 * snapshot. Callers get copies of the handles and do every write to a
 * connection after the lock is released.
 *
 * The optional hooks run inside the critical section, so a session's state
 * change and its registry membership are observed together. A hook may only
 * touch its own session (state, identity, enqueueing a line).
 */

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <linechat/message.hpp>

namespace linechat
{
    class Session;

    struct PresenceEntry
    {
        std::string username;
        UserId userId = 0;
        std::shared_ptr<Session> session;
    };

    class PresenceRegistry
    {
    public:
        PresenceRegistry() = default;

        PresenceRegistry(const PresenceRegistry &) = delete;
        PresenceRegistry &operator=(const PresenceRegistry &) = delete;

        /// Returns false when `username` is already held by a live session or
        /// when `admit` declines; the entry is inserted only if `admit` succeeds.
        [[nodiscard]] bool register_session(const std::string &username,
                                            UserId userId,
                                            const std::shared_ptr<Session> &session,
                                            const std::function<bool()> &admit = {});

        /// Removes the entry owned by `session`, if any. Idempotent.
        /// `onRemoved` runs under the lock whether or not an entry existed.
        void unregister_session(const Session &session,
                                const std::function<void()> &onRemoved = {});

        /// nullptr when the user is not online.
        [[nodiscard]] std::shared_ptr<Session> lookup(const std::string &username) const;

        [[nodiscard]] std::vector<PresenceEntry> snapshot() const;

        [[nodiscard]] std::size_t size() const;

    private:
        struct Slot
        {
            UserId userId = 0;
            std::weak_ptr<Session> session;
            const Session *identity = nullptr;
        };

        mutable std::mutex mutex_;
        std::unordered_map<std::string, Slot> online_;
    };

} // namespace linechat

#endif // LINECHAT_PRESENCE_HPP
