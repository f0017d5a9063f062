#include <linechat/presence.hpp>
#include <linechat/session.hpp>

namespace linechat
{
    bool PresenceRegistry::register_session(const std::string &username,
                                            UserId userId,
                                            const std::shared_ptr<Session> &session,
                                            const std::function<bool()> &admit)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = online_.find(username);
        if (it != online_.end())
        {
            // A slot whose session is gone is stale and may be taken over.
            if (!it->second.session.expired())
                return false;
            online_.erase(it);
        }

        if (admit && !admit())
            return false;

        online_.emplace(username, Slot{userId, session, session.get()});
        return true;
    }

    void PresenceRegistry::unregister_session(const Session &session,
                                              const std::function<void()> &onRemoved)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        // Expired slots are swept on the way; they can never be looked up again.
        for (auto it = online_.begin(); it != online_.end();)
        {
            if (it->second.identity == &session || it->second.session.expired())
                it = online_.erase(it);
            else
                ++it;
        }

        if (onRemoved)
            onRemoved();
    }

    std::shared_ptr<Session> PresenceRegistry::lookup(const std::string &username) const
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = online_.find(username);
        if (it == online_.end())
            return nullptr;
        return it->second.session.lock();
    }

    std::vector<PresenceEntry> PresenceRegistry::snapshot() const
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<PresenceEntry> out;
        out.reserve(online_.size());

        for (const auto &[name, slot] : online_)
        {
            if (auto sp = slot.session.lock())
            {
                out.push_back(PresenceEntry{name, slot.userId, std::move(sp)});
            }
        }
        return out;
    }

    std::size_t PresenceRegistry::size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return online_.size();
    }

} // namespace linechat
