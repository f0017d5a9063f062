#ifndef LINECHAT_SQLITE_GATEWAY_HPP
#define LINECHAT_SQLITE_GATEWAY_HPP

#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include <linechat/PersistenceGateway.hpp>

struct sqlite3;

namespace linechat
{
    /**
     * @brief IPersistenceGateway on a single SQLite connection (WAL).
     *
     * Pass ":memory:" as path for a private in-memory database. All calls are
     * serialized on one connection guarded by a mutex.
     */
    class SqliteGateway : public IPersistenceGateway
    {
    public:
        explicit SqliteGateway(const std::string &db_path);
        ~SqliteGateway() override;

        SqliteGateway(const SqliteGateway &) = delete;
        SqliteGateway &operator=(const SqliteGateway &) = delete;
        SqliteGateway(SqliteGateway &&) = delete;
        SqliteGateway &operator=(SqliteGateway &&) = delete;

        [[nodiscard]] std::optional<UserId> authenticate(const std::string &username,
                                                         const std::string &password) override;

        [[nodiscard]] bool register_user(const std::string &username,
                                         const std::string &password) override;

        [[nodiscard]] std::optional<UserId> find_user_id(const std::string &username) override;

        void save_message(UserId senderId,
                          std::optional<UserId> recipientId,
                          std::optional<GroupId> groupId,
                          const std::string &content,
                          Clock::time_point timestamp) override;

        [[nodiscard]] std::vector<std::string> private_history(UserId userA,
                                                               UserId userB,
                                                               std::size_t limit) override;

        [[nodiscard]] std::vector<std::string> group_history(GroupId groupId,
                                                             std::size_t limit) override;

        [[nodiscard]] std::vector<std::string> all_usernames() override;

        [[nodiscard]] GroupId create_group(const std::string &name, UserId ownerId) override;

        void add_member(UserId userId, GroupId groupId) override;

        [[nodiscard]] std::unordered_set<UserId> group_member_ids(GroupId groupId) override;

    private:
        sqlite3 *db_{nullptr};
        std::mutex mutex_;

        void exec(const char *sql, const char *stage);
        void init_schema();
        static std::string format_timestamp(Clock::time_point tp);
    };

} // namespace linechat

#endif // LINECHAT_SQLITE_GATEWAY_HPP
