#include <linechat/SqliteGateway.hpp>

#include <cstdio>
#include <ctime>

#include <sqlite3.h>

namespace linechat
{
    // ───────────────────────── Internal helpers ─────────────────────────

    namespace
    {
        void sqlite_check(int rc, sqlite3 *db, const char *stage)
        {
            if (rc != SQLITE_OK && rc != SQLITE_ROW && rc != SQLITE_DONE)
            {
                std::string msg = "[SqliteGateway] ";
                msg += stage;
                msg += " error: ";
                msg += sqlite3_errmsg(db);
                throw PersistenceError(msg);
            }
        }

        /// Owns one prepared statement; finalized on scope exit.
        class Statement
        {
        public:
            Statement(sqlite3 *db, const char *sql, const char *stage)
                : db_(db), stage_(stage)
            {
                int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr);
                sqlite_check(rc, db_, stage_);
            }

            ~Statement()
            {
                if (stmt_)
                    sqlite3_finalize(stmt_);
            }

            Statement(const Statement &) = delete;
            Statement &operator=(const Statement &) = delete;

            void bind(int index, const std::string &text)
            {
                // explicit length, content may carry embedded NULs
                int rc = sqlite3_bind_text(stmt_, index, text.data(),
                                           static_cast<int>(text.size()), SQLITE_TRANSIENT);
                sqlite_check(rc, db_, stage_);
            }

            void bind(int index, std::int64_t value)
            {
                int rc = sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
                sqlite_check(rc, db_, stage_);
            }

            template <typename T>
            void bind(int index, const std::optional<T> &value)
            {
                if (value)
                {
                    bind(index, static_cast<std::int64_t>(*value));
                    return;
                }
                int rc = sqlite3_bind_null(stmt_, index);
                sqlite_check(rc, db_, stage_);
            }

            /// Returns true while a row is available.
            bool step()
            {
                int rc = sqlite3_step(stmt_);
                if (rc == SQLITE_ROW)
                    return true;
                sqlite_check(rc, db_, stage_);
                return false;
            }

            /// Single step for INSERT/UPDATE; returns the raw result code.
            int step_raw() { return sqlite3_step(stmt_); }

            std::int64_t column_int(int col) const
            {
                return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, col));
            }

            std::string column_text(int col) const
            {
                const unsigned char *text = sqlite3_column_text(stmt_, col);
                if (!text)
                    return std::string{};
                const int bytes = sqlite3_column_bytes(stmt_, col);
                return std::string(reinterpret_cast<const char *>(text), static_cast<std::size_t>(bytes));
            }

        private:
            sqlite3 *db_;
            const char *stage_;
            sqlite3_stmt *stmt_{nullptr};
        };

        std::string history_line(const Statement &row)
        {
            std::string line = "[";
            line += row.column_text(0);
            line += "] ";
            line += row.column_text(1);
            line += ": ";
            line += row.column_text(2);
            return line;
        }
    } // namespace

    // ───────────────────────── Ctor / Dtor ─────────────────────────

    SqliteGateway::SqliteGateway(const std::string &db_path)
    {
        int rc = sqlite3_open(db_path.c_str(), &db_);
        if (rc != SQLITE_OK)
        {
            std::string msg = "[SqliteGateway] Failed to open DB: ";
            msg += sqlite3_errstr(rc);
            if (db_)
            {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            throw PersistenceError(msg);
        }

        try
        {
            exec("PRAGMA journal_mode=WAL;", "set WAL");
            exec("PRAGMA foreign_keys=ON;", "enable foreign keys");
            init_schema();
        }
        catch (...)
        {
            sqlite3_close(db_);
            db_ = nullptr;
            throw;
        }
    }

    SqliteGateway::~SqliteGateway()
    {
        if (db_)
        {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    void SqliteGateway::exec(const char *sql, const char *stage)
    {
        char *errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK)
        {
            std::string msg = "[SqliteGateway] ";
            msg += stage;
            msg += " failed: ";
            if (errmsg)
            {
                msg += errmsg;
                sqlite3_free(errmsg);
            }
            throw PersistenceError(msg);
        }
    }

    void SqliteGateway::init_schema()
    {
        // TODO: store a salted password hash instead of the raw password.
        exec("CREATE TABLE IF NOT EXISTS users ("
             "  id         INTEGER PRIMARY KEY AUTOINCREMENT,"
             "  username   TEXT NOT NULL UNIQUE,"
             "  password   TEXT NOT NULL,"
             "  created_at TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP"
             ");",
             "create users");

        exec("CREATE TABLE IF NOT EXISTS chat_groups ("
             "  id         INTEGER PRIMARY KEY AUTOINCREMENT,"
             "  name       TEXT NOT NULL,"
             "  owner_id   INTEGER NOT NULL REFERENCES users(id) ON DELETE CASCADE,"
             "  created_at TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP"
             ");",
             "create chat_groups");

        exec("CREATE TABLE IF NOT EXISTS group_members ("
             "  group_id INTEGER NOT NULL REFERENCES chat_groups(id) ON DELETE CASCADE,"
             "  user_id  INTEGER NOT NULL REFERENCES users(id) ON DELETE CASCADE,"
             "  PRIMARY KEY (group_id, user_id)"
             ");",
             "create group_members");

        exec("CREATE TABLE IF NOT EXISTS messages ("
             "  id           INTEGER PRIMARY KEY AUTOINCREMENT,"
             "  from_user_id INTEGER NOT NULL REFERENCES users(id) ON DELETE CASCADE,"
             "  to_user_id   INTEGER REFERENCES users(id) ON DELETE CASCADE,"
             "  group_id     INTEGER REFERENCES chat_groups(id) ON DELETE CASCADE,"
             "  content      TEXT NOT NULL,"
             "  created_at   TEXT NOT NULL"
             ");",
             "create messages");

        exec("CREATE INDEX IF NOT EXISTS idx_messages_group ON messages(group_id);",
             "create idx_messages_group");
    }

    std::string SqliteGateway::format_timestamp(Clock::time_point tp)
    {
        auto tt = Clock::to_time_t(tp);
        std::tm tm{};
        gmtime_r(&tt, &tm);

        char buf[32];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d",
                      tm.tm_year + 1900,
                      tm.tm_mon + 1,
                      tm.tm_mday,
                      tm.tm_hour,
                      tm.tm_min,
                      tm.tm_sec);
        return buf;
    }

    // ───────────────────────── Accounts ─────────────────────────

    std::optional<UserId> SqliteGateway::authenticate(const std::string &username,
                                                      const std::string &password)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        Statement stmt(db_, "SELECT id FROM users WHERE username = ?1 AND password = ?2;",
                       "authenticate");
        stmt.bind(1, username);
        stmt.bind(2, password);

        if (stmt.step())
            return stmt.column_int(0);
        return std::nullopt;
    }

    bool SqliteGateway::register_user(const std::string &username,
                                      const std::string &password)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        Statement stmt(db_, "INSERT INTO users (username, password) VALUES (?1, ?2);",
                       "register_user");
        stmt.bind(1, username);
        stmt.bind(2, password);

        int rc = stmt.step_raw();
        if (rc == SQLITE_CONSTRAINT)
            return false; // username taken

        sqlite_check(rc, db_, "register_user");
        return true;
    }

    std::optional<UserId> SqliteGateway::find_user_id(const std::string &username)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        Statement stmt(db_, "SELECT id FROM users WHERE username = ?1;", "find_user_id");
        stmt.bind(1, username);

        if (stmt.step())
            return stmt.column_int(0);
        return std::nullopt;
    }

    std::vector<std::string> SqliteGateway::all_usernames()
    {
        std::lock_guard<std::mutex> lock(mutex_);

        Statement stmt(db_, "SELECT username FROM users ORDER BY username ASC;", "all_usernames");

        std::vector<std::string> out;
        while (stmt.step())
            out.push_back(stmt.column_text(0));
        return out;
    }

    // ───────────────────────── Messages ─────────────────────────

    void SqliteGateway::save_message(UserId senderId,
                                     std::optional<UserId> recipientId,
                                     std::optional<GroupId> groupId,
                                     const std::string &content,
                                     Clock::time_point timestamp)
    {
        const std::string ts = format_timestamp(timestamp);

        std::lock_guard<std::mutex> lock(mutex_);

        Statement stmt(db_,
                       "INSERT INTO messages (from_user_id, to_user_id, group_id, content, created_at) "
                       "VALUES (?1, ?2, ?3, ?4, ?5);",
                       "save_message");
        stmt.bind(1, senderId);
        stmt.bind(2, recipientId);
        stmt.bind(3, groupId);
        stmt.bind(4, content);
        stmt.bind(5, ts);

        stmt.step();
    }

    std::vector<std::string> SqliteGateway::private_history(UserId userA,
                                                            UserId userB,
                                                            std::size_t limit)
    {
        std::vector<std::string> out;
        if (limit == 0)
            return out;

        std::lock_guard<std::mutex> lock(mutex_);

        // newest N, returned oldest-first
        Statement stmt(db_,
                       "SELECT ts, sender, content FROM ("
                       "  SELECT m.id AS id, m.created_at AS ts, u.username AS sender, m.content AS content"
                       "  FROM messages m JOIN users u ON m.from_user_id = u.id"
                       "  WHERE (m.from_user_id = ?1 AND m.to_user_id = ?2)"
                       "     OR (m.from_user_id = ?2 AND m.to_user_id = ?1)"
                       "  ORDER BY m.id DESC LIMIT ?3"
                       ") ORDER BY id ASC;",
                       "private_history");
        stmt.bind(1, userA);
        stmt.bind(2, userB);
        stmt.bind(3, static_cast<std::int64_t>(limit));

        while (stmt.step())
            out.push_back(history_line(stmt));
        return out;
    }

    std::vector<std::string> SqliteGateway::group_history(GroupId groupId, std::size_t limit)
    {
        std::vector<std::string> out;
        if (limit == 0)
            return out;

        std::lock_guard<std::mutex> lock(mutex_);

        Statement stmt(db_,
                       "SELECT ts, sender, content FROM ("
                       "  SELECT m.id AS id, m.created_at AS ts, u.username AS sender, m.content AS content"
                       "  FROM messages m JOIN users u ON m.from_user_id = u.id"
                       "  WHERE m.group_id = ?1"
                       "  ORDER BY m.id DESC LIMIT ?2"
                       ") ORDER BY id ASC;",
                       "group_history");
        stmt.bind(1, groupId);
        stmt.bind(2, static_cast<std::int64_t>(limit));

        while (stmt.step())
            out.push_back(history_line(stmt));
        return out;
    }

    // ───────────────────────── Groups ─────────────────────────

    GroupId SqliteGateway::create_group(const std::string &name, UserId ownerId)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        Statement stmt(db_, "INSERT INTO chat_groups (name, owner_id) VALUES (?1, ?2);",
                       "create_group");
        stmt.bind(1, name);
        stmt.bind(2, ownerId);
        stmt.step();

        return static_cast<GroupId>(sqlite3_last_insert_rowid(db_));
    }

    void SqliteGateway::add_member(UserId userId, GroupId groupId)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        // OR IGNORE covers the duplicate key only; foreign key violations still fail.
        Statement stmt(db_,
                       "INSERT OR IGNORE INTO group_members (group_id, user_id) VALUES (?1, ?2);",
                       "add_member");
        stmt.bind(1, groupId);
        stmt.bind(2, userId);
        stmt.step();
    }

    std::unordered_set<UserId> SqliteGateway::group_member_ids(GroupId groupId)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        Statement stmt(db_, "SELECT user_id FROM group_members WHERE group_id = ?1;",
                       "group_member_ids");
        stmt.bind(1, groupId);

        std::unordered_set<UserId> out;
        while (stmt.step())
            out.insert(stmt.column_int(0));
        return out;
    }

} // namespace linechat
