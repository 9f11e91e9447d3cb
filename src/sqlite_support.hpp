#ifndef CONVO_DELIVERY_SQLITE_SUPPORT_HPP
#define CONVO_DELIVERY_SQLITE_SUPPORT_HPP

// Internal helpers shared by the SQLite-backed stores.

#include <string>

#include <sqlite3.h>

#include <convo/delivery/types.hpp>

namespace convo::delivery::sqlite
{
    inline void check(int rc, sqlite3 *db, const char *owner, const char *stage)
    {
        if (rc != SQLITE_OK && rc != SQLITE_ROW && rc != SQLITE_DONE)
        {
            std::string msg = "[";
            msg += owner;
            msg += "] ";
            msg += stage;
            msg += " error: ";
            msg += sqlite3_errmsg(db);
            throw StoreError(msg);
        }
    }

    /// Opens `path` in serialized mode with WAL journaling.
    inline sqlite3 *open(const std::string &path, const char *owner)
    {
        sqlite3 *db = nullptr;
        const int rc = sqlite3_open_v2(path.c_str(), &db,
                                       SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                       nullptr);
        if (rc != SQLITE_OK)
        {
            std::string msg = "[";
            msg += owner;
            msg += "] Failed to open DB: ";
            msg += db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
            if (db)
                sqlite3_close(db);
            throw StoreError(msg);
        }

        char *errmsg = nullptr;
        if (sqlite3_exec(db, "PRAGMA journal_mode=WAL;", nullptr, nullptr, &errmsg) != SQLITE_OK)
        {
            std::string msg = "[";
            msg += owner;
            msg += "] Failed to set WAL: ";
            if (errmsg)
            {
                msg += errmsg;
                sqlite3_free(errmsg);
            }
            sqlite3_close(db);
            throw StoreError(msg);
        }

        sqlite3_busy_timeout(db, 5000);
        return db;
    }

    /// Prepared statement that finalizes itself.
    class Statement
    {
    public:
        Statement(sqlite3 *db, const char *sql, const char *owner)
            : db_(db), owner_(owner)
        {
            check(sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr), db_, owner_, "prepare");
        }

        ~Statement()
        {
            if (stmt_)
                sqlite3_finalize(stmt_);
        }

        Statement(const Statement &) = delete;
        Statement &operator=(const Statement &) = delete;

        void bind(int index, const std::string &value)
        {
            check(sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT), db_, owner_, "bind text");
        }

        void bind_blob(int index, const std::string &value)
        {
            check(sqlite3_bind_blob(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT),
                  db_, owner_, "bind blob");
        }

        void bind(int index, sqlite3_int64 value)
        {
            check(sqlite3_bind_int64(stmt_, index, value), db_, owner_, "bind int");
        }

        /// true while a row is available.
        bool step()
        {
            const int rc = sqlite3_step(stmt_);
            check(rc, db_, owner_, "step");
            return rc == SQLITE_ROW;
        }

        [[nodiscard]] sqlite3_int64 column_int(int col) const
        {
            return sqlite3_column_int64(stmt_, col);
        }

        [[nodiscard]] std::string column_text(int col) const
        {
            const unsigned char *text = sqlite3_column_text(stmt_, col);
            return text ? std::string(reinterpret_cast<const char *>(text)) : std::string{};
        }

        [[nodiscard]] std::string column_blob(int col) const
        {
            const void *data = sqlite3_column_blob(stmt_, col);
            const int size = sqlite3_column_bytes(stmt_, col);
            if (!data || size <= 0)
                return {};
            return std::string(static_cast<const char *>(data), static_cast<std::size_t>(size));
        }

    private:
        sqlite3 *db_;
        const char *owner_;
        sqlite3_stmt *stmt_{nullptr};
    };

    /// BEGIN IMMEDIATE ... COMMIT, rolled back unless commit() ran.
    class Transaction
    {
    public:
        Transaction(sqlite3 *db, const char *owner)
            : db_(db), owner_(owner)
        {
            check(sqlite3_exec(db_, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr), db_, owner_, "begin");
        }

        ~Transaction()
        {
            if (!done_)
                sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        }

        Transaction(const Transaction &) = delete;
        Transaction &operator=(const Transaction &) = delete;

        void commit()
        {
            check(sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, nullptr), db_, owner_, "commit");
            done_ = true;
        }

    private:
        sqlite3 *db_;
        const char *owner_;
        bool done_ = false;
    };

} // namespace convo::delivery::sqlite

#endif // CONVO_DELIVERY_SQLITE_SUPPORT_HPP
