#include <convo/delivery/SqliteSyncStateStore.hpp>

#include <utility>

#include "sqlite_support.hpp"

namespace convo::delivery
{
    namespace
    {
        constexpr const char *kOwner = "SqliteSyncStateStore";

        ClientSyncState read_row(const sqlite::Statement &stmt)
        {
            ClientSyncState st;
            st.user_id = stmt.column_text(0);
            st.client_id = stmt.column_text(1);
            st.conversation_id = stmt.column_text(2);
            st.last_message_id = StreamEntryId{static_cast<std::uint64_t>(stmt.column_int(3)),
                                               static_cast<std::uint64_t>(stmt.column_int(4))};
            st.last_sync_at = from_epoch_ms(stmt.column_int(5));
            return st;
        }
    } // namespace

    SqliteSyncStateStore::SqliteSyncStateStore(const std::string &db_path,
                                               std::chrono::seconds ttl,
                                               Clock clock)
        : db_(sqlite::open(db_path, kOwner)),
          ttl_(ttl),
          clock_(clock ? std::move(clock) : Clock{[]
                                                  { return SystemClock::now(); }})
    {
        try
        {
            init_schema();
        }
        catch (const StoreError &)
        {
            sqlite3_close(db_);
            db_ = nullptr;
            throw;
        }
    }

    SqliteSyncStateStore::~SqliteSyncStateStore()
    {
        if (db_)
        {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    void SqliteSyncStateStore::init_schema()
    {
        const char *sql =
            "CREATE TABLE IF NOT EXISTS client_sync_state ("
            "  user_id         TEXT    NOT NULL,"
            "  client_id       TEXT    NOT NULL,"
            "  conversation_id TEXT    NOT NULL,"
            "  cursor_ms       INTEGER NOT NULL,"
            "  cursor_seq      INTEGER NOT NULL,"
            "  last_sync_at_ms INTEGER NOT NULL,"
            "  expires_at_ms   INTEGER NOT NULL,"
            "  PRIMARY KEY (user_id, client_id, conversation_id)"
            ");"
            "CREATE INDEX IF NOT EXISTS idx_client_sync_state_expiry "
            "  ON client_sync_state (expires_at_ms);";

        char *errmsg = nullptr;
        const int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK)
        {
            std::string msg = "[SqliteSyncStateStore] Failed to create table: ";
            if (errmsg)
            {
                msg += errmsg;
                sqlite3_free(errmsg);
            }
            throw StoreError(msg);
        }
    }

    std::optional<ClientSyncState> SqliteSyncStateStore::get(const std::string &user_id,
                                                             const std::string &client_id)
    {
        const auto now_ms = static_cast<sqlite3_int64>(to_epoch_ms(clock_()));

        std::lock_guard<std::mutex> lock(mutex_);

        sqlite::Statement stmt(db_,
                               "SELECT user_id, client_id, conversation_id, cursor_ms, cursor_seq, last_sync_at_ms "
                               "FROM client_sync_state "
                               "WHERE user_id = ?1 AND client_id = ?2 AND expires_at_ms > ?3 "
                               "ORDER BY last_sync_at_ms DESC LIMIT 1;",
                               kOwner);
        stmt.bind(1, user_id);
        stmt.bind(2, client_id);
        stmt.bind(3, now_ms);

        if (!stmt.step())
            return std::nullopt;
        return read_row(stmt);
    }

    std::optional<ClientSyncState> SqliteSyncStateStore::get(const std::string &user_id,
                                                             const std::string &client_id,
                                                             const std::string &conversation_id)
    {
        const auto now_ms = static_cast<sqlite3_int64>(to_epoch_ms(clock_()));

        std::lock_guard<std::mutex> lock(mutex_);

        sqlite::Statement stmt(db_,
                               "SELECT user_id, client_id, conversation_id, cursor_ms, cursor_seq, last_sync_at_ms "
                               "FROM client_sync_state "
                               "WHERE user_id = ?1 AND client_id = ?2 AND conversation_id = ?3 "
                               "  AND expires_at_ms > ?4;",
                               kOwner);
        stmt.bind(1, user_id);
        stmt.bind(2, client_id);
        stmt.bind(3, conversation_id);
        stmt.bind(4, now_ms);

        if (!stmt.step())
            return std::nullopt;
        return read_row(stmt);
    }

    void SqliteSyncStateStore::put(const ClientSyncState &state)
    {
        const auto now = clock_();
        const auto now_ms = static_cast<sqlite3_int64>(to_epoch_ms(now));
        const auto expires_ms = static_cast<sqlite3_int64>(to_epoch_ms(now + ttl_));

        std::lock_guard<std::mutex> lock(mutex_);

        // SET expressions see the pre-update row, so both cursor columns
        // evaluate the same "may advance" condition.
        sqlite::Statement stmt(db_,
                               "INSERT INTO client_sync_state "
                               "(user_id, client_id, conversation_id, cursor_ms, cursor_seq, last_sync_at_ms, expires_at_ms) "
                               "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7) "
                               "ON CONFLICT(user_id, client_id, conversation_id) DO UPDATE SET "
                               "  cursor_ms = CASE WHEN client_sync_state.expires_at_ms <= ?8 "
                               "                     OR excluded.cursor_ms > client_sync_state.cursor_ms "
                               "                     OR (excluded.cursor_ms = client_sync_state.cursor_ms "
                               "                         AND excluded.cursor_seq >= client_sync_state.cursor_seq) "
                               "                   THEN excluded.cursor_ms ELSE client_sync_state.cursor_ms END,"
                               "  cursor_seq = CASE WHEN client_sync_state.expires_at_ms <= ?8 "
                               "                      OR excluded.cursor_ms > client_sync_state.cursor_ms "
                               "                      OR (excluded.cursor_ms = client_sync_state.cursor_ms "
                               "                          AND excluded.cursor_seq >= client_sync_state.cursor_seq) "
                               "                    THEN excluded.cursor_seq ELSE client_sync_state.cursor_seq END,"
                               "  last_sync_at_ms = excluded.last_sync_at_ms,"
                               "  expires_at_ms = excluded.expires_at_ms;",
                               kOwner);
        stmt.bind(1, state.user_id);
        stmt.bind(2, state.client_id);
        stmt.bind(3, state.conversation_id);
        stmt.bind(4, static_cast<sqlite3_int64>(state.last_message_id.ms()));
        stmt.bind(5, static_cast<sqlite3_int64>(state.last_message_id.seq()));
        stmt.bind(6, static_cast<sqlite3_int64>(to_epoch_ms(state.last_sync_at)));
        stmt.bind(7, expires_ms);
        stmt.bind(8, now_ms);
        stmt.step();
    }

    std::size_t SqliteSyncStateStore::purge_expired()
    {
        const auto now_ms = static_cast<sqlite3_int64>(to_epoch_ms(clock_()));

        std::lock_guard<std::mutex> lock(mutex_);

        sqlite::Statement stmt(db_, "DELETE FROM client_sync_state WHERE expires_at_ms <= ?1;", kOwner);
        stmt.bind(1, now_ms);
        stmt.step();
        return static_cast<std::size_t>(sqlite3_changes(db_));
    }

} // namespace convo::delivery
