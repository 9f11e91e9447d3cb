#include <convo/delivery/SqliteConversationLog.hpp>

#include <unordered_map>
#include <utility>

#include "sqlite_support.hpp"

namespace convo::delivery
{
    namespace
    {
        constexpr const char *kOwner = "SqliteConversationLog";
    }

    // ───────────────────────── Ctor / Dtor ─────────────────────────

    SqliteConversationLog::SqliteConversationLog(const std::string &db_path, Clock clock)
        : db_(sqlite::open(db_path, kOwner)),
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

    SqliteConversationLog::~SqliteConversationLog()
    {
        if (db_)
        {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    void SqliteConversationLog::exec(const char *sql, const char *stage)
    {
        char *errmsg = nullptr;
        const int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK)
        {
            std::string msg = "[SqliteConversationLog] ";
            msg += stage;
            msg += ": ";
            if (errmsg)
            {
                msg += errmsg;
                sqlite3_free(errmsg);
            }
            throw StoreError(msg);
        }
    }

    void SqliteConversationLog::init_schema()
    {
        exec("CREATE TABLE IF NOT EXISTS log_entries ("
             "  conversation_id TEXT    NOT NULL,"
             "  entry_ms        INTEGER NOT NULL,"
             "  entry_seq       INTEGER NOT NULL,"
             "  produced_at_ms  INTEGER NOT NULL,"
             "  payload         BLOB    NOT NULL,"
             "  PRIMARY KEY (conversation_id, entry_ms, entry_seq)"
             ") WITHOUT ROWID;",
             "Failed to create log_entries");

        exec("CREATE TABLE IF NOT EXISTS log_watermarks ("
             "  conversation_id TEXT PRIMARY KEY,"
             "  floor_ms        INTEGER NOT NULL,"
             "  floor_seq       INTEGER NOT NULL"
             ");",
             "Failed to create log_watermarks");
    }

    // ───────────────────────── append() ─────────────────────────

    std::optional<StreamEntryId> SqliteConversationLog::latest_id_locked(const std::string &conversation_id)
    {
        sqlite::Statement stmt(db_,
                               "SELECT entry_ms, entry_seq FROM log_entries "
                               "WHERE conversation_id = ?1 "
                               "ORDER BY entry_ms DESC, entry_seq DESC LIMIT 1;",
                               kOwner);
        stmt.bind(1, conversation_id);

        if (stmt.step())
        {
            return StreamEntryId{static_cast<std::uint64_t>(stmt.column_int(0)),
                                 static_cast<std::uint64_t>(stmt.column_int(1))};
        }

        // Everything trimmed: new ids must still clear the floor.
        sqlite::Statement floor(db_,
                                "SELECT floor_ms, floor_seq FROM log_watermarks WHERE conversation_id = ?1;",
                                kOwner);
        floor.bind(1, conversation_id);
        if (floor.step())
        {
            return StreamEntryId{static_cast<std::uint64_t>(floor.column_int(0)),
                                 static_cast<std::uint64_t>(floor.column_int(1))};
        }
        return std::nullopt;
    }

    BroadcastEvent SqliteConversationLog::append_entry(const std::string &conversation_id,
                                                       const std::string &payload)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        sqlite::Transaction tx(db_, kOwner);

        const auto now = clock_();
        const auto now_ms = static_cast<std::uint64_t>(to_epoch_ms(now));
        const StreamEntryId id = next_entry_id(latest_id_locked(conversation_id).value_or(kBeginning), now_ms);

        sqlite::Statement stmt(db_,
                               "INSERT INTO log_entries "
                               "(conversation_id, entry_ms, entry_seq, produced_at_ms, payload) "
                               "VALUES (?1, ?2, ?3, ?4, ?5);",
                               kOwner);
        stmt.bind(1, conversation_id);
        stmt.bind(2, static_cast<sqlite3_int64>(id.ms()));
        stmt.bind(3, static_cast<sqlite3_int64>(id.seq()));
        stmt.bind(4, static_cast<sqlite3_int64>(to_epoch_ms(now)));
        stmt.bind_blob(5, payload);
        stmt.step();

        tx.commit();

        BroadcastEvent ev;
        ev.conversation_id = conversation_id;
        ev.stream_entry_id = id;
        ev.payload = payload;
        ev.produced_at = from_epoch_ms(to_epoch_ms(now));
        return ev;
    }

    // ───────────────────────── read_since() ─────────────────────────

    std::vector<BroadcastEvent> SqliteConversationLog::read_since(
        const std::string &conversation_id,
        const StreamEntryId &after_id,
        const std::optional<std::size_t> &limit)
    {
        std::vector<BroadcastEvent> out;
        if (limit.has_value() && *limit == 0)
            return out;

        std::lock_guard<std::mutex> lock(mutex_);

        sqlite::Statement stmt(db_,
                               "SELECT entry_ms, entry_seq, produced_at_ms, payload "
                               "FROM log_entries "
                               "WHERE conversation_id = ?1 "
                               "  AND (entry_ms > ?2 OR (entry_ms = ?2 AND entry_seq > ?3)) "
                               "ORDER BY entry_ms ASC, entry_seq ASC "
                               "LIMIT ?4;",
                               kOwner);
        stmt.bind(1, conversation_id);
        stmt.bind(2, static_cast<sqlite3_int64>(after_id.ms()));
        stmt.bind(3, static_cast<sqlite3_int64>(after_id.seq()));
        // LIMIT -1 is unbounded in SQLite.
        stmt.bind(4, limit.has_value() ? static_cast<sqlite3_int64>(*limit) : sqlite3_int64{-1});

        while (stmt.step())
        {
            BroadcastEvent ev;
            ev.conversation_id = conversation_id;
            ev.stream_entry_id = StreamEntryId{static_cast<std::uint64_t>(stmt.column_int(0)),
                                               static_cast<std::uint64_t>(stmt.column_int(1))};
            ev.produced_at = from_epoch_ms(stmt.column_int(2));
            ev.payload = stmt.column_blob(3);
            out.push_back(std::move(ev));
        }

        return out; // oldest-first
    }

    std::optional<StreamEntryId> SqliteConversationLog::latest_id(const std::string &conversation_id)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        sqlite::Statement stmt(db_,
                               "SELECT entry_ms, entry_seq FROM log_entries "
                               "WHERE conversation_id = ?1 "
                               "ORDER BY entry_ms DESC, entry_seq DESC LIMIT 1;",
                               kOwner);
        stmt.bind(1, conversation_id);

        if (!stmt.step())
            return std::nullopt;

        return StreamEntryId{static_cast<std::uint64_t>(stmt.column_int(0)),
                             static_cast<std::uint64_t>(stmt.column_int(1))};
    }

    StreamEntryId SqliteConversationLog::retention_floor(const std::string &conversation_id)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        sqlite::Statement stmt(db_,
                               "SELECT floor_ms, floor_seq FROM log_watermarks WHERE conversation_id = ?1;",
                               kOwner);
        stmt.bind(1, conversation_id);

        if (!stmt.step())
            return kBeginning;

        return StreamEntryId{static_cast<std::uint64_t>(stmt.column_int(0)),
                             static_cast<std::uint64_t>(stmt.column_int(1))};
    }

    // ───────────────────────── trim_before() ─────────────────────────

    std::size_t SqliteConversationLog::trim_before(SystemClock::time_point cutoff)
    {
        const auto cutoff_ms = static_cast<sqlite3_int64>(to_epoch_ms(cutoff));

        std::lock_guard<std::mutex> lock(mutex_);
        sqlite::Transaction tx(db_, kOwner);

        // Highest doomed id per conversation becomes its new floor.
        std::unordered_map<std::string, StreamEntryId> floors;
        {
            sqlite::Statement stmt(db_,
                                   "SELECT conversation_id, entry_ms, entry_seq FROM log_entries "
                                   "WHERE entry_ms < ?1;",
                                   kOwner);
            stmt.bind(1, cutoff_ms);

            while (stmt.step())
            {
                const StreamEntryId id{static_cast<std::uint64_t>(stmt.column_int(1)),
                                       static_cast<std::uint64_t>(stmt.column_int(2))};
                auto &floor = floors[stmt.column_text(0)];
                if (floor < id)
                    floor = id;
            }
        }

        if (floors.empty())
        {
            tx.commit();
            return 0;
        }

        for (const auto &[conversation, floor] : floors)
        {
            sqlite::Statement upsert(db_,
                                     "INSERT INTO log_watermarks (conversation_id, floor_ms, floor_seq) "
                                     "VALUES (?1, ?2, ?3) "
                                     "ON CONFLICT(conversation_id) DO UPDATE SET "
                                     "  floor_ms = excluded.floor_ms, floor_seq = excluded.floor_seq "
                                     "WHERE excluded.floor_ms > log_watermarks.floor_ms "
                                     "   OR (excluded.floor_ms = log_watermarks.floor_ms "
                                     "       AND excluded.floor_seq > log_watermarks.floor_seq);",
                                     kOwner);
            upsert.bind(1, conversation);
            upsert.bind(2, static_cast<sqlite3_int64>(floor.ms()));
            upsert.bind(3, static_cast<sqlite3_int64>(floor.seq()));
            upsert.step();
        }

        sqlite::Statement del(db_, "DELETE FROM log_entries WHERE entry_ms < ?1;", kOwner);
        del.bind(1, cutoff_ms);
        del.step();
        const auto removed = static_cast<std::size_t>(sqlite3_changes(db_));

        tx.commit();
        return removed;
    }

} // namespace convo::delivery
