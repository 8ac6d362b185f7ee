#include "worklog/store.hpp"
#include "worklog/calendar.hpp"

namespace worklog {

namespace {

constexpr const char* schema_sql = R"(
PRAGMA journal_mode=WAL;
CREATE TABLE IF NOT EXISTS sessions (
    source_path                  TEXT    PRIMARY KEY,
    project                      TEXT    NOT NULL,
    date                         TEXT    NOT NULL,
    start_time                   TEXT    NOT NULL,
    end_time                     TEXT    NOT NULL,
    duration_seconds             INTEGER NOT NULL,
    input_tokens                 INTEGER NOT NULL DEFAULT 0,
    output_tokens                INTEGER NOT NULL DEFAULT 0,
    cache_creation_input_tokens  INTEGER NOT NULL DEFAULT 0,
    cache_read_input_tokens      INTEGER NOT NULL DEFAULT 0
);
CREATE INDEX IF NOT EXISTS sessions_start_time ON sessions (start_time);
CREATE TABLE IF NOT EXISTS synced_days (
    date          TEXT NOT NULL,
    workspace_id  TEXT NOT NULL,
    state         TEXT NOT NULL,
    synced_at     TEXT NOT NULL,
    PRIMARY KEY (date, workspace_id)
);
CREATE TABLE IF NOT EXISTS synced_entries (
    date               TEXT NOT NULL,
    workspace_id       TEXT NOT NULL,
    project_id         TEXT NOT NULL,
    clockify_entry_id  TEXT NOT NULL,
    synced_at          TEXT NOT NULL,
    PRIMARY KEY (date, workspace_id, project_id)
);
)";

constexpr const char* day_complete = "complete";

struct StmtFinalizer {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};

using Statement = std::unique_ptr<sqlite3_stmt, StmtFinalizer>;

Statement prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return nullptr;
    }
    return Statement(stmt);
}

void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

std::string now_text() {
    return format_timestamp(std::chrono::system_clock::now());
}

} // namespace

Store::Store(sqlite3* db) : db_(db) {}

std::expected<Store, StoreError> Store::open(const std::filesystem::path& path) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &raw,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    Store store(raw);
    if (rc != SQLITE_OK) {
        return std::unexpected(store.last_error("opening " + path.string()));
    }

    char* err = nullptr;
    rc = sqlite3_exec(raw, schema_sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        return std::unexpected(StoreError{rc, "initializing database: " + msg});
    }

    return store;
}

StoreError Store::last_error(const std::string& context) const {
    if (!db_) return StoreError{SQLITE_NOMEM, context + ": out of memory"};
    return StoreError{sqlite3_errcode(db_.get()),
                      context + ": " + sqlite3_errmsg(db_.get())};
}

std::expected<void, StoreError> Store::upsert(const std::string& source_id,
                                              const Session& session) {
    auto stmt = prepare(db_.get(),
        "INSERT OR REPLACE INTO sessions ("
        "    source_path, project, date, start_time, end_time,"
        "    duration_seconds, input_tokens, output_tokens,"
        "    cache_creation_input_tokens, cache_read_input_tokens"
        ") VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)");
    if (!stmt) return std::unexpected(last_error("upserting session"));

    bind_text(stmt.get(), 1, source_id);
    bind_text(stmt.get(), 2, session.project);
    bind_text(stmt.get(), 3, format_date(local_date(session.start)));
    bind_text(stmt.get(), 4, format_timestamp(session.start));
    bind_text(stmt.get(), 5, format_timestamp(session.end));
    sqlite3_bind_int64(stmt.get(), 6, session.active_duration.count());
    sqlite3_bind_int64(stmt.get(), 7, static_cast<sqlite3_int64>(session.input_tokens));
    sqlite3_bind_int64(stmt.get(), 8, static_cast<sqlite3_int64>(session.output_tokens));
    sqlite3_bind_int64(stmt.get(), 9,
                       static_cast<sqlite3_int64>(session.cache_creation_input_tokens));
    sqlite3_bind_int64(stmt.get(), 10,
                       static_cast<sqlite3_int64>(session.cache_read_input_tokens));

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return std::unexpected(last_error("upserting session " + source_id));
    }
    return {};
}

std::expected<std::vector<Session>, StoreError> Store::query_range(
    TimePoint range_start, TimePoint range_end) const {

    auto stmt = prepare(db_.get(),
        "SELECT project, start_time, end_time, duration_seconds,"
        "       input_tokens, output_tokens,"
        "       cache_creation_input_tokens, cache_read_input_tokens "
        "FROM sessions "
        "WHERE start_time < ?1 AND end_time >= ?2 "
        "ORDER BY start_time, source_path");
    if (!stmt) return std::unexpected(last_error("querying sessions"));

    bind_text(stmt.get(), 1, format_timestamp(range_end));
    bind_text(stmt.get(), 2, format_timestamp(range_start));

    std::vector<Session> sessions;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        auto start = parse_timestamp(column_text(stmt.get(), 1));
        auto end = parse_timestamp(column_text(stmt.get(), 2));
        if (!start || !end) {
            return std::unexpected(StoreError{SQLITE_CORRUPT,
                "querying sessions: malformed stored timestamp"});
        }

        sessions.push_back({
            .start = *start,
            .end = *end,
            .active_duration = std::chrono::seconds(sqlite3_column_int64(stmt.get(), 3)),
            .project = column_text(stmt.get(), 0),
            .input_tokens = static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 4)),
            .output_tokens = static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 5)),
            .cache_creation_input_tokens =
                static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 6)),
            .cache_read_input_tokens =
                static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 7)),
        });
    }
    if (rc != SQLITE_DONE) return std::unexpected(last_error("querying sessions"));

    return sessions;
}

std::expected<std::optional<Date>, StoreError> Store::earliest_session_date() const {
    auto stmt = prepare(db_.get(), "SELECT MIN(start_time) FROM sessions");
    if (!stmt) return std::unexpected(last_error("finding earliest session"));

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::unexpected(last_error("finding earliest session"));
    }
    if (sqlite3_column_type(stmt.get(), 0) == SQLITE_NULL) {
        return std::optional<Date>{};
    }

    auto start = parse_timestamp(column_text(stmt.get(), 0));
    if (!start) {
        return std::unexpected(StoreError{SQLITE_CORRUPT,
            "finding earliest session: malformed stored timestamp"});
    }
    return std::optional<Date>{local_date(*start)};
}

std::expected<int64_t, StoreError> Store::session_count() const {
    auto stmt = prepare(db_.get(), "SELECT COUNT(*) FROM sessions");
    if (!stmt || sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::unexpected(last_error("counting sessions"));
    }
    return sqlite3_column_int64(stmt.get(), 0);
}

std::expected<DayState, StoreError> Store::day_state(
    const Date& date, const std::string& workspace_id) const {

    auto stmt = prepare(db_.get(),
        "SELECT state FROM synced_days WHERE date = ?1 AND workspace_id = ?2");
    if (!stmt) return std::unexpected(last_error("reading day state"));

    bind_text(stmt.get(), 1, format_date(date));
    bind_text(stmt.get(), 2, workspace_id);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) return DayState::Open;
    if (rc != SQLITE_ROW) return std::unexpected(last_error("reading day state"));

    return column_text(stmt.get(), 0) == day_complete ? DayState::Complete
                                                      : DayState::Open;
}

std::expected<bool, StoreError> Store::is_day_synced(
    const Date& date, const std::string& workspace_id) const {
    auto state = day_state(date, workspace_id);
    if (!state) return std::unexpected(state.error());
    return *state == DayState::Complete;
}

std::expected<void, StoreError> Store::mark_day_synced(
    const Date& date, const std::string& workspace_id) {

    auto stmt = prepare(db_.get(),
        "INSERT INTO synced_days (date, workspace_id, state, synced_at) "
        "VALUES (?1, ?2, ?3, ?4)");
    if (!stmt) return std::unexpected(last_error("marking day synced"));

    bind_text(stmt.get(), 1, format_date(date));
    bind_text(stmt.get(), 2, workspace_id);
    bind_text(stmt.get(), 3, day_complete);
    bind_text(stmt.get(), 4, now_text());

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return std::unexpected(last_error("marking day " + format_date(date) + " synced"));
    }
    return {};
}

std::expected<std::optional<std::string>, StoreError> Store::synced_entry_id(
    const Date& date, const std::string& workspace_id,
    const std::string& project_id) const {

    auto stmt = prepare(db_.get(),
        "SELECT clockify_entry_id FROM synced_entries "
        "WHERE date = ?1 AND workspace_id = ?2 AND project_id = ?3");
    if (!stmt) return std::unexpected(last_error("reading synced entry"));

    bind_text(stmt.get(), 1, format_date(date));
    bind_text(stmt.get(), 2, workspace_id);
    bind_text(stmt.get(), 3, project_id);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) return std::optional<std::string>{};
    if (rc != SQLITE_ROW) return std::unexpected(last_error("reading synced entry"));
    return std::optional<std::string>{column_text(stmt.get(), 0)};
}

std::expected<bool, StoreError> Store::is_entry_synced(
    const Date& date, const std::string& workspace_id,
    const std::string& project_id) const {
    auto entry = synced_entry_id(date, workspace_id, project_id);
    if (!entry) return std::unexpected(entry.error());
    return entry->has_value();
}

std::expected<void, StoreError> Store::mark_entry_synced(
    const Date& date, const std::string& workspace_id,
    const std::string& project_id, const std::string& entry_id) {

    auto stmt = prepare(db_.get(),
        "INSERT INTO synced_entries ("
        "    date, workspace_id, project_id, clockify_entry_id, synced_at"
        ") VALUES (?1, ?2, ?3, ?4, ?5)");
    if (!stmt) return std::unexpected(last_error("marking entry synced"));

    bind_text(stmt.get(), 1, format_date(date));
    bind_text(stmt.get(), 2, workspace_id);
    bind_text(stmt.get(), 3, project_id);
    bind_text(stmt.get(), 4, entry_id);
    bind_text(stmt.get(), 5, now_text());

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return std::unexpected(last_error("marking entry " + project_id + " on " +
                                          format_date(date) + " synced"));
    }
    return {};
}

} // namespace worklog
