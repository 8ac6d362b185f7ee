#pragma once

#include "worklog/types.hpp"
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace worklog {

class Store {
public:
    // Opens (or creates) the database and its schema. ":memory:" is accepted.
    static std::expected<Store, StoreError> open(const std::filesystem::path& path);

    std::expected<void, StoreError> upsert(const std::string& source_id,
                                           const Session& session);

    // Sessions with start < range_end and end >= range_start, by start time.
    std::expected<std::vector<Session>, StoreError> query_range(
        TimePoint range_start, TimePoint range_end) const;

    std::expected<std::optional<Date>, StoreError> earliest_session_date() const;
    std::expected<int64_t, StoreError> session_count() const;

    std::expected<DayState, StoreError> day_state(
        const Date& date, const std::string& workspace_id) const;
    std::expected<bool, StoreError> is_day_synced(
        const Date& date, const std::string& workspace_id) const;
    std::expected<void, StoreError> mark_day_synced(
        const Date& date, const std::string& workspace_id);

    std::expected<bool, StoreError> is_entry_synced(
        const Date& date, const std::string& workspace_id,
        const std::string& project_id) const;
    std::expected<std::optional<std::string>, StoreError> synced_entry_id(
        const Date& date, const std::string& workspace_id,
        const std::string& project_id) const;
    std::expected<void, StoreError> mark_entry_synced(
        const Date& date, const std::string& workspace_id,
        const std::string& project_id, const std::string& entry_id);

private:
    struct DbCloser {
        void operator()(sqlite3* db) const { sqlite3_close(db); }
    };

    explicit Store(sqlite3* db);

    StoreError last_error(const std::string& context) const;

    std::unique_ptr<sqlite3, DbCloser> db_;
};

} // namespace worklog
