#pragma once

#include "worklog/store.hpp"
#include "worklog/types.hpp"
#include <expected>
#include <functional>
#include <ostream>
#include <string>

namespace worklog {

// Creates one external time entry and returns its id.
using PostTimeEntry = std::function<std::expected<std::string, ApiError>(
    const std::string& project_id, TimePoint start, TimePoint end,
    const std::string& workspace_id)>;

struct SyncSummary {
    int days_synced = 0;
    int entries_posted = 0;
};

// Posts allocations for every unsynced weekday from the earliest stored
// session through the day before `today`. Stops at the first failure;
// entries recorded before it stay recorded, so a re-run resumes.
std::expected<SyncSummary, SyncError> run_sync(
    Store& store, const SyncConfig& config, const PostTimeEntry& post,
    const Date& today, std::ostream& out);

} // namespace worklog
