#include "worklog/sync.hpp"
#include "worklog/allocator.hpp"
#include "worklog/calendar.hpp"

namespace worklog {

namespace {

SyncError store_failure(const std::string& operation, const StoreError& err) {
    return SyncError{operation, err.message};
}

} // namespace

std::expected<SyncSummary, SyncError> run_sync(
    Store& store, const SyncConfig& config, const PostTimeEntry& post,
    const Date& today, std::ostream& out) {

    SyncSummary summary;

    auto earliest = store.earliest_session_date();
    if (!earliest) return std::unexpected(store_failure("earliest_session_date", earliest.error()));
    if (!*earliest) {
        out << "No sessions found. Nothing to sync.\n";
        return summary;
    }

    // Today's work day is not over yet.
    auto yesterday = previous_day(today);
    auto start_date = **earliest;
    if (std::chrono::sys_days{start_date} > std::chrono::sys_days{yesterday}) {
        out << "No complete workdays to sync.\n";
        return summary;
    }

    out << "Syncing workdays from " << format_date(start_date) << " to "
        << format_date(yesterday) << "...\n";

    for (auto date = start_date;
         std::chrono::sys_days{date} <= std::chrono::sys_days{yesterday};
         date = next_day(date)) {

        if (!is_weekday(date)) continue;

        auto date_str = format_date(date);
        auto synced = store.is_day_synced(date, config.workspace_id);
        if (!synced) return std::unexpected(store_failure("is_day_synced " + date_str, synced.error()));
        if (*synced) continue;

        auto window = work_day_boundaries(config.work_day_start, config.work_day_end, date);
        if (!window) return std::unexpected(window.error());

        auto sessions = store.query_range(window->start, window->end);
        if (!sessions) return std::unexpected(store_failure("query_range " + date_str, sessions.error()));

        // Sessions may still arrive for this day through a later scan.
        if (sessions->empty()) continue;

        auto result = compute_allocations(*sessions, config.project_mapping,
                                          config.other_project_id,
                                          window->start, window->end);

        for (auto& project : result.skipped) {
            out << "  " << date_str << " - skipping unmapped project '" << project << "'\n";
        }

        if (result.allocations.empty()) {
            out << "  " << date_str << " - no allocations (all projects skipped)\n";
            continue;
        }

        out << "  " << date_str << " - syncing";
        int day_entries = 0;

        for (auto& allocation : result.allocations) {
            auto entry_synced = store.is_entry_synced(date, config.workspace_id,
                                                      allocation.project_id);
            if (!entry_synced) {
                out << "\n";
                return std::unexpected(store_failure("is_entry_synced " + date_str,
                                                     entry_synced.error()));
            }
            if (*entry_synced) continue;

            auto entry_id = post(allocation.project_id, allocation.start,
                                 allocation.end, config.workspace_id);
            if (!entry_id) {
                out << " - failed\n";
                return std::unexpected(SyncError{
                    "post_time_entry " + allocation.project_id + " on " + date_str,
                    entry_id.error().message});
            }

            auto marked = store.mark_entry_synced(date, config.workspace_id,
                                                  allocation.project_id, *entry_id);
            if (!marked) {
                out << "\n";
                return std::unexpected(store_failure("mark_entry_synced " + date_str,
                                                     marked.error()));
            }
            day_entries++;
        }

        auto marked = store.mark_day_synced(date, config.workspace_id);
        if (!marked) {
            out << "\n";
            return std::unexpected(store_failure("mark_day_synced " + date_str, marked.error()));
        }

        out << " - " << day_entries << " entries posted\n";
        summary.days_synced++;
        summary.entries_posted += day_entries;
    }

    out << "---\n";
    out << "Synced " << summary.days_synced << " days, "
        << summary.entries_posted << " total entries\n";

    return summary;
}

} // namespace worklog
