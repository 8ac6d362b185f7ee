#include "worklog/allocator.hpp"
#include "worklog/calendar.hpp"
#include <algorithm>

namespace worklog {

AllocationResult compute_allocations(
    const std::vector<Session>& sessions,
    const std::map<std::string, std::string>& project_mapping,
    const std::optional<std::string>& other_project_id,
    TimePoint work_day_start, TimePoint work_day_end) {

    AllocationResult result;

    // Ordered by project id: fixes both layout order and remainder placement.
    std::map<std::string, int64_t> buckets;

    for (auto& session : sessions) {
        int64_t secs = session.active_duration.count();

        const std::string* project_id = nullptr;
        if (auto it = project_mapping.find(session.project); it != project_mapping.end()) {
            project_id = &it->second;
        } else if (other_project_id) {
            project_id = &*other_project_id;
        }

        if (!project_id) {
            if (std::ranges::find(result.skipped, session.project) == result.skipped.end()) {
                result.skipped.push_back(session.project);
            }
            continue;
        }

        buckets[*project_id] += secs;
    }

    std::erase_if(buckets, [](const auto& b) { return b.second <= 0; });
    if (buckets.empty()) return result;

    int64_t total_included = 0;
    for (auto& [_, tracked] : buckets) total_included += tracked;

    int64_t work_day_secs = std::chrono::duration_cast<std::chrono::seconds>(
        work_day_end - work_day_start).count();

    std::vector<std::pair<std::string, int64_t>> durations;
    int64_t sum_allocated = 0;
    for (auto& [project_id, tracked] : buckets) {
        int64_t allocated = work_day_secs * tracked / total_included;
        durations.emplace_back(project_id, allocated);
        sum_allocated += allocated;
    }
    durations.back().second += work_day_secs - sum_allocated;

    auto cursor = work_day_start;
    for (auto& [project_id, secs] : durations) {
        auto end = cursor + std::chrono::seconds(secs);
        result.allocations.push_back({
            .project_id = project_id,
            .start = cursor,
            .end = end,
        });
        cursor = end;
    }
    // Absorb any sub-second part of the window so the last block ends exactly.
    result.allocations.back().end = work_day_end;

    return result;
}

std::expected<WorkDayWindow, SyncError> work_day_boundaries(
    const std::string& start, const std::string& end, const Date& date) {

    auto start_time = parse_clock_time(start);
    if (!start_time) {
        return std::unexpected(SyncError{"parsing work_day_start", "invalid time '" + start + "'"});
    }
    auto end_time = parse_clock_time(end);
    if (!end_time) {
        return std::unexpected(SyncError{"parsing work_day_end", "invalid time '" + end + "'"});
    }

    auto start_utc = local_to_utc(date, *start_time);
    if (!start_utc) {
        return std::unexpected(SyncError{"converting work_day_start", start_utc.error()});
    }
    auto end_utc = local_to_utc(date, *end_time);
    if (!end_utc) {
        return std::unexpected(SyncError{"converting work_day_end", end_utc.error()});
    }

    if (*end_utc <= *start_utc) {
        return std::unexpected(SyncError{"computing work day",
            "work_day_end must be after work_day_start on " + format_date(date)});
    }

    return WorkDayWindow{.start = *start_utc, .end = *end_utc};
}

} // namespace worklog
