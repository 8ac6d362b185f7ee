#pragma once

#include "worklog/types.hpp"
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace worklog {

// Splits the work day between destinations in proportion to tracked time.
// Allocations are ordered by project id, contiguous, and cover exactly
// [work_day_start, work_day_end); the rounding remainder goes to the last one.
AllocationResult compute_allocations(
    const std::vector<Session>& sessions,
    const std::map<std::string, std::string>& project_mapping,
    const std::optional<std::string>& other_project_id,
    TimePoint work_day_start, TimePoint work_day_end);

std::expected<WorkDayWindow, SyncError> work_day_boundaries(
    const std::string& start, const std::string& end, const Date& date);

} // namespace worklog
