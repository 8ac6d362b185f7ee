#pragma once

#include "worklog/types.hpp"
#include <chrono>
#include <vector>

namespace worklog {

// Per-project totals, busiest project first.
std::vector<ProjectSummary> summarize_by_project(const std::vector<Session>& sessions);

// Sessions of one local day from a range query. Drops the ones that started
// earlier and only touch the day by ending exactly at `day_start`.
std::vector<Session> sessions_for_day(std::vector<Session> sessions, TimePoint day_start);

std::chrono::seconds total_active(const std::vector<Session>& sessions);

} // namespace worklog
