#pragma once

#include "worklog/types.hpp"
#include <chrono>
#include <optional>
#include <vector>

namespace worklog {

// Builds the session for one transcript. Gaps of at least `idle_threshold`
// between consecutive events are not counted as active time.
std::optional<Session> assemble_session(
    const std::vector<Event>& events,
    std::chrono::minutes idle_threshold = std::chrono::minutes(15));

} // namespace worklog
