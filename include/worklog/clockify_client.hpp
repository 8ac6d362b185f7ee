#pragma once

#include "worklog/types.hpp"
#include <expected>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace worklog {

struct ClockifyProject {
    std::string id;
    std::string name;
    bool archived = false;
};

// Guidance for a non-success HTTP status from Clockify.
std::string status_hint(int status_code);

nlohmann::json make_time_entry_request(const std::string& project_id,
                                       TimePoint start, TimePoint end);

std::expected<std::string, ApiError> parse_time_entry_response(const std::string& body);

ClockifyProject parse_project(const nlohmann::json& j);

// POSTs one time entry and returns the id Clockify assigned to it.
std::expected<std::string, ApiError> post_time_entry(
    const ClientConfig& config, const std::string& project_id,
    TimePoint start, TimePoint end, const std::string& workspace_id);

std::expected<std::vector<ClockifyProject>, ApiError> list_projects(
    const ClientConfig& config, const std::string& workspace_id);

} // namespace worklog
