#include "worklog/clockify_client.hpp"
#include "worklog/calendar.hpp"
#include <httplib.h>

namespace worklog {

namespace {

constexpr int page_size = 50;

std::string safe_str(const nlohmann::json& j, const std::string& key,
                     const std::string& fallback = "") {
    if (j.contains(key) && !j[key].is_null() && j[key].is_string())
        return j[key].get<std::string>();
    return fallback;
}

httplib::Headers auth_headers(const ClientConfig& config) {
    return {{"X-Api-Key", config.api_key}};
}

void configure(httplib::SSLClient& client) {
    client.set_connection_timeout(10);
    client.set_read_timeout(30);
}

ApiError status_error(const httplib::Response& res) {
    return ApiError{res.status, "Clockify API returned HTTP " +
                                    std::to_string(res.status) + ": " +
                                    status_hint(res.status)};
}

ApiError transport_error(const httplib::Result& res) {
    return ApiError{0, "Network error contacting Clockify: " +
                           httplib::to_string(res.error())};
}

} // namespace

std::string status_hint(int status_code) {
    switch (status_code) {
        case 400: return "invalid project ID or request parameters";
        case 401: return "check your API key";
        case 403: return "access forbidden - check workspace/project permissions";
        case 404: return "project or workspace not found";
        case 422: return "invalid request - check time range and project ID";
        default: return "unexpected error";
    }
}

nlohmann::json make_time_entry_request(const std::string& project_id,
                                       TimePoint start, TimePoint end) {
    return {
        {"projectId", project_id},
        {"start", format_timestamp(start)},
        {"end", format_timestamp(end)},
        {"description", "Development"},
    };
}

std::expected<std::string, ApiError> parse_time_entry_response(const std::string& body) {
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded()) {
        return std::unexpected(ApiError{0, "Failed to parse Clockify response JSON"});
    }

    auto id = safe_str(j, "id");
    if (id.empty()) {
        return std::unexpected(ApiError{0, "Clockify response has no entry id"});
    }
    return id;
}

ClockifyProject parse_project(const nlohmann::json& j) {
    return {
        .id = safe_str(j, "id"),
        .name = safe_str(j, "name"),
        .archived = j.contains("archived") && j["archived"].is_boolean() &&
                    j["archived"].get<bool>(),
    };
}

std::expected<std::string, ApiError> post_time_entry(
    const ClientConfig& config, const std::string& project_id,
    TimePoint start, TimePoint end, const std::string& workspace_id) {

    httplib::SSLClient client(config.base_url);
    configure(client);

    auto body = make_time_entry_request(project_id, start, end).dump();
    auto res = client.Post("/api/v1/workspaces/" + workspace_id + "/time-entries",
                           auth_headers(config), body, "application/json");
    if (!res) return std::unexpected(transport_error(res));

    if (res->status < 200 || res->status >= 300) {
        return std::unexpected(status_error(*res));
    }

    return parse_time_entry_response(res->body);
}

std::expected<std::vector<ClockifyProject>, ApiError> list_projects(
    const ClientConfig& config, const std::string& workspace_id) {

    httplib::SSLClient client(config.base_url);
    configure(client);

    std::vector<ClockifyProject> all;
    for (int page = 1;; ++page) {
        std::string path = "/api/v1/workspaces/" + workspace_id +
                           "/projects?page-size=" + std::to_string(page_size) +
                           "&page=" + std::to_string(page);

        auto res = client.Get(path, auth_headers(config));
        if (!res) return std::unexpected(transport_error(res));
        if (res->status != 200) return std::unexpected(status_error(*res));

        auto data = nlohmann::json::parse(res->body, nullptr, false);
        if (data.is_discarded() || !data.is_array()) {
            return std::unexpected(ApiError{0, "Expected array of Clockify projects"});
        }

        for (auto& j : data) {
            all.push_back(parse_project(j));
        }

        if (static_cast<int>(data.size()) < page_size) break; // last page
    }

    return all;
}

} // namespace worklog
