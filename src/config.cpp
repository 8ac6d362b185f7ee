#include "worklog/config.hpp"
#include "worklog/calendar.hpp"
#include "worklog/env.hpp"
#include <fstream>
#include <limits>

namespace worklog {

namespace {

std::expected<std::optional<std::string>, ConfigError> optional_str(
    const nlohmann::json& j, const std::string& key) {
    if (!j.contains(key) || j[key].is_null()) return std::optional<std::string>{};
    if (!j[key].is_string()) {
        return std::unexpected(ConfigError{"'" + key + "' must be a string"});
    }
    return std::optional<std::string>{j[key].get<std::string>()};
}

std::expected<SyncConfig, ConfigError> parse_sync(const nlohmann::json& j) {
    if (!j.is_object()) return std::unexpected(ConfigError{"'sync' must be an object"});

    SyncConfig sync;

    auto workspace = optional_str(j, "workspace_id");
    if (!workspace) return std::unexpected(workspace.error());
    if (!*workspace || (*workspace)->empty()) {
        return std::unexpected(ConfigError{"'sync.workspace_id' is required"});
    }
    sync.workspace_id = **workspace;

    for (auto [key, target] : {std::pair{"work_day_start", &sync.work_day_start},
                               std::pair{"work_day_end", &sync.work_day_end}}) {
        auto value = optional_str(j, key);
        if (!value) return std::unexpected(value.error());
        if (*value) *target = **value;
        if (!parse_clock_time(*target)) {
            return std::unexpected(ConfigError{
                "'sync." + std::string(key) + "' must be HH:MM, got '" + *target + "'"});
        }
    }

    auto start = parse_clock_time(sync.work_day_start);
    auto end = parse_clock_time(sync.work_day_end);
    if (end->hour * 60 + end->minute <= start->hour * 60 + start->minute) {
        return std::unexpected(ConfigError{"'sync.work_day_end' must be after 'sync.work_day_start'"});
    }

    auto other = optional_str(j, "other_project_id");
    if (!other) return std::unexpected(other.error());
    if (*other && !(*other)->empty()) sync.other_project_id = **other;

    if (j.contains("project_mapping")) {
        auto& mapping = j["project_mapping"];
        if (!mapping.is_object()) {
            return std::unexpected(ConfigError{"'sync.project_mapping' must be an object"});
        }
        for (auto& [project, id] : mapping.items()) {
            if (!id.is_string()) {
                return std::unexpected(ConfigError{
                    "project id for '" + project + "' must be a string"});
            }
            sync.project_mapping[project] = id.get<std::string>();
        }
    }

    return sync;
}

} // namespace

std::filesystem::path default_projects_dir() {
    auto home = get_env("HOME");
    std::filesystem::path base = home ? *home : ".";
    return base / ".claude" / "projects";
}

std::expected<AppConfig, ConfigError> parse_config(const nlohmann::json& j) {
    if (!j.is_object()) return std::unexpected(ConfigError{"config must be a JSON object"});

    AppConfig config;
    config.projects_dir = default_projects_dir();

    auto database = optional_str(j, "database");
    if (!database) return std::unexpected(database.error());
    if (*database) config.database = **database;

    auto projects_dir = optional_str(j, "projects_dir");
    if (!projects_dir) return std::unexpected(projects_dir.error());
    if (*projects_dir) config.projects_dir = **projects_dir;

    if (j.contains("idle_timeout_minutes")) {
        auto& idle = j["idle_timeout_minutes"];
        constexpr int64_t max_idle = std::numeric_limits<int>::max();
        bool in_range = idle.is_number_unsigned()
            ? idle.get<uint64_t>() >= 1 && idle.get<uint64_t>() <= static_cast<uint64_t>(max_idle)
            : idle.is_number_integer() && idle.get<int64_t>() >= 1 && idle.get<int64_t>() <= max_idle;
        if (!in_range) {
            return std::unexpected(ConfigError{"'idle_timeout_minutes' must be a positive integer"});
        }
        config.idle_timeout_minutes = static_cast<int>(idle.get<int64_t>());
    }

    if (j.contains("sync") && !j["sync"].is_null()) {
        auto sync = parse_sync(j["sync"]);
        if (!sync) return std::unexpected(sync.error());
        config.sync = std::move(*sync);
    }

    return config;
}

std::expected<AppConfig, ConfigError> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return parse_config(nlohmann::json::object());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(ConfigError{"cannot open " + path.string()});
    }

    auto j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        return std::unexpected(ConfigError{"malformed JSON in " + path.string()});
    }

    auto config = parse_config(j);
    if (!config) {
        return std::unexpected(ConfigError{path.string() + ": " + config.error().message});
    }
    return config;
}

} // namespace worklog
