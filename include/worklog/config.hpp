#pragma once

#include "worklog/types.hpp"
#include <expected>
#include <filesystem>
#include <optional>
#include <nlohmann/json.hpp>

namespace worklog {

struct AppConfig {
    std::filesystem::path database = "worklog.db";
    std::filesystem::path projects_dir;
    int idle_timeout_minutes = 15;
    std::optional<SyncConfig> sync;
};

// $HOME/.claude/projects, or a relative ".claude/projects" without HOME.
std::filesystem::path default_projects_dir();

std::expected<AppConfig, ConfigError> parse_config(const nlohmann::json& j);

// A missing file yields the defaults.
std::expected<AppConfig, ConfigError> load_config(const std::filesystem::path& path);

} // namespace worklog
