#pragma once

#include "worklog/types.hpp"
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

namespace worklog {

// Loads KEY=value pairs into the process environment without overriding
// variables that are already set. A missing file is not an error.
std::unordered_map<std::string, std::string> load_env(
    const std::filesystem::path& path = ".env");

std::optional<std::string> get_env(const std::string& key);

// "clockify_api_key" -> "WORKLOG_CLOCKIFY_API_KEY"
std::string secret_env_var(const std::string& name);

std::expected<std::string, ConfigError> get_secret(const std::string& name);

} // namespace worklog
