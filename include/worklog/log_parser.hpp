#pragma once

#include "worklog/types.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace worklog {

// One transcript line. Only "user" and "assistant" entries with a top-level
// timestamp become events; everything else yields nullopt.
std::optional<Event> parse_event(const std::string& line);

std::optional<TokenUsage> parse_usage(const nlohmann::json& message);

// Reads every line of a transcript in file order. nullopt if the file
// cannot be opened.
std::optional<std::vector<Event>> read_events(const std::filesystem::path& path);

} // namespace worklog
