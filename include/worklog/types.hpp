#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace worklog {

using TimePoint = std::chrono::system_clock::time_point;
using Date = std::chrono::year_month_day;

struct TokenUsage {
    uint64_t input = 0;
    uint64_t output = 0;
    uint64_t cache_creation = 0;
    uint64_t cache_read = 0;
};

struct Event {
    TimePoint timestamp;
    std::optional<std::string> directory;
    std::optional<TokenUsage> usage;
};

struct Session {
    TimePoint start;
    TimePoint end;
    std::chrono::seconds active_duration{0};
    std::string project;
    uint64_t input_tokens = 0;
    uint64_t output_tokens = 0;
    uint64_t cache_creation_input_tokens = 0;
    uint64_t cache_read_input_tokens = 0;

    uint64_t total_tokens() const {
        return input_tokens + output_tokens +
               cache_creation_input_tokens + cache_read_input_tokens;
    }
};

struct Allocation {
    std::string project_id;
    TimePoint start;
    TimePoint end;

    std::chrono::seconds duration() const {
        return std::chrono::duration_cast<std::chrono::seconds>(end - start);
    }
};

struct AllocationResult {
    std::vector<Allocation> allocations;
    std::vector<std::string> skipped; // unmapped projects, first-seen order
};

struct WorkDayWindow {
    TimePoint start;
    TimePoint end;
};

enum class DayState {
    Open,
    Complete,
};

struct SyncConfig {
    std::string workspace_id;
    std::string work_day_start = "09:00";
    std::string work_day_end = "17:00";
    std::map<std::string, std::string> project_mapping;
    std::optional<std::string> other_project_id;
};

// Analytics output types

struct ProjectSummary {
    std::string project;
    int session_count = 0;
    std::chrono::seconds active_duration{0};
    uint64_t tokens = 0;
};

// Errors

struct ApiError {
    int status_code = 0;
    std::string message;
};

struct StoreError {
    int code = 0;
    std::string message;
};

struct SyncError {
    std::string operation;
    std::string message;

    std::string describe() const { return operation + ": " + message; }
};

struct ConfigError {
    std::string message;
};

struct ClientConfig {
    std::string api_key;
    std::string base_url = "api.clockify.me";
};

} // namespace worklog
