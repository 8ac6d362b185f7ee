#pragma once

#include "worklog/store.hpp"
#include "worklog/types.hpp"
#include <chrono>
#include <expected>
#include <filesystem>
#include <functional>
#include <vector>

namespace worklog {

using ProgressCallback = std::function<void(int current, int total)>;

struct ScanSummary {
    int files = 0;
    int sessions = 0;
    int unreadable = 0;
};

// Transcripts live one directory deep: <projects_dir>/<project>/<id>.jsonl.
// Sub-agent transcripts (agent-*.jsonl) are skipped. Sorted by path.
std::vector<std::filesystem::path> find_session_files(
    const std::filesystem::path& projects_dir);

// Re-assembles every transcript and upserts it under its path relative to
// `projects_dir`. Only storage errors abort the scan.
std::expected<ScanSummary, StoreError> scan_sessions(
    Store& store, const std::filesystem::path& projects_dir,
    std::chrono::minutes idle_threshold, ProgressCallback on_progress = nullptr);

} // namespace worklog
