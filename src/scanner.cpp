#include "worklog/scanner.hpp"
#include "worklog/log_parser.hpp"
#include "worklog/session_assembler.hpp"
#include <algorithm>
#include <iostream>

namespace worklog {

std::vector<std::filesystem::path> find_session_files(
    const std::filesystem::path& projects_dir) {

    namespace fs = std::filesystem;
    std::vector<fs::path> results;

    std::error_code ec;
    fs::directory_iterator projects(projects_dir, ec);
    if (ec) return results;

    for (auto& project_entry : projects) {
        if (!project_entry.is_directory(ec)) continue;

        fs::directory_iterator files(project_entry.path(), ec);
        if (ec) continue;

        for (auto& file_entry : files) {
            if (!file_entry.is_regular_file(ec)) continue;

            auto name = file_entry.path().filename().string();
            if (name.ends_with(".jsonl") && !name.starts_with("agent-")) {
                results.push_back(file_entry.path());
            }
        }
    }

    std::ranges::sort(results);
    return results;
}

std::expected<ScanSummary, StoreError> scan_sessions(
    Store& store, const std::filesystem::path& projects_dir,
    std::chrono::minutes idle_threshold, ProgressCallback on_progress) {

    auto files = find_session_files(projects_dir);
    ScanSummary summary;
    summary.files = static_cast<int>(files.size());

    for (size_t i = 0; i < files.size(); ++i) {
        auto events = read_events(files[i]);
        if (!events) {
            std::cerr << "Warning: cannot read " << files[i].string() << "\n";
            summary.unreadable++;
        } else if (auto session = assemble_session(*events, idle_threshold)) {
            auto source_id = files[i].lexically_relative(projects_dir).generic_string();
            auto stored = store.upsert(source_id, *session);
            if (!stored) return std::unexpected(stored.error());
            summary.sessions++;
        }

        if (on_progress) {
            on_progress(static_cast<int>(i + 1), summary.files);
        }
    }

    return summary;
}

} // namespace worklog
