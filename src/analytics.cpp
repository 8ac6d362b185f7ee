#include "worklog/analytics.hpp"
#include <algorithm>
#include <unordered_map>

namespace worklog {

std::vector<ProjectSummary> summarize_by_project(const std::vector<Session>& sessions) {
    struct Acc {
        int count = 0;
        std::chrono::seconds active{0};
        uint64_t tokens = 0;
    };

    std::unordered_map<std::string, Acc> by_project;
    for (auto& s : sessions) {
        auto& a = by_project[s.project];
        a.count++;
        a.active += s.active_duration;
        a.tokens += s.total_tokens();
    }

    std::vector<ProjectSummary> result;
    for (auto& [project, acc] : by_project) {
        result.push_back({
            .project = project,
            .session_count = acc.count,
            .active_duration = acc.active,
            .tokens = acc.tokens,
        });
    }

    std::ranges::sort(result, [](const ProjectSummary& a, const ProjectSummary& b) {
        if (a.active_duration != b.active_duration) return a.active_duration > b.active_duration;
        return a.project < b.project;
    });
    return result;
}

std::vector<Session> sessions_for_day(std::vector<Session> sessions, TimePoint day_start) {
    std::erase_if(sessions, [&](const Session& s) {
        return s.start < day_start && s.end <= day_start;
    });
    return sessions;
}

std::chrono::seconds total_active(const std::vector<Session>& sessions) {
    std::chrono::seconds total{0};
    for (auto& s : sessions) total += s.active_duration;
    return total;
}

} // namespace worklog
