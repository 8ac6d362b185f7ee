#include "worklog/session_assembler.hpp"

namespace worklog {

std::optional<Session> assemble_session(
    const std::vector<Event>& events,
    std::chrono::minutes idle_threshold) {

    if (events.empty()) return std::nullopt;

    Session session;
    session.start = events.front().timestamp;
    session.end = events.back().timestamp;

    TimePoint::duration active{0};
    for (size_t i = 1; i < events.size(); ++i) {
        auto gap = events[i].timestamp - events[i - 1].timestamp;
        if (gap < idle_threshold) {
            active += gap;
        }
    }
    session.active_duration = std::chrono::duration_cast<std::chrono::seconds>(active);

    bool have_project = false;
    for (auto& e : events) {
        if (!have_project && e.directory) {
            session.project = *e.directory;
            have_project = true;
        }
        if (e.usage) {
            session.input_tokens += e.usage->input;
            session.output_tokens += e.usage->output;
            session.cache_creation_input_tokens += e.usage->cache_creation;
            session.cache_read_input_tokens += e.usage->cache_read;
        }
    }

    return session;
}

} // namespace worklog
