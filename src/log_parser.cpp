#include "worklog/log_parser.hpp"
#include "worklog/calendar.hpp"
#include <fstream>

namespace worklog {

namespace {

uint64_t safe_count(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_number_unsigned())
        return j[key].get<uint64_t>();
    if (j.contains(key) && j[key].is_number_integer() && j[key].get<int64_t>() > 0)
        return static_cast<uint64_t>(j[key].get<int64_t>());
    return 0;
}

std::optional<std::string> safe_str(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string())
        return j[key].get<std::string>();
    return std::nullopt;
}

} // namespace

std::optional<TokenUsage> parse_usage(const nlohmann::json& message) {
    if (!message.is_object() || !message.contains("usage") ||
        !message["usage"].is_object()) {
        return std::nullopt;
    }

    auto& usage = message["usage"];
    return TokenUsage{
        .input = safe_count(usage, "input_tokens"),
        .output = safe_count(usage, "output_tokens"),
        .cache_creation = safe_count(usage, "cache_creation_input_tokens"),
        .cache_read = safe_count(usage, "cache_read_input_tokens"),
    };
}

std::optional<Event> parse_event(const std::string& line) {
    auto j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    auto type = safe_str(j, "type");
    if (!type || (*type != "user" && *type != "assistant")) return std::nullopt;

    auto ts = safe_str(j, "timestamp");
    if (!ts) return std::nullopt;
    auto timestamp = parse_timestamp(*ts);
    if (!timestamp) return std::nullopt;

    Event event;
    event.timestamp = *timestamp;
    event.directory = safe_str(j, "cwd");
    if (j.contains("message")) {
        event.usage = parse_usage(j["message"]);
    }
    return event;
}

std::optional<std::vector<Event>> read_events(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) return std::nullopt;

    std::vector<Event> events;
    std::string line;
    while (std::getline(file, line)) {
        if (line.empty()) continue;
        if (auto event = parse_event(line)) {
            events.push_back(std::move(*event));
        }
    }
    return events;
}

} // namespace worklog
