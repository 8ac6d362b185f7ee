#include "worklog/env.hpp"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <string>

namespace worklog {

namespace {

std::string trim(std::string_view sv) {
    auto start = sv.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return "";
    auto end = sv.find_last_not_of(" \t\r\n");
    return std::string(sv.substr(start, end - start + 1));
}

bool is_quoted(const std::string& s) {
    return s.size() >= 2 &&
           ((s.front() == '"' && s.back() == '"') ||
            (s.front() == '\'' && s.back() == '\''));
}

// Unquoted values end at " #"; quoted values are taken verbatim.
std::string parse_value(const std::string& raw) {
    if (is_quoted(raw)) return raw.substr(1, raw.size() - 2);
    auto comment = raw.find(" #");
    if (comment != std::string::npos) return trim(raw.substr(0, comment));
    return raw;
}

} // namespace

std::unordered_map<std::string, std::string> load_env(
    const std::filesystem::path& path) {

    std::unordered_map<std::string, std::string> vars;
    std::ifstream file(path);
    if (!file.is_open()) return vars;

    std::string line;
    while (std::getline(file, line)) {
        auto trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') continue;
        if (trimmed.starts_with("export ")) trimmed = trim(trimmed.substr(7));

        auto eq = trimmed.find('=');
        if (eq == std::string::npos) continue;

        auto key = trim(trimmed.substr(0, eq));
        auto val = parse_value(trim(trimmed.substr(eq + 1)));
        if (key.empty()) continue;

        vars[key] = val;
        ::setenv(key.c_str(), val.c_str(), 0);
    }

    return vars;
}

std::optional<std::string> get_env(const std::string& key) {
    if (auto* val = std::getenv(key.c_str())) {
        return std::string(val);
    }
    return std::nullopt;
}

std::string secret_env_var(const std::string& name) {
    std::string var = "WORKLOG_";
    for (char c : name) {
        var += std::isalnum(static_cast<unsigned char>(c))
                   ? static_cast<char>(std::toupper(static_cast<unsigned char>(c)))
                   : '_';
    }
    return var;
}

std::expected<std::string, ConfigError> get_secret(const std::string& name) {
    auto var = secret_env_var(name);
    auto value = get_env(var);
    if (!value || value->empty()) {
        return std::unexpected(ConfigError{
            "secret '" + name + "' not found (set " + var + " in the environment or .env)"});
    }
    return *value;
}

} // namespace worklog
