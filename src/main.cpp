#include "worklog/analytics.hpp"
#include "worklog/calendar.hpp"
#include "worklog/clockify_client.hpp"
#include "worklog/config.hpp"
#include "worklog/display.hpp"
#include "worklog/env.hpp"
#include "worklog/scanner.hpp"
#include "worklog/store.hpp"
#include "worklog/sync.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <utility>

namespace {

struct CliArgs {
    std::string command;
    std::string config_path = "worklog.json";
    std::optional<worklog::Date> date;
};

void print_usage() {
    std::cerr << R"(Usage: worklog <command> [options]
Commands:
  scan                      Scan transcripts into the session database
  report                    Scan, then show one day's sessions
  sync                      Scan, then post completed workdays to Clockify
  projects                  List Clockify projects in the configured workspace
Options:
  --config <path>           Config file (default: worklog.json)
  --date <YYYY-MM-DD>       Day to report (default: today). The day runs from
                            local midnight to the next; a session crossing
                            midnight is listed on both days
Environment:
  WORKLOG_CLOCKIFY_API_KEY  Clockify API key (may be set in .env)
)";
}

std::optional<CliArgs> parse_args(int argc, char* argv[]) {
    if (argc < 2) return std::nullopt;

    CliArgs args;
    args.command = argv[1];
    if (args.command != "scan" && args.command != "report" &&
        args.command != "sync" && args.command != "projects") {
        std::cerr << "Unknown command: " << args.command << "\n";
        return std::nullopt;
    }

    for (int i = 2; i < argc; i += 2) {
        std::string flag = argv[i];
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << flag << "\n";
            return std::nullopt;
        }
        std::string val = argv[i + 1];

        if (flag == "--config") args.config_path = val;
        else if (flag == "--date") {
            args.date = worklog::parse_date(val);
            if (!args.date) {
                std::cerr << "Invalid date: " << val << "\n";
                return std::nullopt;
            }
        }
        else {
            std::cerr << "Unknown option: " << flag << "\n";
            return std::nullopt;
        }
    }

    return args;
}

bool scan(worklog::Store& store, const worklog::AppConfig& config) {
    std::cerr << "Scanning " << config.projects_dir.string() << "...\n";
    auto summary = worklog::scan_sessions(
        store, config.projects_dir,
        std::chrono::minutes(config.idle_timeout_minutes),
        worklog::display_progress);
    if (!summary) {
        std::cerr << "Error scanning sessions: " << summary.error().message << "\n";
        return false;
    }

    std::cerr << "Stored " << summary->sessions << " session(s) from "
              << summary->files << " file(s)";
    if (summary->unreadable > 0) {
        std::cerr << ", " << summary->unreadable << " unreadable";
    }
    std::cerr << "\n";
    return true;
}

std::optional<worklog::ClientConfig> client_config() {
    auto api_key = worklog::get_secret("clockify_api_key");
    if (!api_key) {
        std::cerr << "Error: " << api_key.error().message << "\n";
        return std::nullopt;
    }
    return worklog::ClientConfig{.api_key = *api_key};
}

} // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return 1;
    }

    worklog::load_env();

    auto config = worklog::load_config(args->config_path);
    if (!config) {
        std::cerr << "Error loading config: " << config.error().message << "\n";
        return 1;
    }

    if (args->command == "projects") {
        if (!config->sync) {
            std::cerr << "Error: no 'sync' section in " << args->config_path << "\n";
            return 1;
        }
        auto client = client_config();
        if (!client) return 1;

        auto projects = worklog::list_projects(*client, config->sync->workspace_id);
        if (!projects) {
            std::cerr << "Error listing projects: " << projects.error().message << "\n";
            return 1;
        }
        worklog::display_projects(*projects, config->sync->project_mapping);
        return 0;
    }

    auto store = worklog::Store::open(config->database);
    if (!store) {
        std::cerr << "Error opening database: " << store.error().message << "\n";
        return 1;
    }

    if (!scan(*store, *config)) return 1;

    auto today = worklog::local_date(std::chrono::system_clock::now());

    if (args->command == "report") {
        auto date = args->date.value_or(today);
        auto day_start = worklog::start_of_local_day(date);
        auto day_end = worklog::start_of_local_day(worklog::next_day(date));
        if (!day_start || !day_end) {
            std::cerr << "Error: " << (day_start ? day_end.error() : day_start.error()) << "\n";
            return 1;
        }

        auto sessions = store->query_range(*day_start, *day_end);
        if (!sessions) {
            std::cerr << "Error querying sessions: " << sessions.error().message << "\n";
            return 1;
        }
        worklog::display_day_report(date, worklog::sessions_for_day(std::move(*sessions), *day_start));
        return 0;
    }

    if (args->command == "sync") {
        if (!config->sync) {
            std::cerr << "Error: no 'sync' section in " << args->config_path << "\n";
            return 1;
        }
        auto client = client_config();
        if (!client) return 1;

        worklog::PostTimeEntry post = [&](const std::string& project_id,
                                          worklog::TimePoint start, worklog::TimePoint end,
                                          const std::string& workspace_id) {
            return worklog::post_time_entry(*client, project_id, start, end, workspace_id);
        };

        auto result = worklog::run_sync(*store, *config->sync, post, today, std::cout);
        if (!result) {
            std::cerr << "Sync aborted: " << result.error().describe() << "\n";
            return 1;
        }
    }

    return 0;
}
