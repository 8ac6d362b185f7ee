#pragma once

#include "worklog/clockify_client.hpp"
#include "worklog/types.hpp"
#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace worklog {

std::string format_duration(std::chrono::seconds d); // "2h 05m"
std::string format_tokens(uint64_t tokens);           // "1.2M", "340k", "87"

void display_progress(int current, int total);

void display_day_report(const Date& date, const std::vector<Session>& sessions);

void display_projects(const std::vector<ClockifyProject>& projects,
                      const std::map<std::string, std::string>& project_mapping);

} // namespace worklog
