#include "worklog/display.hpp"
#include "worklog/analytics.hpp"
#include "worklog/calendar.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>
#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

namespace worklog {

namespace {

using namespace ftxui;

std::string f1(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << v;
    return oss.str();
}

std::string project_label(const std::string& project) {
    return project.empty() ? "(no directory)" : project;
}

void print_document(Element document) {
    auto screen = Screen::Create(Dimension::Full(), Dimension::Fit(document));
    Render(screen, document);
    screen.Print();
    std::cout << "\n";
}

Element render_sessions(const std::vector<Session>& sessions) {
    std::vector<std::vector<std::string>> rows;
    rows.push_back({"Project", "Start", "End", "Active", "Tokens"});
    for (auto& s : sessions) {
        rows.push_back({
            project_label(s.project),
            format_local_time(s.start),
            format_local_time(s.end),
            format_duration(s.active_duration),
            format_tokens(s.total_tokens()),
        });
    }

    auto table = Table(rows);
    table.SelectRow(0).Decorate(bold);
    table.SelectRow(0).SeparatorVertical(LIGHT);
    table.SelectAll().Border(LIGHT);
    table.SelectColumn(3).DecorateCells(align_right);
    table.SelectColumn(4).DecorateCells(align_right);
    return table.Render();
}

Element render_totals(const std::vector<ProjectSummary>& totals) {
    std::vector<std::vector<std::string>> rows;
    rows.push_back({"Project", "Sessions", "Active", "Tokens"});
    for (auto& p : totals) {
        rows.push_back({
            project_label(p.project),
            std::to_string(p.session_count),
            format_duration(p.active_duration),
            format_tokens(p.tokens),
        });
    }

    auto table = Table(rows);
    table.SelectRow(0).Decorate(bold);
    table.SelectAll().Border(LIGHT);
    table.SelectColumn(2).Decorate(color(Color::Green));
    return table.Render();
}

} // namespace

std::string format_duration(std::chrono::seconds d) {
    auto total_minutes = std::chrono::duration_cast<std::chrono::minutes>(d).count();
    std::ostringstream oss;
    if (total_minutes >= 60) {
        oss << total_minutes / 60 << "h " << std::setw(2) << std::setfill('0')
            << total_minutes % 60 << "m";
    } else {
        oss << total_minutes << "m";
    }
    return oss.str();
}

std::string format_tokens(uint64_t tokens) {
    if (tokens >= 1'000'000) return f1(tokens / 1'000'000.0) + "M";
    if (tokens >= 1'000) return std::to_string(tokens / 1'000) + "k";
    return std::to_string(tokens);
}

void display_progress(int current, int total) {
    std::cerr << "\rScanning transcripts " << current << "/" << total << std::flush;
    if (current == total) std::cerr << "\n";
}

void display_day_report(const Date& date, const std::vector<Session>& sessions) {
    if (sessions.empty()) {
        std::cout << "No sessions on " << format_date(date) << ".\n";
        return;
    }

    auto totals = summarize_by_project(sessions);
    print_document(vbox({
        text("Sessions for " + format_date(date)) | bold | color(Color::Cyan),
        separator(),
        render_sessions(sessions),
        text(""),
        text("By project") | bold,
        render_totals(totals),
        text(""),
        hbox({
            text("Total: ") | dim,
            text(format_duration(total_active(sessions))) | bold,
            text(" across " + std::to_string(sessions.size()) + " session(s)") | dim,
        }),
    }));
}

void display_projects(const std::vector<ClockifyProject>& projects,
                      const std::map<std::string, std::string>& project_mapping) {
    if (projects.empty()) {
        std::cout << "No projects in this workspace.\n";
        return;
    }

    std::vector<std::vector<std::string>> rows;
    rows.push_back({"Project ID", "Name", "Mapped from"});
    for (auto& p : projects) {
        std::string mapped;
        for (auto& [dir, id] : project_mapping) {
            if (id != p.id) continue;
            if (!mapped.empty()) mapped += ", ";
            mapped += dir;
        }
        rows.push_back({p.id, p.name + (p.archived ? " (archived)" : ""), mapped});
    }

    auto table = Table(rows);
    table.SelectRow(0).Decorate(bold);
    table.SelectRow(0).SeparatorVertical(LIGHT);
    table.SelectAll().Border(LIGHT);
    for (size_t i = 1; i < rows.size(); ++i) {
        if (projects[i - 1].archived) table.SelectRow(static_cast<int>(i)).Decorate(dim);
    }

    print_document(vbox({
        text("Clockify projects") | bold | color(Color::Cyan),
        separator(),
        table.Render(),
    }));
}

} // namespace worklog
