#include <gtest/gtest.h>
#include "worklog/calendar.hpp"
#include "worklog/clockify_client.hpp"

using namespace worklog;
using namespace std::chrono;

TEST(StatusHint, KnownStatuses) {
    EXPECT_EQ(status_hint(401), "check your API key");
    EXPECT_EQ(status_hint(404), "project or workspace not found");
    EXPECT_EQ(status_hint(422), "invalid request - check time range and project ID");
    EXPECT_EQ(status_hint(503), "unexpected error");
}

TEST(TimeEntryRequest, Fields) {
    auto start = *parse_timestamp("2026-02-04T09:00:00Z");
    auto end = *parse_timestamp("2026-02-04T15:00:00.500Z");

    auto j = make_time_entry_request("proj-1", start, end);
    EXPECT_EQ(j["projectId"], "proj-1");
    EXPECT_EQ(j["start"], "2026-02-04T09:00:00Z");
    EXPECT_EQ(j["end"], "2026-02-04T15:00:00Z");
    EXPECT_EQ(j["description"], "Development");
    EXPECT_EQ(j.size(), 4u);
}

TEST(TimeEntryResponse, ReturnsId) {
    auto id = parse_time_entry_response(
        R"({"id":"64f1c2","description":"Development","projectId":"proj-1"})");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, "64f1c2");
}

TEST(TimeEntryResponse, MissingIdIsError) {
    EXPECT_FALSE(parse_time_entry_response(R"({"description":"x"})").has_value());
    EXPECT_FALSE(parse_time_entry_response(R"({"id":null})").has_value());
}

TEST(TimeEntryResponse, MalformedJsonIsError) {
    auto id = parse_time_entry_response("<html>Bad Gateway</html>");
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().message, "Failed to parse Clockify response JSON");
}

TEST(ParseProject, AllFields) {
    auto p = parse_project(nlohmann::json::parse(
        R"({"id":"p1","name":"Backend","archived":true,"color":"#03A9F4"})"));
    EXPECT_EQ(p.id, "p1");
    EXPECT_EQ(p.name, "Backend");
    EXPECT_TRUE(p.archived);
}

TEST(ParseProject, MissingFieldsDefault) {
    auto p = parse_project(nlohmann::json::parse(R"({"id":"p2"})"));
    EXPECT_EQ(p.id, "p2");
    EXPECT_EQ(p.name, "");
    EXPECT_FALSE(p.archived);
}
