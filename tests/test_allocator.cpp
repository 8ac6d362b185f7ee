#include <gtest/gtest.h>
#include "worklog/allocator.hpp"
#include "worklog/calendar.hpp"
#include <cstdlib>

using namespace worklog;
using namespace std::chrono;

namespace {

// Work day: 09:00-17:00 UTC on 2026-02-04 (8h = 28800s).
const TimePoint work_start = *parse_timestamp("2026-02-04T09:00:00Z");
const TimePoint work_end = *parse_timestamp("2026-02-04T17:00:00Z");
constexpr int64_t work_day_secs = 28800;

TimePoint utc(const std::string& s) {
    return *parse_timestamp(s);
}

Session session(const std::string& project, int64_t active_secs) {
    Session s;
    s.start = utc("2026-02-04T10:00:00Z");
    s.end = s.start;
    s.active_duration = seconds(active_secs);
    s.project = project;
    return s;
}

const std::optional<std::string> other = "proj-other";
const std::optional<std::string> no_other = std::nullopt;

} // namespace

TEST(ComputeAllocations, ZeroSessionsReturnsEmpty) {
    auto result = compute_allocations({}, {{"/work/foo", "proj-foo"}}, other,
                                      work_start, work_end);
    EXPECT_TRUE(result.allocations.empty());
    EXPECT_TRUE(result.skipped.empty());
}

TEST(ComputeAllocations, SingleProjectFillsWorkDay) {
    auto result = compute_allocations({session("/work/myapp", 3600)},
                                      {{"/work/myapp", "proj-myapp"}}, other,
                                      work_start, work_end);
    ASSERT_EQ(result.allocations.size(), 1u);
    EXPECT_EQ(result.allocations[0].project_id, "proj-myapp");
    EXPECT_EQ(result.allocations[0].start, work_start);
    EXPECT_EQ(result.allocations[0].end, work_end);
}

TEST(ComputeAllocations, TwoProjectsSplitProportionally) {
    std::vector<Session> sessions = {session("/a", 10800), session("/b", 3600)};
    auto result = compute_allocations(sessions, {{"/a", "P1"}, {"/b", "P2"}},
                                      std::optional<std::string>("P3"),
                                      work_start, work_end);

    ASSERT_EQ(result.allocations.size(), 2u);
    EXPECT_EQ(result.allocations[0].project_id, "P1");
    EXPECT_EQ(result.allocations[0].start, work_start);
    EXPECT_EQ(result.allocations[0].end, utc("2026-02-04T15:00:00Z"));
    EXPECT_EQ(result.allocations[1].project_id, "P2");
    EXPECT_EQ(result.allocations[1].start, utc("2026-02-04T15:00:00Z"));
    EXPECT_EQ(result.allocations[1].end, work_end);
    EXPECT_TRUE(result.skipped.empty());
}

TEST(ComputeAllocations, SessionsOfSameDestinationAccumulate) {
    std::vector<Session> sessions = {
        session("/a", 1800), session("/a", 1800), session("/b", 3600),
    };
    auto result = compute_allocations(sessions, {{"/a", "P1"}, {"/b", "P2"}},
                                      no_other, work_start, work_end);
    ASSERT_EQ(result.allocations.size(), 2u);
    EXPECT_EQ(result.allocations[0].duration(), hours(4));
    EXPECT_EQ(result.allocations[1].duration(), hours(4));
}

TEST(ComputeAllocations, UnmappedProjectsAggregateIntoOther) {
    std::vector<Session> sessions = {
        session("/work/mapped", 7200),
        session("/work/unknown", 3600),
        session("/work/another", 3600),
    };
    auto result = compute_allocations(sessions, {{"/work/mapped", "proj-mapped"}},
                                      other, work_start, work_end);

    ASSERT_EQ(result.allocations.size(), 2u);
    EXPECT_EQ(result.allocations[0].project_id, "proj-mapped");
    EXPECT_EQ(result.allocations[0].end, utc("2026-02-04T13:00:00Z"));
    EXPECT_EQ(result.allocations[1].project_id, "proj-other");
    EXPECT_EQ(result.allocations[1].end, work_end);
    EXPECT_TRUE(result.skipped.empty());
}

TEST(ComputeAllocations, UnmappedProjectsSkippedWithoutOther) {
    std::vector<Session> sessions = {
        session("/work/mapped", 7200),
        session("/work/unknown", 7200),
        session("/work/unknown", 600),
    };
    auto result = compute_allocations(sessions, {{"/work/mapped", "proj-mapped"}},
                                      no_other, work_start, work_end);

    ASSERT_EQ(result.allocations.size(), 1u);
    EXPECT_EQ(result.allocations[0].project_id, "proj-mapped");
    EXPECT_EQ(result.allocations[0].start, work_start);
    EXPECT_EQ(result.allocations[0].end, work_end);
    EXPECT_EQ(result.skipped, std::vector<std::string>{"/work/unknown"});
}

TEST(ComputeAllocations, AllSkippedYieldsNoAllocations) {
    std::vector<Session> sessions = {session("/x", 600), session("/y", 600)};
    auto result = compute_allocations(sessions, {}, no_other, work_start, work_end);
    EXPECT_TRUE(result.allocations.empty());
    EXPECT_EQ(result.skipped, (std::vector<std::string>{"/x", "/y"}));
}

TEST(ComputeAllocations, ZeroLengthSessionsAllocateNothing) {
    auto result = compute_allocations({session("/a", 0)}, {{"/a", "P1"}}, no_other,
                                      work_start, work_end);
    EXPECT_TRUE(result.allocations.empty());
}

TEST(ComputeAllocations, ZeroBucketGetsNoBlock) {
    std::vector<Session> sessions = {session("/a", 3600), session("/z", 0)};
    auto result = compute_allocations(sessions, {{"/a", "P1"}, {"/z", "P9"}}, no_other,
                                      work_start, work_end);
    ASSERT_EQ(result.allocations.size(), 1u);
    EXPECT_EQ(result.allocations[0].project_id, "P1");
    EXPECT_EQ(result.allocations[0].end, work_end);
}

TEST(ComputeAllocations, AllocationsAreContiguous) {
    std::vector<Session> sessions = {
        session("/work/alpha", 5000),
        session("/work/beta", 3000),
        session("/work/gamma", 2000),
    };
    auto result = compute_allocations(
        sessions,
        {{"/work/alpha", "proj-a"}, {"/work/beta", "proj-b"}, {"/work/gamma", "proj-c"}},
        no_other, work_start, work_end);

    ASSERT_EQ(result.allocations.size(), 3u);
    EXPECT_EQ(result.allocations.front().start, work_start);
    for (size_t i = 1; i < result.allocations.size(); ++i) {
        EXPECT_EQ(result.allocations[i].start, result.allocations[i - 1].end)
            << "gap between allocation " << i - 1 << " and " << i;
        EXPECT_LT(result.allocations[i - 1].project_id, result.allocations[i].project_id);
    }
    EXPECT_EQ(result.allocations.back().end, work_end);
}

TEST(ComputeAllocations, LastEntryAbsorbsRoundingRemainder) {
    // 28800 * 3/7 = 12342.86 -> 12342 twice; 28800 * 1/7 = 4114.29 -> 4114.
    // Floors sum to 28798; the remainder of 2 goes to proj-c.
    std::vector<Session> sessions = {
        session("/work/alpha", 3000),
        session("/work/beta", 3000),
        session("/work/gamma", 1000),
    };
    auto result = compute_allocations(
        sessions,
        {{"/work/alpha", "proj-a"}, {"/work/beta", "proj-b"}, {"/work/gamma", "proj-c"}},
        no_other, work_start, work_end);

    std::vector<int64_t> durations;
    int64_t sum = 0;
    for (auto& a : result.allocations) {
        durations.push_back(a.duration().count());
        sum += a.duration().count();
    }
    EXPECT_EQ(durations, (std::vector<int64_t>{12342, 12342, 4116}));
    EXPECT_EQ(sum, work_day_secs);
}

TEST(ComputeAllocations, OrderDoesNotDependOnInputOrder) {
    std::vector<Session> forward = {session("/c", 700), session("/a", 1300), session("/b", 900)};
    std::vector<Session> reverse(forward.rbegin(), forward.rend());
    std::map<std::string, std::string> mapping = {{"/a", "A"}, {"/b", "B"}, {"/c", "C"}};

    auto r1 = compute_allocations(forward, mapping, no_other, work_start, work_end);
    auto r2 = compute_allocations(reverse, mapping, no_other, work_start, work_end);

    ASSERT_EQ(r1.allocations.size(), r2.allocations.size());
    for (size_t i = 0; i < r1.allocations.size(); ++i) {
        EXPECT_EQ(r1.allocations[i].project_id, r2.allocations[i].project_id);
        EXPECT_EQ(r1.allocations[i].start, r2.allocations[i].start);
        EXPECT_EQ(r1.allocations[i].end, r2.allocations[i].end);
    }
}

TEST(ComputeAllocations, DurationsAlwaysSumToWorkDay) {
    std::map<std::string, std::string> mapping = {
        {"/a", "A"}, {"/b", "B"}, {"/c", "C"}, {"/d", "D"}};
    for (int64_t k = 1; k <= 40; ++k) {
        std::vector<Session> sessions = {
            session("/a", 17 * k), session("/b", 31), session("/c", 7 * k + 3),
            session("/d", 1),
        };
        auto result = compute_allocations(sessions, mapping, no_other, work_start, work_end);
        int64_t sum = 0;
        for (auto& a : result.allocations) sum += a.duration().count();
        EXPECT_EQ(sum, work_day_secs) << "k=" << k;
        EXPECT_EQ(result.allocations.back().end, work_end);
    }
}

class WorkDayBoundariesTest : public ::testing::Test {
protected:
    std::optional<std::string> saved_tz;

    void SetUp() override {
        if (auto* tz = std::getenv("TZ")) saved_tz = tz;
        pin_tz("UTC");
    }

    void pin_tz(const char* zone) {
        ::setenv("TZ", zone, 1);
        ::tzset();
    }

    void TearDown() override {
        if (saved_tz) ::setenv("TZ", saved_tz->c_str(), 1);
        else ::unsetenv("TZ");
        ::tzset();
    }

    const Date date = year{2026} / February / day{4};
};

TEST_F(WorkDayBoundariesTest, ConvertsLocalTimes) {
    auto window = work_day_boundaries("09:00", "17:00", date);
    ASSERT_TRUE(window.has_value());
    EXPECT_EQ(window->start, work_start);
    EXPECT_EQ(window->end, work_end);
}

TEST_F(WorkDayBoundariesTest, RejectsMalformedStart) {
    auto window = work_day_boundaries("9am", "17:00", date);
    ASSERT_FALSE(window.has_value());
    EXPECT_EQ(window.error().operation, "parsing work_day_start");
}

TEST_F(WorkDayBoundariesTest, RejectsMalformedEnd) {
    auto window = work_day_boundaries("09:00", "25:00", date);
    ASSERT_FALSE(window.has_value());
    EXPECT_EQ(window.error().operation, "parsing work_day_end");
}

TEST_F(WorkDayBoundariesTest, RejectsEndBeforeStart) {
    EXPECT_FALSE(work_day_boundaries("17:00", "09:00", date).has_value());
    EXPECT_FALSE(work_day_boundaries("09:00", "09:00", date).has_value());
}

TEST_F(WorkDayBoundariesTest, FollowsDaylightSavingOffset) {
    pin_tz("America/New_York");
    auto summer = work_day_boundaries("09:00", "17:00", year{2026} / July / day{1});
    ASSERT_TRUE(summer.has_value());
    EXPECT_EQ(summer->start, utc("2026-07-01T13:00:00Z"));
    EXPECT_EQ(summer->end, utc("2026-07-01T21:00:00Z"));
}

TEST_F(WorkDayBoundariesTest, RejectsStartInSpringForwardGap) {
    pin_tz("America/New_York");
    auto window = work_day_boundaries("02:30", "17:00", year{2026} / March / day{8});
    ASSERT_FALSE(window.has_value());
    EXPECT_EQ(window.error().operation, "converting work_day_start");
    EXPECT_NE(window.error().message.find("does not exist"), std::string::npos);
}

TEST_F(WorkDayBoundariesTest, RejectsAmbiguousEnd) {
    pin_tz("America/New_York");
    auto window = work_day_boundaries("00:30", "01:30", year{2026} / November / day{1});
    ASSERT_FALSE(window.has_value());
    EXPECT_EQ(window.error().operation, "converting work_day_end");
    EXPECT_NE(window.error().message.find("ambiguous"), std::string::npos);
}
