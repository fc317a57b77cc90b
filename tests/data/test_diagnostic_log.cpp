#include "livemap/data/diagnostic_log.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace livemap::data;

TEST(DiagnosticLog, AddEntryIncreasesSize) {
    DiagnosticLog log(8, false);
    EXPECT_TRUE(log.empty());

    log.add(DiagnosticType::Session, "Connected");

    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log.entries().back().type, DiagnosticType::Session);
    EXPECT_EQ(log.entries().back().message, "Connected");
    EXPECT_TRUE(log.entries().back().detail.empty());
}

TEST(DiagnosticLog, CapacityIsEnforcedWithRollingBuffer) {
    DiagnosticLog log(3, false);
    log.add(DiagnosticType::Warning, "one");
    log.add(DiagnosticType::Warning, "two");
    log.add(DiagnosticType::Warning, "three");
    log.add(DiagnosticType::Error, "four", "raw line");

    ASSERT_EQ(log.size(), 3u);
    EXPECT_EQ(log.entries().front().message, "two");
    EXPECT_EQ(log.entries().back().message, "four");
    EXPECT_EQ(log.entries().back().detail, "raw line");
}

TEST(DiagnosticLog, TotalsSurviveRollover) {
    DiagnosticLog log(2, false);
    log.add(DiagnosticType::Warning, "a");
    log.add(DiagnosticType::Warning, "b");
    log.add(DiagnosticType::Warning, "c");
    log.add(DiagnosticType::Info, "d");

    EXPECT_EQ(log.total(DiagnosticType::Warning), 3u);
    EXPECT_EQ(log.total(DiagnosticType::Info), 1u);
    EXPECT_EQ(log.total(DiagnosticType::Error), 0u);

    log.clear();
    EXPECT_TRUE(log.empty());
    EXPECT_EQ(log.total(DiagnosticType::Warning), 3u);
}

TEST(DiagnosticLog, WallTimeIsMonotonic) {
    DiagnosticLog log(4, false);
    log.add(DiagnosticType::Info, "first");
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    log.add(DiagnosticType::Info, "second");

    EXPECT_LE(log.entries().front().wall_time, log.entries().back().wall_time);
}

TEST(DiagnosticLog, Prefixes) {
    EXPECT_STREQ(DiagnosticLog::prefix(DiagnosticType::Info), "INF");
    EXPECT_STREQ(DiagnosticLog::prefix(DiagnosticType::Session), "SES");
    EXPECT_STREQ(DiagnosticLog::prefix(DiagnosticType::Warning), "WRN");
    EXPECT_STREQ(DiagnosticLog::prefix(DiagnosticType::Error), "ERR");
}
