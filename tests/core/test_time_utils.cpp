#include <gtest/gtest.h>
#include <chrono>
#include <cstring>
#include "paper_ngin/core/time_utils.hpp"

using namespace paper_ngin;
using namespace paper_ngin::core;

class TimeUtilsTest : public ::testing::Test {
protected:
    // 2025-01-01T12:00:00Z
    const Timestamp noon_new_year = std::chrono::system_clock::from_time_t(1735732800);
};

TEST_F(TimeUtilsTest, SafeGmtimeFillsFields) {
    std::time_t epoch = 0;
    std::tm result;
    std::memset(&result, 0, sizeof(result));

    ASSERT_NE(safe_gmtime(&epoch, &result), nullptr);
    EXPECT_EQ(result.tm_year, 70);
    EXPECT_EQ(result.tm_mon, 0);
    EXPECT_EQ(result.tm_mday, 1);
    EXPECT_EQ(result.tm_hour, 0);
}

TEST_F(TimeUtilsTest, TimegmInvertsGmtime) {
    std::time_t original = 1735732800;
    std::tm parts;
    ASSERT_NE(safe_gmtime(&original, &parts), nullptr);
    EXPECT_EQ(safe_timegm(&parts), original);
}

TEST_F(TimeUtilsTest, FormatsIso8601InUtc) {
    EXPECT_EQ(to_iso8601(noon_new_year), "2025-01-01T12:00:00Z");
    EXPECT_EQ(to_iso8601(noon_new_year + std::chrono::milliseconds(999)),
              "2025-01-01T12:00:00Z");
}

TEST_F(TimeUtilsTest, ParsesIso8601Variants) {
    auto plain = from_iso8601("2025-01-01T12:00:00");
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(*plain, noon_new_year);

    auto zulu = from_iso8601("2025-01-01T12:00:00Z");
    ASSERT_TRUE(zulu.has_value());
    EXPECT_EQ(*zulu, noon_new_year);

    auto offset = from_iso8601("2025-01-01T12:00:00+00:00");
    ASSERT_TRUE(offset.has_value());
    EXPECT_EQ(*offset, noon_new_year);
}

TEST_F(TimeUtilsTest, RejectsMalformedTimestamps) {
    EXPECT_FALSE(from_iso8601("").has_value());
    EXPECT_FALSE(from_iso8601("yesterday").has_value());
    EXPECT_FALSE(from_iso8601("2025-01-01").has_value());
}

TEST_F(TimeUtilsTest, FormattedTimeUsesPattern) {
    std::string year = get_formatted_time("%Y", false);
    ASSERT_EQ(year.size(), 4u);
    EXPECT_GE(std::stoi(year), 2025);
}
