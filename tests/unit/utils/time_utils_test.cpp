#include <gtest/gtest.h>

#include "ragline_core/utils/time_utils.hpp"

namespace ragline_core {

using std::chrono::milliseconds;
using std::chrono::seconds;
using std::chrono::system_clock;

TEST(TimeUtilsTest, ToString_EpochIsUtc) {
  EXPECT_EQ(time_point_to_string(system_clock::time_point{}), "1970-01-01 00:00:00.000");
}

TEST(TimeUtilsTest, ToString_KeepsMilliseconds) {
  // 2024-03-01 12:34:56 UTC
  system_clock::time_point tp{seconds(1709296496) + milliseconds(45)};

  EXPECT_EQ(time_point_to_string(tp), "2024-03-01 12:34:56.045");
}

TEST(TimeUtilsTest, ToString_PreEpochThrows) {
  system_clock::time_point tp{-milliseconds(500)};

  EXPECT_THROW(time_point_to_string(tp), std::invalid_argument);
}

TEST(TimeUtilsTest, FromString_RoundTripsAtMillisecondPrecision) {
  system_clock::time_point tp{seconds(1709296496) + milliseconds(987)};

  EXPECT_EQ(string_to_time_point(time_point_to_string(tp)), tp);
}

TEST(TimeUtilsTest, FromString_WithoutMilliseconds) {
  EXPECT_EQ(string_to_time_point("2024-03-01 12:34:56"),
            system_clock::time_point{seconds(1709296496)});
}

TEST(TimeUtilsTest, FromString_GarbageThrows) {
  EXPECT_THROW(string_to_time_point("yesterday"), std::invalid_argument);
  EXPECT_THROW(string_to_time_point(""), std::invalid_argument);
}

TEST(TimeUtilsTest, ToString_SortsChronologically) {
  system_clock::time_point earlier{seconds(1709296496) + milliseconds(999)};
  system_clock::time_point later{seconds(1709296497)};

  EXPECT_LT(time_point_to_string(earlier), time_point_to_string(later));
}

}  // namespace ragline_core
