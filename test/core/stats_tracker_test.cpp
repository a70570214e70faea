#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "core/stats_tracker.hpp"

using namespace seacolor;
using namespace core;


TEST(StatsTrackerTest, TestSummary)
{
  StatsTracker tracker("test", 10);

  StatsSummary s;
  EXPECT_FALSE(tracker.Summary("backscatter", s));

  tracker.Add("backscatter", 2.0f);
  tracker.Add("backscatter", 4.0f);
  tracker.Add("backscatter", 9.0f);

  ASSERT_TRUE(tracker.Summary("backscatter", s));
  EXPECT_EQ(3, s.N);
  EXPECT_FLOAT_EQ(2.0f, s.min);
  EXPECT_FLOAT_EQ(9.0f, s.max);
  EXPECT_FLOAT_EQ(5.0f, s.mean);

  // Negative values should work too (max starts at the lowest float, not the smallest positive).
  tracker.Add("offset", -3.0f);
  tracker.Add("offset", -1.0f);
  ASSERT_TRUE(tracker.Summary("offset", s));
  EXPECT_FLOAT_EQ(-1.0f, s.max);

  tracker.Print("backscatter", "ms");
}


TEST(StatsTrackerTest, TestWindow)
{
  StatsTracker tracker("test", 2);
  tracker.Add("x", 100.0f);
  tracker.Add("x", 1.0f);
  tracker.Add("x", 3.0f);

  StatsSummary s;
  ASSERT_TRUE(tracker.Summary("x", s));
  EXPECT_EQ(2, s.N);
  EXPECT_FLOAT_EQ(1.0f, s.min);
  EXPECT_FLOAT_EQ(3.0f, s.max);
}


TEST(StatsTrackerTest, TestConcurrentAdds)
{
  StatsTracker tracker("test", 1000);

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&tracker]() {
      for (int i = 0; i < 100; ++i) {
        tracker.Add("x", 1.0f);
      }
    });
  }
  for (std::thread& t : threads) {
    t.join();
  }

  StatsSummary s;
  ASSERT_TRUE(tracker.Summary("x", s));
  EXPECT_EQ(400, s.N);
  EXPECT_FLOAT_EQ(1.0f, s.mean);
}
