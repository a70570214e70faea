#include <chrono>
#include <thread>

#include <gtest/gtest.h>

#include "core/timer.hpp"

using namespace seacolor;
using namespace core;


TEST(TimerTest, TestNotStarted)
{
  Timer timer(false);
  EXPECT_EQ(0.0, timer.Elapsed().seconds());

  timer.Start();
  EXPECT_GE(timer.Elapsed().seconds(), 0.0);
}


TEST(TimerTest, TestTock)
{
  Timer timer(true);
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  const Timedelta first = timer.Tock();
  const Timedelta second = timer.Tock();

  EXPECT_GE(first.milliseconds(), 20.0);

  // Tock() restarts the timer.
  EXPECT_LT(second.milliseconds(), first.milliseconds());

  Timedelta total;
  total += first;
  EXPECT_DOUBLE_EQ(first.seconds() + second.seconds(), (total + second).seconds());
}
