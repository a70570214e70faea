#pragma once

#include <chrono>

#include "core/timedelta.hpp"

namespace seacolor {
namespace core {


// Wall-clock stopwatch for profiling the stages of a frame.
class Timer {
 public:
  // Starts right away unless 'immediate' is false.
  explicit Timer(bool immediate = true);

  // (Re)start timing from now.
  void Start();

  // Time since Start(). Zero if the timer was never started.
  Timedelta Elapsed() const;

  // Elapsed time since the last Tock() (or Start()), then restart. Handy for timing a sequence of
  // stages with one timer.
  Timedelta Tock();

 private:
  using Clock = std::chrono::steady_clock;

  bool started_ = false;
  Clock::time_point t0_;
};


}
}
