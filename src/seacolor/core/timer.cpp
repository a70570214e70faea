#include "core/timer.hpp"

namespace seacolor {
namespace core {


Timer::Timer(bool immediate)
{
  if (immediate) {
    Start();
  }
}


void Timer::Start()
{
  started_ = true;
  t0_ = Clock::now();
}


Timedelta Timer::Elapsed() const
{
  if (!started_) {
    return Timedelta(0);
  }
  return Timedelta(std::chrono::duration<double>(Clock::now() - t0_).count());
}


Timedelta Timer::Tock()
{
  const Clock::time_point now = Clock::now();
  const Timedelta dt = started_ ? Timedelta(std::chrono::duration<double>(now - t0_).count()) : Timedelta(0);
  started_ = true;
  t0_ = now;
  return dt;
}


}
}
