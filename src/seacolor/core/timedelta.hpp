#pragma once

namespace seacolor {
namespace core {


// A duration of time, stored in seconds.
class Timedelta {
 public:
  Timedelta(double sec = 0) : sec_(sec) {}

  double seconds() const { return sec_; }
  double milliseconds() const { return sec_ * 1e3; }

  Timedelta& operator+=(const Timedelta& rhs)
  {
    sec_ += rhs.sec_;
    return *this;
  }

  friend Timedelta operator+(Timedelta lhs, const Timedelta& rhs) { return lhs += rhs; }

 private:
  double sec_;
};


}
}
