#pragma once

#include <algorithm>
#include <cmath>
#include <vector>

#include <glog/logging.h>

namespace seacolor {
namespace core {


inline float Relu(float x)
{
  return std::max(x, 0.0f);
}


// Returns the q-th quantile (q in [0, 1]) of the finite values in v, linearly interpolating
// between the two closest ranks. NaNs are ignored. The vector is reordered in-place.
inline float QuantileInPlace(std::vector<float>& v, float q)
{
  CHECK(q >= 0.0f && q <= 1.0f) << "Quantile must be in [0, 1], got " << q << std::endl;

  v.erase(std::remove_if(v.begin(), v.end(), [](float x) { return std::isnan(x); }), v.end());
  CHECK(!v.empty()) << "Can't compute a quantile of an empty (or all-NaN) set" << std::endl;

  const double rank = static_cast<double>(q) * static_cast<double>(v.size() - 1);
  const size_t lo = static_cast<size_t>(std::floor(rank));
  const size_t hi = std::min(lo + 1, v.size() - 1);

  std::nth_element(v.begin(), v.begin() + lo, v.end());
  const float v_lo = v.at(lo);

  // Everything after lo is >= v_lo, so the next rank is the smallest of those.
  const float v_hi = (hi == lo) ? v_lo : *std::min_element(v.begin() + lo + 1, v.end());

  const double t = rank - static_cast<double>(lo);
  return static_cast<float>(v_lo + t * (v_hi - v_lo));
}


}
}
