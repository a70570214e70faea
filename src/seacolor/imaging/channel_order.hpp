#pragma once

#include "core/eigen_types.hpp"

namespace seacolor {
namespace imaging {

using namespace core;


// Parameter artifacts store per-channel values in RGB order, but images are BGR (OpenCV). Both
// permutations are their own inverse, so the same functions convert in either direction.
inline Vector3f SwapRedBlue(const Vector3f& v)
{
  return v.reverse();
}


// For per-channel pairs (R0, R1, G0, G1, B0, B1), swap the R and B pairs as units.
inline Vector6f SwapRedBluePairs(const Vector6f& v)
{
  Vector6f out;
  out << v(4), v(5), v(2), v(3), v(0), v(1);
  return out;
}


}
}
