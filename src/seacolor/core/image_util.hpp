#pragma once

#include <string>

#include "core/cv_types.hpp"

namespace seacolor {
namespace core {


// 8-bit [0, 255] => float [0, 1].
Image3f CastImage3bTo3f(const Image3b& im);


// Float [0, 1] => 8-bit. Values outside of the range saturate.
Image3b CastImage3fTo3b(const Image3f& im);


// Clamp every element (all channels) to [vmin, vmax].
Image3f ClampImage(const Image3f& im, float vmin, float vmax);


// Human readable OpenCV type, e.g "16UC1" or "32FC3". Used in error messages.
std::string CvReadableType(int type);


}
}
