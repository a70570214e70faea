#pragma once

#include "core/cv_types.hpp"
#include "core/timedelta.hpp"
#include "imaging/attenuation.hpp"
#include "imaging/backscatter.hpp"

namespace seacolor {
namespace imaging {

using namespace core;


// Wall time spent in each stage of EnhanceUnderwater(). Diagnostic only.
struct EnhanceTimings final
{
  Timedelta backscatter;
  Timedelta normalization;
  Timedelta attenuation;

  Timedelta Total() const { return backscatter + normalization + attenuation; }
};


struct EnhanceResult final
{
  // Image with backscatter removed (unconstrained, can be negative).
  Image3f direct;

  // Direct signal after exposure normalization, in [0, 1].
  Image3f direct_normalized;

  // Estimated veiling light, zero where depth is invalid.
  Image3f backscatter;

  // Correction factor applied to undo attenuation, in [1, 3].
  Image3f transmission;

  // Color restored image (not clamped).
  Image3f restored;

  // Number of NaNs that were zeroed in the restored image.
  int num_nan = 0;

  EnhanceTimings timings;
};


// Restore the color of an underwater image (BGR, [0, 1]) given a depth map in meters:
//  (1) remove backscatter
//  (2) normalize the exposure of the direct signal
//  (3) invert attenuation
// Throws std::invalid_argument if the image or depth is malformed.
EnhanceResult EnhanceUnderwater(const Image3f& bgr,
                                const Image1f& depth,
                                const BackscatterParams& backscatter_params,
                                const AttenuationParams& attenuation_params);


}
}
