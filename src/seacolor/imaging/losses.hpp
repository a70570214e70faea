#pragma once

#include "core/cv_types.hpp"

namespace seacolor {
namespace imaging {

using namespace core;


// Default weight on negative residuals (over-subtracted backscatter) relative to positive ones.
static const float kDefaultBackscatterCostRatio = 1000.0f;

// Transition point between the quadratic and linear regions of the smooth L1 loss.
static const float kSmoothL1Beta = 0.2f;

// Target mean intensity of each restored channel.
static const float kTargetIntensity = 0.5f;


// Mean over all elements of smooth_l1(x, 0) = 0.5 x^2 / beta if |x| < beta else |x| - 0.5 beta.
float SmoothL1(const Image3f& x, float beta);


// Calibration objective for the backscatter model, evaluated on the direct signal:
//  cost_ratio * smooth_l1(relu(-direct)) + l1(relu(direct))
// Negative residuals mean the veiling light was over-estimated, and are penalized much more
// heavily. The loss is zero iff the direct signal is zero everywhere.
float BackscatterLoss(const Image3f& direct, float cost_ratio = kDefaultBackscatterCostRatio);


struct DeattenuationLossTerms final
{
  // Penalizes values of the restored image outside of [0, 1].
  float saturation = 0;

  // Pulls the mean of each restored channel towards mid-gray.
  float intensity = 0;

  // Keeps the per-channel contrast of the restored image close to that of the direct signal.
  float spatial_variation = 0;

  float total = 0;

  // False if any term came out NaN or infinite (e.g a single pixel image has no sample std).
  bool finite = true;
};


// Unsupervised calibration objective for the attenuation model. The direct signal should be the
// one BEFORE exposure normalization.
DeattenuationLossTerms DeattenuationLoss(const Image3f& direct, const Image3f& restored);


}
}
