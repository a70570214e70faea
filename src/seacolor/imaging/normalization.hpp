#pragma once

#include "core/cv_types.hpp"
#include "core/eigen_types.hpp"

namespace seacolor {
namespace imaging {

using namespace core;


// Clip the z-score of each channel to [-kMaxAbsZScore, kMaxAbsZScore].
static const float kMaxAbsZScore = 5.0f;

// Floor on the channel mean used to reconstruct the signal (one 8-bit intensity level).
static const float kMinChannelMean = 1.0f / 255.0f;


// Per-channel mean and sample standard deviation (N - 1 denominator) over all pixels. The
// standard deviation is NaN if the image has fewer than two pixels.
void ChannelMeanStd(const Image3f& bgr, Vector3d& mean, Vector3d& stdev);


// Rescale the (unconstrained) direct signal into [0, 1] before inverting attenuation:
//  z = (x - mu) / sigma, clipped to [-5, 5]
//  out = clip(z * sigma + max(mu, 1/255), 0, 1)
// The channel statistics are treated as constants (this is not a learned transform). A channel
// with zero or non-finite sigma reconstructs to clip(max(mu, 1/255), 0, 1).
Image3f NormalizeExposure(const Image3f& direct);


}
}
