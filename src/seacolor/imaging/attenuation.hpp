#pragma once

#include <cmath>
#include <string>

#include "core/cv_types.hpp"
#include "core/eigen_types.hpp"
#include "core/macros.hpp"
#include "params/params_base.hpp"

namespace seacolor {
namespace imaging {

using namespace core;


// The correction factor exp(beta_D * z) is capped at 3x.
static const float kMaxLogTransmission = std::log(3.0f);


// How the depth projection is turned into attenuation coefficient fields.
enum CoefficientActivation
{
  RECTIFIED = 0,    // c = relu(w * z)
  DECAYING = 1      // c = exp(-relu(w * z))
};


// Calibrated constants of the direct attenuation model. Each output channel consumes a PAIR of
// projection weights and coefficients. Pairs are stored in BGR order (B0, B1, G0, G1, R0, R1); the
// artifact on disk is RGB and gets permuted in LoadParams() and Save().
struct AttenuationParams final : public ParamsBase
{
  SEACOLOR_PARAMS_STRUCT_CONSTRUCTORS(AttenuationParams);

  // Depth => coefficient projection (no bias).
  Vector6f attenuation_weight = Vector6f::Zero();

  // Combines each pair of coefficient fields. Rectified before use.
  Vector6f attenuation_coef = Vector6f::Zero();

  // Global white balance gain.
  float wb = 1.0f;

  CoefficientActivation activation = CoefficientActivation::RECTIFIED;

  // Writes the params under a "DeattenuationModel" node in the artifact format.
  void Save(const std::string& filepath) const;

 private:
  void LoadParams(const YamlParser& parser) override;
};


struct DeattenuationResult final
{
  // Per-pixel correction factor in [1, 3], exactly 1 wherever depth is invalid.
  Image3f transmission;

  // Restored image J = transmission * direct * wb. Not clamped.
  Image3f restored;

  // Number of NaN entries in the restored image that were replaced with zero.
  int num_nan = 0;
};


// Compute the attenuation coefficient beta_D for each (BGR) channel at every pixel.
Image3f ComputeAttenuationCoefficients(const Image1f& depth, const AttenuationParams& params);


// Invert the wavelength-dependent attenuation of a normalized direct signal using depth.
DeattenuationResult CorrectAttenuation(const Image3f& direct,
                                       const Image1f& depth,
                                       const AttenuationParams& params);


}
}
