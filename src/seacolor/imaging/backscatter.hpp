#pragma once

#include <string>

#include "core/cv_types.hpp"
#include "core/eigen_types.hpp"
#include "core/macros.hpp"
#include "params/params_base.hpp"

namespace seacolor {
namespace imaging {

using namespace core;


// Calibrated constants of the veiling light model. All vectors are stored in BGR order to match
// the images; the artifact on disk is RGB and gets permuted in LoadParams() and Save().
struct BackscatterParams final : public ParamsBase
{
  SEACOLOR_PARAMS_STRUCT_CONSTRUCTORS(BackscatterParams);

  // Asymptotic veiling radiance.
  Vector3f B_inf = Vector3f::Zero();

  // Residual (airlight) term.
  Vector3f J_prime = Vector3f::Zero();

  // Depth => coefficient projections (one weight per channel, no bias).
  Vector3f backscatter_weight = Vector3f::Zero();
  Vector3f residual_weight = Vector3f::Zero();

  // Writes the params under a "BackscatterModel" node in the artifact format.
  void Save(const std::string& filepath) const;

 private:
  void LoadParams(const YamlParser& parser) override;
};


// Estimate the per-pixel veiling light from depth alone:
//  Bc = B_inf * (1 - exp(-relu(w_b * z))) + J_prime * exp(-relu(w_r * z))
//  backscatter = sigmoid(Bc)
// Pixels with invalid depth (z <= 0 or NaN) get exactly zero backscatter.
Image3f EstimateBackscatter(const Image1f& depth, const BackscatterParams& params);


// Subtract the estimated backscatter from an image. The direct signal is NOT clamped, and can be
// negative where the model over-estimates the veiling light.
void RemoveBackscatter(const Image3f& bgr,
                       const Image1f& depth,
                       const BackscatterParams& params,
                       Image3f& direct,
                       Image3f& backscatter);


}
}
