#include <stdexcept>

#include <glog/logging.h>

#include <opencv2/core.hpp>

#include "imaging/backscatter.hpp"
#include "imaging/channel_order.hpp"
#include "imaging/depth_preprocess.hpp"

namespace seacolor {
namespace imaging {


void BackscatterParams::LoadParams(const YamlParser& parser)
{
  Vector3f rgb;

  YamlToTensor(parser.GetNode("BackscatterModel/B_inf"), {3, 1, 1}, rgb);
  B_inf = SwapRedBlue(rgb);

  YamlToTensor(parser.GetNode("BackscatterModel/J_prime"), {3, 1, 1}, rgb);
  J_prime = SwapRedBlue(rgb);

  YamlToTensor(parser.GetNode("BackscatterModel/backscatter_weight"), {3, 1, 1, 1}, rgb);
  backscatter_weight = SwapRedBlue(rgb);

  YamlToTensor(parser.GetNode("BackscatterModel/residual_weight"), {3, 1, 1, 1}, rgb);
  residual_weight = SwapRedBlue(rgb);
}


void BackscatterParams::Save(const std::string& filepath) const
{
  cv::FileStorage fs(filepath, cv::FileStorage::WRITE);
  CHECK(fs.isOpened()) << "Could not open " << filepath << " for writing" << std::endl;

  fs << "BackscatterModel" << "{";
  TensorToYaml(fs, "B_inf", {3, 1, 1}, SwapRedBlue(B_inf));
  TensorToYaml(fs, "J_prime", {3, 1, 1}, SwapRedBlue(J_prime));
  TensorToYaml(fs, "backscatter_weight", {3, 1, 1, 1}, SwapRedBlue(backscatter_weight));
  TensorToYaml(fs, "residual_weight", {3, 1, 1, 1}, SwapRedBlue(residual_weight));
  fs << "}";
}


Image3f EstimateBackscatter(const Image1f& depth, const BackscatterParams& params)
{
  CHECK(!depth.empty()) << "EstimateBackscatter: empty depth" << std::endl;

  const Image1b invalid = InvalidDepthMask(depth);

  Image1f Bc[3];
  for (int c = 0; c < 3; ++c) {
    // Coefficient fields are pointwise (1x1) projections of depth, rectified.
    const Image1f wz_b = params.backscatter_weight(c) * depth;
    const Image1f wz_r = params.residual_weight(c) * depth;
    const Image1f beta_b = cv::max(wz_b, 0.0);
    const Image1f beta_r = cv::max(wz_r, 0.0);

    Image1f exp_b, exp_r;
    cv::exp(-beta_b, exp_b);
    cv::exp(-beta_r, exp_r);

    const Image1f veiling = params.B_inf(c) * (1.0f - exp_b) + params.J_prime(c) * exp_r;

    // Squash into (0, 1) with a sigmoid.
    Image1f exp_neg;
    cv::exp(-veiling, exp_neg);
    cv::divide(1.0, 1.0f + exp_neg, Bc[c]);

    // No measured distance means there's nothing to model.
    Bc[c].setTo(0.0f, invalid);
  }

  Image3f backscatter;
  cv::merge(Bc, 3, backscatter);

  return backscatter;
}


void RemoveBackscatter(const Image3f& bgr,
                       const Image1f& depth,
                       const BackscatterParams& params,
                       Image3f& direct,
                       Image3f& backscatter)
{
  if (bgr.empty() || depth.empty()) {
    throw std::invalid_argument("RemoveBackscatter: empty image or depth");
  }
  if (bgr.size() != depth.size()) {
    throw std::invalid_argument("RemoveBackscatter: image and depth have different sizes");
  }

  backscatter = EstimateBackscatter(depth, params);
  direct = bgr - backscatter;
}


}
}
