#include <cmath>
#include <stdexcept>

#include <glog/logging.h>

#include <opencv2/core.hpp>

#include "core/eigen_types.hpp"
#include "imaging/losses.hpp"
#include "imaging/normalization.hpp"

namespace seacolor {
namespace imaging {


// Mean over every element (pixels and channels) of an image.
static float MeanOfElements(const Image3f& im)
{
  const cv::Scalar s = cv::sum(im);
  const double numel = static_cast<double>(im.total()) * static_cast<double>(im.channels());
  return static_cast<float>((s[0] + s[1] + s[2]) / numel);
}


float SmoothL1(const Image3f& x, float beta)
{
  CHECK_GT(beta, 0.0f);

  // With m = min(|x|, beta) this is 0.5 m^2 / beta + (|x| - m), which matches both branches.
  const Image3f ax = cv::abs(x);
  const Image3f m = cv::min(ax, beta);
  const Image3f elementwise = m.mul(m) * (0.5f / beta) + (ax - m);

  return MeanOfElements(elementwise);
}


float BackscatterLoss(const Image3f& direct, float cost_ratio)
{
  if (direct.empty()) {
    throw std::invalid_argument("BackscatterLoss: empty image");
  }

  const Image3f neg_direct = -direct;
  const Image3f pos = cv::max(direct, 0.0);
  const Image3f neg = cv::max(neg_direct, 0.0);

  return cost_ratio * SmoothL1(neg, kSmoothL1Beta) + MeanOfElements(pos);
}


DeattenuationLossTerms DeattenuationLoss(const Image3f& direct, const Image3f& restored)
{
  if (direct.empty() || restored.empty()) {
    throw std::invalid_argument("DeattenuationLoss: empty image");
  }
  if (direct.size() != restored.size()) {
    throw std::invalid_argument("DeattenuationLoss: direct and restored have different sizes");
  }

  DeattenuationLossTerms terms;

  const Image3f neg_restored = -restored;
  const Image3f over = restored - cv::Scalar::all(1.0);
  const Image3f excursion = cv::max(neg_restored, 0.0) + cv::max(over, 0.0);
  terms.saturation = MeanOfElements(excursion.mul(excursion));

  Vector3d mean_J, std_J, mean_direct, std_direct;
  ChannelMeanStd(restored, mean_J, std_J);
  ChannelMeanStd(direct, mean_direct, std_direct);

  terms.intensity = static_cast<float>(
      (mean_J.array() - kTargetIntensity).square().mean());
  terms.spatial_variation = static_cast<float>(
      (std_J - std_direct).array().square().mean());

  terms.total = terms.saturation + terms.intensity + terms.spatial_variation;

  LOG_IF(WARNING, !std::isfinite(terms.saturation)) << "NaN saturation loss!";
  LOG_IF(WARNING, !std::isfinite(terms.intensity)) << "NaN intensity loss!";
  LOG_IF(WARNING, !std::isfinite(terms.spatial_variation)) << "NaN spatial variation loss!";

  terms.finite = std::isfinite(terms.total);

  return terms;
}


}
}
