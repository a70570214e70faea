#include <stdexcept>

#include <glog/logging.h>

#include <opencv2/core.hpp>

#include "core/math_util.hpp"
#include "imaging/attenuation.hpp"
#include "imaging/channel_order.hpp"
#include "imaging/depth_preprocess.hpp"

namespace seacolor {
namespace imaging {


void AttenuationParams::LoadParams(const YamlParser& parser)
{
  Vector6f rgb;

  YamlToTensor(parser.GetNode("DeattenuationModel/attenuation_weight"), {6, 1, 1, 1}, rgb);
  attenuation_weight = SwapRedBluePairs(rgb);

  YamlToTensor(parser.GetNode("DeattenuationModel/attenuation_coef"), {6, 1, 1}, rgb);
  attenuation_coef = SwapRedBluePairs(rgb);

  Vector1f wb_tensor;
  YamlToTensor(parser.GetNode("DeattenuationModel/wb"), {1, 1, 1}, wb_tensor);
  wb = wb_tensor(0);

  // Older artifacts don't specify an activation.
  if (parser.HasNode("DeattenuationModel/activation")) {
    activation = YamlToEnum<CoefficientActivation>(parser.GetNode("DeattenuationModel/activation"));
  }
  CHECK(activation == RECTIFIED || activation == DECAYING)
      << "Unknown coefficient activation: " << activation << std::endl;
}


void AttenuationParams::Save(const std::string& filepath) const
{
  cv::FileStorage fs(filepath, cv::FileStorage::WRITE);
  CHECK(fs.isOpened()) << "Could not open " << filepath << " for writing" << std::endl;

  Vector1f wb_tensor;
  wb_tensor << wb;

  fs << "DeattenuationModel" << "{";
  TensorToYaml(fs, "attenuation_weight", {6, 1, 1, 1}, SwapRedBluePairs(attenuation_weight));
  TensorToYaml(fs, "attenuation_coef", {6, 1, 1}, SwapRedBluePairs(attenuation_coef));
  TensorToYaml(fs, "wb", {1, 1, 1}, wb_tensor);
  fs << "activation" << static_cast<int>(activation);
  fs << "}";
}


// Coefficient field for one projection weight.
static Image1f CoefficientField(const Image1f& depth, float weight, CoefficientActivation activation)
{
  const Image1f wz = weight * depth;
  const Image1f rectified = cv::max(wz, 0.0);

  if (activation == CoefficientActivation::RECTIFIED) {
    return rectified;
  }

  Image1f decayed;
  cv::exp(-rectified, decayed);
  return decayed;
}


Image3f ComputeAttenuationCoefficients(const Image1f& depth, const AttenuationParams& params)
{
  CHECK(!depth.empty()) << "ComputeAttenuationCoefficients: empty depth" << std::endl;

  Image1f beta_D[3];
  for (int c = 0; c < 3; ++c) {
    const int i0 = 2*c;
    const int i1 = 2*c + 1;
    const Image1f c0 = CoefficientField(depth, params.attenuation_weight(i0), params.activation);
    const Image1f c1 = CoefficientField(depth, params.attenuation_weight(i1), params.activation);
    beta_D[c] = c0 * Relu(params.attenuation_coef(i0)) + c1 * Relu(params.attenuation_coef(i1));
  }

  Image3f out;
  cv::merge(beta_D, 3, out);
  return out;
}


DeattenuationResult CorrectAttenuation(const Image3f& direct,
                                       const Image1f& depth,
                                       const AttenuationParams& params)
{
  if (direct.empty() || depth.empty()) {
    throw std::invalid_argument("CorrectAttenuation: empty image or depth");
  }
  if (direct.size() != depth.size()) {
    throw std::invalid_argument("CorrectAttenuation: image and depth have different sizes");
  }

  const Image1b invalid = InvalidDepthMask(depth);
  const Image3f beta_D = ComputeAttenuationCoefficients(depth, params);

  Image1f beta_Dc[3];
  Image1f f[3];
  cv::split(beta_D, beta_Dc);

  for (int c = 0; c < 3; ++c) {
    // Floor the exponent at zero so that f >= 1 everywhere, and cap it so that f <= 3.
    Image1f exponent = beta_Dc[c].mul(depth);
    exponent = cv::max(exponent, 0.0);
    exponent = cv::min(exponent, kMaxLogTransmission);
    cv::exp(exponent, f[c]);

    // Identity transmission wherever there is no depth to invert.
    f[c].setTo(1.0f, invalid);
  }

  DeattenuationResult result;
  cv::merge(f, 3, result.transmission);

  result.restored = result.transmission.mul(direct) * params.wb;

  // Count NaNs (x != x) before patching them.
  const cv::Mat flat = result.restored.reshape(1);
  result.num_nan = cv::countNonZero(flat != flat);

  if (result.num_nan > 0) {
    LOG(WARNING) << "Replacing " << result.num_nan << " NaN values in the restored image with zero";
    cv::patchNaNs(result.restored, 0.0);
  }

  return result;
}


}
}
