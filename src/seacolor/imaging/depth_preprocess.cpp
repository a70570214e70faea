#include <cmath>
#include <stdexcept>
#include <vector>

#include <glog/logging.h>

#include <opencv2/imgproc.hpp>

#include "core/image_util.hpp"
#include "core/math_util.hpp"
#include "imaging/depth_preprocess.hpp"

namespace seacolor {
namespace imaging {


void DepthPreprocessParams::LoadParams(const YamlParser& parser)
{
  parser.GetParam("depth_16u", &depth_16u);
  parser.GetParam("mask_max_depth", &mask_max_depth);
  parser.GetParam("outlier_quantile", &outlier_quantile);
  parser.GetParam("closing_kernel_size", &closing_kernel_size);

  CHECK(outlier_quantile >= 0.0f && outlier_quantile < 0.5f)
      << "outlier_quantile must be in [0, 0.5)" << std::endl;
  CHECK_GE(closing_kernel_size, 1);
}


Image1b InvalidDepthMask(const Image1f& depth)
{
  // NaN > 0 is false, so NaNs end up in the invalid mask too.
  Image1b invalid;
  cv::bitwise_not(depth > 0.0f, invalid);
  return invalid;
}


cv::Mat ResizeAntialiased(const cv::Mat& im, const cv::Size& size)
{
  if (size.area() == 0 || im.size() == size) {
    return im;
  }

  const bool shrinking = (size.width < im.cols) || (size.height < im.rows);

  cv::Mat out;
  cv::resize(im, out, size, 0, 0, shrinking ? cv::INTER_AREA : cv::INTER_LINEAR);
  return out;
}


void ClipDepthOutliers(Image1f& depth, float q)
{
  std::vector<float> values;
  values.reserve(depth.total());
  for (const float z : depth) {
    if (!std::isnan(z)) { values.emplace_back(z); }
  }

  // Nothing to clip in an all-NaN map.
  if (values.empty()) {
    return;
  }

  const float low = QuantileInPlace(values, q);
  const float high = QuantileInPlace(values, 1.0f - q);

  depth.setTo(0.0f, (depth < low) | (depth > high));
}


Image1f CloseDepthHoles(const Image1f& depth, int kernel_size)
{
  const cv::Mat kernel = cv::getStructuringElement(
      cv::MORPH_RECT, cv::Size(kernel_size, kernel_size));

  // NOTE: The default border value makes pixels outside of the image ignored by both the
  // dilation and the erosion.
  Image1f out;
  cv::morphologyEx(depth, out, cv::MORPH_CLOSE, kernel);
  return out;
}


Image1f PreprocessDepth(const cv::Mat& raw,
                        const cv::Size& target_size,
                        const DepthPreprocessParams& params)
{
  if (raw.empty()) {
    throw std::invalid_argument("PreprocessDepth: empty depth map");
  }
  if (raw.channels() != 1) {
    throw std::invalid_argument("PreprocessDepth: expected a single channel depth map, got " +
                                CvReadableType(raw.type()));
  }

  const cv::Mat resized = ResizeAntialiased(raw, target_size);

  Image1f depth;
  resized.convertTo(depth, CV_32F, params.depth_16u ? kMillimetersToMeters : 1.0);

  if (params.mask_max_depth) {
    double vmin, vmax;
    cv::minMaxLoc(depth, &vmin, &vmax);
    depth.setTo(static_cast<float>(vmax), depth == 0.0f);
  }

  ClipDepthOutliers(depth, params.outlier_quantile);

  return CloseDepthHoles(depth, params.closing_kernel_size);
}


}
}
