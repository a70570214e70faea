#pragma once

#include "core/cv_types.hpp"
#include "core/macros.hpp"
#include "params/params_base.hpp"

namespace seacolor {
namespace imaging {

using namespace core;


// Depth maps are converted to meters. Millimeter depth maps are stored as 16-bit integers.
static const float kMillimetersToMeters = 1.0f / 1000.0f;


// Controls how a raw depth map is cleaned up before it gets used by the optical model.
struct DepthPreprocessParams final : public ParamsBase
{
  SEACOLOR_PARAMS_STRUCT_CONSTRUCTORS(DepthPreprocessParams);

  // If set, the raw depth holds integer millimeters. Otherwise it's floating point meters.
  bool depth_16u = false;

  // If set, zero (missing) depth is replaced with the max depth seen in the frame. This treats
  // missing returns as far-away background instead of invalid pixels.
  bool mask_max_depth = false;

  // Depth below this quantile or above (1 - quantile) is treated as an outlier.
  float outlier_quantile = 1e-4;

  // Size of the square structuring element used to close small holes.
  int closing_kernel_size = 3;

 private:
  void LoadParams(const YamlParser& parser) override;
};


// Mask (255) of pixels without a valid depth return, i.e z <= 0 or NaN.
Image1b InvalidDepthMask(const Image1f& depth);


// Resize an image to size, using area interpolation when shrinking (anti-aliased) and bilinear
// otherwise. Returns the input unchanged if it already has the right size, or if size is empty.
cv::Mat ResizeAntialiased(const cv::Mat& im, const cv::Size& size);


// Zero out (invalidate) depths outside of the [q, 1 - q] quantile band. NaNs are ignored when
// computing the quantiles.
void ClipDepthOutliers(Image1f& depth, float q);


// Fill small invalid holes with a grayscale morphological closing (dilate, then erode).
Image1f CloseDepthHoles(const Image1f& depth, int kernel_size);


// Full cleanup of a decoded depth map: resize => convert to meters => (optionally) replace zeros
// with max depth => clip outliers => close holes. The raw depth may be 16U or 32F.
Image1f PreprocessDepth(const cv::Mat& raw,
                        const cv::Size& target_size,
                        const DepthPreprocessParams& params);


}
}
