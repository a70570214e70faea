#include <stdexcept>
#include <string>

#include "core/timer.hpp"
#include "imaging/enhance.hpp"
#include "imaging/normalization.hpp"

namespace seacolor {
namespace imaging {


static std::string SizeString(const cv::Size& size)
{
  return std::to_string(size.width) + "x" + std::to_string(size.height);
}


EnhanceResult EnhanceUnderwater(const Image3f& bgr,
                                const Image1f& depth,
                                const BackscatterParams& backscatter_params,
                                const AttenuationParams& attenuation_params)
{
  if (bgr.empty()) {
    throw std::invalid_argument("EnhanceUnderwater: empty image");
  }
  if (depth.empty()) {
    throw std::invalid_argument("EnhanceUnderwater: empty depth");
  }
  if (bgr.size() != depth.size()) {
    throw std::invalid_argument("EnhanceUnderwater: image is " + SizeString(bgr.size()) +
                                " but depth is " + SizeString(depth.size()));
  }

  EnhanceResult result;
  Timer timer(true);

  RemoveBackscatter(bgr, depth, backscatter_params, result.direct, result.backscatter);
  result.timings.backscatter = timer.Tock();

  result.direct_normalized = NormalizeExposure(result.direct);
  result.timings.normalization = timer.Tock();

  DeattenuationResult deattenuated = CorrectAttenuation(result.direct_normalized, depth, attenuation_params);
  result.transmission = deattenuated.transmission;
  result.restored = deattenuated.restored;
  result.num_nan = deattenuated.num_nan;
  result.timings.attenuation = timer.Tock();

  return result;
}


}
}
