#include <stdexcept>

#include <opencv2/imgcodecs.hpp>

#include "core/file_utils.hpp"
#include "core/image_util.hpp"
#include "imaging/depth_preprocess.hpp"
#include "imaging/io.hpp"

namespace seacolor {
namespace imaging {


Image3f LoadImage(const std::string& filepath, const cv::Size& size)
{
  const Image3b raw = cv::imread(filepath, cv::IMREAD_COLOR);
  if (raw.empty()) {
    throw std::runtime_error("Could not read image: " + filepath);
  }

  return CastImage3bTo3f(ResizeAntialiased(raw, size));
}


cv::Mat LoadDepth(const std::string& filepath)
{
  const cv::Mat raw = cv::imread(filepath, cv::IMREAD_ANYDEPTH);
  if (raw.empty()) {
    throw std::runtime_error("Could not read depth map: " + filepath);
  }
  return raw;
}


void WriteImage(const std::string& filepath, const Image3f& im)
{
  if (!cv::imwrite(filepath, CastImage3fTo3b(ClampImage(im, 0.0f, 1.0f)))) {
    throw std::runtime_error("Could not write image: " + filepath);
  }
}


void WriteEnhanceResult(const std::string& output_dir,
                        const std::string& name,
                        const EnhanceResult& result,
                        bool save_intermediates)
{
  if (save_intermediates) {
    WriteImage(Join(output_dir, name + "-direct.png"), result.direct_normalized);
    WriteImage(Join(output_dir, name + "-backscatter.png"), result.backscatter);

    double fmin, fmax;
    cv::minMaxLoc(result.transmission.reshape(1), &fmin, &fmax);
    const Image3f f_scaled = result.transmission / fmax;
    WriteImage(Join(output_dir, name + "-f.png"), f_scaled);
  }

  WriteImage(Join(output_dir, name + "-corrected.png"), result.restored);
}


}
}
