#pragma once

#include <string>

#include "core/cv_types.hpp"
#include "imaging/enhance.hpp"

namespace seacolor {
namespace imaging {

using namespace core;


// Read an 8-bit color image as BGR in [0, 1], resized to size (if nonempty).
// Throws std::runtime_error if the file can't be decoded.
Image3f LoadImage(const std::string& filepath, const cv::Size& size = cv::Size());


// Read a depth map without changing its bit depth (e.g 16U millimeters or 32F meters).
// Throws std::runtime_error if the file can't be decoded.
cv::Mat LoadDepth(const std::string& filepath);


// Write a [0, 1] image to disk as 8-bit, clamping values outside of the range.
void WriteImage(const std::string& filepath, const Image3f& im);


// Writes "<name>-corrected.png" into output_dir. If save_intermediates is set, also writes
// "<name>-direct.png", "<name>-backscatter.png" and "<name>-f.png". The transmission image is
// scaled by its max value for visualization.
void WriteEnhanceResult(const std::string& output_dir,
                        const std::string& name,
                        const EnhanceResult& result,
                        bool save_intermediates);


}
}
