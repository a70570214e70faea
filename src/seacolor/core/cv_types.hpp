#pragma once

#include <string>
#include <opencv2/core.hpp>

namespace seacolor {
namespace core {

typedef cv::Mat1b Image1b;
typedef cv::Mat3b Image3b;

// 16-bit unsigned images (e.g millimeter depth maps).
typedef cv::Mat1w Image1w;

// 32-bit floating point images
typedef cv::Mat1f Image1f;
typedef cv::Mat3f Image3f;

}
}
