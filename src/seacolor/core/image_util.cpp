#include <opencv2/core.hpp>

#include "core/image_util.hpp"

namespace seacolor {
namespace core {


Image3f CastImage3bTo3f(const Image3b& im)
{
  Image3f out;
  im.convertTo(out, CV_32F, 1.0 / 255.0);
  return out;
}


Image3b CastImage3fTo3b(const Image3f& im)
{
  Image3b out;
  im.convertTo(out, CV_8U, 255.0);
  return out;
}


Image3f ClampImage(const Image3f& im, float vmin, float vmax)
{
  Image3f out;
  cv::max(im, cv::Scalar::all(vmin), out);
  cv::min(out, cv::Scalar::all(vmax), out);
  return out;
}


std::string CvReadableType(int type)
{
  static const char* kDepthNames[] = { "8U", "8S", "16U", "16S", "32S", "32F", "64F", "16F" };

  const int depth = CV_MAT_DEPTH(type);
  const std::string name = (depth >= 0 && depth < 8) ? kDepthNames[depth] : "User";

  return name + "C" + std::to_string(CV_MAT_CN(type));
}


}
}
