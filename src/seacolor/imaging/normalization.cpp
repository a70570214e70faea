#include <cmath>
#include <limits>
#include <stdexcept>

#include <opencv2/core.hpp>

#include "imaging/normalization.hpp"

namespace seacolor {
namespace imaging {


void ChannelMeanStd(const Image3f& bgr, Vector3d& mean, Vector3d& stdev)
{
  cv::Scalar m, s;
  cv::meanStdDev(bgr, m, s);

  // meanStdDev() divides by N; correct it to the unbiased estimate.
  const double N = static_cast<double>(bgr.rows) * static_cast<double>(bgr.cols);
  const double bessel = (N > 1) ? std::sqrt(N / (N - 1)) : std::numeric_limits<double>::quiet_NaN();

  for (int c = 0; c < 3; ++c) {
    mean(c) = m[c];
    stdev(c) = s[c] * bessel;
  }
}


Image3f NormalizeExposure(const Image3f& direct)
{
  if (direct.empty()) {
    throw std::invalid_argument("NormalizeExposure: empty image");
  }

  Vector3d mu, sigma;
  ChannelMeanStd(direct, mu, sigma);

  Image1f channels[3];
  cv::split(direct, channels);

  for (int c = 0; c < 3; ++c) {
    const float floor_mu = std::max(static_cast<float>(mu(c)), kMinChannelMean);

    if (!std::isfinite(sigma(c)) || sigma(c) <= 0) {
      channels[c].setTo(std::min(std::max(floor_mu, 0.0f), 1.0f));
      continue;
    }

    const float mu_c = static_cast<float>(mu(c));
    const float sigma_c = static_cast<float>(sigma(c));

    Image1f z = (channels[c] - mu_c) / sigma_c;
    z = cv::max(z, -kMaxAbsZScore);
    z = cv::min(z, kMaxAbsZScore);

    Image1f out = z * sigma_c + floor_mu;
    out = cv::max(out, 0.0f);
    channels[c] = cv::min(out, 1.0f);
  }

  Image3f out;
  cv::merge(channels, 3, out);

  return out;
}


}
}
