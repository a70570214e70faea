#include <cmath>
#include <limits>
#include <stdexcept>

#include "gtest/gtest.h"

#include "imaging/backscatter.hpp"
#include "test_params.hpp"

using namespace seacolor;
using namespace core;
using namespace imaging;


static float ExpectedBackscatter(float z, float B_inf, float J_prime, float w_b, float w_r)
{
  const float veiling = B_inf * (1.0f - std::exp(-std::max(w_b * z, 0.0f))) +
                        J_prime * std::exp(-std::max(w_r * z, 0.0f));
  return 1.0f / (1.0f + std::exp(-veiling));
}


TEST(BackscatterTest, TestKnownValue)
{
  const BackscatterParams params = MakeBackscatterParams();
  const Image1f depth(4, 5, 2.0f);

  const Image3f backscatter = EstimateBackscatter(depth, params);
  ASSERT_EQ(depth.size(), backscatter.size());

  for (int c = 0; c < 3; ++c) {
    const float expected = ExpectedBackscatter(
        2.0f, params.B_inf(c), params.J_prime(c), params.backscatter_weight(c), params.residual_weight(c));
    EXPECT_NEAR(expected, backscatter(0, 0)[c], 1e-5);
    EXPECT_NEAR(expected, backscatter(3, 4)[c], 1e-5);
  }
}


TEST(BackscatterTest, TestInvalidDepthIsMasked)
{
  const BackscatterParams params = MakeBackscatterParams();

  Image1f depth(3, 3, 1.5f);
  depth(0, 0) = 0.0f;
  depth(1, 1) = -2.0f;
  depth(2, 2) = std::numeric_limits<float>::quiet_NaN();

  const Image3f bgr(3, 3, cv::Vec3f(0.3f, 0.5f, 0.7f));

  Image3f direct, backscatter;
  RemoveBackscatter(bgr, depth, params, direct, backscatter);

  for (int i = 0; i < 3; ++i) {
    for (int c = 0; c < 3; ++c) {
      EXPECT_EQ(0.0f, backscatter(i, i)[c]);
      EXPECT_EQ(bgr(i, i)[c], direct(i, i)[c]);
    }
  }

  // Valid pixels should still have some veiling light removed.
  EXPECT_GT(backscatter(0, 1)[0], 0.0f);
  EXPECT_LT(direct(0, 1)[0], bgr(0, 1)[0]);
}


TEST(BackscatterTest, TestOpenUnitInterval)
{
  const BackscatterParams params = MakeBackscatterParams();

  Image1f depth(16, 16);
  cv::randu(depth, 0.01f, 30.0f);

  const Image3f backscatter = EstimateBackscatter(depth, params);
  for (int i = 0; i < backscatter.rows; ++i) {
    for (int j = 0; j < backscatter.cols; ++j) {
      for (int c = 0; c < 3; ++c) {
        EXPECT_GT(backscatter(i, j)[c], 0.0f);
        EXPECT_LT(backscatter(i, j)[c], 1.0f);
      }
    }
  }
}


TEST(BackscatterTest, TestNegativeWeightsAreRectified)
{
  BackscatterParams params = MakeBackscatterParams();
  params.backscatter_weight << -1.0f, -1.0f, -1.0f;
  params.residual_weight << -1.0f, -1.0f, -1.0f;

  const Image1f depth(2, 2, 5.0f);
  const Image3f backscatter = EstimateBackscatter(depth, params);

  // Both coefficient fields are zero, so only the residual term survives.
  for (int c = 0; c < 3; ++c) {
    const float expected = 1.0f / (1.0f + std::exp(-params.J_prime(c)));
    EXPECT_NEAR(expected, backscatter(1, 1)[c], 1e-6);
  }
}


TEST(BackscatterTest, TestConstantDepthIsUniform)
{
  const BackscatterParams params = MakeBackscatterParams();
  const Image1f depth(10, 12, 3.7f);
  const Image3f backscatter = EstimateBackscatter(depth, params);

  const cv::Vec3f first = backscatter(0, 0);
  for (int i = 0; i < backscatter.rows; ++i) {
    for (int j = 0; j < backscatter.cols; ++j) {
      EXPECT_EQ(first, backscatter(i, j));
    }
  }
}


TEST(BackscatterTest, TestBadInput)
{
  const BackscatterParams params = MakeBackscatterParams();
  Image3f direct, backscatter;

  EXPECT_THROW(RemoveBackscatter(Image3f(), Image1f(2, 2, 1.0f), params, direct, backscatter),
               std::invalid_argument);
  EXPECT_THROW(RemoveBackscatter(Image3f(2, 2, cv::Vec3f(0, 0, 0)), Image1f(3, 2, 1.0f), params, direct, backscatter),
               std::invalid_argument);
}
