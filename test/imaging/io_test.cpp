#include <stdexcept>

#include <boost/filesystem.hpp>
#include <opencv2/imgcodecs.hpp>

#include "gtest/gtest.h"

#include "core/file_utils.hpp"
#include "imaging/io.hpp"

using namespace seacolor;
using namespace core;
using namespace imaging;

namespace fs = boost::filesystem;


class IoTest : public ::testing::Test {
 protected:
  void SetUp() override
  {
    folder_ = (fs::temp_directory_path() / fs::unique_path()).string();
    mkdir(folder_);
  }

  void TearDown() override { rmdir(folder_); }

  std::string folder_;
};


TEST_F(IoTest, TestWriteLoadImage)
{
  Image3f im(6, 8);
  cv::randu(im, 0.0f, 1.0f);
  im(0, 0) = cv::Vec3f(-0.5f, 1.5f, 0.5f);

  const std::string path = Join(folder_, "im.png");
  WriteImage(path, im);

  const Image3f loaded = LoadImage(path);
  ASSERT_EQ(im.size(), loaded.size());

  // Out of range values are clamped, everything else is quantized to 8 bits.
  EXPECT_EQ(0.0f, loaded(0, 0)[0]);
  EXPECT_NEAR(1.0f, loaded(0, 0)[1], 1e-6);
  EXPECT_NEAR(im(3, 5)[2], loaded(3, 5)[2], 1.0 / 255.0);

  EXPECT_EQ(cv::Size(4, 3), LoadImage(path, cv::Size(4, 3)).size());
}


TEST_F(IoTest, TestLoadDepthKeepsBitDepth)
{
  const Image1w raw(5, 5, static_cast<uint16_t>(2345));
  const std::string path = Join(folder_, "depth.png");
  ASSERT_TRUE(cv::imwrite(path, raw));

  const cv::Mat depth = LoadDepth(path);
  EXPECT_EQ(CV_16UC1, depth.type());
  EXPECT_EQ(2345, depth.at<uint16_t>(4, 4));
}


TEST_F(IoTest, TestMissingFiles)
{
  EXPECT_THROW(LoadImage(Join(folder_, "nope.png")), std::runtime_error);
  EXPECT_THROW(LoadDepth(Join(folder_, "nope.png")), std::runtime_error);
  EXPECT_ANY_THROW(WriteImage(Join(Join(folder_, "no_such_folder"), "im.png"), Image3f(2, 2, cv::Vec3f(0, 0, 0))));
}


TEST_F(IoTest, TestWriteEnhanceResult)
{
  EnhanceResult result;
  result.direct = Image3f(4, 4, cv::Vec3f(-0.1f, 0.2f, 0.3f));
  result.direct_normalized = Image3f(4, 4, cv::Vec3f(0.1f, 0.2f, 0.3f));
  result.backscatter = Image3f(4, 4, cv::Vec3f(0.5f, 0.5f, 0.5f));
  result.transmission = Image3f(4, 4, cv::Vec3f(1.0f, 1.5f, 2.0f));
  result.restored = Image3f(4, 4, cv::Vec3f(0.2f, 0.4f, 0.6f));

  WriteEnhanceResult(folder_, "frame", result, false);
  EXPECT_TRUE(Exists(Join(folder_, "frame-corrected.png")));
  EXPECT_FALSE(Exists(Join(folder_, "frame-direct.png")));

  WriteEnhanceResult(folder_, "frame", result, true);
  EXPECT_TRUE(Exists(Join(folder_, "frame-direct.png")));
  EXPECT_TRUE(Exists(Join(folder_, "frame-backscatter.png")));
  EXPECT_TRUE(Exists(Join(folder_, "frame-f.png")));

  // The transmission is scaled by its max.
  const Image3f f = LoadImage(Join(folder_, "frame-f.png"));
  EXPECT_NEAR(1.0f, f(0, 0)[2], 1e-6);
  EXPECT_NEAR(0.5f, f(0, 0)[0], 1.0 / 255.0);
}
