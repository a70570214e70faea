#include <fstream>
#include <stdexcept>

#include <boost/filesystem.hpp>
#include <gtest/gtest.h>

#include "core/file_utils.hpp"

using namespace seacolor;
using namespace core;

namespace fs = boost::filesystem;


TEST(FileUtilsTest, TestFilenamesInDirectory)
{
  const std::string folder = (fs::temp_directory_path() / fs::unique_path()).string();
  ASSERT_TRUE(mkdir(folder));

  std::ofstream(Join(folder, "b.png")).close();
  std::ofstream(Join(folder, "a.png")).close();
  std::ofstream(Join(folder, "c.png")).close();
  mkdir(Join(folder, "subfolder"));

  std::vector<std::string> files;
  EXPECT_EQ(3, FilenamesInDirectory(folder, files, true));
  EXPECT_EQ(Join(folder, "a.png"), files.at(0));
  EXPECT_EQ(Join(folder, "b.png"), files.at(1));
  EXPECT_EQ(Join(folder, "c.png"), files.at(2));

  EXPECT_FALSE(mkdir(folder, true));
  EXPECT_THROW(mkdir(folder, false), std::runtime_error);

  EXPECT_TRUE(rmdir(folder));
  EXPECT_FALSE(Exists(folder));

  EXPECT_THROW(FilenamesInDirectory(folder, files), std::runtime_error);
}


TEST(FileUtilsTest, TestStem)
{
  EXPECT_EQ("LFT_3374", Stem("/data/images/LFT_3374.png"));
  EXPECT_EQ("frame.0001", Stem("frame.0001.tif"));
  EXPECT_EQ("noext", Stem("noext"));
}
