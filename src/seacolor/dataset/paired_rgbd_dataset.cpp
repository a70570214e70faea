#include <glog/logging.h>

#include "core/file_utils.hpp"
#include "dataset/paired_rgbd_dataset.hpp"
#include "imaging/io.hpp"

namespace seacolor {
namespace dataset {


PairedRgbdDataset::PairedRgbdDataset(const std::string& image_folder,
                                     const std::string& depth_folder,
                                     const cv::Size& target_size,
                                     const imaging::DepthPreprocessParams& depth_params)
    : target_size_(target_size),
      depth_params_(depth_params)
{
  std::vector<std::string> image_paths, depth_paths;
  FilenamesInDirectory(image_folder, image_paths, true);
  FilenamesInDirectory(depth_folder, depth_paths, true);

  CHECK_EQ(image_paths.size(), depth_paths.size())
      << "Found " << image_paths.size() << " images in " << image_folder << " but "
      << depth_paths.size() << " depth maps in " << depth_folder << std::endl;

  for (size_t i = 0; i < image_paths.size(); ++i) {
    items_.emplace_back(image_paths.at(i), depth_paths.at(i));
  }

  LOG(INFO) << "Found " << items_.size() << " image/depth pairs" << std::endl;
}


RgbdFrame PairedRgbdDataset::Load(size_t i) const
{
  const RgbdDatasetItem& item = items_.at(i);

  RgbdFrame frame;
  frame.name = Stem(item.path_image);
  frame.bgr = imaging::LoadImage(item.path_image, target_size_);

  // If no target size was given, the depth map is brought to the image size.
  const cv::Size depth_size = (target_size_.area() > 0) ? target_size_ : frame.bgr.size();
  frame.depth = imaging::PreprocessDepth(imaging::LoadDepth(item.path_depth), depth_size, depth_params_);

  return frame;
}


}
}
