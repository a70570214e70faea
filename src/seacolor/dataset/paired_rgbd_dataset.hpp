#pragma once

#include <string>
#include <vector>

#include "core/cv_types.hpp"
#include "core/macros.hpp"
#include "imaging/depth_preprocess.hpp"

namespace seacolor {
namespace dataset {

using namespace core;


// Represents an image and its depth map stored on disk.
struct RgbdDatasetItem
{
  explicit RgbdDatasetItem(const std::string& path_image,
                           const std::string& path_depth)
      : path_image(path_image),
        path_depth(path_depth) {}

  std::string path_image;
  std::string path_depth;
};


// A decoded and preprocessed frame, ready for enhancement.
struct RgbdFrame
{
  // Filename of the image without directory or extension. Used to name outputs.
  std::string name;
  Image3f bgr;
  Image1f depth;
};


// Pairs up the files in an image folder and a depth folder by sorted filename. Both folders must
// contain the same number of files.
class PairedRgbdDataset final {
 public:
  SEACOLOR_DELETE_DEFAULT_CONSTRUCTOR(PairedRgbdDataset)

  // Images and depth maps are resized to target_size (pass an empty size to keep native size).
  PairedRgbdDataset(const std::string& image_folder,
                    const std::string& depth_folder,
                    const cv::Size& target_size,
                    const imaging::DepthPreprocessParams& depth_params);

  size_t Size() const { return items_.size(); }

  const RgbdDatasetItem& Item(size_t i) const { return items_.at(i); }

  // Decode and preprocess the i-th pair. Throws std::runtime_error if either file can't be read,
  // or std::invalid_argument if the depth map is malformed.
  RgbdFrame Load(size_t i) const;

 private:
  cv::Size target_size_;
  imaging::DepthPreprocessParams depth_params_;
  std::vector<RgbdDatasetItem> items_;
};


}
}
