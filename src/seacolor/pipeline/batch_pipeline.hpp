#pragma once

#include <atomic>
#include <string>

#include "core/macros.hpp"
#include "core/stats_tracker.hpp"
#include "core/thread_safe_queue.hpp"
#include "dataset/paired_rgbd_dataset.hpp"
#include "imaging/attenuation.hpp"
#include "imaging/backscatter.hpp"
#include "imaging/depth_preprocess.hpp"
#include "params/params_base.hpp"

namespace seacolor {
namespace pipeline {

using namespace core;


// Counts reported at the end of a batch run.
struct BatchSummary final
{
  int num_frames = 0;
  int num_processed = 0;
  int num_failed = 0;
  int num_frames_with_nan = 0;
  long num_nan = 0;
};


// Restores every image/depth pair in a pair of folders, writing the results to an output folder.
// Frames are independent, so they're distributed over a pool of worker threads.
class BatchPipeline final {
 public:
  struct Params final : public ParamsBase
  {
    SEACOLOR_PARAMS_STRUCT_CONSTRUCTORS(Params);

    std::string image_folder;
    std::string depth_folder;
    std::string output_folder;

    // Target resolution for images and depth. Zero keeps the native image size.
    int height = 0;
    int width = 0;

    bool save_intermediates = false;

    // Calibration artifacts for the two models.
    std::string backscatter_params_path;
    std::string attenuation_params_path;

    // Number of worker threads. Zero means one per hardware thread.
    int num_workers = 0;

    imaging::DepthPreprocessParams depth_params;

   private:
    void LoadParams(const YamlParser& parser) override;
  };

  SEACOLOR_DELETE_COPY_CONSTRUCTORS(BatchPipeline)
  SEACOLOR_DELETE_DEFAULT_CONSTRUCTOR(BatchPipeline)

  // Loads both calibration artifacts. Aborts if either is missing or malformed.
  explicit BatchPipeline(const Params& params);

  // Construct with calibration params that are already in memory.
  BatchPipeline(const Params& params,
                const imaging::BackscatterParams& backscatter_params,
                const imaging::AttenuationParams& attenuation_params);

  // Process every frame. Aborts before processing anything if the image and depth folders
  // don't pair up. A frame that fails is logged and counted, and the rest keep going.
  BatchSummary Run();

  // Per-stage timing (in milliseconds) from the most recent Run().
  const StatsTracker& Stats() const { return stats_; }

 private:
  // Pops frame indices until the queue is empty.
  void WorkerLoop(const dataset::PairedRgbdDataset& rgbd_dataset, ThreadsafeQueue<size_t>& queue);

  // Load, enhance, and write a single frame. Returns false if anything went wrong.
  bool ProcessFrame(const dataset::PairedRgbdDataset& rgbd_dataset, size_t index);

  // Number of threads to use for n frames.
  int NumWorkers(size_t num_frames) const;

 private:
  Params params_;
  imaging::BackscatterParams backscatter_params_;
  imaging::AttenuationParams attenuation_params_;

  StatsTracker stats_;

  std::atomic<int> num_processed_{0};
  std::atomic<int> num_failed_{0};
  std::atomic<int> num_frames_with_nan_{0};
  std::atomic<long> num_nan_{0};
};


}
}
