#include <algorithm>
#include <exception>
#include <functional>
#include <thread>
#include <vector>

#include <glog/logging.h>

#include "core/file_utils.hpp"
#include "core/timer.hpp"
#include "imaging/enhance.hpp"
#include "imaging/io.hpp"
#include "pipeline/batch_pipeline.hpp"

namespace seacolor {
namespace pipeline {


// Keep timing stats for this many of the most recent frames.
static const size_t kStatsWindow = 1000;


void BatchPipeline::Params::LoadParams(const YamlParser& parser)
{
  image_folder = YamlToString(parser.GetNode("images"));
  depth_folder = YamlToString(parser.GetNode("depth"));
  output_folder = YamlToString(parser.GetNode("output"));
  parser.GetParam("height", &height);
  parser.GetParam("width", &width);
  parser.GetParam("save_intermediates", &save_intermediates);
  backscatter_params_path = YamlToString(parser.GetNode("bs_params"));
  attenuation_params_path = YamlToString(parser.GetNode("da_params"));
  parser.GetParam("num_workers", &num_workers);

  depth_params = imaging::DepthPreprocessParams(parser.Subtree("DepthPreprocess"));

  CHECK_GE(height, 0);
  CHECK_GE(width, 0);
  CHECK((height == 0) == (width == 0)) << "Set both height and width, or neither" << std::endl;
  CHECK_GE(num_workers, 0);
}


BatchPipeline::BatchPipeline(const Params& params)
    : BatchPipeline(params,
                    imaging::BackscatterParams(params.backscatter_params_path),
                    imaging::AttenuationParams(params.attenuation_params_path)) {}


BatchPipeline::BatchPipeline(const Params& params,
                             const imaging::BackscatterParams& backscatter_params,
                             const imaging::AttenuationParams& attenuation_params)
    : params_(params),
      backscatter_params_(backscatter_params),
      attenuation_params_(attenuation_params),
      stats_("BatchPipeline", kStatsWindow)
{
  LOG(INFO) << "Constructed BatchPipeline!" << std::endl;
  LOG_IF(INFO, !backscatter_params_.Source().empty()) << "Backscatter params: " << backscatter_params_.Source();
  LOG_IF(INFO, !attenuation_params_.Source().empty()) << "Attenuation params: " << attenuation_params_.Source();
}


int BatchPipeline::NumWorkers(size_t num_frames) const
{
  int n = params_.num_workers;
  if (n == 0) {
    // hardware_concurrency() can return 0 if it isn't computable.
    n = std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
  }
  return std::max(1, std::min(n, static_cast<int>(num_frames)));
}


BatchSummary BatchPipeline::Run()
{
  num_processed_ = 0;
  num_failed_ = 0;
  num_frames_with_nan_ = 0;
  num_nan_ = 0;

  const dataset::PairedRgbdDataset rgbd_dataset(
      params_.image_folder,
      params_.depth_folder,
      cv::Size(params_.width, params_.height),
      params_.depth_params);

  mkdir(params_.output_folder, true);

  // Unbounded, since every index is pushed before the workers start.
  ThreadsafeQueue<size_t> queue(0);
  for (size_t i = 0; i < rgbd_dataset.Size(); ++i) {
    queue.Push(i);
  }

  const int num_workers = NumWorkers(rgbd_dataset.Size());
  LOG(INFO) << "Processing " << rgbd_dataset.Size() << " frames with " << num_workers << " workers" << std::endl;

  Timer timer(true);

  std::vector<std::thread> workers;
  for (int i = 0; i < num_workers; ++i) {
    workers.emplace_back(&BatchPipeline::WorkerLoop, this, std::cref(rgbd_dataset), std::ref(queue));
  }
  for (std::thread& worker : workers) {
    worker.join();
  }

  const double elapsed_sec = timer.Elapsed().seconds();

  BatchSummary summary;
  summary.num_frames = static_cast<int>(rgbd_dataset.Size());
  summary.num_processed = num_processed_;
  summary.num_failed = num_failed_;
  summary.num_frames_with_nan = num_frames_with_nan_;
  summary.num_nan = num_nan_;

  stats_.Print("load", "ms");
  stats_.Print("backscatter", "ms");
  stats_.Print("normalization", "ms");
  stats_.Print("attenuation", "ms");
  stats_.Print("write", "ms");

  LOG(INFO) << "Processed " << summary.num_processed << "/" << summary.num_frames << " frames in "
            << elapsed_sec << " sec (" << summary.num_failed << " failed)" << std::endl;
  LOG_IF(WARNING, summary.num_frames_with_nan > 0)
      << summary.num_frames_with_nan << " frames had NaNs in the restored image ("
      << summary.num_nan << " values zeroed)" << std::endl;

  return summary;
}


void BatchPipeline::WorkerLoop(const dataset::PairedRgbdDataset& rgbd_dataset, ThreadsafeQueue<size_t>& queue)
{
  size_t index;
  while (queue.PopIfNonEmpty(index)) {
    if (ProcessFrame(rgbd_dataset, index)) {
      ++num_processed_;
    } else {
      ++num_failed_;
    }
  }
}


bool BatchPipeline::ProcessFrame(const dataset::PairedRgbdDataset& rgbd_dataset, size_t index)
{
  const dataset::RgbdDatasetItem& item = rgbd_dataset.Item(index);

  try {
    Timer timer(true);
    const dataset::RgbdFrame frame = rgbd_dataset.Load(index);
    stats_.Add("load", timer.Tock().milliseconds());

    const imaging::EnhanceResult result = imaging::EnhanceUnderwater(
        frame.bgr, frame.depth, backscatter_params_, attenuation_params_);

    stats_.Add("backscatter", result.timings.backscatter.milliseconds());
    stats_.Add("normalization", result.timings.normalization.milliseconds());
    stats_.Add("attenuation", result.timings.attenuation.milliseconds());

    if (result.num_nan > 0) {
      LOG(WARNING) << "Zeroed " << result.num_nan << " NaN values in " << frame.name << std::endl;
      ++num_frames_with_nan_;
      num_nan_ += result.num_nan;
    }

    timer.Start();
    imaging::WriteEnhanceResult(params_.output_folder, frame.name, result, params_.save_intermediates);
    stats_.Add("write", timer.Tock().milliseconds());

    VLOG(1) << "Enhanced " << frame.name << " in " << result.timings.Total().milliseconds() << " ms ("
            << result.timings.backscatter.milliseconds() << " ms backscatter, "
            << result.timings.attenuation.milliseconds() << " ms attenuation)";

  } catch (const std::exception& e) {
    LOG(ERROR) << "Failed to process frame " << index << " (" << item.path_image << ", "
               << item.path_depth << "): " << e.what() << std::endl;
    return false;
  }

  return true;
}


}
}
