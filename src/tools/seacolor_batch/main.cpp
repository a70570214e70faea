#include <glog/logging.h>

#include "pipeline/batch_pipeline.hpp"

using namespace seacolor;


int main(int argc, char const *argv[])
{
  // Set up glog.
  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = 1;

  CHECK_EQ(2, argc)
      << "Requires (1) arg: the path to a batch config YAML (see config/SeacolorBatch.yaml)" << std::endl;

  const pipeline::BatchPipeline::Params params{std::string(argv[1])};

  pipeline::BatchPipeline batch(params);
  const pipeline::BatchSummary summary = batch.Run();

  LOG(INFO) << "DONE" << std::endl;

  return (summary.num_failed == 0) ? 0 : 1;
}
