#include <glog/logging.h>

#include "core/stats_tracker.hpp"

namespace seacolor {
namespace core {


StatsTracker::StatsTracker(const std::string& tracker_name, size_t k)
    : tracker_name_(tracker_name), k_(k)
{
  CHECK_GT(k, 0ul) << "StatsTracker needs room for at least one sample" << std::endl;
}


void StatsTracker::Add(const std::string& name, float value)
{
  std::lock_guard<std::mutex> lock(lock_);
  if (stats_.count(name) == 0) {
    stats_.emplace(name, StatsBuffer<float>(k_));
  }
  stats_.at(name).Add(value);
}


bool StatsTracker::Summary(const std::string& name, StatsSummary& summary) const
{
  std::lock_guard<std::mutex> lock(lock_);
  if (stats_.count(name) == 0) {
    return false;
  }
  summary.N = stats_.at(name).MinMaxMean(summary.min, summary.max, summary.mean);
  return true;
}


void StatsTracker::Print(const std::string& name, const std::string& units) const
{
  StatsSummary s;

  // Can't print stats for nonexistent scalar.
  if (!Summary(name, s)) {
    return;
  }

  LOG(INFO) << "[ " << tracker_name_ << "/" << name << " ] MIN=" << s.min << " " << units
            << " MAX=" << s.max << " " << units << " MEAN=" << s.mean << " " << units
            << " (N=" << s.N << ")";
}


}
}
