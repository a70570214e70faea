#pragma once

#include <algorithm>
#include <limits>
#include <mutex>
#include <string>
#include <unordered_map>

#include "core/macros.hpp"
#include "core/sliding_buffer.hpp"

namespace seacolor {
namespace core {


template <typename Item>
class StatsBuffer : public SlidingBuffer<Item> {
 public:
  explicit StatsBuffer(size_t k) : SlidingBuffer<Item>(k) {}

  // Min, max and mean over the items currently held. Returns the number of items.
  int MinMaxMean(Item& min, Item& max, Item& mean) const
  {
    const int N = static_cast<int>(this->Size());
    min = std::numeric_limits<Item>::max();
    max = std::numeric_limits<Item>::lowest();
    mean = 0;

    for (int ago = 0; ago < N; ++ago) {
      const Item val = this->Get(ago);
      min = std::min(min, val);
      max = std::max(max, val);
      mean += val;
    }

    if (N > 0) {
      mean /= static_cast<Item>(N);
    }

    return N;
  }
};


// Summary of the samples currently held for one named scalar.
struct StatsSummary final
{
  int N = 0;
  float min = 0;
  float max = 0;
  float mean = 0;
};


// Stores the k latest scalar measurements for various named parameters so that we can log basic
// stats about them. The pipeline uses this to profile each enhancement stage across frames.
// All methods are safe to call from multiple worker threads.
class StatsTracker final {
 public:
  SEACOLOR_DELETE_COPY_CONSTRUCTORS(StatsTracker)

  StatsTracker(const std::string& tracker_name, size_t k);

  void Add(const std::string& name, float value);

  // Returns false if nothing has been added under this name.
  bool Summary(const std::string& name, StatsSummary& summary) const;

  // Log MIN/MAX/MEAN for a scalar at INFO level.
  void Print(const std::string& name, const std::string& units) const;

 private:
  std::string tracker_name_;
  size_t k_;
  mutable std::mutex lock_;
  std::unordered_map<std::string, StatsBuffer<float>> stats_;
};


}
}
