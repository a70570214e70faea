#pragma once

#include <deque>

#include <glog/logging.h>

namespace seacolor {
namespace core {


// Keeps the most recent N items. Adding to a full buffer evicts the oldest item.
template <typename Item>
class SlidingBuffer {
 public:
  explicit SlidingBuffer(size_t capacity) : capacity_(capacity)
  {
    CHECK_GT(capacity, 0ul) << "SlidingBuffer needs a nonzero capacity" << std::endl;
  }

  void Add(const Item& item)
  {
    if (items_.size() == capacity_) {
      items_.pop_front();
    }
    items_.push_back(item);
    ++num_added_;
  }

  // Item added k_ago additions before the most recent one (0 is the newest).
  const Item& Get(size_t k_ago) const
  {
    CHECK_LT(k_ago, items_.size()) << "Only holding " << items_.size() << " items" << std::endl;
    return items_.at(items_.size() - 1 - k_ago);
  }

  const Item& Head() const { return Get(0); }

  // Number of items currently held (never more than the capacity).
  size_t Size() const { return items_.size(); }
  size_t Capacity() const { return capacity_; }

  // Number of items ever added, including evicted ones.
  size_t Added() const { return num_added_; }

 private:
  size_t capacity_;
  size_t num_added_ = 0;
  std::deque<Item> items_;
};


}
}
