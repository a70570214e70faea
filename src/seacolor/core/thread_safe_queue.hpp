#pragma once

#include <mutex>
#include <queue>
#include <utility>

#include <glog/logging.h>

namespace seacolor {
namespace core {


template<typename Item>
class ThreadsafeQueue {
 public:
  // Construct the queue with a max size and drop policy.
  // If max_queue_size is zero, no items are dropped (size unbounded).
  explicit ThreadsafeQueue(size_t max_queue_size,
                           bool drop_oldest_if_full = true)
      : max_queue_size_(max_queue_size),
        drop_oldest_if_full_(drop_oldest_if_full) {}

  // Push an item onto the queue. Returns whether the item was accepted.
  bool Push(Item item)
  {
    std::lock_guard<std::mutex> lock(lock_);
    if (q_.size() >= max_queue_size_ && max_queue_size_ != 0) {
      if (!drop_oldest_if_full_) {
        return false;
      }
      LOG(WARNING) << "Dropping item from ThreadsafeQueue!" << std::endl;
      q_.pop();
    }
    q_.push(std::move(item));
    return true;
  }

  // Check if the queue is empty and pop the front item if not. This is safe to use with multiple
  // consumers, because we check non-emptiness and pop within the same lock.
  bool PopIfNonEmpty(Item& item)
  {
    std::lock_guard<std::mutex> lock(lock_);
    const bool nonempty = !q_.empty();
    if (nonempty) {
      item = std::move(q_.front());
      q_.pop();
    }
    return nonempty;
  }

  // Return the current size of the queue.
  size_t Size()
  {
    std::lock_guard<std::mutex> lock(lock_);
    return q_.size();
  }

  bool Empty() { return Size() == 0; }

 private:
  size_t max_queue_size_ = 0;
  bool drop_oldest_if_full_ = true;

  std::queue<Item> q_;
  std::mutex lock_;
};

}
}
