#include <atomic>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "core/thread_safe_queue.hpp"

using namespace seacolor;
using namespace core;


TEST(ThreadsafeQueueTest, TestFifo)
{
  ThreadsafeQueue<size_t> q(0);
  EXPECT_TRUE(q.Empty());

  q.Push(3);
  q.Push(5);
  EXPECT_EQ(2ul, q.Size());

  size_t item = 0;
  ASSERT_TRUE(q.PopIfNonEmpty(item));
  EXPECT_EQ(3ul, item);
  ASSERT_TRUE(q.PopIfNonEmpty(item));
  EXPECT_EQ(5ul, item);
  EXPECT_FALSE(q.PopIfNonEmpty(item));
}


TEST(ThreadsafeQueueTest, TestBounded)
{
  ThreadsafeQueue<int> drop_oldest(2, true);
  EXPECT_TRUE(drop_oldest.Push(1));
  EXPECT_TRUE(drop_oldest.Push(2));
  EXPECT_TRUE(drop_oldest.Push(3));
  EXPECT_EQ(2ul, drop_oldest.Size());

  int item = 0;
  drop_oldest.PopIfNonEmpty(item);
  EXPECT_EQ(2, item);

  ThreadsafeQueue<int> reject(1, false);
  EXPECT_TRUE(reject.Push(1));
  EXPECT_FALSE(reject.Push(2));
  reject.PopIfNonEmpty(item);
  EXPECT_EQ(1, item);
}


TEST(ThreadsafeQueueTest, TestMultipleConsumers)
{
  const size_t N = 1000;
  ThreadsafeQueue<size_t> q(0);
  for (size_t i = 0; i < N; ++i) {
    q.Push(i);
  }

  std::vector<std::atomic<int>> seen(N);
  for (std::atomic<int>& s : seen) { s = 0; }

  std::vector<std::thread> consumers;
  for (int t = 0; t < 4; ++t) {
    consumers.emplace_back([&q, &seen]() {
      size_t i;
      while (q.PopIfNonEmpty(i)) {
        ++seen.at(i);
      }
    });
  }
  for (std::thread& t : consumers) {
    t.join();
  }

  // Every item is popped exactly once.
  for (size_t i = 0; i < N; ++i) {
    EXPECT_EQ(1, seen.at(i).load());
  }
}
