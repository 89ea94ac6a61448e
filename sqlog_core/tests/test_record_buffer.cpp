#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "sqlog/errors.hpp"
#include "sqlog/record_buffer.hpp"

using namespace sqlog;

namespace
{

LogRecord make_record(const std::string& msg)
{
  LogRecord r;
  r.message = msg;
  return r;
}

}  // namespace

TEST(RecordBuffer, BelowCapacityReturnsEmptyBatch)
{
  RecordBuffer buffer(3);
  EXPECT_TRUE(buffer.Enqueue(make_record("a")).Empty());
  EXPECT_TRUE(buffer.Enqueue(make_record("b")).Empty());
  EXPECT_EQ(buffer.Pending(), 2u);
  EXPECT_EQ(buffer.State(), BufferState::Active);
}

TEST(RecordBuffer, ReachingCapacitySwapsOutInOrder)
{
  RecordBuffer buffer(3);
  buffer.Enqueue(make_record("A"));
  buffer.Enqueue(make_record("B"));
  Batch batch = buffer.Enqueue(make_record("C"));

  ASSERT_EQ(batch.Size(), 3u);
  EXPECT_EQ(batch.Records()[0].message, "A");
  EXPECT_EQ(batch.Records()[1].message, "B");
  EXPECT_EQ(batch.Records()[2].message, "C");
  EXPECT_EQ(buffer.Pending(), 0u);
  EXPECT_EQ(buffer.InFlight(), 1u);
  EXPECT_EQ(buffer.State(), BufferState::Flushing);
}

TEST(RecordBuffer, ReleasingBatchEndsFlushing)
{
  RecordBuffer buffer(1);
  {
    Batch batch = buffer.Enqueue(make_record("x"));
    EXPECT_EQ(buffer.InFlight(), 1u);
    Batch moved = std::move(batch);
    EXPECT_EQ(buffer.InFlight(), 1u);
  }
  EXPECT_EQ(buffer.InFlight(), 0u);
  EXPECT_EQ(buffer.State(), BufferState::Active);
}

TEST(RecordBuffer, DrainTakesEverythingOnce)
{
  RecordBuffer buffer(100);
  for (int i = 0; i < 5; ++i)
  {
    buffer.Enqueue(make_record(std::to_string(i)));
  }
  Batch first = buffer.Drain();
  Batch second = buffer.Drain();
  EXPECT_EQ(first.Size(), 5u);
  EXPECT_TRUE(second.Empty());
  EXPECT_EQ(buffer.InFlight(), 1u);
}

TEST(RecordBuffer, CloseReturnsFinalBatchAndRejectsEnqueue)
{
  RecordBuffer buffer(10);
  buffer.Enqueue(make_record("last"));
  Batch final_batch = buffer.Close();
  ASSERT_EQ(final_batch.Size(), 1u);
  EXPECT_EQ(buffer.State(), BufferState::Closed);

  EXPECT_TRUE(buffer.Close().Empty());
  EXPECT_THROW(buffer.Enqueue(make_record("late")), ClosedHandlerError);
}

TEST(RecordBuffer, WaitIdleBlocksUntilBatchReleased)
{
  RecordBuffer buffer(1);
  Batch batch = buffer.Enqueue(make_record("x"));
  std::atomic<bool> idle{false};

  std::thread waiter(
      [&]
      {
        buffer.WaitIdle();
        idle = true;
      });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(idle.load());
  batch = Batch();
  waiter.join();
  EXPECT_TRUE(idle.load());
}

TEST(RecordBuffer, ConcurrentEnqueueLosesNothing)
{
  constexpr int kThreads = 8;
  constexpr int kPerThread = 500;
  RecordBuffer buffer(64);
  std::atomic<size_t> swapped{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t)
  {
    threads.emplace_back(
        [&]
        {
          for (int i = 0; i < kPerThread; ++i)
          {
            Batch batch = buffer.Enqueue(make_record("m"));
            swapped += batch.Size();
          }
        });
  }
  for (auto& th : threads) th.join();

  swapped += buffer.Drain().Size();
  EXPECT_EQ(swapped.load(), static_cast<size_t>(kThreads * kPerThread));
}

TEST(RecordBuffer, LaterBatchWaitsForEarlierRelease)
{
  RecordBuffer buffer(1);
  Batch first = buffer.Enqueue(make_record("a"));
  Batch second = buffer.Enqueue(make_record("b"));
  ASSERT_LT(first.Sequence(), second.Sequence());

  std::atomic<bool> turn{false};
  std::thread writer(
      [&]
      {
        buffer.WaitForTurn(second);
        turn = true;
      });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(turn.load());
  buffer.WaitForTurn(first);  // 最早的批次不等待
  first = Batch();
  writer.join();
  EXPECT_TRUE(turn.load());
}

TEST(RecordBuffer, OutOfOrderReleaseStillAdvancesTurn)
{
  RecordBuffer buffer(1);
  Batch first = buffer.Enqueue(make_record("a"));
  Batch second = buffer.Enqueue(make_record("b"));
  Batch third = buffer.Enqueue(make_record("c"));

  second = Batch();
  first = Batch();
  buffer.WaitForTurn(third);
  EXPECT_EQ(buffer.InFlight(), 1u);
}
