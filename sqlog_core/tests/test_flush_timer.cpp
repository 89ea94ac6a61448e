#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <limits>
#include <thread>

#include "sqlog/flush_timer.hpp"

using sqlog::FlushTimer;
using namespace std::chrono_literals;

TEST(FlushTimer, TicksPeriodically)
{
  std::atomic<int> ticks{0};
  FlushTimer timer(std::chrono::duration<double>(0.02), [&] { ++ticks; });
  timer.Start();
  EXPECT_TRUE(timer.Running());
  std::this_thread::sleep_for(150ms);
  timer.Stop();

  EXPECT_GE(ticks.load(), 2);
  EXPECT_EQ(timer.TickCount(), static_cast<uint64_t>(ticks.load()));
  EXPECT_FALSE(timer.Running());
}

TEST(FlushTimer, NonPositiveIntervalDisables)
{
  std::atomic<int> ticks{0};
  FlushTimer zero(std::chrono::duration<double>(0.0), [&] { ++ticks; });
  FlushTimer negative(std::chrono::duration<double>(-1.0), [&] { ++ticks; });
  zero.Start();
  negative.Start();
  EXPECT_FALSE(zero.Enabled());
  EXPECT_FALSE(zero.Running());
  EXPECT_FALSE(negative.Running());
  std::this_thread::sleep_for(20ms);
  EXPECT_EQ(ticks.load(), 0);
}

TEST(FlushTimer, StopIsPromptAndIdempotent)
{
  FlushTimer timer(std::chrono::duration<double>(1000.0), [] {});
  timer.Start();

  auto start = std::chrono::steady_clock::now();
  timer.Stop();
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_LT(elapsed, 1s);
  EXPECT_EQ(timer.TickCount(), 0u);

  timer.Stop();
  EXPECT_FALSE(timer.Running());
}

TEST(FlushTimer, NoTicksAfterStop)
{
  std::atomic<int> ticks{0};
  FlushTimer timer(std::chrono::duration<double>(0.01), [&] { ++ticks; });
  timer.Start();
  std::this_thread::sleep_for(50ms);
  timer.Stop();
  int after_stop = ticks.load();
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(ticks.load(), after_stop);
}

TEST(FlushTimer, DestructorStopsThread)
{
  std::atomic<int> ticks{0};
  {
    FlushTimer timer(std::chrono::duration<double>(0.01), [&] { ++ticks; });
    timer.Start();
    std::this_thread::sleep_for(30ms);
  }
  int after = ticks.load();
  std::this_thread::sleep_for(30ms);
  EXPECT_EQ(ticks.load(), after);
}

TEST(FlushTimer, HugeIntervalNeverFires)
{
  for (double seconds : {1e12, std::numeric_limits<double>::infinity()})
  {
    std::atomic<int> ticks{0};
    FlushTimer timer(std::chrono::duration<double>(seconds), [&] { ++ticks; });
    timer.Start();
    EXPECT_TRUE(timer.Running());
    std::this_thread::sleep_for(200ms);
    EXPECT_EQ(timer.TickCount(), 0u) << seconds;

    auto start = std::chrono::steady_clock::now();
    timer.Stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 500ms);
    EXPECT_EQ(ticks.load(), 0);
  }
}

TEST(FlushTimer, SubNanosecondIntervalStillStops)
{
  std::atomic<int> ticks{0};
  FlushTimer timer(std::chrono::duration<double>(1e-12), [&] { ++ticks; });
  timer.Start();
  std::this_thread::sleep_for(20ms);
  timer.Stop();
  EXPECT_GT(ticks.load(), 0);
  EXPECT_FALSE(timer.Running());
}
