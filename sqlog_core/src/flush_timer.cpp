#include "sqlog/flush_timer.hpp"

#include <cmath>

namespace sqlog
{

FlushTimer::FlushTimer(std::chrono::duration<double> interval, Callback on_tick)
    : interval_(interval), on_tick_(std::move(on_tick))
{
}

FlushTimer::~FlushTimer() { Stop(); }

void FlushTimer::Start()
{
  if (!Enabled() || !on_tick_)
  {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_)
  {
    return;
  }
  running_ = true;
  stop_requested_ = false;
  worker_ = std::thread(&FlushTimer::WorkerLoop, this);
}

void FlushTimer::Stop()
{
  std::thread worker;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_)
    {
      return;
    }
    stop_requested_ = true;
    running_ = false;
    worker = std::move(worker_);
  }
  cv_.notify_all();
  if (worker.joinable())
  {
    worker.join();
  }
}

bool FlushTimer::Running() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

uint64_t FlushTimer::TickCount() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return ticks_;
}

namespace
{

// 超过此值的间隔（含 +inf）视为永不触发，只等待 Stop()
constexpr std::chrono::hours kMaxPeriod{24 * 365 * 100};

}  // namespace

std::optional<std::chrono::steady_clock::duration> FlushTimer::Period() const
{
  const double seconds = interval_.count();
  if (!std::isfinite(seconds) ||
      interval_ >= std::chrono::duration<double>(kMaxPeriod))
  {
    return std::nullopt;
  }
  auto period = std::chrono::duration_cast<std::chrono::steady_clock::duration>(interval_);
  if (period <= std::chrono::steady_clock::duration::zero())
  {
    period = std::chrono::steady_clock::duration(1);
  }
  return period;
}

void FlushTimer::WorkerLoop()
{
  const auto period = Period();
  std::unique_lock<std::mutex> lock(mutex_);
  if (!period)
  {
    cv_.wait(lock, [this] { return stop_requested_; });
    return;
  }
  auto next = std::chrono::steady_clock::now() + *period;
  while (!stop_requested_)
  {
    if (cv_.wait_until(lock, next, [this] { return stop_requested_; }))
    {
      break;
    }
    ++ticks_;
    lock.unlock();
    on_tick_();
    lock.lock();
    next = std::chrono::steady_clock::now() + *period;
  }
}

}  // namespace sqlog
