#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace sqlog
{

// 周期定时器：独立线程每隔 interval 调用一次回调
class FlushTimer
{
 public:
  using Callback = std::function<void()>;

  // interval <= 0 或 NaN 表示禁用，Start() 不启动线程
  FlushTimer(std::chrono::duration<double> interval, Callback on_tick);
  ~FlushTimer();

  FlushTimer(const FlushTimer&) = delete;
  FlushTimer& operator=(const FlushTimer&) = delete;

  void Start();
  void Stop();  // 幂等；唤醒并等待线程退出

  bool Enabled() const { return interval_.count() > 0; }
  bool Running() const;
  uint64_t TickCount() const;

 private:
  std::chrono::duration<double> interval_;
  Callback on_tick_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool running_ = false;
  bool stop_requested_ = false;
  uint64_t ticks_ = 0;
  std::thread worker_;

  // 换算为时钟周期：过小取 1 tick，过大返回 nullopt
  std::optional<std::chrono::steady_clock::duration> Period() const;
  void WorkerLoop();
};

}  // namespace sqlog
