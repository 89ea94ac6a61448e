#pragma once
#include <cstdint>
#include <mutex>
#include <string>

#include "log_record.hpp"

namespace sqlog
{

// 线程/进程身份：填充 LogRecord 的执行上下文字段
class LogContext
{
 public:
  static LogContext& Instance();

  void SetProcessName(const std::string& name);
  std::string ProcessName() const;

  static void SetThreadName(const char* name);
  static const char* GetThreadName();
  static uint32_t GetThreadId();
  static uint32_t GetProcessId();

  void FillExecutionContext(LogRecord& record) const;

 private:
  LogContext() = default;

  mutable std::mutex mutex_;
  std::string process_name_;

  static thread_local char tls_thread_name_[32];
  static thread_local uint32_t tls_thread_id_;
  static thread_local bool tls_thread_id_cached_;
};

}  // namespace sqlog
