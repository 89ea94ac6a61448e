#include "sqlog/logger.hpp"

#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace sqlog
{

Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::AddSink(std::shared_ptr<ILogSink> sink)
{
  if (!sink)
  {
    return;
  }
  std::unique_lock<std::shared_mutex> lock(sinks_mutex_);
  sinks_.push_back(std::move(sink));
}

void Logger::SetLevel(LogLevel level) { level_.store(level, std::memory_order_relaxed); }

LogLevel Logger::Level() const { return level_.load(std::memory_order_relaxed); }

void Logger::Log(LogLevel level, const SourceLocation& loc, std::string message, Fields extra,
                 std::optional<ExceptionInfo> exception)
{
  if (level < Level() || level == LogLevel::Off)
  {
    return;
  }
  LogRecord record =
      MakeRecord(level, name_, std::move(message), &loc, std::move(extra), std::move(exception));

  std::shared_lock<std::shared_mutex> lock(sinks_mutex_);
  for (auto& sink : sinks_)
  {
    if (sink->ShouldLog(record.level))
    {
      sink->Write(record);
    }
  }
}

void Logger::Flush()
{
  std::shared_lock<std::shared_mutex> lock(sinks_mutex_);
  for (auto& sink : sinks_)
  {
    sink->Flush();
  }
}

void Logger::Close()
{
  std::shared_lock<std::shared_mutex> lock(sinks_mutex_);
  for (auto& sink : sinks_)
  {
    sink->Close();
  }
}

std::string Logger::FormatMessage(const char* fmt, ...)
{
  char buf[SQLOG_MAX_MSG_LEN];
  va_list args;
  va_start(args, fmt);
  va_list retry;
  va_copy(retry, args);
  int written = std::vsnprintf(buf, sizeof(buf), fmt, args);
  va_end(args);

  std::string out;
  if (written < 0)
  {
    va_end(retry);
    return out;
  }
  if (static_cast<size_t>(written) < sizeof(buf))
  {
    out.assign(buf, static_cast<size_t>(written));
  }
  else
  {
    // 超出栈缓冲，按实际长度重新格式化
    out.resize(static_cast<size_t>(written) + 1);
    std::vsnprintf(&out[0], out.size(), fmt, retry);
    out.resize(static_cast<size_t>(written));
  }
  va_end(retry);
  return out;
}

}  // namespace sqlog
