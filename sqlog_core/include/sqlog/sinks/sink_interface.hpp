#pragma once
#include "../log_level.hpp"
#include "../log_record.hpp"

namespace sqlog
{

class ILogSink
{
 public:
  virtual ~ILogSink() = default;

  // 写入一条日志（在调用方线程上执行）
  virtual void Write(const LogRecord& record) = 0;

  // 立即把缓冲写出
  virtual void Flush() = 0;

  // 有界关闭：之后的 Write/Flush 抛 ClosedHandlerError
  virtual void Close() {}

  // 设置该 Sink 的最低输出级别（独立于 Logger 级别）
  void SetLevel(LogLevel level) { min_level_ = level; }

  LogLevel Level() const { return min_level_; }

  // Sink 级别过滤
  bool ShouldLog(LogLevel record_level) const { return record_level >= min_level_; }

 protected:
  LogLevel min_level_ = LogLevel::Trace;
};

}  // namespace sqlog
