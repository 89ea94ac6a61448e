#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace sqlog
{

class SinkError : public std::runtime_error
{
 public:
  explicit SinkError(const std::string& what) : std::runtime_error(what) {}
};

// 选项非法（空路径、capacity 为 0）
class ConfigError : public SinkError
{
 public:
  using SinkError::SinkError;
};

// 保留列冲突、标识符非法、DDL 失败、已有表结构不兼容
class SchemaError : public SinkError
{
 public:
  using SinkError::SinkError;
};

// 打开数据库或设置 PRAGMA 失败
class ConnectionError : public SinkError
{
 public:
  ConnectionError(const std::string& what, int sqlite_code)
      : SinkError(what), sqlite_code_(sqlite_code)
  {
  }

  int SqliteCode() const { return sqlite_code_; }

 private:
  int sqlite_code_;
};

// 批量写入失败；该批次已丢弃（至多一次投递）
class FlushError : public SinkError
{
 public:
  FlushError(const std::string& what, int sqlite_code, size_t batch_size)
      : SinkError(what), sqlite_code_(sqlite_code), batch_size_(batch_size)
  {
  }

  int SqliteCode() const { return sqlite_code_; }
  size_t BatchSize() const { return batch_size_; }

 private:
  int sqlite_code_;
  size_t batch_size_;
};

class ClosedHandlerError : public SinkError
{
 public:
  using SinkError::SinkError;
};

}  // namespace sqlog
