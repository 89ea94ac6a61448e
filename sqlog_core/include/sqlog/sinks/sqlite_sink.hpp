#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "../errors.hpp"
#include "../flush_timer.hpp"
#include "../platform.hpp"
#include "../record_buffer.hpp"
#include "../storage/batch_writer.hpp"
#include "../storage/connection_provider.hpp"
#include "../storage/schema.hpp"
#include "sink_interface.hpp"

namespace sqlog
{

struct SqliteSinkOptions
{
  // 数据库文件路径（必填）
  std::string db_path;
  std::string table_name = SQLOG_DEFAULT_TABLE;
  // 缓冲达到该条数时立即写出
  size_t capacity = SQLOG_DEFAULT_CAPACITY;
  // 定时写出间隔（秒），<= 0 时不启动定时线程
  double flush_interval = SQLOG_DEFAULT_FLUSH_INTERVAL_S;
  std::vector<AdditionalField> additional_fields;
};

// 批量写入 SQLite 的 Sink。
//
// Write() 只在缓冲区锁内追加记录；缓冲满时由触发的调用方线程在锁外写出整个批次。
// 定时线程每 flush_interval 秒换出并写出剩余记录。两条路径都经过同一次换出，
// 因此一条记录只会被写一次。写失败的批次被丢弃（至多一次投递）。
class SqliteSink : public ILogSink
{
 public:
  using ErrorHandler = std::function<void(const SinkError&)>;

  // 建表/校验在构造期间完成；失败抛 ConfigError / SchemaError / ConnectionError
  explicit SqliteSink(SqliteSinkOptions options);
  SqliteSink(const std::string& db_path, const std::string& table_name = SQLOG_DEFAULT_TABLE,
             size_t capacity = SQLOG_DEFAULT_CAPACITY,
             double flush_interval = SQLOG_DEFAULT_FLUSH_INTERVAL_S,
             std::vector<AdditionalField> additional_fields = {});
  ~SqliteSink() override;

  SqliteSink(const SqliteSink&) = delete;
  SqliteSink& operator=(const SqliteSink&) = delete;

  // 同步路径上的写失败抛 FlushError；关闭后抛 ClosedHandlerError
  void Write(const LogRecord& record) override;
  void Flush() override;
  void Close() override;

  // 定时线程与析构路径上无法抛出的错误交给该回调；默认输出到 stderr
  void SetErrorHandler(ErrorHandler handler);

  size_t Pending() const { return buffer_.Pending(); }
  BufferState State() const { return buffer_.State(); }
  bool IsClosed() const { return buffer_.State() == BufferState::Closed; }

  const SqliteSinkOptions& Options() const { return options_; }
  const Schema& GetSchema() const { return schema_; }

  uint64_t DroppedCount() const { return dropped_.load(std::memory_order_relaxed); }
  uint64_t RowsWritten() const { return writer_.RowsWritten(); }
  uint64_t BatchesWritten() const { return writer_.BatchesWritten(); }
  uint64_t SubstitutionCount() const { return writer_.Formatter().SubstitutionCount(); }
  uint64_t TimerTicks() const { return timer_.TickCount(); }
  bool TimerRunning() const { return timer_.Running(); }
  size_t OpenConnections() const { return provider_.OpenCount(); }

 private:
  SqliteSinkOptions options_;
  Schema schema_;
  ConnectionProvider provider_;
  BatchWriter writer_;
  RecordBuffer buffer_;
  FlushTimer timer_;

  std::atomic<uint64_t> dropped_{0};

  mutable std::mutex error_mutex_;
  ErrorHandler error_handler_;

  std::mutex close_mutex_;
  bool close_started_ = false;

  static SqliteSinkOptions Validate(SqliteSinkOptions options);

  void WriteBatch(Batch batch);
  void OnTimerTick();
  void ReportError(const SinkError& error) const;
};

}  // namespace sqlog
