#pragma once
#include <atomic>
#include <cstdint>
#include <string>

#include "../formatters/row_formatter.hpp"
#include "../record_buffer.hpp"
#include "connection_provider.hpp"
#include "schema.hpp"

namespace sqlog
{

// 把一个批次写成单个事务：全部可见或全部回滚。失败抛 FlushError，不重试、不回队。
class BatchWriter
{
 public:
  BatchWriter(const Schema& schema, ConnectionProvider& provider);

  // 空批次直接返回，不获取连接
  void Flush(Batch batch);

  uint64_t RowsWritten() const { return rows_written_.load(std::memory_order_relaxed); }
  uint64_t BatchesWritten() const { return batches_written_.load(std::memory_order_relaxed); }
  const RowFormatter& Formatter() const { return formatter_; }

 private:
  const Schema& schema_;
  ConnectionProvider& provider_;
  RowFormatter formatter_;
  std::string insert_sql_;

  std::atomic<uint64_t> rows_written_{0};
  std::atomic<uint64_t> batches_written_{0};

  static int BindRow(sqlite3_stmt* stmt, const Row& row);
};

}  // namespace sqlog
