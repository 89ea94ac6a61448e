#include "sqlog/sinks/sqlite_sink.hpp"

#include <chrono>
#include <cstdio>
#include <exception>

namespace sqlog
{

SqliteSinkOptions SqliteSink::Validate(SqliteSinkOptions options)
{
  if (options.db_path.empty())
  {
    throw ConfigError("SqliteSink: db_path is required");
  }
  if (options.capacity == 0)
  {
    throw ConfigError("SqliteSink: capacity must be positive");
  }
  return options;
}

SqliteSink::SqliteSink(SqliteSinkOptions options)
    : options_(Validate(std::move(options)))
    , schema_(options_.table_name, options_.additional_fields)
    , provider_(options_.db_path)
    , writer_(schema_, provider_)
    , buffer_(options_.capacity)
    , timer_(std::chrono::duration<double>(options_.flush_interval), [this] { OnTimerTick(); })
{
  {
    ConnectionProvider::Lease lease = provider_.Acquire();
    schema_.EnsureSchema(lease.Handle());
  }
  timer_.Start();
}

SqliteSink::SqliteSink(const std::string& db_path, const std::string& table_name,
                       size_t capacity, double flush_interval,
                       std::vector<AdditionalField> additional_fields)
    : SqliteSink(SqliteSinkOptions{db_path, table_name, capacity, flush_interval,
                                   std::move(additional_fields)})
{
}

SqliteSink::~SqliteSink()
{
  try
  {
    Close();
  }
  catch (const SinkError& e)
  {
    ReportError(e);
  }
}

void SqliteSink::Write(const LogRecord& record)
{
  if (buffer_.State() == BufferState::Closed)
  {
    throw ClosedHandlerError("SqliteSink: write after close");
  }
  if (!ShouldLog(record.level))
  {
    return;
  }
  Batch batch = buffer_.Enqueue(record);
  if (!batch.Empty())
  {
    WriteBatch(std::move(batch));
  }
}

void SqliteSink::Flush()
{
  if (buffer_.State() == BufferState::Closed)
  {
    throw ClosedHandlerError("SqliteSink: flush after close");
  }
  WriteBatch(buffer_.Drain());
}

void SqliteSink::Close()
{
  std::lock_guard<std::mutex> lock(close_mutex_);
  if (close_started_)
  {
    return;
  }
  close_started_ = true;

  // 先停定时器，避免与最后一次换出竞争
  timer_.Stop();

  Batch final_batch = buffer_.Close();
  std::exception_ptr flush_error;
  try
  {
    WriteBatch(std::move(final_batch));
  }
  catch (const SinkError&)
  {
    flush_error = std::current_exception();
  }

  // 其他线程上尚未写完的批次
  buffer_.WaitIdle();
  provider_.Shutdown();

  if (flush_error)
  {
    std::rethrow_exception(flush_error);
  }
}

void SqliteSink::SetErrorHandler(ErrorHandler handler)
{
  std::lock_guard<std::mutex> lock(error_mutex_);
  error_handler_ = std::move(handler);
}

void SqliteSink::WriteBatch(Batch batch)
{
  if (batch.Empty())
  {
    return;
  }
  const size_t size = batch.Size();
  buffer_.WaitForTurn(batch);
  try
  {
    writer_.Flush(std::move(batch));
  }
  catch (const SinkError&)
  {
    dropped_.fetch_add(size, std::memory_order_relaxed);
    throw;
  }
}

void SqliteSink::OnTimerTick()
{
  try
  {
    WriteBatch(buffer_.Drain());
  }
  catch (const SinkError& e)
  {
    ReportError(e);
  }
}

void SqliteSink::ReportError(const SinkError& error) const
{
  ErrorHandler handler;
  {
    std::lock_guard<std::mutex> lock(error_mutex_);
    handler = error_handler_;
  }
  if (handler)
  {
    handler(error);
    return;
  }
  std::fprintf(stderr, "SqliteSink: %s\n", error.what());
}

}  // namespace sqlog
