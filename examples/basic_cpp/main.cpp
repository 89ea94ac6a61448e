#include <sqlog/errors.hpp>
#include <sqlog/log_context.hpp>
#include <sqlog/logger.hpp>
#include <sqlog/sinks/sqlite_sink.hpp>

#include <cstdio>
#include <memory>
#include <stdexcept>
#include <thread>

int main()
{
  const char* db_path = "/tmp/sqlog_example.db";

  // --- Sink setup ---

  sqlog::SqliteSinkOptions opts;
  opts.db_path = db_path;
  opts.table_name = "app_logs";
  opts.capacity = 16;
  opts.flush_interval = 1.0;
  opts.additional_fields = {{"user_id", "TEXT"}, {"latency_ms", "REAL"}};

  std::shared_ptr<sqlog::SqliteSink> sink;
  try
  {
    sink = std::make_shared<sqlog::SqliteSink>(opts);
  }
  catch (const sqlog::SinkError& e)
  {
    std::fprintf(stderr, "failed to open log store: %s\n", e.what());
    return 1;
  }

  // Timer-thread failures have no caller to throw to
  sink->SetErrorHandler([](const sqlog::SinkError& e)
                        { std::fprintf(stderr, "[sqlog] background flush failed: %s\n", e.what()); });

  // --- Configuration ---

  sqlog::Logger logger("basic_example");
  logger.AddSink(sink);
  logger.SetLevel(sqlog::LogLevel::Trace);
  sqlog::LogContext::Instance().SetProcessName("basic_example");
  sqlog::LogContext::SetThreadName("main");

  // --- Basic logging ---

  SQLOG_TRACE(logger, "application started");
  SQLOG_DEBUG(logger, "debug value: %d", 42);
  SQLOG_INFO(logger, "hello %s, version %s", "world", "1.0");
  SQLOG_WARN(logger, "disk usage at %d%%", 85);
  SQLOG_ERROR(logger, "connection failed: %s", "timeout");

  // --- Structured data ---

  sqlog::Fields request{
      {"user_id", "u-1001"},
      {"latency_ms", 12.5},
      {"route", sqlog::Value::MakeObject({{"method", "GET"}, {"path", "/api/items"}})},
  };
  SQLOG_INFO_EX(logger, request, "request served");

  // --- Exceptions ---

  try
  {
    throw std::runtime_error("upstream returned 503");
  }
  catch (const std::exception& e)
  {
    SQLOG_EXCEPTION(logger, e, "call to %s failed", "inventory");
  }

  // --- Multi-thread demo ---

  auto worker = [&logger](int id)
  {
    char name[16];
    std::snprintf(name, sizeof(name), "worker-%d", id);
    sqlog::LogContext::SetThreadName(name);

    for (int i = 0; i < 5; ++i)
    {
      SQLOG_INFO(logger, "task %d processing step %d", id, i);
    }
  };

  std::thread t1(worker, 1);
  std::thread t2(worker, 2);
  t1.join();
  t2.join();

  // --- Shutdown ---

  SQLOG_INFO(logger, "shutting down");
  try
  {
    logger.Close();
  }
  catch (const sqlog::SinkError& e)
  {
    std::fprintf(stderr, "final flush failed: %s\n", e.what());
    return 1;
  }

  std::printf("Example finished. %llu rows written to %s (table app_logs).\n",
              static_cast<unsigned long long>(sink->RowsWritten()), db_path);
  return 0;
}
