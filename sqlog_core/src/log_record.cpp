#include "sqlog/log_record.hpp"

#include <cstdlib>
#include <memory>
#include <typeinfo>
#include <utility>
#include <vector>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

#include "sqlog/log_context.hpp"
#include "sqlog/storage/schema.hpp"
#include "sqlog/timestamp.hpp"

namespace sqlog
{

namespace
{

std::string Demangle(const char* name)
{
#if defined(__GNUG__)
  int status = 0;
  std::unique_ptr<char, void (*)(void*)> demangled(
      abi::__cxa_demangle(name, nullptr, nullptr, &status), std::free);
  if (status == 0 && demangled)
  {
    return demangled.get();
  }
#endif
  return name;
}

void AppendTrace(const std::exception& ex, std::string& trace, size_t depth)
{
  if (depth > 0)
  {
    trace += "\ncaused by: ";
  }
  trace += Demangle(typeid(ex).name());
  trace += ": ";
  trace += ex.what();
  try
  {
    std::rethrow_if_nested(ex);
  }
  catch (const std::exception& nested)
  {
    AppendTrace(nested, trace, depth + 1);
  }
  catch (...)
  {
    // 嵌套的非 std::exception 只记录占位，不向外传播
    trace += "\ncaused by: non-standard exception";
  }
}

}  // namespace

ExceptionInfo ExceptionInfo::FromException(const std::exception& ex)
{
  ExceptionInfo info;
  info.type = Demangle(typeid(ex).name());
  info.message = ex.what();
  AppendTrace(ex, info.stack_trace, 0);
  return info;
}

LogRecord MakeRecord(LogLevel level, std::string logger_name, std::string message,
                     const SourceLocation* loc, Fields extra,
                     std::optional<ExceptionInfo> exception, Fields additional)
{
  LogRecord record;
  record.created_at_ns = wall_clock_now_ns();
  record.level = level;
  record.level_name = std::string(to_string(level));
  record.logger_name = std::move(logger_name);
  record.message = std::move(message);

  if (loc)
  {
    record.file_path = loc->file_path ? loc->file_path : "";
    record.function_name = loc->function_name ? loc->function_name : "";
    record.line = loc->line;
  }

  LogContext::Instance().FillExecutionContext(record);
  record.exception = std::move(exception);

  // 调用方原有的键先落位，保留键改名时遇到冲突追加 '_' 直到空闲，不丢弃任何值
  std::vector<std::pair<std::string, Value>> reserved;
  for (auto& [key, value] : extra)
  {
    if (IsReservedColumn(key))
    {
      reserved.emplace_back(key, std::move(value));
    }
    else
    {
      record.extra.emplace(key, std::move(value));
    }
  }
  for (auto& [key, value] : reserved)
  {
    std::string renamed = "extra_" + key;
    while (record.extra.count(renamed) > 0)
    {
      renamed.push_back('_');
    }
    record.extra.emplace(std::move(renamed), std::move(value));
  }
  record.additional = std::move(additional);
  return record;
}

}  // namespace sqlog
