#pragma once
#include <cstdint>
#include <exception>
#include <optional>
#include <string>

#include "log_level.hpp"
#include "source_location.hpp"
#include "value.hpp"

namespace sqlog {

struct ExceptionInfo {
    std::string type;
    std::string message;
    std::string stack_trace;

    // 记录动态类型（demangle 后）、what()，并沿 std::nested_exception 链展开
    static ExceptionInfo FromException(const std::exception& ex);
};

struct LogRecord {
    LogLevel    level = LogLevel::Info;
    std::string level_name;
    std::string logger_name;
    std::string message;

    uint64_t    created_at_ns = 0;

    // 源码位置，不可用时为空 / 0，落库为 NULL
    std::string file_path;
    std::string function_name;
    uint32_t    line = 0;

    uint32_t    thread_id = 0;
    std::string thread_name;
    uint32_t    process_id = 0;
    std::string process_name;

    std::optional<ExceptionInfo> exception;

    Fields      extra;
    Fields      additional;
};

// 由一次日志事件构造完整记录：时间戳、线程/进程上下文、level_name 一并填充；
// extra 中与保留列同名的键改名为 "extra_<key>"
LogRecord MakeRecord(LogLevel level, std::string logger_name, std::string message,
                     const SourceLocation* loc = nullptr, Fields extra = {},
                     std::optional<ExceptionInfo> exception = std::nullopt,
                     Fields additional = {});

} // namespace sqlog
