#pragma once
#include <cstdint>
#include <string_view>

namespace sqlog {

// 持久化为整数列 level，数值随严重程度单调递增
enum class LogLevel : uint8_t {
    Trace = 0,
    Debug = 1,
    Info  = 2,
    Warn  = 3,
    Error = 4,
    Fatal = 5,
    Off   = 6
};

constexpr std::string_view to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

// 写入 level 列的整数代码（level_name 列用 to_string）
constexpr int to_int(LogLevel level) {
    return static_cast<int>(level);
}

// 编译期最低活跃级别（通过 CMake -DSQLOG_ACTIVE_LEVEL=2 注入）
#ifndef SQLOG_ACTIVE_LEVEL
    #ifdef NDEBUG
        #define SQLOG_ACTIVE_LEVEL 2  // Info
    #else
        #define SQLOG_ACTIVE_LEVEL 0  // Trace
    #endif
#endif

} // namespace sqlog
