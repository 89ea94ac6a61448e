#pragma once
#include "log_level.hpp"
#include "log_record.hpp"
#include "platform.hpp"
#include "source_location.hpp"
#include "sinks/sink_interface.hpp"

#include <atomic>
#include <exception>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#ifdef SQLOG_USE_FMTLIB
#include <fmt/format.h>
#endif

namespace sqlog {

// 生成 LogRecord 并同步分发给各 Sink。每个 Logger 是独立实例，没有全局注册表。
class Logger {
public:
    explicit Logger(std::string name);

    const std::string& Name() const { return name_; }

    void AddSink(std::shared_ptr<ILogSink> sink);
    void SetLevel(LogLevel level);
    LogLevel Level() const;

    // Sink 抛出的错误（FlushError、ClosedHandlerError）原样传给调用方
    void Log(LogLevel level, const SourceLocation& loc, std::string message,
             Fields extra = {}, std::optional<ExceptionInfo> exception = std::nullopt);

    void Flush();
    void Close();

    // Core log method — template, defined in header
    template <typename... Args>
    void LogImpl(LogLevel level, const SourceLocation& loc, Fields extra,
                 const std::exception* exception, const char* fmt, Args&&... args);

private:
    std::string name_;
    std::atomic<LogLevel> level_{LogLevel::Info};

    mutable std::shared_mutex sinks_mutex_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;

    static std::string FormatMessage(const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 1, 2)))
#endif
        ;
};

// ===== LogImpl template implementation =====

template <typename... Args>
void Logger::LogImpl(LogLevel level, const SourceLocation& loc, Fields extra,
                     const std::exception* exception, const char* fmt, Args&&... args) {
#ifdef SQLOG_USE_FMTLIB
    std::string message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
#else
    std::string message = FormatMessage(fmt, args...);
#endif

    std::optional<ExceptionInfo> info;
    if (exception) {
        info = ExceptionInfo::FromException(*exception);
    }
    Log(level, loc, std::move(message), std::move(extra), std::move(info));
}

} // namespace sqlog

// ===== Logging macros =====

#define SQLOG_CALL(logger, lvl, extra, exc, fmt_str, ...) \
    do { \
        constexpr auto _sqlog_lvl = ::sqlog::LogLevel::lvl; \
        if (static_cast<int>(_sqlog_lvl) >= SQLOG_ACTIVE_LEVEL) { \
            auto& _sqlog_logger = (logger); \
            if (_sqlog_lvl >= _sqlog_logger.Level()) { \
                _sqlog_logger.LogImpl( \
                    _sqlog_lvl, SQLOG_CURRENT_LOCATION(), \
                    extra, exc, fmt_str, ##__VA_ARGS__); \
            } \
        } \
    } while (0)

#define SQLOG_TRACE(logger, fmt, ...) SQLOG_CALL(logger, Trace, ::sqlog::Fields{}, nullptr, fmt, ##__VA_ARGS__)
#define SQLOG_DEBUG(logger, fmt, ...) SQLOG_CALL(logger, Debug, ::sqlog::Fields{}, nullptr, fmt, ##__VA_ARGS__)
#define SQLOG_INFO(logger, fmt, ...)  SQLOG_CALL(logger, Info,  ::sqlog::Fields{}, nullptr, fmt, ##__VA_ARGS__)
#define SQLOG_WARN(logger, fmt, ...)  SQLOG_CALL(logger, Warn,  ::sqlog::Fields{}, nullptr, fmt, ##__VA_ARGS__)
#define SQLOG_ERROR(logger, fmt, ...) SQLOG_CALL(logger, Error, ::sqlog::Fields{}, nullptr, fmt, ##__VA_ARGS__)
#define SQLOG_FATAL(logger, fmt, ...) SQLOG_CALL(logger, Fatal, ::sqlog::Fields{}, nullptr, fmt, ##__VA_ARGS__)

// 携带 extra（Fields 变量；花括号字面量需加括号）
#define SQLOG_DEBUG_EX(logger, extra, fmt, ...) SQLOG_CALL(logger, Debug, extra, nullptr, fmt, ##__VA_ARGS__)
#define SQLOG_INFO_EX(logger, extra, fmt, ...)  SQLOG_CALL(logger, Info,  extra, nullptr, fmt, ##__VA_ARGS__)
#define SQLOG_WARN_EX(logger, extra, fmt, ...)  SQLOG_CALL(logger, Warn,  extra, nullptr, fmt, ##__VA_ARGS__)
#define SQLOG_ERROR_EX(logger, extra, fmt, ...) SQLOG_CALL(logger, Error, extra, nullptr, fmt, ##__VA_ARGS__)

// 以 Error 级别记录并附带异常信息
#define SQLOG_EXCEPTION(logger, exc, fmt, ...) \
    SQLOG_CALL(logger, Error, ::sqlog::Fields{}, &(exc), fmt, ##__VA_ARGS__)
