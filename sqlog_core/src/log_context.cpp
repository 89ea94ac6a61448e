#include "sqlog/log_context.hpp"
#include "sqlog/platform.hpp"
#include <cstring>
#include <functional>
#include <thread>

#if defined(SQLOG_PLATFORM_LINUX)
#include <sys/syscall.h>
#include <unistd.h>
#elif defined(SQLOG_PLATFORM_MACOS)
#include <pthread.h>
#include <unistd.h>
#endif

namespace sqlog {

thread_local char LogContext::tls_thread_name_[32] = {};
thread_local uint32_t LogContext::tls_thread_id_ = 0;
thread_local bool LogContext::tls_thread_id_cached_ = false;

LogContext& LogContext::Instance() {
    static LogContext ctx;
    return ctx;
}

void LogContext::SetProcessName(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    process_name_ = name;
}

std::string LogContext::ProcessName() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return process_name_;
}

void LogContext::SetThreadName(const char* name) {
    if (!name) return;
    std::strncpy(tls_thread_name_, name, sizeof(tls_thread_name_) - 1);
    tls_thread_name_[sizeof(tls_thread_name_) - 1] = '\0';
}

const char* LogContext::GetThreadName() {
    return tls_thread_name_;
}

uint32_t LogContext::GetThreadId() {
    if (!tls_thread_id_cached_) {
#if defined(SQLOG_PLATFORM_LINUX)
        tls_thread_id_ = static_cast<uint32_t>(syscall(SYS_gettid));
#elif defined(SQLOG_PLATFORM_MACOS)
        uint64_t tid = 0;
        pthread_threadid_np(nullptr, &tid);
        tls_thread_id_ = static_cast<uint32_t>(tid);
#else
        tls_thread_id_ = static_cast<uint32_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
#endif
        tls_thread_id_cached_ = true;
    }
    return tls_thread_id_;
}

uint32_t LogContext::GetProcessId() {
#if defined(SQLOG_PLATFORM_LINUX) || defined(SQLOG_PLATFORM_MACOS)
    static const uint32_t process_id = static_cast<uint32_t>(getpid());
#else
    static const uint32_t process_id = 0;
#endif
    return process_id;
}

void LogContext::FillExecutionContext(LogRecord& record) const {
    record.process_id = GetProcessId();
    record.process_name = ProcessName();
    record.thread_id = GetThreadId();
    record.thread_name = tls_thread_name_;
}

} // namespace sqlog
