#pragma once

// ===== 平台检测 =====
#if defined(__linux__)
    #define SQLOG_PLATFORM_LINUX 1
#elif defined(__APPLE__)
    #define SQLOG_PLATFORM_MACOS 1
#endif

// ===== 缓冲默认值（SqliteSinkOptions） =====
#ifndef SQLOG_DEFAULT_TABLE
    #define SQLOG_DEFAULT_TABLE "logs"
#endif

#ifndef SQLOG_DEFAULT_CAPACITY
    #define SQLOG_DEFAULT_CAPACITY 1000
#endif

#ifndef SQLOG_DEFAULT_FLUSH_INTERVAL_S
    #define SQLOG_DEFAULT_FLUSH_INTERVAL_S 5.0
#endif

// ===== SQLite 连接参数 =====
#ifndef SQLOG_BUSY_TIMEOUT_MS
    #define SQLOG_BUSY_TIMEOUT_MS 5000
#endif

// 负值表示 KiB（PRAGMA cache_size 语义），约 10MB
#ifndef SQLOG_CACHE_SIZE_KIB
    #define SQLOG_CACHE_SIZE_KIB 10000
#endif

// 256MB
#ifndef SQLOG_MMAP_SIZE
    #define SQLOG_MMAP_SIZE 268435456LL
#endif

// ===== 日志消息最大长度（snprintf 路径） =====
#ifndef SQLOG_MAX_MSG_LEN
    #define SQLOG_MAX_MSG_LEN 4096
#endif
