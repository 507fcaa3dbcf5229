#pragma once

// ===== 平台检测 =====
#if defined(__linux__)
    #define LUMINA_PLATFORM_LINUX 1
#elif defined(__APPLE__)
    #define LUMINA_PLATFORM_MACOS 1
#endif

#if !defined(LUMINA_PLATFORM_LINUX) && !defined(LUMINA_PLATFORM_MACOS)
    #error "lumina requires a POSIX platform"
#endif

// ===== 日志根目录 =====
#ifndef LUMINA_DEFAULT_LOG_ROOT
    #define LUMINA_DEFAULT_LOG_ROOT "./logs"
#endif

// ===== 日志保留策略 =====
#ifndef LUMINA_DEFAULT_RETENTION_DAYS
    #define LUMINA_DEFAULT_RETENTION_DAYS 30
#endif
#ifndef LUMINA_DEFAULT_SWEEP_INTERVAL_HOURS
    #define LUMINA_DEFAULT_SWEEP_INTERVAL_HOURS 24
#endif

// ===== 关闭等待超时 =====
#ifndef LUMINA_DEFAULT_SHUTDOWN_TIMEOUT_MS
    #define LUMINA_DEFAULT_SHUTDOWN_TIMEOUT_MS 5000
#endif

// ===== 文件写缓冲区大小 =====
#ifndef LUMINA_IO_BUFFER_SIZE
    #define LUMINA_IO_BUFFER_SIZE 8192
#endif
