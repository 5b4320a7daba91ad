#pragma once

#include <cstdio>

#ifndef RESTORE_ENABLE_LOGGING
#define RESTORE_ENABLE_LOGGING 0
#endif

#if RESTORE_ENABLE_LOGGING
#define RESTORE_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[restore] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define RESTORE_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[restore] warn: "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define RESTORE_LOG_DEBUG(...) do { } while (0)
#define RESTORE_LOG_WARN(...) do { } while (0)
#endif
