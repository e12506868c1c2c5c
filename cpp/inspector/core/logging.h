#pragma once

#include <cstdio>

#ifndef INSPECTOR_ENABLE_LOGGING
#define INSPECTOR_ENABLE_LOGGING 0
#endif

#if INSPECTOR_ENABLE_LOGGING
#define INSPECTOR_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[inspector] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define INSPECTOR_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[inspector] warn: "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define INSPECTOR_LOG_ERROR(...) \
    do { \
        std::fprintf(stderr, "[inspector] error: "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define INSPECTOR_LOG_DEBUG(...) do { } while (0)
#define INSPECTOR_LOG_WARN(...) do { } while (0)
#define INSPECTOR_LOG_ERROR(...) do { } while (0)
#endif
