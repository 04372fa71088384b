#pragma once

#include <cstdio>

#ifndef CHRONOLINE_ENABLE_LOGGING
#define CHRONOLINE_ENABLE_LOGGING 0
#endif

#if CHRONOLINE_ENABLE_LOGGING
#define CHRONOLINE_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[DEBUG] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define CHRONOLINE_LOG_TRACE(...) \
    do { \
        std::fprintf(stderr, "[TRACE] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define CHRONOLINE_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[WARN] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define CHRONOLINE_LOG_DEBUG(...) do { } while (0)
#define CHRONOLINE_LOG_TRACE(...) do { } while (0)
#define CHRONOLINE_LOG_WARN(...) do { } while (0)
#endif
