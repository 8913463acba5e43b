#pragma once

#include <cstdio>

#ifndef GRIDCORE_ENABLE_LOGGING
#define GRIDCORE_ENABLE_LOGGING 0
#endif

#if GRIDCORE_ENABLE_LOGGING
#define GRIDCORE_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[gridcore] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define GRIDCORE_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[gridcore] warning: "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define GRIDCORE_LOG_DEBUG(...) do { } while (0)
#define GRIDCORE_LOG_WARN(...) do { } while (0)
#endif
