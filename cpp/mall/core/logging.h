#pragma once

#include <cstdio>

#ifndef MALL_ENABLE_LOGGING
#define MALL_ENABLE_LOGGING 0
#endif

#if MALL_ENABLE_LOGGING
#define MALL_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[mall] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define MALL_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[mall] warn: "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define MALL_LOG_DEBUG(...) do { } while (0)
#define MALL_LOG_WARN(...) do { } while (0)
#endif
