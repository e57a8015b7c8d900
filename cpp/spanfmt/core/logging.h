#pragma once

#include <cstdio>

#ifndef SPANFMT_ENABLE_LOGGING
#define SPANFMT_ENABLE_LOGGING 0
#endif

#if SPANFMT_ENABLE_LOGGING
#define SPANFMT_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[spanfmt] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define SPANFMT_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[spanfmt] warning: "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define SPANFMT_LOG_DEBUG(...) do { } while (0)
#define SPANFMT_LOG_WARN(...) do { } while (0)
#endif
