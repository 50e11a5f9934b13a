#pragma once

#include <cstdio>

#ifndef POLYSEQ_ENABLE_LOGGING
#define POLYSEQ_ENABLE_LOGGING 0
#endif

#if POLYSEQ_ENABLE_LOGGING
#define POLYSEQ_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define POLYSEQ_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define POLYSEQ_LOG_DEBUG(...) do { } while (0)
#define POLYSEQ_LOG_WARN(...) do { } while (0)
#endif
