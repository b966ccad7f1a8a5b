#pragma once

#include <cstdio>

#ifndef VGEDIT_ENABLE_LOGGING
#define VGEDIT_ENABLE_LOGGING 0
#endif

#if VGEDIT_ENABLE_LOGGING
#define VGEDIT_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[vgedit] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define VGEDIT_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[vgedit][warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define VGEDIT_LOG_DEBUG(...) do { } while (0)
#define VGEDIT_LOG_WARN(...) do { } while (0)
#endif
