#pragma once

// Edit-session diagnostics for cadstring: rejected edits and session
// transitions, written to stderr.
// Compiled out unless the build sets CADSTRING_ENABLE_LOGGING=1
// (CMake option of the same name).

#include <cstdio>

#ifndef CADSTRING_ENABLE_LOGGING
#define CADSTRING_ENABLE_LOGGING 0
#endif

#if CADSTRING_ENABLE_LOGGING
#define CADSTRING_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[cadstring] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define CADSTRING_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[cadstring] warning: "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define CADSTRING_LOG_DEBUG(...) do { } while (0)
#define CADSTRING_LOG_WARN(...) do { } while (0)
#endif
