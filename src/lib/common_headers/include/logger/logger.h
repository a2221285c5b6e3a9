/** This is based on my EasyLib logger. */
#pragma once

#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>

// NOTE These are globally configurable parameters. Having these as macros
//      means there is no performance overhead for unused logging (assuming
//      effective dead code elimination).
#ifndef LOGGER_STREAM
#define LOGGER_STREAM stderr
#endif
#ifndef LOGGER_COMPILER_LEVEL
#define LOGGER_COMPILER_LEVEL LOGGER_LEVEL_TRACE
#endif

// NOTE If you change the order of these levels, you need to change the
//      LOGGER_LEVEL_STRINGS too.
enum LoggerLevel {
    LOGGER_LEVEL_VERBOSE = 0,
    LOGGER_LEVEL_TRACE = 1,
    LOGGER_LEVEL_DEBUG = 2,
    LOGGER_LEVEL_INFO = 3,
    LOGGER_LEVEL_WARN = 4,
    LOGGER_LEVEL_ERROR = 5,
    LOGGER_LEVEL_FATAL = 6,
};

// NOTE This is mutable by programs and tests. It is a single variable
//      shared across translation units.
inline LoggerLevel LOGGER_LEVEL = LOGGER_LEVEL_INFO;

inline char const *const LOGGER_LEVEL_STRINGS[] =
    {"VERBOSE", "TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};

static inline bool
logger_enabled(LoggerLevel const log_level)
{
    return log_level >= LOGGER_COMPILER_LEVEL && log_level >= LOGGER_LEVEL;
}

/// @note   I capture errno outside of this function because any standard
///         library call (e.g. printf) can change the value of errno.
static inline void
_logger(FILE *const stream,
        LoggerLevel const log_level,
        int const errno_,
        char const *const file,
        int const line,
        char const *const format,
        ...)
{
    if (!logger_enabled(log_level)) {
        return;
    }
    std::time_t t = std::time(nullptr);
    std::tm tm = *std::localtime(&t);
    std::fprintf(stream,
                 "[%s] [%d-%02d-%02d %02d:%02d:%02d] [ %s:%d ] ",
                 LOGGER_LEVEL_STRINGS[log_level],
                 tm.tm_year + 1900,
                 tm.tm_mon + 1,
                 tm.tm_mday,
                 tm.tm_hour,
                 tm.tm_min,
                 tm.tm_sec,
                 file,
                 line);
    // NOTE Only print errno when it is set, otherwise every line of the
    //      list dumps carries a useless "Success".
    if (errno_ != 0) {
        std::fprintf(stream, "[errno %d: %s] ", errno_, std::strerror(errno_));
    }
    std::va_list ap;
    va_start(ap, format);
    std::vfprintf(stream, format, ap);
    va_end(ap);
    std::fprintf(stream, "\n");
    std::fflush(stream);
}

#define LOGGER_LOG(level, ...)                                                 \
    _logger(LOGGER_STREAM, (level), errno, __FILE__, __LINE__, __VA_ARGS__)

#define LOGGER_VERBOSE(...) LOGGER_LOG(LOGGER_LEVEL_VERBOSE, __VA_ARGS__)
#define LOGGER_TRACE(...)   LOGGER_LOG(LOGGER_LEVEL_TRACE, __VA_ARGS__)
#define LOGGER_DEBUG(...)   LOGGER_LOG(LOGGER_LEVEL_DEBUG, __VA_ARGS__)
#define LOGGER_INFO(...)    LOGGER_LOG(LOGGER_LEVEL_INFO, __VA_ARGS__)
#define LOGGER_WARN(...)    LOGGER_LOG(LOGGER_LEVEL_WARN, __VA_ARGS__)
#define LOGGER_ERROR(...)   LOGGER_LOG(LOGGER_LEVEL_ERROR, __VA_ARGS__)
#define LOGGER_FATAL(...)   LOGGER_LOG(LOGGER_LEVEL_FATAL, __VA_ARGS__)
