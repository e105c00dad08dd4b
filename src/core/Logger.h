#pragma once

#include <stdarg.h>

/**
 * @file Logger.h
 * @brief Minimal levelled logger.
 *
 * Lines go to whatever sink the entry point installs (Serial on the board,
 * a capture buffer in tests). Nothing is printed until one is set.
 */

enum LogLevel {
    LOG_LEVEL_ERROR = 0,
    LOG_LEVEL_WARN = 1,
    LOG_LEVEL_INFO = 2,
    LOG_LEVEL_DEBUG = 3,
};

// Receives one formatted line, without trailing newline
typedef void (*LogSink)(const char* line);

class Logger {
public:
    static void SetLevel(LogLevel level) { _current_level = level; }
    static LogLevel Level() { return _current_level; }

    // Pass nullptr to silence output
    static void SetSink(LogSink sink) { _sink = sink; }

    static void Error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
    static void Warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
    static void Info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
    static void Debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

private:
    static void PrintFormatted(const char* level, const char* fmt, va_list args);

    static LogLevel _current_level;
    static LogSink _sink;
};
