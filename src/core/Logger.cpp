#include "Logger.h"

#include <stdio.h>

LogLevel Logger::_current_level = LOG_LEVEL_INFO;
LogSink Logger::_sink = nullptr;

void Logger::Error(const char* fmt, ...) {
    if (_current_level < LOG_LEVEL_ERROR) return;
    va_list args;
    va_start(args, fmt);
    PrintFormatted("E", fmt, args);
    va_end(args);
}

void Logger::Warn(const char* fmt, ...) {
    if (_current_level < LOG_LEVEL_WARN) return;
    va_list args;
    va_start(args, fmt);
    PrintFormatted("W", fmt, args);
    va_end(args);
}

void Logger::Info(const char* fmt, ...) {
    if (_current_level < LOG_LEVEL_INFO) return;
    va_list args;
    va_start(args, fmt);
    PrintFormatted("I", fmt, args);
    va_end(args);
}

void Logger::Debug(const char* fmt, ...) {
    if (_current_level < LOG_LEVEL_DEBUG) return;
    va_list args;
    va_start(args, fmt);
    PrintFormatted("D", fmt, args);
    va_end(args);
}

void Logger::PrintFormatted(const char* level, const char* fmt, va_list args) {
    if (!_sink) return;
    char buffer[256];
    int prefix = snprintf(buffer, sizeof(buffer), "[%s] ", level);
    if (prefix < 0) return;
    vsnprintf(buffer + prefix, sizeof(buffer) - prefix, fmt, args);
    _sink(buffer);
}
