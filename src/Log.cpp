// Log.cpp – Process-wide log level and sink.

#include "MOTCodec/Log.hpp"

#include <fmt/core.h>

#include <cstdio>

namespace mot {

namespace {

LogLevel g_level = LogLevel::Warning;

void stderrSink(LogLevel level, std::string_view message) {
    fmt::print(stderr, "[mot] {}: {}\n", logLevelName(level), message);
}

LogSink& sink() {
    static LogSink s = stderrSink;
    return s;
}

} // namespace

void setLogSink(LogSink s) {
    sink() = s ? std::move(s) : LogSink(stderrSink);
}

void setLogLevel(LogLevel level) noexcept { g_level = level; }

LogLevel logLevel() noexcept { return g_level; }

std::string_view logLevelName(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Debug:   return "debug";
    case LogLevel::Info:    return "info";
    case LogLevel::Warning: return "warning";
    case LogLevel::Error:   return "error";
    case LogLevel::Off:     return "off";
    }
    return "?";
}

bool logEnabled(LogLevel level) noexcept {
    return level != LogLevel::Off && level >= g_level;
}

namespace detail {

void emit(LogLevel level, std::string_view message) {
    sink()(level, message);
}

} // namespace detail

} // namespace mot
