#pragma once
// Log.hpp – Leveled diagnostics for the MOT decoder.
//
// Messages are formatted with fmt and handed to a single process-wide sink.
// The default sink prints "[mot] <level>: <message>" to stderr for warnings
// and errors; install your own with setLogSink() before decoding.
//
//   mot::setLogLevel(mot::LogLevel::Debug);
//   mot::logDebug("segment {} of transport id {}", idx, tid);

#include <fmt/format.h>

#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace mot {

enum class LogLevel { Debug, Info, Warning, Error, Off };

using LogSink = std::function<void(LogLevel, std::string_view)>;

// Replace the sink. An empty function restores the stderr sink.
void setLogSink(LogSink sink);

void     setLogLevel(LogLevel level) noexcept;
LogLevel logLevel() noexcept;

// True if a message at `level` would reach the sink. Guard log calls whose
// arguments are costly to build.
bool logEnabled(LogLevel level) noexcept;

std::string_view logLevelName(LogLevel level) noexcept;

namespace detail {
void emit(LogLevel level, std::string_view message);

template <typename... Args>
void log(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
    if (!logEnabled(level)) return;
    emit(level, fmt::format(format, std::forward<Args>(args)...));
}
} // namespace detail

template <typename... Args>
void logDebug(fmt::format_string<Args...> format, Args&&... args) {
    detail::log(LogLevel::Debug, format, std::forward<Args>(args)...);
}

template <typename... Args>
void logInfo(fmt::format_string<Args...> format, Args&&... args) {
    detail::log(LogLevel::Info, format, std::forward<Args>(args)...);
}

template <typename... Args>
void logWarning(fmt::format_string<Args...> format, Args&&... args) {
    detail::log(LogLevel::Warning, format, std::forward<Args>(args)...);
}

template <typename... Args>
void logError(fmt::format_string<Args...> format, Args&&... args) {
    detail::log(LogLevel::Error, format, std::forward<Args>(args)...);
}

} // namespace mot
