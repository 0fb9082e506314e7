#pragma once

/// @file include/kdc/log.hpp
/// @brief Diagnostic logging for kindecomp, built on {fmt}.
///
/// # Module: Log
///
/// ## Responsibility
/// Report progress and anomalies (energy offset, critical ratio search,
/// clamping counts, pathological decompositions) without making them
/// fatal. Messages are formatted with `fmt::format` and handed to a sink.
///
/// The default sink prints `[kindecomp] <level>: <message>` to stderr for
/// messages at or above the threshold (default: Info). Tests replace the
/// sink to capture warnings.
///
/// ## Guarantees
/// - `write` never throws; a formatting failure drops the message
/// - Single-threaded: the sink and threshold are process-wide and unguarded

#include <fmt/format.h>

#include <exception>
#include <functional>
#include <string_view>
#include <utility>

namespace kdc::log {

enum class Level {
    Debug,
    Info,
    Warning,
    Error,
};

/// Convert Level to its lowercase name ("debug", "info", ...).
[[nodiscard]] const char* to_string(Level level) noexcept;

/// Receives every message at or above the threshold.
using Sink = std::function<void(Level, std::string_view)>;

/// Replace the active sink. An empty sink restores the default.
void set_sink(Sink sink);

/// Restore the default stderr sink.
void reset_sink();

/// Set the minimum level forwarded to the sink.
void set_threshold(Level level) noexcept;

[[nodiscard]] Level threshold() noexcept;

/// Forward an already formatted message to the sink (if above threshold).
void emit(Level level, std::string_view message) noexcept;

/// Format and emit a message.
template <typename... Args>
void write(Level level, fmt::format_string<Args...> format, Args&&... args) noexcept {
    if (level < threshold()) {
        return;
    }
    try {
        emit(level, fmt::format(format, std::forward<Args>(args)...));
    } catch (const std::exception&) {
        emit(Level::Error, "log message could not be formatted");
    }
}

template <typename... Args>
void debug(fmt::format_string<Args...> format, Args&&... args) noexcept {
    write(Level::Debug, format, std::forward<Args>(args)...);
}

template <typename... Args>
void info(fmt::format_string<Args...> format, Args&&... args) noexcept {
    write(Level::Info, format, std::forward<Args>(args)...);
}

template <typename... Args>
void warning(fmt::format_string<Args...> format, Args&&... args) noexcept {
    write(Level::Warning, format, std::forward<Args>(args)...);
}

template <typename... Args>
void error(fmt::format_string<Args...> format, Args&&... args) noexcept {
    write(Level::Error, format, std::forward<Args>(args)...);
}

}  // namespace kdc::log
