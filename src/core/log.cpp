/// @file src/core/log.cpp
/// @brief Logging sink management and the default stderr sink.

#include "kdc/log.hpp"

#include <cstdio>

namespace kdc::log {

namespace {

void stderr_sink(Level level, std::string_view message) {
    fmt::print(stderr, "[kindecomp] {}: {}\n", to_string(level), message);
}

Sink& active_sink() {
    static Sink sink = stderr_sink;
    return sink;
}

Level& active_threshold() {
    static Level level = Level::Info;
    return level;
}

}  // namespace

const char* to_string(Level level) noexcept {
    switch (level) {
        case Level::Debug:   return "debug";
        case Level::Info:    return "info";
        case Level::Warning: return "warning";
        case Level::Error:   return "error";
    }
    return "unknown";
}

void set_sink(Sink sink) {
    active_sink() = sink ? std::move(sink) : Sink(stderr_sink);
}

void reset_sink() {
    active_sink() = stderr_sink;
}

void set_threshold(Level level) noexcept {
    active_threshold() = level;
}

Level threshold() noexcept {
    return active_threshold();
}

void emit(Level level, std::string_view message) noexcept {
    if (level < active_threshold()) {
        return;
    }
    try {
        active_sink()(level, message);
    } catch (const std::exception& ex) {
        // Report sink failures directly; the message itself is lost.
        std::fputs("[kindecomp] log sink failed: ", stderr);
        std::fputs(ex.what(), stderr);
        std::fputs("\n", stderr);
    }
}

}  // namespace kdc::log
