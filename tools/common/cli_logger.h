#pragma once

#include <algorithm>
#include <iostream>
#include <utility>

#include "dunetools/console_unicode.h"

namespace dunetools::log {

enum class VerbosityLevel : int { Quiet = 0, Verbose = 1, Debug = 2 };

inline VerbosityLevel current_level = VerbosityLevel::Quiet;

inline void set_verbosity(int level) {
    level = std::clamp(level, 0, 2);
    current_level = static_cast<VerbosityLevel>(level);
}

inline bool debug_enabled() { return current_level >= VerbosityLevel::Debug; }

constexpr const char* level_name(VerbosityLevel level) {
    switch (level) {
        case VerbosityLevel::Quiet: return "QUIET";
        case VerbosityLevel::Verbose: return "VERBOSE";
        case VerbosityLevel::Debug: return "DEBUG";
    }
    return "VERBOSE";
}

constexpr const char* level_emoji(VerbosityLevel level) {
    switch (level) {
        case VerbosityLevel::Quiet: return "🔇";
        case VerbosityLevel::Verbose: return "🔈";
        case VerbosityLevel::Debug: return "🐞";
    }
    return "🔈";
}

// Diagnostics go to stderr, so that is the terminal that matters.
inline bool supports_utf() {
    static const bool value = []() {
        auto caps = console::detect_capabilities(console::Stream::Stderr);
        return caps.has_native_unicode_console || caps.utf8_configured;
    }();
    return value;
}

template <typename... Args>
void write_fields(std::ostream& stream, Args&&... args) {
    if constexpr (sizeof...(Args) > 0) {
        ((stream << std::forward<Args>(args) << ' '), ...);
    }
    stream << '\n';
}

template <typename... Args>
void log_impl(VerbosityLevel min_level, Args&&... args) {
    if (current_level < min_level) return;
    auto& stream = std::cerr;
    if (supports_utf())
        stream << '[' << level_emoji(min_level) << "] ";
    else
        stream << '[' << level_name(min_level) << "] ";
    write_fields(stream, std::forward<Args>(args)...);
}

template <typename... Args>
void info(Args&&... args) {
    log_impl(VerbosityLevel::Verbose, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(Args&&... args) {
    log_impl(VerbosityLevel::Debug, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(Args&&... args) {
    auto& stream = std::cerr;
    stream << (supports_utf() ? "⚠️ " : "[WARN] ");
    write_fields(stream, std::forward<Args>(args)...);
}

template <typename... Args>
void error(Args&&... args) {
    auto& stream = std::cerr;
    stream << (supports_utf() ? "❌ " : "[ERROR] ");
    write_fields(stream, std::forward<Args>(args)...);
}

// Plain lines for tool output proper (usage text, summaries).
template <typename... Args> void print(Args&&... args) {
    write_fields(std::cout, std::forward<Args>(args)...);
}

} // namespace dunetools::log

namespace dunetools::cli {
    using namespace dunetools::log;
}

#define LOGI(...) ::dunetools::log::info(__VA_ARGS__)
#define LOGW(...) ::dunetools::log::warn(__VA_ARGS__)
#define LOGE(...) ::dunetools::log::error(__VA_ARGS__)
#define LOGD(...) ::dunetools::log::debug(__VA_ARGS__)
