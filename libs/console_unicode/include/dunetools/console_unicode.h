#pragma once

#include <string>
#include <string_view>

namespace dunetools::console {

enum class Stream { Stdout, Stderr };

// Capabilities of one standard stream's terminal.
struct Capabilities {
    bool is_tty = false;
    bool utf8_configured = false;
    bool has_native_unicode_console = false;
    bool likely_emoji_ok = false;
};

// Detected once per stream and cached.
Capabilities detect_capabilities(Stream stream = Stream::Stderr);

// Replaces every non-ASCII byte with replacement.
std::string to_ascii_fallback(std::string_view s, char replacement = '?');

} // namespace dunetools::console
