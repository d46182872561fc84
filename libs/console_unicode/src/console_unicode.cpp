#include "dunetools/console_unicode.h"

#include <cctype>
#include <cstdio>
#include <cstdlib>

#if defined(_WIN32)
#include <windows.h>
#include <io.h>
#else
#include <langinfo.h>
#include <locale.h>
#include <strings.h>
#include <unistd.h>
#endif

namespace dunetools::console {

namespace {

Capabilities detect(Stream stream) {
    Capabilities caps;

#if defined(_WIN32)
    const bool err = stream == Stream::Stderr;
    caps.is_tty = _isatty(_fileno(err ? stderr : stdout)) != 0;
    HANDLE h = GetStdHandle(err ? STD_ERROR_HANDLE : STD_OUTPUT_HANDLE);
    DWORD mode = 0;
    const bool has_console = h != INVALID_HANDLE_VALUE && GetConsoleMode(h, &mode);
    caps.has_native_unicode_console = caps.is_tty && has_console;
    caps.utf8_configured = GetConsoleOutputCP() == 65001;
    auto* wt = std::getenv("WT_SESSION");
    caps.likely_emoji_ok = caps.has_native_unicode_console &&
                           (caps.utf8_configured || (wt && wt[0]));
#else
    caps.is_tty = isatty(stream == Stream::Stderr ? STDERR_FILENO : STDOUT_FILENO) != 0;
    setlocale(LC_CTYPE, "");
    const char* codeset = nl_langinfo(CODESET);
    caps.utf8_configured = codeset &&
                           (strcasecmp(codeset, "utf-8") == 0 || strcasecmp(codeset, "utf8") == 0);
    const char* term = std::getenv("TERM");
    const bool term_ok = term && term[0] && strcasecmp(term, "dumb") != 0;
    caps.likely_emoji_ok = caps.is_tty && caps.utf8_configured && term_ok;
#endif

    return caps;
}

} // namespace

Capabilities detect_capabilities(Stream stream) {
    static const Capabilities out_caps = detect(Stream::Stdout);
    static const Capabilities err_caps = detect(Stream::Stderr);
    return stream == Stream::Stderr ? err_caps : out_caps;
}

std::string to_ascii_fallback(std::string_view s, char replacement) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back(c < 0x80 ? static_cast<char>(c) : replacement);
    return out;
}

} // namespace dunetools::console
