#include "dunetools/console_unicode.h"

#include <gtest/gtest.h>

using dunetools::console::to_ascii_fallback;

TEST(ConsoleUnicode, AsciiPassesThrough) {
    EXPECT_EQ(to_ascii_fallback("Tuek's Sietch"), "Tuek's Sietch");
}

TEST(ConsoleUnicode, MultiByteSequencesAreReplacedPerByte) {
    // U+00E9 is two bytes in UTF-8.
    EXPECT_EQ(to_ascii_fallback("caf\xc3\xa9"), "caf??");
    EXPECT_EQ(to_ascii_fallback("\xc3\xa9", '_'), "__");
}

TEST(ConsoleUnicode, DetectionIsCached) {
    const auto a = dunetools::console::detect_capabilities(dunetools::console::Stream::Stderr);
    const auto b = dunetools::console::detect_capabilities(dunetools::console::Stream::Stderr);
    EXPECT_EQ(a.is_tty, b.is_tty);
    EXPECT_EQ(a.utf8_configured, b.utf8_configured);
    EXPECT_EQ(a.likely_emoji_ok, b.likely_emoji_ok);
}
