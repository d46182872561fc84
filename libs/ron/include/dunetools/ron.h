#pragma once

#include <cstddef>
#include <filesystem>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "dunetools/board.h"

namespace dunetools::ron {

// ParseError reports a rejected document with a 1-based position.
class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& message, size_t line, size_t column);

    [[nodiscard]] size_t line() const { return line_; }
    [[nodiscard]] size_t column() const { return column_; }

private:
    size_t line_;
    size_t column_;
};

// FormatFloat writes the shortest digits that read back to the same double.
// Decimal exponents from -4 to 15 print in fixed notation with at least one
// fractional digit ("1.0", "100000.0", "0.0001"), others in scientific
// notation ("1e-05", "1e+16").
std::string format_float(double v);

// Write emits the location document: one record per location in model
// order, tab indentation per nesting level, a trailing comma after every
// list and map entry.
void write(std::ostream& w, const board::LocationModel& model);

// ToString renders the whole document in memory.
std::string to_string(const board::LocationModel& model);

// WriteFile renders the document, writes it to "<path>.tmp" and renames it
// over path. On failure the destination is left untouched and the temporary
// file removed. Throws std::system_error.
void write_file(const std::filesystem::path& path, const board::LocationModel& model);

// Parse reads a location document back into a model. Whitespace and
// comments are insignificant and trailing commas are optional. Throws
// ParseError.
board::LocationModel parse(std::string_view text);

// ReadFile loads and parses path. Throws std::system_error or ParseError.
board::LocationModel read_file(const std::filesystem::path& path);

} // namespace dunetools::ron
