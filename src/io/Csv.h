#pragma once

//
// Csv.h
// -----
// Just enough RFC 4180 for the two files the harness touches: the parameter
// spec (quoted value lists) and the trial log (quoted JSON).  Rows are one
// physical line each; a quoted field spanning lines is reported as malformed
// rather than stitched together.
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace patchprobe::io::csv {

struct Line {
  std::size_t number{0};  // 1-based, header included
  std::string text;
};

// Split `text` into lines.  `\r\n` endings are accepted and blank lines are
// skipped.  A trailing fragment without a newline is kept only when
// `keepUnterminated` is set: in a file another process appends to, it is a row
// the writer has not finished yet.
std::vector<Line> splitLines(std::string_view text, bool keepUnterminated);

// Split one row into fields.  nullopt for an unterminated quote or stray
// characters after a closing quote.
std::optional<std::vector<std::string>> splitRow(std::string_view row);

// Quote a field when it needs it (comma, quote, CR or LF inside), doubling any
// embedded quotes.
std::string quoteField(std::string_view field);

std::string joinRow(const std::vector<std::string>& fields);

std::string trim(std::string_view view);

// Whole-field decimal integer (surrounding whitespace allowed, optional sign).
std::optional<long long> parseInteger(std::string_view field);

}  // namespace patchprobe::io::csv
