#include "io/Csv.h"

#include <charconv>

namespace patchprobe::io::csv {

std::vector<Line> splitLines(std::string_view text, bool keepUnterminated) {
  std::vector<Line> lines;
  std::size_t start = 0;
  std::size_t number = 0;
  while (start < text.size()) {
    std::size_t newline = text.find('\n', start);
    if (newline == std::string_view::npos) {
      if (!keepUnterminated) {
        break;
      }
      newline = text.size();
    }
    ++number;
    std::string_view raw = text.substr(start, newline - start);
    if (!raw.empty() && raw.back() == '\r') {
      raw.remove_suffix(1);
    }
    if (!trim(raw).empty()) {
      lines.push_back(Line{number, std::string(raw)});
    }
    start = newline + 1;
  }
  return lines;
}

std::optional<std::vector<std::string>> splitRow(std::string_view row) {
  std::vector<std::string> fields;
  std::string current;
  bool inQuotes = false;
  bool afterQuote = false;

  for (std::size_t i = 0; i < row.size(); ++i) {
    const char ch = row[i];
    if (inQuotes) {
      if (ch == '"') {
        if (i + 1 < row.size() && row[i + 1] == '"') {
          current.push_back('"');
          ++i;
        } else {
          inQuotes = false;
          afterQuote = true;
        }
      } else {
        current.push_back(ch);
      }
      continue;
    }

    if (ch == ',') {
      fields.push_back(std::move(current));
      current.clear();
      afterQuote = false;
      continue;
    }
    if (afterQuote) {
      if (ch == ' ' || ch == '\t') {
        continue;
      }
      return std::nullopt;
    }
    if (ch == '"' && trim(current).empty()) {
      current.clear();
      inQuotes = true;
      continue;
    }
    current.push_back(ch);
  }

  if (inQuotes) {
    return std::nullopt;
  }
  fields.push_back(std::move(current));
  return fields;
}

std::string quoteField(std::string_view field) {
  if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
    return std::string(field);
  }
  std::string out;
  out.reserve(field.size() + 2);
  out.push_back('"');
  for (const char ch : field) {
    if (ch == '"') {
      out.push_back('"');
    }
    out.push_back(ch);
  }
  out.push_back('"');
  return out;
}

std::string joinRow(const std::vector<std::string>& fields) {
  std::string out;
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) {
      out.push_back(',');
    }
    out += quoteField(fields[i]);
  }
  return out;
}

std::string trim(std::string_view view) {
  const auto begin = view.find_first_not_of(" \t\r\n");
  if (begin == std::string_view::npos) {
    return {};
  }
  const auto end = view.find_last_not_of(" \t\r\n");
  return std::string(view.substr(begin, end - begin + 1));
}

std::optional<long long> parseInteger(std::string_view field) {
  const std::string cleaned = trim(field);
  if (cleaned.empty()) {
    return std::nullopt;
  }
  const char* first = cleaned.data();
  const char* last = cleaned.data() + cleaned.size();
  if (*first == '+') {
    ++first;
  }
  long long value = 0;
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

}  // namespace patchprobe::io::csv
