#ifndef KINDLING_HELPERS_STRINGS_HPP
#define KINDLING_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief String helpers for parsing subprocess output.
 *
 * Docker, kind and kubectl all report through line-oriented text. These
 * helpers trim, split and search that text without pulling in a regex engine.
 */

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace kindling {
namespace helpers {
namespace strings {

/* ----------------------------- Predicates ----------------------------- */

/// True for space, tab, CR and LF.
[[nodiscard]] constexpr bool isSpace(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

/// True when @p haystack contains @p needle.
[[nodiscard]] inline bool contains(std::string_view haystack, std::string_view needle) noexcept {
  return haystack.find(needle) != std::string_view::npos;
}

/// Case-insensitive ASCII equality.
[[nodiscard]] inline bool iequals(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

/* ----------------------------- Manipulation ----------------------------- */

/// View of @p s without leading or trailing whitespace.
[[nodiscard]] inline std::string_view trim(std::string_view s) noexcept {
  std::size_t begin = 0;
  std::size_t end = s.size();
  while (begin < end && isSpace(s[begin])) {
    ++begin;
  }
  while (end > begin && isSpace(s[end - 1])) {
    --end;
  }
  return s.substr(begin, end - begin);
}

/// Lower-cased ASCII copy.
[[nodiscard]] inline std::string toLower(std::string_view s) {
  std::string out(s);
  for (char& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

/// Non-empty trimmed lines of @p text.
[[nodiscard]] inline std::vector<std::string> splitLines(std::string_view text) {
  std::vector<std::string> out;
  std::size_t pos = 0;
  while (pos <= text.size()) {
    std::size_t nl = text.find('\n', pos);
    if (nl == std::string_view::npos) {
      nl = text.size();
    }
    const std::string_view LINE = trim(text.substr(pos, nl - pos));
    if (!LINE.empty()) {
      out.emplace_back(LINE);
    }
    pos = nl + 1;
  }
  return out;
}

/// Whitespace separated tokens of @p text.
[[nodiscard]] inline std::vector<std::string> splitWhitespace(std::string_view text) {
  std::vector<std::string> out;
  std::size_t i = 0;
  while (i < text.size()) {
    while (i < text.size() && isSpace(text[i])) {
      ++i;
    }
    const std::size_t START = i;
    while (i < text.size() && !isSpace(text[i])) {
      ++i;
    }
    if (i > START) {
      out.emplace_back(text.substr(START, i - START));
    }
  }
  return out;
}

/// Last @p count lines of @p text, joined with newlines.
[[nodiscard]] inline std::string tailLines(std::string_view text, std::size_t count) {
  const std::vector<std::string> LINES = splitLines(text);
  std::string out;
  const std::size_t FIRST = LINES.size() > count ? LINES.size() - count : 0;
  for (std::size_t i = FIRST; i < LINES.size(); ++i) {
    out += LINES[i];
    out += '\n';
  }
  return out;
}

/**
 * @brief Escape a string for embedding in a JSON string literal.
 *
 * Handles quote, backslash and control characters. Non-ASCII bytes pass
 * through unchanged.
 */
[[nodiscard]] inline std::string jsonEscape(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (const char C : s) {
    switch (C) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(C) < 0x20) {
        static constexpr char HEX[] = "0123456789abcdef";
        out += "\\u00";
        out += HEX[(C >> 4) & 0x0F];
        out += HEX[C & 0x0F];
      } else {
        out += C;
      }
    }
  }
  return out;
}

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Find the first dotted-quad IPv4 address in @p text.
 * @return Address text, or empty string when none is present.
 */
[[nodiscard]] inline std::string findIpv4(std::string_view text) {
  std::size_t i = 0;
  while (i < text.size()) {
    if (!std::isdigit(static_cast<unsigned char>(text[i])) ||
        (i > 0 && (std::isdigit(static_cast<unsigned char>(text[i - 1])) || text[i - 1] == '.'))) {
      ++i;
      continue;
    }

    std::size_t j = i;
    int octets = 0;
    bool valid = true;
    while (octets < 4) {
      const std::size_t DIGITS_START = j;
      int value = 0;
      while (j < text.size() && std::isdigit(static_cast<unsigned char>(text[j])) &&
             j - DIGITS_START < 3) {
        value = value * 10 + (text[j] - '0');
        ++j;
      }
      if (j == DIGITS_START || value > 255) {
        valid = false;
        break;
      }
      ++octets;
      if (octets < 4) {
        if (j >= text.size() || text[j] != '.') {
          valid = false;
          break;
        }
        ++j;
      }
    }

    if (valid && (j >= text.size() || !std::isdigit(static_cast<unsigned char>(text[j])))) {
      return std::string(text.substr(i, j - i));
    }
    ++i;
  }
  return {};
}

} // namespace strings
} // namespace helpers
} // namespace kindling

#endif // KINDLING_HELPERS_STRINGS_HPP
