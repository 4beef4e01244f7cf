#ifndef AWGCHECK_HELPERS_STRINGS_HPP
#define AWGCHECK_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief String helpers for parsing command output and building shell commands.
 *
 * All inputs come from short command outputs or config files, so helpers work
 * on std::string / std::string_view and favour clarity over zero allocation.
 */

#include <cctype>
#include <cstdint>
#include <cstdlib> // strtoll
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace awgcheck {
namespace helpers {
namespace strings {

/* ----------------------------- Trimming ----------------------------- */

/// True for the whitespace characters found in command output and .env files.
[[nodiscard]] inline bool isSpace(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

/**
 * @brief View of @p s without leading and trailing whitespace.
 * @note The result aliases @p s.
 */
[[nodiscard]] inline std::string_view trim(std::string_view s) noexcept {
  std::size_t begin = 0;
  while (begin < s.size() && isSpace(s[begin])) {
    ++begin;
  }
  std::size_t end = s.size();
  while (end > begin && isSpace(s[end - 1])) {
    --end;
  }
  return s.substr(begin, end - begin);
}

/* ----------------------------- Case ----------------------------- */

/// ASCII lower-case copy.
[[nodiscard]] inline std::string toLower(std::string_view s) {
  std::string out(s);
  for (char& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

/**
 * @brief Case-insensitive (ASCII) substring test.
 * @param haystack Text to search.
 * @param needle   Lower-case needle.
 */
[[nodiscard]] inline bool containsIgnoreCase(std::string_view haystack,
                                             std::string_view needle) {
  return toLower(haystack).find(needle) != std::string::npos;
}

/// True if @p s starts with @p prefix.
[[nodiscard]] inline bool startsWith(std::string_view s, std::string_view prefix) noexcept {
  return s.substr(0, prefix.size()) == prefix;
}

/* ----------------------------- Splitting ----------------------------- */

/**
 * @brief Split text into lines on '\n', dropping a trailing '\r' from each line.
 *
 * A final empty line after the last newline is not returned.
 */
[[nodiscard]] inline std::vector<std::string_view> splitLines(std::string_view text) {
  std::vector<std::string_view> lines;
  std::size_t start = 0;
  while (start < text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    std::string_view line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.push_back(line);
    start = end + 1;
  }
  return lines;
}

/**
 * @brief Split on runs of whitespace (awk-style fields).
 */
[[nodiscard]] inline std::vector<std::string_view> splitFields(std::string_view line) {
  std::vector<std::string_view> fields;
  std::size_t i = 0;
  while (i < line.size()) {
    while (i < line.size() && isSpace(line[i])) {
      ++i;
    }
    const std::size_t START = i;
    while (i < line.size() && !isSpace(line[i])) {
      ++i;
    }
    if (i > START) {
      fields.push_back(line.substr(START, i - START));
    }
  }
  return fields;
}

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Parse a whole string as a signed decimal integer.
 * @return Value, or nullopt if @p s (after trimming) is empty, has a sign-only
 *         body, or contains anything but digits.
 */
[[nodiscard]] inline std::optional<std::int64_t> parseInt64(std::string_view s) {
  const std::string_view BODY = trim(s);
  if (BODY.empty()) {
    return std::nullopt;
  }
  std::size_t i = (BODY[0] == '-' || BODY[0] == '+') ? 1 : 0;
  if (i == BODY.size()) {
    return std::nullopt;
  }
  for (; i < BODY.size(); ++i) {
    if (BODY[i] < '0' || BODY[i] > '9') {
      return std::nullopt;
    }
  }
  const std::string COPY(BODY);
  return static_cast<std::int64_t>(std::strtoll(COPY.c_str(), nullptr, 10));
}

/* ----------------------------- Quoting ----------------------------- */

/**
 * @brief Quote a value for safe interpolation into a POSIX shell command.
 *
 * Wraps in single quotes; embedded single quotes become '\''.
 */
[[nodiscard]] inline std::string shellQuote(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('\'');
  for (const char C : s) {
    if (C == '\'') {
      out.append("'\\''");
    } else {
      out.push_back(C);
    }
  }
  out.push_back('\'');
  return out;
}

/**
 * @brief Escape a string for inclusion in a JSON string literal (without quotes).
 */
[[nodiscard]] inline std::string jsonEscape(std::string_view s) {
  static constexpr char HEX[] = "0123456789abcdef";
  std::string out;
  out.reserve(s.size());
  for (const char C : s) {
    switch (C) {
    case '"':
      out.append("\\\"");
      break;
    case '\\':
      out.append("\\\\");
      break;
    case '\n':
      out.append("\\n");
      break;
    case '\r':
      out.append("\\r");
      break;
    case '\t':
      out.append("\\t");
      break;
    default:
      if (static_cast<unsigned char>(C) < 0x20) {
        out.append("\\u00");
        out.push_back(HEX[(static_cast<unsigned char>(C) >> 4) & 0xF]);
        out.push_back(HEX[static_cast<unsigned char>(C) & 0xF]);
      } else {
        out.push_back(C);
      }
    }
  }
  return out;
}

} // namespace strings
} // namespace helpers
} // namespace awgcheck

#endif // AWGCHECK_HELPERS_STRINGS_HPP
