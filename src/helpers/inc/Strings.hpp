#ifndef SWAPCHECK_HELPERS_STRINGS_HPP
#define SWAPCHECK_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief String view helpers for parsing command output and option values.
 *
 * All functions work on non-owning std::string_view and never allocate,
 * except splitWhitespace() which returns a vector of views.
 */

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>
#include <vector>

namespace swapcheck {
namespace helpers {
namespace strings {

/* ----------------------------- Classification ----------------------------- */

/// True for space, tab, CR, LF, vertical tab and form feed.
[[nodiscard]] constexpr bool isSpace(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

/// True for '0'..'9'.
[[nodiscard]] constexpr bool isDigit(char c) noexcept { return c >= '0' && c <= '9'; }

/// True if the view is non-empty and made of decimal digits only.
[[nodiscard]] constexpr bool isUnsignedInteger(std::string_view s) noexcept {
  if (s.empty()) {
    return false;
  }
  for (const char C : s) {
    if (!isDigit(C)) {
      return false;
    }
  }
  return true;
}

/* ----------------------------- Trimming ----------------------------- */

/// Strip leading whitespace.
[[nodiscard]] constexpr std::string_view trimLeft(std::string_view s) noexcept {
  std::size_t i = 0;
  while (i < s.size() && isSpace(s[i])) {
    ++i;
  }
  return s.substr(i);
}

/// Strip trailing whitespace (including newlines and carriage returns).
[[nodiscard]] constexpr std::string_view trimRight(std::string_view s) noexcept {
  std::size_t len = s.size();
  while (len > 0 && isSpace(s[len - 1])) {
    --len;
  }
  return s.substr(0, len);
}

/// Strip whitespace on both sides.
[[nodiscard]] constexpr std::string_view trim(std::string_view s) noexcept {
  return trimRight(trimLeft(s));
}

/// True if the view is empty or whitespace only.
[[nodiscard]] constexpr bool isBlank(std::string_view s) noexcept { return trim(s).empty(); }

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Parse a decimal unsigned integer.
 * @param s Digits only; empty parses as zero.
 * @param out Parsed value (unchanged on failure).
 * @return false on non-digit characters or overflow.
 */
[[nodiscard]] constexpr bool parseUint64(std::string_view s, std::uint64_t& out) noexcept {
  constexpr std::uint64_t MAX = std::numeric_limits<std::uint64_t>::max();
  std::uint64_t val = 0;
  for (const char C : s) {
    if (!isDigit(C)) {
      return false;
    }
    const auto DIGIT = static_cast<std::uint64_t>(C - '0');
    if (val > (MAX - DIGIT) / 10) {
      return false;
    }
    val = val * 10 + DIGIT;
  }
  out = val;
  return true;
}

/* ----------------------------- Splitting ----------------------------- */

/// Split on runs of whitespace, dropping empty fields.
[[nodiscard]] inline std::vector<std::string_view> splitWhitespace(std::string_view s) {
  std::vector<std::string_view> fields;
  std::size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && isSpace(s[i])) {
      ++i;
    }
    const std::size_t START = i;
    while (i < s.size() && !isSpace(s[i])) {
      ++i;
    }
    if (i > START) {
      fields.push_back(s.substr(START, i - START));
    }
  }
  return fields;
}

/**
 * @brief Visit each line of a text blob.
 * @tparam F Callable taking std::string_view (line without its '\n').
 * @note A trailing newline does not produce an extra empty line.
 */
template <typename F> inline void forEachLine(std::string_view text, F&& visit) {
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t EOL = text.find('\n', pos);
    if (EOL == std::string_view::npos) {
      visit(text.substr(pos));
      return;
    }
    visit(text.substr(pos, EOL - pos));
    pos = EOL + 1;
  }
}

} // namespace strings
} // namespace helpers
} // namespace swapcheck

#endif // SWAPCHECK_HELPERS_STRINGS_HPP
