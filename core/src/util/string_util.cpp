#include "string_util.h"

#include <cstdint>

#include <unicode/locid.h>
#include <unicode/unistr.h>

namespace jpx::util {

namespace {

bool is_ascii_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool is_continuation(unsigned char c) {
  return (c & 0xC0) == 0x80;
}

/// ASCII-only and malformed text keep the byte-wise ASCII mapping.
bool needs_unicode_mapping(std::string_view s) {
  bool has_non_ascii = false;
  for (char c : s) {
    if (static_cast<unsigned char>(c) >= 0x80) {
      has_non_ascii = true;
      break;
    }
  }
  return has_non_ascii && s.size() <= static_cast<size_t>(INT32_MAX) && is_valid_utf8(s);
}

icu::UnicodeString from_utf8(std::string_view s) {
  return icu::UnicodeString::fromUTF8(
      icu::StringPiece(s.data(), static_cast<int32_t>(s.size())));
}

}  // namespace

std::string to_lower(std::string_view s) {
  if (!needs_unicode_mapping(s)) {
    std::string out(s);
    for (char& c : out) {
      if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
  }
  icu::UnicodeString text = from_utf8(s);
  text.toLower(icu::Locale::getRoot());
  std::string out;
  text.toUTF8String(out);
  return out;
}

std::string to_upper(std::string_view s) {
  if (!needs_unicode_mapping(s)) {
    std::string out(s);
    for (char& c : out) {
      if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    }
    return out;
  }
  icu::UnicodeString text = from_utf8(s);
  text.toUpper(icu::Locale::getRoot());
  std::string out;
  text.toUTF8String(out);
  return out;
}

std::string trim_ws(std::string_view s) {
  size_t start = 0;
  while (start < s.size() && is_ascii_space(s[start])) {
    ++start;
  }
  size_t end = s.size();
  while (end > start && is_ascii_space(s[end - 1])) {
    --end;
  }
  return std::string(s.substr(start, end - start));
}

size_t utf8_length(std::string_view s) {
  size_t count = 0;
  for (char c : s) {
    if (!is_continuation(static_cast<unsigned char>(c))) ++count;
  }
  return count;
}

bool is_valid_utf8(std::string_view s) {
  size_t i = 0;
  while (i < s.size()) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    size_t extra = 0;
    if (c < 0x80) {
      extra = 0;
    } else if (c >= 0xC2 && c <= 0xDF) {
      extra = 1;
    } else if (c >= 0xE0 && c <= 0xEF) {
      extra = 2;
    } else if (c >= 0xF0 && c <= 0xF4) {
      extra = 3;
    } else {
      return false;
    }
    if (i + extra >= s.size()) return false;
    for (size_t k = 1; k <= extra; ++k) {
      if (!is_continuation(static_cast<unsigned char>(s[i + k]))) return false;
    }
    i += extra + 1;
  }
  return true;
}

void append_unescaped(char escaped, std::string& out) {
  switch (escaped) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case '\\':
    case '"':
    case '\'':
      out.push_back(escaped);
      break;
    default:
      // Unknown escapes (JSON unicode escapes included) reach the JSON parser untouched.
      out.push_back('\\');
      out.push_back(escaped);
      break;
  }
}

}  // namespace jpx::util
