#include "subtok/unicode.hpp"

#include <unicode/locid.h>
#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>

#include "subtok/error.hpp"

namespace subtok {

namespace {

bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

void append_unicode_string(const icu::UnicodeString& s, std::u32string& out) {
  for (int32_t i = 0; i < s.length();) {
    UChar32 c = s.char32At(i);
    out.push_back(static_cast<char32_t>(c));
    i = s.moveIndex32(i, 1);
  }
}

const icu::Normalizer2& nfd_instance() {
  static const icu::Normalizer2* instance = [] {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* n = icu::Normalizer2::getNFDInstance(status);
    if (U_FAILURE(status) || n == nullptr) {
      throw TokenizerError("failed to load ICU NFD normalizer");
    }
    return n;
  }();
  return *instance;
}

const icu::Normalizer2& nfkc_instance() {
  static const icu::Normalizer2* instance = [] {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* n = icu::Normalizer2::getNFKCInstance(status);
    if (U_FAILURE(status) || n == nullptr) {
      throw TokenizerError("failed to load ICU NFKC normalizer");
    }
    return n;
  }();
  return *instance;
}

}  // namespace

bool NextCodepoint(std::string_view s, std::size_t& i, char32_t& cp) {
  if (i >= s.size()) {
    return false;
  }
  auto byte = [&](std::size_t k) { return static_cast<unsigned char>(s[i + k]); };
  unsigned char c = byte(0);
  if (c < 0x80) {
    cp = c;
    i += 1;
    return true;
  }
  // Overlong forms, surrogates and values above U+10FFFF are malformed.
  if (c >= 0xC2 && c <= 0xDF && i + 1 < s.size() && is_continuation(byte(1))) {
    cp = ((c & 0x1F) << 6) | (byte(1) & 0x3F);
    i += 2;
    return true;
  }
  if ((c >> 4) == 0xE && i + 2 < s.size() && is_continuation(byte(1)) && is_continuation(byte(2))) {
    bool overlong = c == 0xE0 && byte(1) < 0xA0;
    bool surrogate = c == 0xED && byte(1) >= 0xA0;
    if (!overlong && !surrogate) {
      cp = ((c & 0x0F) << 12) | ((byte(1) & 0x3F) << 6) | (byte(2) & 0x3F);
      i += 3;
      return true;
    }
  }
  if (c >= 0xF0 && c <= 0xF4 && i + 3 < s.size() && is_continuation(byte(1)) && is_continuation(byte(2)) &&
      is_continuation(byte(3))) {
    bool overlong = c == 0xF0 && byte(1) < 0x90;
    bool too_large = c == 0xF4 && byte(1) >= 0x90;
    if (!overlong && !too_large) {
      cp = ((c & 0x07) << 18) | ((byte(1) & 0x3F) << 12) | ((byte(2) & 0x3F) << 6) | (byte(3) & 0x3F);
      i += 4;
      return true;
    }
  }
  i += 1;
  cp = kReplacementChar;
  return true;
}

void AppendUtf8(char32_t cp, std::string& out) {
  if (cp <= 0x7F) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FF) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp <= 0xFFFF) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

std::u32string DecodeUtf8(std::string_view s) {
  std::u32string out;
  out.reserve(s.size());
  std::size_t i = 0;
  char32_t cp = 0;
  while (NextCodepoint(s, i, cp)) {
    out.push_back(cp);
  }
  return out;
}

std::string EncodeUtf8(std::u32string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char32_t cp : s) {
    AppendUtf8(cp, out);
  }
  return out;
}

std::size_t CountChars(std::string_view s) {
  std::size_t n = 0;
  std::size_t i = 0;
  char32_t cp = 0;
  while (NextCodepoint(s, i, cp)) {
    ++n;
  }
  return n;
}

bool IsValidUtf8(std::string_view s) {
  std::size_t i = 0;
  char32_t cp = 0;
  while (i < s.size()) {
    std::size_t prev = i;
    NextCodepoint(s, i, cp);
    if (cp == kReplacementChar && i - prev == 1) {
      return false;
    }
  }
  return true;
}

bool IsWhitespace(char32_t c) { return u_isUWhiteSpace(static_cast<UChar32>(c)); }

bool IsControl(char32_t c) {
  if (c == U'\t' || c == U'\n' || c == U'\r') {
    return false;
  }
  switch (u_charType(static_cast<UChar32>(c))) {
    case U_CONTROL_CHAR:
    case U_FORMAT_CHAR:
    case U_PRIVATE_USE_CHAR:
    case U_SURROGATE:
      return true;
    default:
      return false;
  }
}

bool IsPunctuation(char32_t c) {
  if ((c >= 33 && c <= 47) || (c >= 58 && c <= 64) || (c >= 91 && c <= 96) || (c >= 123 && c <= 126)) {
    return true;
  }
  return u_ispunct(static_cast<UChar32>(c));
}

bool IsCjk(char32_t c) {
  return (c >= 0x4E00 && c <= 0x9FFF) || (c >= 0x3400 && c <= 0x4DBF) || (c >= 0x20000 && c <= 0x2A6DF) ||
         (c >= 0x2A700 && c <= 0x2B73F) || (c >= 0x2B740 && c <= 0x2B81F) || (c >= 0x2B820 && c <= 0x2CEAF) ||
         (c >= 0xF900 && c <= 0xFAFF) || (c >= 0x2F800 && c <= 0x2FA1F) ||
         // hiragana, katakana and katakana phonetic extensions
         (c >= 0x3040 && c <= 0x30FF) || (c >= 0x31F0 && c <= 0x31FF) ||
         // hangul syllables
         (c >= 0xAC00 && c <= 0xD7AF);
}

bool IsNonSpacingMark(char32_t c) { return u_charType(static_cast<UChar32>(c)) == U_NON_SPACING_MARK; }

bool IsAsciiDigit(char32_t c) { return c >= U'0' && c <= U'9'; }

void AppendLowercase(char32_t c, std::u32string& out) {
  if (c < 0x80) {
    out.push_back(c >= U'A' && c <= U'Z' ? c + 32 : c);
    return;
  }
  icu::UnicodeString s(static_cast<UChar32>(c));
  s.toLower(icu::Locale::getRoot());
  append_unicode_string(s, out);
}

void AppendNfd(char32_t c, std::u32string& out) {
  if (c < 0xC0) {
    out.push_back(c);
    return;
  }
  UErrorCode status = U_ZERO_ERROR;
  icu::UnicodeString decomposed = nfd_instance().normalize(icu::UnicodeString(static_cast<UChar32>(c)), status);
  if (U_FAILURE(status)) {
    throw TokenizerError("NFD decomposition failed");
  }
  append_unicode_string(decomposed, out);
}

std::u32string NormalizeNfkc(std::u32string_view s) {
  icu::UnicodeString input;
  for (char32_t c : s) {
    input.append(static_cast<UChar32>(c));
  }
  UErrorCode status = U_ZERO_ERROR;
  icu::UnicodeString normalized = nfkc_instance().normalize(input, status);
  if (U_FAILURE(status)) {
    throw TokenizerError("NFKC normalization failed");
  }
  std::u32string out;
  out.reserve(s.size());
  append_unicode_string(normalized, out);
  return out;
}

bool HasNfkcBoundaryBefore(char32_t c) { return nfkc_instance().hasBoundaryBefore(static_cast<UChar32>(c)); }

std::string_view TrimEnd(std::string_view s) {
  std::size_t end = 0;
  std::size_t i = 0;
  char32_t cp = 0;
  while (NextCodepoint(s, i, cp)) {
    if (!IsWhitespace(cp)) {
      end = i;
    }
  }
  return s.substr(0, end);
}

std::string_view Trim(std::string_view s) {
  std::size_t i = 0;
  char32_t cp = 0;
  while (i < s.size()) {
    std::size_t prev = i;
    NextCodepoint(s, i, cp);
    if (!IsWhitespace(cp)) {
      return TrimEnd(s.substr(prev));
    }
  }
  return s.substr(s.size());
}

}  // namespace subtok
