#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace subtok {

// Replacement character emitted for malformed UTF-8 sequences.
inline constexpr char32_t kReplacementChar = 0xFFFD;

// Decodes the code point starting at byte `i` and advances `i` past it.
// Malformed sequences consume one byte and yield U+FFFD.
bool NextCodepoint(std::string_view s, std::size_t& i, char32_t& cp);
void AppendUtf8(char32_t cp, std::string& out);

std::u32string DecodeUtf8(std::string_view s);
std::string EncodeUtf8(std::u32string_view s);
[[nodiscard]] std::size_t CountChars(std::string_view s);
[[nodiscard]] bool IsValidUtf8(std::string_view s);

// Unicode White_Space property.
[[nodiscard]] bool IsWhitespace(char32_t c);
// Categories Cc, Cf, Co and Cs, except tab, newline and carriage return.
[[nodiscard]] bool IsControl(char32_t c);
// ASCII symbol ranges plus every Unicode P* category.
[[nodiscard]] bool IsPunctuation(char32_t c);
// CJK ideographs (all extension blocks), kana and hangul syllables.
[[nodiscard]] bool IsCjk(char32_t c);
// Category Mn.
[[nodiscard]] bool IsNonSpacingMark(char32_t c);
[[nodiscard]] bool IsAsciiDigit(char32_t c);

// Full (possibly expanding) lowercase mapping of a single character.
void AppendLowercase(char32_t c, std::u32string& out);
// Canonical decomposition of a single character.
void AppendNfd(char32_t c, std::u32string& out);
// NFKC normalization of a character run.
std::u32string NormalizeNfkc(std::u32string_view s);
// True when NFKC never combines `c` with anything before it.
[[nodiscard]] bool HasNfkcBoundaryBefore(char32_t c);

// Unicode-aware whitespace trimming.
std::string_view TrimEnd(std::string_view s);
std::string_view Trim(std::string_view s);

}  // namespace subtok
