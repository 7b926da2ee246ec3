#undef NDEBUG
#include <cassert>
#include <string>

#include "subtok/unicode.hpp"

using namespace subtok;

namespace {

void test_decoding() {
  std::string text = "a\xC3\xA9\xE4\xB8\xAD\xF0\x9F\x98\x80";
  assert(CountChars(text) == 4);
  std::u32string chars = DecodeUtf8(text);
  assert((chars == std::u32string{U'a', 0xE9, 0x4E2D, 0x1F600}));
  assert(EncodeUtf8(chars) == text);
  assert(IsValidUtf8(text));

  // each malformed byte becomes one replacement character
  std::string bad = "a\xC3\xFF";
  assert(!IsValidUtf8(bad));
  assert((DecodeUtf8(bad) == std::u32string{U'a', kReplacementChar, kReplacementChar}));

  // overlong encodings
  assert(!IsValidUtf8("\xC0\xAF"));
  assert(!IsValidUtf8("\xE0\x80\xAF"));
  assert(!IsValidUtf8("\xF0\x80\x80\xAF"));
  assert((DecodeUtf8("\xC0\xAF") == std::u32string{kReplacementChar, kReplacementChar}));

  // UTF-16 surrogates
  assert(!IsValidUtf8("\xED\xA0\x80"));
  assert((DecodeUtf8("\xED\xA0\x80") == std::u32string(3, kReplacementChar)));
  assert(IsValidUtf8("\xED\x9F\xBF"));

  // beyond U+10FFFF
  assert(!IsValidUtf8("\xF4\x90\x80\x80"));
  assert(!IsValidUtf8("\xF5\x80\x80\x80"));
  assert(IsValidUtf8("\xF4\x8F\xBF\xBF"));
  assert((DecodeUtf8("\xF4\x8F\xBF\xBF") == std::u32string{0x10FFFF}));

  // an encoded replacement character is valid input
  assert(IsValidUtf8("\xEF\xBF\xBD"));
}

void test_classes() {
  assert(IsWhitespace(U' '));
  assert(IsWhitespace(U'\n'));
  assert(IsWhitespace(0x3000));
  assert(!IsWhitespace(U'a'));

  assert(IsControl(0x200B));
  assert(IsControl(0x0001));
  assert(!IsControl(U'\t'));
  assert(!IsControl(U'\n'));

  assert(IsPunctuation(U'!'));
  assert(IsPunctuation(U'$'));
  assert(IsPunctuation(U'`'));
  assert(IsPunctuation(0x3002));
  assert(!IsPunctuation(U'a'));

  assert(IsCjk(0x4E2D));
  assert(IsCjk(0x20000));
  assert(!IsCjk(U'a'));

  assert(IsNonSpacingMark(0x0301));
  assert(!IsNonSpacingMark(U'e'));
  assert(IsAsciiDigit(U'7'));
  assert(!IsAsciiDigit(0x0667));
}

void test_case_and_normalization() {
  std::u32string lowered;
  AppendLowercase(U'A', lowered);
  AppendLowercase(0xC9, lowered);
  assert((lowered == std::u32string{U'a', 0xE9}));

  std::u32string decomposed;
  AppendNfd(0xE9, decomposed);
  assert((decomposed == std::u32string{U'e', 0x0301}));

  assert(NormalizeNfkc(U"ｈｅ") == U"he");
  assert(NormalizeNfkc(U"é") == U"é");
  assert(NormalizeNfkc(U"ﬁ") == U"fi");
  assert(HasNfkcBoundaryBefore(U'a'));
  assert(!HasNfkcBoundaryBefore(0x0301));
}

void test_trim() {
  assert(Trim("  hello \t\n") == "hello");
  assert(TrimEnd("  hello  ") == "  hello");
  assert(Trim("\xE3\x80\x80x\xE3\x80\x80") == "x");
  assert(Trim("   ").empty());
}

}  // namespace

int main() {
  test_decoding();
  test_classes();
  test_case_and_normalization();
  test_trim();
  return 0;
}
