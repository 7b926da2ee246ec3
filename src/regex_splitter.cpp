#include "subtok/regex_splitter.hpp"

#include <algorithm>
#include <string>

#include <unicode/regex.h>
#include <unicode/utext.h>

#include "subtok/error.hpp"
#include "subtok/unicode.hpp"

namespace subtok {

struct RegexSplitter::Impl {
  std::unique_ptr<icu::RegexPattern> pattern;
};

namespace {

struct UTextCloser {
  void operator()(UText* ut) const { utext_close(ut); }
};

void check(UErrorCode status, const char* what) {
  if (U_FAILURE(status)) {
    throw TokenizerError(std::string(what) + ": " + u_errorName(status));
  }
}

}  // namespace

RegexSplitter::RegexSplitter(std::string_view pattern) : impl_(std::make_unique<Impl>()) {
  UErrorCode status = U_ZERO_ERROR;
  UParseError parse_error;
  icu::UnicodeString upattern =
      icu::UnicodeString::fromUTF8(icu::StringPiece(pattern.data(), static_cast<int32_t>(pattern.size())));
  impl_->pattern.reset(icu::RegexPattern::compile(upattern, 0, parse_error, status));
  check(status, "invalid regular expression");
}

RegexSplitter::~RegexSplitter() = default;
RegexSplitter::RegexSplitter(RegexSplitter&&) noexcept = default;
RegexSplitter& RegexSplitter::operator=(RegexSplitter&&) noexcept = default;

std::vector<TokenRef> RegexSplitter::Split(TokenRef token) const {
  std::vector<TokenRef> tokens;
  if (token.text.empty()) {
    return tokens;
  }
  UErrorCode status = U_ZERO_ERROR;
  // Native indices of a UTF-8 UText are byte offsets.
  std::unique_ptr<UText, UTextCloser> ut(
      utext_openUTF8(nullptr, token.text.data(), static_cast<int64_t>(token.text.size()), &status));
  check(status, "cannot open text for matching");
  std::unique_ptr<icu::RegexMatcher> matcher(impl_->pattern->matcher(status));
  check(status, "cannot create regex matcher");
  matcher->reset(ut.get());

  std::size_t byte_pos = 0;
  std::size_t char_pos = 0;
  char32_t c = 0;
  auto advance_to = [&](std::size_t target) {
    while (byte_pos < target) {
      NextCodepoint(token.text, byte_pos, c);
      ++char_pos;
    }
  };

  while (matcher->find(status)) {
    check(status, "regex match failed");
    auto start = static_cast<std::size_t>(matcher->start64(status));
    auto end = static_cast<std::size_t>(matcher->end64(status));
    check(status, "regex match failed");
    if (end <= start) {
      continue;
    }
    advance_to(start);
    std::size_t char_start = char_pos;
    advance_to(end);
    std::size_t char_end = std::min(char_pos, token.reference_offsets.size());
    tokens.emplace_back(token.text.substr(start, end - start),
                        token.reference_offsets.subspan(char_start, char_end - char_start), Mask::none);
  }
  check(status, "regex match failed");
  return tokens;
}

}  // namespace subtok
