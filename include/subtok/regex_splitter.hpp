#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include "subtok/token.hpp"

namespace subtok {

// Pre-tokenization pattern of the GPT-2 family.
inline constexpr std::string_view kGpt2Pattern =
    R"('s|'t|'re|'ve|'m|'ll|'d| ?\p{L}+| ?\p{N}+| ?[^\s\p{L}\p{N}]+|\s+(?!\S)|\s+)";
// Pre-tokenization pattern of CTRL: runs of non-space plus an optional newline.
inline constexpr std::string_view kCtrlPattern = R"(\S+\n?)";

// Splits text into the non-overlapping matches of an ICU regular expression.
// Text between matches is dropped. Safe to share across threads.
class RegexSplitter {
 public:
  // Throws TokenizerError when the pattern does not compile.
  explicit RegexSplitter(std::string_view pattern);
  ~RegexSplitter();
  RegexSplitter(RegexSplitter&&) noexcept;
  RegexSplitter& operator=(RegexSplitter&&) noexcept;

  [[nodiscard]] std::vector<TokenRef> Split(TokenRef token) const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace subtok
