#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

#include "subtok/token.hpp"
#include "subtok/vocab.hpp"

namespace subtok {

enum class TruncationStrategy {
  // drop from whichever sequence is currently longer, the first on ties
  longest_first,
  only_first,
  only_second,
  do_not_truncate,
};

// Splits untouched (mask none) tokens at every character matching `pred`.
// Text before a separator loses its trailing whitespace. With
// `add_separators` each separator becomes its own token tagged `set_mask`.
std::vector<TokenRef> SplitOnChar(TokenRef token, const std::function<bool(char32_t)>& pred, bool add_separators,
                                  Mask set_mask);

// Result of probing a substring matcher at one position.
struct SubstrMatch {
  std::size_t bytes = 0;
  std::size_t chars = 0;
  Mask mask = Mask::none;
};

// Like SplitOnChar, but separators are substrings reported by `test_substr`
// for the text starting at each character.
std::vector<TokenRef> SplitOnSubstr(TokenRef token, const std::function<SubstrMatch(std::string_view)>& test_substr,
                                    bool add_separators);

std::vector<TokenRef> WhitespaceTokenize(TokenRef token);
// Isolates the vocabulary's special values, longest match first. The unknown
// value is tagged unknown, the others special.
std::vector<TokenRef> SplitOnSpecialTokens(TokenRef token, const Vocab& vocab);
std::vector<TokenRef> SplitOnPunct(TokenRef token);
std::vector<TokenRef> TokenizeCjkChars(TokenRef token);

// Per-character transforms. Each output character keeps the reference offset
// of the input character it came from.
void Lowercase(Token& token);
void StripAccents(Token& token);
// Removes control characters, NUL and U+FFFD, maps whitespace to a space.
void CleanText(Token& token);
void DecomposeNfkc(Token& token);
void ReplaceWhitespace(Token& token, char32_t replacement);
// Replaces every occurrence of `from` by `to`. The replacement takes the
// offsets of the replaced characters, padded with the last one.
void ReplaceString(Token& token, std::string_view from, std::string_view to);

// A none token directly followed by a continuation becomes begin.
void FixMask(std::vector<Token>& tokens);

// Removes `num_tokens_to_remove` ids according to `strategy` and returns the
// overflowing ids, preceded by a `stride` window of the kept ids.
// Throws ValueError when the request cannot be satisfied.
std::vector<TokenId> TruncateSequences(TokenIdsWithOffsets& first, std::optional<TokenIdsWithOffsets>& second,
                                       std::size_t num_tokens_to_remove, TruncationStrategy strategy,
                                       std::size_t stride);

}  // namespace subtok
