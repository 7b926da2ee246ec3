#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "subtok/token.hpp"
#include "subtok/tokenization_utils.hpp"
#include "subtok/vocab.hpp"

namespace subtok {

// Common surface of every tokenizer family. A family supplies the three
// stages (pretokenize, segment, frame) and its decoding join; everything
// else is shared.
class Tokenizer {
 public:
  virtual ~Tokenizer() = default;

  [[nodiscard]] virtual const Vocab& GetVocab() const = 0;

  // Coarse, offset-preserving split of one input (words, punctuation,
  // special tokens, ...).
  [[nodiscard]] virtual std::vector<Token> Pretokenize(TokenRef text) const = 0;
  // Sub-word segmentation of pretokenized tokens. Identity by default.
  [[nodiscard]] virtual std::vector<Token> Segment(std::vector<Token> tokens) const { return tokens; }
  // Adds the family's framing tokens. The default concatenates both
  // sequences with segment ids 0 and 1.
  [[nodiscard]] virtual TokenIdsWithSpecialTokens BuildInputWithSpecialTokens(
      TokenIdsWithOffsets first, std::optional<TokenIdsWithOffsets> second) const;
  // Joins decoded tokens into text. The default separates them by spaces.
  [[nodiscard]] virtual std::string ConvertTokensToString(const std::vector<std::string>& tokens) const;

  // Empty for blank input. Reference offsets index the characters of `text`.
  [[nodiscard]] std::vector<Token> TokenizeToTokens(std::string_view text) const;
  [[nodiscard]] std::vector<std::string> Tokenize(std::string_view text) const;
  [[nodiscard]] TokensWithOffsets TokenizeWithOffsets(std::string_view text) const;
  [[nodiscard]] std::vector<std::vector<std::string>> TokenizeList(std::span<const std::string> texts) const;
  [[nodiscard]] std::vector<TokensWithOffsets> TokenizeListWithOffsets(std::span<const std::string> texts) const;

  [[nodiscard]] std::vector<TokenId> ConvertTokensToIds(std::span<const std::string> tokens) const;

  // Tokenizes, truncates to `max_len` (framing included) and frames one input
  // or a pair. Throws ValueError when `strategy` cannot satisfy `max_len`.
  [[nodiscard]] TokenizedInput Encode(std::string_view text_a, std::optional<std::string_view> text_b,
                                      std::size_t max_len, TruncationStrategy strategy, std::size_t stride) const;
  [[nodiscard]] std::vector<TokenizedInput> EncodeList(std::span<const std::string> texts, std::size_t max_len,
                                                       TruncationStrategy strategy, std::size_t stride) const;
  [[nodiscard]] std::vector<TokenizedInput> EncodePairList(std::span<const std::pair<std::string, std::string>> pairs,
                                                           std::size_t max_len, TruncationStrategy strategy,
                                                           std::size_t stride) const;

  [[nodiscard]] std::vector<std::string> DecodeToVec(std::span<const TokenId> ids, bool skip_special_tokens) const;
  [[nodiscard]] std::string Decode(std::span<const TokenId> ids, bool skip_special_tokens,
                                   bool clean_up_tokenization_spaces) const;
  [[nodiscard]] std::vector<std::string> DecodeList(std::span<const std::vector<TokenId>> token_ids_list,
                                                    bool skip_special_tokens,
                                                    bool clean_up_tokenization_spaces) const;

  // Undoes the spacing that word-level tokenization adds around English
  // punctuation and contractions.
  static std::string CleanUpTokenization(std::string text);

 protected:
  // Maps tokens to ids, keeping offsets, reference offsets and masks aligned.
  [[nodiscard]] TokenIdsWithOffsets TokensToIds(const std::vector<Token>& tokens) const;
};

// Joins `tokens` with `separator`.
std::string JoinTokens(const std::vector<std::string>& tokens, std::string_view separator);
// Replaces every occurrence of `from` in `text` by `to`.
void ReplaceAll(std::string& text, std::string_view from, std::string_view to);

}  // namespace subtok
