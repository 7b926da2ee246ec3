#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace subtok {

using TokenId = std::int64_t;
// Position of a character (Unicode scalar value) in the original input.
using OffsetSize = std::uint32_t;

// Reference offset carried by characters that do not exist in the input,
// such as an inserted prefix space. Removed before results are returned.
inline constexpr OffsetSize kNoOffset = std::numeric_limits<OffsetSize>::max();

// Half-open character range [begin, end) in the original input.
struct Offset {
  OffsetSize begin = 0;
  OffsetSize end = 0;

  Offset() = default;
  Offset(OffsetSize b, OffsetSize e) : begin(b), end(e) {}

  // An empty or inverted range carries no position.
  [[nodiscard]] std::optional<Offset> AsOptional() const {
    if (end > begin) {
      return *this;
    }
    return std::nullopt;
  }

  friend bool operator==(const Offset&, const Offset&) = default;
};

enum class Mask : std::uint8_t {
  none,
  whitespace,
  punctuation,
  // single Chinese/Japanese/Korean character
  cjk,
  special,
  // first sub-token of a word split into several sub-tokens
  begin,
  continuation,
  // all but the last sub-token of a word, the reverse of continuation
  unfinished,
  unknown,
};

[[nodiscard]] std::string_view MaskName(Mask mask);

// Offset covering the given reference offsets, ignoring kNoOffset entries.
[[nodiscard]] Offset OffsetFromReferences(std::span<const OffsetSize> reference_offsets);

struct Token;

// View over a slice of the input text. Does not own its data.
struct TokenRef {
  std::string_view text;
  Offset offset;
  std::span<const OffsetSize> reference_offsets;
  Mask mask = Mask::none;

  TokenRef() = default;
  TokenRef(std::string_view text, std::span<const OffsetSize> reference_offsets);
  TokenRef(std::string_view text, std::span<const OffsetSize> reference_offsets, Mask mask);
  TokenRef(const Token& token);  // NOLINT(google-explicit-constructor)

  [[nodiscard]] Token ToOwned() const;
};

struct Token {
  std::string text;
  Offset offset;
  // One entry per character of `text`.
  std::vector<OffsetSize> reference_offsets;
  Mask mask = Mask::none;

  Token() = default;
  // Token over `text` starting at character 0 of a fresh input.
  explicit Token(std::string text);
  Token(std::string text, std::vector<OffsetSize> reference_offsets, Mask mask = Mask::none);

  [[nodiscard]] TokenRef AsRef() const { return TokenRef(*this); }

  // Recomputes `offset` from `reference_offsets`.
  void UpdateOffset();
  // Drops kNoOffset entries left by injected characters.
  void DropUnmappedOffsets();

  friend bool operator==(const Token&, const Token&) = default;
};

// Yields consecutive groups of tokens that form one word: a token that is not
// a continuation followed by all the continuations after it.
template <typename T>
class ConsolidatedTokenIterator {
 public:
  explicit ConsolidatedTokenIterator(std::span<const T> tokens) : tokens_(tokens) {}

  std::optional<std::span<const T>> Next() {
    while (true) {
      if (cursor_ < tokens_.size()) {
        if (tokens_[cursor_].mask != Mask::continuation && cursor_ > begin_) {
          auto group = tokens_.subspan(begin_, cursor_ - begin_);
          begin_ = cursor_;
          ++cursor_;
          return group;
        }
        ++cursor_;
      } else {
        if (begin_ < tokens_.size()) {
          auto group = tokens_.subspan(begin_);
          begin_ = tokens_.size();
          cursor_ = tokens_.size();
          return group;
        }
        return std::nullopt;
      }
    }
  }

 private:
  std::span<const T> tokens_;
  std::size_t begin_ = 0;
  std::size_t cursor_ = 0;
};

template <typename T>
ConsolidatedTokenIterator<T> IterConsolidateTokens(const std::vector<T>& tokens) {
  return ConsolidatedTokenIterator<T>(std::span<const T>(tokens));
}

// Per-token results of tokenizing one input.
struct TokensWithOffsets {
  std::vector<std::string> tokens;
  std::vector<std::optional<Offset>> offsets;
  std::vector<std::vector<OffsetSize>> reference_offsets;
  std::vector<Mask> masks;

  friend bool operator==(const TokensWithOffsets&, const TokensWithOffsets&) = default;
};

// Token ids of one input, position-aligned with their offsets and masks.
struct TokenIdsWithOffsets {
  std::vector<TokenId> ids;
  std::vector<std::optional<Offset>> offsets;
  std::vector<std::vector<OffsetSize>> reference_offsets;
  std::vector<Mask> masks;

  [[nodiscard]] std::size_t size() const { return ids.size(); }
  [[nodiscard]] bool empty() const { return ids.empty(); }
};

// Model input assembled from one or two sequences plus framing tokens.
struct TokenIdsWithSpecialTokens {
  std::vector<TokenId> token_ids;
  std::vector<std::int8_t> segment_ids;
  std::vector<std::int8_t> special_tokens_mask;
  std::vector<std::optional<Offset>> token_offsets;
  std::vector<std::vector<OffsetSize>> reference_offsets;
  std::vector<Mask> mask;

  void Append(TokenIdsWithOffsets&& sequence, std::int8_t segment_id);
  // Adds a framing token: no offset, special mask.
  void AppendSpecial(TokenId id, std::int8_t segment_id);
};

struct TokenizedInput {
  std::vector<TokenId> token_ids;
  std::vector<std::int8_t> segment_ids;
  std::vector<std::int8_t> special_tokens_mask;
  std::vector<TokenId> overflowing_tokens;
  std::size_t num_truncated_tokens = 0;
  std::vector<std::optional<Offset>> token_offsets;
  std::vector<std::vector<OffsetSize>> reference_offsets;
  std::vector<Mask> mask;

  friend bool operator==(const TokenizedInput&, const TokenizedInput&) = default;
};

}  // namespace subtok
