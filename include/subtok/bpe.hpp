#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "subtok/token.hpp"
#include "subtok/vocab.hpp"

namespace subtok {

// GPT-2 byte-level alphabet. Printable bytes keep their own code point, the
// others are moved to 256 and up so that every byte is a visible character.
const std::array<char32_t, 256>& ByteToUnicode();
// Reverse of ByteToUnicode. Returns std::nullopt outside the alphabet.
std::optional<std::uint8_t> UnicodeToByte(char32_t c);
// Maps each byte of `text` to its alphabet character, UTF-8 encoded.
std::string BytesToUnicodeString(std::string_view text);
// Inverse of BytesToUnicodeString. Characters outside the alphabet keep their
// UTF-8 bytes; invalid UTF-8 in the result is replaced by U+FFFD.
std::string UnicodeStringToBytes(std::string_view text);

// Ordered merge list. A lower rank merges first.
class BpePairVocab {
 public:
  BpePairVocab() = default;
  explicit BpePairVocab(std::unordered_map<std::string, std::int64_t, StringHash, std::equal_to<>> ranks)
      : ranks_(std::move(ranks)) {}

  // Skips the header line. Every following line holding at least two
  // space-separated symbols is a merge, ranked by its position among valid
  // lines. A repeated pair keeps its last rank.
  static BpePairVocab FromFile(const std::string& path);

  [[nodiscard]] std::optional<std::int64_t> GetRank(std::string_view left, std::string_view right) const;
  [[nodiscard]] std::size_t Size() const { return ranks_.size(); }

 private:
  std::unordered_map<std::string, std::int64_t, StringHash, std::equal_to<>> ranks_;
};

// Sub-word pieces plus the number of input characters each one covers.
struct BpeOutput {
  std::vector<std::string> pieces;
  std::vector<std::size_t> char_counts;
};

// Plain BPE over the characters of `word`.
BpeOutput Bpe(std::string_view word, const BpePairVocab& ranks);
// BPE with an end-of-word marker "</w>" glued to the last character. The
// marker stays in the last piece but is not counted as input characters.
BpeOutput OpenAiGptBpe(std::string_view word, const BpePairVocab& ranks);
// BPE with an end-of-word marker that is removed afterwards. Every piece but
// the last gets the "@@" continuation suffix.
BpeOutput CtrlBpe(std::string_view word, const BpePairVocab& ranks);

using BpeFunction = BpeOutput (*)(std::string_view, const BpePairVocab&);

// Thread-safe least-recently-used memo of BPE results keyed by word.
class BpeCache {
 public:
  static constexpr std::size_t kDefaultCapacity = 50'000;

  // A capacity of zero disables caching.
  explicit BpeCache(std::size_t capacity = kDefaultCapacity) : capacity_(capacity) {}

  [[nodiscard]] std::optional<BpeOutput> Get(const std::string& word);
  void Put(const std::string& word, const BpeOutput& output);
  [[nodiscard]] std::size_t Size() const;
  [[nodiscard]] std::size_t Capacity() const { return capacity_; }
  void Clear();

 private:
  using Entry = std::pair<std::string, BpeOutput>;

  std::size_t capacity_;
  mutable std::mutex mu_;
  std::list<Entry> order_;
  std::unordered_map<std::string, std::list<Entry>::iterator, StringHash, std::equal_to<>> index_;
};

// Runs `bpe` on one pre-token and maps the pieces back to reference offsets.
// With `as_bytes` the token is first mapped through the byte-level alphabet
// and every byte inherits the offset of its character. Several pieces are
// tagged begin/continuation, a single piece keeps mask none.
std::vector<Token> SplitOnBpePairs(TokenRef token, BpeFunction bpe, const BpePairVocab& ranks, BpeCache* cache,
                                   bool as_bytes);

}  // namespace subtok
