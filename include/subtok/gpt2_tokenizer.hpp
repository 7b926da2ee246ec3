#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "subtok/bpe.hpp"
#include "subtok/regex_splitter.hpp"
#include "subtok/tokenizer.hpp"

namespace subtok {

// Special tokens are isolated first; the rest is optionally lowercased and
// split with `splitter`.
std::vector<Token> ByteLevelPretokenize(TokenRef text, const Vocab& vocab, const RegexSplitter& splitter,
                                        bool lower_case);
// Byte-level BPE over every token that is neither special nor unknown.
std::vector<Token> ByteLevelSegment(std::vector<Token> tokens, const BpePairVocab& merges, BpeCache* cache);

// GPT-2: regex pretokenization and byte-level BPE.
class Gpt2Tokenizer final : public Tokenizer {
 public:
  static constexpr std::string_view kUnknownToken = "<|endoftext|>";

  Gpt2Tokenizer(std::shared_ptr<const Vocab> vocab, BpePairVocab merges, bool lower_case,
                std::size_t cache_capacity = BpeCache::kDefaultCapacity);

  static Gpt2Tokenizer FromFile(const std::string& vocab_path, const std::string& merges_path, bool lower_case,
                                std::size_t cache_capacity = BpeCache::kDefaultCapacity);
  // JSON token -> id map; <|endoftext|> is both the unknown and the only
  // special token.
  static std::shared_ptr<const Vocab> LoadVocab(const std::string& path);

  [[nodiscard]] const Vocab& GetVocab() const override { return *vocab_; }
  [[nodiscard]] std::vector<Token> Pretokenize(TokenRef text) const override;
  [[nodiscard]] std::vector<Token> Segment(std::vector<Token> tokens) const override;
  [[nodiscard]] std::string ConvertTokensToString(const std::vector<std::string>& tokens) const override;

 private:
  std::shared_ptr<const Vocab> vocab_;
  BpePairVocab merges_;
  RegexSplitter splitter_;
  std::unique_ptr<BpeCache> cache_;
  bool lower_case_;
};

}  // namespace subtok
