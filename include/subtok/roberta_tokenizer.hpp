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

// RoBERTa: GPT-2 byte-level BPE with <s>/</s> framing. With
// `add_prefix_space` an input that does not start with whitespace is
// tokenized as if preceded by a space, so its first word gets the same ids as
// a word in the middle of a sentence.
class RobertaTokenizer final : public Tokenizer {
 public:
  static constexpr std::string_view kUnknownToken = "<unk>";
  static constexpr std::string_view kBosToken = "<s>";
  static constexpr std::string_view kEosToken = "</s>";
  static constexpr std::string_view kPadToken = "<pad>";
  static constexpr std::string_view kMaskToken = "<mask>";

  RobertaTokenizer(std::shared_ptr<const Vocab> vocab, BpePairVocab merges, bool lower_case,
                   bool add_prefix_space = true, std::size_t cache_capacity = BpeCache::kDefaultCapacity);

  static RobertaTokenizer FromFile(const std::string& vocab_path, const std::string& merges_path, bool lower_case,
                                   bool add_prefix_space = true,
                                   std::size_t cache_capacity = BpeCache::kDefaultCapacity);
  // JSON token -> id map; requires <unk> <s> </s> <pad> <mask>.
  static std::shared_ptr<const Vocab> LoadVocab(const std::string& path);
  static std::shared_ptr<const Vocab> MakeVocab(ValueMap values);

  [[nodiscard]] const Vocab& GetVocab() const override { return *vocab_; }
  [[nodiscard]] std::vector<Token> Pretokenize(TokenRef text) const override;
  [[nodiscard]] std::vector<Token> Segment(std::vector<Token> tokens) const override;
  // <s> A </s> </s> B </s>
  [[nodiscard]] TokenIdsWithSpecialTokens BuildInputWithSpecialTokens(
      TokenIdsWithOffsets first, std::optional<TokenIdsWithOffsets> second) const override;
  [[nodiscard]] std::string ConvertTokensToString(const std::vector<std::string>& tokens) const override;

 private:
  std::shared_ptr<const Vocab> vocab_;
  BpePairVocab merges_;
  RegexSplitter splitter_;
  std::unique_ptr<BpeCache> cache_;
  bool lower_case_;
  bool add_prefix_space_;
};

}  // namespace subtok
