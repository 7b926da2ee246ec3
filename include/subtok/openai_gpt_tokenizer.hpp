#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "subtok/bpe.hpp"
#include "subtok/tokenizer.hpp"

namespace subtok {

// OpenAI GPT: base pretokenization (lowercased by default) and BPE with a
// "</w>" end-of-word marker.
class OpenAiGptTokenizer final : public Tokenizer {
 public:
  static constexpr std::string_view kUnknownToken = "<unk>";

  OpenAiGptTokenizer(std::shared_ptr<const Vocab> vocab, BpePairVocab merges, bool lower_case = true,
                     std::size_t cache_capacity = BpeCache::kDefaultCapacity);

  static OpenAiGptTokenizer FromFile(const std::string& vocab_path, const std::string& merges_path,
                                     bool lower_case = true, std::size_t cache_capacity = BpeCache::kDefaultCapacity);
  static std::shared_ptr<const Vocab> LoadVocab(const std::string& path);

  [[nodiscard]] const Vocab& GetVocab() const override { return *vocab_; }
  [[nodiscard]] std::vector<Token> Pretokenize(TokenRef text) const override;
  [[nodiscard]] std::vector<Token> Segment(std::vector<Token> tokens) const override;
  [[nodiscard]] std::string ConvertTokensToString(const std::vector<std::string>& tokens) const override;

 private:
  std::shared_ptr<const Vocab> vocab_;
  BpePairVocab merges_;
  std::unique_ptr<BpeCache> cache_;
  bool lower_case_;
};

}  // namespace subtok
