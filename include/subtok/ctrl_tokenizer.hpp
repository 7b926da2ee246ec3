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

// CTRL: whitespace-delimited words (a trailing newline stays attached) and
// BPE pieces marked with a "@@" continuation suffix. Special tokens are not
// protected.
class CtrlTokenizer final : public Tokenizer {
 public:
  static constexpr std::string_view kUnknownToken = "<unk>";

  CtrlTokenizer(std::shared_ptr<const Vocab> vocab, BpePairVocab merges, bool lower_case,
                std::size_t cache_capacity = BpeCache::kDefaultCapacity);

  static CtrlTokenizer FromFile(const std::string& vocab_path, const std::string& merges_path, bool lower_case,
                                std::size_t cache_capacity = BpeCache::kDefaultCapacity);
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
