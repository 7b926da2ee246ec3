#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "subtok/tokenizer.hpp"

namespace subtok {

// BERT-style pretokenization: whitespace split, special tokens, punctuation,
// CJK characters, then optional lowercasing and accent stripping of every
// token that is neither special nor unknown.
std::vector<Token> BaseTokenize(TokenRef text, const Vocab& vocab, bool lower_case, bool strip_accents);

// Word-level tokenizer without sub-word segmentation.
class BaseTokenizer final : public Tokenizer {
 public:
  static constexpr std::string_view kUnknownToken = "[UNK]";

  BaseTokenizer(std::shared_ptr<const Vocab> vocab, bool lower_case, bool strip_accents);

  static BaseTokenizer FromFile(const std::string& vocab_path, bool lower_case, bool strip_accents);
  static std::shared_ptr<const Vocab> LoadVocab(const std::string& path);

  [[nodiscard]] const Vocab& GetVocab() const override { return *vocab_; }
  [[nodiscard]] std::vector<Token> Pretokenize(TokenRef text) const override;

 private:
  std::shared_ptr<const Vocab> vocab_;
  bool lower_case_;
  bool strip_accents_;
};

}  // namespace subtok
