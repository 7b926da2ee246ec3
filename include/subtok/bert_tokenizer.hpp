#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "subtok/tokenizer.hpp"

namespace subtok {

// BERT: base pretokenization followed by WordPiece.
class BertTokenizer final : public Tokenizer {
 public:
  static constexpr std::string_view kUnknownToken = "[UNK]";
  static constexpr std::string_view kClsToken = "[CLS]";
  static constexpr std::string_view kSepToken = "[SEP]";
  static constexpr std::string_view kMaskToken = "[MASK]";
  static constexpr std::string_view kPadToken = "[PAD]";

  BertTokenizer(std::shared_ptr<const Vocab> vocab, bool lower_case, bool strip_accents);

  static BertTokenizer FromFile(const std::string& vocab_path, bool lower_case, bool strip_accents);
  // One token per line; requires [UNK] [CLS] [SEP] [MASK] [PAD].
  static std::shared_ptr<const Vocab> LoadVocab(const std::string& path);
  static std::shared_ptr<const Vocab> MakeVocab(ValueMap values);

  [[nodiscard]] const Vocab& GetVocab() const override { return *vocab_; }
  [[nodiscard]] std::vector<Token> Pretokenize(TokenRef text) const override;
  [[nodiscard]] std::vector<Token> Segment(std::vector<Token> tokens) const override;
  // [CLS] A [SEP] B [SEP]
  [[nodiscard]] TokenIdsWithSpecialTokens BuildInputWithSpecialTokens(
      TokenIdsWithOffsets first, std::optional<TokenIdsWithOffsets> second) const override;
  [[nodiscard]] std::string ConvertTokensToString(const std::vector<std::string>& tokens) const override;

 private:
  std::shared_ptr<const Vocab> vocab_;
  bool lower_case_;
  bool strip_accents_;
};

}  // namespace subtok
