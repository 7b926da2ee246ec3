#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "subtok/sentencepiece_model.hpp"
#include "subtok/tokenizer.hpp"

namespace subtok {

// Normalization switches of the SentencePiece families.
struct SentencePieceOptions {
  bool lower_case = false;
  bool strip_accents = false;
  // `` and '' become "
  bool replace_quotes = false;
  // pieces ending in "<digit>," are segmented again without the comma
  bool split_digit_comma = false;
};

// Isolates special tokens, then normalizes the remaining text: control
// characters removed, NFKC, optional case and accent folding, whitespace
// replaced by U+2581 and a leading U+2581 added when missing.
std::vector<Token> SentencePiecePretokenize(TokenRef text, const Vocab& vocab, const SentencePieceOptions& options);
// Unigram segmentation of every normalized token, followed by mask
// assignment. Characters added by normalization lose their offsets here.
std::vector<Token> SentencePieceSegment(std::vector<Token> tokens, const SentencePieceModel& model,
                                        bool split_digit_comma);
// Concatenates pieces and turns U+2581 back into spaces.
std::string SentencePieceTokensToString(const std::vector<std::string>& tokens);
// Piece text -> piece index.
ValueMap SentencePieceValues(const SentencePieceModel& model);

// Plain SentencePiece unigram model without framing.
class SentencePieceTokenizer final : public Tokenizer {
 public:
  static constexpr std::string_view kUnknownToken = "<unk>";

  SentencePieceTokenizer(std::shared_ptr<const Vocab> vocab, std::shared_ptr<const SentencePieceModel> model,
                         bool lower_case);

  static SentencePieceTokenizer FromFile(const std::string& model_path, bool lower_case);
  static std::shared_ptr<const Vocab> MakeVocab(const SentencePieceModel& model);

  [[nodiscard]] const Vocab& GetVocab() const override { return *vocab_; }
  [[nodiscard]] const SentencePieceModel& GetModel() const { return *model_; }
  [[nodiscard]] std::vector<Token> Pretokenize(TokenRef text) const override;
  [[nodiscard]] std::vector<Token> Segment(std::vector<Token> tokens) const override;
  [[nodiscard]] std::string ConvertTokensToString(const std::vector<std::string>& tokens) const override;

 private:
  std::shared_ptr<const Vocab> vocab_;
  std::shared_ptr<const SentencePieceModel> model_;
  SentencePieceOptions options_;
};

// XLNet: payload first, then <sep> after each sequence and a final <cls>
// with segment id 2.
class XLNetTokenizer final : public Tokenizer {
 public:
  static constexpr std::string_view kUnknownToken = "<unk>";
  static constexpr std::string_view kSepToken = "<sep>";
  static constexpr std::string_view kClsToken = "<cls>";
  static constexpr std::string_view kMaskToken = "<mask>";
  static constexpr std::string_view kPadToken = "<pad>";
  static constexpr std::string_view kBosToken = "<s>";
  static constexpr std::string_view kEosToken = "</s>";

  XLNetTokenizer(std::shared_ptr<const Vocab> vocab, std::shared_ptr<const SentencePieceModel> model,
                 bool lower_case, bool strip_accents);

  static XLNetTokenizer FromFile(const std::string& model_path, bool lower_case, bool strip_accents);
  static std::shared_ptr<const Vocab> MakeVocab(const SentencePieceModel& model);

  [[nodiscard]] const Vocab& GetVocab() const override { return *vocab_; }
  [[nodiscard]] std::vector<Token> Pretokenize(TokenRef text) const override;
  [[nodiscard]] std::vector<Token> Segment(std::vector<Token> tokens) const override;
  // A <sep> B <sep> <cls>
  [[nodiscard]] TokenIdsWithSpecialTokens BuildInputWithSpecialTokens(
      TokenIdsWithOffsets first, std::optional<TokenIdsWithOffsets> second) const override;
  [[nodiscard]] std::string ConvertTokensToString(const std::vector<std::string>& tokens) const override;

 private:
  std::shared_ptr<const Vocab> vocab_;
  std::shared_ptr<const SentencePieceModel> model_;
  SentencePieceOptions options_;
};

// ALBERT: SentencePiece pieces with BERT framing.
class AlbertTokenizer final : public Tokenizer {
 public:
  static constexpr std::string_view kUnknownToken = "<unk>";
  static constexpr std::string_view kClsToken = "[CLS]";
  static constexpr std::string_view kSepToken = "[SEP]";
  static constexpr std::string_view kMaskToken = "[MASK]";
  static constexpr std::string_view kPadToken = "<pad>";

  AlbertTokenizer(std::shared_ptr<const Vocab> vocab, std::shared_ptr<const SentencePieceModel> model,
                  bool lower_case, bool strip_accents);

  static AlbertTokenizer FromFile(const std::string& model_path, bool lower_case, bool strip_accents);
  static std::shared_ptr<const Vocab> MakeVocab(const SentencePieceModel& model);

  [[nodiscard]] const Vocab& GetVocab() const override { return *vocab_; }
  [[nodiscard]] std::vector<Token> Pretokenize(TokenRef text) const override;
  [[nodiscard]] std::vector<Token> Segment(std::vector<Token> tokens) const override;
  // [CLS] A [SEP] B [SEP]
  [[nodiscard]] TokenIdsWithSpecialTokens BuildInputWithSpecialTokens(
      TokenIdsWithOffsets first, std::optional<TokenIdsWithOffsets> second) const override;
  [[nodiscard]] std::string ConvertTokensToString(const std::vector<std::string>& tokens) const override;

 private:
  std::shared_ptr<const Vocab> vocab_;
  std::shared_ptr<const SentencePieceModel> model_;
  SentencePieceOptions options_;
};

// T5: every sequence closed by </s>. The vocabulary is extended with the
// sentinel tokens <extra_id_0> ... <extra_id_99>, numbered downwards from the
// last id.
class T5Tokenizer final : public Tokenizer {
 public:
  static constexpr std::string_view kUnknownToken = "<unk>";
  static constexpr std::string_view kEosToken = "</s>";
  static constexpr std::string_view kPadToken = "<pad>";
  static constexpr int kExtraIds = 100;

  T5Tokenizer(std::shared_ptr<const Vocab> vocab, std::shared_ptr<const SentencePieceModel> model, bool lower_case);

  static T5Tokenizer FromFile(const std::string& model_path, bool lower_case);
  static std::shared_ptr<const Vocab> MakeVocab(const SentencePieceModel& model);

  [[nodiscard]] const Vocab& GetVocab() const override { return *vocab_; }
  [[nodiscard]] std::vector<Token> Pretokenize(TokenRef text) const override;
  [[nodiscard]] std::vector<Token> Segment(std::vector<Token> tokens) const override;
  // A </s> B </s>
  [[nodiscard]] TokenIdsWithSpecialTokens BuildInputWithSpecialTokens(
      TokenIdsWithOffsets first, std::optional<TokenIdsWithOffsets> second) const override;
  [[nodiscard]] std::string ConvertTokensToString(const std::vector<std::string>& tokens) const override;

 private:
  std::shared_ptr<const Vocab> vocab_;
  std::shared_ptr<const SentencePieceModel> model_;
  SentencePieceOptions options_;
};

// XLM-RoBERTa: SentencePiece pieces renumbered to the fairseq layout
// (<s> 0, <pad> 1, </s> 2, <unk> 3, piece i >= 3 at i + 1, <mask> last) with
// RoBERTa framing.
class XlmRobertaTokenizer final : public Tokenizer {
 public:
  static constexpr std::string_view kUnknownToken = "<unk>";
  static constexpr std::string_view kBosToken = "<s>";
  static constexpr std::string_view kEosToken = "</s>";
  static constexpr std::string_view kPadToken = "<pad>";
  static constexpr std::string_view kMaskToken = "<mask>";

  XlmRobertaTokenizer(std::shared_ptr<const Vocab> vocab, std::shared_ptr<const SentencePieceModel> model,
                      bool lower_case);

  static XlmRobertaTokenizer FromFile(const std::string& model_path, bool lower_case);
  static std::shared_ptr<const Vocab> MakeVocab(const SentencePieceModel& model);

  [[nodiscard]] const Vocab& GetVocab() const override { return *vocab_; }
  [[nodiscard]] std::vector<Token> Pretokenize(TokenRef text) const override;
  [[nodiscard]] std::vector<Token> Segment(std::vector<Token> tokens) const override;
  // <s> A </s> </s> B </s>
  [[nodiscard]] TokenIdsWithSpecialTokens BuildInputWithSpecialTokens(
      TokenIdsWithOffsets first, std::optional<TokenIdsWithOffsets> second) const override;
  [[nodiscard]] std::string ConvertTokensToString(const std::vector<std::string>& tokens) const override;

 private:
  std::shared_ptr<const Vocab> vocab_;
  std::shared_ptr<const SentencePieceModel> model_;
  SentencePieceOptions options_;
};

}  // namespace subtok
