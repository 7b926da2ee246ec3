#include "subtok/bert_tokenizer.hpp"

#include <utility>

#include "subtok/base_tokenizer.hpp"
#include "subtok/unicode.hpp"
#include "subtok/wordpiece.hpp"

namespace subtok {

BertTokenizer::BertTokenizer(std::shared_ptr<const Vocab> vocab, bool lower_case, bool strip_accents)
    : vocab_(std::move(vocab)), lower_case_(lower_case), strip_accents_(strip_accents) {}

BertTokenizer BertTokenizer::FromFile(const std::string& vocab_path, bool lower_case, bool strip_accents) {
  return BertTokenizer(LoadVocab(vocab_path), lower_case, strip_accents);
}

std::shared_ptr<const Vocab> BertTokenizer::LoadVocab(const std::string& path) {
  return MakeVocab(ReadVocabFile(path));
}

std::shared_ptr<const Vocab> BertTokenizer::MakeVocab(ValueMap values) {
  return Vocab::Create(std::move(values), std::string(kUnknownToken), {kClsToken, kSepToken, kMaskToken, kPadToken});
}

std::vector<Token> BertTokenizer::Pretokenize(TokenRef text) const {
  return BaseTokenize(text, *vocab_, lower_case_, strip_accents_);
}

std::vector<Token> BertTokenizer::Segment(std::vector<Token> tokens) const {
  std::vector<Token> out;
  out.reserve(tokens.size());
  for (auto& token : tokens) {
    if (token.mask == Mask::special || token.mask == Mask::unknown) {
      out.push_back(std::move(token));
      continue;
    }
    for (auto& piece : TokenizeWordpiece(token, *vocab_)) {
      out.push_back(std::move(piece));
    }
  }
  return out;
}

TokenIdsWithSpecialTokens BertTokenizer::BuildInputWithSpecialTokens(TokenIdsWithOffsets first,
                                                                     std::optional<TokenIdsWithOffsets> second) const {
  TokenIdsWithSpecialTokens out;
  TokenId sep = vocab_->TokenToId(kSepToken);
  out.AppendSpecial(vocab_->TokenToId(kClsToken), 0);
  out.Append(std::move(first), 0);
  out.AppendSpecial(sep, 0);
  if (second) {
    out.Append(std::move(*second), 1);
    out.AppendSpecial(sep, 1);
  }
  return out;
}

std::string BertTokenizer::ConvertTokensToString(const std::vector<std::string>& tokens) const {
  std::string text = JoinTokens(tokens, " ");
  ReplaceAll(text, " ##", "");
  return std::string(Trim(text));
}

}  // namespace subtok
