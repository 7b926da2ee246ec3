#include "subtok/ctrl_tokenizer.hpp"

#include <utility>

#include "subtok/unicode.hpp"

namespace subtok {

CtrlTokenizer::CtrlTokenizer(std::shared_ptr<const Vocab> vocab, BpePairVocab merges, bool lower_case,
                             std::size_t cache_capacity)
    : vocab_(std::move(vocab)),
      merges_(std::move(merges)),
      splitter_(kCtrlPattern),
      cache_(std::make_unique<BpeCache>(cache_capacity)),
      lower_case_(lower_case) {}

CtrlTokenizer CtrlTokenizer::FromFile(const std::string& vocab_path, const std::string& merges_path,
                                      bool lower_case, std::size_t cache_capacity) {
  return CtrlTokenizer(LoadVocab(vocab_path), BpePairVocab::FromFile(merges_path), lower_case, cache_capacity);
}

std::shared_ptr<const Vocab> CtrlTokenizer::LoadVocab(const std::string& path) {
  return Vocab::Create(ReadJsonVocabFile(path), std::string(kUnknownToken));
}

std::vector<Token> CtrlTokenizer::Pretokenize(TokenRef text) const {
  Token owned = text.ToOwned();
  if (lower_case_) {
    Lowercase(owned);
  }
  std::vector<Token> tokens;
  for (const TokenRef& word : splitter_.Split(owned)) {
    tokens.push_back(word.ToOwned());
  }
  return tokens;
}

std::vector<Token> CtrlTokenizer::Segment(std::vector<Token> tokens) const {
  std::vector<Token> out;
  out.reserve(tokens.size());
  for (auto& token : tokens) {
    for (auto& piece : SplitOnBpePairs(token, CtrlBpe, merges_, cache_.get(), false)) {
      out.push_back(std::move(piece));
    }
  }
  FixMask(out);
  return out;
}

std::string CtrlTokenizer::ConvertTokensToString(const std::vector<std::string>& tokens) const {
  std::string text = JoinTokens(tokens, " ");
  ReplaceAll(text, "@@ ", "");
  return std::string(Trim(text));
}

}  // namespace subtok
