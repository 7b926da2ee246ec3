#include "subtok/gpt2_tokenizer.hpp"

#include <utility>

namespace subtok {

std::vector<Token> ByteLevelPretokenize(TokenRef text, const Vocab& vocab, const RegexSplitter& splitter,
                                        bool lower_case) {
  std::vector<Token> tokens;
  for (const TokenRef& piece : SplitOnSpecialTokens(text, vocab)) {
    if (piece.mask == Mask::special || piece.mask == Mask::unknown) {
      tokens.push_back(piece.ToOwned());
      continue;
    }
    Token owned = piece.ToOwned();
    if (lower_case) {
      Lowercase(owned);
    }
    for (const TokenRef& word : splitter.Split(owned)) {
      tokens.push_back(word.ToOwned());
    }
  }
  return tokens;
}

std::vector<Token> ByteLevelSegment(std::vector<Token> tokens, const BpePairVocab& merges, BpeCache* cache) {
  std::vector<Token> out;
  out.reserve(tokens.size());
  for (auto& token : tokens) {
    if (token.mask == Mask::special || token.mask == Mask::unknown) {
      out.push_back(std::move(token));
      continue;
    }
    for (auto& piece : SplitOnBpePairs(token, Bpe, merges, cache, true)) {
      out.push_back(std::move(piece));
    }
  }
  FixMask(out);
  return out;
}

Gpt2Tokenizer::Gpt2Tokenizer(std::shared_ptr<const Vocab> vocab, BpePairVocab merges, bool lower_case,
                             std::size_t cache_capacity)
    : vocab_(std::move(vocab)),
      merges_(std::move(merges)),
      splitter_(kGpt2Pattern),
      cache_(std::make_unique<BpeCache>(cache_capacity)),
      lower_case_(lower_case) {}

Gpt2Tokenizer Gpt2Tokenizer::FromFile(const std::string& vocab_path, const std::string& merges_path,
                                      bool lower_case, std::size_t cache_capacity) {
  return Gpt2Tokenizer(LoadVocab(vocab_path), BpePairVocab::FromFile(merges_path), lower_case, cache_capacity);
}

std::shared_ptr<const Vocab> Gpt2Tokenizer::LoadVocab(const std::string& path) {
  return Vocab::Create(ReadJsonVocabFile(path), std::string(kUnknownToken));
}

std::vector<Token> Gpt2Tokenizer::Pretokenize(TokenRef text) const {
  return ByteLevelPretokenize(text, *vocab_, splitter_, lower_case_);
}

std::vector<Token> Gpt2Tokenizer::Segment(std::vector<Token> tokens) const {
  return ByteLevelSegment(std::move(tokens), merges_, cache_.get());
}

std::string Gpt2Tokenizer::ConvertTokensToString(const std::vector<std::string>& tokens) const {
  return UnicodeStringToBytes(JoinTokens(tokens, ""));
}

}  // namespace subtok
