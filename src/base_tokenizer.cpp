#include "subtok/base_tokenizer.hpp"

#include <utility>

namespace subtok {

std::vector<Token> BaseTokenize(TokenRef text, const Vocab& vocab, bool lower_case, bool strip_accents) {
  std::vector<Token> tokens;
  for (const TokenRef& word : WhitespaceTokenize(text)) {
    for (const TokenRef& piece : SplitOnSpecialTokens(word, vocab)) {
      for (const TokenRef& punct : SplitOnPunct(piece)) {
        for (const TokenRef& part : TokenizeCjkChars(punct)) {
          Token token = part.ToOwned();
          if (token.mask != Mask::special && token.mask != Mask::unknown) {
            if (lower_case) {
              Lowercase(token);
            }
            if (strip_accents) {
              StripAccents(token);
            }
          }
          if (!token.text.empty()) {
            tokens.push_back(std::move(token));
          }
        }
      }
    }
  }
  return tokens;
}

BaseTokenizer::BaseTokenizer(std::shared_ptr<const Vocab> vocab, bool lower_case, bool strip_accents)
    : vocab_(std::move(vocab)), lower_case_(lower_case), strip_accents_(strip_accents) {}

BaseTokenizer BaseTokenizer::FromFile(const std::string& vocab_path, bool lower_case, bool strip_accents) {
  return BaseTokenizer(LoadVocab(vocab_path), lower_case, strip_accents);
}

std::shared_ptr<const Vocab> BaseTokenizer::LoadVocab(const std::string& path) {
  return Vocab::Create(ReadVocabFile(path), std::string(kUnknownToken));
}

std::vector<Token> BaseTokenizer::Pretokenize(TokenRef text) const {
  return BaseTokenize(text, *vocab_, lower_case_, strip_accents_);
}

}  // namespace subtok
