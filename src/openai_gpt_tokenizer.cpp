#include "subtok/openai_gpt_tokenizer.hpp"

#include <utility>

#include "subtok/base_tokenizer.hpp"
#include "subtok/unicode.hpp"

namespace subtok {

OpenAiGptTokenizer::OpenAiGptTokenizer(std::shared_ptr<const Vocab> vocab, BpePairVocab merges, bool lower_case,
                                       std::size_t cache_capacity)
    : vocab_(std::move(vocab)),
      merges_(std::move(merges)),
      cache_(std::make_unique<BpeCache>(cache_capacity)),
      lower_case_(lower_case) {}

OpenAiGptTokenizer OpenAiGptTokenizer::FromFile(const std::string& vocab_path, const std::string& merges_path,
                                                bool lower_case, std::size_t cache_capacity) {
  return OpenAiGptTokenizer(LoadVocab(vocab_path), BpePairVocab::FromFile(merges_path), lower_case, cache_capacity);
}

std::shared_ptr<const Vocab> OpenAiGptTokenizer::LoadVocab(const std::string& path) {
  return Vocab::Create(ReadJsonVocabFile(path), std::string(kUnknownToken));
}

std::vector<Token> OpenAiGptTokenizer::Pretokenize(TokenRef text) const {
  return BaseTokenize(text, *vocab_, lower_case_, false);
}

std::vector<Token> OpenAiGptTokenizer::Segment(std::vector<Token> tokens) const {
  std::vector<Token> out;
  out.reserve(tokens.size());
  for (auto& token : tokens) {
    if (token.mask == Mask::special || token.mask == Mask::unknown) {
      out.push_back(std::move(token));
      continue;
    }
    for (auto& piece : SplitOnBpePairs(token, OpenAiGptBpe, merges_, cache_.get(), false)) {
      out.push_back(std::move(piece));
    }
  }
  FixMask(out);
  return out;
}

std::string OpenAiGptTokenizer::ConvertTokensToString(const std::vector<std::string>& tokens) const {
  std::string text = JoinTokens(tokens, "");
  ReplaceAll(text, "</w>", " ");
  return std::string(Trim(text));
}

}  // namespace subtok
