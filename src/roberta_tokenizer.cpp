#include "subtok/roberta_tokenizer.hpp"

#include <utility>

#include "subtok/gpt2_tokenizer.hpp"
#include "subtok/unicode.hpp"

namespace subtok {

RobertaTokenizer::RobertaTokenizer(std::shared_ptr<const Vocab> vocab, BpePairVocab merges, bool lower_case,
                                   bool add_prefix_space, std::size_t cache_capacity)
    : vocab_(std::move(vocab)),
      merges_(std::move(merges)),
      splitter_(kGpt2Pattern),
      cache_(std::make_unique<BpeCache>(cache_capacity)),
      lower_case_(lower_case),
      add_prefix_space_(add_prefix_space) {}

RobertaTokenizer RobertaTokenizer::FromFile(const std::string& vocab_path, const std::string& merges_path,
                                            bool lower_case, bool add_prefix_space, std::size_t cache_capacity) {
  return RobertaTokenizer(LoadVocab(vocab_path), BpePairVocab::FromFile(merges_path), lower_case, add_prefix_space,
                          cache_capacity);
}

std::shared_ptr<const Vocab> RobertaTokenizer::LoadVocab(const std::string& path) {
  return MakeVocab(ReadJsonVocabFile(path));
}

std::shared_ptr<const Vocab> RobertaTokenizer::MakeVocab(ValueMap values) {
  return Vocab::Create(std::move(values), std::string(kUnknownToken), {kBosToken, kEosToken, kPadToken, kMaskToken});
}

std::vector<Token> RobertaTokenizer::Pretokenize(TokenRef text) const {
  if (add_prefix_space_ && !text.text.empty()) {
    std::size_t i = 0;
    char32_t first = 0;
    NextCodepoint(text.text, i, first);
    if (!IsWhitespace(first)) {
      std::vector<OffsetSize> refs;
      refs.reserve(text.reference_offsets.size() + 1);
      refs.push_back(kNoOffset);
      refs.insert(refs.end(), text.reference_offsets.begin(), text.reference_offsets.end());
      Token prefixed(" " + std::string(text.text), std::move(refs), text.mask);
      return ByteLevelPretokenize(prefixed, *vocab_, splitter_, lower_case_);
    }
  }
  return ByteLevelPretokenize(text, *vocab_, splitter_, lower_case_);
}

std::vector<Token> RobertaTokenizer::Segment(std::vector<Token> tokens) const {
  std::vector<Token> out = ByteLevelSegment(std::move(tokens), merges_, cache_.get());
  for (auto& token : out) {
    token.DropUnmappedOffsets();
  }
  return out;
}

TokenIdsWithSpecialTokens RobertaTokenizer::BuildInputWithSpecialTokens(
    TokenIdsWithOffsets first, std::optional<TokenIdsWithOffsets> second) const {
  TokenIdsWithSpecialTokens out;
  TokenId eos = vocab_->TokenToId(kEosToken);
  out.AppendSpecial(vocab_->TokenToId(kBosToken), 0);
  out.Append(std::move(first), 0);
  out.AppendSpecial(eos, 0);
  if (second) {
    out.AppendSpecial(eos, 1);
    out.Append(std::move(*second), 1);
    out.AppendSpecial(eos, 1);
  }
  return out;
}

std::string RobertaTokenizer::ConvertTokensToString(const std::vector<std::string>& tokens) const {
  return UnicodeStringToBytes(JoinTokens(tokens, ""));
}

}  // namespace subtok
