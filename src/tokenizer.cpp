#include "subtok/tokenizer.hpp"

#include <array>
#include <utility>

#include "subtok/unicode.hpp"

namespace subtok {

std::string JoinTokens(const std::vector<std::string>& tokens, std::string_view separator) {
  std::string out;
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    if (i > 0) {
      out.append(separator);
    }
    out.append(tokens[i]);
  }
  return out;
}

void ReplaceAll(std::string& text, std::string_view from, std::string_view to) {
  if (from.empty()) {
    return;
  }
  std::size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
}

TokenIdsWithSpecialTokens Tokenizer::BuildInputWithSpecialTokens(TokenIdsWithOffsets first,
                                                                 std::optional<TokenIdsWithOffsets> second) const {
  TokenIdsWithSpecialTokens out;
  out.Append(std::move(first), 0);
  if (second) {
    out.Append(std::move(*second), 1);
  }
  return out;
}

std::string Tokenizer::ConvertTokensToString(const std::vector<std::string>& tokens) const {
  return JoinTokens(tokens, " ");
}

std::vector<Token> Tokenizer::TokenizeToTokens(std::string_view text) const {
  if (Trim(text).empty()) {
    return {};
  }
  std::size_t n_chars = CountChars(text);
  std::vector<OffsetSize> refs(n_chars);
  for (std::size_t i = 0; i < n_chars; ++i) {
    refs[i] = static_cast<OffsetSize>(i);
  }
  std::vector<Token> tokens = Segment(Pretokenize(TokenRef(text, refs)));
  std::erase_if(tokens, [](const Token& t) { return t.text.empty(); });
  return tokens;
}

std::vector<std::string> Tokenizer::Tokenize(std::string_view text) const {
  std::vector<std::string> out;
  for (auto& token : TokenizeToTokens(text)) {
    out.push_back(std::move(token.text));
  }
  return out;
}

TokensWithOffsets Tokenizer::TokenizeWithOffsets(std::string_view text) const {
  TokensWithOffsets out;
  for (auto& token : TokenizeToTokens(text)) {
    out.offsets.push_back(token.reference_offsets.empty() ? std::nullopt : token.offset.AsOptional());
    out.masks.push_back(token.mask);
    out.tokens.push_back(std::move(token.text));
    out.reference_offsets.push_back(std::move(token.reference_offsets));
  }
  return out;
}

std::vector<std::vector<std::string>> Tokenizer::TokenizeList(std::span<const std::string> texts) const {
  std::vector<std::vector<std::string>> out;
  out.reserve(texts.size());
  for (const auto& text : texts) {
    out.push_back(Tokenize(text));
  }
  return out;
}

std::vector<TokensWithOffsets> Tokenizer::TokenizeListWithOffsets(std::span<const std::string> texts) const {
  std::vector<TokensWithOffsets> out;
  out.reserve(texts.size());
  for (const auto& text : texts) {
    out.push_back(TokenizeWithOffsets(text));
  }
  return out;
}

std::vector<TokenId> Tokenizer::ConvertTokensToIds(std::span<const std::string> tokens) const {
  return GetVocab().ConvertTokensToIds(tokens);
}

TokenIdsWithOffsets Tokenizer::TokensToIds(const std::vector<Token>& tokens) const {
  const Vocab& vocab = GetVocab();
  TokenIdsWithOffsets out;
  out.ids.reserve(tokens.size());
  out.offsets.reserve(tokens.size());
  out.reference_offsets.reserve(tokens.size());
  out.masks.reserve(tokens.size());
  for (const auto& token : tokens) {
    out.ids.push_back(vocab.TokenToId(token.text));
    out.offsets.push_back(token.reference_offsets.empty() ? std::nullopt : token.offset.AsOptional());
    out.reference_offsets.push_back(token.reference_offsets);
    out.masks.push_back(token.mask);
  }
  return out;
}

TokenizedInput Tokenizer::Encode(std::string_view text_a, std::optional<std::string_view> text_b,
                                 std::size_t max_len, TruncationStrategy strategy, std::size_t stride) const {
  TokenIdsWithOffsets first = TokensToIds(TokenizeToTokens(text_a));
  std::optional<TokenIdsWithOffsets> second;
  if (text_b) {
    second = TokensToIds(TokenizeToTokens(*text_b));
  }

  std::optional<TokenIdsWithOffsets> empty_second;
  if (second) {
    empty_second.emplace();
  }
  std::size_t framing = BuildInputWithSpecialTokens(TokenIdsWithOffsets{}, std::move(empty_second)).token_ids.size();
  std::size_t total = first.size() + (second ? second->size() : 0) + framing;
  std::size_t num_truncated = total > max_len ? total - max_len : 0;

  std::vector<TokenId> overflow = TruncateSequences(first, second, num_truncated, strategy, stride);
  TokenIdsWithSpecialTokens merged = BuildInputWithSpecialTokens(std::move(first), std::move(second));

  TokenizedInput out;
  out.token_ids = std::move(merged.token_ids);
  out.segment_ids = std::move(merged.segment_ids);
  out.special_tokens_mask = std::move(merged.special_tokens_mask);
  out.overflowing_tokens = std::move(overflow);
  out.num_truncated_tokens = num_truncated;
  out.token_offsets = std::move(merged.token_offsets);
  out.reference_offsets = std::move(merged.reference_offsets);
  out.mask = std::move(merged.mask);
  return out;
}

std::vector<TokenizedInput> Tokenizer::EncodeList(std::span<const std::string> texts, std::size_t max_len,
                                                  TruncationStrategy strategy, std::size_t stride) const {
  std::vector<TokenizedInput> out;
  out.reserve(texts.size());
  for (const auto& text : texts) {
    out.push_back(Encode(text, std::nullopt, max_len, strategy, stride));
  }
  return out;
}

std::vector<TokenizedInput> Tokenizer::EncodePairList(std::span<const std::pair<std::string, std::string>> pairs,
                                                      std::size_t max_len, TruncationStrategy strategy,
                                                      std::size_t stride) const {
  std::vector<TokenizedInput> out;
  out.reserve(pairs.size());
  for (const auto& [a, b] : pairs) {
    out.push_back(Encode(a, b, max_len, strategy, stride));
  }
  return out;
}

std::vector<std::string> Tokenizer::DecodeToVec(std::span<const TokenId> ids, bool skip_special_tokens) const {
  const Vocab& vocab = GetVocab();
  std::vector<std::string> tokens;
  tokens.reserve(ids.size());
  for (TokenId id : ids) {
    if (skip_special_tokens && vocab.IsSpecialId(id)) {
      continue;
    }
    tokens.push_back(vocab.IdToToken(id));
  }
  return tokens;
}

std::string Tokenizer::Decode(std::span<const TokenId> ids, bool skip_special_tokens,
                              bool clean_up_tokenization_spaces) const {
  std::string text = ConvertTokensToString(DecodeToVec(ids, skip_special_tokens));
  if (clean_up_tokenization_spaces) {
    return CleanUpTokenization(std::move(text));
  }
  return text;
}

std::vector<std::string> Tokenizer::DecodeList(std::span<const std::vector<TokenId>> token_ids_list,
                                               bool skip_special_tokens, bool clean_up_tokenization_spaces) const {
  std::vector<std::string> out;
  out.reserve(token_ids_list.size());
  for (const auto& ids : token_ids_list) {
    out.push_back(Decode(ids, skip_special_tokens, clean_up_tokenization_spaces));
  }
  return out;
}

std::string Tokenizer::CleanUpTokenization(std::string text) {
  // order matters: " do not" runs before " 's" and friends
  static constexpr std::array<std::pair<std::string_view, std::string_view>, 11> kReplacements{{
      {" .", "."},
      {" !", "!"},
      {" ?", "?"},
      {" ,", ","},
      {" ' ", "'"},
      {" n't", "n't"},
      {" 'm", "'m"},
      {" do not", " don't"},
      {" 's", "'s"},
      {" 've", "'ve"},
      {" 're", "'re"},
  }};
  for (const auto& [from, to] : kReplacements) {
    ReplaceAll(text, from, to);
  }
  return text;
}

}  // namespace subtok
