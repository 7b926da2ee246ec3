#include "subtok/parallel.hpp"

#include <algorithm>
#include <thread>

namespace subtok {

EncodeRequest ParsePairLine(std::string_view line) {
  auto tab = line.find('\t');
  if (tab == std::string_view::npos) {
    return {std::string(line), std::nullopt};
  }
  return {std::string(line.substr(0, tab)), std::string(line.substr(tab + 1))};
}

std::size_t EffectiveThreads(std::size_t requested, std::size_t jobs) {
  std::size_t threads = requested > 0 ? requested : std::max(1u, std::thread::hardware_concurrency());
  return std::max<std::size_t>(1, std::min(threads, jobs));
}

std::vector<std::vector<std::string>> MultiThreadedTokenizer::TokenizeList(std::span<const std::string> texts) const {
  return ParallelMap<std::vector<std::string>>(texts.size(), threads_,
                                               [&](std::size_t i) { return tokenizer_.Tokenize(texts[i]); });
}

std::vector<TokensWithOffsets> MultiThreadedTokenizer::TokenizeListWithOffsets(
    std::span<const std::string> texts) const {
  return ParallelMap<TokensWithOffsets>(texts.size(), threads_,
                                        [&](std::size_t i) { return tokenizer_.TokenizeWithOffsets(texts[i]); });
}

std::vector<TokenizedInput> MultiThreadedTokenizer::EncodeList(std::span<const std::string> texts,
                                                               std::size_t max_len, TruncationStrategy strategy,
                                                               std::size_t stride) const {
  return ParallelMap<TokenizedInput>(texts.size(), threads_, [&](std::size_t i) {
    return tokenizer_.Encode(texts[i], std::nullopt, max_len, strategy, stride);
  });
}

std::vector<TokenizedInput> MultiThreadedTokenizer::EncodePairList(
    std::span<const std::pair<std::string, std::string>> pairs, std::size_t max_len, TruncationStrategy strategy,
    std::size_t stride) const {
  return ParallelMap<TokenizedInput>(pairs.size(), threads_, [&](std::size_t i) {
    return tokenizer_.Encode(pairs[i].first, pairs[i].second, max_len, strategy, stride);
  });
}

std::vector<TokenizedInput> MultiThreadedTokenizer::EncodeRequestList(std::span<const EncodeRequest> requests,
                                                                      std::size_t max_len,
                                                                      TruncationStrategy strategy,
                                                                      std::size_t stride) const {
  return ParallelMap<TokenizedInput>(requests.size(), threads_, [&](std::size_t i) {
    const auto& [first, second] = requests[i];
    std::optional<std::string_view> second_view;
    if (second) second_view = *second;
    return tokenizer_.Encode(first, second_view, max_len, strategy, stride);
  });
}

std::vector<std::string> MultiThreadedTokenizer::DecodeList(std::span<const std::vector<TokenId>> token_ids_list,
                                                            bool skip_special_tokens,
                                                            bool clean_up_tokenization_spaces) const {
  return ParallelMap<std::string>(token_ids_list.size(), threads_, [&](std::size_t i) {
    return tokenizer_.Decode(token_ids_list[i], skip_special_tokens, clean_up_tokenization_spaces);
  });
}

}  // namespace subtok
