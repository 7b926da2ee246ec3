#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

#include "subtok/bpe.hpp"
#include "subtok/tokenization_utils.hpp"
#include "subtok/tokenizer.hpp"

namespace subtok {

enum class TokenizerFamily {
  base,
  bert,
  gpt2,
  roberta,
  openai_gpt,
  ctrl,
  sentencepiece,
  xlnet,
  albert,
  t5,
  xlm_roberta,
};

struct TokenizerConfig {
  TokenizerFamily family = TokenizerFamily::bert;
  // vocabulary file, or the SentencePiece model for unigram families
  std::string vocab_path;
  // BPE merges, required by gpt2, roberta, openai_gpt and ctrl
  std::string merges_path;
  bool lower_case = false;
  bool strip_accents = false;
  bool add_prefix_space = true;

  std::size_t max_len = 512;
  std::size_t stride = 0;
  TruncationStrategy truncation = TruncationStrategy::longest_first;
  // 0 = hardware concurrency
  std::size_t threads = 0;
  std::size_t bpe_cache_capacity = BpeCache::kDefaultCapacity;

  bool skip_special_tokens = false;
  bool clean_up_tokenization_spaces = true;
};

// KEY=VALUE lines; '#' starts a comment line, surrounding quotes are
// removed, a UTF-8 byte order mark is skipped. A missing file yields an empty
// map.
std::unordered_map<std::string, std::string> ReadEnvFile(const std::string& path);

// Applies FAMILY (or TOKENIZER), VOCAB_PATH, MERGES_PATH, LOWER_CASE,
// STRIP_ACCENTS, ADD_PREFIX_SPACE, MAX_LEN, STRIDE, TRUNCATION, THREADS,
// BPE_CACHE_CAPACITY, SKIP_SPECIAL_TOKENS and CLEAN_UP_SPACES.
// Throws ValueError on a malformed value.
void ApplyEnvOverrides(TokenizerConfig& cfg, const std::unordered_map<std::string, std::string>& env);

// The parsers below throw ValueError naming the rejected value.
TokenizerFamily ParseFamily(std::string_view name);
TruncationStrategy ParseTruncationStrategy(std::string_view name);
bool ParseBool(std::string_view value);
std::size_t ParseSize(std::string_view value);

std::string_view FamilyName(TokenizerFamily family);
std::string_view TruncationStrategyName(TruncationStrategy strategy);

// Loads the vocabulary (and merges or model) named by `cfg` and builds the
// tokenizer of its family.
std::unique_ptr<Tokenizer> CreateTokenizer(const TokenizerConfig& cfg);

}  // namespace subtok
