#include "subtok/config.hpp"

#include <charconv>
#include <fstream>

#include "subtok/base_tokenizer.hpp"
#include "subtok/bert_tokenizer.hpp"
#include "subtok/ctrl_tokenizer.hpp"
#include "subtok/error.hpp"
#include "subtok/gpt2_tokenizer.hpp"
#include "subtok/openai_gpt_tokenizer.hpp"
#include "subtok/roberta_tokenizer.hpp"
#include "subtok/sentencepiece_tokenizer.hpp"

namespace subtok {

namespace {

std::string to_lower_ascii(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    out.push_back((c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c);
  }
  return out;
}

std::string_view trim_ascii(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

void require_merges(const TokenizerConfig& cfg) {
  if (cfg.merges_path.empty()) {
    throw ValueError(std::string(FamilyName(cfg.family)) + " tokenizer requires a merges file");
  }
}

}  // namespace

std::unordered_map<std::string, std::string> ReadEnvFile(const std::string& path) {
  std::unordered_map<std::string, std::string> env;
  std::ifstream in(path);
  if (!in) {
    return env;
  }
  bool first_line = true;
  std::string line;
  while (std::getline(in, line)) {
    if (first_line) {
      first_line = false;
      if (line.starts_with("\xEF\xBB\xBF")) {
        line.erase(0, 3);
      }
    }
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    std::string_view trimmed = trim_ascii(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    auto eq = trimmed.find('=');
    if (eq == std::string_view::npos) {
      continue;
    }
    std::string key(trim_ascii(trimmed.substr(0, eq)));
    std::string_view val = trim_ascii(trimmed.substr(eq + 1));
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') || (val.front() == '\'' && val.back() == '\''))) {
      val = val.substr(1, val.size() - 2);
    }
    env[key] = std::string(val);
  }
  return env;
}

void ApplyEnvOverrides(TokenizerConfig& cfg, const std::unordered_map<std::string, std::string>& env) {
  auto get = [&](const std::string& key) -> const std::string* {
    auto it = env.find(key);
    if (it == env.end()) {
      return nullptr;
    }
    return &it->second;
  };
  if (auto v = get("TOKENIZER")) cfg.family = ParseFamily(*v);
  if (auto v = get("FAMILY")) cfg.family = ParseFamily(*v);
  if (auto v = get("VOCAB_PATH")) cfg.vocab_path = *v;
  if (auto v = get("MERGES_PATH")) cfg.merges_path = *v;
  if (auto v = get("LOWER_CASE")) cfg.lower_case = ParseBool(*v);
  if (auto v = get("STRIP_ACCENTS")) cfg.strip_accents = ParseBool(*v);
  if (auto v = get("ADD_PREFIX_SPACE")) cfg.add_prefix_space = ParseBool(*v);
  if (auto v = get("MAX_LEN")) cfg.max_len = ParseSize(*v);
  if (auto v = get("STRIDE")) cfg.stride = ParseSize(*v);
  if (auto v = get("TRUNCATION")) cfg.truncation = ParseTruncationStrategy(*v);
  if (auto v = get("THREADS")) cfg.threads = ParseSize(*v);
  if (auto v = get("BPE_CACHE_CAPACITY")) cfg.bpe_cache_capacity = ParseSize(*v);
  if (auto v = get("SKIP_SPECIAL_TOKENS")) cfg.skip_special_tokens = ParseBool(*v);
  if (auto v = get("CLEAN_UP_SPACES")) cfg.clean_up_tokenization_spaces = ParseBool(*v);
}

TokenizerFamily ParseFamily(std::string_view name) {
  std::string v = to_lower_ascii(trim_ascii(name));
  if (v == "base") return TokenizerFamily::base;
  if (v == "bert") return TokenizerFamily::bert;
  if (v == "gpt2") return TokenizerFamily::gpt2;
  if (v == "roberta") return TokenizerFamily::roberta;
  if (v == "openai_gpt" || v == "openai-gpt" || v == "gpt") return TokenizerFamily::openai_gpt;
  if (v == "ctrl") return TokenizerFamily::ctrl;
  if (v == "sentencepiece" || v == "spm") return TokenizerFamily::sentencepiece;
  if (v == "xlnet") return TokenizerFamily::xlnet;
  if (v == "albert") return TokenizerFamily::albert;
  if (v == "t5") return TokenizerFamily::t5;
  if (v == "xlm_roberta" || v == "xlm-roberta" || v == "xlmr") return TokenizerFamily::xlm_roberta;
  throw ValueError("unknown tokenizer family: " + std::string(name));
}

TruncationStrategy ParseTruncationStrategy(std::string_view name) {
  std::string v = to_lower_ascii(trim_ascii(name));
  if (v == "longest_first") return TruncationStrategy::longest_first;
  if (v == "only_first") return TruncationStrategy::only_first;
  if (v == "only_second") return TruncationStrategy::only_second;
  if (v == "do_not_truncate" || v == "none") return TruncationStrategy::do_not_truncate;
  throw ValueError("unknown truncation strategy: " + std::string(name));
}

bool ParseBool(std::string_view value) {
  std::string v = to_lower_ascii(trim_ascii(value));
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    return false;
  }
  throw ValueError("invalid boolean: " + std::string(value));
}

std::size_t ParseSize(std::string_view value) {
  std::string_view v = trim_ascii(value);
  std::size_t out = 0;
  auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
  if (v.empty() || ec != std::errc() || ptr != v.data() + v.size()) {
    throw ValueError("invalid number: " + std::string(value));
  }
  return out;
}

std::string_view FamilyName(TokenizerFamily family) {
  switch (family) {
    case TokenizerFamily::base:
      return "base";
    case TokenizerFamily::bert:
      return "bert";
    case TokenizerFamily::gpt2:
      return "gpt2";
    case TokenizerFamily::roberta:
      return "roberta";
    case TokenizerFamily::openai_gpt:
      return "openai_gpt";
    case TokenizerFamily::ctrl:
      return "ctrl";
    case TokenizerFamily::sentencepiece:
      return "sentencepiece";
    case TokenizerFamily::xlnet:
      return "xlnet";
    case TokenizerFamily::albert:
      return "albert";
    case TokenizerFamily::t5:
      return "t5";
    case TokenizerFamily::xlm_roberta:
      return "xlm_roberta";
  }
  return "unknown";
}

std::string_view TruncationStrategyName(TruncationStrategy strategy) {
  switch (strategy) {
    case TruncationStrategy::longest_first:
      return "longest_first";
    case TruncationStrategy::only_first:
      return "only_first";
    case TruncationStrategy::only_second:
      return "only_second";
    case TruncationStrategy::do_not_truncate:
      return "do_not_truncate";
  }
  return "unknown";
}

std::unique_ptr<Tokenizer> CreateTokenizer(const TokenizerConfig& cfg) {
  if (cfg.vocab_path.empty()) {
    throw ValueError(std::string(FamilyName(cfg.family)) + " tokenizer requires a vocabulary path");
  }
  switch (cfg.family) {
    case TokenizerFamily::base:
      return std::make_unique<BaseTokenizer>(BaseTokenizer::FromFile(cfg.vocab_path, cfg.lower_case, cfg.strip_accents));
    case TokenizerFamily::bert:
      return std::make_unique<BertTokenizer>(BertTokenizer::FromFile(cfg.vocab_path, cfg.lower_case, cfg.strip_accents));
    case TokenizerFamily::gpt2:
      require_merges(cfg);
      return std::make_unique<Gpt2Tokenizer>(
          Gpt2Tokenizer::FromFile(cfg.vocab_path, cfg.merges_path, cfg.lower_case, cfg.bpe_cache_capacity));
    case TokenizerFamily::roberta:
      require_merges(cfg);
      return std::make_unique<RobertaTokenizer>(RobertaTokenizer::FromFile(
          cfg.vocab_path, cfg.merges_path, cfg.lower_case, cfg.add_prefix_space, cfg.bpe_cache_capacity));
    case TokenizerFamily::openai_gpt:
      require_merges(cfg);
      return std::make_unique<OpenAiGptTokenizer>(
          OpenAiGptTokenizer::FromFile(cfg.vocab_path, cfg.merges_path, cfg.lower_case, cfg.bpe_cache_capacity));
    case TokenizerFamily::ctrl:
      require_merges(cfg);
      return std::make_unique<CtrlTokenizer>(
          CtrlTokenizer::FromFile(cfg.vocab_path, cfg.merges_path, cfg.lower_case, cfg.bpe_cache_capacity));
    case TokenizerFamily::sentencepiece:
      return std::make_unique<SentencePieceTokenizer>(SentencePieceTokenizer::FromFile(cfg.vocab_path, cfg.lower_case));
    case TokenizerFamily::xlnet:
      return std::make_unique<XLNetTokenizer>(
          XLNetTokenizer::FromFile(cfg.vocab_path, cfg.lower_case, cfg.strip_accents));
    case TokenizerFamily::albert:
      return std::make_unique<AlbertTokenizer>(
          AlbertTokenizer::FromFile(cfg.vocab_path, cfg.lower_case, cfg.strip_accents));
    case TokenizerFamily::t5:
      return std::make_unique<T5Tokenizer>(T5Tokenizer::FromFile(cfg.vocab_path, cfg.lower_case));
    case TokenizerFamily::xlm_roberta:
      return std::make_unique<XlmRobertaTokenizer>(XlmRobertaTokenizer::FromFile(cfg.vocab_path, cfg.lower_case));
  }
  throw ValueError("unsupported tokenizer family");
}

}  // namespace subtok
