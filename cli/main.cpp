#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "subtok/config.hpp"
#include "subtok/error.hpp"
#include "subtok/file_io.hpp"
#include "subtok/parallel.hpp"
#include "subtok/serialization.hpp"

using namespace subtok;

namespace {

struct Args {
  std::string env_path = ".env";
  std::string command;
  std::vector<std::string> positional;
  std::optional<std::string> pair;
  bool pairs_file = false;
  bool show_help = false;
};

void print_usage() {
  std::cerr << "subtok command line tool\n"
            << "Usage:\n"
            << "  subtok_cli tokenize <text...> [options]\n"
            << "  subtok_cli encode <text> [--pair <text>] [options]\n"
            << "  subtok_cli encode_file <path> [--pairs] [options]\n"
            << "  subtok_cli decode <id...> [options]\n\n"
            << "Options:\n"
            << "  --env <path>                Path to .env (default: .env)\n"
            << "  --family <name>             bert | base | gpt2 | roberta | openai_gpt | ctrl |\n"
            << "                              sentencepiece | xlnet | albert | t5 | xlm_roberta\n"
            << "  --vocab <path>              Vocabulary file or SentencePiece model\n"
            << "  --merges <path>             BPE merges file\n"
            << "  --lower-case                Lower case the input\n"
            << "  --strip-accents             Remove accents from the input\n"
            << "  --no-prefix-space           RoBERTa: do not prepend a space\n"
            << "  --max-len <n>               Maximum encoded length (default: 512)\n"
            << "  --stride <n>                Overflow context tokens (default: 0)\n"
            << "  --truncation <name>         longest_first | only_first | only_second | do_not_truncate\n"
            << "  --threads <n>               Worker threads for encode_file (0=auto)\n"
            << "  --cache <n>                 BPE cache entries (default: 50000, 0=off)\n"
            << "  --pair <text>               Second sequence for encode\n"
            << "  --pairs                     encode_file lines hold two tab-separated texts (no tab: one text)\n"
            << "  --skip-special              decode: drop special tokens\n"
            << "  --no-clean-up               decode: keep spaces before punctuation\n"
            << "  --help                      Show this help\n";
}

std::string detect_env_path_arg(int argc, char** argv, const std::string& default_path) {
  std::string path = default_path;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--env" && i + 1 < argc) {
      path = argv[i + 1];
      ++i;
    }
  }
  return path;
}

// Flags override values read from the .env file. Throws ValueError on a
// malformed flag value.
bool parse_args(int argc, char** argv, TokenizerConfig& cfg, Args& args, std::string& err) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto require_value = [&](const std::string& name) -> const char* {
      if (i + 1 >= argc) {
        err = "missing value for " + name;
        return nullptr;
      }
      return argv[++i];
    };

    if (arg == "--help" || arg == "-h") {
      args.show_help = true;
      return false;
    }
    if (arg == "--lower-case") {
      cfg.lower_case = true;
      continue;
    }
    if (arg == "--strip-accents") {
      cfg.strip_accents = true;
      continue;
    }
    if (arg == "--no-prefix-space") {
      cfg.add_prefix_space = false;
      continue;
    }
    if (arg == "--pairs") {
      args.pairs_file = true;
      continue;
    }
    if (arg == "--skip-special") {
      cfg.skip_special_tokens = true;
      continue;
    }
    if (arg == "--no-clean-up") {
      cfg.clean_up_tokenization_spaces = false;
      continue;
    }
    if (arg.starts_with("--")) {
      const char* v = require_value(arg);
      if (!v) {
        return false;
      }
      if (arg == "--env") {
        args.env_path = v;
      } else if (arg == "--family") {
        cfg.family = ParseFamily(v);
      } else if (arg == "--vocab") {
        cfg.vocab_path = v;
      } else if (arg == "--merges") {
        cfg.merges_path = v;
      } else if (arg == "--max-len") {
        cfg.max_len = ParseSize(v);
      } else if (arg == "--stride") {
        cfg.stride = ParseSize(v);
      } else if (arg == "--truncation") {
        cfg.truncation = ParseTruncationStrategy(v);
      } else if (arg == "--threads") {
        cfg.threads = ParseSize(v);
      } else if (arg == "--cache") {
        cfg.bpe_cache_capacity = ParseSize(v);
      } else if (arg == "--pair") {
        args.pair = v;
      } else {
        err = "unknown option: " + arg;
        return false;
      }
      continue;
    }
    if (args.command.empty()) {
      args.command = arg;
    } else {
      args.positional.push_back(arg);
    }
  }
  if (args.command.empty()) {
    err = "missing command";
    return false;
  }
  return true;
}

int run_tokenize(const Tokenizer& tok, const Args& args) {
  for (const auto& text : args.positional) {
    nlohmann::json j = tok.TokenizeWithOffsets(text);
    std::cout << j.dump() << "\n";
  }
  return 0;
}

int run_encode(const Tokenizer& tok, const TokenizerConfig& cfg, const Args& args) {
  if (args.positional.size() != 1) {
    std::cerr << "encode expects exactly one text\n";
    return 1;
  }
  std::optional<std::string_view> second;
  if (args.pair) {
    second = *args.pair;
  }
  nlohmann::json j = tok.Encode(args.positional.front(), second, cfg.max_len, cfg.truncation, cfg.stride);
  std::cout << j.dump() << "\n";
  return 0;
}

int run_encode_file(const Tokenizer& tok, const TokenizerConfig& cfg, const Args& args) {
  if (args.positional.size() != 1) {
    std::cerr << "encode_file expects exactly one input path\n";
    return 1;
  }
  std::string contents = ReadFileAll(args.positional.front());
  auto lines = SplitLines(contents);
  MultiThreadedTokenizer batch(tok, cfg.threads);

  auto start_time = std::chrono::steady_clock::now();
  std::vector<TokenizedInput> encoded;
  if (args.pairs_file) {
    std::vector<EncodeRequest> requests;
    requests.reserve(lines.size());
    for (auto line : lines) {
      requests.push_back(ParsePairLine(line));
    }
    encoded = batch.EncodeRequestList(requests, cfg.max_len, cfg.truncation, cfg.stride);
  } else {
    std::vector<std::string> texts(lines.begin(), lines.end());
    encoded = batch.EncodeList(texts, cfg.max_len, cfg.truncation, cfg.stride);
  }

  std::size_t total_tokens = 0;
  for (const auto& input : encoded) {
    total_tokens += input.token_ids.size();
    nlohmann::json j = input;
    std::cout << j.dump() << "\n";
  }
  double elapsed =
      std::chrono::duration_cast<std::chrono::duration<double>>(std::chrono::steady_clock::now() - start_time)
          .count();
  if (elapsed < 1e-9) {
    elapsed = 1e-9;
  }
  std::cerr << "Lines: " << encoded.size() << "\n";
  std::cerr << "Threads: " << EffectiveThreads(cfg.threads, encoded.size()) << "\n";
  std::cerr << "throughput lines/s=" << static_cast<double>(encoded.size()) / elapsed
            << " tok/s=" << static_cast<double>(total_tokens) / elapsed << "\n";
  return 0;
}

int run_decode(const Tokenizer& tok, const TokenizerConfig& cfg, const Args& args) {
  std::vector<TokenId> ids;
  ids.reserve(args.positional.size());
  for (const auto& value : args.positional) {
    ids.push_back(static_cast<TokenId>(ParseSize(value)));
  }
  std::cout << tok.Decode(ids, cfg.skip_special_tokens, cfg.clean_up_tokenization_spaces) << "\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  std::ios::sync_with_stdio(false);

  TokenizerConfig cfg;
  Args args;
  std::string err;
  try {
    args.env_path = detect_env_path_arg(argc, argv, args.env_path);
    ApplyEnvOverrides(cfg, ReadEnvFile(args.env_path));
    if (!parse_args(argc, argv, cfg, args, err)) {
      if (!args.show_help) {
        std::cerr << err << "\n";
      }
      print_usage();
      return args.show_help ? 0 : 1;
    }
  } catch (const TokenizerError& e) {
    std::cerr << e.what() << "\n";
    print_usage();
    return 1;
  }

  if (args.command != "tokenize" && args.command != "encode" && args.command != "encode_file" &&
      args.command != "decode") {
    std::cerr << "Unknown command: " << args.command << "\n";
    print_usage();
    return 1;
  }

  std::unique_ptr<Tokenizer> tok;
  try {
    tok = CreateTokenizer(cfg);
  } catch (const TokenizerError& e) {
    std::cerr << "failed to load " << FamilyName(cfg.family) << " tokenizer: " << e.what() << "\n";
    return 2;
  }
  std::cerr << "Tokenizer: " << FamilyName(cfg.family) << " vocab=" << tok->GetVocab().Size() << "\n";

  try {
    if (args.command == "tokenize") return run_tokenize(*tok, args);
    if (args.command == "encode") return run_encode(*tok, cfg, args);
    if (args.command == "encode_file") return run_encode_file(*tok, cfg, args);
    return run_decode(*tok, cfg, args);
  } catch (const TokenizerError& e) {
    std::cerr << args.command << " failed: " << e.what() << "\n";
    return 3;
  }
}
