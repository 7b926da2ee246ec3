#pragma once

#include <atomic>
#include <cstddef>
#include <exception>
#include <future>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "subtok/tokenizer.hpp"

namespace subtok {

// A text to encode, with the second text when it is a pair.
using EncodeRequest = std::pair<std::string, std::optional<std::string>>;

// Splits `line` at its first tab into a pair request. A line without a tab is
// a single sequence.
EncodeRequest ParsePairLine(std::string_view line);

// Number of workers for `jobs` items: `requested`, or the hardware
// concurrency when zero, never more than the number of items.
std::size_t EffectiveThreads(std::size_t requested, std::size_t jobs);

// Computes fn(0) ... fn(n - 1) on a pool of std::async workers pulling indices
// from a shared counter. Results keep index order. The first exception thrown
// by a worker is rethrown once all workers have stopped.
template <typename Out, typename Fn>
std::vector<Out> ParallelMap(std::size_t n, std::size_t threads, Fn&& fn) {
  std::vector<Out> out(n);
  threads = EffectiveThreads(threads, n);
  if (threads <= 1) {
    for (std::size_t i = 0; i < n; ++i) {
      out[i] = fn(i);
    }
    return out;
  }

  std::atomic<std::size_t> next{0};
  std::vector<std::future<void>> jobs;
  jobs.reserve(threads);
  for (std::size_t t = 0; t < threads; ++t) {
    jobs.emplace_back(std::async(std::launch::async, [&]() {
      while (true) {
        auto idx = next.fetch_add(1);
        if (idx >= n) break;
        out[idx] = fn(idx);
      }
    }));
  }
  std::exception_ptr error;
  for (auto& job : jobs) {
    try {
      job.get();
    } catch (...) {
      if (!error) error = std::current_exception();
      next.store(n);
    }
  }
  if (error) {
    std::rethrow_exception(error);
  }
  return out;
}

// Batch surface of a tokenizer spread over worker threads. The tokenizer is
// shared read-only and must outlive this object.
class MultiThreadedTokenizer {
 public:
  explicit MultiThreadedTokenizer(const Tokenizer& tokenizer, std::size_t threads = 0)
      : tokenizer_(tokenizer), threads_(threads) {}

  [[nodiscard]] std::vector<std::vector<std::string>> TokenizeList(std::span<const std::string> texts) const;
  [[nodiscard]] std::vector<TokensWithOffsets> TokenizeListWithOffsets(std::span<const std::string> texts) const;
  [[nodiscard]] std::vector<TokenizedInput> EncodeList(std::span<const std::string> texts, std::size_t max_len,
                                                       TruncationStrategy strategy, std::size_t stride) const;
  [[nodiscard]] std::vector<TokenizedInput> EncodePairList(std::span<const std::pair<std::string, std::string>> pairs,
                                                           std::size_t max_len, TruncationStrategy strategy,
                                                           std::size_t stride) const;
  [[nodiscard]] std::vector<TokenizedInput> EncodeRequestList(std::span<const EncodeRequest> requests,
                                                              std::size_t max_len, TruncationStrategy strategy,
                                                              std::size_t stride) const;
  [[nodiscard]] std::vector<std::string> DecodeList(std::span<const std::vector<TokenId>> token_ids_list,
                                                    bool skip_special_tokens,
                                                    bool clean_up_tokenization_spaces) const;

  [[nodiscard]] std::size_t Threads() const { return threads_; }

 private:
  const Tokenizer& tokenizer_;
  std::size_t threads_;
};

}  // namespace subtok
