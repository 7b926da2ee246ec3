#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <memory>
#include <random>
#include <string>
#include <string_view>

#include "subtok/bert_tokenizer.hpp"
#include "subtok/vocab.hpp"

namespace subtok::test {

// Writes `contents` to a fresh file under the temp directory and returns its
// path. The file is removed when the returned object goes out of scope.
class TempFile {
 public:
  explicit TempFile(std::string_view contents, std::string_view suffix = ".txt") {
    static std::atomic<int> counter{0};
    static const unsigned int run_id = std::random_device{}();
    path_ = (std::filesystem::temp_directory_path() /
             ("subtok_test_" + std::to_string(run_id) + "_" + std::to_string(counter.fetch_add(1)) +
              std::string(suffix)))
                .string();
    std::ofstream out(path_, std::ios::binary);
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
  }
  ~TempFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }
  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  [[nodiscard]] const std::string& path() const { return path_; }

 private:
  std::string path_;
};

// Token -> id in list order.
inline ValueMap MakeValues(std::initializer_list<std::string_view> tokens) {
  ValueMap values;
  TokenId next = 0;
  for (auto token : tokens) {
    values.emplace(std::string(token), next++);
  }
  return values;
}

// {hello:0, world:1, [UNK]:2, !:3, [CLS]:4, [SEP]:5, [MASK]:6, 中:7, 华:8,
// 人:9, [PAD]:10, una:11, ##ffa:12, ##ble:13}
inline std::shared_ptr<const Vocab> MakeBertTestVocab() {
  return BertTokenizer::MakeVocab(MakeValues({"hello", "world", "[UNK]", "!", "[CLS]", "[SEP]", "[MASK]", "中", "华",
                                              "人", "[PAD]", "una", "##ffa", "##ble"}));
}

}  // namespace subtok::test
