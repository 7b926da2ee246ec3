#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "subtok/bert_tokenizer.hpp"

int main() {
  using namespace subtok;

  ValueMap values;
  TokenId next = 0;
  for (const char* token : {"[UNK]", "[CLS]", "[SEP]", "[MASK]", "[PAD]", "hello", "world", "token", "##ization",
                            "fast", "is", "!", ","}) {
    values.emplace(token, next++);
  }
  BertTokenizer tokenizer(BertTokenizer::MakeVocab(std::move(values)), true, false);

  std::string text = "Hello, world! Tokenization is fast";
  auto tokens = tokenizer.TokenizeWithOffsets(text);
  std::cout << "Tokens:";
  for (std::size_t i = 0; i < tokens.tokens.size(); ++i) {
    std::cout << ' ' << tokens.tokens[i];
    if (tokens.offsets[i]) {
      std::cout << '[' << tokens.offsets[i]->begin << ',' << tokens.offsets[i]->end << ')';
    }
  }

  auto encoded = tokenizer.Encode(text, "hello world", 12, TruncationStrategy::longest_first, 0);
  std::cout << "\nEncoded IDs:";
  for (auto id : encoded.token_ids) {
    std::cout << ' ' << id;
  }
  std::cout << "\nOverflow:";
  for (auto id : encoded.overflowing_tokens) {
    std::cout << ' ' << id;
  }
  std::cout << "\nDecoded: " << tokenizer.Decode(encoded.token_ids, true, true) << '\n';
  return 0;
}
