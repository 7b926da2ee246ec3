#undef NDEBUG
#include <cassert>
#include <vector>

#include "subtok/bert_tokenizer.hpp"
#include "test_util.hpp"

int main() {
  using namespace subtok;

  BertTokenizer tokenizer(test::MakeBertTestVocab(), true, false);
  auto encoded = tokenizer.Encode("Hello world!", std::nullopt, 16, TruncationStrategy::longest_first, 0);
  assert(!encoded.token_ids.empty());
  assert(encoded.token_ids.size() == encoded.segment_ids.size());
  auto text = tokenizer.Decode(encoded.token_ids, true, true);
  assert(!text.empty());

  return 0;
}
