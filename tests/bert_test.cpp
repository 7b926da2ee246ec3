#undef NDEBUG
#include <cassert>
#include <optional>
#include <string>
#include <vector>

#include "subtok/bert_tokenizer.hpp"
#include "subtok/error.hpp"
#include "subtok/wordpiece.hpp"
#include "test_util.hpp"

using namespace subtok;

namespace {

BertTokenizer make_tokenizer() { return BertTokenizer(test::MakeBertTestVocab(), true, true); }

void test_wordpiece_split() {
  auto tok = make_tokenizer();
  auto out = tok.TokenizeWithOffsets("Unaffable hello!");
  assert((out.tokens == std::vector<std::string>{"una", "##ffa", "##ble", "hello", "!"}));
  assert((out.masks ==
          std::vector<Mask>{Mask::begin, Mask::continuation, Mask::continuation, Mask::none, Mask::punctuation}));
  assert(out.offsets[0] == Offset(0, 3));
  assert(out.offsets[1] == Offset(3, 6));
  assert(out.offsets[2] == Offset(6, 9));
  assert(out.offsets[3] == Offset(10, 15));
}

void test_unknown_word() {
  auto tok = make_tokenizer();
  auto out = tok.TokenizeWithOffsets("asdf hello");
  assert((out.tokens == std::vector<std::string>{"[UNK]", "hello"}));
  assert(out.masks[0] == Mask::unknown);
  assert(out.offsets[0] == Offset(0, 4));

  // partially covered words are unknown as a whole
  auto partial = tok.Tokenize("unafoo");
  assert((partial == std::vector<std::string>{"[UNK]"}));
}

void test_max_word_len() {
  auto vocab = test::MakeBertTestVocab();
  std::vector<OffsetSize> refs{0, 1, 2, 3, 4};
  TokenRef word("hello", refs);
  auto pieces = TokenizeWordpiece(word, *vocab, 3);
  assert(pieces.size() == 1);
  assert(pieces[0].text == "[UNK]");
  assert(pieces[0].reference_offsets.size() == 5);
  assert(TokenizeWordpiece(word, *vocab).front().text == "hello");
}

void test_framing() {
  auto tok = make_tokenizer();
  auto single = tok.Encode("Unaffable hello!", std::nullopt, 20, TruncationStrategy::longest_first, 0);
  assert((single.token_ids == std::vector<TokenId>{4, 11, 12, 13, 0, 3, 5}));
  assert((single.special_tokens_mask == std::vector<std::int8_t>{1, 0, 0, 0, 0, 0, 1}));
  assert(!single.token_offsets.front().has_value());
  assert(!single.token_offsets.back().has_value());
  assert(single.mask.front() == Mask::special);

  auto pair = tok.Encode("hello", "world", 20, TruncationStrategy::longest_first, 0);
  assert((pair.token_ids == std::vector<TokenId>{4, 0, 5, 1, 5}));
  assert((pair.segment_ids == std::vector<std::int8_t>{0, 0, 0, 1, 1}));
}

void test_truncation_counts_framing() {
  auto tok = make_tokenizer();
  auto out = tok.Encode("hello world !", std::nullopt, 3, TruncationStrategy::longest_first, 0);
  assert(out.num_truncated_tokens == 2);
  assert((out.token_ids == std::vector<TokenId>{4, 0, 5}));
  assert((out.overflowing_tokens == std::vector<TokenId>{1, 3}));

  auto one = tok.Encode("hello world !", std::nullopt, 4, TruncationStrategy::longest_first, 0);
  assert(one.num_truncated_tokens == 1);
  assert((one.token_ids == std::vector<TokenId>{4, 0, 1, 5}));
  assert((one.overflowing_tokens == std::vector<TokenId>{3}));
}

void test_decode() {
  auto tok = make_tokenizer();
  std::vector<TokenId> ids{4, 11, 12, 13, 0, 3, 5};
  assert(tok.Decode(ids, true, true) == "unaffable hello!");
  assert(tok.Decode(ids, false, false) == "[CLS] unaffable hello ! [SEP]");
}

void test_missing_special_token() {
  bool thrown = false;
  try {
    (void)BertTokenizer::MakeVocab(test::MakeValues({"[UNK]", "[CLS]", "[SEP]", "hello"}));
  } catch (const TokenNotFoundError&) {
    thrown = true;
  }
  assert(thrown);

  thrown = false;
  try {
    (void)BertTokenizer::FromFile("/nonexistent/subtok/vocab.txt", true, true);
  } catch (const FileNotFoundError&) {
    thrown = true;
  }
  assert(thrown);
}

void test_from_file() {
  test::TempFile file("[PAD]\n[UNK]\n[CLS]\n[SEP]\n[MASK]\nplay\n##ing\n");
  auto tok = BertTokenizer::FromFile(file.path(), true, false);
  auto out = tok.Encode("Playing", std::nullopt, 16, TruncationStrategy::longest_first, 0);
  assert((out.token_ids == std::vector<TokenId>{2, 5, 6, 3}));
}

}  // namespace

int main() {
  test_wordpiece_split();
  test_unknown_word();
  test_max_word_len();
  test_framing();
  test_truncation_counts_framing();
  test_decode();
  test_missing_special_token();
  test_from_file();
  return 0;
}
