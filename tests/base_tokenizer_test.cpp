#undef NDEBUG
#include <cassert>
#include <optional>
#include <string>
#include <vector>

#include "subtok/base_tokenizer.hpp"
#include "subtok/error.hpp"
#include "test_util.hpp"

using namespace subtok;

namespace {

BaseTokenizer make_tokenizer() { return BaseTokenizer(test::MakeBertTestVocab(), true, true); }

void test_special_token_in_sentence() {
  auto tok = make_tokenizer();
  auto out = tok.TokenizeWithOffsets("Sentence with [MASK] token.");
  assert((out.tokens == std::vector<std::string>{"sentence", "with", "[MASK]", "token", "."}));
  assert((out.masks == std::vector<Mask>{Mask::none, Mask::none, Mask::special, Mask::none, Mask::punctuation}));
  std::vector<std::optional<Offset>> expected{Offset(0, 8), Offset(9, 13), Offset(14, 20), Offset(21, 26),
                                              Offset(26, 27)};
  assert(out.offsets == expected);
  assert((out.reference_offsets[0] == std::vector<OffsetSize>{0, 1, 2, 3, 4, 5, 6, 7}));
}

void test_accents_and_punctuation() {
  auto tok = make_tokenizer();
  auto out = tok.TokenizeWithOffsets("Allons, Flipote, allons; que d'eux je me délivre.");
  assert((out.tokens == std::vector<std::string>{"allons", ",", "flipote", ",", "allons", ";", "que", "d", "'", "eux",
                                                 "je", "me", "delivre", "."}));
  assert(out.offsets[0] == Offset(0, 6));
  assert(out.offsets[2] == Offset(8, 15));
  assert(out.offsets[12] == Offset(41, 48));
  assert(out.offsets[13] == Offset(48, 49));
}

void test_cjk_and_unknown() {
  auto tok = make_tokenizer();
  auto out = tok.TokenizeWithOffsets("[UNK]中华人民共和国 [PAD] asdf");
  assert((out.tokens == std::vector<std::string>{"[UNK]", "中", "华", "人", "民", "共", "和", "国", "[PAD]", "asdf"}));
  std::vector<Mask> masks{Mask::unknown};
  masks.insert(masks.end(), 7, Mask::cjk);
  masks.push_back(Mask::special);
  masks.push_back(Mask::none);
  assert(out.masks == masks);
  assert(out.offsets[1] == Offset(5, 6));
  assert(out.offsets[8] == Offset(13, 18));
  assert(out.offsets[9] == Offset(19, 23));
}

void test_blank_input() {
  auto tok = make_tokenizer();
  assert(tok.Tokenize("").empty());
  assert(tok.Tokenize(" \t\n ").empty());
  auto encoded = tok.Encode("   ", std::nullopt, 10, TruncationStrategy::longest_first, 0);
  assert(encoded.token_ids.empty());
  assert(encoded.num_truncated_tokens == 0);
}

void test_pair_longest_first() {
  auto tok = make_tokenizer();
  auto out = tok.Encode("hello world!", "!This is the second sentence!!!", 10, TruncationStrategy::longest_first, 0);
  assert(out.num_truncated_tokens == 2);
  assert((out.token_ids == std::vector<TokenId>{0, 1, 3, 3, 2, 2, 2, 2, 2, 3}));
  assert((out.segment_ids == std::vector<std::int8_t>{0, 0, 0, 1, 1, 1, 1, 1, 1, 1}));
  assert((out.overflowing_tokens == std::vector<TokenId>{3, 3}));
  assert(out.special_tokens_mask.size() == out.token_ids.size());
  assert(out.token_offsets.size() == out.token_ids.size());
  assert(out.reference_offsets.size() == out.token_ids.size());
  assert(out.mask.size() == out.token_ids.size());
}

void test_pair_tie_drops_from_first() {
  auto tok = make_tokenizer();
  auto out = tok.Encode("hello world", "world hello", 3, TruncationStrategy::longest_first, 0);
  assert(out.num_truncated_tokens == 1);
  assert((out.token_ids == std::vector<TokenId>{0, 1, 0}));
  assert((out.overflowing_tokens == std::vector<TokenId>{1}));
}

void test_single_overflow() {
  auto tok = make_tokenizer();
  std::string text = "[UNK] a ! c ! e ! g ! i ! [PAD] a ! c ! e ! g ! i !";
  auto out = tok.Encode(text, std::nullopt, 10, TruncationStrategy::longest_first, 0);
  assert(out.num_truncated_tokens == 12);
  assert((out.overflowing_tokens == std::vector<TokenId>{3, 10, 2, 3, 2, 3, 2, 3, 2, 3, 2, 3}));
  assert(out.token_ids.size() == 10);

  auto strided = tok.Encode(text, std::nullopt, 10, TruncationStrategy::longest_first, 2);
  assert(strided.overflowing_tokens.size() == 14);
  assert(strided.overflowing_tokens[0] == strided.token_ids[8]);
  assert(strided.overflowing_tokens[1] == strided.token_ids[9]);
}

void test_truncation_errors() {
  auto tok = make_tokenizer();
  bool thrown = false;
  try {
    (void)tok.Encode("hello world hello", std::nullopt, 2, TruncationStrategy::do_not_truncate, 0);
  } catch (const ValueError&) {
    thrown = true;
  }
  assert(thrown);

  thrown = false;
  try {
    (void)tok.Encode("hello world hello", std::nullopt, 2, TruncationStrategy::only_second, 0);
  } catch (const ValueError&) {
    thrown = true;
  }
  assert(thrown);

  thrown = false;
  try {
    (void)tok.Encode("hello", "world world world", 2, TruncationStrategy::only_first, 0);
  } catch (const ValueError&) {
    thrown = true;
  }
  assert(thrown);

  auto out = tok.Encode("hello", "world world world", 2, TruncationStrategy::only_second, 0);
  assert((out.token_ids == std::vector<TokenId>{0, 1}));
  assert((out.overflowing_tokens == std::vector<TokenId>{1, 1}));
}

void test_decode() {
  auto tok = make_tokenizer();
  std::vector<TokenId> ids{10, 0, 1, 2, 3};
  assert(tok.Decode(ids, true, true) == "hello world!");
  assert(tok.Decode(ids, false, false) == "[PAD] hello world [UNK] !");
  assert(tok.Decode(ids, false, true) == "[PAD] hello world [UNK]!");

  std::vector<std::vector<TokenId>> batch{{0, 3}, {1}};
  assert((tok.DecodeList(batch, true, true) == std::vector<std::string>{"hello!", "world"}));
}

void test_clean_up_tokenization() {
  assert(Tokenizer::CleanUpTokenization("hello , world . is it ?") == "hello, world. is it?");
  assert(Tokenizer::CleanUpTokenization("i do n't know , it 's fine") == "i don't know, it's fine");
  assert(Tokenizer::CleanUpTokenization("we 're here and i 'm ok") == "we're here and i'm ok");
  // " do not" is rewritten before the contraction rules run
  assert(Tokenizer::CleanUpTokenization("you do not") == "you don't");
}

void test_convert_tokens_to_ids() {
  auto tok = make_tokenizer();
  std::vector<std::string> tokens{"hello", "[SEP]", "missing", "!"};
  assert((tok.ConvertTokensToIds(tokens) == std::vector<TokenId>{0, 5, 2, 3}));
}

void test_consolidated_iterator() {
  std::vector<Token> tokens{
      Token("una", {0, 1, 2}, Mask::begin),
      Token("##ffa", {3, 4, 5}, Mask::continuation),
      Token("##ble", {6, 7, 8}, Mask::continuation),
      Token("hello", {10, 11, 12, 13, 14}, Mask::none),
      Token("!", {15}, Mask::punctuation),
  };
  auto it = IterConsolidateTokens(tokens);
  std::vector<std::size_t> sizes;
  std::size_t covered = 0;
  while (auto group = it.Next()) {
    assert(&(*group)[0] == &tokens[covered]);
    sizes.push_back(group->size());
    covered += group->size();
  }
  assert((sizes == std::vector<std::size_t>{3, 1, 1}));
  assert(covered == tokens.size());
  assert(!it.Next());
}

void test_list_apis() {
  auto tok = make_tokenizer();
  std::vector<std::string> texts{"hello world", "", "Hello!"};
  auto lists = tok.TokenizeList(texts);
  assert(lists.size() == 3);
  assert(lists[1].empty());
  assert((lists[2] == std::vector<std::string>{"hello", "!"}));

  auto encoded = tok.EncodeList(texts, 10, TruncationStrategy::longest_first, 0);
  assert((encoded[0].token_ids == std::vector<TokenId>{0, 1}));
  assert((encoded[2].token_ids == std::vector<TokenId>{0, 3}));

  std::vector<std::pair<std::string, std::string>> pairs{{"hello", "world"}};
  auto pair_encoded = tok.EncodePairList(pairs, 10, TruncationStrategy::longest_first, 0);
  assert((pair_encoded[0].segment_ids == std::vector<std::int8_t>{0, 1}));
}

void test_vocab_file() {
  test::TempFile file("[UNK]\nhello  \nworld\n!\n");
  auto tok = BaseTokenizer::FromFile(file.path(), true, false);
  assert(tok.GetVocab().Size() == 4);
  assert((tok.ConvertTokensToIds(tok.Tokenize("Hello world!")) == std::vector<TokenId>{1, 2, 3}));
}

}  // namespace

int main() {
  test_special_token_in_sentence();
  test_accents_and_punctuation();
  test_cjk_and_unknown();
  test_blank_input();
  test_pair_longest_first();
  test_pair_tie_drops_from_first();
  test_single_overflow();
  test_truncation_errors();
  test_decode();
  test_clean_up_tokenization();
  test_convert_tokens_to_ids();
  test_consolidated_iterator();
  test_list_apis();
  test_vocab_file();
  return 0;
}
