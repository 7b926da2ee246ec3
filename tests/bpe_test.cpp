#undef NDEBUG
#include <cassert>
#include <optional>
#include <string>
#include <vector>

#include "subtok/bpe.hpp"
#include "subtok/ctrl_tokenizer.hpp"
#include "subtok/error.hpp"
#include "subtok/gpt2_tokenizer.hpp"
#include "subtok/openai_gpt_tokenizer.hpp"
#include "subtok/roberta_tokenizer.hpp"
#include "test_util.hpp"

using namespace subtok;

namespace {

// U+0120, the byte-level image of a space
const std::string kG = "\xC4\xA0";

std::string gpt2_merges() {
  return "#version: 0.2\n"
         "h e\n"
         "l l\n"
         "he ll\n"
         "hell o\n" +
         kG + " w\n" + "o r\n" + kG + "w or\n" + kG + "wor l\n" + kG + "worl d\n" + kG + " hello\n";
}

std::string gpt2_vocab() {
  return R"({"<|endoftext|>": 0, "hello": 1, ")" + kG + R"(world": 2, "!": 3, ")" + kG +
         R"(": 4, "h": 5, "e": 6, "l": 7, "o": 8, "w": 9, "r": 10, "d": 11, "ll": 12, "he": 13, "hell": 14})";
}

void test_byte_alphabet() {
  const auto& table = ByteToUnicode();
  assert(table[static_cast<unsigned char>('a')] == U'a');
  assert(table[static_cast<unsigned char>(' ')] == 0x120);
  assert(table[static_cast<unsigned char>('\n')] == 0x10A);
  assert(UnicodeToByte(0x120) == std::optional<std::uint8_t>(32));
  assert(!UnicodeToByte(0x4E2D).has_value());
  assert(BytesToUnicodeString(" a") == kG + "a");
  std::string text = "h\xC3\xA9llo\n\t world";
  assert(UnicodeStringToBytes(BytesToUnicodeString(text)) == text);

  // overlong and surrogate byte sequences come back as replacement characters
  assert(UnicodeStringToBytes(BytesToUnicodeString("a\xC0\xAF")) == "a\xEF\xBF\xBD\xEF\xBF\xBD");
  assert(UnicodeStringToBytes(BytesToUnicodeString("\xED\xA0\x80")) ==
         "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
}

void test_merges_file() {
  test::TempFile merges("#version: 0.2\nh e\n\nlonely\nl l\nh e\n");
  auto ranks = BpePairVocab::FromFile(merges.path());
  assert(ranks.Size() == 2);
  // a repeated pair keeps its last rank
  assert(ranks.GetRank("h", "e") == std::optional<std::int64_t>(2));
  assert(ranks.GetRank("l", "l") == std::optional<std::int64_t>(1));
  assert(!ranks.GetRank("l", "o").has_value());
}

void test_bpe_functions() {
  test::TempFile merges("#version: 0.2\nh e\nl l\nhe ll\nhell o</w>\nl d</w>\n");
  auto ranks = BpePairVocab::FromFile(merges.path());

  auto plain = Bpe("hello", ranks);
  assert((plain.pieces == std::vector<std::string>{"hell", "o"}));
  assert((plain.char_counts == std::vector<std::size_t>{4, 1}));

  auto gpt = OpenAiGptBpe("hello", ranks);
  assert((gpt.pieces == std::vector<std::string>{"hello</w>"}));
  assert((gpt.char_counts == std::vector<std::size_t>{5}));

  auto ctrl = CtrlBpe("held", ranks);
  assert((ctrl.pieces == std::vector<std::string>{"he@@", "ld"}));
  assert((ctrl.char_counts == std::vector<std::size_t>{2, 2}));
}

void test_cache() {
  BpeCache cache(2);
  BpeOutput out{{"a"}, {1}};
  cache.Put("a", out);
  cache.Put("b", out);
  assert(cache.Get("a").has_value());
  cache.Put("c", out);
  assert(cache.Size() == 2);
  assert(!cache.Get("b").has_value());
  assert(cache.Get("a").has_value());
  assert(cache.Get("c").has_value());
  cache.Clear();
  assert(cache.Size() == 0);

  BpeCache disabled(0);
  disabled.Put("a", out);
  assert(disabled.Size() == 0);
  assert(!disabled.Get("a").has_value());
}

void test_gpt2() {
  test::TempFile vocab(gpt2_vocab(), ".json");
  test::TempFile merges(gpt2_merges());
  auto tok = Gpt2Tokenizer::FromFile(vocab.path(), merges.path(), false);

  auto out = tok.TokenizeWithOffsets("hello world!");
  assert((out.tokens == std::vector<std::string>{"hello", kG + "world", "!"}));
  assert(out.offsets[0] == Offset(0, 5));
  assert(out.offsets[1] == Offset(5, 11));
  assert(out.offsets[2] == Offset(11, 12));

  auto split = tok.TokenizeWithOffsets("hel");
  assert((split.tokens == std::vector<std::string>{"he", "l"}));
  assert((split.masks == std::vector<Mask>{Mask::begin, Mask::continuation}));

  auto special = tok.Tokenize("<|endoftext|>hello");
  assert((special == std::vector<std::string>{"<|endoftext|>", "hello"}));

  auto encoded = tok.Encode("hello world!", std::nullopt, 10, TruncationStrategy::longest_first, 0);
  assert((encoded.token_ids == std::vector<TokenId>{1, 2, 3}));
  assert((encoded.segment_ids == std::vector<std::int8_t>{0, 0, 0}));

  // the same input again goes through the cache
  assert(tok.Tokenize("hello world!") == out.tokens);

  std::vector<TokenId> ids{1, 2, 3};
  assert(tok.Decode(ids, false, false) == "hello world!");

  auto lowered = Gpt2Tokenizer::FromFile(vocab.path(), merges.path(), true, 0);
  assert((lowered.ConvertTokensToIds(lowered.Tokenize("HELLO")) == std::vector<TokenId>{1}));
}

void test_roberta() {
  test::TempFile vocab(R"({"<unk>": 0, "<s>": 1, "</s>": 2, "<pad>": 3, "<mask>": 4, ")" + kG + R"(hello": 5, ")" +
                           kG + R"(world": 6, "!": 7, "hello": 8})",
                       ".json");
  test::TempFile merges(gpt2_merges());
  auto tok = RobertaTokenizer::FromFile(vocab.path(), merges.path(), false);

  auto out = tok.TokenizeWithOffsets("hello world!");
  assert((out.tokens == std::vector<std::string>{kG + "hello", kG + "world", "!"}));
  assert(out.offsets[0] == Offset(0, 5));
  assert((out.reference_offsets[0] == std::vector<OffsetSize>{0, 1, 2, 3, 4}));
  assert(out.offsets[1] == Offset(5, 11));

  auto single = tok.Encode("hello world!", std::nullopt, 16, TruncationStrategy::longest_first, 0);
  assert((single.token_ids == std::vector<TokenId>{1, 5, 6, 7, 2}));
  assert((single.special_tokens_mask == std::vector<std::int8_t>{1, 0, 0, 0, 1}));

  auto pair = tok.Encode("hello", "world", 16, TruncationStrategy::longest_first, 0);
  assert((pair.token_ids == std::vector<TokenId>{1, 5, 2, 2, 6, 2}));
  assert((pair.segment_ids == std::vector<std::int8_t>{0, 0, 0, 1, 1, 1}));

  std::vector<TokenId> ids{1, 5, 6, 7, 2};
  assert(tok.Decode(ids, true, true) == " hello world!");

  auto no_prefix = RobertaTokenizer::FromFile(vocab.path(), merges.path(), false, false);
  assert((no_prefix.ConvertTokensToIds(no_prefix.Tokenize("hello")) == std::vector<TokenId>{8}));

  test::TempFile incomplete(R"({"<unk>": 0, "<s>": 1, "</s>": 2})", ".json");
  bool thrown = false;
  try {
    (void)RobertaTokenizer::FromFile(incomplete.path(), merges.path(), false);
  } catch (const TokenNotFoundError&) {
    thrown = true;
  }
  assert(thrown);
}

void test_openai_gpt() {
  test::TempFile vocab(
      R"({"<unk>": 0, "hello</w>": 1, "world</w>": 2, "!</w>": 3, "h": 4, "he": 5, "hell": 6, "ll": 7, "l</w>": 8})",
      ".json");
  test::TempFile merges("#version: 0.2\nh e\nl l\nhe ll\nhell o</w>\nw o\nwo r\nl d</w>\nwor ld</w>\n");
  auto tok = OpenAiGptTokenizer::FromFile(vocab.path(), merges.path());

  auto out = tok.TokenizeWithOffsets("Hello world!");
  assert((out.tokens == std::vector<std::string>{"hello</w>", "world</w>", "!</w>"}));
  assert(out.offsets[0] == Offset(0, 5));
  assert(out.offsets[1] == Offset(6, 11));
  assert(out.offsets[2] == Offset(11, 12));

  auto split = tok.TokenizeWithOffsets("hel");
  assert((split.tokens == std::vector<std::string>{"he", "l</w>"}));
  assert((split.masks == std::vector<Mask>{Mask::begin, Mask::continuation}));
  assert(split.offsets[1] == Offset(2, 3));

  std::vector<TokenId> ids{1, 2, 3};
  assert(tok.Decode(ids, false, false) == "hello world !");
  assert(tok.Decode(ids, false, true) == "hello world!");
}

void test_ctrl() {
  test::TempFile vocab(R"({"<unk>": 0, "hello": 1, "wor@@": 2, "ld": 3})", ".json");
  test::TempFile merges("#version: 0.2\nh e\nl l\nhe ll\nhell o</w>\nw o\nwo r\nl d</w>\n");
  auto tok = CtrlTokenizer::FromFile(vocab.path(), merges.path(), true);

  auto out = tok.TokenizeWithOffsets("Hello world");
  assert((out.tokens == std::vector<std::string>{"hello", "wor@@", "ld"}));
  assert((out.masks == std::vector<Mask>{Mask::none, Mask::begin, Mask::continuation}));
  assert(out.offsets[1] == Offset(6, 9));
  assert(out.offsets[2] == Offset(9, 11));

  std::vector<TokenId> ids{1, 2, 3};
  assert(tok.Decode(ids, false, false) == "hello world");
}

void test_bad_vocab_file() {
  test::TempFile not_json("hello\nworld\n", ".json");
  test::TempFile merges(gpt2_merges());
  bool thrown = false;
  try {
    (void)Gpt2Tokenizer::FromFile(not_json.path(), merges.path(), false);
  } catch (const VocabularyParsingError&) {
    thrown = true;
  }
  assert(thrown);
}

}  // namespace

int main() {
  test_byte_alphabet();
  test_merges_file();
  test_bpe_functions();
  test_cache();
  test_gpt2();
  test_roberta();
  test_openai_gpt();
  test_ctrl();
  test_bad_vocab_file();
  return 0;
}
