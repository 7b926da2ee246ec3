#undef NDEBUG
#include <cassert>
#include <optional>
#include <string>
#include <vector>

#include "subtok/error.hpp"
#include "subtok/tokenization_utils.hpp"
#include "subtok/unicode.hpp"
#include "test_util.hpp"

using namespace subtok;

namespace {

std::vector<OffsetSize> iota_refs(std::string_view text) {
  std::vector<OffsetSize> refs(CountChars(text));
  for (std::size_t i = 0; i < refs.size(); ++i) refs[i] = static_cast<OffsetSize>(i);
  return refs;
}

TokenIdsWithOffsets make_ids(std::vector<TokenId> ids) {
  TokenIdsWithOffsets seq;
  for (TokenId id : ids) {
    seq.ids.push_back(id);
    seq.offsets.push_back(std::nullopt);
    seq.reference_offsets.emplace_back();
    seq.masks.push_back(Mask::none);
  }
  return seq;
}

void test_splitting() {
  std::string text = "Hello,  world!";
  auto refs = iota_refs(text);
  TokenRef input(text, refs);

  auto words = WhitespaceTokenize(input);
  assert(words.size() == 2);
  assert(words[0].text == "Hello,");
  assert(words[1].text == "world!");
  assert(words[1].offset == Offset(8, 14));

  auto punct = SplitOnPunct(words[0]);
  assert(punct.size() == 2);
  assert(punct[1].text == ",");
  assert(punct[1].mask == Mask::punctuation);
  assert(punct[1].offset == Offset(5, 6));

  // tokens that already carry a mask are left alone
  assert(SplitOnPunct(punct[1]).size() == 1);

  std::string cjk = "ab\xE4\xB8\xAD" "cd";
  auto cjk_refs = iota_refs(cjk);
  auto parts = TokenizeCjkChars(TokenRef(cjk, cjk_refs));
  assert(parts.size() == 3);
  assert(parts[1].mask == Mask::cjk);
  assert(parts[2].offset == Offset(3, 5));
}

void test_special_tokens() {
  auto vocab = test::MakeBertTestVocab();
  std::string text = "a[MASK]b [UNK]";
  auto refs = iota_refs(text);
  auto parts = SplitOnSpecialTokens(TokenRef(text, refs), *vocab);
  assert(parts.size() == 4);
  assert(parts[0].text == "a");
  assert(parts[1].text == "[MASK]" && parts[1].mask == Mask::special);
  assert(parts[1].offset == Offset(1, 7));
  assert(parts[2].text == "b");
  assert(parts[3].text == "[UNK]" && parts[3].mask == Mask::unknown);
}

void test_char_transforms() {
  // U+0130 lowercases to two characters that share one position
  Token dotted("x\xC4\xB0y");
  Lowercase(dotted);
  assert(dotted.text == "xi\xCC\x87y");
  assert((dotted.reference_offsets == std::vector<OffsetSize>{0, 1, 1, 2}));

  Token accents("d\xC3\xA9livre");
  StripAccents(accents);
  assert(accents.text == "delivre");
  assert(accents.reference_offsets.size() == 7);
  assert(accents.offset == Offset(0, 7));

  Token noisy(std::string("a\x01") + "b\tc");
  CleanText(noisy);
  assert(noisy.text == "ab c");
  assert((noisy.reference_offsets == std::vector<OffsetSize>{0, 2, 3, 4}));

  Token ligature("\xEF\xAC\x81x");
  DecomposeNfkc(ligature);
  assert(ligature.text == "fix");
  assert((ligature.reference_offsets == std::vector<OffsetSize>{0, 0, 1}));

  Token spaced("a b");
  ReplaceWhitespace(spaced, 0x2581);
  assert(spaced.text == "a\xE2\x96\x81" "b");
  assert(spaced.reference_offsets.size() == 3);

  Token quoted("``hi''");
  ReplaceString(quoted, "``", "\"");
  ReplaceString(quoted, "''", "\"");
  assert(quoted.text == "\"hi\"");
  assert((quoted.reference_offsets == std::vector<OffsetSize>{0, 2, 3, 4}));
}

void test_fix_mask() {
  std::vector<Token> tokens{Token("a", {0}, Mask::none), Token("b", {1}, Mask::continuation),
                            Token("c", {2}, Mask::punctuation), Token("d", {3}, Mask::continuation)};
  FixMask(tokens);
  assert(tokens[0].mask == Mask::begin);
  assert(tokens[2].mask == Mask::punctuation);
}

void test_truncate_pair() {
  auto first = make_ids({1, 2, 3});
  std::optional<TokenIdsWithOffsets> second = make_ids({4, 5, 6, 7, 8});
  auto overflow = TruncateSequences(first, second, 4, TruncationStrategy::longest_first, 1);
  // second, second, then first on the tie, then second again
  assert((first.ids == std::vector<TokenId>{1, 2}));
  assert((second->ids == std::vector<TokenId>{4, 5}));
  assert((overflow == std::vector<TokenId>{2, 6, 3, 7, 8}));
  assert(first.masks.size() == first.ids.size());
  assert(second->offsets.size() == second->ids.size());

  auto a = make_ids({1, 2, 3});
  std::optional<TokenIdsWithOffsets> b = make_ids({4, 5});
  auto only_second = TruncateSequences(a, b, 1, TruncationStrategy::only_second, 1);
  assert((b->ids == std::vector<TokenId>{4}));
  assert((only_second == std::vector<TokenId>{4, 5}));

  bool thrown = false;
  try {
    auto x = make_ids({1});
    std::optional<TokenIdsWithOffsets> y = make_ids({2});
    (void)TruncateSequences(x, y, 3, TruncationStrategy::longest_first, 0);
  } catch (const ValueError&) {
    thrown = true;
  }
  assert(thrown);
}

void test_truncate_single() {
  auto seq = make_ids({1, 2, 3, 4, 5});
  std::optional<TokenIdsWithOffsets> none;
  auto overflow = TruncateSequences(seq, none, 2, TruncationStrategy::only_first, 2);
  assert((seq.ids == std::vector<TokenId>{1, 2, 3}));
  assert((overflow == std::vector<TokenId>{2, 3, 4, 5}));

  auto untouched = make_ids({1, 2});
  assert(TruncateSequences(untouched, none, 0, TruncationStrategy::do_not_truncate, 0).empty());
  assert(untouched.ids.size() == 2);
}

}  // namespace

int main() {
  test_splitting();
  test_special_tokens();
  test_char_transforms();
  test_fix_mask();
  test_truncate_pair();
  test_truncate_single();
  return 0;
}
