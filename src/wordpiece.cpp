#include "subtok/wordpiece.hpp"

#include <algorithm>
#include <string>

#include "subtok/tokenization_utils.hpp"
#include "subtok/unicode.hpp"

namespace subtok {

namespace {

std::vector<Token> unknown_word(TokenRef token, const Vocab& vocab) {
  std::vector<Token> out;
  out.emplace_back(vocab.UnknownValue(),
                   std::vector<OffsetSize>(token.reference_offsets.begin(), token.reference_offsets.end()),
                   Mask::unknown);
  return out;
}

}  // namespace

std::vector<Token> TokenizeWordpiece(TokenRef token, const Vocab& vocab, std::size_t max_word_len) {
  if (token.text.empty()) {
    return {};
  }
  // byte position of every character boundary, including the end
  std::vector<std::size_t> bounds;
  bounds.reserve(token.text.size() + 1);
  std::size_t i = 0;
  char32_t c = 0;
  while (i < token.text.size()) {
    bounds.push_back(i);
    NextCodepoint(token.text, i, c);
  }
  bounds.push_back(token.text.size());
  std::size_t n_chars = bounds.size() - 1;
  if (n_chars > max_word_len) {
    return unknown_word(token, vocab);
  }

  std::vector<Token> pieces;
  std::string candidate;
  std::size_t start = 0;
  while (start < n_chars) {
    std::size_t end = n_chars;
    bool found = false;
    while (end > start) {
      candidate.clear();
      if (start > 0) {
        candidate = "##";
      }
      candidate.append(token.text, bounds[start], bounds[end] - bounds[start]);
      if (vocab.Contains(candidate)) {
        std::size_t ref_end = std::min(end, token.reference_offsets.size());
        std::size_t ref_begin = std::min(start, ref_end);
        pieces.emplace_back(candidate,
                            std::vector<OffsetSize>(token.reference_offsets.begin() + ref_begin,
                                                    token.reference_offsets.begin() + ref_end),
                            start > 0 ? Mask::continuation : token.mask);
        found = true;
        break;
      }
      --end;
    }
    if (!found) {
      return unknown_word(token, vocab);
    }
    start = end;
  }
  FixMask(pieces);
  return pieces;
}

}  // namespace subtok
