#include "subtok/tokenization_utils.hpp"

#include <algorithm>
#include <string>

#include "subtok/error.hpp"
#include "subtok/unicode.hpp"

namespace subtok {

namespace {

TokenRef slice(const TokenRef& token, std::size_t byte_begin, std::size_t byte_end, std::size_t char_begin,
               std::size_t char_end, Mask mask) {
  std::size_t n_refs = token.reference_offsets.size();
  char_begin = std::min(char_begin, n_refs);
  char_end = std::min(char_end, n_refs);
  return TokenRef(token.text.substr(byte_begin, byte_end - byte_begin),
                  token.reference_offsets.subspan(char_begin, char_end - char_begin), mask);
}

void push_trimmed(std::vector<TokenRef>& tokens, const TokenRef& token, std::size_t byte_begin,
                  std::size_t byte_end, std::size_t char_begin) {
  std::string_view trimmed = TrimEnd(token.text.substr(byte_begin, byte_end - byte_begin));
  std::size_t n = CountChars(trimmed);
  if (n > 0) {
    tokens.push_back(slice(token, byte_begin, byte_begin + trimmed.size(), char_begin, char_begin + n, Mask::none));
  }
}

// Rebuilds a token character by character. `fn` appends the replacement of
// each input character to its output buffer.
template <typename Fn>
void map_chars(Token& token, Fn fn) {
  std::string text;
  text.reserve(token.text.size());
  std::vector<OffsetSize> refs;
  refs.reserve(token.reference_offsets.size());
  std::u32string buf;
  std::size_t i = 0;
  std::size_t k = 0;
  char32_t c = 0;
  while (NextCodepoint(token.text, i, c)) {
    buf.clear();
    fn(c, buf);
    OffsetSize pos = k < token.reference_offsets.size() ? token.reference_offsets[k] : kNoOffset;
    for (char32_t out : buf) {
      AppendUtf8(out, text);
      refs.push_back(pos);
    }
    ++k;
  }
  token.text = std::move(text);
  token.reference_offsets = std::move(refs);
  token.UpdateOffset();
}

bool is_ascii(std::string_view s) {
  return std::all_of(s.begin(), s.end(), [](char c) { return static_cast<unsigned char>(c) < 0x80; });
}

void pop_back(TokenIdsWithOffsets& seq, std::vector<TokenId>& overflow) {
  overflow.insert(overflow.begin(), seq.ids.back());
  seq.ids.pop_back();
  if (!seq.offsets.empty()) seq.offsets.pop_back();
  if (!seq.reference_offsets.empty()) seq.reference_offsets.pop_back();
  if (!seq.masks.empty()) seq.masks.pop_back();
}

void prepend_window(const TokenIdsWithOffsets& seq, std::size_t stride, std::vector<TokenId>& overflow) {
  std::size_t window = std::min(seq.ids.size(), stride);
  if (window > 0) {
    overflow.insert(overflow.begin(), seq.ids.end() - static_cast<std::ptrdiff_t>(window), seq.ids.end());
  }
}

std::vector<TokenId> truncate_with_overflow(TokenIdsWithOffsets& seq, std::size_t num_tokens_to_remove,
                                            std::size_t stride) {
  std::size_t cutoff = seq.ids.size() - num_tokens_to_remove;
  std::vector<TokenId> overflow(seq.ids.begin() + static_cast<std::ptrdiff_t>(cutoff), seq.ids.end());
  seq.ids.resize(cutoff);
  seq.offsets.resize(std::min(seq.offsets.size(), cutoff));
  seq.reference_offsets.resize(std::min(seq.reference_offsets.size(), cutoff));
  seq.masks.resize(std::min(seq.masks.size(), cutoff));
  if (!overflow.empty()) {
    prepend_window(seq, stride, overflow);
  }
  return overflow;
}

}  // namespace

std::vector<TokenRef> SplitOnChar(TokenRef token, const std::function<bool(char32_t)>& pred, bool add_separators,
                                  Mask set_mask) {
  if (token.mask != Mask::none) {
    return {token};
  }
  std::vector<TokenRef> tokens;
  std::size_t char_begin = 0;
  std::size_t bytes_begin = 0;
  std::size_t char_idx = 0;
  std::size_t i = 0;
  char32_t c = 0;
  while (i < token.text.size()) {
    std::size_t byte_idx = i;
    NextCodepoint(token.text, i, c);
    if (pred(c)) {
      if (char_begin < char_idx) {
        push_trimmed(tokens, token, bytes_begin, byte_idx, char_begin);
      }
      if (add_separators) {
        tokens.push_back(slice(token, byte_idx, i, char_idx, char_idx + 1, set_mask));
      }
      char_begin = char_idx + 1;
      bytes_begin = i;
    }
    ++char_idx;
  }
  if (char_begin < char_idx) {
    tokens.push_back(slice(token, bytes_begin, token.text.size(), char_begin, char_idx, Mask::none));
  }
  return tokens;
}

std::vector<TokenRef> SplitOnSubstr(TokenRef token, const std::function<SubstrMatch(std::string_view)>& test_substr,
                                    bool add_separators) {
  if (token.mask != Mask::none) {
    return {token};
  }
  std::vector<TokenRef> tokens;
  std::size_t char_begin = 0;
  std::size_t bytes_begin = 0;
  std::size_t char_idx = 0;
  std::size_t i = 0;
  char32_t c = 0;
  while (i < token.text.size()) {
    std::size_t byte_idx = i;
    SubstrMatch match = test_substr(token.text.substr(byte_idx));
    if (match.chars > 0) {
      if (char_begin < char_idx) {
        push_trimmed(tokens, token, bytes_begin, byte_idx, char_begin);
      }
      if (add_separators) {
        tokens.push_back(
            slice(token, byte_idx, byte_idx + match.bytes, char_idx, char_idx + match.chars, match.mask));
      }
      i = byte_idx + match.bytes;
      char_idx += match.chars;
      char_begin = char_idx;
      bytes_begin = i;
      continue;
    }
    NextCodepoint(token.text, i, c);
    ++char_idx;
  }
  if (char_begin < char_idx) {
    tokens.push_back(slice(token, bytes_begin, token.text.size(), char_begin, char_idx, Mask::none));
  }
  return tokens;
}

std::vector<TokenRef> WhitespaceTokenize(TokenRef token) {
  return SplitOnChar(token, IsWhitespace, false, Mask::whitespace);
}

std::vector<TokenRef> SplitOnSpecialTokens(TokenRef token, const Vocab& vocab) {
  const auto& specials = vocab.SpecialValues();
  const std::string& unknown = vocab.UnknownValue();
  auto test_substr = [&](std::string_view s) {
    SubstrMatch best;
    for (const auto& [value, id] : specials) {
      if (value.size() > best.bytes && s.starts_with(value)) {
        best.bytes = value.size();
        best.chars = CountChars(value);
        best.mask = value == unknown ? Mask::unknown : Mask::special;
      }
    }
    return best;
  };
  return SplitOnSubstr(token, test_substr, true);
}

std::vector<TokenRef> SplitOnPunct(TokenRef token) {
  return SplitOnChar(token, IsPunctuation, true, Mask::punctuation);
}

std::vector<TokenRef> TokenizeCjkChars(TokenRef token) { return SplitOnChar(token, IsCjk, true, Mask::cjk); }

void Lowercase(Token& token) {
  map_chars(token, [](char32_t c, std::u32string& out) { AppendLowercase(c, out); });
}

void StripAccents(Token& token) {
  if (is_ascii(token.text)) {
    return;
  }
  std::u32string decomposed;
  map_chars(token, [&](char32_t c, std::u32string& out) {
    decomposed.clear();
    AppendNfd(c, decomposed);
    for (char32_t d : decomposed) {
      if (!IsNonSpacingMark(d)) {
        out.push_back(d);
      }
    }
  });
}

void CleanText(Token& token) {
  map_chars(token, [](char32_t c, std::u32string& out) {
    if (c == 0 || c == kReplacementChar || IsControl(c)) {
      return;
    }
    out.push_back(IsWhitespace(c) ? U' ' : c);
  });
}

void DecomposeNfkc(Token& token) {
  if (is_ascii(token.text)) {
    return;
  }
  std::u32string chars = DecodeUtf8(token.text);
  std::string text;
  std::vector<OffsetSize> refs;
  refs.reserve(chars.size());
  auto ref_at = [&](std::size_t k) { return k < token.reference_offsets.size() ? token.reference_offsets[k] : kNoOffset; };

  std::size_t seg_begin = 0;
  while (seg_begin < chars.size()) {
    std::size_t seg_end = seg_begin + 1;
    while (seg_end < chars.size() && !HasNfkcBoundaryBefore(chars[seg_end])) {
      ++seg_end;
    }
    std::u32string normalized = NormalizeNfkc(std::u32string_view(chars).substr(seg_begin, seg_end - seg_begin));
    std::size_t seg_len = seg_end - seg_begin;
    for (std::size_t k = 0; k < normalized.size(); ++k) {
      AppendUtf8(normalized[k], text);
      refs.push_back(ref_at(seg_begin + std::min(k, seg_len - 1)));
    }
    seg_begin = seg_end;
  }
  token.text = std::move(text);
  token.reference_offsets = std::move(refs);
  token.UpdateOffset();
}

void ReplaceWhitespace(Token& token, char32_t replacement) {
  map_chars(token, [replacement](char32_t c, std::u32string& out) { out.push_back(IsWhitespace(c) ? replacement : c); });
}

void ReplaceString(Token& token, std::string_view from, std::string_view to) {
  if (from.empty() || token.text.find(from) == std::string::npos) {
    return;
  }
  std::size_t from_chars = CountChars(from);
  std::size_t to_chars = CountChars(to);
  std::string text;
  std::vector<OffsetSize> refs;
  std::size_t i = 0;
  std::size_t k = 0;
  char32_t c = 0;
  auto ref_at = [&](std::size_t idx) { return idx < token.reference_offsets.size() ? token.reference_offsets[idx] : kNoOffset; };
  while (i < token.text.size()) {
    if (std::string_view(token.text).substr(i).starts_with(from)) {
      text.append(to);
      for (std::size_t r = 0; r < to_chars; ++r) {
        refs.push_back(ref_at(k + std::min(r, from_chars - 1)));
      }
      i += from.size();
      k += from_chars;
      continue;
    }
    std::size_t start = i;
    NextCodepoint(token.text, i, c);
    text.append(token.text, start, i - start);
    refs.push_back(ref_at(k));
    ++k;
  }
  token.text = std::move(text);
  token.reference_offsets = std::move(refs);
  token.UpdateOffset();
}

void FixMask(std::vector<Token>& tokens) {
  for (std::size_t i = 1; i < tokens.size(); ++i) {
    if (tokens[i].mask == Mask::continuation && tokens[i - 1].mask == Mask::none) {
      tokens[i - 1].mask = Mask::begin;
    }
  }
}

std::vector<TokenId> TruncateSequences(TokenIdsWithOffsets& first, std::optional<TokenIdsWithOffsets>& second,
                                       std::size_t num_tokens_to_remove, TruncationStrategy strategy,
                                       std::size_t stride) {
  if (num_tokens_to_remove == 0) {
    return {};
  }
  if (second.has_value()) {
    switch (strategy) {
      case TruncationStrategy::longest_first: {
        if (first.size() + second->size() < num_tokens_to_remove) {
          throw ValueError("Combined sequence length too short for requested truncation amount");
        }
        std::vector<TokenId> overflow;
        overflow.reserve(num_tokens_to_remove + stride);
        for (std::size_t n = 0; n < num_tokens_to_remove; ++n) {
          if (first.size() >= second->size()) {
            pop_back(first, overflow);
          } else {
            pop_back(*second, overflow);
          }
        }
        prepend_window(first, stride, overflow);
        return overflow;
      }
      case TruncationStrategy::only_first:
        if (first.size() < num_tokens_to_remove) {
          throw ValueError("First sequence too short for first only truncation");
        }
        return truncate_with_overflow(first, num_tokens_to_remove, stride);
      case TruncationStrategy::only_second:
        if (second->size() < num_tokens_to_remove) {
          throw ValueError("Second sequence too short for second only truncation");
        }
        return truncate_with_overflow(*second, num_tokens_to_remove, stride);
      case TruncationStrategy::do_not_truncate:
        throw ValueError("Truncation needed but no truncation requested");
    }
  }
  switch (strategy) {
    case TruncationStrategy::longest_first:
    case TruncationStrategy::only_first:
      if (first.size() < num_tokens_to_remove) {
        throw ValueError("First sequence too short for first only truncation");
      }
      return truncate_with_overflow(first, num_tokens_to_remove, stride);
    case TruncationStrategy::only_second:
      throw ValueError("Invalid truncation strategy for single sentence truncation");
    case TruncationStrategy::do_not_truncate:
      throw ValueError("Truncation needed but no truncation requested");
  }
  throw ValueError("Unknown truncation strategy");
}

}  // namespace subtok
