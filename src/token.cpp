#include "subtok/token.hpp"

#include <algorithm>
#include <utility>

#include "subtok/unicode.hpp"

namespace subtok {

std::string_view MaskName(Mask mask) {
  switch (mask) {
    case Mask::none:
      return "none";
    case Mask::whitespace:
      return "whitespace";
    case Mask::punctuation:
      return "punctuation";
    case Mask::cjk:
      return "cjk";
    case Mask::special:
      return "special";
    case Mask::begin:
      return "begin";
    case Mask::continuation:
      return "continuation";
    case Mask::unfinished:
      return "unfinished";
    case Mask::unknown:
      return "unknown";
  }
  return "none";
}

Offset OffsetFromReferences(std::span<const OffsetSize> reference_offsets) {
  bool found = false;
  OffsetSize lo = 0;
  OffsetSize hi = 0;
  for (OffsetSize pos : reference_offsets) {
    if (pos == kNoOffset) {
      continue;
    }
    if (!found) {
      lo = hi = pos;
      found = true;
    } else {
      lo = std::min(lo, pos);
      hi = std::max(hi, pos);
    }
  }
  if (!found) {
    return Offset{};
  }
  return Offset{lo, hi + 1};
}

TokenRef::TokenRef(std::string_view text, std::span<const OffsetSize> reference_offsets)
    : TokenRef(text, reference_offsets, Mask::none) {}

TokenRef::TokenRef(std::string_view text, std::span<const OffsetSize> reference_offsets, Mask mask)
    : text(text), offset(OffsetFromReferences(reference_offsets)), reference_offsets(reference_offsets), mask(mask) {}

TokenRef::TokenRef(const Token& token)
    : text(token.text), offset(token.offset), reference_offsets(token.reference_offsets), mask(token.mask) {}

Token TokenRef::ToOwned() const {
  Token token;
  token.text = std::string(text);
  token.offset = offset;
  token.reference_offsets.assign(reference_offsets.begin(), reference_offsets.end());
  token.mask = mask;
  return token;
}

Token::Token(std::string text) : text(std::move(text)) {
  auto n = static_cast<OffsetSize>(CountChars(this->text));
  reference_offsets.reserve(n);
  for (OffsetSize i = 0; i < n; ++i) {
    reference_offsets.push_back(i);
  }
  offset = Offset{0, n};
}

Token::Token(std::string text, std::vector<OffsetSize> reference_offsets, Mask mask)
    : text(std::move(text)), reference_offsets(std::move(reference_offsets)), mask(mask) {
  UpdateOffset();
}

void Token::UpdateOffset() { offset = OffsetFromReferences(reference_offsets); }

void Token::DropUnmappedOffsets() {
  std::erase(reference_offsets, kNoOffset);
  UpdateOffset();
}

void TokenIdsWithSpecialTokens::Append(TokenIdsWithOffsets&& sequence, std::int8_t segment_id) {
  std::size_t n = sequence.ids.size();
  token_ids.insert(token_ids.end(), sequence.ids.begin(), sequence.ids.end());
  segment_ids.insert(segment_ids.end(), n, segment_id);
  special_tokens_mask.insert(special_tokens_mask.end(), n, 0);
  if (sequence.offsets.size() == n) {
    token_offsets.insert(token_offsets.end(), sequence.offsets.begin(), sequence.offsets.end());
  } else {
    token_offsets.insert(token_offsets.end(), n, std::nullopt);
  }
  if (sequence.reference_offsets.size() == n) {
    for (auto& refs : sequence.reference_offsets) {
      reference_offsets.push_back(std::move(refs));
    }
  } else {
    reference_offsets.insert(reference_offsets.end(), n, std::vector<OffsetSize>{});
  }
  if (sequence.masks.size() == n) {
    mask.insert(mask.end(), sequence.masks.begin(), sequence.masks.end());
  } else {
    mask.insert(mask.end(), n, Mask::none);
  }
}

void TokenIdsWithSpecialTokens::AppendSpecial(TokenId id, std::int8_t segment_id) {
  token_ids.push_back(id);
  segment_ids.push_back(segment_id);
  special_tokens_mask.push_back(1);
  token_offsets.push_back(std::nullopt);
  reference_offsets.emplace_back();
  mask.push_back(Mask::special);
}

}  // namespace subtok
