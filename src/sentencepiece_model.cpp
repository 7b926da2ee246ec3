#include "subtok/sentencepiece_model.hpp"

#include <algorithm>
#include <limits>
#include <utility>

#include "sentencepiece_model.pb.h"
#include "subtok/error.hpp"
#include "subtok/file_io.hpp"
#include "subtok/unicode.hpp"

namespace subtok {

namespace {

std::uint64_t edge_key(std::uint32_t node, char32_t c) {
  return (static_cast<std::uint64_t>(node) << 21) | static_cast<std::uint64_t>(c);
}

PieceType piece_type(sentencepiece::ModelProto::SentencePiece::Type type) {
  using Proto = sentencepiece::ModelProto::SentencePiece;
  switch (type) {
    case Proto::NORMAL:
      return PieceType::normal;
    case Proto::UNKNOWN:
      return PieceType::unknown;
    case Proto::CONTROL:
      return PieceType::control;
    case Proto::USER_DEFINED:
      return PieceType::user_defined;
    case Proto::UNUSED:
      return PieceType::unused;
    case Proto::BYTE:
      return PieceType::byte;
  }
  return PieceType::normal;
}

struct Lattice {
  std::vector<float> best;
  std::vector<std::size_t> prev;
  std::vector<std::int32_t> piece;
};

constexpr std::size_t kUnreached = std::numeric_limits<std::size_t>::max();

}  // namespace

SentencePieceModel::SentencePieceModel(std::vector<Piece> pieces) : pieces_(std::move(pieces)) {
  terminal_.push_back(kNoPiece);
  float min_score = std::numeric_limits<float>::max();
  bool has_normal = false;
  for (std::size_t idx = 0; idx < pieces_.size(); ++idx) {
    const Piece& piece = pieces_[idx];
    if (piece.type != PieceType::normal && piece.type != PieceType::user_defined) {
      continue;
    }
    if (piece.type == PieceType::normal) {
      min_score = std::min(min_score, piece.score);
      has_normal = true;
    }
    if (piece.text.empty()) {
      continue;
    }
    std::uint32_t node = 0;
    std::size_t i = 0;
    char32_t c = 0;
    while (NextCodepoint(piece.text, i, c)) {
      auto [it, inserted] = edges_.try_emplace(edge_key(node, c), static_cast<std::uint32_t>(terminal_.size()));
      if (inserted) {
        terminal_.push_back(kNoPiece);
      }
      node = it->second;
    }
    // first occurrence of a duplicated piece wins
    if (terminal_[node] == kNoPiece) {
      terminal_[node] = static_cast<std::int32_t>(idx);
    }
  }
  unknown_score_ = (has_normal ? min_score : 0.0F) - kUnknownPenalty;
}

SentencePieceModel SentencePieceModel::FromFile(const std::string& path) {
  std::string contents = ReadFileAll(path);
  sentencepiece::ModelProto proto;
  if (!proto.ParseFromString(contents)) {
    throw VocabularyParsingError(path + " is not a valid SentencePiece model");
  }
  return FromProto(proto);
}

SentencePieceModel SentencePieceModel::FromProto(const sentencepiece::ModelProto& proto) {
  std::vector<Piece> pieces;
  pieces.reserve(static_cast<std::size_t>(proto.pieces_size()));
  for (const auto& p : proto.pieces()) {
    pieces.push_back(Piece{p.piece(), p.score(), piece_type(p.type())});
  }
  return SentencePieceModel(std::move(pieces));
}

std::int32_t SentencePieceModel::child(std::uint32_t node, char32_t c) const {
  auto it = edges_.find(edge_key(node, c));
  if (it == edges_.end()) {
    return kNoPiece;
  }
  return static_cast<std::int32_t>(it->second);
}

std::vector<PrefixMatch> SentencePieceModel::CommonPrefixSearch(std::u32string_view text) const {
  std::vector<PrefixMatch> matches;
  std::uint32_t node = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    std::int32_t next = child(node, text[i]);
    if (next == kNoPiece) {
      break;
    }
    node = static_cast<std::uint32_t>(next);
    if (terminal_[node] != kNoPiece) {
      matches.push_back(PrefixMatch{static_cast<std::size_t>(terminal_[node]), i + 1});
    }
  }
  return matches;
}

std::vector<Token> SentencePieceModel::Segment(const Token& token) const {
  std::u32string chars = DecodeUtf8(token.text);
  std::size_t n = chars.size();
  if (n == 0) {
    return {};
  }
  std::vector<std::size_t> byte_pos;
  byte_pos.reserve(n + 1);
  std::size_t i = 0;
  char32_t c = 0;
  while (i < token.text.size()) {
    byte_pos.push_back(i);
    NextCodepoint(token.text, i, c);
  }
  byte_pos.push_back(token.text.size());

  Lattice lattice{std::vector<float>(n + 1, -std::numeric_limits<float>::infinity()),
                  std::vector<std::size_t>(n + 1, kUnreached), std::vector<std::int32_t>(n + 1, kNoPiece)};
  lattice.best[0] = 0.0F;
  for (std::size_t start = 0; start < n; ++start) {
    if (start > 0 && lattice.prev[start] == kUnreached) {
      continue;
    }
    bool has_single_char = false;
    for (const PrefixMatch& m : CommonPrefixSearch(std::u32string_view(chars).substr(start))) {
      std::size_t end = start + m.chars;
      float score = lattice.best[start] + pieces_[m.piece].score;
      has_single_char = has_single_char || m.chars == 1;
      if (lattice.prev[end] == kUnreached || score > lattice.best[end]) {
        lattice.best[end] = score;
        lattice.prev[end] = start;
        lattice.piece[end] = static_cast<std::int32_t>(m.piece);
      }
    }
    if (!has_single_char) {
      float score = lattice.best[start] + unknown_score_;
      if (lattice.prev[start + 1] == kUnreached || score > lattice.best[start + 1]) {
        lattice.best[start + 1] = score;
        lattice.prev[start + 1] = start;
        lattice.piece[start + 1] = kNoPiece;
      }
    }
  }

  std::vector<std::pair<std::size_t, std::size_t>> path;
  std::vector<std::int32_t> path_pieces;
  for (std::size_t end = n; end > 0; end = lattice.prev[end]) {
    path.emplace_back(lattice.prev[end], end);
    path_pieces.push_back(lattice.piece[end]);
  }
  std::reverse(path.begin(), path.end());
  std::reverse(path_pieces.begin(), path_pieces.end());

  auto refs_of = [&](std::size_t begin, std::size_t end) {
    std::size_t b = std::min(begin, token.reference_offsets.size());
    std::size_t e = std::min(end, token.reference_offsets.size());
    return std::vector<OffsetSize>(token.reference_offsets.begin() + b, token.reference_offsets.begin() + e);
  };

  std::vector<Token> tokens;
  tokens.reserve(path.size());
  for (std::size_t k = 0; k < path.size(); ++k) {
    auto [begin, end] = path[k];
    std::string text = token.text.substr(byte_pos[begin], byte_pos[end] - byte_pos[begin]);
    bool unknown = path_pieces[k] == kNoPiece;
    if (unknown && !tokens.empty() && tokens.back().mask == Mask::unknown) {
      Token& last = tokens.back();
      last.text.append(text);
      auto more = refs_of(begin, end);
      last.reference_offsets.insert(last.reference_offsets.end(), more.begin(), more.end());
      last.UpdateOffset();
      continue;
    }
    tokens.emplace_back(std::move(text), refs_of(begin, end), unknown ? Mask::unknown : Mask::none);
  }
  return tokens;
}

void SentencePieceModel::PopulateMasks(std::vector<Token>& tokens, char32_t whitespace_token) {
  std::string marker;
  AppendUtf8(whitespace_token, marker);
  Mask previous = Mask::none;
  for (Token& token : tokens) {
    std::size_t i = 0;
    char32_t first = 0;
    NextCodepoint(token.text, i, first);
    bool single_char = !token.text.empty() && i == token.text.size();
    Mask assigned = token.mask;
    if (single_char && IsPunctuation(first)) {
      assigned = Mask::punctuation;
      previous = Mask::punctuation;
    } else if (single_char && IsWhitespace(first)) {
      assigned = Mask::whitespace;
      previous = Mask::punctuation;
    } else if (!token.text.starts_with(marker) && previous != Mask::punctuation && previous != Mask::whitespace) {
      assigned = Mask::continuation;
      previous = Mask::continuation;
    } else {
      previous = Mask::none;
    }
    if (token.mask != Mask::unknown && token.mask != Mask::special) {
      token.mask = assigned;
    }
  }
}

}  // namespace subtok
