#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "subtok/token.hpp"

namespace sentencepiece {
class ModelProto;
}  // namespace sentencepiece

namespace subtok {

// Word-start marker (U+2581) replacing whitespace in SentencePiece text.
inline constexpr char32_t kSentencePieceWhitespace = 0x2581;
inline constexpr std::string_view kSentencePieceWhitespaceUtf8 = "\xE2\x96\x81";

enum class PieceType : std::uint8_t { normal, unknown, control, user_defined, unused, byte };

struct Piece {
  std::string text;
  float score = 0.0F;
  PieceType type = PieceType::normal;
};

// A vocabulary piece found at the start of a text.
struct PrefixMatch {
  std::size_t piece = 0;
  std::size_t chars = 0;
};

// Unigram language model with a character trie over its pieces. Pieces are
// identified by their position in the model.
class SentencePieceModel {
 public:
  // Score added to the best prefix score when a character has no piece.
  static constexpr float kUnknownPenalty = 10.0F;

  explicit SentencePieceModel(std::vector<Piece> pieces);

  // Reads a serialized ModelProto, optionally gzip or xz compressed.
  // Throws FileNotFoundError or VocabularyParsingError.
  static SentencePieceModel FromFile(const std::string& path);
  static SentencePieceModel FromProto(const sentencepiece::ModelProto& proto);

  [[nodiscard]] const std::vector<Piece>& Pieces() const { return pieces_; }
  [[nodiscard]] std::size_t Size() const { return pieces_.size(); }

  // Every normal or user-defined piece that is a prefix of `text`, shortest
  // first.
  [[nodiscard]] std::vector<PrefixMatch> CommonPrefixSearch(std::u32string_view text) const;

  // Highest scoring segmentation of an already normalized token (Viterbi).
  // Characters not covered by any piece come out as unknown tokens, runs of
  // them merged into one.
  [[nodiscard]] std::vector<Token> Segment(const Token& token) const;

  // Assigns punctuation, whitespace and continuation masks to segmented
  // pieces. Pieces not starting with `whitespace_token` continue the previous
  // word unless it ended on punctuation or whitespace. Special and unknown
  // masks are kept.
  static void PopulateMasks(std::vector<Token>& tokens, char32_t whitespace_token);

 private:
  static constexpr std::int32_t kNoPiece = -1;

  std::int32_t child(std::uint32_t node, char32_t c) const;

  std::vector<Piece> pieces_;
  // edge (parent node, code point) -> child node
  std::unordered_map<std::uint64_t, std::uint32_t> edges_;
  // piece index terminating at each node, or kNoPiece
  std::vector<std::int32_t> terminal_;
  float unknown_score_ = -kUnknownPenalty;
};

}  // namespace subtok
