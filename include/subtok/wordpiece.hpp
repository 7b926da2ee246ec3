#pragma once

#include <cstddef>
#include <vector>

#include "subtok/token.hpp"
#include "subtok/vocab.hpp"

namespace subtok {

inline constexpr std::size_t kDefaultMaxWordLen = 100;

// Greedy longest-match-first sub-word segmentation. Pieces after the first
// carry a "##" prefix and the continuation mask. A word longer than
// `max_word_len` characters, or one that cannot be covered by vocabulary
// pieces, becomes a single unknown token spanning the whole word.
std::vector<Token> TokenizeWordpiece(TokenRef token, const Vocab& vocab, std::size_t max_word_len = kDefaultMaxWordLen);

}  // namespace subtok
