#include "subtok/serialization.hpp"

#include <nlohmann/json.hpp>

namespace subtok {

namespace {

nlohmann::json offsets_json(const std::vector<std::optional<Offset>>& offsets) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& offset : offsets) {
    if (offset) {
      arr.push_back(*offset);
    } else {
      arr.push_back(nullptr);
    }
  }
  return arr;
}

}  // namespace

void to_json(nlohmann::json& j, const Offset& offset) { j = nlohmann::json::array({offset.begin, offset.end}); }

void to_json(nlohmann::json& j, const Mask& mask) { j = std::string(MaskName(mask)); }

void to_json(nlohmann::json& j, const TokensWithOffsets& tokens) {
  j = nlohmann::json{{"tokens", tokens.tokens},
                     {"offsets", offsets_json(tokens.offsets)},
                     {"reference_offsets", tokens.reference_offsets},
                     {"masks", tokens.masks}};
}

void to_json(nlohmann::json& j, const TokenizedInput& input) {
  j = nlohmann::json{{"token_ids", input.token_ids},
                     {"segment_ids", input.segment_ids},
                     {"special_tokens_mask", input.special_tokens_mask},
                     {"overflowing_tokens", input.overflowing_tokens},
                     {"num_truncated_tokens", input.num_truncated_tokens},
                     {"token_offsets", offsets_json(input.token_offsets)},
                     {"reference_offsets", input.reference_offsets},
                     {"mask", input.mask}};
}

}  // namespace subtok
