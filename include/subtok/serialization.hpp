#pragma once

#include <nlohmann/json_fwd.hpp>

#include "subtok/token.hpp"

namespace subtok {

// JSON views of tokenization results, as printed by the command line tool.
// Missing offsets are written as null, masks by name.
void to_json(nlohmann::json& j, const Offset& offset);
void to_json(nlohmann::json& j, const Mask& mask);
void to_json(nlohmann::json& j, const TokensWithOffsets& tokens);
void to_json(nlohmann::json& j, const TokenizedInput& input);

}  // namespace subtok
