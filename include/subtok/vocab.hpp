#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "subtok/token.hpp"

namespace subtok {

struct StringHash {
  using is_transparent = void;
  std::size_t operator()(std::string_view s) const noexcept { return std::hash<std::string_view>{}(s); }
};

using ValueMap = std::unordered_map<std::string, TokenId, StringHash, std::equal_to<>>;
using IndexMap = std::unordered_map<TokenId, std::string>;

// Bidirectional token <-> id mapping with a designated unknown token and a
// set of special tokens. Built once by a loader, then shared read-only.
class Vocab {
 public:
  // Registers `unknown_value` as special; throws TokenNotFoundError when it
  // is not part of `values`.
  Vocab(ValueMap values, std::string unknown_value);

  // Builds a vocabulary and registers each of `special_values`.
  static std::shared_ptr<const Vocab> Create(ValueMap values, std::string unknown_value,
                                             std::initializer_list<std::string_view> special_values = {});

  // Throws TokenNotFoundError when `token` is not in the vocabulary.
  void RegisterSpecialValue(std::string_view token);

  // Unknown tokens resolve to the id of the unknown value.
  [[nodiscard]] TokenId TokenToId(std::string_view token) const;
  // Unknown ids resolve to the unknown value.
  [[nodiscard]] const std::string& IdToToken(TokenId id) const;
  [[nodiscard]] std::vector<TokenId> ConvertTokensToIds(std::span<const std::string> tokens) const;

  [[nodiscard]] bool Contains(std::string_view token) const { return values_.find(token) != values_.end(); }
  [[nodiscard]] bool IsSpecialId(TokenId id) const { return special_indices_.contains(id); }

  [[nodiscard]] const ValueMap& Values() const { return values_; }
  [[nodiscard]] const IndexMap& Indices() const { return indices_; }
  [[nodiscard]] const ValueMap& SpecialValues() const { return special_values_; }
  [[nodiscard]] const IndexMap& SpecialIndices() const { return special_indices_; }
  [[nodiscard]] const std::string& UnknownValue() const { return unknown_value_; }
  [[nodiscard]] std::size_t Size() const { return values_.size(); }

 private:
  ValueMap values_;
  IndexMap indices_;
  ValueMap special_values_;
  IndexMap special_indices_;
  std::string unknown_value_;
  TokenId unknown_id_ = 0;
};

// One token per line, the zero-based line index is the id. Lines are
// trimmed of surrounding whitespace.
ValueMap ReadVocabFile(const std::string& path);

// JSON object mapping token strings to integer ids.
ValueMap ReadJsonVocabFile(const std::string& path);

}  // namespace subtok
