#include "subtok/vocab.hpp"

#include <utility>

#include <nlohmann/json.hpp>

#include "subtok/error.hpp"
#include "subtok/file_io.hpp"
#include "subtok/unicode.hpp"

namespace subtok {

Vocab::Vocab(ValueMap values, std::string unknown_value)
    : values_(std::move(values)), unknown_value_(std::move(unknown_value)) {
  indices_.reserve(values_.size());
  for (const auto& [token, id] : values_) {
    indices_[id] = token;
  }
  RegisterSpecialValue(unknown_value_);
  unknown_id_ = values_.find(std::string_view(unknown_value_))->second;
}

std::shared_ptr<const Vocab> Vocab::Create(ValueMap values, std::string unknown_value,
                                           std::initializer_list<std::string_view> special_values) {
  auto vocab = std::make_shared<Vocab>(std::move(values), std::move(unknown_value));
  for (auto value : special_values) {
    vocab->RegisterSpecialValue(value);
  }
  return vocab;
}

void Vocab::RegisterSpecialValue(std::string_view token) {
  auto it = values_.find(token);
  if (it == values_.end()) {
    throw TokenNotFoundError("The special value " + std::string(token) + " could not be found in the vocabulary");
  }
  special_values_[it->first] = it->second;
  special_indices_[it->second] = it->first;
}

TokenId Vocab::TokenToId(std::string_view token) const {
  if (auto it = special_values_.find(token); it != special_values_.end()) {
    return it->second;
  }
  if (auto it = values_.find(token); it != values_.end()) {
    return it->second;
  }
  return unknown_id_;
}

const std::string& Vocab::IdToToken(TokenId id) const {
  if (auto it = special_indices_.find(id); it != special_indices_.end()) {
    return it->second;
  }
  if (auto it = indices_.find(id); it != indices_.end()) {
    return it->second;
  }
  return unknown_value_;
}

std::vector<TokenId> Vocab::ConvertTokensToIds(std::span<const std::string> tokens) const {
  std::vector<TokenId> ids;
  ids.reserve(tokens.size());
  for (const auto& token : tokens) {
    ids.push_back(TokenToId(token));
  }
  return ids;
}

ValueMap ReadVocabFile(const std::string& path) {
  std::string contents = ReadFileAll(path);
  if (!IsValidUtf8(contents)) {
    throw VocabularyParsingError(path + " is not valid UTF-8");
  }
  ValueMap values;
  TokenId index = 0;
  for (auto line : SplitLines(contents)) {
    values.insert_or_assign(std::string(TrimEnd(line)), index);
    ++index;
  }
  return values;
}

ValueMap ReadJsonVocabFile(const std::string& path) {
  std::string contents = ReadFileAll(path);
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(contents);
  } catch (const nlohmann::json::parse_error& e) {
    throw VocabularyParsingError(path + ": " + e.what());
  }
  if (!j.is_object()) {
    throw VocabularyParsingError(path + ": expected a JSON object of token ids");
  }
  ValueMap values;
  values.reserve(j.size());
  for (auto it = j.begin(); it != j.end(); ++it) {
    if (!it.value().is_number_integer()) {
      throw VocabularyParsingError(path + ": id of token " + it.key() + " is not an integer");
    }
    if (it.value().get<TokenId>() < 0) {
      throw VocabularyParsingError(path + ": id of token " + it.key() + " is negative");
    }
    values.emplace(it.key(), it.value().get<TokenId>());
  }
  return values;
}

}  // namespace subtok
