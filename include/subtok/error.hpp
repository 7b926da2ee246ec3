#pragma once

#include <stdexcept>
#include <string>

namespace subtok {

// Base of every error thrown by the library.
class TokenizerError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// A vocabulary, merges or model file is missing or cannot be opened.
class FileNotFoundError final : public TokenizerError {
 public:
  using TokenizerError::TokenizerError;
};

// A file was opened but its contents could not be decoded.
class VocabularyParsingError final : public TokenizerError {
 public:
  using TokenizerError::TokenizerError;
};

// A token required by a model family is absent from its vocabulary.
class TokenNotFoundError final : public TokenizerError {
 public:
  using TokenizerError::TokenizerError;
};

// Invalid argument, e.g. an impossible truncation request.
class ValueError final : public TokenizerError {
 public:
  using TokenizerError::TokenizerError;
};

}  // namespace subtok
