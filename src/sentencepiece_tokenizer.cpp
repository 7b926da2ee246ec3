#include "subtok/sentencepiece_tokenizer.hpp"

#include <utility>

#include "subtok/unicode.hpp"

namespace subtok {

namespace {

bool starts_with_marker(std::string_view text) { return text.starts_with(kSentencePieceWhitespaceUtf8); }

// "▁2018," -> "▁2018" ","; the comma keeps the mask of the original piece.
void split_digit_comma(std::vector<Token>& pieces, const SentencePieceModel& model) {
  std::vector<Token> out;
  out.reserve(pieces.size());
  for (auto& piece : pieces) {
    std::u32string chars = DecodeUtf8(piece.text);
    std::size_t n = chars.size();
    if (n < 2 || chars[n - 1] != U',' || !IsAsciiDigit(chars[n - 2])) {
      out.push_back(std::move(piece));
      continue;
    }
    std::string body = piece.text.substr(0, piece.text.size() - 1);
    std::vector<OffsetSize> body_refs = piece.reference_offsets;
    OffsetSize comma_ref = kNoOffset;
    if (!body_refs.empty()) {
      comma_ref = body_refs.back();
      body_refs.pop_back();
    }

    std::vector<Token> sub;
    if (starts_with_marker(body)) {
      sub = model.Segment(Token(std::move(body), std::move(body_refs)));
    } else {
      body_refs.insert(body_refs.begin(), kNoOffset);
      sub = model.Segment(Token(std::string(kSentencePieceWhitespaceUtf8) + body, std::move(body_refs)));
      if (!sub.empty() && starts_with_marker(sub.front().text)) {
        if (sub.front().text.size() == kSentencePieceWhitespaceUtf8.size()) {
          sub.erase(sub.begin());
        } else {
          Token& first = sub.front();
          first.text.erase(0, kSentencePieceWhitespaceUtf8.size());
          first.reference_offsets.erase(first.reference_offsets.begin());
          first.UpdateOffset();
        }
      }
    }
    for (auto& s : sub) {
      out.push_back(std::move(s));
    }
    out.emplace_back(",", std::vector<OffsetSize>{comma_ref}, piece.mask);
  }
  pieces = std::move(out);
}

std::shared_ptr<const SentencePieceModel> load_model(const std::string& path) {
  return std::make_shared<const SentencePieceModel>(SentencePieceModel::FromFile(path));
}

TokenIdsWithSpecialTokens frame_like_roberta(const Vocab& vocab, TokenIdsWithOffsets first,
                                             std::optional<TokenIdsWithOffsets> second) {
  TokenIdsWithSpecialTokens out;
  TokenId eos = vocab.TokenToId("</s>");
  out.AppendSpecial(vocab.TokenToId("<s>"), 0);
  out.Append(std::move(first), 0);
  out.AppendSpecial(eos, 0);
  if (second) {
    out.AppendSpecial(eos, 1);
    out.Append(std::move(*second), 1);
    out.AppendSpecial(eos, 1);
  }
  return out;
}

}  // namespace

std::vector<Token> SentencePiecePretokenize(TokenRef text, const Vocab& vocab, const SentencePieceOptions& options) {
  std::vector<Token> tokens;
  for (const TokenRef& piece : SplitOnSpecialTokens(text, vocab)) {
    Token token = piece.ToOwned();
    if (token.mask == Mask::special || token.mask == Mask::unknown) {
      tokens.push_back(std::move(token));
      continue;
    }
    if (options.replace_quotes) {
      ReplaceString(token, "``", "\"");
      ReplaceString(token, "''", "\"");
    }
    CleanText(token);
    DecomposeNfkc(token);
    if (options.lower_case) {
      Lowercase(token);
    }
    if (options.strip_accents) {
      StripAccents(token);
    }
    if (token.text.empty()) {
      continue;
    }
    ReplaceWhitespace(token, kSentencePieceWhitespace);
    if (!starts_with_marker(token.text)) {
      token.text.insert(0, kSentencePieceWhitespaceUtf8);
      token.reference_offsets.insert(token.reference_offsets.begin(), kNoOffset);
    }
    tokens.push_back(std::move(token));
  }
  return tokens;
}

std::vector<Token> SentencePieceSegment(std::vector<Token> tokens, const SentencePieceModel& model,
                                        bool split_digit_comma_pieces) {
  std::vector<Token> out;
  out.reserve(tokens.size());
  for (auto& token : tokens) {
    if (token.mask == Mask::special || token.mask == Mask::unknown) {
      out.push_back(std::move(token));
      continue;
    }
    std::vector<Token> pieces = model.Segment(token);
    if (split_digit_comma_pieces) {
      split_digit_comma(pieces, model);
    }
    for (auto& piece : pieces) {
      piece.DropUnmappedOffsets();
      out.push_back(std::move(piece));
    }
  }
  SentencePieceModel::PopulateMasks(out, kSentencePieceWhitespace);
  return out;
}

std::string SentencePieceTokensToString(const std::vector<std::string>& tokens) {
  std::string text = JoinTokens(tokens, "");
  ReplaceAll(text, kSentencePieceWhitespaceUtf8, " ");
  return std::string(Trim(text));
}

ValueMap SentencePieceValues(const SentencePieceModel& model) {
  ValueMap values;
  values.reserve(model.Size());
  const auto& pieces = model.Pieces();
  for (std::size_t idx = 0; idx < pieces.size(); ++idx) {
    values.insert_or_assign(pieces[idx].text, static_cast<TokenId>(idx));
  }
  return values;
}

// SentencePieceTokenizer

SentencePieceTokenizer::SentencePieceTokenizer(std::shared_ptr<const Vocab> vocab,
                                               std::shared_ptr<const SentencePieceModel> model, bool lower_case)
    : vocab_(std::move(vocab)), model_(std::move(model)) {
  options_.lower_case = lower_case;
}

SentencePieceTokenizer SentencePieceTokenizer::FromFile(const std::string& model_path, bool lower_case) {
  auto model = load_model(model_path);
  auto vocab = MakeVocab(*model);
  return SentencePieceTokenizer(std::move(vocab), std::move(model), lower_case);
}

std::shared_ptr<const Vocab> SentencePieceTokenizer::MakeVocab(const SentencePieceModel& model) {
  return Vocab::Create(SentencePieceValues(model), std::string(kUnknownToken));
}

std::vector<Token> SentencePieceTokenizer::Pretokenize(TokenRef text) const {
  return SentencePiecePretokenize(text, *vocab_, options_);
}

std::vector<Token> SentencePieceTokenizer::Segment(std::vector<Token> tokens) const {
  return SentencePieceSegment(std::move(tokens), *model_, options_.split_digit_comma);
}

std::string SentencePieceTokenizer::ConvertTokensToString(const std::vector<std::string>& tokens) const {
  return SentencePieceTokensToString(tokens);
}

// XLNetTokenizer

XLNetTokenizer::XLNetTokenizer(std::shared_ptr<const Vocab> vocab, std::shared_ptr<const SentencePieceModel> model,
                               bool lower_case, bool strip_accents)
    : vocab_(std::move(vocab)), model_(std::move(model)) {
  options_.lower_case = lower_case;
  options_.strip_accents = strip_accents;
  options_.replace_quotes = true;
  options_.split_digit_comma = true;
}

XLNetTokenizer XLNetTokenizer::FromFile(const std::string& model_path, bool lower_case, bool strip_accents) {
  auto model = load_model(model_path);
  auto vocab = MakeVocab(*model);
  return XLNetTokenizer(std::move(vocab), std::move(model), lower_case, strip_accents);
}

std::shared_ptr<const Vocab> XLNetTokenizer::MakeVocab(const SentencePieceModel& model) {
  return Vocab::Create(SentencePieceValues(model), std::string(kUnknownToken),
                       {kSepToken, kClsToken, kMaskToken, kPadToken, kBosToken, kEosToken});
}

std::vector<Token> XLNetTokenizer::Pretokenize(TokenRef text) const {
  return SentencePiecePretokenize(text, *vocab_, options_);
}

std::vector<Token> XLNetTokenizer::Segment(std::vector<Token> tokens) const {
  return SentencePieceSegment(std::move(tokens), *model_, options_.split_digit_comma);
}

TokenIdsWithSpecialTokens XLNetTokenizer::BuildInputWithSpecialTokens(TokenIdsWithOffsets first,
                                                                      std::optional<TokenIdsWithOffsets> second) const {
  TokenIdsWithSpecialTokens out;
  TokenId sep = vocab_->TokenToId(kSepToken);
  out.Append(std::move(first), 0);
  out.AppendSpecial(sep, 0);
  if (second) {
    out.Append(std::move(*second), 1);
    out.AppendSpecial(sep, 1);
  }
  out.AppendSpecial(vocab_->TokenToId(kClsToken), 2);
  return out;
}

std::string XLNetTokenizer::ConvertTokensToString(const std::vector<std::string>& tokens) const {
  return SentencePieceTokensToString(tokens);
}

// AlbertTokenizer

AlbertTokenizer::AlbertTokenizer(std::shared_ptr<const Vocab> vocab, std::shared_ptr<const SentencePieceModel> model,
                                 bool lower_case, bool strip_accents)
    : vocab_(std::move(vocab)), model_(std::move(model)) {
  options_.lower_case = lower_case;
  options_.strip_accents = strip_accents;
  options_.replace_quotes = true;
  options_.split_digit_comma = true;
}

AlbertTokenizer AlbertTokenizer::FromFile(const std::string& model_path, bool lower_case, bool strip_accents) {
  auto model = load_model(model_path);
  auto vocab = MakeVocab(*model);
  return AlbertTokenizer(std::move(vocab), std::move(model), lower_case, strip_accents);
}

std::shared_ptr<const Vocab> AlbertTokenizer::MakeVocab(const SentencePieceModel& model) {
  return Vocab::Create(SentencePieceValues(model), std::string(kUnknownToken),
                       {kClsToken, kSepToken, kMaskToken, kPadToken});
}

std::vector<Token> AlbertTokenizer::Pretokenize(TokenRef text) const {
  return SentencePiecePretokenize(text, *vocab_, options_);
}

std::vector<Token> AlbertTokenizer::Segment(std::vector<Token> tokens) const {
  return SentencePieceSegment(std::move(tokens), *model_, options_.split_digit_comma);
}

TokenIdsWithSpecialTokens AlbertTokenizer::BuildInputWithSpecialTokens(TokenIdsWithOffsets first,
                                                                       std::optional<TokenIdsWithOffsets> second) const {
  TokenIdsWithSpecialTokens out;
  TokenId sep = vocab_->TokenToId(kSepToken);
  out.AppendSpecial(vocab_->TokenToId(kClsToken), 0);
  out.Append(std::move(first), 0);
  out.AppendSpecial(sep, 0);
  if (second) {
    out.Append(std::move(*second), 1);
    out.AppendSpecial(sep, 1);
  }
  return out;
}

std::string AlbertTokenizer::ConvertTokensToString(const std::vector<std::string>& tokens) const {
  return SentencePieceTokensToString(tokens);
}

// T5Tokenizer

T5Tokenizer::T5Tokenizer(std::shared_ptr<const Vocab> vocab, std::shared_ptr<const SentencePieceModel> model,
                         bool lower_case)
    : vocab_(std::move(vocab)), model_(std::move(model)) {
  options_.lower_case = lower_case;
}

T5Tokenizer T5Tokenizer::FromFile(const std::string& model_path, bool lower_case) {
  auto model = load_model(model_path);
  auto vocab = MakeVocab(*model);
  return T5Tokenizer(std::move(vocab), std::move(model), lower_case);
}

std::shared_ptr<const Vocab> T5Tokenizer::MakeVocab(const SentencePieceModel& model) {
  ValueMap values = SentencePieceValues(model);
  auto last_id = static_cast<TokenId>(model.Size()) + kExtraIds - 1;
  std::vector<std::string> extra_ids;
  extra_ids.reserve(kExtraIds);
  for (int n = 0; n < kExtraIds; ++n) {
    extra_ids.push_back("<extra_id_" + std::to_string(n) + ">");
    values.insert_or_assign(extra_ids.back(), last_id - n);
  }
  auto vocab = std::make_shared<Vocab>(std::move(values), std::string(kUnknownToken));
  vocab->RegisterSpecialValue(kEosToken);
  vocab->RegisterSpecialValue(kPadToken);
  for (const auto& extra : extra_ids) {
    vocab->RegisterSpecialValue(extra);
  }
  return vocab;
}

std::vector<Token> T5Tokenizer::Pretokenize(TokenRef text) const {
  return SentencePiecePretokenize(text, *vocab_, options_);
}

std::vector<Token> T5Tokenizer::Segment(std::vector<Token> tokens) const {
  return SentencePieceSegment(std::move(tokens), *model_, options_.split_digit_comma);
}

TokenIdsWithSpecialTokens T5Tokenizer::BuildInputWithSpecialTokens(TokenIdsWithOffsets first,
                                                                   std::optional<TokenIdsWithOffsets> second) const {
  TokenIdsWithSpecialTokens out;
  TokenId eos = vocab_->TokenToId(kEosToken);
  out.Append(std::move(first), 0);
  out.AppendSpecial(eos, 0);
  if (second) {
    out.Append(std::move(*second), 1);
    out.AppendSpecial(eos, 1);
  }
  return out;
}

std::string T5Tokenizer::ConvertTokensToString(const std::vector<std::string>& tokens) const {
  return SentencePieceTokensToString(tokens);
}

// XlmRobertaTokenizer

XlmRobertaTokenizer::XlmRobertaTokenizer(std::shared_ptr<const Vocab> vocab,
                                         std::shared_ptr<const SentencePieceModel> model, bool lower_case)
    : vocab_(std::move(vocab)), model_(std::move(model)) {
  options_.lower_case = lower_case;
}

XlmRobertaTokenizer XlmRobertaTokenizer::FromFile(const std::string& model_path, bool lower_case) {
  auto model = load_model(model_path);
  auto vocab = MakeVocab(*model);
  return XlmRobertaTokenizer(std::move(vocab), std::move(model), lower_case);
}

std::shared_ptr<const Vocab> XlmRobertaTokenizer::MakeVocab(const SentencePieceModel& model) {
  ValueMap values;
  values.reserve(model.Size() + 2);
  values.emplace(kBosToken, 0);
  values.emplace(kPadToken, 1);
  values.emplace(kEosToken, 2);
  values.emplace(kUnknownToken, 3);
  const auto& pieces = model.Pieces();
  for (std::size_t idx = 3; idx < pieces.size(); ++idx) {
    values.try_emplace(pieces[idx].text, static_cast<TokenId>(idx + 1));
  }
  values.try_emplace(std::string(kMaskToken), static_cast<TokenId>(pieces.size() + 1));
  return Vocab::Create(std::move(values), std::string(kUnknownToken), {kBosToken, kEosToken, kPadToken, kMaskToken});
}

std::vector<Token> XlmRobertaTokenizer::Pretokenize(TokenRef text) const {
  return SentencePiecePretokenize(text, *vocab_, options_);
}

std::vector<Token> XlmRobertaTokenizer::Segment(std::vector<Token> tokens) const {
  return SentencePieceSegment(std::move(tokens), *model_, options_.split_digit_comma);
}

TokenIdsWithSpecialTokens XlmRobertaTokenizer::BuildInputWithSpecialTokens(
    TokenIdsWithOffsets first, std::optional<TokenIdsWithOffsets> second) const {
  return frame_like_roberta(*vocab_, std::move(first), std::move(second));
}

std::string XlmRobertaTokenizer::ConvertTokensToString(const std::vector<std::string>& tokens) const {
  return SentencePieceTokensToString(tokens);
}

}  // namespace subtok
