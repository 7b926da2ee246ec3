#include "subtok/bpe.hpp"

#include <algorithm>
#include <limits>

#include "subtok/error.hpp"
#include "subtok/file_io.hpp"
#include "subtok/unicode.hpp"

namespace subtok {

namespace {

constexpr std::string_view kEndOfWord = "</w>";
constexpr std::string_view kCtrlContinuation = "@@";

std::array<char32_t, 256> build_byte_to_unicode() {
  std::array<char32_t, 256> table{};
  std::array<bool, 256> printable{};
  for (int b = 33; b <= 126; ++b) printable[b] = true;
  for (int b = 161; b <= 172; ++b) printable[b] = true;
  for (int b = 174; b <= 255; ++b) printable[b] = true;
  char32_t next = 256;
  for (int b = 0; b < 256; ++b) {
    table[b] = printable[b] ? static_cast<char32_t>(b) : next++;
  }
  return table;
}

std::string pair_key(std::string_view left, std::string_view right) {
  std::string key;
  key.reserve(left.size() + right.size() + 1);
  key.append(left);
  key.push_back(' ');
  key.append(right);
  return key;
}

std::vector<std::string> split_chars(std::string_view word) {
  std::vector<std::string> symbols;
  symbols.reserve(word.size());
  std::size_t i = 0;
  char32_t c = 0;
  while (i < word.size()) {
    std::size_t start = i;
    NextCodepoint(word, i, c);
    symbols.emplace_back(word.substr(start, i - start));
  }
  return symbols;
}

// Repeatedly merges every occurrence of the lowest-ranked adjacent pair.
void merge_symbols(std::vector<std::string>& symbols, const BpePairVocab& ranks) {
  while (symbols.size() >= 2) {
    std::int64_t best_rank = std::numeric_limits<std::int64_t>::max();
    std::size_t best_pos = symbols.size();
    for (std::size_t pos = 0; pos + 1 < symbols.size(); ++pos) {
      auto rank = ranks.GetRank(symbols[pos], symbols[pos + 1]);
      if (rank && *rank < best_rank) {
        best_rank = *rank;
        best_pos = pos;
      }
    }
    if (best_pos == symbols.size()) {
      break;
    }
    const std::string left = symbols[best_pos];
    const std::string right = symbols[best_pos + 1];

    std::vector<std::string> merged;
    merged.reserve(symbols.size());
    for (std::size_t p = 0; p < symbols.size();) {
      if (p + 1 < symbols.size() && symbols[p] == left && symbols[p + 1] == right) {
        merged.push_back(left + right);
        p += 2;
      } else {
        merged.push_back(std::move(symbols[p]));
        ++p;
      }
    }
    symbols.swap(merged);
  }
}

std::vector<std::size_t> count_chars(const std::vector<std::string>& pieces) {
  std::vector<std::size_t> counts;
  counts.reserve(pieces.size());
  for (const auto& piece : pieces) {
    counts.push_back(CountChars(piece));
  }
  return counts;
}

void strip_suffix(std::string& s, std::string_view suffix) {
  if (std::string_view(s).ends_with(suffix)) {
    s.resize(s.size() - suffix.size());
  }
}

}  // namespace

const std::array<char32_t, 256>& ByteToUnicode() {
  static const std::array<char32_t, 256> table = build_byte_to_unicode();
  return table;
}

std::optional<std::uint8_t> UnicodeToByte(char32_t c) {
  static const std::unordered_map<char32_t, std::uint8_t> reverse = [] {
    std::unordered_map<char32_t, std::uint8_t> m;
    const auto& table = ByteToUnicode();
    for (int b = 0; b < 256; ++b) {
      m.emplace(table[b], static_cast<std::uint8_t>(b));
    }
    return m;
  }();
  auto it = reverse.find(c);
  if (it == reverse.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::string BytesToUnicodeString(std::string_view text) {
  const auto& table = ByteToUnicode();
  std::string out;
  out.reserve(text.size() * 2);
  for (unsigned char b : text) {
    AppendUtf8(table[b], out);
  }
  return out;
}

std::string UnicodeStringToBytes(std::string_view text) {
  std::string bytes;
  bytes.reserve(text.size());
  std::size_t i = 0;
  char32_t c = 0;
  while (NextCodepoint(text, i, c)) {
    if (auto b = UnicodeToByte(c)) {
      bytes.push_back(static_cast<char>(*b));
    } else {
      AppendUtf8(c, bytes);
    }
  }
  if (IsValidUtf8(bytes)) {
    return bytes;
  }
  std::string out;
  out.reserve(bytes.size());
  i = 0;
  while (NextCodepoint(bytes, i, c)) {
    AppendUtf8(c, out);
  }
  return out;
}

BpePairVocab BpePairVocab::FromFile(const std::string& path) {
  std::string contents = ReadFileAll(path);
  if (!IsValidUtf8(contents)) {
    throw VocabularyParsingError(path + " is not valid UTF-8");
  }
  std::unordered_map<std::string, std::int64_t, StringHash, std::equal_to<>> ranks;
  std::int64_t rank = 0;
  auto lines = SplitLines(contents);
  for (std::size_t i = 1; i < lines.size(); ++i) {
    std::string_view line = Trim(lines[i]);
    std::size_t sep = line.find(' ');
    if (sep == std::string_view::npos) {
      continue;
    }
    std::string_view left = line.substr(0, sep);
    std::string_view rest = line.substr(sep + 1);
    std::string_view right = rest.substr(0, rest.find(' '));
    ranks.insert_or_assign(pair_key(left, right), rank);
    ++rank;
  }
  return BpePairVocab(std::move(ranks));
}

std::optional<std::int64_t> BpePairVocab::GetRank(std::string_view left, std::string_view right) const {
  auto it = ranks_.find(pair_key(left, right));
  if (it == ranks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

BpeOutput Bpe(std::string_view word, const BpePairVocab& ranks) {
  BpeOutput out;
  out.pieces = split_chars(word);
  merge_symbols(out.pieces, ranks);
  out.char_counts = count_chars(out.pieces);
  return out;
}

BpeOutput OpenAiGptBpe(std::string_view word, const BpePairVocab& ranks) {
  BpeOutput out;
  out.pieces = split_chars(word);
  if (out.pieces.empty()) {
    return out;
  }
  out.pieces.back().append(kEndOfWord);
  merge_symbols(out.pieces, ranks);
  out.char_counts = count_chars(out.pieces);
  out.char_counts.back() -= kEndOfWord.size();
  return out;
}

BpeOutput CtrlBpe(std::string_view word, const BpePairVocab& ranks) {
  BpeOutput out;
  out.pieces = split_chars(word);
  if (out.pieces.empty()) {
    return out;
  }
  out.pieces.back().append(kEndOfWord);
  merge_symbols(out.pieces, ranks);
  strip_suffix(out.pieces.back(), kEndOfWord);
  if (out.pieces.back().empty()) {
    out.pieces.pop_back();
  }
  out.char_counts = count_chars(out.pieces);
  for (std::size_t i = 0; i + 1 < out.pieces.size(); ++i) {
    out.pieces[i].append(kCtrlContinuation);
  }
  return out;
}

std::optional<BpeOutput> BpeCache::Get(const std::string& word) {
  if (capacity_ == 0) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(mu_);
  auto it = index_.find(word);
  if (it == index_.end()) {
    return std::nullopt;
  }
  order_.splice(order_.begin(), order_, it->second);
  return it->second->second;
}

void BpeCache::Put(const std::string& word, const BpeOutput& output) {
  if (capacity_ == 0) {
    return;
  }
  std::lock_guard<std::mutex> lock(mu_);
  auto it = index_.find(word);
  if (it != index_.end()) {
    it->second->second = output;
    order_.splice(order_.begin(), order_, it->second);
    return;
  }
  order_.emplace_front(word, output);
  index_.emplace(word, order_.begin());
  if (order_.size() > capacity_) {
    index_.erase(order_.back().first);
    order_.pop_back();
  }
}

std::size_t BpeCache::Size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return order_.size();
}

void BpeCache::Clear() {
  std::lock_guard<std::mutex> lock(mu_);
  order_.clear();
  index_.clear();
}

std::vector<Token> SplitOnBpePairs(TokenRef token, BpeFunction bpe, const BpePairVocab& ranks, BpeCache* cache,
                                   bool as_bytes) {
  std::string text;
  std::vector<OffsetSize> refs;
  if (as_bytes) {
    text = BytesToUnicodeString(token.text);
    refs.reserve(token.text.size());
    std::size_t i = 0;
    std::size_t k = 0;
    char32_t c = 0;
    while (i < token.text.size()) {
      std::size_t start = i;
      NextCodepoint(token.text, i, c);
      OffsetSize pos = k < token.reference_offsets.size() ? token.reference_offsets[k] : kNoOffset;
      refs.insert(refs.end(), i - start, pos);
      ++k;
    }
  } else {
    text.assign(token.text);
    refs.assign(token.reference_offsets.begin(), token.reference_offsets.end());
  }

  std::optional<BpeOutput> cached = cache ? cache->Get(text) : std::nullopt;
  BpeOutput output;
  if (cached) {
    output = std::move(*cached);
  } else {
    output = bpe(text, ranks);
    if (cache) {
      cache->Put(text, output);
    }
  }

  std::vector<Token> tokens;
  tokens.reserve(output.pieces.size());
  std::size_t start = 0;
  for (std::size_t idx = 0; idx < output.pieces.size(); ++idx) {
    std::size_t begin = std::min(start, refs.size());
    std::size_t end = std::min(start + output.char_counts[idx], refs.size());
    Mask mask = Mask::none;
    if (output.pieces.size() > 1) {
      mask = idx == 0 ? Mask::begin : Mask::continuation;
    }
    tokens.emplace_back(output.pieces[idx], std::vector<OffsetSize>(refs.begin() + begin, refs.begin() + end), mask);
    start += output.char_counts[idx];
  }
  return tokens;
}

}  // namespace subtok
