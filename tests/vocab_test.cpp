#undef NDEBUG
#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

#include <lzma.h>
#include <zlib.h>

#include "subtok/error.hpp"
#include "subtok/file_io.hpp"
#include "subtok/vocab.hpp"
#include "test_util.hpp"

using namespace subtok;

namespace {

std::string gzip(const std::string& data) {
  z_stream zs{};
  int rc = deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY);
  assert(rc == Z_OK);
  std::string out(deflateBound(&zs, static_cast<uLong>(data.size())) + 32, '\0');
  zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  zs.avail_in = static_cast<uInt>(data.size());
  zs.next_out = reinterpret_cast<Bytef*>(out.data());
  zs.avail_out = static_cast<uInt>(out.size());
  rc = deflate(&zs, Z_FINISH);
  assert(rc == Z_STREAM_END);
  out.resize(zs.total_out);
  deflateEnd(&zs);
  return out;
}

std::string xz(const std::string& data) {
  lzma_stream strm = LZMA_STREAM_INIT;
  lzma_ret rc = lzma_easy_encoder(&strm, 6, LZMA_CHECK_CRC64);
  assert(rc == LZMA_OK);
  std::string out(lzma_stream_buffer_bound(data.size()), '\0');
  strm.next_in = reinterpret_cast<const std::uint8_t*>(data.data());
  strm.avail_in = data.size();
  strm.next_out = reinterpret_cast<std::uint8_t*>(out.data());
  strm.avail_out = out.size();
  rc = lzma_code(&strm, LZMA_FINISH);
  assert(rc == LZMA_STREAM_END);
  out.resize(strm.total_out);
  lzma_end(&strm);
  return out;
}

void test_lookup() {
  auto vocab = Vocab::Create(test::MakeValues({"[UNK]", "hello", "world", "[SEP]"}), "[UNK]", {"[SEP]"});
  assert(vocab->Size() == 4);
  assert(vocab->TokenToId("hello") == 1);
  assert(vocab->TokenToId("missing") == 0);
  assert(vocab->IdToToken(2) == "world");
  assert(vocab->IdToToken(42) == "[UNK]");
  assert(vocab->IsSpecialId(0));
  assert(vocab->IsSpecialId(3));
  assert(!vocab->IsSpecialId(1));
  assert(vocab->Contains("world"));
  assert(!vocab->Contains("missing"));
  assert(vocab->UnknownValue() == "[UNK]");
  assert(vocab->SpecialValues().size() == 2);

  for (const auto& [token, id] : vocab->Values()) {
    assert(vocab->TokenToId(vocab->IdToToken(id)) == id);
    assert(vocab->IdToToken(vocab->TokenToId(token)) == token);
  }

  std::vector<std::string> tokens{"world", "nope", "[SEP]"};
  assert((vocab->ConvertTokensToIds(tokens) == std::vector<TokenId>{2, 0, 3}));
}

void test_missing_values() {
  bool thrown = false;
  try {
    Vocab vocab(test::MakeValues({"hello"}), "[UNK]");
  } catch (const TokenNotFoundError&) {
    thrown = true;
  }
  assert(thrown);

  thrown = false;
  try {
    (void)Vocab::Create(test::MakeValues({"[UNK]"}), "[UNK]", {"[CLS]"});
  } catch (const TokenNotFoundError&) {
    thrown = true;
  }
  assert(thrown);
}

void test_line_file() {
  test::TempFile file("[UNK]\r\nhello \n\xE4\xB8\xAD\n");
  ValueMap values = ReadVocabFile(file.path());
  assert(values.size() == 3);
  assert(values.at("hello") == 1);
  assert(values.at("\xE4\xB8\xAD") == 2);

  test::TempFile invalid("[UNK]\n\xFF\xFE\n");
  bool thrown = false;
  try {
    (void)ReadVocabFile(invalid.path());
  } catch (const VocabularyParsingError&) {
    thrown = true;
  }
  assert(thrown);

  test::TempFile overlong("[UNK]\n\xC0\xAF\n");
  thrown = false;
  try {
    (void)ReadVocabFile(overlong.path());
  } catch (const VocabularyParsingError&) {
    thrown = true;
  }
  assert(thrown);

  // only trailing whitespace is trimmed
  test::TempFile indented("[UNK]\n  hello\t\n");
  ValueMap kept = ReadVocabFile(indented.path());
  assert(kept.at("  hello") == 1);
  assert(kept.count("hello") == 0);
}

void test_json_file() {
  test::TempFile file(R"({"<unk>": 0, "hello": 7})", ".json");
  ValueMap values = ReadJsonVocabFile(file.path());
  assert(values.at("hello") == 7);

  test::TempFile wrong_type(R"({"hello": "seven"})", ".json");
  bool thrown = false;
  try {
    (void)ReadJsonVocabFile(wrong_type.path());
  } catch (const VocabularyParsingError&) {
    thrown = true;
  }
  assert(thrown);

  test::TempFile negative(R"({"a": -1})", ".json");
  thrown = false;
  try {
    (void)ReadJsonVocabFile(negative.path());
  } catch (const VocabularyParsingError&) {
    thrown = true;
  }
  assert(thrown);

  test::TempFile array(R"(["hello"])", ".json");
  thrown = false;
  try {
    (void)ReadJsonVocabFile(array.path());
  } catch (const VocabularyParsingError&) {
    thrown = true;
  }
  assert(thrown);
}

void test_compressed_and_missing() {
  test::TempFile file(gzip("[UNK]\nhello\n"), ".txt.gz");
  ValueMap values = ReadVocabFile(file.path());
  assert(values.size() == 2);
  assert(values.at("hello") == 1);

  test::TempFile xz_file(xz("[UNK]\nhello\nworld\n"), ".txt.xz");
  ValueMap xz_values = ReadVocabFile(xz_file.path());
  assert(xz_values.size() == 3);
  assert(xz_values.at("world") == 2);

  test::TempFile corrupt_xz("definitely not an xz stream", ".txt.xz");
  bool thrown = false;
  try {
    (void)ReadVocabFile(corrupt_xz.path());
  } catch (const VocabularyParsingError&) {
    thrown = true;
  }
  assert(thrown);

  std::string packed = xz("[UNK]\nhello\n");
  test::TempFile truncated_xz(packed.substr(0, packed.size() / 2), ".txt.xz");
  thrown = false;
  try {
    (void)ReadFileAll(truncated_xz.path());
  } catch (const VocabularyParsingError&) {
    thrown = true;
  }
  assert(thrown);

  thrown = false;
  try {
    (void)ReadFileAll("/nonexistent/subtok/vocab.txt");
  } catch (const FileNotFoundError&) {
    thrown = true;
  }
  assert(thrown);
}

void test_split_lines() {
  auto lines = SplitLines("a\r\nb\n\nc\n");
  assert(lines.size() == 4);
  assert(lines[0] == "a");
  assert(lines[2].empty());
  assert(lines[3] == "c");
}

}  // namespace

int main() {
  test_lookup();
  test_missing_values();
  test_line_file();
  test_json_file();
  test_compressed_and_missing();
  test_split_lines();
  return 0;
}
