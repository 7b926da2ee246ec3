#include "subtok/file_io.hpp"

#include <cstdint>
#include <fstream>
#include <iterator>
#include <vector>

#include <lzma.h>
#include <zlib.h>

#include "subtok/error.hpp"

namespace subtok {

namespace {

bool ends_with(const std::string& s, std::string_view suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::ifstream open_binary(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw FileNotFoundError(path + " vocabulary file not found");
  }
  return in;
}

std::string read_text_file_all(const std::string& path) {
  auto in = open_binary(path);
  std::string out((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw VocabularyParsingError("I/O error while reading " + path);
  }
  return out;
}

std::string read_gz_file_all(const std::string& path) {
  gzFile f = gzopen(path.c_str(), "rb");
  if (!f) {
    throw FileNotFoundError(path + " vocabulary file not found");
  }
  std::string out;
  std::vector<char> buf(1 << 16);
  while (true) {
    int got = gzread(f, buf.data(), static_cast<unsigned int>(buf.size()));
    if (got < 0) {
      gzclose(f);
      throw VocabularyParsingError("failed to inflate " + path);
    }
    if (got == 0) {
      break;
    }
    out.append(buf.data(), static_cast<std::size_t>(got));
  }
  gzclose(f);
  return out;
}

std::string read_xz_file_all(const std::string& path) {
  auto in = open_binary(path);
  lzma_stream strm = LZMA_STREAM_INIT;
  if (lzma_stream_decoder(&strm, UINT64_MAX, 0) != LZMA_OK) {
    throw VocabularyParsingError("failed to initialise xz decoder for " + path);
  }

  std::string out;
  std::vector<std::uint8_t> in_buf(1 << 16);
  std::vector<char> out_buf(1 << 16);
  lzma_action action = LZMA_RUN;
  bool ok = true;
  while (true) {
    if (strm.avail_in == 0 && action == LZMA_RUN) {
      in.read(reinterpret_cast<char*>(in_buf.data()), static_cast<std::streamsize>(in_buf.size()));
      if (in.bad()) {
        ok = false;
        break;
      }
      strm.next_in = in_buf.data();
      strm.avail_in = static_cast<std::size_t>(in.gcount());
      if (strm.avail_in == 0) {
        action = LZMA_FINISH;
      }
    }
    strm.next_out = reinterpret_cast<std::uint8_t*>(out_buf.data());
    strm.avail_out = out_buf.size();
    lzma_ret ret = lzma_code(&strm, action);
    std::size_t produced = out_buf.size() - strm.avail_out;
    out.append(out_buf.data(), produced);
    if (ret == LZMA_STREAM_END) {
      break;
    }
    // A truncated stream stalls under LZMA_FINISH with no output.
    if (ret != LZMA_OK || (action == LZMA_FINISH && produced == 0)) {
      ok = false;
      break;
    }
  }
  lzma_end(&strm);
  if (!ok) {
    throw VocabularyParsingError("failed to decode xz stream " + path);
  }
  return out;
}

}  // namespace

std::string ReadFileAll(const std::string& path) {
  if (ends_with(path, ".gz")) {
    return read_gz_file_all(path);
  }
  if (ends_with(path, ".xz")) {
    return read_xz_file_all(path);
  }
  return read_text_file_all(path);
}

std::vector<std::string_view> SplitLines(std::string_view contents) {
  std::vector<std::string_view> lines;
  std::size_t start = 0;
  while (start < contents.size()) {
    std::size_t pos = contents.find('\n', start);
    std::string_view line =
        pos == std::string_view::npos ? contents.substr(start) : contents.substr(start, pos - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.push_back(line);
    if (pos == std::string_view::npos) {
      break;
    }
    start = pos + 1;
  }
  return lines;
}

}  // namespace subtok
