#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace subtok {

// Reads a whole file. Paths ending in .gz are inflated with zlib and paths
// ending in .xz are decoded with liblzma.
// Throws FileNotFoundError when the file cannot be opened and
// VocabularyParsingError when it cannot be read or decompressed.
std::string ReadFileAll(const std::string& path);

// Splits file contents into lines, dropping "\n" / "\r\n" terminators. A
// trailing terminator does not produce an empty last line.
std::vector<std::string_view> SplitLines(std::string_view contents);

}  // namespace subtok
