#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace guidstore {
namespace utils {

enum class SizeUnit {
  Bytes,     // 1.2 MB
  Bits,      // 1.2 Mb
  IbiBytes   // 1.2 MiB
};

// Human readable size rounded to places decimals, trailing zeros dropped
std::string size_to_string(uint64_t bytes, int places = 2, SizeUnit unit = SizeUnit::Bytes);
// Same for the size of an existing file, throws std::filesystem::filesystem_error otherwise
std::string size_to_string(const std::filesystem::path& file, int places = 2,
                           SizeUnit unit = SizeUnit::Bytes);

} // namespace utils
} // namespace guidstore
