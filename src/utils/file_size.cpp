#include "utils/file_size.hpp"
#include <array>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace guidstore {
namespace utils {

namespace {

constexpr std::array<const char*, 8> SIZE_SUFFIXES = {"B", "KB", "MB", "GB", "TB", "PB", "EB", "ZB"};
constexpr std::array<const char*, 8> BIT_SUFFIXES = {"b", "Kb", "Mb", "Gb", "Tb", "Pb", "Eb", "Zb"};
constexpr std::array<const char*, 8> IBI_SUFFIXES = {"iB", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB", "ZiB"};

std::string format_rounded(double value, int places) {
  double multiplier = std::pow(10.0, places);
  double rounded = std::round(value * multiplier) / multiplier;

  std::ostringstream out;
  out << std::fixed << std::setprecision(places) << rounded;
  std::string text = out.str();
  if (text.find('.') != std::string::npos) {
    text.erase(text.find_last_not_of('0') + 1);
    if (text.back() == '.') {
      text.pop_back();
    }
  }
  return text;
}

} // namespace

std::string size_to_string(uint64_t bytes, int places, SizeUnit unit) {
  if (places < 0) {
    throw std::invalid_argument("size_to_string: negative decimal places");
  }

  const std::array<const char*, 8>* suffixes = &SIZE_SUFFIXES;
  double size = static_cast<double>(bytes);
  double section = 1000.0;

  switch (unit) {
    case SizeUnit::Bits:
      size *= 8;
      suffixes = &BIT_SUFFIXES;
      break;
    case SizeUnit::Bytes:
      break;
    case SizeUnit::IbiBytes:
      section = 1024.0;
      suffixes = &IBI_SUFFIXES;
      break;
  }

  size_t index = 0;
  while (size >= section && index < suffixes->size() - 1) {
    size /= section;
    index++;
  }

  return format_rounded(size, places) + " " + (*suffixes)[index];
}

std::string size_to_string(const std::filesystem::path& file, int places, SizeUnit unit) {
  return size_to_string(static_cast<uint64_t>(std::filesystem::file_size(file)), places, unit);
}

} // namespace utils
} // namespace guidstore
