#include "utils/strings.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>

namespace guidstore {
namespace utils {

namespace {

constexpr const char* INVALID_FILE_NAME_CHARS = "/\\:*?\"<>|";

bool is_invalid_file_name_char(unsigned char c) {
  return std::iscntrl(c) != 0 || std::strchr(INVALID_FILE_NAME_CHARS, c) != nullptr;
}

} // namespace

std::string valid_file_name(const std::string& original) {
  std::string result;
  result.reserve(original.size());
  for (char c : original) {
    if (!is_invalid_file_name_char(static_cast<unsigned char>(c))) {
      result.push_back(c);
    }
  }
  return result;
}

bool is_alpha_numeric(const std::string& text) {
  return std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isalnum(c) != 0; });
}

bool is_alphabetical(const std::string& text) {
  return std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isalpha(c) != 0; });
}

} // namespace utils
} // namespace guidstore
