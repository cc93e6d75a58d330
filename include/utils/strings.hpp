#pragma once

#include <string>

namespace guidstore {
namespace utils {

// Removes characters that may not appear in a file name
std::string valid_file_name(const std::string& original);

// "abc123" is alphanumeric, "abc123!" is not. Empty strings pass.
bool is_alpha_numeric(const std::string& text);
// "abc" is alphabetical, "abc123" is not
bool is_alphabetical(const std::string& text);

} // namespace utils
} // namespace guidstore
