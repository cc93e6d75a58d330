#include "store/key_addressing.hpp"
#include "store/store_error.hpp"
#include <boost/uuid/string_generator.hpp>

namespace guidstore {
namespace store {

//==============================================
// KEY PARSING
//==============================================

Key parse_key(const std::string& text) {
  try {
    boost::uuids::string_generator gen;
    return gen(text);
  } catch (const std::runtime_error& e) {
    throw ConfigurationError("invalid key '" + text + "': " + e.what());
  }
}


//==============================================
// ADDRESS DERIVATION
//==============================================

std::string to_hex(const Key& key) {
  static constexpr char digits[] = "0123456789abcdef";

  std::string hex;
  hex.reserve(key.size() * 2);
  for (auto byte : key) {
    hex.push_back(digits[(byte >> 4) & 0x0F]);
    hex.push_back(digits[byte & 0x0F]);
  }
  return hex;
}

std::string shard_of(const Key& key) {
  return to_hex(key).substr(0, 2);
}

std::string address(const Key& key) {
  std::string leaf = to_hex(key);
  return leaf.substr(0, 2) + "/" + leaf;
}

std::filesystem::path address_path(const std::filesystem::path& root, const Key& key) {
  std::string leaf = to_hex(key);
  return root / leaf.substr(0, 2) / leaf;
}

} // namespace store
} // namespace guidstore
