#pragma once

#include <string>
#include <filesystem>
#include <boost/uuid/uuid.hpp>

namespace guidstore {
namespace store {

// Entries are addressed by externally supplied 128-bit identifiers
using Key = boost::uuids::uuid;

// ---- KEY PARSING ----
// Accepts "xxxxxxxx-xxxx-...", 32 hex digits and "{...}" forms, throws ConfigurationError otherwise
Key parse_key(const std::string& text);


// ---- ADDRESS DERIVATION ----
// 32 lowercase hex digits without separators
std::string to_hex(const Key& key);
// First two hex digits of the key, used as the shard directory/prefix
std::string shard_of(const Key& key);
// "<shard>/<leaf>", '/' separated on every platform
std::string address(const Key& key);
// address(key) resolved below root as root/shard/leaf
std::filesystem::path address_path(const std::filesystem::path& root, const Key& key);

} // namespace store
} // namespace guidstore
