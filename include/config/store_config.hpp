#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace guidstore {
namespace config {

enum class StoreKind {
  Archive,
  Sharded
};

enum class FlushPolicy {
  Buffered,
  Auto,
  Interval
};

// Startup settings for a store and its logging
struct StoreConfig {
  StoreKind kind = StoreKind::Sharded;
  std::string path = "guidstore-data";
  FlushPolicy flush_mode = FlushPolicy::Buffered;
  uint64_t flush_interval_ms = 1000;
  std::string log_file;   // empty: log to console
  std::string log_level = "info";
};

// ---- ENUM NAMES ----
std::string to_string(StoreKind kind);
std::string to_string(FlushPolicy policy);
// Throw ConfigError for unknown names
StoreKind parse_store_kind(const std::string& name);
FlushPolicy parse_flush_policy(const std::string& name);


// ---- JSON MAPPING ----
void to_json(nlohmann::json& j, const StoreConfig& config);
// Field-by-field merge: absent fields keep their current value
void from_json(const nlohmann::json& j, StoreConfig& config);

} // namespace config
} // namespace guidstore
