#include "config/store_config.hpp"
#include "config/config_error.hpp"

namespace guidstore {
namespace config {

//==============================================
// ENUM NAMES
//==============================================

std::string to_string(StoreKind kind) {
  switch (kind) {
    case StoreKind::Archive: return "archive";
    case StoreKind::Sharded: return "sharded";
  }
  return "unknown";
}

std::string to_string(FlushPolicy policy) {
  switch (policy) {
    case FlushPolicy::Buffered: return "buffered";
    case FlushPolicy::Auto:     return "auto";
    case FlushPolicy::Interval: return "interval";
  }
  return "unknown";
}

StoreKind parse_store_kind(const std::string& name) {
  if (name == "archive") return StoreKind::Archive;
  if (name == "sharded") return StoreKind::Sharded;
  throw ConfigError("unknown store kind '" + name + "'");
}

FlushPolicy parse_flush_policy(const std::string& name) {
  if (name == "buffered") return FlushPolicy::Buffered;
  if (name == "auto") return FlushPolicy::Auto;
  if (name == "interval") return FlushPolicy::Interval;
  throw ConfigError("unknown flush mode '" + name + "'");
}


//==============================================
// JSON MAPPING
//==============================================

void to_json(nlohmann::json& j, const StoreConfig& config) {
  j = nlohmann::json{
    {"kind", to_string(config.kind)},
    {"path", config.path},
    {"flush_mode", to_string(config.flush_mode)},
    {"flush_interval_ms", config.flush_interval_ms},
    {"log_file", config.log_file},
    {"log_level", config.log_level}
  };
}

void from_json(const nlohmann::json& j, StoreConfig& config) {
  if (!j.is_object()) {
    throw ConfigError("store configuration must be a JSON object");
  }
  config.kind = parse_store_kind(j.value("kind", to_string(config.kind)));
  config.path = j.value("path", config.path);
  config.flush_mode = parse_flush_policy(j.value("flush_mode", to_string(config.flush_mode)));
  config.flush_interval_ms = j.value("flush_interval_ms", config.flush_interval_ms);
  config.log_file = j.value("log_file", config.log_file);
  config.log_level = j.value("log_level", config.log_level);
}

} // namespace config
} // namespace guidstore
