#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "store/store_error.hpp"

namespace guidstore {
namespace store {

// JSON text codec used for every object payload. Types participate through
// nlohmann's to_json/from_json customization points.

// Throws PayloadError when the value cannot be encoded (e.g. invalid UTF-8)
template <typename T>
std::string serialize(const T& value) {
  try {
    return nlohmann::json(value).dump();
  } catch (const nlohmann::json::exception& e) {
    throw PayloadError(e.what());
  }
}

// Throws PayloadError when the text is not JSON or does not convert to T
template <typename T>
T deserialize(const std::string& text) {
  try {
    return nlohmann::json::parse(text).get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw PayloadError(e.what());
  }
}

} // namespace store
} // namespace guidstore
