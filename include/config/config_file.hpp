#pragma once

#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>
#include <boost/log/trivial.hpp>
#include "config/config_error.hpp"

namespace guidstore {
namespace config {

// JSON backed configuration object owned by the caller. T supplies
//   void to_json(nlohmann::json&, const T&)
//   void from_json(const nlohmann::json&, T&)
// where from_json reads each field with the current value as default, so a
// load only replaces the fields present in the file.
template <typename T>
class ConfigFile {
public:
  using Listener = std::function<void(const ConfigFile<T>&)>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ConfigFile() = default;
  explicit ConfigFile(std::filesystem::path path, T values = T{})
    : path_(std::move(path))
    , values_(std::move(values)) {}


  // ---- PERSISTENCE ----
  // Writes the current values as indented JSON, throws ConfigError without a path
  void save() {
    if (path_.empty()) {
      throw ConfigError("configuration file path is not set");
    }
    BOOST_LOG_TRIVIAL(debug) << "Config: Saving config file: " << path_.string();

    if (path_.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(path_.parent_path(), ec);
    }

    std::ofstream file(path_, std::ios::trunc);
    if (!file) {
      throw ConfigError("failed to open " + path_.string() + " for writing");
    }
    file << nlohmann::json(values_).dump(4);
    file.flush();
    if (!file) {
      throw ConfigError("failed to write " + path_.string());
    }

    if (on_saved_) {
      on_saved_(*this);
    }
  }

  // Merges the file into the current values, or creates it from them when absent
  void load() {
    if (path_.empty()) {
      throw ConfigError("configuration file path is not set");
    }

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
      BOOST_LOG_TRIVIAL(info) << "Config: " << path_.string() << " not found, writing defaults";
      save();
      return;
    }

    BOOST_LOG_TRIVIAL(debug) << "Config: Loading config file: " << path_.string();
    std::ifstream file(path_);
    if (!file) {
      throw ConfigError("failed to open " + path_.string() + " for reading");
    }

    try {
      nlohmann::json document = nlohmann::json::parse(file);
      from_json(document, values_);
    } catch (const nlohmann::json::exception& e) {
      throw ConfigError("failed to parse " + path_.string() + ": " + e.what());
    }

    if (on_loaded_) {
      on_loaded_(*this);
    }
  }


  // ---- GETTERS AND SETTERS ----
  const std::filesystem::path& path() const { return path_; }
  void set_path(std::filesystem::path path) { path_ = std::move(path); }

  T& values() { return values_; }
  const T& values() const { return values_; }

  void on_saved(Listener listener) { on_saved_ = std::move(listener); }
  void on_loaded(Listener listener) { on_loaded_ = std::move(listener); }

private:
  // ---- PARAMETERS ----
  std::filesystem::path path_;
  T values_{};
  Listener on_saved_;
  Listener on_loaded_;
};

} // namespace config
} // namespace guidstore
