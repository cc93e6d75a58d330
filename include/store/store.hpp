#pragma once

#include <string>
#include <istream>
#include <memory>
#include <optional>
#include <type_traits>
#include "store/key_addressing.hpp"
#include "store/serializer.hpp"
#include "store/store_error.hpp"

namespace guidstore {
namespace store {

// Common contract of the archive-backed and directory-backed stores.
// Object payloads are JSON text, stream payloads are copied verbatim.
class Store {
public:
  virtual ~Store() = default;

  Store(const Store&) = delete;
  Store& operator=(const Store&) = delete;


  // ---- CORE STORAGE OPERATIONS ----
  // Serializes value as JSON and stores it under key, replacing any previous entry
  template <typename T,
            typename = std::enable_if_t<!std::is_base_of_v<std::istream, std::decay_t<T>>>>
  void write_entry(const Key& key, const T& value) {
    write_text(key, serialize(value));
  }

  // Copies the remaining bytes of data verbatim under key
  void write_entry(const Key& key, std::istream& data) { write_stream(key, data); }

  // Returns std::nullopt for an absent key or an empty payload (a buffered
  // entry that has not been flushed yet), throws PayloadError on undecodable content
  template <typename T>
  std::optional<T> read_entry(const Key& key) {
    std::optional<std::string> text = read_text(key);
    if (!text || text->empty()) {
      return std::nullopt;
    }
    return deserialize<T>(*text);
  }

  // Live read stream over the stored bytes, nullptr when the key is absent
  virtual std::unique_ptr<std::istream> read_file(const Key& key) = 0;


  // ---- QUERY OPERATIONS ----
  virtual bool exists(const Key& key) = 0;


  // ---- DURABILITY AND LIFECYCLE ----
  // Pushes pending writes to the backing medium
  virtual void flush() = 0;
  // Flushes and releases the backing resource; the instance is unusable afterwards
  virtual void dispose() = 0;
  virtual bool is_disposed() const = 0;

protected:
  Store() = default;

  virtual void write_text(const Key& key, const std::string& text) = 0;
  virtual void write_stream(const Key& key, std::istream& data) = 0;
  virtual std::optional<std::string> read_text(const Key& key) = 0;
};

} // namespace store
} // namespace guidstore
