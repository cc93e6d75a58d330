#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include "store/store.hpp"
#include "archive/zip_archive.hpp"

namespace guidstore {
namespace store {

// Single compressed container file. Entries are named "<shard>/<leaf>" inside
// the archive. Writes stay in memory until flush() or dispose(), both of which
// rewrite the container (cost proportional to the container size).
class ArchiveStore : public Store {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Opens the container in update mode, creating it when absent
  explicit ArchiveStore(const std::filesystem::path& path);
  ~ArchiveStore() override;

  static std::unique_ptr<ArchiveStore> open(const std::filesystem::path& path);


  // ---- CORE STORAGE OPERATIONS ----
  // Live decompressing stream over the entry
  std::unique_ptr<std::istream> read_file(const Key& key) override;


  // ---- QUERY OPERATIONS ----
  // Index lookup, never decompresses
  bool exists(const Key& key) override;
  size_t entry_count();
  const std::filesystem::path& path() const { return path_; }


  // ---- DURABILITY AND LIFECYCLE ----
  // Closes and reopens the container so every pending change reaches disk
  void flush() override;
  void dispose() override;
  bool is_disposed() const override { return disposed_; }

protected:
  void write_text(const Key& key, const std::string& text) override;
  void write_stream(const Key& key, std::istream& data) override;
  std::optional<std::string> read_text(const Key& key) override;

private:
  // ---- PARAMETERS ----
  std::filesystem::path path_;
  std::unique_ptr<archive::ZipArchive> container_;
  bool disposed_ = false;
  // Serializes access to the container, which is not thread safe itself
  std::mutex mutex_;


  // ---- UTILITY METHODS ----
  // Throws StoreDisposedError once dispose() has run
  void ensure_usable(const char* operation) const;
  std::unique_ptr<archive::ZipArchive> open_container() const;
};

} // namespace store
} // namespace guidstore
