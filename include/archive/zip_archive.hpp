#ifndef GUIDSTORE_ZIP_ARCHIVE_HPP
#define GUIDSTORE_ZIP_ARCHIVE_HPP

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "archive/archive_error.hpp"

namespace guidstore::archive {

// Central directory view of one entry
struct ZipEntryInfo {
  std::string name;
  uint16_t flags = 0;
  uint16_t method = 0;
  uint16_t mod_time = 0;
  uint16_t mod_date = 0;
  uint32_t crc32 = 0;
  uint64_t compressed_size = 0;
  uint64_t uncompressed_size = 0;
  uint64_t local_header_offset = 0;
};

// ZIP container opened in update mode. Committed entries are read straight from
// the backing file; added entries are deflated into memory and only reach the
// file on commit(), which rewrites the container and swaps it in atomically.
class ZipArchive {
public:
  static constexpr int COMPRESSION_LEVEL = 9;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Opens path, creating an empty archive when it does not exist
  explicit ZipArchive(const std::filesystem::path& path);
  // Commits pending changes if close() was not called
  ~ZipArchive();

  ZipArchive(const ZipArchive&) = delete;
  ZipArchive& operator=(const ZipArchive&) = delete;


  // ---- ENTRY OPERATIONS ----
  bool contains(const std::string& name) const;
  // Adds or replaces an entry; replacing drops the old record on commit
  void put(const std::string& name, const std::string& data);
  void put(const std::string& name, std::istream& data);
  // Returns false when no such entry exists
  bool remove(const std::string& name);
  // Decompressing read stream, nullptr when the entry is absent
  std::unique_ptr<std::istream> open_entry(const std::string& name) const;


  // ---- QUERY OPERATIONS ----
  std::vector<std::string> entry_names() const;
  size_t entry_count() const;
  bool is_dirty() const { return dirty_; }
  bool is_open() const { return open_; }
  const std::filesystem::path& path() const { return path_; }


  // ---- PERSISTENCE ----
  // Rewrites the container with all pending changes; no-op when clean
  void commit();
  // Commits and releases the archive, further calls throw ArchiveClosedError
  void close();

private:
  // Payload added since the last commit, already compressed
  struct PendingEntry {
    ZipEntryInfo info;
    std::string compressed;
  };

  // ---- PARAMETERS ----
  std::filesystem::path path_;
  // Entries present in the backing file that are still live
  std::unordered_map<std::string, ZipEntryInfo> committed_;
  std::unordered_map<std::string, PendingEntry> pending_;
  bool open_ = false;
  bool dirty_ = false;


  // ---- INDEX LOADING ----
  void create_empty() const;
  // Parses end of central directory and central directory into committed_
  void load_index();


  // ---- PERSISTENCE ----
  // Copies one committed record verbatim from source, returns the bytes copied
  uint64_t copy_record(std::istream& source, std::ostream& target, const ZipEntryInfo& info) const;
  // Writes a fresh local header followed by the compressed bytes, returns the bytes written
  uint64_t write_record(std::ostream& target, const PendingEntry& entry) const;
  // Byte offset of the payload behind a committed entry's local header
  uint64_t data_offset(std::istream& source, const ZipEntryInfo& info) const;


  // ---- UTILITY METHODS ----
  void ensure_open() const;
  static void validate_name(const std::string& name);
  // Deflates data into a pending entry named name
  static PendingEntry compress(const std::string& name, std::istream& data);
};

} // namespace guidstore::archive

#endif // GUIDSTORE_ZIP_ARCHIVE_HPP
