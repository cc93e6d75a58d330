#include "store/archive_store.hpp"
#include <iterator>
#include <boost/log/trivial.hpp>

namespace guidstore {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ArchiveStore::ArchiveStore(const std::filesystem::path& path) : path_(path) {
  BOOST_LOG_TRIVIAL(debug) << "ArchiveStore: Creating or opening database file: " << path_.string();

  if (path_.empty()) {
    throw ConfigurationError("ArchiveStore: container path is empty");
  }
  std::error_code ec;
  if (std::filesystem::is_directory(path_, ec)) {
    throw ConfigurationError("ArchiveStore: container path is a directory: " + path_.string());
  }

  container_ = open_container();
}

ArchiveStore::~ArchiveStore() {
  if (disposed_) {
    return;
  }
  try {
    dispose();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "ArchiveStore: Failed to dispose " << path_.string()
                             << " during destruction: " << e.what();
  }
}

std::unique_ptr<ArchiveStore> ArchiveStore::open(const std::filesystem::path& path) {
  return std::make_unique<ArchiveStore>(path);
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void ArchiveStore::write_text(const Key& key, const std::string& text) {
  std::lock_guard<std::mutex> lock(mutex_);
  ensure_usable("write_entry");

  const std::string name = address(key);
  BOOST_LOG_TRIVIAL(debug) << "ArchiveStore: Writing entry to " << to_hex(key);

  try {
    // put() drops an existing entry of the same name; streams cannot be rewritten in place
    container_->put(name, text);
  } catch (const archive::ArchiveError& e) {
    throw StoreIOError(std::string("ArchiveStore: Failed to write entry ") + name + ": " + e.what());
  }
}

void ArchiveStore::write_stream(const Key& key, std::istream& data) {
  std::lock_guard<std::mutex> lock(mutex_);
  ensure_usable("write_entry");

  const std::string name = address(key);
  BOOST_LOG_TRIVIAL(debug) << "ArchiveStore: Writing file entry to " << to_hex(key);

  try {
    container_->put(name, data);
  } catch (const archive::ArchiveError& e) {
    throw StoreIOError(std::string("ArchiveStore: Failed to write entry ") + name + ": " + e.what());
  }
}

std::optional<std::string> ArchiveStore::read_text(const Key& key) {
  std::unique_ptr<std::istream> stream = read_file(key);
  if (!stream) {
    return std::nullopt;
  }

  try {
    return std::string(std::istreambuf_iterator<char>(*stream), std::istreambuf_iterator<char>());
  } catch (const archive::ArchiveError& e) {
    throw StoreIOError(std::string("ArchiveStore: Failed to read entry ") + address(key) + ": " + e.what());
  }
}

std::unique_ptr<std::istream> ArchiveStore::read_file(const Key& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  ensure_usable("read_file");

  const std::string name = address(key);
  try {
    std::unique_ptr<std::istream> stream = container_->open_entry(name);
    if (stream) {
      BOOST_LOG_TRIVIAL(debug) << "ArchiveStore: Reading entry " << to_hex(key);
    }
    return stream;
  } catch (const archive::ArchiveError& e) {
    throw StoreIOError(std::string("ArchiveStore: Failed to open entry ") + name + ": " + e.what());
  }
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool ArchiveStore::exists(const Key& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  ensure_usable("exists");
  return container_->contains(address(key));
}

size_t ArchiveStore::entry_count() {
  std::lock_guard<std::mutex> lock(mutex_);
  ensure_usable("entry_count");
  return container_->entry_count();
}


//==============================================
// DURABILITY AND LIFECYCLE
//==============================================

void ArchiveStore::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  ensure_usable("flush");

  BOOST_LOG_TRIVIAL(debug) << "ArchiveStore: Flushing " << path_.string();
  try {
    container_->close();
    container_.reset();
    container_ = open_container();
  } catch (const archive::ArchiveError& e) {
    throw StoreIOError(std::string("ArchiveStore: Failed to flush ") + path_.string() + ": " + e.what());
  }
}

void ArchiveStore::dispose() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (disposed_) {
    BOOST_LOG_TRIVIAL(warning) << "ArchiveStore: Dispose called twice for " << path_.string();
    return;
  }

  BOOST_LOG_TRIVIAL(warning) << "ArchiveStore: Disposing of the database file: " << path_.string();
  disposed_ = true;
  if (!container_) {
    return;
  }

  std::unique_ptr<archive::ZipArchive> container = std::move(container_);
  try {
    container->close();
  } catch (const archive::ArchiveError& e) {
    throw StoreIOError(std::string("ArchiveStore: Failed to close ") + path_.string() + ": " + e.what());
  }
}


//==============================================
// UTILITY METHODS
//==============================================

void ArchiveStore::ensure_usable(const char* operation) const {
  if (disposed_ || !container_) {
    throw StoreDisposedError(std::string("ArchiveStore: ") + operation + " on " + path_.string());
  }
}

std::unique_ptr<archive::ZipArchive> ArchiveStore::open_container() const {
  try {
    return std::make_unique<archive::ZipArchive>(path_);
  } catch (const archive::ArchiveError& e) {
    BOOST_LOG_TRIVIAL(error) << "ArchiveStore: Failed to open " << path_.string() << ": " << e.what();
    throw StoreIOError(std::string("ArchiveStore: Failed to open ") + path_.string() + ": " + e.what());
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "ArchiveStore: Failed to open " << path_.string() << ": " << e.what();
    throw StoreIOError(std::string("ArchiveStore: Failed to open ") + path_.string() + ": " + e.what());
  }
}

} // namespace store
} // namespace guidstore
