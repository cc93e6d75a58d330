#include "store/sharded_file_store.hpp"
#include <algorithm>
#include <exception>
#include <iterator>
#include <thread>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/log/trivial.hpp>

namespace guidstore {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ShardedFileStore::ShardedFileStore(const std::filesystem::path& root, FlushMode mode)
  : root_(root)
  , mode_(mode) {
  BOOST_LOG_TRIVIAL(info) << "ShardedFileStore: Initializing store with root: " << root_.string();

  if (mode_ == FlushMode::Interval) {
    throw ConfigurationError("ShardedFileStore: interval mode requires a flush interval");
  }
  check_root();
}

ShardedFileStore::ShardedFileStore(const std::filesystem::path& root,
                                   std::chrono::milliseconds flush_interval)
  : root_(root)
  , mode_(FlushMode::Interval) {
  BOOST_LOG_TRIVIAL(info) << "ShardedFileStore: Initializing store with root: " << root_.string()
                          << " and flush interval " << flush_interval.count() << "ms";

  if (flush_interval.count() <= 0) {
    throw ConfigurationError("ShardedFileStore: flush interval must be positive");
  }
  check_root();

  flusher_ = std::make_unique<utils::IntervalFlusher>(flush_interval, [this]() {
    if (!disposed_) {
      flush();
    }
  });
  flusher_->start();
}

ShardedFileStore::~ShardedFileStore() {
  if (disposed_) {
    return;
  }
  try {
    dispose();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "ShardedFileStore: Failed to dispose " << root_.string()
                             << " during destruction: " << e.what();
  }
}

std::unique_ptr<ShardedFileStore> ShardedFileStore::open(const std::filesystem::path& root,
                                                         FlushMode mode) {
  return std::make_unique<ShardedFileStore>(root, mode);
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void ShardedFileStore::write_text(const Key& key, const std::string& text) {
  ensure_usable("write_entry");
  BOOST_LOG_TRIVIAL(debug) << "ShardedFileStore: Writing entry to " << to_hex(key);

  QueuedStreamPtr handle = acquire_stream(key);
  std::lock_guard<std::mutex> lock(handle->mutex);

  try {
    // A second write in the same session replaces the first
    if (handle->written) {
      handle->stream.close();
      open_for_write(*handle);
    }

    handle->stream.write(text.data(), static_cast<std::streamsize>(text.size()));
    finish_write(*handle, key);
  } catch (const StoreIOError&) {
    discard_stream(key, handle);
    throw;
  }
}

void ShardedFileStore::write_stream(const Key& key, std::istream& data) {
  ensure_usable("write_entry");
  BOOST_LOG_TRIVIAL(debug) << "ShardedFileStore: Writing file entry to " << to_hex(key);

  if (!data.good()) {
    BOOST_LOG_TRIVIAL(error) << "ShardedFileStore: Invalid input stream provided for key: " << to_hex(key);
    throw StoreIOError("ShardedFileStore: Invalid input stream");
  }

  QueuedStreamPtr handle = acquire_stream(key);
  std::lock_guard<std::mutex> lock(handle->mutex);

  try {
    if (handle->written) {
      handle->stream.close();
      open_for_write(*handle);
    }

    // Copy the input stream in chunks
    char buffer[4096];
    size_t bytes_written = 0;
    while (data.read(buffer, sizeof(buffer))) {
      handle->stream.write(buffer, data.gcount());
      bytes_written += static_cast<size_t>(data.gcount());
    }
    if (data.gcount() > 0) {
      handle->stream.write(buffer, data.gcount());
      bytes_written += static_cast<size_t>(data.gcount());
    }
    if (data.bad()) {
      throw StoreIOError("ShardedFileStore: Failed reading input stream for key " + to_hex(key));
    }

    BOOST_LOG_TRIVIAL(trace) << "ShardedFileStore: Copied " << bytes_written << " bytes for key: " << to_hex(key);
    finish_write(*handle, key);
  } catch (const StoreIOError&) {
    discard_stream(key, handle);
    throw;
  }
}

std::optional<std::string> ShardedFileStore::read_text(const Key& key) {
  std::unique_ptr<std::istream> stream = read_file(key);
  if (!stream) {
    return std::nullopt;
  }

  std::string text{std::istreambuf_iterator<char>(*stream), std::istreambuf_iterator<char>()};
  if (stream->bad()) {
    throw StoreIOError("ShardedFileStore: Failed to read " + path_for(key).string());
  }
  return text;
}

std::unique_ptr<std::istream> ShardedFileStore::read_file(const Key& key) {
  ensure_usable("read_file");

  std::filesystem::path file_path = path_for(key);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(file_path, ec)) {
    BOOST_LOG_TRIVIAL(debug) << "ShardedFileStore: Key " << to_hex(key) << " not found";
    return nullptr;
  }

  auto stream = std::make_unique<std::ifstream>(file_path, std::ios::binary);
  if (!*stream) {
    throw StoreIOError("ShardedFileStore: Failed to open file: " + file_path.string());
  }

  BOOST_LOG_TRIVIAL(debug) << "ShardedFileStore: Reading entry " << to_hex(key);
  return stream;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool ShardedFileStore::exists(const Key& key) {
  ensure_usable("exists");

  std::error_code ec;
  bool found = std::filesystem::is_regular_file(path_for(key), ec);
  BOOST_LOG_TRIVIAL(trace) << "ShardedFileStore: Key " << to_hex(key) << (found ? " exists" : " not found");
  return found;
}

size_t ShardedFileStore::open_handle_count() {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  return queued_streams_.size();
}

std::filesystem::path ShardedFileStore::path_for(const Key& key) const {
  return address_path(root_, key);
}


//==============================================
// DURABILITY AND LIFECYCLE
//==============================================

void ShardedFileStore::flush() {
  ensure_usable("flush");

  auto streams = snapshot_streams();
  BOOST_LOG_TRIVIAL(debug) << "ShardedFileStore: Flushing " << streams.size() << " open handles";

  for_each_stream(streams, [](QueuedStream& handle) {
    std::lock_guard<std::mutex> lock(handle.mutex);
    if (!handle.stream.is_open()) {
      return;
    }
    handle.stream.flush();
    if (!handle.stream) {
      throw StoreIOError("ShardedFileStore: Failed to flush " + handle.path.string());
    }
  });
}

void ShardedFileStore::dispose() {
  if (disposed_.exchange(true)) {
    BOOST_LOG_TRIVIAL(warning) << "ShardedFileStore: Dispose called twice for " << root_.string();
    return;
  }

  BOOST_LOG_TRIVIAL(warning) << "ShardedFileStore: Disposing of the database directory: " << root_.string();

  // No timer flush may run while handles are being closed
  if (flusher_) {
    flusher_->stop();
    flusher_.reset();
  }

  std::map<Key, QueuedStreamPtr> streams;
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    streams.swap(queued_streams_);
  }

  for_each_stream(streams, [](QueuedStream& handle) {
    std::lock_guard<std::mutex> lock(handle.mutex);
    if (!handle.stream.is_open()) {
      return;
    }
    handle.stream.close();
    if (!handle.stream) {
      throw StoreIOError("ShardedFileStore: Failed to close " + handle.path.string());
    }
  });

  BOOST_LOG_TRIVIAL(debug) << "ShardedFileStore: Closed " << streams.size() << " handles";
}


//==============================================
// HANDLE MANAGEMENT
//==============================================

ShardedFileStore::QueuedStreamPtr ShardedFileStore::acquire_stream(const Key& key) {
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = queued_streams_.find(key);
    if (it != queued_streams_.end()) {
      return it->second;
    }
  }

  // Open outside the registry lock
  auto handle = std::make_shared<QueuedStream>();
  handle->path = path_for(key);
  open_for_write(*handle);

  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto [it, inserted] = queued_streams_.emplace(key, handle);
  if (inserted) {
    BOOST_LOG_TRIVIAL(debug) << "ShardedFileStore: Registered write handle for " << to_hex(key);
  }
  return it->second;
}

void ShardedFileStore::open_for_write(QueuedStream& handle) const {
  std::error_code ec;
  std::filesystem::create_directories(handle.path.parent_path(), ec);
  if (ec) {
    throw StoreIOError("ShardedFileStore: Failed to create shard directory " +
                       handle.path.parent_path().string() + ": " + ec.message());
  }

  handle.stream.clear();
  handle.stream.open(handle.path, std::ios::binary | std::ios::out | std::ios::trunc);
  if (!handle.stream) {
    throw StoreIOError("ShardedFileStore: Failed to create file: " + handle.path.string());
  }
  handle.written = false;
}

void ShardedFileStore::for_each_stream(const std::map<Key, QueuedStreamPtr>& streams,
                                       const std::function<void(QueuedStream&)>& action) const {
  if (streams.empty()) {
    return;
  }
  if (streams.size() == 1) {
    action(*streams.begin()->second);
    return;
  }

  size_t workers = std::max<size_t>(1, std::thread::hardware_concurrency());
  boost::asio::thread_pool pool(std::min(streams.size(), workers));

  std::mutex error_mutex;
  std::exception_ptr first_error;

  for (const auto& entry : streams) {
    QueuedStreamPtr handle = entry.second;
    boost::asio::post(pool, [&action, &error_mutex, &first_error, handle]() {
      try {
        action(*handle);
      } catch (...) {
        std::lock_guard<std::mutex> lock(error_mutex);
        if (!first_error) {
          first_error = std::current_exception();
        }
      }
    });
  }
  pool.join();

  if (first_error) {
    std::rethrow_exception(first_error);
  }
}

void ShardedFileStore::discard_stream(const Key& key, const QueuedStreamPtr& handle) {
  BOOST_LOG_TRIVIAL(warning) << "ShardedFileStore: Dropping write handle for " << to_hex(key)
                             << " after a failed write";
  handle->stream.close();
  handle->stream.clear();
  handle->written = false;

  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto it = queued_streams_.find(key);
  if (it != queued_streams_.end() && it->second == handle) {
    queued_streams_.erase(it);
  }
}

std::map<Key, ShardedFileStore::QueuedStreamPtr> ShardedFileStore::snapshot_streams() {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  return queued_streams_;
}


//==============================================
// UTILITY METHODS
//==============================================

void ShardedFileStore::check_root() const {
  if (root_.empty()) {
    throw ConfigurationError("ShardedFileStore: root path is empty");
  }

  std::error_code ec;
  std::filesystem::create_directories(root_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "ShardedFileStore: Failed to create root " << root_.string() << ": " << ec.message();
    throw StoreIOError("ShardedFileStore: Failed to create root " + root_.string() + ": " + ec.message());
  }
  if (!std::filesystem::is_directory(root_, ec)) {
    throw StoreIOError("ShardedFileStore: Root is not a directory: " + root_.string());
  }
  BOOST_LOG_TRIVIAL(debug) << "ShardedFileStore: Store directory created/verified at: " << root_.string();
}

void ShardedFileStore::ensure_usable(const char* operation) const {
  if (disposed_) {
    throw StoreDisposedError(std::string("ShardedFileStore: ") + operation + " on " + root_.string());
  }
}

void ShardedFileStore::finish_write(QueuedStream& handle, const Key& key) {
  if (!handle.stream) {
    throw StoreIOError("ShardedFileStore: Failed to write " + handle.path.string());
  }
  handle.written = true;

  if (mode_ == FlushMode::AutoFlush) {
    handle.stream.flush();
    if (!handle.stream) {
      throw StoreIOError("ShardedFileStore: Failed to flush " + handle.path.string());
    }
    BOOST_LOG_TRIVIAL(trace) << "ShardedFileStore: Auto-flushed " << to_hex(key);
  }
}

} // namespace store
} // namespace guidstore
