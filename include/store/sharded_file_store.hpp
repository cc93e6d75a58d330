#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "store/store.hpp"
#include "utils/interval_flusher.hpp"

namespace guidstore {
namespace store {

enum class FlushMode {
  Buffered,   // rely on flush() or dispose()
  AutoFlush,  // flush the handle after every write
  Interval    // flushed periodically by an IntervalFlusher
};

// One file per entry below root/<shard>/<leaf>. Write handles are held open per
// key until flush/dispose so repeated writes avoid reopening files.
class ShardedFileStore : public Store {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Buffered or auto-flush store rooted at root, created when absent
  explicit ShardedFileStore(const std::filesystem::path& root, FlushMode mode = FlushMode::Buffered);
  // Store flushed every flush_interval by a background timer
  ShardedFileStore(const std::filesystem::path& root, std::chrono::milliseconds flush_interval);
  ~ShardedFileStore() override;

  static std::unique_ptr<ShardedFileStore> open(const std::filesystem::path& root,
                                                FlushMode mode = FlushMode::Buffered);


  // ---- CORE STORAGE OPERATIONS ----
  // Read-only handle over the file, independent of any held-open write handle
  std::unique_ptr<std::istream> read_file(const Key& key) override;


  // ---- QUERY OPERATIONS ----
  // Filesystem probe at the derived address, not an index lookup
  bool exists(const Key& key) override;
  size_t open_handle_count();
  FlushMode mode() const { return mode_; }
  const std::filesystem::path& root() const { return root_; }
  std::filesystem::path path_for(const Key& key) const;


  // ---- DURABILITY AND LIFECYCLE ----
  // Flushes every held-open handle concurrently without closing them
  void flush() override;
  // Stops the timer, flushes and closes every handle
  void dispose() override;
  bool is_disposed() const override { return disposed_; }

protected:
  void write_text(const Key& key, const std::string& text) override;
  void write_stream(const Key& key, std::istream& data) override;
  std::optional<std::string> read_text(const Key& key) override;

private:
  // Held-open write handle; its mutex orders writes against timer flushes
  struct QueuedStream {
    std::mutex mutex;
    std::filesystem::path path;
    std::ofstream stream;
    bool written = false;
  };
  using QueuedStreamPtr = std::shared_ptr<QueuedStream>;

  // ---- PARAMETERS ----
  std::filesystem::path root_;
  FlushMode mode_;
  std::map<Key, QueuedStreamPtr> queued_streams_;
  // Guards queued_streams_ only, never held during file I/O
  std::mutex registry_mutex_;
  std::unique_ptr<utils::IntervalFlusher> flusher_;
  std::atomic<bool> disposed_{false};


  // ---- HANDLE MANAGEMENT ----
  // Returns the registered handle for key, registering a new one when missing
  QueuedStreamPtr acquire_stream(const Key& key);
  // Opens (truncating) the file behind handle, creating the shard directory
  void open_for_write(QueuedStream& handle) const;
  // Runs action on every handle in a pool sized by the handle count
  void for_each_stream(const std::map<Key, QueuedStreamPtr>& streams,
                       const std::function<void(QueuedStream&)>& action) const;
  std::map<Key, QueuedStreamPtr> snapshot_streams();
  // Closes a handle whose write failed and unregisters it; caller holds handle->mutex
  void discard_stream(const Key& key, const QueuedStreamPtr& handle);


  // ---- UTILITY METHODS ----
  void check_root() const;
  void ensure_usable(const char* operation) const;
  void finish_write(QueuedStream& handle, const Key& key);
};

} // namespace store
} // namespace guidstore
