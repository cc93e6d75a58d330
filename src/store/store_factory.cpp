#include "store/store_factory.hpp"
#include "store/archive_store.hpp"
#include "store/sharded_file_store.hpp"
#include <boost/log/trivial.hpp>

namespace guidstore {
namespace store {

std::unique_ptr<Store> open_store(const config::StoreConfig& config) {
  BOOST_LOG_TRIVIAL(debug) << "Store factory: Opening " << config::to_string(config.kind)
                           << " store at " << config.path;

  if (config.kind == config::StoreKind::Archive) {
    // The container is only rewritten on flush() or dispose()
    if (config.flush_mode != config::FlushPolicy::Buffered) {
      throw ConfigurationError("archive stores only support buffered flushing, got " +
                               config::to_string(config.flush_mode));
    }
    return ArchiveStore::open(config.path);
  }

  switch (config.flush_mode) {
    case config::FlushPolicy::Buffered:
      return ShardedFileStore::open(config.path, FlushMode::Buffered);
    case config::FlushPolicy::Auto:
      return ShardedFileStore::open(config.path, FlushMode::AutoFlush);
    case config::FlushPolicy::Interval:
      return std::make_unique<ShardedFileStore>(
        config.path, std::chrono::milliseconds(config.flush_interval_ms));
  }
  throw ConfigurationError("unknown flush mode");
}

} // namespace store
} // namespace guidstore
