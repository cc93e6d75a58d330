#include <gtest/gtest.h>
#include "config/config_file.hpp"
#include "config/store_config.hpp"
#include "store/archive_store.hpp"
#include "store/sharded_file_store.hpp"
#include "store/store_factory.hpp"
#include "test_utils.hpp"

using namespace guidstore;
using namespace guidstore::config;

class ConfigTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;

  void SetUp() override {
    init_test_logging();
    test_dir = make_test_dir("config_test");
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(test_dir, ec);
  }
};

TEST_F(ConfigTest, LoadCreatesMissingFileWithDefaults) {
  std::filesystem::path path = test_dir / "nested" / "store.json";
  ConfigFile<StoreConfig> file(path);

  bool saved = false;
  file.on_saved([&saved](const ConfigFile<StoreConfig>&) { saved = true; });
  file.load();

  EXPECT_TRUE(saved);
  ASSERT_TRUE(std::filesystem::exists(path));
  nlohmann::json document = nlohmann::json::parse(read_file_contents(path));
  EXPECT_EQ(document.at("kind"), "sharded");
  EXPECT_EQ(document.at("flush_mode"), "buffered");
  EXPECT_EQ(document.at("flush_interval_ms"), 1000);
}

TEST_F(ConfigTest, SaveThenLoadRestoresValues) {
  std::filesystem::path path = test_dir / "store.json";
  {
    ConfigFile<StoreConfig> file(path);
    file.values().kind = StoreKind::Archive;
    file.values().path = "/var/lib/app/db.zip";
    file.values().flush_mode = FlushPolicy::Auto;
    file.values().log_level = "debug";
    file.save();
  }

  ConfigFile<StoreConfig> reloaded(path);
  bool loaded = false;
  reloaded.on_loaded([&loaded](const ConfigFile<StoreConfig>&) { loaded = true; });
  reloaded.load();

  EXPECT_TRUE(loaded);
  EXPECT_EQ(reloaded.values().kind, StoreKind::Archive);
  EXPECT_EQ(reloaded.values().path, "/var/lib/app/db.zip");
  EXPECT_EQ(reloaded.values().flush_mode, FlushPolicy::Auto);
  EXPECT_EQ(reloaded.values().log_level, "debug");
}

TEST_F(ConfigTest, LoadMergesOnlyPresentFields) {
  std::filesystem::path path = test_dir / "partial.json";
  write_file_contents(path, R"({"path": "elsewhere", "flush_interval_ms": 250})");

  StoreConfig initial;
  initial.log_file = "keep.log";
  ConfigFile<StoreConfig> file(path, initial);
  file.load();

  EXPECT_EQ(file.values().path, "elsewhere");
  EXPECT_EQ(file.values().flush_interval_ms, 250u);
  EXPECT_EQ(file.values().log_file, "keep.log");
  EXPECT_EQ(file.values().kind, StoreKind::Sharded);
}

TEST_F(ConfigTest, InvalidFilesAreConfigErrors) {
  std::filesystem::path path = test_dir / "bad.json";

  write_file_contents(path, "{ not json");
  EXPECT_THROW(ConfigFile<StoreConfig>(path).load(), ConfigError);

  write_file_contents(path, R"({"kind": "floppy"})");
  EXPECT_THROW(ConfigFile<StoreConfig>(path).load(), ConfigError);

  write_file_contents(path, R"({"flush_interval_ms": "soon"})");
  EXPECT_THROW(ConfigFile<StoreConfig>(path).load(), ConfigError);

  write_file_contents(path, "[1, 2]");
  EXPECT_THROW(ConfigFile<StoreConfig>(path).load(), ConfigError);
}

TEST_F(ConfigTest, EmptyPathIsRejected) {
  ConfigFile<StoreConfig> file;
  EXPECT_THROW(file.save(), ConfigError);
  EXPECT_THROW(file.load(), ConfigError);

  file.set_path(test_dir / "late.json");
  EXPECT_NO_THROW(file.save());
}

TEST_F(ConfigTest, EnumNamesRoundTrip) {
  EXPECT_EQ(parse_store_kind(to_string(StoreKind::Archive)), StoreKind::Archive);
  EXPECT_EQ(parse_store_kind(to_string(StoreKind::Sharded)), StoreKind::Sharded);
  EXPECT_EQ(parse_flush_policy("interval"), FlushPolicy::Interval);
  EXPECT_THROW(parse_flush_policy("sometimes"), ConfigError);
}

TEST_F(ConfigTest, FactoryOpensConfiguredStore) {
  StoreConfig archive_config;
  archive_config.kind = StoreKind::Archive;
  archive_config.path = (test_dir / "db.zip").string();
  std::unique_ptr<store::Store> archive = store::open_store(archive_config);
  EXPECT_NE(dynamic_cast<store::ArchiveStore*>(archive.get()), nullptr);

  StoreConfig sharded_config;
  sharded_config.path = (test_dir / "dbdir").string();
  sharded_config.flush_mode = FlushPolicy::Interval;
  sharded_config.flush_interval_ms = 50;
  std::unique_ptr<store::Store> sharded = store::open_store(sharded_config);
  auto* sharded_store = dynamic_cast<store::ShardedFileStore*>(sharded.get());
  ASSERT_NE(sharded_store, nullptr);
  EXPECT_EQ(sharded_store->mode(), store::FlushMode::Interval);

  sharded_config.flush_mode = FlushPolicy::Auto;
  sharded = store::open_store(sharded_config);
  EXPECT_EQ(dynamic_cast<store::ShardedFileStore*>(sharded.get())->mode(), store::FlushMode::AutoFlush);
}

TEST_F(ConfigTest, FactoryRejectsInvalidCombinations) {
  StoreConfig config;
  config.kind = StoreKind::Archive;
  config.path = (test_dir / "db.zip").string();
  config.flush_mode = FlushPolicy::Interval;
  EXPECT_THROW(store::open_store(config), store::ConfigurationError);
  config.flush_mode = FlushPolicy::Auto;
  EXPECT_THROW(store::open_store(config), store::ConfigurationError);
  EXPECT_FALSE(std::filesystem::exists(config.path));

  config.flush_mode = FlushPolicy::Interval;
  config.kind = StoreKind::Sharded;
  config.flush_interval_ms = 0;
  EXPECT_THROW(store::open_store(config), store::ConfigurationError);
}
