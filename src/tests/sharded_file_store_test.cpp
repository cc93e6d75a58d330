#include <gtest/gtest.h>
#include <map>
#include <sstream>
#include <stdexcept>
#include <streambuf>
#include <thread>
#include <vector>
#include <boost/uuid/random_generator.hpp>
#include "store/sharded_file_store.hpp"
#include "test_utils.hpp"

using namespace guidstore::store;

class ShardedFileStoreTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::filesystem::path root;

  const Key key = parse_key("ab345678-0000-0000-0000-000000000001");
  const Key other_key = parse_key("cd345678-0000-0000-0000-000000000002");

  void SetUp() override {
    init_test_logging();
    test_dir = make_test_dir("sharded_store_test");
    root = test_dir / "dbdir";
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(test_dir, ec);
  }
};

TEST_F(ShardedFileStoreTest, CreatesRootOnConstruction) {
  ShardedFileStore store(root);
  EXPECT_TRUE(std::filesystem::is_directory(root));
  EXPECT_EQ(store.mode(), FlushMode::Buffered);
}

TEST_F(ShardedFileStoreTest, FilesLiveAtShardedAddresses) {
  ShardedFileStore store(root);
  store.write_entry(key, std::string("hello"));
  store.dispose();

  std::filesystem::path expected = root / "ab" / "ab345678000000000000000000000001";
  EXPECT_EQ(store.path_for(key), expected);
  EXPECT_TRUE(std::filesystem::is_regular_file(expected));
  EXPECT_EQ(read_file_contents(expected), "\"hello\"");
}

TEST_F(ShardedFileStoreTest, BufferedVisibilityBeforeFlush) {
  ShardedFileStore store(root, FlushMode::Buffered);
  store.write_entry(key, std::string("hello"));

  // The file is created when its handle is registered, the bytes follow on flush
  EXPECT_TRUE(store.exists(key));
  EXPECT_EQ(store.open_handle_count(), 1u);
  EXPECT_EQ(read_file_contents(store.path_for(key)), "");
  EXPECT_FALSE(store.read_entry<std::string>(key).has_value());

  store.flush();
  EXPECT_EQ(store.read_entry<std::string>(key), std::optional<std::string>("hello"));
  // Flushing keeps the handle open
  EXPECT_EQ(store.open_handle_count(), 1u);
}

TEST_F(ShardedFileStoreTest, DisposePersistsBufferedWrites) {
  {
    ShardedFileStore store(root);
    store.write_entry(key, std::map<std::string, int>{{"a", 1}});
    store.write_entry(other_key, std::vector<int>{1, 2, 3});
    store.dispose();
    EXPECT_EQ(store.open_handle_count(), 0u);
  }

  ShardedFileStore reopened(root);
  auto map = reopened.read_entry<std::map<std::string, int>>(key);
  ASSERT_TRUE(map.has_value());
  EXPECT_EQ(map->at("a"), 1);
  EXPECT_EQ(reopened.read_entry<std::vector<int>>(other_key), std::optional<std::vector<int>>(std::vector<int>{1, 2, 3}));
}

TEST_F(ShardedFileStoreTest, AutoFlushMakesWritesVisibleImmediately) {
  ShardedFileStore store(root, FlushMode::AutoFlush);
  store.write_entry(key, 42);

  EXPECT_EQ(read_file_contents(store.path_for(key)), "42");
  EXPECT_EQ(store.read_entry<int>(key), std::optional<int>(42));
}

TEST_F(ShardedFileStoreTest, RepeatedWritesReplaceContent) {
  ShardedFileStore store(root, FlushMode::AutoFlush);
  store.write_entry(key, std::string("a much longer first value"));
  store.write_entry(key, std::string("short"));

  EXPECT_EQ(store.read_entry<std::string>(key), std::optional<std::string>("short"));
  EXPECT_EQ(store.open_handle_count(), 1u);
}

TEST_F(ShardedFileStoreTest, StreamWritesAreVerbatim) {
  std::string blob(10000, '\0');
  for (size_t i = 0; i < blob.size(); ++i) {
    blob[i] = static_cast<char>(i * 7);
  }
  std::istringstream input(blob);

  ShardedFileStore store(root);
  store.write_entry(key, input);
  store.flush();

  std::unique_ptr<std::istream> stream = store.read_file(key);
  ASSERT_NE(stream, nullptr);
  std::string read(std::istreambuf_iterator<char>(*stream), {});
  EXPECT_EQ(read, blob);
}

TEST_F(ShardedFileStoreTest, BadInputStreamIsRejected) {
  ShardedFileStore store(root);
  std::stringstream bad_stream;
  bad_stream.setstate(std::ios::badbit);
  EXPECT_THROW(store.write_entry(key, bad_stream), StoreIOError);
}

namespace {

// Serves one block of data, then fails every further read
class FailingStreamBuf : public std::streambuf {
public:
  explicit FailingStreamBuf(std::string block) : block_(std::move(block)) {}

protected:
  int_type underflow() override {
    if (served_) {
      throw std::runtime_error("device error");
    }
    served_ = true;
    setg(block_.data(), block_.data(), block_.data() + block_.size());
    return traits_type::to_int_type(block_[0]);
  }

private:
  std::string block_;
  bool served_ = false;
};

} // namespace

TEST_F(ShardedFileStoreTest, FailedWriteDoesNotPoisonKey) {
  ShardedFileStore store(root);
  FailingStreamBuf failing(std::string(4096, 'x'));
  std::istream input(&failing);

  EXPECT_THROW(store.write_entry(key, input), StoreIOError);
  // The half-written handle is dropped
  EXPECT_EQ(store.open_handle_count(), 0u);

  store.write_entry(key, std::string("recovered"));
  store.flush();
  EXPECT_EQ(read_file_contents(store.path_for(key)), "\"recovered\"");
  EXPECT_NO_THROW(store.dispose());
}

TEST_F(ShardedFileStoreTest, AbsentKeysReadAsEmpty) {
  ShardedFileStore store(root);
  EXPECT_FALSE(store.exists(other_key));
  EXPECT_FALSE(store.read_entry<int>(other_key).has_value());
  EXPECT_EQ(store.read_file(other_key), nullptr);
}

TEST_F(ShardedFileStoreTest, ReadsFilesWrittenByOthers) {
  // A key can be read without any write handle in this session
  std::filesystem::create_directories(root / "cd");
  write_file_contents(root / "cd" / "cd345678000000000000000000000002", "{\"x\":5}");

  ShardedFileStore store(root);
  EXPECT_TRUE(store.exists(other_key));
  auto value = store.read_entry<std::map<std::string, int>>(other_key);
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(value->at("x"), 5);
  EXPECT_EQ(store.open_handle_count(), 0u);
}

TEST_F(ShardedFileStoreTest, MalformedPayloadIsAnError) {
  std::filesystem::create_directories(root / "cd");
  write_file_contents(root / "cd" / "cd345678000000000000000000000002", "{broken");

  ShardedFileStore store(root);
  EXPECT_THROW(store.read_entry<int>(other_key), PayloadError);
}

TEST_F(ShardedFileStoreTest, FlushCoversManyHandles) {
  boost::uuids::random_generator gen;
  std::vector<Key> keys;
  ShardedFileStore store(root);
  for (int i = 0; i < 200; ++i) {
    keys.push_back(gen());
    store.write_entry(keys.back(), i);
  }
  EXPECT_EQ(store.open_handle_count(), keys.size());

  store.flush();
  for (size_t i = 0; i < keys.size(); ++i) {
    EXPECT_EQ(read_file_contents(store.path_for(keys[i])), std::to_string(i));
  }
}

TEST_F(ShardedFileStoreTest, IntervalModeFlushesInBackground) {
  ShardedFileStore store(root, std::chrono::milliseconds(20));
  EXPECT_EQ(store.mode(), FlushMode::Interval);
  store.write_entry(key, std::string("timed"));

  const std::filesystem::path file = store.path_for(key);
  EXPECT_TRUE(wait_for([&]() { return read_file_contents(file) == "\"timed\""; }));
  store.dispose();
}

TEST_F(ShardedFileStoreTest, InvalidConfigurationIsRejected) {
  EXPECT_THROW(ShardedFileStore(""), ConfigurationError);
  EXPECT_THROW(ShardedFileStore(root, FlushMode::Interval), ConfigurationError);
  EXPECT_THROW(ShardedFileStore(root, std::chrono::milliseconds(0)), ConfigurationError);
}

TEST_F(ShardedFileStoreTest, RootThatIsAFileIsAnIOError) {
  write_file_contents(test_dir / "plain_file", "x");
  EXPECT_THROW(ShardedFileStore(test_dir / "plain_file"), StoreIOError);
}

TEST_F(ShardedFileStoreTest, DisposedStoreFailsFast) {
  ShardedFileStore store(root, std::chrono::milliseconds(50));
  store.write_entry(key, 1);
  store.dispose();

  EXPECT_TRUE(store.is_disposed());
  EXPECT_THROW(store.write_entry(key, 2), StoreDisposedError);
  EXPECT_THROW(store.read_entry<int>(key), StoreDisposedError);
  EXPECT_THROW(store.exists(key), StoreDisposedError);
  EXPECT_THROW(store.flush(), StoreDisposedError);
  EXPECT_NO_THROW(store.dispose());

  EXPECT_EQ(read_file_contents(store.path_for(key)), "1");
}

TEST_F(ShardedFileStoreTest, ConcurrentWritersOnDistinctKeys) {
  ShardedFileStore store(root);
  std::vector<std::thread> writers;
  std::vector<std::vector<Key>> keys(4);
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([&store, &keys, t]() {
      boost::uuids::random_generator gen;
      for (int i = 0; i < 50; ++i) {
        keys[t].push_back(gen());
        store.write_entry(keys[t].back(), t * 1000 + i);
      }
    });
  }
  for (auto& writer : writers) {
    writer.join();
  }
  store.dispose();

  ShardedFileStore reopened(root);
  for (int t = 0; t < 4; ++t) {
    for (int i = 0; i < 50; ++i) {
      EXPECT_EQ(reopened.read_entry<int>(keys[t][i]), std::optional<int>(t * 1000 + i));
    }
  }
}
