#include <gtest/gtest.h>
#include <iomanip>
#include <map>
#include <sstream>
#include <vector>
#include "archive/zip_archive.hpp"
#include "store/archive_store.hpp"
#include "test_utils.hpp"

using namespace guidstore::store;

namespace {

struct Profile {
  std::string name;
  int age = 0;
  std::vector<std::string> tags;
};

void to_json(nlohmann::json& j, const Profile& p) {
  j = nlohmann::json{{"name", p.name}, {"age", p.age}, {"tags", p.tags}};
}

void from_json(const nlohmann::json& j, Profile& p) {
  j.at("name").get_to(p.name);
  j.at("age").get_to(p.age);
  j.at("tags").get_to(p.tags);
}

} // namespace

class ArchiveStoreTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::filesystem::path db_path;
  std::unique_ptr<ArchiveStore> store;

  const Key key_a = parse_key("11111111-1111-1111-1111-111111111111");
  const Key key_b = parse_key("22222222-2222-2222-2222-222222222222");

  void SetUp() override {
    init_test_logging();
    test_dir = make_test_dir("archive_store_test");
    db_path = test_dir / "db.zip";
    store = ArchiveStore::open(db_path);
    ASSERT_NE(store, nullptr);
  }

  void TearDown() override {
    store.reset();
    std::error_code ec;
    std::filesystem::remove_all(test_dir, ec);
  }

  void reopen() {
    store->dispose();
    store = ArchiveStore::open(db_path);
  }
};

TEST_F(ArchiveStoreTest, WriteReadAcrossReopen) {
  std::map<std::string, int> value{{"a", 1}};
  store->write_entry(key_a, value);

  EXPECT_TRUE(store->exists(key_a));
  auto read = store->read_entry<std::map<std::string, int>>(key_a);
  ASSERT_TRUE(read.has_value());
  EXPECT_EQ(*read, value);

  reopen();
  read = store->read_entry<std::map<std::string, int>>(key_a);
  ASSERT_TRUE(read.has_value());
  EXPECT_EQ(*read, value);
}

TEST_F(ArchiveStoreTest, EntriesUseShardedNames) {
  store->write_entry(key_a, std::map<std::string, int>{{"a", 1}});
  store->dispose();

  guidstore::archive::ZipArchive archive(db_path);
  EXPECT_EQ(archive.entry_names(), std::vector<std::string>{"11/11111111111111111111111111111111"});

  std::unique_ptr<std::istream> stream = archive.open_entry("11/11111111111111111111111111111111");
  ASSERT_NE(stream, nullptr);
  std::string text(std::istreambuf_iterator<char>(*stream), {});
  EXPECT_EQ(text, "{\"a\":1}");
}

TEST_F(ArchiveStoreTest, FlushCommitsWithoutDispose) {
  store->write_entry(key_a, std::string("flushed"));
  store->flush();

  {
    guidstore::archive::ZipArchive on_disk(db_path);
    ASSERT_TRUE(on_disk.contains(address(key_a)));
    std::unique_ptr<std::istream> stream = on_disk.open_entry(address(key_a));
    ASSERT_NE(stream, nullptr);
    std::string text(std::istreambuf_iterator<char>(*stream), {});
    EXPECT_EQ(text, "\"flushed\"");
  }

  // The store stays writable after a flush
  store->write_entry(key_b, 7);
  store->flush();

  guidstore::archive::ZipArchive on_disk(db_path);
  EXPECT_EQ(on_disk.entry_count(), 2u);
  EXPECT_TRUE(on_disk.contains(address(key_b)));
  EXPECT_EQ(store->read_entry<int>(key_b), std::optional<int>(7));
}

TEST_F(ArchiveStoreTest, ZeroLengthFileOpensAsEmptyContainer) {
  store.reset();
  std::filesystem::path empty_path = test_dir / "empty.zip";
  write_file_contents(empty_path, "");
  ASSERT_EQ(std::filesystem::file_size(empty_path), 0u);

  store = ArchiveStore::open(empty_path);
  EXPECT_EQ(store->entry_count(), 0u);
  EXPECT_FALSE(store->exists(key_a));

  store->write_entry(key_a, std::string("value"));
  store->dispose();

  store = ArchiveStore::open(empty_path);
  EXPECT_EQ(store->read_entry<std::string>(key_a), std::optional<std::string>("value"));
}

TEST_F(ArchiveStoreTest, StructuredValuesRoundTrip) {
  Profile profile{"ada", 36, {"math", "engines"}};
  store->write_entry(key_b, profile);
  store->flush();

  auto read = store->read_entry<Profile>(key_b);
  ASSERT_TRUE(read.has_value());
  EXPECT_EQ(read->name, "ada");
  EXPECT_EQ(read->age, 36);
  EXPECT_EQ(read->tags, profile.tags);
}

TEST_F(ArchiveStoreTest, OverwriteKeepsSecondValue) {
  store->write_entry(key_a, std::string("first"));
  store->flush();
  store->write_entry(key_a, std::string("second"));

  EXPECT_EQ(store->read_entry<std::string>(key_a), std::optional<std::string>("second"));
  EXPECT_EQ(store->entry_count(), 1u);

  reopen();
  EXPECT_EQ(store->read_entry<std::string>(key_a), std::optional<std::string>("second"));
  EXPECT_EQ(store->entry_count(), 1u);
}

TEST_F(ArchiveStoreTest, AbsentKeysReadAsEmpty) {
  EXPECT_FALSE(store->exists(key_b));
  EXPECT_FALSE(store->read_entry<std::string>(key_b).has_value());
  EXPECT_EQ(store->read_file(key_b), nullptr);
}

TEST_F(ArchiveStoreTest, StreamPayloadsAreStoredVerbatim) {
  std::string blob;
  for (int i = 0; i < 70000; ++i) {
    blob.push_back(static_cast<char>((i * 31) % 256));
  }
  std::istringstream input(blob);
  store->write_entry(key_a, input);
  reopen();

  std::unique_ptr<std::istream> stream = store->read_file(key_a);
  ASSERT_NE(stream, nullptr);
  std::string read(std::istreambuf_iterator<char>(*stream), {});
  EXPECT_EQ(read, blob);
}

TEST_F(ArchiveStoreTest, MalformedPayloadIsAnError) {
  std::istringstream input("not json at all");
  store->write_entry(key_a, input);

  EXPECT_THROW(store->read_entry<Profile>(key_a), PayloadError);
  // Valid JSON of the wrong shape fails the same way
  store->write_entry(key_b, std::vector<int>{1, 2, 3});
  EXPECT_THROW(store->read_entry<Profile>(key_b), PayloadError);
}

TEST_F(ArchiveStoreTest, UnencodableValueIsAPayloadError) {
  // Strings must be valid UTF-8 to be encoded
  EXPECT_THROW(store->write_entry(key_a, std::string("bad \xff\xfe bytes")), PayloadError);
  EXPECT_FALSE(store->exists(key_a));
}

TEST_F(ArchiveStoreTest, EmptyPayloadReadsAsAbsent) {
  std::istringstream empty("");
  store->write_entry(key_a, empty);

  EXPECT_TRUE(store->exists(key_a));
  EXPECT_FALSE(store->read_entry<Profile>(key_a).has_value());
}

TEST_F(ArchiveStoreTest, DisposedStoreFailsFast) {
  store->dispose();
  EXPECT_TRUE(store->is_disposed());

  EXPECT_THROW(store->write_entry(key_a, 1), StoreDisposedError);
  EXPECT_THROW(store->read_entry<int>(key_a), StoreDisposedError);
  EXPECT_THROW(store->read_file(key_a), StoreDisposedError);
  EXPECT_THROW(store->exists(key_a), StoreDisposedError);
  EXPECT_THROW(store->flush(), StoreDisposedError);
  // A second dispose only warns
  EXPECT_NO_THROW(store->dispose());
}

TEST_F(ArchiveStoreTest, InvalidPathsAreRejected) {
  EXPECT_THROW(ArchiveStore(""), ConfigurationError);
  EXPECT_THROW(ArchiveStore{test_dir}, ConfigurationError);
}

TEST_F(ArchiveStoreTest, CorruptContainerIsAnIOError) {
  std::filesystem::path corrupt = test_dir / "corrupt.zip";
  write_file_contents(corrupt, std::string(64, 'q'));
  EXPECT_THROW(ArchiveStore{corrupt}, StoreIOError);
}

TEST_F(ArchiveStoreTest, ManyKeysAcrossShards) {
  std::vector<Key> keys;
  for (int i = 0; i < 64; ++i) {
    std::ostringstream text;
    text << std::hex << std::setw(2) << std::setfill('0') << (i * 4) << "000000-0000-0000-0000-"
         << std::setw(12) << std::setfill('0') << i;
    keys.push_back(parse_key(text.str()));
    store->write_entry(keys.back(), i);
  }
  reopen();

  EXPECT_EQ(store->entry_count(), keys.size());
  for (size_t i = 0; i < keys.size(); ++i) {
    EXPECT_EQ(store->read_entry<int>(keys[i]), std::optional<int>(static_cast<int>(i)));
  }
}
