#include <gtest/gtest.h>
#include <set>
#include <boost/uuid/random_generator.hpp>
#include "store/key_addressing.hpp"
#include "store/store_error.hpp"

using namespace guidstore::store;

TEST(KeyAddressingTest, HexIsLowercaseWithoutSeparators) {
  Key key = parse_key("ABCDEF01-2345-6789-ABCD-EF0123456789");
  EXPECT_EQ(to_hex(key), "abcdef0123456789abcdef0123456789");
  EXPECT_EQ(to_hex(key).size(), 32u);
}

TEST(KeyAddressingTest, ShardIsFirstTwoHexDigits) {
  Key key = parse_key("11111111-1111-1111-1111-111111111111");
  EXPECT_EQ(shard_of(key), "11");
  EXPECT_EQ(address(key), "11/11111111111111111111111111111111");

  Key other = parse_key("ff000000-0000-0000-0000-000000000001");
  EXPECT_EQ(shard_of(other), "ff");
  EXPECT_EQ(address(other), "ff/ff000000000000000000000000000001");
}

TEST(KeyAddressingTest, AddressPathResolvesBelowRoot) {
  Key key = parse_key("0a1b2c3d-0000-0000-0000-000000000000");
  std::filesystem::path path = address_path("/data/store", key);
  EXPECT_EQ(path, std::filesystem::path("/data/store") / "0a" / "0a1b2c3d000000000000000000000000");
}

TEST(KeyAddressingTest, ParseAcceptsCommonForms) {
  Key dashed = parse_key("0a1b2c3d-4e5f-6071-8293-a4b5c6d7e8f9");
  Key plain = parse_key("0a1b2c3d4e5f60718293a4b5c6d7e8f9");
  Key braced = parse_key("{0a1b2c3d-4e5f-6071-8293-a4b5c6d7e8f9}");
  EXPECT_EQ(dashed, plain);
  EXPECT_EQ(dashed, braced);
}

TEST(KeyAddressingTest, ParseRejectsMalformedKeys) {
  EXPECT_THROW(parse_key(""), ConfigurationError);
  EXPECT_THROW(parse_key("not-a-key"), ConfigurationError);
  EXPECT_THROW(parse_key("0a1b2c3d-4e5f-6071-8293"), ConfigurationError);
  EXPECT_THROW(parse_key("zz1b2c3d-4e5f-6071-8293-a4b5c6d7e8f9"), ConfigurationError);
}

TEST(KeyAddressingTest, DistinctKeysGetDistinctAddresses) {
  boost::uuids::random_generator gen;
  std::set<std::string> addresses;
  for (int i = 0; i < 1000; ++i) {
    Key key = gen();
    std::string addr = address(key);
    EXPECT_EQ(addr.substr(0, 2), to_hex(key).substr(0, 2));
    EXPECT_EQ(addr[2], '/');
    addresses.insert(addr);
  }
  EXPECT_EQ(addresses.size(), 1000u);
}

TEST(KeyAddressingTest, AddressIsStable) {
  Key key = parse_key("deadbeef-0000-4000-8000-00000000cafe");
  EXPECT_EQ(address(key), address(parse_key(to_hex(key))));
}
