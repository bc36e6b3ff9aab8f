#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <tokenledger/Snapshot.hpp>
#include <tokenledger/testUtils.hpp>

#include <sstream>
#include <string>

using namespace tokenledger;
using namespace tokenledger::snapshot;

namespace
{
   std::string bytes(std::initializer_list<unsigned char> values)
   {
      return std::string(values.begin(), values.end());
   }
}  // namespace

TEST_CASE("snapshot-header-is-little-endian")
{
   std::ostringstream out;
   writeHeader(SnapshotHeader{}, out);
   CHECK(out.str() == bytes({0x52, 0x47, 0x44, 0x4c, 0x01, 0x00, 0x00, 0x00}));

   std::istringstream in(out.str());
   CHECK_NOTHROW(readHeader(SnapshotHeader{}, in));
}

TEST_CASE("snapshot-header-is-validated")
{
   std::istringstream empty("");
   CHECK_THROWS_WITH(readHeader(SnapshotHeader{}, empty), "Not a snapshot file");

   std::istringstream wrongMagic(bytes({1, 2, 3, 4, 1, 0, 0, 0}));
   CHECK_THROWS_WITH(readHeader(SnapshotHeader{}, wrongMagic), "Not a snapshot file");

   std::istringstream wrongVersion(bytes({0x52, 0x47, 0x44, 0x4c, 0x02, 0x00, 0x00, 0x00}));
   CHECK_THROWS_WITH(readHeader(SnapshotHeader{}, wrongVersion), "Unexpected snapshot version");
}

TEST_CASE("snapshot-rows")
{
   std::ostringstream out;
   std::string        key   = "key";
   std::string        value = "value";
   writeRow(7, key, value, out);
   writeRow(1, {}, {}, out);
   CHECK(out.str() == bytes({7, 0, 0, 0, 3, 0, 0, 0}) + "key" + bytes({5, 0, 0, 0}) + "value" +
                          bytes({1, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0}));

   std::istringstream in(out.str());
   Row                row;
   REQUIRE(readRow(row, in));
   CHECK(row.table == 7);
   CHECK(std::string(row.key.begin(), row.key.end()) == "key");
   CHECK(std::string(row.value.begin(), row.value.end()) == "value");
   REQUIRE(readRow(row, in));
   CHECK(row.table == 1);
   CHECK(row.key.empty());
   CHECK(row.value.empty());
   CHECK(!readRow(row, in));
}

TEST_CASE("truncated-snapshot-rows-are-rejected")
{
   std::ostringstream out;
   std::string        value = "value";
   writeRow(2, value, value, out);
   auto data = out.str();

   for (std::size_t size : {2, 6, 10, 14, 20})
   {
      INFO("truncated to " << size);
      std::istringstream in(data.substr(0, size));
      Row                row;
      CHECK_THROWS_WITH(readRow(row, in), "Truncated snapshot");
   }
}

TEST_CASE("oversized-snapshot-rows-are-rejected")
{
   std::istringstream in(bytes({1, 0, 0, 0, 0xff, 0xff, 0xff, 0xff}));
   Row                row;
   CHECK_THROWS_WITH(readRow(row, in), "Snapshot row too large");
}

TEST_CASE("balances-pack-into-16-bytes")
{
   auto packed = packBalance(0x0102);
   CHECK(packed[0] == 0x02);
   CHECK(packed[1] == 0x01);
   CHECK(packed[15] == 0);

   for (Balance value : {Balance{0}, Balance{1000}, Balance{1} << 100, maxBalance})
   {
      CHECK(unpackBalance(packBalance(value)) == value);
   }

   std::string shortData(15, '\0');
   CHECK_THROWS_WITH(unpackBalance(shortData), "Balance must be 16 bytes");
}
