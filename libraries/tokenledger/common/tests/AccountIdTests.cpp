#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <tokenledger/AccountId.hpp>
#include <tokenledger/testUtils.hpp>

#include <unordered_set>

using namespace tokenledger;

TEST_CASE("account-names-are-zero-padded")
{
   auto alice = AccountId::fromName("alice");
   REQUIRE(alice.bytes[0] == 'a');
   REQUIRE(alice.bytes[4] == 'e');
   for (std::size_t i = 5; i < AccountId::size; ++i)
      REQUIRE(alice.bytes[i] == 0);
   REQUIRE(alice.str() == "alice");
   REQUIRE(alice == "alice"_a);
}

TEST_CASE("invalid-account-names-are-rejected")
{
   REQUIRE_THROWS_WITH(AccountId::fromName(""), "Account name is empty");
   REQUIRE_THROWS(AccountId::fromName(std::string(33, 'a')));
   REQUIRE_THROWS(AccountId::fromName("has space"));
   REQUIRE_THROWS(AccountId::fromName(std::string("nul\0byte", 8)));
   REQUIRE_NOTHROW(AccountId::fromName(std::string(32, 'z')));
}

TEST_CASE("hex-account-ids-round-trip")
{
   auto ones = AccountId::filled(0x01);
   REQUIRE(ones.hex() == "0101010101010101010101010101010101010101010101010101010101010101");
   REQUIRE(AccountId::fromHex(ones.hex()) == ones);
   REQUIRE(AccountId::parse(ones.hex()) == ones);
   REQUIRE(!ones.isName());
   REQUIRE(ones.str() == ones.hex());

   auto mixed = AccountId::parse("ABCDEF0123456789abcdef0123456789ABCDEF0123456789abcdef0123456789");
   REQUIRE(mixed.bytes[0] == 0xab);
   REQUIRE(mixed.bytes[31] == 0x89);
}

TEST_CASE("parse-prefers-hex-only-for-64-digits")
{
   REQUIRE(AccountId::parse("bob") == "bob"_a);
   REQUIRE(AccountId::parse("cafe") == "cafe"_a);
   REQUIRE_THROWS(AccountId::fromHex("cafe"));
   REQUIRE_THROWS(AccountId::fromHex(std::string(64, 'g')));
}

TEST_CASE("zero-id-is-not-a-name")
{
   AccountId zero;
   REQUIRE(!zero.isName());
   REQUIRE(zero.str() == std::string(64, '0'));
}

TEST_CASE("account-ids-hash-and-compare-by-bytes")
{
   std::unordered_set<AccountId> set;
   set.insert("alice"_a);
   set.insert("alice"_a);
   set.insert("bob"_a);
   set.insert(AccountId::filled(0x02));
   REQUIRE(set.size() == 3);
   REQUIRE(set.count(AccountId::fromName("bob")) == 1);
   REQUIRE("alice"_a < "bob"_a);
   REQUIRE(AccountId::filled(0x01) != AccountId::filled(0x02));
}
