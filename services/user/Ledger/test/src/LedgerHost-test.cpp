#include <catch2/catch.hpp>
#include <services/user/LedgerHost.hpp>
#include <tokenledger/testUtils.hpp>

using namespace LedgerService;
using namespace LedgerService::Errors;
using namespace tokenledger::literals;

namespace
{
   const auto alice = "alice"_a;
   const auto bob   = "bob"_a;
   const auto carol = "carol"_a;

   std::string balanceOf(LedgerHost& host, const AccountId& account)
   {
      return host.call(std::nullopt, "balanceOf", {account.str()}).returnVal();
   }
}  // namespace

SCENARIO("Hosting a ledger")
{
   MemoryStateStore store;
   LedgerHost       host{store};

   GIVEN("No ledger has been created")
   {
      THEN("Calls fail")
      {
         CHECK(host.call(alice, "transfer", {"bob", "1"}).failed(ledgerDNE));
         CHECK(host.call(std::nullopt, "totalSupply", {}).failed(ledgerDNE));
      }
      THEN("Alice may create one without a supply")
      {
         CHECK(host.create(alice, std::nullopt).succeeded());
         CHECK(host.call(std::nullopt, "totalSupply", {}).returnVal() == "0");
         CHECK(store.load()->balances.count(alice) == 1);
      }
   }

   GIVEN("Alice created a ledger with a supply of 1000")
   {
      REQUIRE(host.create(alice, 1000).succeeded());

      THEN("It cannot be created twice")
      {
         CHECK(host.create(bob, 5).failed(ledgerExists));
         CHECK(balanceOf(host, alice) == "1000");
      }

      THEN("Queries return decimal text")
      {
         CHECK(host.call(std::nullopt, "totalSupply", {}).returnVal() == "1000");
         CHECK(balanceOf(host, alice) == "1000");
         CHECK(balanceOf(host, bob) == "0");
         CHECK(host.call(std::nullopt, "allowance", {"alice", "bob"}).returnVal() == "0");
      }

      WHEN("Alice transfers 100 to Bob")
      {
         auto transfer = host.call(alice, "transfer", {"bob", "100"});

         THEN("The transfer succeeds and is stored")
         {
            REQUIRE(transfer.succeeded());
            CHECK(transfer.returnVal().empty());
            CHECK(balanceOf(host, bob) == "100");
            CHECK(balanceOf(host, alice) == "900");
         }
         THEN("The event is returned to the host")
         {
            REQUIRE(transfer.events().size() == 1);
            CHECK(transfer.events()[0] == TransferEvent{alice, bob, 100});
         }

         AND_WHEN("Alice takes 50 back from Bob")
         {
            auto transferFrom = host.call(alice, "transferFrom", {"bob", "50"});

            THEN("Bob is debited and Alice credited without an event")
            {
               REQUIRE(transferFrom.succeeded());
               CHECK(transferFrom.events().empty());
               CHECK(balanceOf(host, bob) == "50");
               CHECK(balanceOf(host, alice) == "950");
            }
         }
      }

      THEN("A failed transfer leaves the stored state alone")
      {
         auto before = *store.load();
         CHECK(host.call(alice, "transfer", {"carol", "2000"}).failed(insufficientBalance));
         CHECK(*store.load() == before);
      }

      THEN("Burning more than the balance clamps")
      {
         CHECK(host.call(alice, "burn", {"1500"}).succeeded());
         CHECK(balanceOf(host, alice) == "0");
         CHECK(host.call(std::nullopt, "totalSupply", {}).returnVal() == "1000");
      }

      THEN("Anyone may issue")
      {
         CHECK(host.call(std::nullopt, "issue", {"carol", "25"}).succeeded());
         CHECK(balanceOf(host, carol) == "25");
      }

      THEN("Approvals are recorded")
      {
         CHECK(host.call(alice, "approve", {"carol", "40"}).succeeded());
         CHECK(host.call(std::nullopt, "allowance", {"alice", "carol"}).returnVal() == "40");
      }

      THEN("Actions that act for a sender require one")
      {
         CHECK(host.call(std::nullopt, "transfer", {"bob", "1"}).failed(missingSender));
         CHECK(host.call(std::nullopt, "burn", {"1"}).failed(missingSender));
         CHECK(host.call(std::nullopt, "approve", {"bob", "1"}).failed(missingSender));
         CHECK(host.call(std::nullopt, "transferFrom", {"alice", "1"}).failed(missingSender));
      }

      THEN("Malformed calls fail without a change")
      {
         auto before = *store.load();
         CHECK(host.call(alice, "mint", {"1"}).failed(unknownAction));
         CHECK(host.call(alice, "transfer", {"bob"}).failed(wrongArgCount));
         CHECK(host.call(alice, "transfer", {"bob", "-5"}).failed("non-negative integer"));
         CHECK(host.call(alice, "transfer", {"", "5"}).failed("Account name is empty"));
         CHECK(*store.load() == before);
      }

      THEN("Accounts may be given as hex")
      {
         auto hexBob = bob.hex();
         CHECK(host.call(alice, "transfer", {hexBob, "3"}).succeeded());
         CHECK(balanceOf(host, bob) == "3");
      }
   }
}

TEST_CASE("call-results")
{
   auto ok = CallResult::success("12", {});
   CHECK(ok.succeeded());
   CHECK(!ok.failed(""));
   CHECK(ok.returnVal() == "12");
   CHECK(!ok.error());

   auto bad = CallResult::failure("Insufficient balance");
   CHECK(!bad.succeeded());
   CHECK(bad.failed("Insufficient"));
   CHECK(!bad.failed("overflow"));
   CHECK(bad.error() == std::optional<std::string>{"Insufficient balance"});
   CHECK_THROWS_WITH(bad.returnVal(), "call failed: Insufficient balance");
}
