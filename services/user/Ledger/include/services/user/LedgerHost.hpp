#pragma once

#include <services/user/Ledger.hpp>
#include <services/user/ledgerStore.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace LedgerService
{
   /// Outcome of one host call
   class CallResult
   {
     public:
      static CallResult success(std::string returnVal, std::vector<TransferEvent> events);
      static CallResult failure(std::string error);

      bool succeeded() const { return !err.has_value(); }
      // True if the call failed with an error containing `expected`
      bool failed(std::string_view expected) const;

      const std::optional<std::string>& error() const { return err; }
      // Decimal text for queries, empty for mutations
      const std::string&                returnVal() const;
      const std::vector<TransferEvent>& events() const { return emitted; }

     private:
      std::optional<std::string> err;
      std::string                value;
      std::vector<TransferEvent> emitted;
   };

   /// Runs ledger actions on behalf of callers
   ///
   /// Each call loads the state from the store, runs one action and
   /// stores the state again only if the action succeeded. Errors never
   /// escape; they are returned in the [CallResult].
   ///
   /// Actions and their arguments:
   /// - `totalSupply`
   /// - `balanceOf account`
   /// - `allowance owner spender`
   /// - `transfer to value` (sender required)
   /// - `transferFrom from value` (sender required)
   /// - `burn value` (sender required)
   /// - `issue to value`
   /// - `approve spender value` (sender required)
   class LedgerHost
   {
     public:
      explicit LedgerHost(StateStore& store);

      /// Create a new ledger; `std::nullopt` uses the default (empty) constructor.
      CallResult create(const AccountId& creator, std::optional<Balance> initialSupply);

      CallResult call(const std::optional<AccountId>& sender,
                      std::string_view                action,
                      const std::vector<std::string>& args);

     private:
      StateStore* store;
   };
}  // namespace LedgerService
