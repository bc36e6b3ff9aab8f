#pragma once

#include <tokenledger/AccountId.hpp>
#include <tokenledger/Balance.hpp>

#include <compare>
#include <cstddef>
#include <unordered_map>

namespace LedgerService
{
   using tokenledger::AccountId;
   using tokenledger::Balance;

   struct AllowanceKey
   {
      AccountId owner;
      AccountId spender;

      friend auto operator<=>(const AllowanceKey&, const AllowanceKey&) = default;
   };

   std::size_t hash_value(const AllowanceKey& key);

   struct AllowanceKeyHash
   {
      std::size_t operator()(const AllowanceKey& key) const noexcept { return hash_value(key); }
   };

   using BalanceMap   = std::unordered_map<AccountId, Balance>;
   using AllowanceMap = std::unordered_map<AllowanceKey, Balance, AllowanceKeyHash>;

   /// Everything the ledger persists between calls
   struct LedgerState
   {
      Balance      totalSupply = 0;
      BalanceMap   balances;
      AllowanceMap allowances;

      friend bool operator==(const LedgerState&, const LedgerState&) = default;
   };

   struct TransferEvent
   {
      AccountId from;
      AccountId to;
      Balance   value = 0;

      friend bool operator==(const TransferEvent&, const TransferEvent&) = default;
   };
}  // namespace LedgerService
