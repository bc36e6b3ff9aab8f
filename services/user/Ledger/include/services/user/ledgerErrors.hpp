#pragma once

#include <string_view>

namespace LedgerService
{
   namespace Errors
   {
      constexpr std::string_view insufficientBalance = "Insufficient balance";
      constexpr std::string_view balanceOverflow     = "Balance overflow";
      constexpr std::string_view ledgerExists        = "Ledger already exists";
      constexpr std::string_view ledgerDNE           = "Ledger does not exist";
      constexpr std::string_view unknownAction       = "Unknown action";
      constexpr std::string_view wrongArgCount       = "Wrong number of arguments";
      constexpr std::string_view missingSender       = "Action requires a sender";
   }  // namespace Errors
}  // namespace LedgerService
