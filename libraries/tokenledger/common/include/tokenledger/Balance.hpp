#pragma once

#include <string>
#include <string_view>

namespace tokenledger
{
   /// Quantity of the token's smallest unit
   ///
   /// 128 bits wide so that a total supply can never overflow the type
   /// in practice. Arithmetic that could overflow goes through
   /// [sumOverflows] first.
   using Balance = unsigned __int128;

   inline constexpr Balance maxBalance = ~Balance{0};

   inline constexpr bool sumOverflows(Balance value1, Balance value2)
   {
      return maxBalance - value2 < value1;
   }

   /// Decimal form of `value`
   std::string balanceToString(Balance value);

   /// Parse a decimal balance
   ///
   /// Aborts if `s` is empty, contains anything but the digits `0-9`,
   /// or is larger than [maxBalance].
   Balance parseBalance(std::string_view s);

   inline namespace literals
   {
      /// Balance literal for values that do not fit in 64 bits
      ///
      /// `340282366920938463463374607431768211455_bal == maxBalance`
      Balance operator""_bal(const char* s);
   }  // namespace literals
}  // namespace tokenledger
