#include <tokenledger/Balance.hpp>
#include <tokenledger/check.hpp>

#include <algorithm>
#include <cstring>

namespace tokenledger
{
   std::string balanceToString(Balance value)
   {
      if (value == 0)
         return "0";
      std::string result;
      while (value != 0)
      {
         result += static_cast<char>('0' + static_cast<int>(value % 10));
         value /= 10;
      }
      std::reverse(result.begin(), result.end());
      return result;
   }

   Balance parseBalance(std::string_view s)
   {
      check(!s.empty(), "Expected a balance");
      Balance result = 0;
      for (char ch : s)
      {
         check(ch >= '0' && ch <= '9', "Balance must be a non-negative integer: " + std::string(s));
         Balance digit = ch - '0';
         check((maxBalance - digit) / 10 >= result, "Balance out of range: " + std::string(s));
         result = result * 10 + digit;
      }
      return result;
   }

   inline namespace literals
   {
      Balance operator""_bal(const char* s)
      {
         return parseBalance(std::string_view{s, std::strlen(s)});
      }
   }  // namespace literals
}  // namespace tokenledger
