#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace tokenledger
{
   /// Abort the current call with `message`
   ///
   /// The host boundary catches the exception and reports `message`
   /// as the failure of the call. Message should be UTF8.
   [[noreturn]] inline void abortMessage(std::string_view message)
   {
      throw std::runtime_error(std::string{message});
   }

   /// Abort with message if `!cond`
   ///
   /// Message should be UTF8.
   inline void check(bool cond, std::string_view message)
   {
      if (!cond)
         abortMessage(message);
   }
}  // namespace tokenledger
