#include <tokenledger/AccountId.hpp>
#include <tokenledger/check.hpp>

#include <boost/container_hash/hash.hpp>

#include <algorithm>

namespace tokenledger
{
   namespace
   {
      constexpr char xdigits[] = "0123456789abcdef";

      int fromHexDigit(char ch)
      {
         if (ch >= '0' && ch <= '9')
            return ch - '0';
         if (ch >= 'a' && ch <= 'f')
            return ch - 'a' + 10;
         if (ch >= 'A' && ch <= 'F')
            return ch - 'A' + 10;
         return -1;
      }

      bool isPrintable(std::uint8_t ch)
      {
         return ch > 0x20 && ch < 0x7f;
      }

      bool isHex(std::string_view s)
      {
         return s.size() == AccountId::size * 2 &&
                std::all_of(s.begin(), s.end(), [](char ch) { return fromHexDigit(ch) >= 0; });
      }
   }  // namespace

   AccountId AccountId::fromName(std::string_view name)
   {
      check(!name.empty(), "Account name is empty");
      check(name.size() <= size, "Account name longer than 32 bytes: " + std::string(name));
      AccountId result;
      for (std::size_t i = 0; i < name.size(); ++i)
      {
         auto ch = static_cast<std::uint8_t>(name[i]);
         check(isPrintable(ch), "Account name must be printable ASCII: " + std::string(name));
         result.bytes[i] = ch;
      }
      return result;
   }

   AccountId AccountId::fromHex(std::string_view hex)
   {
      check(isHex(hex), "Account id must be 64 hex digits: " + std::string(hex));
      AccountId result;
      for (std::size_t i = 0; i < size; ++i)
      {
         result.bytes[i] =
             static_cast<std::uint8_t>(fromHexDigit(hex[2 * i]) << 4 | fromHexDigit(hex[2 * i + 1]));
      }
      return result;
   }

   AccountId AccountId::parse(std::string_view s)
   {
      if (isHex(s))
         return fromHex(s);
      return fromName(s);
   }

   std::string AccountId::hex() const
   {
      std::string result;
      result.reserve(size * 2);
      for (auto ch : bytes)
      {
         result += xdigits[(ch >> 4) & 0xF];
         result += xdigits[ch & 0xF];
      }
      return result;
   }

   bool AccountId::isName() const
   {
      auto end = std::find(bytes.begin(), bytes.end(), 0);
      return end != bytes.begin() && std::all_of(bytes.begin(), end, isPrintable) &&
             std::all_of(end, bytes.end(), [](std::uint8_t ch) { return ch == 0; });
   }

   std::string AccountId::str() const
   {
      if (!isName())
         return hex();
      auto end = std::find(bytes.begin(), bytes.end(), 0);
      return std::string(bytes.begin(), end);
   }

   std::size_t hash_value(const AccountId& account)
   {
      return boost::hash_range(account.bytes.begin(), account.bytes.end());
   }
}  // namespace tokenledger
