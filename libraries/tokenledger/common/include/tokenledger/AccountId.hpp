#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace tokenledger
{
   /// An account identity
   ///
   /// Account ids are opaque 32-byte values. The ledger only compares
   /// and hashes them; the ordering exists so that stored state can be
   /// written out deterministically.
   ///
   /// Two text forms are accepted by [parse]:
   /// - 64 hex digits, the raw bytes
   /// - a name of 1 to 32 printable ASCII characters, stored zero-padded
   struct AccountId
   {
      static constexpr std::size_t size = 32;

      std::array<std::uint8_t, size> bytes = {};

      /// Construct the all-zero id
      constexpr AccountId() = default;

      constexpr explicit AccountId(const std::array<std::uint8_t, size>& bytes) : bytes(bytes) {}

      /// Every byte set to `b`
      static constexpr AccountId filled(std::uint8_t b)
      {
         AccountId result;
         result.bytes.fill(b);
         return result;
      }

      static AccountId fromName(std::string_view name);
      static AccountId fromHex(std::string_view hex);
      static AccountId parse(std::string_view s);

      /// Name form if the id was built from a name, hex otherwise
      std::string str() const;
      std::string hex() const;

      /// True if the bytes are a printable name followed by zero padding
      bool isName() const;

      friend auto operator<=>(const AccountId&, const AccountId&) = default;
   };

   std::size_t hash_value(const AccountId& account);

   inline namespace literals
   {
      inline AccountId operator""_a(const char* s, std::size_t len)
      {
         return AccountId::fromName(std::string_view{s, len});
      }
   }  // namespace literals
}  // namespace tokenledger

template <>
struct std::hash<tokenledger::AccountId>
{
   std::size_t operator()(const tokenledger::AccountId& account) const noexcept
   {
      return tokenledger::hash_value(account);
   }
};
