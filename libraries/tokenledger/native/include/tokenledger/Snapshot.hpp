#pragma once

#include <tokenledger/Balance.hpp>

#include <array>
#include <cstdint>
#include <iosfwd>
#include <span>
#include <vector>

namespace tokenledger::snapshot
{
   // snapshot format:
   // header
   // (table size32 key size32 value)*
   //
   // All integers are little-endian.

   struct SnapshotHeader
   {
      std::uint32_t magic   = 0x4c444752;
      std::uint32_t version = 1;
   };

   constexpr std::uint32_t maxRowBytes = 1u << 20;

   struct Row
   {
      std::uint32_t     table = 0;
      std::vector<char> key;
      std::vector<char> value;
   };

   void writeHeader(const SnapshotHeader& header, std::ostream& stream);
   void readHeader(const SnapshotHeader& header, std::istream& stream);

   void writeRow(std::uint32_t         table,
                 std::span<const char> key,
                 std::span<const char> value,
                 std::ostream&         stream);

   // Returns false at a clean end of file. Aborts if the file ends
   // inside a row.
   bool readRow(Row& row, std::istream& stream);

   std::array<char, 16> packBalance(Balance value);
   Balance              unpackBalance(std::span<const char> data);
}  // namespace tokenledger::snapshot
