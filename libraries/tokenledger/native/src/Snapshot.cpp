#include <tokenledger/Snapshot.hpp>
#include <tokenledger/check.hpp>

#include <boost/endian/conversion.hpp>

#include <istream>
#include <ostream>

namespace tokenledger::snapshot
{
   namespace
   {
      void write_u32(std::uint32_t value, std::ostream& stream)
      {
         boost::endian::native_to_little_inplace(value);
         stream.write(reinterpret_cast<const char*>(&value), sizeof(value));
      }

      bool read_u32(std::uint32_t& result, std::istream& stream)
      {
         if (!stream.read(reinterpret_cast<char*>(&result), sizeof(result)))
            return false;
         boost::endian::little_to_native_inplace(result);
         return true;
      }

      std::uint32_t read_u32(std::istream& stream)
      {
         std::uint32_t result;
         check(read_u32(result, stream), "Truncated snapshot");
         return result;
      }

      void read_bytes(std::vector<char>& out, std::istream& stream)
      {
         auto size = read_u32(stream);
         check(size <= maxRowBytes, "Snapshot row too large");
         out.resize(size);
         if (size != 0)
            check(!!stream.read(out.data(), size), "Truncated snapshot");
      }
   }  // namespace

   void writeHeader(const SnapshotHeader& header, std::ostream& stream)
   {
      write_u32(header.magic, stream);
      write_u32(header.version, stream);
   }

   void readHeader(const SnapshotHeader& header, std::istream& stream)
   {
      std::uint32_t magic;
      check(read_u32(magic, stream) && magic == header.magic, "Not a snapshot file");
      check(read_u32(stream) == header.version, "Unexpected snapshot version");
   }

   void writeRow(std::uint32_t         table,
                 std::span<const char> key,
                 std::span<const char> value,
                 std::ostream&         stream)
   {
      std::uint32_t key_size   = key.size();
      std::uint32_t value_size = value.size();
      write_u32(table, stream);
      write_u32(key_size, stream);
      stream.write(key.data(), key_size);
      write_u32(value_size, stream);
      stream.write(value.data(), value_size);
   }

   bool readRow(Row& row, std::istream& stream)
   {
      if (!read_u32(row.table, stream))
      {
         check(stream.gcount() == 0, "Truncated snapshot");
         return false;
      }
      read_bytes(row.key, stream);
      read_bytes(row.value, stream);
      return true;
   }

   std::array<char, 16> packBalance(Balance value)
   {
      std::array<char, 16> result;
      for (auto& ch : result)
      {
         ch = static_cast<char>(static_cast<std::uint8_t>(value & 0xff));
         value >>= 8;
      }
      return result;
   }

   Balance unpackBalance(std::span<const char> data)
   {
      check(data.size() == 16, "Balance must be 16 bytes");
      Balance result = 0;
      for (auto iter = data.rbegin(); iter != data.rend(); ++iter)
      {
         result = (result << 8) | static_cast<std::uint8_t>(*iter);
      }
      return result;
   }
}  // namespace tokenledger::snapshot
