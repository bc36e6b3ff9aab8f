#include <services/user/ledgerStore.hpp>

#include <tokenledger/Snapshot.hpp>
#include <tokenledger/check.hpp>
#include <tokenledger/log.hpp>

#include <algorithm>
#include <cstring>
#include <fstream>
#include <span>
#include <string>
#include <utility>
#include <vector>

using namespace LedgerService;
using namespace tokenledger::snapshot;
using tokenledger::check;

namespace
{
   std::span<const char> keyBytes(const AccountId& account)
   {
      return {reinterpret_cast<const char*>(account.bytes.data()), account.bytes.size()};
   }

   AccountId readAccount(std::span<const char> key)
   {
      AccountId result;
      std::memcpy(result.bytes.data(), key.data(), AccountId::size);
      return result;
   }

   template <typename Map>
   std::vector<typename Map::const_iterator> sortedRows(const Map& map)
   {
      std::vector<typename Map::const_iterator> rows;
      rows.reserve(map.size());
      for (auto iter = map.begin(); iter != map.end(); ++iter)
         rows.push_back(iter);
      std::sort(rows.begin(), rows.end(),
                [](const auto& lhs, const auto& rhs) { return lhs->first < rhs->first; });
      return rows;
   }
}  // namespace

SnapshotFileStore::SnapshotFileStore(std::filesystem::path path) : file(std::move(path)) {}

std::optional<LedgerState> SnapshotFileStore::load()
{
   if (!std::filesystem::exists(file))
      return std::nullopt;

   std::ifstream in(file, std::ios::binary);
   check(in.is_open(), "Cannot open " + file.string());
   readHeader(SnapshotHeader{}, in);

   LedgerState state;
   bool        haveSupply = false;
   Row         row;
   while (readRow(row, in))
   {
      switch (row.table)
      {
         case supplyTable:
            check(row.key.empty() && !haveSupply, "Snapshot has an invalid supply row");
            state.totalSupply = unpackBalance(row.value);
            haveSupply        = true;
            break;
         case balanceTable:
            check(row.key.size() == AccountId::size, "Snapshot has an invalid balance key");
            state.balances[readAccount(row.key)] = unpackBalance(row.value);
            break;
         case allowanceTable:
         {
            check(row.key.size() == 2 * AccountId::size, "Snapshot has an invalid allowance key");
            std::span<const char> key{row.key};
            AllowanceKey          allowanceKey{readAccount(key.first(AccountId::size)),
                                      readAccount(key.subspan(AccountId::size))};
            state.allowances[allowanceKey] = unpackBalance(row.value);
            break;
         }
         default:
            tokenledger::abortMessage("Snapshot has an unknown table " + std::to_string(row.table));
      }
   }
   check(haveSupply, "Snapshot has no supply row");

   TOKENLEDGER_LOG(tokenledger::loggers::generic::get(), debug)
       << "Loaded " << state.balances.size() << " balances and " << state.allowances.size()
       << " allowances from " << file.string();
   return state;
}

void SnapshotFileStore::store(const LedgerState& state)
{
   auto tmp = file;
   tmp += ".tmp";
   {
      std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
      check(out.is_open(), "Cannot open " + tmp.string());

      writeHeader(SnapshotHeader{}, out);
      writeRow(supplyTable, {}, packBalance(state.totalSupply), out);
      for (const auto& iter : sortedRows(state.balances))
      {
         writeRow(balanceTable, keyBytes(iter->first), packBalance(iter->second), out);
      }
      for (const auto& iter : sortedRows(state.allowances))
      {
         std::vector<char> key;
         auto              owner   = keyBytes(iter->first.owner);
         auto              spender = keyBytes(iter->first.spender);
         key.insert(key.end(), owner.begin(), owner.end());
         key.insert(key.end(), spender.begin(), spender.end());
         writeRow(allowanceTable, key, packBalance(iter->second), out);
      }
      out.flush();
      check(!!out, "Failed writing " + tmp.string());
   }
   std::filesystem::rename(tmp, file);
}
