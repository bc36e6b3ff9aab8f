#pragma once

#include <services/user/ledgerTypes.hpp>

#include <filesystem>
#include <optional>

namespace LedgerService
{
   /// Where a host keeps [LedgerState] between calls
   class StateStore
   {
     public:
      virtual ~StateStore() = default;

      /// std::nullopt if nothing was stored yet
      virtual std::optional<LedgerState> load()                          = 0;
      virtual void                       store(const LedgerState& state) = 0;
   };

   class MemoryStateStore : public StateStore
   {
     public:
      std::optional<LedgerState> load() override { return saved; }
      void                       store(const LedgerState& state) override { saved = state; }

     private:
      std::optional<LedgerState> saved;
   };

   /// Keeps the state in a snapshot file
   ///
   /// Tables: 0 = total supply, 1 = balances keyed by account,
   /// 2 = allowances keyed by owner followed by spender. Rows are sorted
   /// by key, so equal states produce identical files. Writes go to a
   /// temporary file that is renamed over the previous snapshot.
   class SnapshotFileStore : public StateStore
   {
     public:
      static constexpr std::uint32_t supplyTable    = 0;
      static constexpr std::uint32_t balanceTable   = 1;
      static constexpr std::uint32_t allowanceTable = 2;

      explicit SnapshotFileStore(std::filesystem::path path);

      std::optional<LedgerState> load() override;
      void                       store(const LedgerState& state) override;

      const std::filesystem::path& path() const { return file; }

     private:
      std::filesystem::path file;
   };
}  // namespace LedgerService
