#pragma once

#include <services/user/ledgerErrors.hpp>
#include <services/user/ledgerTypes.hpp>

#include <vector>

namespace LedgerService
{
   /// Receives the notifications a [Ledger] emits
   ///
   /// The host decides how they are delivered or indexed.
   class EventSink
   {
     public:
      virtual ~EventSink() = default;

      virtual void transferred(const AccountId& from, const AccountId& to, Balance value) = 0;
   };

   /// An [EventSink] that keeps every event in order
   class EventLog : public EventSink
   {
     public:
      void transferred(const AccountId& from, const AccountId& to, Balance value) override;

      const std::vector<TransferEvent>& events() const { return log; }
      std::vector<TransferEvent>        take();

     private:
      std::vector<TransferEvent> log;
   };

   /// A single-token ledger
   ///
   /// Holds the balances and allowances of one token. Every mutation
   /// takes the identity of its caller as an argument; the ledger trusts
   /// it verbatim. Each call validates everything before its first
   /// write, so a call that aborts leaves the state untouched.
   ///
   /// `burn` and `issue` do not update the total supply, so after either
   /// one `totalSupply()` no longer equals the sum of all balances.
   class Ledger
   {
     public:
      /// Create a ledger whose whole initial supply belongs to `creator`.
      Ledger(const AccountId& creator, Balance initialSupply, EventSink& events);

      /// Create an empty ledger (zero supply) owned by `creator`.
      Ledger(const AccountId& creator, EventSink& events);

      /// Restore a ledger from previously saved state.
      Ledger(LedgerState state, EventSink& events);

      Balance totalSupply() const;

      /// Balance of `account`; 0 for accounts the ledger has never seen.
      Balance balanceOf(const AccountId& account) const;

      /// Amount `spender` was approved to move out of `owner`'s balance.
      Balance allowance(const AccountId& owner, const AccountId& spender) const;

      /// Move `value` from `caller` to `to`.
      ///
      /// Aborts with `insufficientBalance` if `caller` holds less than
      /// `value`, or `balanceOverflow` if the credit would not fit.
      /// Emits `transferred`. Transferring to oneself is allowed.
      void transfer(const AccountId& caller, const AccountId& to, Balance value);

      /// Move `value` from `from` to `caller`.
      ///
      /// No allowance is checked or consumed: any caller may move any
      /// account's balance to itself. Emits nothing.
      void transferFrom(const AccountId& caller, const AccountId& from, Balance value);

      /// Reduce `caller`'s balance by `value`, clamping at 0.
      void burn(const AccountId& caller, Balance value);

      /// Credit `value` to `to`. Anyone may issue.
      ///
      /// Aborts with `balanceOverflow` if the credit would not fit.
      void issue(const AccountId& to, Balance value);

      /// Set the allowance of `spender` over `caller`'s balance to `value`.
      void approve(const AccountId& caller, const AccountId& spender, Balance value);

      const LedgerState& state() const { return ledgerState; }

     private:
      void moveBalance(const AccountId& from, const AccountId& to, Balance value);

      LedgerState ledgerState;
      EventSink*  eventSink;
   };
}  // namespace LedgerService
