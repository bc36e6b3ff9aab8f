#include <services/user/Ledger.hpp>

#include <tokenledger/check.hpp>
#include <tokenledger/log.hpp>

#include <boost/container_hash/hash.hpp>

#include <utility>

using namespace LedgerService;
using namespace LedgerService::Errors;
using tokenledger::balanceToString;
using tokenledger::check;
using tokenledger::sumOverflows;

namespace
{
   template <typename Map, typename Key>
   Balance lookup(const Map& map, const Key& key)
   {
      auto iter = map.find(key);
      if (iter == map.end())
         return 0;
      return iter->second;
   }
}  // namespace

std::size_t LedgerService::hash_value(const AllowanceKey& key)
{
   std::size_t seed = 0;
   boost::hash_combine(seed, key.owner);
   boost::hash_combine(seed, key.spender);
   return seed;
}

void EventLog::transferred(const AccountId& from, const AccountId& to, Balance value)
{
   log.push_back(TransferEvent{.from = from, .to = to, .value = value});
}

std::vector<TransferEvent> EventLog::take()
{
   return std::exchange(log, {});
}

Ledger::Ledger(const AccountId& creator, Balance initialSupply, EventSink& events)
    : eventSink(&events)
{
   ledgerState.totalSupply = initialSupply;
   ledgerState.balances.emplace(creator, initialSupply);
}

Ledger::Ledger(const AccountId& creator, EventSink& events) : Ledger(creator, 0, events) {}

Ledger::Ledger(LedgerState state, EventSink& events)
    : ledgerState(std::move(state)), eventSink(&events)
{
}

Balance Ledger::totalSupply() const
{
   return ledgerState.totalSupply;
}

Balance Ledger::balanceOf(const AccountId& account) const
{
   return lookup(ledgerState.balances, account);
}

Balance Ledger::allowance(const AccountId& owner, const AccountId& spender) const
{
   return lookup(ledgerState.allowances, AllowanceKey{owner, spender});
}

void Ledger::transfer(const AccountId& caller, const AccountId& to, Balance value)
{
   moveBalance(caller, to, value);
   eventSink->transferred(caller, to, value);
}

void Ledger::transferFrom(const AccountId& caller, const AccountId& from, Balance value)
{
   // The caller receives. The allowance of (from, caller) is neither
   // required nor reduced.
   moveBalance(from, caller, value);
}

void Ledger::burn(const AccountId& caller, Balance value)
{
   auto balance = balanceOf(caller);
   if (balance < value)
   {
      TOKENLEDGER_LOG(tokenledger::loggers::generic::get(), debug)
          << "burn of " << balanceToString(value) << " clamped to "
          << balanceToString(balance) << " for " << caller.str();
      ledgerState.balances[caller] = 0;
   }
   else
   {
      ledgerState.balances[caller] = balance - value;
   }
}

void Ledger::issue(const AccountId& to, Balance value)
{
   auto balance = balanceOf(to);
   check(!sumOverflows(balance, value), balanceOverflow);

   ledgerState.balances[to] = balance + value;
}

void Ledger::approve(const AccountId& caller, const AccountId& spender, Balance value)
{
   ledgerState.allowances[AllowanceKey{caller, spender}] = value;
}

void Ledger::moveBalance(const AccountId& from, const AccountId& to, Balance value)
{
   auto fromBalance = balanceOf(from);
   check(fromBalance >= value, insufficientBalance);
   if (from != to)
   {
      check(!sumOverflows(balanceOf(to), value), balanceOverflow);
   }

   ledgerState.balances[from] = fromBalance - value;
   auto toBalance             = balanceOf(to);
   ledgerState.balances[to]   = toBalance + value;
}
