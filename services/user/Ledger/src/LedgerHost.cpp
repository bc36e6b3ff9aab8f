#include <services/user/LedgerHost.hpp>

#include <tokenledger/check.hpp>
#include <tokenledger/log.hpp>

#include <exception>
#include <functional>
#include <string>
#include <utility>

using namespace LedgerService;
using namespace LedgerService::Errors;
using tokenledger::balanceToString;
using tokenledger::check;
using tokenledger::parseBalance;

namespace
{
   using Args = std::vector<std::string>;

   struct ActionEntry
   {
      std::string_view name;
      std::size_t      numArgs;
      bool             needsSender;
      bool             mutates;
      std::function<std::string(Ledger&, const AccountId& sender, const Args&)> run;
   };

   AccountId account(const std::string& s)
   {
      return AccountId::parse(s);
   }

   const std::vector<ActionEntry>& actions()
   {
      static const std::vector<ActionEntry> result = {
          {"totalSupply", 0, false, false,
           [](Ledger& l, const AccountId&, const Args&)
           { return balanceToString(l.totalSupply()); }},
          {"balanceOf", 1, false, false,
           [](Ledger& l, const AccountId&, const Args& a)
           { return balanceToString(l.balanceOf(account(a[0]))); }},
          {"allowance", 2, false, false,
           [](Ledger& l, const AccountId&, const Args& a)
           { return balanceToString(l.allowance(account(a[0]), account(a[1]))); }},
          {"transfer", 2, true, true,
           [](Ledger& l, const AccountId& sender, const Args& a)
           {
              l.transfer(sender, account(a[0]), parseBalance(a[1]));
              return std::string{};
           }},
          {"transferFrom", 2, true, true,
           [](Ledger& l, const AccountId& sender, const Args& a)
           {
              l.transferFrom(sender, account(a[0]), parseBalance(a[1]));
              return std::string{};
           }},
          {"burn", 1, true, true,
           [](Ledger& l, const AccountId& sender, const Args& a)
           {
              l.burn(sender, parseBalance(a[0]));
              return std::string{};
           }},
          {"issue", 2, false, true,
           [](Ledger& l, const AccountId&, const Args& a)
           {
              l.issue(account(a[0]), parseBalance(a[1]));
              return std::string{};
           }},
          {"approve", 2, true, true,
           [](Ledger& l, const AccountId& sender, const Args& a)
           {
              l.approve(sender, account(a[0]), parseBalance(a[1]));
              return std::string{};
           }},
      };
      return result;
   }

   const ActionEntry& findAction(std::string_view name)
   {
      for (const auto& entry : actions())
      {
         if (entry.name == name)
            return entry;
      }
      tokenledger::abortMessage(std::string(unknownAction) + ": " + std::string(name));
   }
}  // namespace

CallResult CallResult::success(std::string returnVal, std::vector<TransferEvent> events)
{
   CallResult result;
   result.value   = std::move(returnVal);
   result.emitted = std::move(events);
   return result;
}

CallResult CallResult::failure(std::string error)
{
   CallResult result;
   result.err = std::move(error);
   return result;
}

bool CallResult::failed(std::string_view expected) const
{
   if (!err)
   {
      TOKENLEDGER_LOG(tokenledger::loggers::generic::get(), debug)
          << "call succeeded, but was expected to fail";
      return false;
   }
   if (err->find(expected) != std::string::npos)
      return true;
   TOKENLEDGER_LOG(tokenledger::loggers::generic::get(), debug)
       << "call was expected to fail with: \"" << expected << "\", but it failed with: \""
       << *err << "\"";
   return false;
}

const std::string& CallResult::returnVal() const
{
   check(succeeded(), "call failed: " + err.value_or(""));
   return value;
}

LedgerHost::LedgerHost(StateStore& store) : store(&store) {}

CallResult LedgerHost::create(const AccountId& creator, std::optional<Balance> initialSupply)
{
   try
   {
      check(!store->load().has_value(), ledgerExists);

      EventLog events;
      auto ledger = initialSupply ? Ledger{creator, *initialSupply, events}
                                  : Ledger{creator, events};
      store->store(ledger.state());

      TOKENLEDGER_LOG(tokenledger::loggers::generic::get(), info)
          << "Created ledger with supply " << balanceToString(ledger.totalSupply())
          << " owned by " << creator.str();
      return CallResult::success({}, events.take());
   }
   catch (std::exception& e)
   {
      TOKENLEDGER_LOG(tokenledger::loggers::generic::get(), warning)
          << "create failed: " << e.what();
      return CallResult::failure(e.what());
   }
}

CallResult LedgerHost::call(const std::optional<AccountId>& sender,
                            std::string_view                action,
                            const std::vector<std::string>& args)
{
   try
   {
      const auto& entry = findAction(action);
      check(args.size() == entry.numArgs, std::string(wrongArgCount) + " for " +
                                              std::string(action) + ": expected " +
                                              std::to_string(entry.numArgs));
      check(!entry.needsSender || sender.has_value(),
            std::string(missingSender) + ": " + std::string(action));

      auto state = store->load();
      check(state.has_value(), ledgerDNE);

      TOKENLEDGER_LOG(tokenledger::loggers::generic::get(), debug)
          << "dispatch " << action << " sender=" << (sender ? sender->str() : "-");

      EventLog events;
      Ledger   ledger{std::move(*state), events};
      auto     returnVal = entry.run(ledger, sender.value_or(AccountId{}), args);
      if (entry.mutates)
         store->store(ledger.state());

      for (const auto& event : events.events())
      {
         TOKENLEDGER_LOG(tokenledger::loggers::generic::get(), info)
             << "transferred from=" << event.from.str() << " to=" << event.to.str()
             << " value=" << balanceToString(event.value);
      }
      return CallResult::success(std::move(returnVal), events.take());
   }
   catch (std::exception& e)
   {
      TOKENLEDGER_LOG(tokenledger::loggers::generic::get(), warning)
          << action << " failed: " << e.what();
      return CallResult::failure(e.what());
   }
}
