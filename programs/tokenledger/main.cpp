#include <services/user/LedgerHost.hpp>
#include <tokenledger/check.hpp>
#include <tokenledger/log.hpp>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/variables_map.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace LedgerService;
using tokenledger::AccountId;
using tokenledger::Balance;

namespace tokenledger
{
   void validate(boost::any& v, const std::vector<std::string>& values, AccountId*, int)
   {
      boost::program_options::validators::check_first_occurrence(v);
      auto s = boost::program_options::validators::get_single_string(values);
      try
      {
         v = AccountId::parse(s);
      }
      catch (std::exception&)
      {
         throw boost::program_options::invalid_option_value(s);
      }
   }
}  // namespace tokenledger

namespace
{
   const char usage[] =
       "USAGE: tokenledger [options] create [supply]\n"
       "       tokenledger [options] <action> [args...]\n"
       "\n"
       "Actions:\n"
       "  totalSupply\n"
       "  balanceOf <account>\n"
       "  allowance <owner> <spender>\n"
       "  transfer <to> <value>\n"
       "  transferFrom <from> <value>\n"
       "  burn <value>\n"
       "  issue <to> <value>\n"
       "  approve <spender> <value>\n"
       "\n"
       "Accounts are names of up to 32 characters or 64 hex digits.";

   void printResult(const CallResult& result)
   {
      if (!result.returnVal().empty())
      {
         std::cout << result.returnVal() << "\n";
      }
      for (const auto& event : result.events())
      {
         std::cout << "transferred from=" << event.from.str() << " to=" << event.to.str()
                   << " value=" << tokenledger::balanceToString(event.value) << "\n";
      }
   }
}  // namespace

int main(int argc, char* argv[])
{
   std::string                 statePath;
   std::optional<AccountId>    sender;
   std::string                 configPath;
   std::vector<std::string>    command;
   tokenledger::loggers::level logLevel;

   namespace po = boost::program_options;

   po::options_description common_opts("Options");
   auto                    opt = common_opts.add_options();
   opt("state,s", po::value(&statePath)->default_value("ledger.snapshot")->value_name("path"),
       "Snapshot file holding the ledger state");
   opt("sender,u", po::value<AccountId>()->value_name("account"),
       "Account performing the action");
   opt("log-level",
       po::value(&logLevel)->default_value(tokenledger::loggers::level::notice)->value_name("level"),
       "Minimum severity that is logged: debug, info, notice, warning, error, critical");

   po::options_description desc("tokenledger");
   desc.add(common_opts);
   desc.add_options()("config,c", po::value(&configPath)->value_name("path"),
                      "Read options from an INI file; the command line takes precedence");
   desc.add_options()("command", po::value(&command), "Action and arguments");
   auto add_cmdonly = [](auto& opts)
   { opts.add_options()("help,h", "Show this message")("version,V", "Print version information"); };
   add_cmdonly(desc);

   po::positional_options_description positional;
   positional.add("command", -1);

   po::variables_map vm;
   try
   {
      po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(),
                vm);
      if (vm.count("config"))
      {
         auto          path = vm["config"].as<std::string>();
         std::ifstream in(path);
         tokenledger::check(in.is_open(), "Cannot open config file " + path);
         po::store(po::parse_config_file(in, common_opts), vm);
      }
      po::notify(vm);
   }
   catch (std::exception& e)
   {
      if (!vm.count("help") && !vm.count("version"))
      {
         std::cerr << e.what() << "\n";
         return 1;
      }
   }

   if (vm.count("help"))
   {
      add_cmdonly(common_opts);
      std::cerr << usage << "\n\n";
      std::cerr << common_opts << "\n";
      return 1;
   }

   if (vm.count("version"))
   {
      std::cerr << "tokenledger " << TOKENLEDGER_VERSION_MAJOR << "." << TOKENLEDGER_VERSION_MINOR
                << "." << TOKENLEDGER_VERSION_PATCH << "\n";
      return 1;
   }

   try
   {
      tokenledger::loggers::configure(vm);
      if (vm.count("sender"))
         sender = vm["sender"].as<AccountId>();
      tokenledger::check(!command.empty(), "No action given; see --help");

      SnapshotFileStore store{std::filesystem::path(statePath)};
      LedgerHost        host{store};

      const auto&              action = command.front();
      std::vector<std::string> args(command.begin() + 1, command.end());
      CallResult               result = CallResult::failure("");
      if (action == "create")
      {
         tokenledger::check(sender.has_value(), "create requires --sender");
         tokenledger::check(args.size() <= 1, "create takes at most one argument");
         std::optional<Balance> supply;
         if (!args.empty())
            supply = tokenledger::parseBalance(args[0]);
         result = host.create(*sender, supply);
      }
      else
      {
         result = host.call(sender, action, args);
      }

      if (!result.succeeded())
      {
         TOKENLEDGER_LOG(tokenledger::loggers::generic::get(), error) << *result.error();
         std::cerr << *result.error() << "\n";
         return 1;
      }
      printResult(result);
      return 0;
   }
   catch (std::exception& e)
   {
      TOKENLEDGER_LOG(tokenledger::loggers::generic::get(), error) << e.what();
      std::cerr << e.what() << "\n";
   }
   return 1;
}
