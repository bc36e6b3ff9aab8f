#pragma once

#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/program_options/variables_map.hpp>

#include <cstdint>
#include <iosfwd>

namespace tokenledger
{
   namespace loggers
   {
      enum class level : std::uint32_t
      {
         debug,
         info,
         notice,
         warning,
         error,
         critical,
      };
      std::ostream& operator<<(std::ostream&, const level&);
      std::istream& operator>>(std::istream& is, level& l);
      using common_logger = boost::log::sources::severity_logger_mt<level>;
      BOOST_LOG_GLOBAL_LOGGER(generic, common_logger)

      // Replaces the current sink with one that writes to std::clog.
      // Records below `minimum` are dropped.
      void configure(level minimum);
      // Same as above but writes to `out`, which must outlive the sink.
      void configure(level minimum, std::ostream& out);
      // Reads the "log-level" option, if present.
      void configure(const boost::program_options::variables_map&);
      void configure_default();
      // Removes the sink installed by configure
      void shutdown();
   }  // namespace loggers

#define TOKENLEDGER_LOG(logger, log_level) \
   BOOST_LOG_SEV(logger, ::tokenledger::loggers::level::log_level)
}  // namespace tokenledger
