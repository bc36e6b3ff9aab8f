#include <tokenledger/log.hpp>

#include <boost/core/null_deleter.hpp>
#include <boost/log/attributes/function.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/core/core.hpp>
#include <boost/log/expressions/message.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/formatting_ostream.hpp>
#include <boost/make_shared.hpp>

#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>

namespace tokenledger::loggers
{
   BOOST_LOG_GLOBAL_LOGGER_DEFAULT(generic, common_logger)

   namespace
   {
      using backend_type = boost::log::sinks::text_ostream_backend;
      using sink_type    = boost::log::sinks::synchronous_sink<backend_type>;

      template <typename S, typename T>
      void format_timestamp(S& os, const T& timestamp)
      {
         auto date = std::chrono::floor<std::chrono::days>(timestamp);
         auto ymd  = std::chrono::year_month_day(date);
         auto time = std::chrono::hh_mm_ss(
             std::chrono::duration_cast<std::chrono::milliseconds>(timestamp - date));
         os << std::setfill('0');
         os << std::setw(4) << (int)ymd.year() << '-' << std::setw(2) << (unsigned)ymd.month()
            << '-' << std::setw(2) << (unsigned)ymd.day();
         os << 'T' << std::setw(2) << time.hours().count() << ':' << std::setw(2)
            << time.minutes().count() << ':' << std::setw(2) << time.seconds().count() << '.'
            << std::setw(3) << time.subseconds().count() << 'Z';
         os << std::setfill(' ');
      }

      void format_record(const boost::log::record_view& rec, boost::log::formatting_ostream& os)
      {
         if (auto timestamp =
                 boost::log::extract<std::chrono::system_clock::time_point>("TimeStamp", rec))
         {
            std::ostringstream ts;
            format_timestamp(ts, *timestamp);
            os << ts.str() << ' ';
         }
         if (auto l = boost::log::extract<level>("Severity", rec))
         {
            os << '[' << *l << "]: ";
         }
         if (auto message = rec[boost::log::expressions::smessage])
         {
            os << *message;
         }
      }

      std::mutex                   sink_mutex;
      boost::shared_ptr<sink_type> current_sink;

      void install(level minimum, boost::shared_ptr<std::ostream> stream)
      {
         std::lock_guard lock{sink_mutex};
         auto            core = boost::log::core::get();
         static bool     attributes_added = [&]
         {
            core->add_global_attribute(
                "TimeStamp",
                boost::log::attributes::function<std::chrono::system_clock::time_point>(
                    []() { return std::chrono::system_clock::now(); }));
            return true;
         }();
         (void)attributes_added;

         auto backend = boost::make_shared<backend_type>();
         backend->add_stream(std::move(stream));
         backend->auto_flush(true);
         auto sink = boost::make_shared<sink_type>(backend);
         sink->set_formatter(&format_record);
         sink->set_filter(
             [minimum](const boost::log::attribute_value_set& attrs)
             {
                auto l = boost::log::extract<level>("Severity", attrs);
                return !l || *l >= minimum;
             });

         if (current_sink)
            core->remove_sink(current_sink);
         core->add_sink(sink);
         current_sink = std::move(sink);
      }
   }  // namespace

   void configure(level minimum)
   {
      install(minimum, boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
   }

   void configure(level minimum, std::ostream& out)
   {
      install(minimum, boost::shared_ptr<std::ostream>(&out, boost::null_deleter()));
   }

   void configure(const boost::program_options::variables_map& map)
   {
      if (auto iter = map.find("log-level"); iter != map.end() && !iter->second.empty())
      {
         configure(iter->second.as<level>());
      }
      else
      {
         configure_default();
      }
   }

   void configure_default()
   {
      configure(level::notice);
   }

   void shutdown()
   {
      std::lock_guard lock{sink_mutex};
      if (current_sink)
      {
         current_sink->flush();
         boost::log::core::get()->remove_sink(current_sink);
         current_sink.reset();
      }
   }

   std::ostream& operator<<(std::ostream& os, const level& l)
   {
      switch (l)
      {
         case level::debug:
            os << "debug";
            break;
         case level::info:
            os << "info";
            break;
         case level::notice:
            os << "notice";
            break;
         case level::warning:
            os << "warning";
            break;
         case level::error:
            os << "error";
            break;
         case level::critical:
            os << "critical";
            break;
      }
      return os;
   }

   std::istream& operator>>(std::istream& is, level& l)
   {
      std::string s;
      if (is >> s)
      {
         if (s == "debug")
         {
            l = level::debug;
         }
         else if (s == "info")
         {
            l = level::info;
         }
         else if (s == "notice")
         {
            l = level::notice;
         }
         else if (s == "warning")
         {
            l = level::warning;
         }
         else if (s == "error")
         {
            l = level::error;
         }
         else if (s == "critical")
         {
            l = level::critical;
         }
         else
         {
            throw std::runtime_error("not a valid log level: \"" + s + "\"");
         }
      }
      return is;
   }
}  // namespace tokenledger::loggers
