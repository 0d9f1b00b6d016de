// yamlfix: canonical YAML formatter
//  version 0.1.0 | MIT License
//  Logging front end on top of the Boost.Log trivial logger
#pragma once

#include <iostream>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/console.hpp>

#define YAMLFIX_LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define YAMLFIX_LOG_INFO BOOST_LOG_TRIVIAL(info)
#define YAMLFIX_LOG_WARNING BOOST_LOG_TRIVIAL(warning)
#define YAMLFIX_LOG_ERROR BOOST_LOG_TRIVIAL(error)

namespace yamlfix {

namespace internal {

  // ANSI color of the "+" marker for each severity
  inline int severity_color( boost::log::trivial::severity_level level ) {
    switch ( level ) {
      case boost::log::trivial::trace:
      case boost::log::trivial::debug: return 34;
      case boost::log::trivial::info: return 32;
      case boost::log::trivial::warning: return 33;
      default: return 31;
    }
  }

  // Renders "[+] message" with the marker colored by severity
  inline void format_record( const boost::log::record_view& rec,
    boost::log::formatting_ostream& strm )
  {
    auto level = rec[ boost::log::trivial::severity ];
    int color = level ? severity_color( *level ) : 31;
    strm << "[\033[" << color << "m+\033[0m] "
      << rec[ boost::log::expressions::smessage ];
  }

} // namespace yamlfix::internal

  // Installs the stderr sink used by the command line tool. Verbosity 0 shows
  // INFO and above, anything higher shows DEBUG as well.
  inline void init_logging( int verbosity ) {
    auto sink = boost::log::add_console_log( std::clog );
    sink->set_formatter( &internal::format_record );

    auto threshold = verbosity > 0 ? boost::log::trivial::debug
      : boost::log::trivial::info;
    boost::log::core::get()->set_filter(
      boost::log::trivial::severity >= threshold );
  }

} // namespace yamlfix
