// yamlfix: canonical YAML formatter
//  version 0.1.0 | MIT License
//  Formatting options and the INI / environment configuration loader
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "yamlfix_errors.hh"
#include "yamlfix_log.hh"

namespace yamlfix {

  enum class SequenceStyle { flow, block, keep };

  // Immutable once a pipeline starts. Passed by const reference everywhere.
  struct FormatOptions {
    bool allow_duplicate_keys = false;
    int indent_mapping = 2;
    int indent_offset = 2;
    int indent_sequence = 4;
    int line_length = 80;
    SequenceStyle sequence_style = SequenceStyle::flow;
    bool explicit_start = true;
    std::string none_representation = "";
    bool preserve_quotes = false;
    bool quote_basic_values = false;
    bool quote_keys_and_basic_values = false;
    std::string quote_representation = "'";
    int comments_min_spaces_from_content = 2;
    bool comments_require_starting_space = true;
    int comments_whitelines = 1;
    int section_whitelines = 0;
    int whitelines = 0;
  };

namespace internal {

  inline const std::string CONFIG_SECTION = "yamlfix";
  inline const std::string DEFAULT_ENV_PREFIX = "YAMLFIX";

  inline std::string to_lower( std::string s ) {
    std::transform( s.begin(), s.end(), s.begin(),
      [](unsigned char c) { return static_cast< char >( std::tolower(c) ); } );
    return s;
  }

  inline std::string to_upper( std::string s ) {
    std::transform( s.begin(), s.end(), s.begin(),
      [](unsigned char c) { return static_cast< char >( std::toupper(c) ); } );
    return s;
  }

  inline bool parse_bool( const std::string& option, const std::string& raw ) {
    const std::string v = to_lower( raw );
    if ( v == "true" || v == "yes" || v == "on" || v == "1" ) return true;
    if ( v == "false" || v == "no" || v == "off" || v == "0" ) return false;
    throw ConfigValidationError( option, "expected a boolean, got '"
      + raw + '\'' );
  }

  inline int parse_count( const std::string& option, const std::string& raw,
    int minimum = 0 )
  {
    if ( raw.empty() || !std::all_of(raw.begin(), raw.end(),
      [](unsigned char c) { return std::isdigit(c) != 0; }) )
    {
      throw ConfigValidationError( option, "expected a non-negative integer, "
        "got '" + raw + '\'' );
    }
    long value = std::strtol( raw.c_str(), nullptr, 10 );
    if ( value < minimum || value > 100000 ) {
      throw ConfigValidationError( option, "value " + raw
        + " is out of range" );
    }
    return static_cast< int >( value );
  }

  inline SequenceStyle parse_sequence_style( const std::string& option,
    const std::string& raw )
  {
    const std::string v = to_lower( raw );
    if ( v == "flow_style" || v == "flow" ) return SequenceStyle::flow;
    if ( v == "block_style" || v == "block" ) return SequenceStyle::block;
    if ( v == "keep_style" || v == "keep" ) return SequenceStyle::keep;
    throw ConfigValidationError( option, "expected one of flow_style, "
      "block_style, keep_style, got '" + raw + '\'' );
  }

} // namespace yamlfix::internal

  // Collects option values from INI files and the environment, then builds
  // a validated FormatOptions. Later sources override earlier ones.
  class ConfigLoader {
  public:
    explicit ConfigLoader( std::string env_prefix
      = internal::DEFAULT_ENV_PREFIX ) : env_prefix_( std::move(env_prefix) ) {}

    // Reads the [yamlfix] section of an INI file
    void add_file( const std::string& path );

    // Records one option by name, as if read from a file
    void set( const std::string& option, const std::string& value );

    // Applies <PREFIX>_<OPTION> environment variables, then validates
    FormatOptions load() const;

    static const std::vector< std::string >& option_names();

  private:
    using Setter = std::function< void( FormatOptions&, const std::string& ) >;
    static const std::map< std::string, Setter >& setters();

    std::string env_prefix_;
    std::map< std::string, std::string > values_;
  };

} // namespace yamlfix

inline const std::map< std::string, yamlfix::ConfigLoader::Setter >&
  yamlfix::ConfigLoader::setters()
{
  using namespace internal;
  static const std::map< std::string, Setter > table = {
    { "allow_duplicate_keys", [](FormatOptions& o, const std::string& v) {
      o.allow_duplicate_keys = parse_bool( "allow_duplicate_keys", v ); } },
    { "indent_mapping", [](FormatOptions& o, const std::string& v) {
      o.indent_mapping = parse_count( "indent_mapping", v, 1 ); } },
    { "indent_offset", [](FormatOptions& o, const std::string& v) {
      o.indent_offset = parse_count( "indent_offset", v ); } },
    { "indent_sequence", [](FormatOptions& o, const std::string& v) {
      o.indent_sequence = parse_count( "indent_sequence", v, 1 ); } },
    { "line_length", [](FormatOptions& o, const std::string& v) {
      o.line_length = parse_count( "line_length", v, 1 ); } },
    { "sequence_style", [](FormatOptions& o, const std::string& v) {
      o.sequence_style = parse_sequence_style( "sequence_style", v ); } },
    { "explicit_start", [](FormatOptions& o, const std::string& v) {
      o.explicit_start = parse_bool( "explicit_start", v ); } },
    { "none_representation", [](FormatOptions& o, const std::string& v) {
      if ( v != "" && v != "null" && v != "Null" && v != "NULL" && v != "~" ) {
        throw ConfigValidationError( "none_representation", "expected one of "
          "'', 'null', 'Null', 'NULL', '~', got '" + v + '\'' );
      }
      o.none_representation = v; } },
    { "preserve_quotes", [](FormatOptions& o, const std::string& v) {
      o.preserve_quotes = parse_bool( "preserve_quotes", v ); } },
    { "quote_basic_values", [](FormatOptions& o, const std::string& v) {
      o.quote_basic_values = parse_bool( "quote_basic_values", v ); } },
    { "quote_keys_and_basic_values", [](FormatOptions& o,
      const std::string& v) { o.quote_keys_and_basic_values
        = parse_bool( "quote_keys_and_basic_values", v ); } },
    { "quote_representation", [](FormatOptions& o, const std::string& v) {
      if ( v != "'" && v != "\"" ) {
        throw ConfigValidationError( "quote_representation",
          "expected ' or \", got '" + v + '\'' );
      }
      o.quote_representation = v; } },
    { "comments_min_spaces_from_content", [](FormatOptions& o,
      const std::string& v) { o.comments_min_spaces_from_content
        = parse_count( "comments_min_spaces_from_content", v ); } },
    { "comments_require_starting_space", [](FormatOptions& o,
      const std::string& v) { o.comments_require_starting_space
        = parse_bool( "comments_require_starting_space", v ); } },
    { "comments_whitelines", [](FormatOptions& o, const std::string& v) {
      o.comments_whitelines = parse_count( "comments_whitelines", v ); } },
    { "section_whitelines", [](FormatOptions& o, const std::string& v) {
      o.section_whitelines = parse_count( "section_whitelines", v ); } },
    { "whitelines", [](FormatOptions& o, const std::string& v) {
      o.whitelines = parse_count( "whitelines", v ); } },
  };
  return table;
}

inline const std::vector< std::string >& yamlfix::ConfigLoader::option_names()
{
  static const std::vector< std::string > names = [] {
    std::vector< std::string > out;
    for ( const auto& [name, setter] : setters() ) out.push_back( name );
    return out;
  }();
  return names;
}

inline void yamlfix::ConfigLoader::add_file( const std::string& path ) {
  boost::property_tree::ptree tree;
  try {
    boost::property_tree::ini_parser::read_ini( path, tree );
  }
  catch ( const boost::property_tree::ini_parser_error& ex ) {
    throw ConfigValidationError( "config-file", ex.what() );
  }

  auto section = tree.get_child_optional( internal::CONFIG_SECTION );
  if ( !section ) {
    YAMLFIX_LOG_WARNING << "Configuration file " << path << " has no ["
      << internal::CONFIG_SECTION << "] section";
    return;
  }

  YAMLFIX_LOG_DEBUG << "Loading configuration from " << path;
  for ( const auto& [key, child] : *section ) {
    this->set( key, child.get_value< std::string >() );
  }
}

inline void yamlfix::ConfigLoader::set( const std::string& option,
  const std::string& value )
{
  if ( !setters().count(option) ) {
    throw ConfigValidationError( option, "unknown option" );
  }
  values_[ option ] = value;
}

inline yamlfix::FormatOptions yamlfix::ConfigLoader::load() const {
  std::map< std::string, std::string > merged = values_;

  // Environment overrides every config file
  for ( const auto& name : option_names() ) {
    const std::string var = env_prefix_ + '_' + internal::to_upper( name );
    if ( const char* env = std::getenv(var.c_str()) ) {
      YAMLFIX_LOG_DEBUG << "Option " << name << " overridden by " << var;
      merged[ name ] = env;
    }
  }

  FormatOptions options;
  for ( const auto& [name, value] : merged ) {
    setters().at( name )( options, value );
  }

  if ( options.quote_basic_values && options.quote_keys_and_basic_values ) {
    YAMLFIX_LOG_DEBUG << "quote_keys_and_basic_values takes precedence over "
      "quote_basic_values";
  }
  return options;
}
