// yamlfix: canonical YAML formatter
//  version 0.1.0 | MIT License
//  Protects Jinja expressions from the YAML parser and restores them after
//  formatting
#pragma once

#include <regex>
#include <sstream>
#include <string>
#include <vector>

#include "yamlfix_log.hh"
#include "yamlfix_scan.hh"

namespace yamlfix {

  enum class QuoteContext { none, single_quoted, double_quoted };

  struct JinjaExpression {
    std::string text;
    QuoteContext context = QuoteContext::none;
  };

namespace internal {

  inline const std::string JINJA_PLACEHOLDER_PREFIX = "__yamlfix_jinja_";
  inline const std::string JINJA_PLACEHOLDER_SUFFIX = "__";

  // Quote context of position `pos` in a single line of YAML text
  inline QuoteContext quote_context_at( const std::string& line,
    std::size_t pos )
  {
    switch ( scan_line(line.substr(0, pos)).open_quote ) {
      case '\'': return QuoteContext::single_quoted;
      case '"': return QuoteContext::double_quoted;
      default: return QuoteContext::none;
    }
  }

  inline std::string escape_for( const std::string& text, QuoteContext ctx ) {
    std::string out;
    for ( char c : text ) {
      if ( ctx == QuoteContext::single_quoted && c == '\'' ) out += "''";
      else if ( ctx == QuoteContext::double_quoted && (c == '"' || c == '\\') )
      {
        out += '\\';
        out += c;
      }
      else out += c;
    }
    return out;
  }

} // namespace yamlfix::internal

  class JinjaEscaper {
  public:
    JinjaEscaper() : prefix_( internal::JINJA_PLACEHOLDER_PREFIX ) {}

    // Replaces every single-line {{ ... }} and {% ... %} with a placeholder
    std::string escape( const std::string& text );

    // Puts the recorded expressions back in place of their placeholders
    std::string unescape( const std::string& text ) const;

    const std::vector< JinjaExpression >& expressions() const
      { return expressions_; }

    // True when the scalar text still carries a placeholder
    bool contains_placeholder( const std::string& text ) const
      { return text.find( prefix_ ) != std::string::npos; }

  private:
    std::string prefix_;
    std::vector< JinjaExpression > expressions_;
  };

  // Placeholder test for passes that do not hold the escaper
  inline bool has_jinja_placeholder( const std::string& text ) {
    return text.find( internal::JINJA_PLACEHOLDER_PREFIX ) != std::string::npos;
  }

} // namespace yamlfix

inline std::string yamlfix::JinjaEscaper::escape( const std::string& text ) {
  static const std::regex expression( R"(\{\{.*?\}\}|\{%.*?%\})" );

  expressions_.clear();
  prefix_ = internal::JINJA_PLACEHOLDER_PREFIX;
  // Never collide with text already present in the document
  while ( text.find(prefix_) != std::string::npos ) prefix_ = '_' + prefix_;

  std::ostringstream out;
  std::size_t start = 0;
  while ( start <= text.size() ) {
    std::size_t eol = text.find( '\n', start );
    const std::string line = text.substr( start,
      eol == std::string::npos ? std::string::npos : eol - start );

    std::size_t last = 0;
    for ( std::sregex_iterator it( line.begin(), line.end(), expression ), end;
      it != end; ++it )
    {
      const std::size_t pos = static_cast< std::size_t >( it->position() );
      out << line.substr( last, pos - last );
      out << prefix_ << expressions_.size()
        << internal::JINJA_PLACEHOLDER_SUFFIX;
      expressions_.push_back( { it->str(),
        internal::quote_context_at(line, pos) } );
      last = pos + it->length();
    }
    out << line.substr( last );

    if ( eol == std::string::npos ) break;
    out << '\n';
    start = eol + 1;
  }

  if ( !expressions_.empty() ) {
    YAMLFIX_LOG_DEBUG << "Escaped " << expressions_.size()
      << " jinja expressions";
  }
  return out.str();
}

inline std::string yamlfix::JinjaEscaper::unescape( const std::string& text )
  const
{
  if ( expressions_.empty() ) return text;

  const std::regex placeholder( prefix_ + "([0-9]+)"
    + internal::JINJA_PLACEHOLDER_SUFFIX );

  std::string out;
  std::size_t last = 0;
  for ( std::sregex_iterator it( text.begin(), text.end(), placeholder ), end;
    it != end; ++it )
  {
    const std::size_t pos = static_cast< std::size_t >( it->position() );
    const std::size_t n = std::stoul( (*it)[1].str() );
    out += text.substr( last, pos - last );
    last = pos + it->length();

    if ( n >= expressions_.size() ) {
      out += it->str();
      continue;
    }

    const JinjaExpression& expr = expressions_[ n ];
    std::size_t bol = text.rfind( '\n', pos );
    bol = bol == std::string::npos ? 0 : bol + 1;
    QuoteContext now = internal::quote_context_at(
      text.substr(bol, pos - bol), pos - bol );

    if ( now == expr.context ) out += expr.text;
    else out += internal::escape_for( expr.text, now );
  }
  out += text.substr( last );
  return out;
}
