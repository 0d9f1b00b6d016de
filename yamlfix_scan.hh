// yamlfix: canonical YAML formatter
//  version 0.1.0 | MIT License
//  Raw-text line scanning shared by the splitter and the tree parser
#pragma once

#include <regex>
#include <string>

namespace yamlfix {

namespace internal {

  inline constexpr std::size_t npos = std::string::npos;

  inline bool is_space( char c ) { return c == ' ' || c == '\t'; }

  inline std::string ltrim( const std::string& s ) {
    std::size_t b = 0;
    while ( b < s.size() && is_space(s[b]) ) ++b;
    return s.substr( b );
  }

  inline std::string rtrim( const std::string& s ) {
    std::size_t e = s.size();
    while ( e > 0 && (is_space(s[e - 1]) || s[e - 1] == '\r') ) --e;
    return s.substr( 0, e );
  }

  inline std::string trim( const std::string& s ) { return ltrim( rtrim(s) ); }

  inline std::string pad( int n ) {
    return std::string( n > 0 ? static_cast< std::size_t >( n ) : 0u, ' ' );
  }

  inline bool starts_with( const std::string& s, const std::string& prefix ) {
    return s.compare( 0, prefix.size(), prefix ) == 0;
  }

  // Number of leading spaces. Tabs never count as indentation.
  inline int count_indent( const std::string& line ) {
    int n = 0;
    while ( n < static_cast< int >( line.size() ) && line[n] == ' ' ) ++n;
    return n;
  }

  inline bool is_blank( const std::string& line ) {
    for ( char c : line ) {
      if ( !is_space(c) && c != '\r' ) return false;
    }
    return true;
  }

  // A quote opens a quoted scalar only where a token may start
  inline bool is_token_start( const std::string& s, std::size_t i ) {
    if ( i == 0 ) return true;
    char p = s[ i - 1 ];
    return is_space( p ) || p == '[' || p == '{' || p == ',';
  }

  // Index of the closing quote of a scalar opened before `from`, or npos.
  // Handles '' inside single quotes and backslash escapes inside double.
  inline std::size_t find_closing_quote( const std::string& s,
    std::size_t from, char quote )
  {
    for ( std::size_t i = from; i < s.size(); ++i ) {
      if ( quote == '"' && s[i] == '\\' ) { ++i; continue; }
      if ( s[i] != quote ) continue;
      if ( quote == '\'' && i + 1 < s.size() && s[i + 1] == '\'' ) {
        ++i;
        continue;
      }
      return i;
    }
    return npos;
  }

  struct LineScan {
    std::size_t comment = npos; // index of the '#' starting a comment
    char open_quote = 0;        // quote still open at the end of the line
  };

  // Quote-aware scan of one line. `open_quote` carries a quoted scalar over
  // from the previous line.
  inline LineScan scan_line( const std::string& s, char open_quote = 0 ) {
    LineScan out;
    char q = open_quote;
    for ( std::size_t i = 0; i < s.size(); ++i ) {
      char c = s[i];
      if ( q == '\'' ) {
        if ( c == '\'' ) {
          if ( i + 1 < s.size() && s[i + 1] == '\'' ) ++i;
          else q = 0;
        }
        continue;
      }
      if ( q == '"' ) {
        if ( c == '\\' ) ++i;
        else if ( c == '"' ) q = 0;
        continue;
      }
      if ( c == '#' && (i == 0 || is_space(s[i - 1])) ) {
        out.comment = i;
        break;
      }
      if ( (c == '\'' || c == '"') && is_token_start(s, i) ) q = c;
    }
    out.open_quote = q;
    return out;
  }

  inline std::size_t find_comment( const std::string& s ) {
    return scan_line( s ).comment;
  }

  inline bool is_sequence_entry( const std::string& content ) {
    return !content.empty() && content[0] == '-'
      && ( content.size() == 1 || is_space(content[1]) );
  }

  // Position of the ':' separating an implicit block mapping key from its
  // value, or npos when the content is not a mapping entry
  inline std::size_t find_mapping_separator( const std::string& s ) {
    if ( s.empty() ) return npos;
    const char c0 = s[0];

    if ( c0 == '"' || c0 == '\'' ) {
      std::size_t close = find_closing_quote( s, 1, c0 );
      if ( close == npos ) return npos;
      std::size_t j = close + 1;
      while ( j < s.size() && is_space(s[j]) ) ++j;
      if ( j < s.size() && s[j] == ':'
        && (j + 1 == s.size() || is_space(s[j + 1])) ) return j;
      return npos;
    }

    if ( c0 == '[' || c0 == '{' || c0 == '|' || c0 == '>' || c0 == '#'
      || c0 == '%' || c0 == '@' || c0 == '`' ) return npos;
    if ( (c0 == '-' || c0 == '?') && (s.size() == 1 || is_space(s[1])) ) {
      return npos;
    }

    for ( std::size_t i = 0; i < s.size(); ++i ) {
      if ( s[i] == '#' && i > 0 && is_space(s[i - 1]) ) return npos;
      if ( s[i] == ':' && (i + 1 == s.size() || is_space(s[i + 1])) ) {
        return i;
      }
    }
    return npos;
  }

  // Block scalar header token: indicator, optional chomping and indentation
  inline bool is_block_scalar_header( const std::string& token ) {
    static const std::regex header( R"(^[|>]([1-9][+-]?|[+-][1-9]?)?$)" );
    return std::regex_match( token, header );
  }

  inline bool is_marker_line( const std::string& line,
    const std::string& marker )
  {
    return starts_with( line, marker )
      && ( line.size() == marker.size() || is_space(line[marker.size()])
      || line[marker.size()] == '\r' );
  }

  inline bool is_document_start( const std::string& line ) {
    return is_marker_line( line, "---" );
  }

  inline bool is_document_end( const std::string& line ) {
    return is_marker_line( line, "..." );
  }

} // namespace yamlfix::internal

} // namespace yamlfix
