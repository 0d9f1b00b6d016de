// yamlfix: canonical YAML formatter
//  version 0.1.0 | MIT License
//  Parses each document into the round-trip tree, validates it with fkYAML
//  and applies the structural policies
#pragma once

#include <cstdint>
#include <set>
#include <regex>
#include <sstream>
#include <string>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

#include "yamlfix_config.hh"
#include "yamlfix_errors.hh"
#include "yamlfix_log.hh"
#include "yamlfix_splitter.hh"
#include "yamlfix_tree.hh"

namespace yamlfix {

  // Specialized version of the fkYAML basic_node template. The choice of
  // fkyaml::ordered_map preserves the lexical order of the input.
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

  enum class ScalarType { null, boolean, integer, floating, string };

  // Type fkYAML resolves for a plain scalar
  inline ScalarType resolve_scalar_type( const std::string& plain ) {
    if ( plain.empty() ) return ScalarType::null;

    // Indicators that would start something other than a plain scalar
    static const std::string indicators = "*&!|>'\"[{%@`";
    if ( indicators.find(plain[0]) != std::string::npos ) {
      return ScalarType::string;
    }

    ordered_node node;
    try {
      node = ordered_node::deserialize( plain );
    }
    catch ( const fkyaml::exception& ) {
      // Text fkYAML cannot read as a standalone node is a string in context
      return ScalarType::string;
    }

    if ( node.is_null() ) return ScalarType::null;
    if ( node.is_boolean() ) return ScalarType::boolean;
    if ( node.is_integer() ) return ScalarType::integer;
    if ( node.is_float_number() ) return ScalarType::floating;
    return ScalarType::string;
  }

  class Normalizer {
  public:
    explicit Normalizer( const FormatOptions& options ) : options_( options ) {}

    // Builds doc.tree and applies the structural policies
    void normalize( Document& doc ) const;

    // Switches mapping-value sequences to the configured representation
    void apply_sequence_style( Node& node ) const;

  private:
    // Returns true when any mapping repeats a key
    bool check_duplicate_keys( const Node& node ) const;
    void validate( const Document& doc ) const;

    const FormatOptions& options_;
  };

namespace internal {

  // A block sequence that can be written as [a, b] without losing anything
  inline bool flow_eligible( const Node& seq ) {
    if ( seq.items.empty() ) return false;
    for ( const auto& item : seq.items ) {
      const Node& v = *item.value;
      if ( !v.is_single_line_scalar() || !v.comment.empty()
        || !v.leading.empty() ) return false;
      if ( v.is_plain() && v.text.front().empty() ) return false;
      // Flow indicators would split or end the collection
      if ( v.is_plain()
        && v.text.front().find_first_of(",[]{}") != std::string::npos )
      {
        return false;
      }
      for ( const auto& t : item.leading ) {
        if ( !t.blank ) return false;
      }
    }
    return true;
  }

} // namespace yamlfix::internal

} // namespace yamlfix

inline void yamlfix::Normalizer::normalize( Document& doc ) const {
  // 1) Round-trip tree
  TreeParser parser( doc.first_line );
  doc.tree = std::make_unique< Tree >(
    parser.parse(doc.text, doc.marker_content) );

  // 2) Duplicate keys, which fkYAML refuses outright
  const bool duplicates = check_duplicate_keys( *doc.tree->root );
  if ( duplicates ) {
    YAMLFIX_LOG_DEBUG << "Document " << doc.index << " has duplicate keys, "
      "skipping validation";
  }
  else {
    // 3) Semantic validation
    validate( doc );
  }

  // 4) Default sequence representation
  apply_sequence_style( *doc.tree->root );
}

inline bool yamlfix::Normalizer::check_duplicate_keys( const Node& node ) const
{
  bool found = false;

  if ( node.kind == NodeKind::Mapping ) {
    std::set< std::string > seen;
    for ( const auto& entry : node.entries ) {
      const std::string key = internal::unquote_key( entry.key );
      if ( seen.count(key) ) {
        if ( !options_.allow_duplicate_keys ) {
          throw DuplicateKeyError( key, entry.line, entry.column );
        }
        found = true;
      }
      seen.insert( key );
    }
    for ( const auto& entry : node.entries ) {
      found = check_duplicate_keys( *entry.value ) || found;
    }
  }
  else if ( node.kind == NodeKind::Sequence ) {
    for ( const auto& item : node.items ) {
      found = check_duplicate_keys( *item.value ) || found;
    }
  }
  return found;
}

inline void yamlfix::Normalizer::validate( const Document& doc ) const {
  std::ostringstream text;
  for ( const auto& directive : doc.directives ) text << directive << '\n';
  text << "---";
  if ( !doc.marker_content.empty() ) text << ' ' << doc.marker_content;
  text << '\n' << doc.text << '\n';

  try {
    ordered_node::deserialize( text.str() );
  }
  catch ( const fkyaml::exception& ex ) {
    // Positions as fkYAML reports them, relative to the document
    static const std::regex position(
      R"(\s*\(?at line (\d+), column (\d+)\)?)" );
    const std::string what = ex.what();
    int line = 0, column = 0;
    std::smatch m;
    if ( std::regex_search(what, m, position) ) {
      line = std::stoi( m[1].str() );
      column = std::stoi( m[2].str() );
    }
    // ParseError appends the position itself
    std::ostringstream oss;
    oss << "document " << doc.index << " is not valid YAML: "
      << std::regex_replace( what, position, "" );
    throw ParseError( oss.str(), line, column );
  }
}

inline void yamlfix::Normalizer::apply_sequence_style( Node& node ) const {
  if ( node.kind == NodeKind::Mapping ) {
    for ( auto& entry : node.entries ) {
      Node& v = *entry.value;
      if ( v.kind == NodeKind::Sequence ) {
        if ( options_.sequence_style == SequenceStyle::flow && !v.flow
          && internal::flow_eligible(v) )
        {
          v.flow = true;
          for ( auto& item : v.items ) item.leading.clear();
        }
        else if ( options_.sequence_style == SequenceStyle::block && v.flow
          && !v.items.empty() )
        {
          v.flow = false;
        }
      }
      apply_sequence_style( v );
    }
  }
  else if ( node.is_block_sequence() ) {
    for ( auto& item : node.items ) apply_sequence_style( *item.value );
  }
}
