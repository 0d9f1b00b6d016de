// yamlfix: canonical YAML formatter
//  version 0.1.0 | MIT License
//  The fixed-order formatting pass chain. Passes 1-5 work on the round-trip
//  tree, passes 6-8 on the rendered lines.
#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>
#include <vector>

#include "yamlfix_config.hh"
#include "yamlfix_emitter.hh"
#include "yamlfix_jinja.hh"
#include "yamlfix_log.hh"
#include "yamlfix_normalizer.hh"
#include "yamlfix_splitter.hh"
#include "yamlfix_tree.hh"

namespace yamlfix {

  // 1) Sets or clears the '---' marker
  inline void fix_explicit_start( Document& doc, const FormatOptions& options );

  // 2) yes/no/on/off and friends become true/false
  inline void fix_truthy_strings( Tree& tree );

  // 3) Nulls take the configured representation
  inline void substitute_none( Tree& tree, const FormatOptions& options );

  // 4) Quotes a plain scalar does without are dropped, unless preserve_quotes
  // is set; then plain string scalars get quoted on request
  inline void remove_unneeded_quotes( Tree& tree,
    const FormatOptions& options );
  inline void enforce_quotes( Tree& tree, const FormatOptions& options );

  // 5) Flow sequences too wide for line_length become block sequences. With
  // an escaper, widths count the restored Jinja expressions.
  inline void reconcile_sequence_style( Tree& tree,
    const FormatOptions& options, const JinjaEscaper* escaper = nullptr );

  inline std::vector< RenderedLine > render_document( const Document& doc,
    const FormatOptions& options );

  // 6) Inline comment spacing and the space after '#'
  inline void fix_comments( std::vector< RenderedLine >& lines,
    const FormatOptions& options );

  // 7) Blank line runs, section separation and comment separation
  inline void fix_whitelines( std::vector< RenderedLine >& lines,
    const FormatOptions& options );

  // 8) Exactly one final newline, none for empty content
  inline std::string enforce_trailing_newline(
    const std::vector< RenderedLine >& lines );

  class PassChain {
  public:
    explicit PassChain( const FormatOptions& options,
      const JinjaEscaper* escaper = nullptr )
      : options_( options ), escaper_( escaper ) {}

    // Runs every pass in order and stores the result in doc.rendered
    void run( Document& doc ) const;

  private:
    const FormatOptions& options_;
    const JinjaEscaper* escaper_;
  };

namespace internal {

  inline std::string quote_scalar( const std::string& text, char quote ) {
    std::string out( 1, quote );
    for ( char c : text ) {
      if ( quote == '\'' && c == '\'' ) out += "''";
      else if ( quote == '"' && (c == '"' || c == '\\') ) {
        out += '\\';
        out += c;
      }
      else out += c;
    }
    out += quote;
    return out;
  }

  // Applies fn to every mapping value and sequence item, flow items included
  template < typename Fn >
  void for_each_value( Node& node, Fn&& fn, bool in_flow = false ) {
    if ( node.kind == NodeKind::Mapping ) {
      for ( auto& entry : node.entries ) {
        fn( *entry.value, false );
        for_each_value( *entry.value, fn, false );
      }
    }
    else if ( node.kind == NodeKind::Sequence ) {
      const bool flow = in_flow || node.flow;
      for ( auto& item : node.items ) {
        fn( *item.value, flow );
        for_each_value( *item.value, fn, flow );
      }
    }
  }

  inline bool quotable( const Node& v ) {
    return v.is_plain() && !v.has_tag() && v.text.size() == 1
      && !v.is_alias() && !has_jinja_placeholder( v.text.front() )
      && resolve_scalar_type( v.text.front() ) == ScalarType::string;
  }

  inline bool quotable_key( const std::string& key ) {
    static const std::string indicators = "'\"&*!?[{|>%@`";
    if ( key.empty() || key == "<<" ) return false;
    if ( indicators.find(key[0]) != std::string::npos ) return false;
    return !has_jinja_placeholder( key )
      && resolve_scalar_type( key ) == ScalarType::string;
  }

  // Text that reads back as the same string when written plain. YAML 1.1
  // boolean words and text starting like a number keep their quotes.
  inline bool plain_safe( const std::string& s ) {
    static const std::string indicators = "-?:,[]{}#&*!|>'\"%@`.+~=<";
    static const std::vector< std::string > truthy = {
      "y", "n", "yes", "no", "on", "off", "true", "false" };
    if ( s.empty() || indicators.find(s[0]) != std::string::npos ) return false;
    if ( std::isdigit(static_cast< unsigned char >(s[0])) ) return false;
    if ( is_space(s.front()) || is_space(s.back()) ) return false;
    if ( s.find_first_of(":#,[]{}\t\\") != std::string::npos ) return false;
    if ( has_jinja_placeholder(s) ) return false;
    if ( std::find(truthy.begin(), truthy.end(), to_lower(s)) != truthy.end() )
      return false;
    return resolve_scalar_type( s ) == ScalarType::string;
  }

  // The unquoted text of a single-line quoted scalar, or "" when the quotes
  // must stay
  inline std::string removable_quotes( const std::string& quoted ) {
    if ( quoted.size() < 3 || (quoted.front() != '\'' && quoted.front() != '"')
      || quoted.back() != quoted.front() ) return std::string();
    // Escape sequences have no plain spelling
    if ( quoted.front() == '"'
      && quoted.find('\\') != std::string::npos ) return std::string();
    const std::string inner = unquote_key( quoted );
    return plain_safe( inner ) ? inner : std::string();
  }

  inline void unquote_node( Node& node ) {
    auto apply = [&]( Node& v ) {
      if ( !v.is_quoted() || v.has_tag() || v.text.size() != 1 ) return;
      std::string plain = removable_quotes( v.text.front() );
      if ( plain.empty() ) return;
      v.text.front() = plain;
      v.style = ScalarStyle::Plain;
    };

    if ( node.kind == NodeKind::Mapping ) {
      for ( auto& entry : node.entries ) {
        std::string key = removable_quotes( entry.key );
        if ( !key.empty() ) entry.key = key;
        apply( *entry.value );
        unquote_node( *entry.value );
      }
    }
    else if ( node.kind == NodeKind::Sequence ) {
      for ( auto& item : node.items ) {
        apply( *item.value );
        unquote_node( *item.value );
      }
    }
  }

  // Sequences whose items are all scalars free of comments
  inline bool scalar_only( const Node& seq ) {
    for ( const auto& item : seq.items ) {
      const Node& v = *item.value;
      if ( !v.is_scalar() || !v.comment.empty() ) return false;
      for ( const auto& t : item.leading ) {
        if ( !t.blank ) return false;
      }
    }
    return true;
  }

  inline void quote_node( Node& node, bool keys, char quote ) {
    const ScalarStyle style = quote == '\'' ? ScalarStyle::SingleQuoted
      : ScalarStyle::DoubleQuoted;
    auto apply = [&]( Node& v ) {
      if ( !quotable(v) ) return;
      v.text.front() = quote_scalar( v.text.front(), quote );
      v.style = style;
    };

    if ( node.kind == NodeKind::Mapping ) {
      for ( auto& entry : node.entries ) {
        if ( keys && quotable_key(entry.key) ) {
          entry.key = quote_scalar( entry.key, quote );
        }
        apply( *entry.value );
        quote_node( *entry.value, keys, quote );
      }
    }
    else if ( node.kind == NodeKind::Sequence ) {
      const bool items = keys || scalar_only( node );
      for ( auto& item : node.items ) {
        if ( items ) apply( *item.value );
        quote_node( *item.value, keys, quote );
      }
    }
  }

  class SequenceReconciler {
  public:
    SequenceReconciler( const FormatOptions& options,
      const JinjaEscaper* escaper )
      : options_( options ), escaper_( escaper ), emitter_( options ) {}

    int width( const MapEntry& entry, int indent ) const {
      const std::string line = emitter_.flow_line( entry, indent );
      return static_cast< int >(
        escaper_ ? escaper_->unescape( line ).size() : line.size() );
    }

    void mapping( Node& map, int indent ) const {
      const Layout& layout = emitter_.layout();
      for ( auto& entry : map.entries ) {
        Node& v = *entry.value;
        if ( v.is_flow_sequence() && !v.items.empty()
          && width(entry, indent) > options_.line_length )
        {
          YAMLFIX_LOG_DEBUG << "Sequence under '" << entry.key
            << "' exceeds " << options_.line_length << " columns";
          v.flow = false;
        }
        if ( v.is_block_mapping() ) mapping( v, layout.child(indent) );
        else if ( v.is_block_sequence() ) sequence( v, layout.dash(indent) );
      }
    }

    void sequence( Node& seq, int dash ) const {
      const int content = emitter_.layout().item( dash );
      for ( auto& item : seq.items ) {
        Node& v = *item.value;
        if ( v.is_block_mapping() ) mapping( v, content );
        else if ( v.is_block_sequence() ) sequence( v, content );
      }
    }

  private:
    const FormatOptions& options_;
    const JinjaEscaper* escaper_;
    Emitter emitter_;
  };

  // Blank lines allowed at a section boundary holding `blanks` blank lines
  inline int section_gap( const FormatOptions& options, int blanks ) {
    if ( options.whitelines > options.section_whitelines
      && blanks >= options.whitelines ) return options.whitelines;
    return options.section_whitelines;
  }

  inline bool is_boundary( const RenderedLine& line ) {
    return line.kind == LineKind::marker || line.kind == LineKind::directive;
  }

} // namespace yamlfix::internal

} // namespace yamlfix

inline void yamlfix::fix_explicit_start( Document& doc,
  const FormatOptions& options )
{
  if ( options.explicit_start ) {
    doc.explicit_start = true;
    return;
  }

  // The marker carries structure that cannot move elsewhere. A document
  // without content that another one follows would merge into it.
  const bool required = doc.index > 0 || !doc.directives.empty()
    || !doc.marker_content.empty() || !doc.marker_comment.empty()
    || ( !doc.last && !doc.has_content() );
  if ( !required ) doc.explicit_start = false;
}

inline void yamlfix::fix_truthy_strings( Tree& tree ) {
  internal::for_each_value( *tree.root, []( Node& v, bool ) {
    if ( !v.is_plain() || v.has_tag() || v.text.size() != 1 ) return;
    const std::string lower = internal::to_lower( v.text.front() );
    if ( lower == "true" || lower == "yes" || lower == "on" ) {
      v.text.front() = "true";
    }
    else if ( lower == "false" || lower == "no" || lower == "off" ) {
      v.text.front() = "false";
    }
  } );
}

inline void yamlfix::substitute_none( Tree& tree,
  const FormatOptions& options )
{
  const std::string& repr = options.none_representation;
  internal::for_each_value( *tree.root, [&repr]( Node& v, bool in_flow ) {
    if ( !v.is_null() ) return;
    // A flow item cannot be empty
    if ( in_flow && repr.empty() ) return;
    if ( repr.empty() ) v.text.clear();
    else v.text = { repr };
  } );
}

inline void yamlfix::remove_unneeded_quotes( Tree& tree,
  const FormatOptions& options )
{
  if ( options.preserve_quotes ) return;
  internal::unquote_node( *tree.root );
}

inline void yamlfix::enforce_quotes( Tree& tree,
  const FormatOptions& options )
{
  const bool keys = options.quote_keys_and_basic_values;
  if ( !keys && !options.quote_basic_values ) return;
  internal::quote_node( *tree.root, keys,
    options.quote_representation.front() );
}

inline void yamlfix::reconcile_sequence_style( Tree& tree,
  const FormatOptions& options, const JinjaEscaper* escaper )
{
  if ( options.sequence_style != SequenceStyle::flow ) return;

  internal::SequenceReconciler reconciler( options, escaper );
  Node& root = *tree.root;
  if ( root.is_block_mapping() ) reconciler.mapping( root, 0 );
  else if ( root.is_block_sequence() ) reconciler.sequence( root, 0 );
}

inline std::vector< yamlfix::RenderedLine > yamlfix::render_document(
  const Document& doc, const FormatOptions& options )
{
  std::vector< RenderedLine > lines;

  for ( const auto& p : doc.preamble ) {
    RenderedLine line;
    if ( internal::is_blank(p) ) line.kind = LineKind::blank;
    else {
      line.kind = LineKind::comment;
      line.text = internal::rtrim( p );
      line.comment_pos = line.text.find( '#' );
    }
    lines.push_back( line );
  }

  for ( const auto& d : doc.directives ) {
    RenderedLine line;
    line.kind = LineKind::directive;
    line.text = d;
    lines.push_back( line );
  }

  std::vector< RenderedLine > body = Emitter( options ).emit( *doc.tree );

  if ( doc.explicit_start ) {
    RenderedLine marker;
    marker.kind = LineKind::marker;
    marker.text = "---";
    if ( !doc.marker_content.empty() && !body.empty() ) {
      // The root node starts on the marker line
      marker.text += " " + body.front().text;
      if ( body.front().comment_pos != std::string::npos ) {
        marker.comment_pos = body.front().comment_pos + 4;
      }
      body.erase( body.begin() );
    }
    else if ( !doc.marker_comment.empty() ) {
      marker.comment_pos = 4;
      marker.text += " " + doc.marker_comment;
    }
    lines.push_back( marker );
  }

  lines.insert( lines.end(), body.begin(), body.end() );
  return lines;
}

inline void yamlfix::fix_comments( std::vector< RenderedLine >& lines,
  const FormatOptions& options )
{
  const int min_spaces = std::max( options.comments_min_spaces_from_content,
    1 );

  for ( auto& line : lines ) {
    if ( line.comment_pos == std::string::npos ) continue;
    std::string& text = line.text;
    std::size_t pos = line.comment_pos;

    // Inline comments: at least min_spaces between content and '#'
    if ( line.kind != LineKind::comment ) {
      std::size_t gap = 0;
      while ( gap < pos && text[pos - gap - 1] == ' ' ) ++gap;
      if ( gap < pos && static_cast< int >( gap ) < min_spaces ) {
        text.insert( pos, internal::pad(min_spaces - static_cast< int >(gap)) );
        pos += min_spaces - gap;
      }
    }

    if ( options.comments_require_starting_space && pos + 1 < text.size() ) {
      const unsigned char next = static_cast< unsigned char >( text[pos + 1] );
      if ( std::isalnum(next) || next == '_' ) text.insert( pos + 1, " " );
    }
    line.comment_pos = pos;
  }
}

inline void yamlfix::fix_whitelines( std::vector< RenderedLine >& lines,
  const FormatOptions& options )
{
  // Section membership: a top-level key with an indented block below it,
  // together with the comment lines right above the key. Comments at column
  // 0 stay with the section only when more of its lines follow them.
  std::vector< int > owner( lines.size(), -1 );
  std::vector< std::size_t > pending;
  int current = -1;
  int sections = 0;
  for ( std::size_t i = 0; i < lines.size(); ++i ) {
    const RenderedLine& line = lines[i];
    if ( internal::is_boundary(line) ) {
      current = -1;
      pending.clear();
      continue;
    }
    if ( line.entry_start ) {
      std::size_t first = i;
      while ( first > 0 && lines[first - 1].kind == LineKind::comment ) --first;
      current = line.section_start ? sections++ : -1;
      for ( std::size_t j = first; j <= i; ++j ) owner[j] = current;
      pending.clear();
      continue;
    }
    if ( line.kind == LineKind::blank ) continue;
    if ( line.kind == LineKind::comment && !line.text.empty()
      && line.text[0] == '#' )
    {
      pending.push_back( i );
      continue;
    }
    for ( std::size_t j : pending ) owner[j] = current;
    pending.clear();
    owner[i] = current;
  }

  std::vector< RenderedLine > out;
  int prev = -1;
  int blanks = 0;
  for ( std::size_t i = 0; i < lines.size(); ++i ) {
    const RenderedLine& line = lines[i];
    if ( line.kind == LineKind::blank ) {
      ++blanks;
      continue;
    }

    int target = 0;
    if ( prev >= 0 && !internal::is_boundary(lines[prev])
      && !internal::is_boundary(line) )
    {
      const bool comment = line.kind == LineKind::comment;
      target = comment ? blanks : ( blanks > 0 ? options.whitelines : 0 );

      const int a = owner[ prev ];
      const int b = owner[ i ];
      if ( (a != -1 && a != b) || (b != -1 && a != b) ) {
        target = internal::section_gap( options, blanks );
      }
      if ( comment && target > 0 ) target = options.comments_whitelines;
    }

    for ( int k = 0; k < target; ++k ) {
      RenderedLine blank;
      blank.kind = LineKind::blank;
      out.push_back( blank );
    }
    out.push_back( line );
    prev = static_cast< int >( i );
    blanks = 0;
  }
  lines = std::move( out );
}

inline std::string yamlfix::enforce_trailing_newline(
  const std::vector< RenderedLine >& lines )
{
  std::size_t end = lines.size();
  while ( end > 0 && lines[end - 1].text.empty() ) --end;

  std::string out;
  for ( std::size_t i = 0; i < end; ++i ) {
    out += lines[i].text;
    out += '\n';
  }
  return out;
}

inline void yamlfix::PassChain::run( Document& doc ) const {
  Tree& tree = *doc.tree;
  YAMLFIX_LOG_DEBUG << "Running source code fixers on document " << doc.index;

  fix_explicit_start( doc, options_ );
  fix_truthy_strings( tree );
  substitute_none( tree, options_ );
  remove_unneeded_quotes( tree, options_ );
  enforce_quotes( tree, options_ );
  reconcile_sequence_style( tree, options_, escaper_ );

  std::vector< RenderedLine > lines = render_document( doc, options_ );
  fix_comments( lines, options_ );
  fix_whitelines( lines, options_ );
  doc.rendered = enforce_trailing_newline( lines );

  doc.tree.reset();
}
