// yamlfix: canonical YAML formatter
//  version 0.1.0 | MIT License
//  Renders a round-trip tree into classified output lines
#pragma once

#include <algorithm>
#include <string>
#include <vector>

#include "yamlfix_config.hh"
#include "yamlfix_scan.hh"
#include "yamlfix_tree.hh"

namespace yamlfix {

  enum class LineKind { directive, marker, content, comment, blank,
    scalar_body };

  struct RenderedLine {
    std::string text;
    LineKind kind = LineKind::content;
    std::size_t comment_pos = std::string::npos; // '#' of an inline comment
    bool entry_start = false;   // key line of a top-level mapping entry
    bool section_start = false; // ... whose value is an indented block
  };

  // Column arithmetic shared by the emitter and the sequence reconciler
  struct Layout {
    int mapping;
    int sequence;
    int offset;

    explicit Layout( const FormatOptions& options )
      : mapping( options.indent_mapping ),
      sequence( options.indent_sequence ), offset( options.indent_offset ) {}

    // Column of the keys of a mapping nested under a key at `indent`
    int child( int indent ) const { return indent + mapping; }

    // Column of the dashes of a block sequence under a key at `indent`
    int dash( int indent ) const { return indent + offset; }

    // Column of the item content for dashes at `dash`
    int item( int dash ) const
      { return dash + std::max( sequence - offset, 2 ); }
  };

  class Emitter {
  public:
    explicit Emitter( const FormatOptions& options )
      : options_( options ), layout_( options ) {}

    std::vector< RenderedLine > emit( const Tree& tree ) const;

    // Single-line flow rendering of a node, properties excluded
    std::string render_flow( const Node& node ) const;

    // The single line "<indent><key>: [a, b]" of a flow sequence entry
    std::string flow_line( const MapEntry& entry, int indent ) const;

    int flow_width( const MapEntry& entry, int indent ) const
      { return static_cast< int >( flow_line(entry, indent).size() ); }

    const Layout& layout() const { return layout_; }

  private:
    using Lines = std::vector< RenderedLine >;

    void push( Lines& out, std::string text, LineKind kind,
      const std::string& comment = std::string(), int gap = 1 ) const;
    void emit_trivia( const Trivia& trivia, int indent, Lines& out ) const;
    void emit_mapping( const Node& map, int indent,
      const std::string& first_prefix, bool top_level, Lines& out ) const;
    void emit_sequence( const Node& seq, int dash,
      const std::string& first_prefix, Lines& out ) const;
    void emit_entry_value( const std::string& head, const Node& value,
      int indent, Lines& out ) const;
    void emit_item_value( const std::string& dash_head,
      const std::string& gap, const Node& value, int dash, int content,
      Lines& out ) const;
    void emit_detached( const std::string& head, const std::string& sep,
      const Node& value, int owner, int cont, Lines& out ) const;
    void emit_inline( const std::string& head, const std::string& sep,
      const Node& value, const std::string& props, int owner, int cont,
      Lines& out ) const;
    void emit_lines( const std::string& first, const Node& value, int cont,
      Lines& out ) const;
    bool foldable( const Node& value, int cont ) const;

    const FormatOptions& options_;
    Layout layout_;
  };

namespace internal {

  // Rewrites the indentation indicator of a block scalar header
  inline std::string adjust_indicator( const std::string& header,
    int relative )
  {
    std::string out = header;
    for ( char& c : out ) {
      if ( c >= '1' && c <= '9' && relative >= 1 && relative <= 9 ) {
        c = static_cast< char >( '0' + relative );
      }
    }
    return out;
  }

  inline std::vector< std::string > split_words( const std::string& line ) {
    std::vector< std::string > words;
    std::size_t start = 0;
    while ( start <= line.size() ) {
      std::size_t sp = line.find( ' ', start );
      if ( sp == npos ) {
        words.push_back( line.substr(start) );
        break;
      }
      words.push_back( line.substr(start, sp - start) );
      start = sp + 1;
    }
    return words;
  }

} // namespace yamlfix::internal

} // namespace yamlfix

inline void yamlfix::Emitter::push( Lines& out, std::string text,
  LineKind kind, const std::string& comment, int gap ) const
{
  RenderedLine line;
  line.kind = kind;
  if ( !comment.empty() ) {
    text += internal::pad( std::max(gap, 1) );
    line.comment_pos = text.size();
    text += comment;
  }
  line.text = std::move( text );
  out.push_back( std::move(line) );
}

// Comments at column 0 stay there, others follow the entry they precede.
// A negative indent keeps every comment at its original column.
inline void yamlfix::Emitter::emit_trivia( const Trivia& trivia, int indent,
  Lines& out ) const
{
  for ( const auto& t : trivia ) {
    if ( t.blank ) {
      push( out, std::string(), LineKind::blank );
      continue;
    }
    int column = indent < 0 ? t.column : ( t.column == 0 ? 0 : indent );
    RenderedLine line;
    line.kind = LineKind::comment;
    line.text = internal::pad( column ) + t.text;
    line.comment_pos = static_cast< std::size_t >( column );
    out.push_back( std::move(line) );
  }
}

inline std::vector< yamlfix::RenderedLine > yamlfix::Emitter::emit(
  const Tree& tree ) const
{
  Lines out;
  emit_trivia( tree.leading, 0, out );

  const Node& root = *tree.root;
  const bool block = root.is_block_mapping()
    || ( root.is_block_sequence() && !root.items.empty() );

  if ( block ) {
    if ( !root.properties.empty() || !root.comment.empty() ) {
      push( out, root.properties, LineKind::content, root.comment,
        root.properties.empty() ? 0 : root.comment_gap );
    }
    if ( root.is_block_mapping() ) emit_mapping( root, 0, "", true, out );
    else emit_sequence( root, 0, "", out );
  }
  else if ( !(root.is_null() && root.text.empty() && root.properties.empty()
    && root.comment.empty()) )
  {
    emit_detached( "", "", root, -1, 0, out );
  }

  emit_trivia( tree.trailing, -1, out );
  return out;
}

inline void yamlfix::Emitter::emit_mapping( const Node& map, int indent,
  const std::string& first_prefix, bool top_level, Lines& out ) const
{
  for ( std::size_t i = 0; i < map.entries.size(); ++i ) {
    const MapEntry& entry = map.entries[i];
    emit_trivia( entry.leading, indent, out );

    const std::string head = ( i == 0 && !first_prefix.empty()
      ? first_prefix : internal::pad(indent) ) + entry.key + ":";
    const std::size_t mark = out.size();
    emit_entry_value( head, *entry.value, indent, out );

    if ( top_level && mark < out.size() ) {
      const Node& v = *entry.value;
      out[mark].entry_start = true;
      out[mark].section_start = v.is_block_mapping()
        || ( v.is_block_sequence() && !v.items.empty() );
    }
  }
}

inline void yamlfix::Emitter::emit_sequence( const Node& seq, int dash,
  const std::string& first_prefix, Lines& out ) const
{
  const int content = layout_.item( dash );
  const std::string gap = internal::pad( content - dash - 1 );

  for ( std::size_t i = 0; i < seq.items.size(); ++i ) {
    const SeqItem& item = seq.items[i];
    emit_trivia( item.leading, dash, out );

    const std::string dash_head = ( i == 0 && !first_prefix.empty()
      ? first_prefix : internal::pad(dash) ) + "-";
    emit_item_value( dash_head, gap, *item.value, dash, content, out );
  }
}

inline void yamlfix::Emitter::emit_entry_value( const std::string& head,
  const Node& value, int indent, Lines& out ) const
{
  const std::string props = value.properties.empty() ? ""
    : " " + value.properties;

  if ( value.is_block_mapping() ) {
    push( out, head + props, LineKind::content, value.comment,
      value.comment_gap );
    emit_mapping( value, layout_.child(indent), "", false, out );
    return;
  }
  if ( value.is_block_sequence() && !value.items.empty() ) {
    push( out, head + props, LineKind::content, value.comment,
      value.comment_gap );
    emit_sequence( value, layout_.dash(indent), "", out );
    return;
  }
  emit_detached( head, " ", value, indent, layout_.child(indent), out );
}

inline void yamlfix::Emitter::emit_item_value( const std::string& dash_head,
  const std::string& gap, const Node& value, int dash, int content,
  Lines& out ) const
{
  const bool bare = value.properties.empty() && value.comment.empty();
  const std::string props = value.properties.empty() ? ""
    : " " + value.properties;

  if ( value.is_block_mapping() ) {
    if ( bare && value.entries.front().leading.empty() ) {
      emit_mapping( value, content, dash_head + gap, false, out );
    }
    else {
      push( out, dash_head + props, LineKind::content, value.comment,
        value.comment_gap );
      emit_mapping( value, content, "", false, out );
    }
    return;
  }

  if ( value.is_block_sequence() && !value.items.empty() ) {
    if ( bare && value.items.front().leading.empty() ) {
      emit_sequence( value, content, dash_head + gap, out );
    }
    else {
      push( out, dash_head + props, LineKind::content, value.comment,
        value.comment_gap );
      emit_sequence( value, content, "", out );
    }
    return;
  }

  emit_detached( dash_head, gap, value, dash, content, out );
}

// A scalar or flow node whose leading comments force it onto its own line
// below the key or dash
inline void yamlfix::Emitter::emit_detached( const std::string& head,
  const std::string& sep, const Node& value, int owner, int cont,
  Lines& out ) const
{
  if ( value.leading.empty() ) {
    emit_inline( head, sep, value, value.properties, owner, cont, out );
    return;
  }

  const std::string line = head + ( value.properties.empty() ? ""
    : (sep.empty() ? "" : sep) + value.properties );
  if ( !line.empty() ) push( out, line, LineKind::content );
  emit_trivia( value.leading, cont, out );
  emit_inline( internal::pad(cont), "", value, "", owner, cont, out );
}

inline void yamlfix::Emitter::emit_inline( const std::string& head,
  const std::string& sep, const Node& value, const std::string& props,
  int owner, int cont, Lines& out ) const
{
  const std::string first = head + sep + ( props.empty() ? "" : props + " " );

  switch ( value.kind ) {
    case NodeKind::Mapping:
    case NodeKind::Sequence:
      // Flow sequences, and the empty block collections they stand in for
      push( out, first + render_flow(value), LineKind::content,
        value.comment, value.comment_gap );
      return;
    case NodeKind::FlowMapping:
      push( out, first + value.text.front(), LineKind::content,
        value.comment, value.comment_gap );
      return;
    case NodeKind::Raw:
      emit_lines( first, value, cont, out );
      return;
    case NodeKind::Scalar:
      break;
  }

  if ( value.is_plain() && value.text.empty() ) {
    push( out, head + ( props.empty() ? "" : sep + props ),
      LineKind::content, value.comment, value.comment_gap );
    return;
  }

  if ( value.style == ScalarStyle::Literal
    || value.style == ScalarStyle::Folded )
  {
    push( out, first + internal::adjust_indicator(value.header, cont - owner),
      LineKind::content, value.comment, value.comment_gap );
    for ( const auto& body : value.text ) {
      push( out, body.empty() ? body : internal::pad(cont) + body,
        LineKind::scalar_body );
    }
    return;
  }

  if ( foldable(value, cont) ) {
    // Greedy refill: break before a word once the line is past the width
    std::vector< std::string > words;
    for ( const auto& l : value.text ) {
      for ( auto& w : internal::split_words(l) ) words.push_back( w );
    }
    std::string line = first + words.front();
    LineKind kind = LineKind::content;
    for ( std::size_t i = 1; i < words.size(); ++i ) {
      if ( static_cast< int >( line.size() ) > options_.line_length ) {
        push( out, line, kind );
        kind = LineKind::scalar_body;
        line = internal::pad( cont ) + words[i];
      }
      else line += " " + words[i];
    }
    push( out, line, kind, value.comment, value.comment_gap );
    return;
  }

  emit_lines( first, value, cont, out );
}

// First line after the key, continuation lines re-indented to `cont`
inline void yamlfix::Emitter::emit_lines( const std::string& first,
  const Node& value, int cont, Lines& out ) const
{
  const auto& text = value.text;
  for ( std::size_t i = 0; i < text.size(); ++i ) {
    std::string line = i == 0 ? first + text[i]
      : ( text[i].empty() ? std::string() : internal::pad(cont) + text[i] );
    const LineKind kind = i == 0 ? LineKind::content : LineKind::scalar_body;
    if ( i + 1 == text.size() ) {
      push( out, line, kind, value.comment, value.comment_gap );
    }
    else push( out, line, kind );
  }
}

// Plain multi-word scalars are refilled unless their spacing is significant
inline bool yamlfix::Emitter::foldable( const Node& value, int cont ) const {
  if ( !value.is_plain() || value.text.empty() || cont <= 0
    || value.is_alias() ) return false;
  for ( const auto& l : value.text ) {
    if ( l.empty() || l.find("  ") != std::string::npos
      || l.find('\t') != std::string::npos ) return false;
  }
  return true;
}

inline std::string yamlfix::Emitter::render_flow( const Node& node ) const {
  switch ( node.kind ) {
    case NodeKind::Mapping:
      return "{}";
    case NodeKind::Sequence: {
      std::string out = "[";
      for ( std::size_t i = 0; i < node.items.size(); ++i ) {
        const Node& item = *node.items[i].value;
        if ( i > 0 ) out += ", ";
        if ( !item.properties.empty() ) out += item.properties + " ";
        out += render_flow( item );
      }
      return out + "]";
    }
    default: {
      std::string out;
      for ( const auto& l : node.text ) {
        if ( l.empty() ) continue;
        if ( !out.empty() ) out += ' ';
        out += l;
      }
      return out;
    }
  }
}

inline std::string yamlfix::Emitter::flow_line( const MapEntry& entry,
  int indent ) const
{
  const Node& v = *entry.value;
  std::string line = internal::pad( indent ) + entry.key + ": ";
  if ( !v.properties.empty() ) line += v.properties + " ";
  return line + render_flow( v );
}
