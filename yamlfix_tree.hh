// yamlfix: canonical YAML formatter
//  version 0.1.0 | MIT License
//  Comment-preserving round-trip tree and the indentation-driven parser that
//  builds it
#pragma once

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include "yamlfix_errors.hh"
#include "yamlfix_scan.hh"

namespace yamlfix {

  enum class NodeKind { Scalar, Mapping, Sequence, FlowMapping, Raw };

  enum class ScalarStyle { Plain, SingleQuoted, DoubleQuoted, Literal, Folded };

  // One blank or comment-only line attached to the node that follows it
  struct TriviaLine {
    bool blank = true;
    std::string text; // comment text starting at '#'
    int column = 0;   // original column of the '#'
  };

  using Trivia = std::vector< TriviaLine >;

  struct Node;
  using NodePtr = std::unique_ptr< Node >;

  struct MapEntry {
    Trivia leading;
    std::string key; // as authored, quotes included
    int line = 0;
    int column = 0;
    NodePtr value;
  };

  struct SeqItem {
    Trivia leading;
    NodePtr value;
  };

  // A node of the round-trip tree. Scalars keep their authored lines,
  // collections their children, and every node the comment that shares its
  // first line (last line for multi-line scalars).
  //
  //  Scalar       text holds the lines (plain, quoted) or the body relative
  //               to the body indentation (literal, folded; header in header)
  //  Sequence     items; flow tells [a, b] apart from a block sequence
  //  FlowMapping  text[0] holds the whole {...} collection
  //  Raw          text holds a multi-line flow collection with interior
  //               comments, kept as authored
  struct Node {
    NodeKind kind = NodeKind::Scalar;
    ScalarStyle style = ScalarStyle::Plain;
    bool flow = false;
    std::string properties; // anchor and/or tag, e.g. "&base !!map"
    std::vector< std::string > text;
    std::string header;
    std::string comment;
    int comment_gap = 1;
    Trivia leading; // comments between a key and a value on its own line
    std::vector< MapEntry > entries;
    std::vector< SeqItem > items;
    int line = 0;
    int column = 0;

    bool is_scalar() const { return kind == NodeKind::Scalar; }
    bool is_block_mapping() const { return kind == NodeKind::Mapping; }
    bool is_block_sequence() const
      { return kind == NodeKind::Sequence && !flow; }
    bool is_flow_sequence() const
      { return kind == NodeKind::Sequence && flow; }

    bool has_tag() const
      { return properties.find( '!' ) != std::string::npos; }

    bool is_plain() const
      { return kind == NodeKind::Scalar && style == ScalarStyle::Plain; }

    bool is_quoted() const {
      return kind == NodeKind::Scalar && ( style == ScalarStyle::SingleQuoted
        || style == ScalarStyle::DoubleQuoted );
    }

    // Plain or quoted scalar written on a single line
    bool is_single_line_scalar() const
      { return ( is_plain() || is_quoted() ) && text.size() == 1; }

    bool is_alias() const {
      return is_plain() && text.size() == 1 && !text[0].empty()
        && text[0][0] == '*';
    }

    bool is_null() const {
      if ( !is_plain() || has_tag() || text.size() > 1 ) return false;
      if ( text.empty() ) return true;
      const std::string& v = text[0];
      return v.empty() || v == "~" || v == "null" || v == "Null"
        || v == "NULL";
    }
  };

  struct Tree {
    Trivia leading;
    NodePtr root;
    Trivia trailing;
  };

namespace internal {

  // Key text without its quotes, used to compare keys
  inline std::string unquote_key( const std::string& key ) {
    if ( key.size() < 2 ) return key;
    const char q = key.front();
    if ( (q != '\'' && q != '"') || key.back() != q ) return key;

    std::string out;
    for ( std::size_t i = 1; i + 1 < key.size(); ++i ) {
      if ( q == '\'' && key[i] == '\'' && key[i + 1] == '\'' ) {
        out += '\'';
        ++i;
      }
      else if ( q == '"' && key[i] == '\\' && i + 2 < key.size() ) {
        out += key[ ++i ];
      }
      else out += key[i];
    }
    return out;
  }

  // Index of the '#' starting a comment after a plain scalar, or npos
  inline std::size_t find_plain_comment( const std::string& s ) {
    for ( std::size_t i = 1; i < s.size(); ++i ) {
      if ( s[i] == '#' && is_space(s[i - 1]) ) return i;
    }
    return npos;
  }

  // Splits the inside of a flow collection on its top-level commas
  inline std::vector< std::string > split_flow_items( const std::string& s ) {
    std::vector< std::string > out;
    std::string cur;
    int depth = 0;
    char q = 0;
    for ( std::size_t i = 0; i < s.size(); ++i ) {
      const char c = s[i];
      if ( q ) {
        cur += c;
        if ( q == '"' && c == '\\' && i + 1 < s.size() ) cur += s[ ++i ];
        else if ( q == '\'' && c == '\'' && i + 1 < s.size() && s[i + 1] == '\'' )
          cur += s[ ++i ];
        else if ( c == q ) q = 0;
        continue;
      }
      if ( (c == '\'' || c == '"') && ( i == 0 || is_space(s[i - 1])
        || s[i - 1] == '[' || s[i - 1] == '{' || s[i - 1] == ','
        || s[i - 1] == ':' ) ) q = c;
      else if ( c == '[' || c == '{' ) ++depth;
      else if ( c == ']' || c == '}' ) --depth;
      else if ( c == ',' && depth == 0 ) {
        out.push_back( cur );
        cur.clear();
        continue;
      }
      cur += c;
    }
    out.push_back( cur );
    return out;
  }

  // Strips leading anchor/tag tokens from `rest`. `gap` receives the spaces
  // that preceded whatever is left.
  inline std::string take_properties( std::string& rest, int& gap ) {
    std::string props;
    while ( !rest.empty() && (rest[0] == '&' || rest[0] == '!') ) {
      std::size_t end = 0;
      while ( end < rest.size() && !is_space(rest[end]) ) ++end;
      props += ( props.empty() ? "" : " " ) + rest.substr( 0, end );
      rest = rest.substr( end );
      std::size_t ws = 0;
      while ( ws < rest.size() && is_space(rest[ws]) ) ++ws;
      gap = static_cast< int >( ws );
      rest = rest.substr( ws );
    }
    return props;
  }

} // namespace yamlfix::internal

  // Builds a Tree from the body of one document. Line numbers reported in
  // errors are relative to the whole file when first_line is set.
  class TreeParser {
  public:
    explicit TreeParser( int first_line = 1 ) : first_line_( first_line ) {}

    // marker_content is whatever followed '---' on the marker line
    Tree parse( const std::string& text,
      const std::string& marker_content = std::string() );

  private:
    struct Line {
      std::string raw;
      std::string content; // text after the indentation, right-trimmed
      int indent = 0;
      int number = 0;
      bool blank = false;
      bool comment = false;
      bool tab_indent = false;
    };

    void lex( const std::string& text, const std::string& marker_content );
    Trivia collect_trivia();
    std::size_t next_content( std::size_t from ) const;
    const Line& line_at( std::size_t index ) const;

    NodePtr parse_node( int owner, bool in_sequence );
    NodePtr parse_mapping( int indent );
    NodePtr parse_sequence( int indent );
    NodePtr parse_value( std::string rest, int owner, bool in_sequence,
      int column );
    NodePtr parse_nested( NodePtr node, int owner, bool in_sequence );
    NodePtr parse_block_scalar( NodePtr node, const std::string& rest,
      int owner );
    NodePtr parse_flow( NodePtr node, const std::string& rest );
    NodePtr parse_quoted( NodePtr node, const std::string& rest );
    NodePtr parse_plain( NodePtr node, const std::string& rest, int owner );

    void fill_flow_sequence( Node& node, const std::string& text ) const;
    NodePtr parse_flow_item( std::string text, int line, int column ) const;

    [[noreturn]] void fail( const std::string& msg, int line,
      int column ) const;

    std::vector< Line > lines_;
    std::size_t pos_ = 0;
    int first_line_;
  };

} // namespace yamlfix

inline void yamlfix::TreeParser::lex( const std::string& text,
  const std::string& marker_content )
{
  using namespace internal;
  lines_.clear();

  // Content sharing the '---' line becomes a virtual first line
  if ( !trim(marker_content).empty() ) {
    Line l;
    l.raw = trim( marker_content );
    l.content = l.raw;
    l.number = first_line_ - 1;
    l.comment = l.content[0] == '#';
    lines_.push_back( l );
  }

  std::size_t start = 0;
  int number = first_line_;
  while ( start < text.size() ) {
    std::size_t eol = text.find( '\n', start );
    std::string raw = text.substr( start,
      eol == npos ? npos : eol - start );
    if ( !raw.empty() && raw.back() == '\r' ) raw.pop_back();

    Line l;
    l.raw = raw;
    l.number = number++;
    l.blank = is_blank( raw );
    l.indent = count_indent( raw );
    if ( !l.blank ) {
      std::string lead = raw.substr( l.indent );
      l.tab_indent = lead[0] == '\t';
      l.content = rtrim( ltrim(lead) );
      l.comment = l.content[0] == '#';
    }
    lines_.push_back( l );

    if ( eol == npos ) break;
    start = eol + 1;
  }
}

inline yamlfix::Tree yamlfix::TreeParser::parse( const std::string& text,
  const std::string& marker_content )
{
  lex( text, marker_content );
  pos_ = 0;

  Tree tree;
  tree.leading = collect_trivia();
  if ( pos_ >= lines_.size() ) {
    tree.root = std::make_unique< Node >();
    return tree;
  }

  tree.root = parse_node( -1, false );
  tree.trailing = collect_trivia();
  if ( pos_ < lines_.size() ) {
    const Line& l = lines_[ pos_ ];
    fail( "unexpected content '" + l.content + "' after the document root",
      l.number, l.indent );
  }
  return tree;
}

inline yamlfix::Trivia yamlfix::TreeParser::collect_trivia() {
  Trivia out;
  while ( pos_ < lines_.size()
    && (lines_[pos_].blank || lines_[pos_].comment) )
  {
    const Line& l = lines_[ pos_++ ];
    TriviaLine t;
    t.blank = l.blank;
    if ( !l.blank ) {
      t.text = l.content;
      t.column = static_cast< int >( l.raw.find('#') );
    }
    out.push_back( t );
  }
  return out;
}

inline std::size_t yamlfix::TreeParser::next_content( std::size_t from ) const
{
  while ( from < lines_.size() && (lines_[from].blank || lines_[from].comment) )
  {
    ++from;
  }
  return from;
}

inline const yamlfix::TreeParser::Line& yamlfix::TreeParser::line_at(
  std::size_t index ) const
{
  const Line& l = lines_.at( index );
  if ( l.tab_indent ) {
    fail( "found a tab character where an indentation space is expected",
      l.number, l.indent );
  }
  return l;
}

[[noreturn]] inline void yamlfix::TreeParser::fail( const std::string& msg,
  int line, int column ) const
{
  throw ParseError( msg, line, column + 1 );
}

// Dispatches on the next content line: block sequence, block mapping, or a
// scalar / flow node standing on its own line
inline yamlfix::NodePtr yamlfix::TreeParser::parse_node( int owner,
  bool in_sequence )
{
  using namespace internal;
  const Line& l = line_at( next_content(pos_) );

  if ( is_sequence_entry(l.content) ) return parse_sequence( l.indent );
  if ( l.content == "?" || starts_with(l.content, "? ") ) {
    fail( "complex mapping keys are not supported", l.number, l.indent );
  }
  if ( find_mapping_separator(l.content) != npos ) {
    return parse_mapping( l.indent );
  }

  Trivia lead = collect_trivia();
  NodePtr node = parse_value( l.content, owner, in_sequence, l.indent );
  node->leading.insert( node->leading.begin(), lead.begin(), lead.end() );
  return node;
}

inline yamlfix::NodePtr yamlfix::TreeParser::parse_mapping( int indent ) {
  using namespace internal;
  auto node = std::make_unique< Node >();
  node->kind = NodeKind::Mapping;

  while ( true ) {
    const std::size_t save = pos_;
    Trivia lead = collect_trivia();
    if ( pos_ >= lines_.size() ) { pos_ = save; break; }

    const Line& l = line_at( pos_ );
    if ( l.indent < indent ) { pos_ = save; break; }
    if ( l.indent > indent ) {
      fail( "bad indentation of a mapping entry", l.number, l.indent );
    }

    const std::string content = l.content;
    if ( is_sequence_entry(content) ) {
      fail( "expected a mapping key, found a sequence entry", l.number,
        l.indent );
    }
    if ( content == "?" || starts_with(content, "? ") ) {
      fail( "complex mapping keys are not supported", l.number, l.indent );
    }

    const std::size_t sep = find_mapping_separator( content );
    if ( sep == npos ) {
      fail( "could not find expected ':'", l.number, l.indent );
    }

    MapEntry entry;
    entry.leading = std::move( lead );
    entry.key = rtrim( content.substr(0, sep) );
    entry.line = l.number;
    entry.column = l.indent + 1;
    if ( entry.key.empty() ) {
      fail( "empty mapping key", l.number, l.indent );
    }
    if ( node->entries.empty() ) {
      node->line = l.number;
      node->column = l.indent + 1;
    }

    entry.value = parse_value( content.substr(sep + 1), indent, false,
      l.indent + static_cast< int >( sep ) + 2 );
    node->entries.push_back( std::move(entry) );
  }
  return node;
}

inline yamlfix::NodePtr yamlfix::TreeParser::parse_sequence( int indent ) {
  using namespace internal;
  auto node = std::make_unique< Node >();
  node->kind = NodeKind::Sequence;

  while ( true ) {
    const std::size_t save = pos_;
    Trivia lead = collect_trivia();
    if ( pos_ >= lines_.size() ) { pos_ = save; break; }

    const Line& l = line_at( pos_ );
    if ( l.indent < indent
      || (l.indent == indent && !is_sequence_entry(l.content)) )
    {
      pos_ = save;
      break;
    }
    if ( l.indent > indent ) {
      fail( "bad indentation of a sequence entry", l.number, l.indent );
    }

    const int dash = l.indent;
    if ( node->items.empty() ) {
      node->line = l.number;
      node->column = dash + 1;
    }

    const std::string rest = l.content.substr( 1 );
    std::size_t ws = 0;
    while ( ws < rest.size() && is_space(rest[ws]) ) ++ws;
    const std::string body = rest.substr( ws );

    SeqItem item;
    item.leading = std::move( lead );

    const bool compact = !body.empty() && body[0] != '#'
      && ( is_sequence_entry(body) || find_mapping_separator(body) != npos
      || body == "?" || starts_with(body, "? ") );
    if ( compact ) {
      // "- key: value" and "- - item": reparse the remainder in place as a
      // line indented to the item content column
      lines_[ pos_ ].content = body;
      lines_[ pos_ ].indent = dash + 1 + static_cast< int >( ws );
      item.value = parse_node( dash, true );
    }
    else {
      item.value = parse_value( rest, dash, true,
        dash + 1 + static_cast< int >( ws ) );
    }
    node->items.push_back( std::move(item) );
  }
  return node;
}

// Parses the value starting at `rest` on the current line, consuming every
// line that belongs to it. `owner` is the indentation of the key or dash.
inline yamlfix::NodePtr yamlfix::TreeParser::parse_value( std::string rest,
  int owner, bool in_sequence, int column )
{
  using namespace internal;
  auto node = std::make_unique< Node >();
  node->line = lines_[ pos_ ].number;
  node->column = column + 1;

  std::size_t ws = 0;
  while ( ws < rest.size() && is_space(rest[ws]) ) ++ws;
  int gap = static_cast< int >( ws );
  rest = rtrim( rest.substr(ws) );

  // 1) Anchor and tag
  node->properties = take_properties( rest, gap );

  // 2) Nothing on this line but a comment: nested block or null
  if ( rest.empty() || rest[0] == '#' ) {
    if ( !rest.empty() ) {
      node->comment = rest;
      node->comment_gap = std::max( gap, 1 );
    }
    ++pos_;
    return parse_nested( std::move(node), owner, in_sequence );
  }

  // 3) Everything else is a scalar or flow node starting here
  switch ( rest[0] ) {
    case '|':
    case '>':
      return parse_block_scalar( std::move(node), rest, owner );
    case '[':
    case '{':
      return parse_flow( std::move(node), rest );
    case '"':
    case '\'':
      return parse_quoted( std::move(node), rest );
    default:
      break;
  }
  if ( rest == "?" || starts_with(rest, "? ") ) {
    fail( "complex mapping keys are not supported", node->line, column );
  }
  return parse_plain( std::move(node), rest, owner );
}

inline yamlfix::NodePtr yamlfix::TreeParser::parse_nested( NodePtr node,
  int owner, bool in_sequence )
{
  using namespace internal;
  const std::size_t k = next_content( pos_ );
  if ( k >= lines_.size() ) return node;

  const Line& next = line_at( k );
  const int next_indent = next.indent;
  const bool deeper = next_indent > owner;
  const bool sibling_sequence = !in_sequence && next_indent == owner
    && is_sequence_entry( next.content );
  if ( !deeper && !sibling_sequence ) return node;

  NodePtr child = parse_node( owner, in_sequence );

  if ( !node->properties.empty() ) {
    child->properties = node->properties
      + ( child->properties.empty() ? "" : " " + child->properties );
  }

  if ( !node->comment.empty() ) {
    const bool block = child->kind == NodeKind::Mapping
      || child->is_block_sequence();
    if ( block && child->comment.empty() ) {
      child->comment = node->comment;
      child->comment_gap = node->comment_gap;
    }
    else {
      // A scalar below its key keeps the key line comment just above it
      TriviaLine t;
      t.blank = false;
      t.text = node->comment;
      t.column = next_indent;
      child->leading.insert( child->leading.begin(), t );
    }
  }
  child->line = node->line;
  return child;
}

inline yamlfix::NodePtr yamlfix::TreeParser::parse_block_scalar( NodePtr node,
  const std::string& rest, int owner )
{
  using namespace internal;
  std::size_t end = 0;
  while ( end < rest.size() && !is_space(rest[end]) ) ++end;
  const std::string header = rest.substr( 0, end );
  if ( !is_block_scalar_header(header) ) {
    fail( "invalid block scalar header '" + header + "'", node->line,
      node->column - 1 );
  }

  std::size_t ws = end;
  while ( ws < rest.size() && is_space(rest[ws]) ) ++ws;
  if ( ws < rest.size() ) {
    if ( rest[ws] != '#' ) {
      fail( "unexpected text after a block scalar header", node->line,
        node->column - 1 );
    }
    node->comment = rest.substr( ws );
    node->comment_gap = static_cast< int >( ws - end );
  }

  node->style = header[0] == '|' ? ScalarStyle::Literal : ScalarStyle::Folded;
  node->header = header;
  ++pos_;

  int indicator = 0;
  char chomping = 0;
  for ( char c : header.substr(1) ) {
    if ( c >= '1' && c <= '9' ) indicator = c - '0';
    else chomping = c;
  }

  // Body indentation: explicit, or that of the first non-blank line
  int body_indent = owner + indicator;
  bool has_body = indicator > 0;
  if ( !has_body ) {
    std::size_t k = pos_;
    while ( k < lines_.size() && is_blank(lines_[k].raw) ) ++k;
    if ( k < lines_.size() ) {
      body_indent = count_indent( lines_[k].raw );
      has_body = body_indent > owner;
    }
  }
  body_indent = std::max( body_indent, 0 );

  std::vector< std::string > body;
  while ( has_body && pos_ < lines_.size() ) {
    const std::string& raw = lines_[ pos_ ].raw;
    if ( is_blank(raw) ) {
      body.push_back( static_cast< int >( raw.size() ) > body_indent
        ? raw.substr( body_indent ) : std::string() );
      ++pos_;
      continue;
    }
    if ( count_indent(raw) < body_indent ) break;
    body.push_back( raw.substr(body_indent) );
    ++pos_;
  }

  // Trailing blank lines belong to the scalar only with keep chomping
  if ( chomping != '+' ) {
    while ( !body.empty() && is_blank(body.back()) ) {
      body.pop_back();
      --pos_;
    }
  }

  node->text = std::move( body );
  return node;
}

inline yamlfix::NodePtr yamlfix::TreeParser::parse_flow( NodePtr node,
  const std::string& rest )
{
  using namespace internal;
  const char open = rest[0];

  std::vector< std::string > raw_lines;
  std::string joined;
  std::string tail;
  bool interior_comment = false;
  bool closed = false;
  int depth = 0;
  char q = 0;

  std::string line = rest;
  while ( true ) {
    std::string code;
    for ( std::size_t i = 0; i < line.size(); ++i ) {
      const char c = line[i];
      if ( q ) {
        code += c;
        if ( q == '"' && c == '\\' && i + 1 < line.size() ) code += line[ ++i ];
        else if ( q == '\'' && c == '\'' && i + 1 < line.size()
          && line[i + 1] == '\'' ) code += line[ ++i ];
        else if ( c == q ) q = 0;
        continue;
      }
      if ( c == '#' && (i == 0 || is_space(line[i - 1])) ) {
        interior_comment = true;
        break;
      }
      if ( (c == '\'' || c == '"') && ( i == 0 || is_space(line[i - 1])
        || line[i - 1] == '[' || line[i - 1] == '{' || line[i - 1] == ','
        || line[i - 1] == ':' ) ) q = c;
      else if ( c == '[' || c == '{' ) ++depth;
      else if ( c == ']' || c == '}' ) {
        if ( --depth == 0 ) {
          code += c;
          tail = line.substr( i + 1 );
          closed = true;
          break;
        }
      }
      code += c;
    }

    raw_lines.push_back( trim(line) );
    const std::string piece = trim( code );
    if ( !piece.empty() ) joined += ( joined.empty() ? "" : " " ) + piece;
    ++pos_;
    if ( closed ) break;
    if ( pos_ >= lines_.size() ) {
      fail( "unterminated flow collection", node->line, node->column - 1 );
    }
    line = lines_[ pos_ ].raw;
  }

  std::size_t ws = 0;
  while ( ws < tail.size() && is_space(tail[ws]) ) ++ws;
  const std::string after = rtrim( tail.substr(ws) );
  if ( !after.empty() ) {
    if ( after[0] != '#' ) {
      fail( "unexpected text after a flow collection", node->line,
        node->column - 1 );
    }
    if ( !interior_comment ) {
      node->comment = after;
      node->comment_gap = std::max( static_cast< int >( ws ), 1 );
    }
  }

  if ( interior_comment ) {
    node->kind = NodeKind::Raw;
    node->text = std::move( raw_lines );
    return node;
  }

  if ( open == '[' ) fill_flow_sequence( *node, joined );
  else {
    node->kind = NodeKind::FlowMapping;
    node->text = { joined };
  }
  return node;
}

inline void yamlfix::TreeParser::fill_flow_sequence( Node& node,
  const std::string& text ) const
{
  using namespace internal;
  if ( text.size() < 2 || text.back() != ']' ) {
    fail( "malformed flow sequence", node.line, node.column - 1 );
  }

  node.kind = NodeKind::Sequence;
  node.flow = true;

  const auto pieces = split_flow_items( text.substr(1, text.size() - 2) );
  for ( std::size_t i = 0; i < pieces.size(); ++i ) {
    std::string piece = trim( pieces[i] );
    if ( piece.empty() ) {
      // "[]" and a trailing comma carry no item
      if ( i + 1 == pieces.size() ) continue;
      fail( "expected the node content, but found ','", node.line,
        node.column - 1 );
    }
    SeqItem item;
    item.value = parse_flow_item( piece, node.line, node.column );
    node.items.push_back( std::move(item) );
  }
}

inline yamlfix::NodePtr yamlfix::TreeParser::parse_flow_item(
  std::string text, int line, int column ) const
{
  using namespace internal;
  auto item = std::make_unique< Node >();
  item->line = line;
  item->column = column;

  int gap = 0;
  item->properties = take_properties( text, gap );

  if ( text.empty() ) return item;

  switch ( text[0] ) {
    case '[':
      fill_flow_sequence( *item, text );
      return item;
    case '{':
      item->kind = NodeKind::FlowMapping;
      item->text = { text };
      return item;
    case '\'':
      item->style = ScalarStyle::SingleQuoted;
      break;
    case '"':
      item->style = ScalarStyle::DoubleQuoted;
      break;
    default:
      // A single "key: value" pair is kept whole
      if ( find_mapping_separator(text) != npos ) {
        item->kind = NodeKind::FlowMapping;
        item->text = { text };
        return item;
      }
      break;
  }
  item->text = { text };
  return item;
}

inline yamlfix::NodePtr yamlfix::TreeParser::parse_quoted( NodePtr node,
  const std::string& rest )
{
  using namespace internal;
  const char q = rest[0];
  std::vector< std::string > lines;

  std::string cur = rest;
  std::size_t close = find_closing_quote( cur, 1, q );
  while ( close == npos ) {
    lines.push_back( rtrim(cur) );
    ++pos_;
    if ( pos_ >= lines_.size() ) {
      fail( "unterminated quoted scalar", node->line, node->column - 1 );
    }
    cur = trim( lines_[pos_].raw );
    close = find_closing_quote( cur, 0, q );
  }
  lines.push_back( cur.substr(0, close + 1) );

  const std::string tail = cur.substr( close + 1 );
  std::size_t ws = 0;
  while ( ws < tail.size() && is_space(tail[ws]) ) ++ws;
  const std::string after = rtrim( tail.substr(ws) );
  if ( !after.empty() ) {
    if ( after[0] != '#' ) {
      fail( "unexpected text after a quoted scalar", lines_[pos_].number,
        static_cast< int >( close ) );
    }
    node->comment = after;
    node->comment_gap = std::max( static_cast< int >( ws ), 1 );
  }
  ++pos_;

  node->style = q == '\'' ? ScalarStyle::SingleQuoted
    : ScalarStyle::DoubleQuoted;
  node->text = std::move( lines );
  return node;
}

inline yamlfix::NodePtr yamlfix::TreeParser::parse_plain( NodePtr node,
  const std::string& rest, int owner )
{
  using namespace internal;

  auto take_comment = [&node]( const std::string& s, std::size_t at ) {
    const std::string code = rtrim( s.substr(0, at) );
    node->comment = rtrim( s.substr(at) );
    node->comment_gap = static_cast< int >( at - code.size() );
  };

  std::size_t c = find_plain_comment( rest );
  const std::string code = rtrim( rest.substr(0, c) );
  if ( find_mapping_separator(code) != npos ) {
    fail( "mapping values are not allowed in this context", node->line,
      node->column - 1 );
  }
  node->text = { code };
  if ( c != npos ) take_comment( rest, c );
  ++pos_;

  // Continuation lines of a multi-line plain scalar
  while ( c == npos ) {
    std::size_t k = pos_;
    while ( k < lines_.size() && lines_[k].blank ) ++k;
    if ( k >= lines_.size() ) break;

    const Line& l = lines_[ k ];
    if ( l.comment || l.tab_indent || l.indent <= owner ) break;
    if ( find_mapping_separator(l.content) != npos ) break;

    for ( std::size_t j = pos_; j < k; ++j ) node->text.push_back( "" );
    c = find_plain_comment( l.content );
    node->text.push_back( rtrim(l.content.substr(0, c)) );
    if ( c != npos ) take_comment( l.content, c );
    pos_ = k + 1;
  }
  return node;
}
