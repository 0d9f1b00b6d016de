// yamlfix: canonical YAML formatter
//  version 0.1.0 | MIT License
//  Splits a multi-document stream on its markers and joins it back
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "yamlfix_scan.hh"
#include "yamlfix_tree.hh"

namespace yamlfix {

  struct Document {
    std::size_t index = 0;
    int first_line = 1; // file line of the first body line
    std::vector< std::string > preamble;   // comment lines before '---'
    std::vector< std::string > directives; // '%' lines
    bool explicit_start = false;
    std::string marker_content;  // node text sharing the '---' line
    std::string marker_comment;  // comment sharing the '---' line
    std::string text;            // body
    bool last = true;            // no document follows in the stream
    std::unique_ptr< Tree > tree;
    std::string rendered;

    // Nothing but blank lines
    bool empty() const {
      if ( !directives.empty() || !marker_content.empty()
        || !marker_comment.empty() ) return false;
      for ( const auto& l : preamble ) {
        if ( !internal::is_blank(l) ) return false;
      }
      std::size_t start = 0;
      while ( start < text.size() ) {
        std::size_t eol = text.find( '\n', start );
        if ( !internal::is_blank(text.substr(start,
          eol == std::string::npos ? std::string::npos : eol - start)) )
          return false;
        if ( eol == std::string::npos ) break;
        start = eol + 1;
      }
      return true;
    }

    // Any body line that is not blank or a comment
    bool has_content() const {
      if ( !marker_content.empty() ) return true;
      std::size_t start = 0;
      while ( start < text.size() ) {
        std::size_t eol = text.find( '\n', start );
        const std::string line = internal::trim( text.substr(start,
          eol == std::string::npos ? std::string::npos : eol - start) );
        if ( !line.empty() && line[0] != '#' ) return true;
        if ( eol == std::string::npos ) break;
        start = eol + 1;
      }
      return false;
    }
  };

namespace internal {

  // The value part of a content line: after any "- " prefixes, the key and
  // the node properties
  inline std::string value_part( const std::string& content ) {
    std::string v = trim( content );
    while ( is_sequence_entry(v) ) v = ltrim( v.substr(1) );
    std::size_t sep = find_mapping_separator( v );
    if ( sep != npos ) v = ltrim( v.substr(sep + 1) );
    int gap = 0;
    take_properties( v, gap );
    return v;
  }

  // Tracks whether a line sits inside a block scalar body or a multi-line
  // quoted scalar, where markers and directives are not structural
  class StreamScanner {
  public:
    bool in_scalar() const { return quote_ != 0; }

    bool in_block_body( const std::string& raw ) const {
      return block_owner_ >= -1
        && ( is_blank(raw) || count_indent(raw) > block_owner_ );
    }

    void reset( int block_owner = -2 ) {
      quote_ = 0;
      block_owner_ = block_owner;
    }

    // `base` shifts the owning indentation; -1 for text after '---'
    void feed( const std::string& raw, int base = 0 ) {
      if ( in_block_body(raw) ) return;
      block_owner_ = -2;

      if ( quote_ ) {
        if ( find_closing_quote(raw, 0, quote_) != npos ) quote_ = 0;
        return;
      }
      if ( is_blank(raw) ) return;
      const std::string content = trim( raw );
      if ( content[0] == '#' ) return;

      const std::string v = value_part( content );
      if ( v.empty() ) return;
      if ( v[0] == '|' || v[0] == '>' ) {
        std::size_t end = v.find_first_of( " \t" );
        if ( is_block_scalar_header(v.substr(0, end)) ) {
          block_owner_ = count_indent( raw ) + base;
        }
      }
      else if ( v[0] == '"' || v[0] == '\'' ) {
        if ( find_closing_quote(v, 1, v[0]) == npos ) quote_ = v[0];
      }
    }

  private:
    char quote_ = 0;
    int block_owner_ = -2; // indentation owning the current block scalar
  };

} // namespace yamlfix::internal

  // Splits on column-0 '---' markers outside quoted scalars. Directives
  // attach to the following document, '...' closes the current one, and
  // comment lines before a marker form that document's preamble.
  inline std::vector< Document > split_documents( const std::string& text ) {
    using namespace internal;
    std::vector< Document > docs;
    Document cur;
    std::vector< std::string > body;
    bool content = false;
    StreamScanner scanner;

    auto finish = [&]() {
      std::string joined;
      for ( std::size_t i = 0; i < body.size(); ++i ) {
        if ( i > 0 ) joined += '\n';
        joined += body[i];
      }
      cur.text = joined;
      cur.index = docs.size();
      docs.push_back( std::move(cur) );
      cur = Document();
      body.clear();
      content = false;
      scanner.reset();
    };

    std::vector< std::string > lines;
    std::size_t start = 0;
    while ( start < text.size() ) {
      std::size_t eol = text.find( '\n', start );
      std::string raw = text.substr( start, eol == npos ? npos : eol - start );
      if ( !raw.empty() && raw.back() == '\r' ) raw.pop_back();
      lines.push_back( raw );
      if ( eol == npos ) break;
      start = eol + 1;
    }

    for ( std::size_t i = 0; i < lines.size(); ++i ) {
      const std::string& raw = lines[i];
      const int number = static_cast< int >( i ) + 1;

      if ( !scanner.in_scalar() ) {
        if ( is_document_start(raw) ) {
          if ( cur.explicit_start || content ) finish();
          else if ( !body.empty() ) {
            cur.preamble = body;
            body.clear();
          }
          cur.explicit_start = true;
          cur.first_line = number + 1;
          const std::string rest = trim( raw.substr(3) );
          if ( !rest.empty() && rest[0] == '#' ) cur.marker_comment = rest;
          else cur.marker_content = rest;

          // "--- |" opens a root block scalar
          scanner.reset();
          scanner.feed( cur.marker_content, -1 );
          continue;
        }
        if ( is_document_end(raw) ) {
          finish();
          continue;
        }
        if ( !content && !cur.explicit_start && !raw.empty()
          && raw[0] == '%' )
        {
          cur.directives.push_back( rtrim(raw) );
          continue;
        }
      }

      if ( body.empty() ) cur.first_line = number;
      body.push_back( raw );
      if ( !is_blank(raw) && trim(raw)[0] != '#' ) content = true;
      scanner.feed( raw );
    }
    finish();

    while ( !docs.empty() && docs.back().empty() ) docs.pop_back();
    for ( auto& doc : docs ) doc.last = false;
    if ( !docs.empty() ) docs.back().last = true;
    return docs;
  }

  // Concatenates rendered documents. Every document after the first starts
  // with '---'; '...' precedes a document that carries directives.
  inline std::string join_documents( const std::vector< Document >& docs ) {
    std::string out;
    for ( std::size_t i = 0; i < docs.size(); ++i ) {
      const Document& doc = docs[i];
      if ( i > 0 && !doc.directives.empty() ) out += "...\n";
      if ( i > 0 && !doc.explicit_start ) out += "---\n";
      out += doc.rendered;
    }
    return out;
  }

} // namespace yamlfix
