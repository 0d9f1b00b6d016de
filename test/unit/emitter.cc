// yamlfix: canonical YAML formatter
//  version 0.1.0 | MIT License
//  Tests for the indentation-aware emitter
#include "yamlfix_emitter.hh"
#include "yamlfix_tree.hh"

#include <catch2/catch.hpp>

namespace {

  std::string render( const std::string& text,
    const yamlfix::FormatOptions& options = yamlfix::FormatOptions() )
  {
    yamlfix::Tree tree = yamlfix::TreeParser().parse( text );
    std::string out;
    for ( const auto& line : yamlfix::Emitter(options).emit(tree) ) {
      out += line.text + '\n';
    }
    return out;
  }

}

TEST_CASE("Mappings are re-indented", "[emitter]")
{
  yamlfix::FormatOptions options;
  CHECK(render( "a: 1\nb:\n  c: 2\n" ) == "a: 1\nb:\n  c: 2\n");
  CHECK(render( "a: 1\nb:\n     c: 2\n" ) == "a: 1\nb:\n  c: 2\n");

  options.indent_mapping = 4;
  CHECK(render( "b:\n  c:\n    d: 2\n", options ) == "b:\n    c:\n        d: 2\n");
}

TEST_CASE("Sequence indentation follows offset and sequence width",
  "[emitter]")
{
  yamlfix::FormatOptions options;
  CHECK(render( "k:\n- a\n- b\n" ) == "k:\n  - a\n  - b\n");
  CHECK(render( "- name: x\n  val: 1\n- y\n" )
    == "- name: x\n  val: 1\n- y\n");
  CHECK(render( "items:\n- name: a\n  value: 1\n" )
    == "items:\n  - name: a\n    value: 1\n");

  options.indent_sequence = 2;
  options.indent_offset = 0;
  CHECK(render( "k:\n  - a\n  - b\n", options ) == "k:\n- a\n- b\n");
}

TEST_CASE("Flow sequences are written with single spaces", "[emitter]")
{
  CHECK(render( "a: [1,2,3]\n" ) == "a: [1, 2, 3]\n");
  CHECK(render( "a: [ x , [y,z] ]\n" ) == "a: [x, [y, z]]\n");
  CHECK(render( "a: []\n" ) == "a: []\n");

  yamlfix::FormatOptions options;
  yamlfix::Emitter emitter( options );
  yamlfix::Tree tree = yamlfix::TreeParser().parse( "k: [aaaa, bbbb, ccc]" );
  CHECK(emitter.flow_width( tree.root->entries[0], 0 ) == 20);
  CHECK(emitter.flow_width( tree.root->entries[0], 4 ) == 24);
}

TEST_CASE("Comments and block scalars survive emission", "[emitter]")
{
  CHECK(render( "# top\na: 1  # one\n# before b\nb: x\n" )
    == "# top\na: 1  # one\n# before b\nb: x\n");
  CHECK(render( "a: |-\n    x\n    y\nb: 1\n" ) == "a: |-\n  x\n  y\nb: 1\n");
  CHECK(render( "a: >\n  folded\n\n  text\n" ) == "a: >\n  folded\n\n  text\n");
}

TEST_CASE("Long plain scalars are refilled past line_length", "[emitter]")
{
  yamlfix::FormatOptions options;
  options.line_length = 20;
  CHECK(render( "k: aaaa bbbb cccc dddd eeee\n", options )
    == "k: aaaa bbbb cccc dddd\n  eeee\n");

  // Significant spacing is left alone
  CHECK(render( "k: aaaa  bbbb cccc dddd eeee\n", options )
    == "k: aaaa  bbbb cccc dddd eeee\n");
}
