// yamlfix: canonical YAML formatter
//  version 0.1.0 | MIT License
//  Tests for parsing, validation and the default sequence style
#include "yamlfix_normalizer.hh"

#include <catch2/catch.hpp>

namespace {

  yamlfix::Document normalized( const std::string& text,
    const yamlfix::FormatOptions& options )
  {
    auto docs = yamlfix::split_documents( text );
    REQUIRE(docs.size() == 1);
    yamlfix::Normalizer( options ).normalize( docs.front() );
    return std::move( docs.front() );
  }

}

TEST_CASE("Plain scalars resolve to their YAML types", "[normalizer]")
{
  using namespace yamlfix;

  CHECK(resolve_scalar_type( "hello" ) == ScalarType::string);
  CHECK(resolve_scalar_type( "123" ) == ScalarType::integer);
  CHECK(resolve_scalar_type( "1.5" ) == ScalarType::floating);
  CHECK(resolve_scalar_type( "true" ) == ScalarType::boolean);
  CHECK(resolve_scalar_type( "~" ) == ScalarType::null);
  CHECK(resolve_scalar_type( "" ) == ScalarType::null);
  CHECK(resolve_scalar_type( "*ref" ) == ScalarType::string);
}

TEST_CASE("Duplicate keys are rejected unless allowed", "[normalizer]")
{
  using namespace yamlfix;

  FormatOptions options;
  try {
    normalized( "a: 1\nb:\n  c: 1\n  'c': 2\n", options );
    FAIL("duplicate key was accepted");
  }
  catch ( const DuplicateKeyError& ex ) {
    CHECK(ex.key() == "c");
    CHECK(ex.line() == 4);
  }

  options.allow_duplicate_keys = true;
  Document doc = normalized( "a: 1\na: 2\n", options );
  REQUIRE(doc.tree);
  CHECK(doc.tree->root->entries.size() == 2);
}

TEST_CASE("Malformed documents are reported with positions", "[normalizer]")
{
  using namespace yamlfix;

  FormatOptions options;
  auto docs = split_documents( "a: 1\n---\nb: [1, 2\n" );
  REQUIRE(docs.size() == 2);
  Normalizer normalizer( options );
  normalizer.normalize( docs[0] );
  try {
    normalizer.normalize( docs[1] );
    FAIL("unterminated flow sequence was accepted");
  }
  catch ( const ParseError& ex ) {
    CHECK(ex.line() == 3);
  }
}

TEST_CASE("Sequences under keys take the configured style", "[normalizer]")
{
  using namespace yamlfix;

  FormatOptions options;
  Document flow = normalized( "k:\n  - a\n  - b\nm:\n  - x: 1\n", options );
  CHECK(flow.tree->root->entries[0].value->is_flow_sequence());
  // Mappings cannot go inline
  CHECK(flow.tree->root->entries[1].value->is_block_sequence());

  Document commented = normalized( "k:\n  - a  # first\n  - b\n", options );
  CHECK(commented.tree->root->entries[0].value->is_block_sequence());

  options.sequence_style = SequenceStyle::block;
  Document block = normalized( "k: [a, b]\n", options );
  CHECK(block.tree->root->entries[0].value->is_block_sequence());

  options.sequence_style = SequenceStyle::keep;
  Document keep = normalized( "k: [a, b]\nm:\n  - c\n", options );
  CHECK(keep.tree->root->entries[0].value->is_flow_sequence());
  CHECK(keep.tree->root->entries[1].value->is_block_sequence());
}

TEST_CASE("Items with flow indicators keep their block sequence",
  "[normalizer]")
{
  using namespace yamlfix;

  FormatOptions options;
  Document comma = normalized( "k:\n  - a, b\n  - c\n", options );
  CHECK(comma.tree->root->entries[0].value->is_block_sequence());

  Document quoted = normalized( "k:\n  - 'a, b'\n  - c\n", options );
  CHECK(quoted.tree->root->entries[0].value->is_flow_sequence());

  for ( const std::string item : { "x]", "x[0", "a}b" } ) {
    Tree tree = TreeParser( 1 ).parse( "k:\n  - " + item + "\n  - z\n", "" );
    CHECK_FALSE(internal::flow_eligible( *tree.root->entries[0].value ));
  }
}
