// yamlfix: canonical YAML formatter
//  version 0.1.0 | MIT License
//  Tests for the round-trip tree parser
#include "yamlfix_tree.hh"

#include <catch2/catch.hpp>

TEST_CASE("Block mappings and their comments", "[tree]")
{
  using namespace yamlfix;

  TreeParser parser;
  Tree tree = parser.parse( "# top\na: 1  # one\nb:\n  c: 2\n" );

  REQUIRE(tree.leading.size() == 1);
  CHECK(tree.leading[0].text == "# top");
  CHECK(tree.leading[0].column == 0);

  const Node& root = *tree.root;
  REQUIRE(root.is_block_mapping());
  REQUIRE(root.entries.size() == 2);

  const MapEntry& a = root.entries[0];
  CHECK(a.key == "a");
  CHECK(a.line == 2);
  CHECK(a.value->text == std::vector< std::string >{ "1" });
  CHECK(a.value->comment == "# one");
  CHECK(a.value->comment_gap == 2);

  const Node& b = *root.entries[1].value;
  REQUIRE(b.is_block_mapping());
  CHECK(b.entries[0].key == "c");
  CHECK(b.entries[0].column == 3);
}

TEST_CASE("Sequences, compact entries and flow collections", "[tree]")
{
  using namespace yamlfix;

  TreeParser parser;
  Tree seq = parser.parse( "- name: x\n  val: 1\n- y\n- - a\n  - b\n" );
  const Node& root = *seq.root;
  REQUIRE(root.is_block_sequence());
  REQUIRE(root.items.size() == 3);
  CHECK(root.items[0].value->is_block_mapping());
  CHECK(root.items[0].value->entries.size() == 2);
  CHECK(root.items[1].value->text == std::vector< std::string >{ "y" });
  CHECK(root.items[2].value->is_block_sequence());
  CHECK(root.items[2].value->items.size() == 2);

  Tree flow = TreeParser().parse( "a: [1, 'two', {k: v}, [x]]\n" );
  const Node& list = *flow.root->entries[0].value;
  REQUIRE(list.is_flow_sequence());
  REQUIRE(list.items.size() == 4);
  CHECK(list.items[1].value->style == ScalarStyle::SingleQuoted);
  CHECK(list.items[2].value->kind == NodeKind::FlowMapping);
  CHECK(list.items[3].value->is_flow_sequence());

  Tree mapping = TreeParser().parse( "a: {k: v,\n  j: w}\n" );
  const Node& inline_map = *mapping.root->entries[0].value;
  CHECK(inline_map.kind == NodeKind::FlowMapping);
  CHECK(inline_map.text == std::vector< std::string >{ "{k: v, j: w}" });

  Tree raw = TreeParser().parse( "a: [1,  # first\n  2]\n" );
  CHECK(raw.root->entries[0].value->kind == NodeKind::Raw);
}

TEST_CASE("Scalars keep their authored form", "[tree]")
{
  using namespace yamlfix;

  Tree block = TreeParser().parse( "a: |\n  line1\n  line2\n\nb: 1\n" );
  const Node& literal = *block.root->entries[0].value;
  CHECK(literal.style == ScalarStyle::Literal);
  CHECK(literal.header == "|");
  CHECK(literal.text == std::vector< std::string >{ "line1", "line2" });
  REQUIRE(block.root->entries.size() == 2);
  CHECK(block.root->entries[1].leading.size() == 1);

  Tree plain = TreeParser().parse( "a: one\n  two\nb: 3\n" );
  CHECK(plain.root->entries[0].value->text
    == std::vector< std::string >{ "one", "two" });

  Tree quoted = TreeParser().parse( "a: \"x\n  y\"\n" );
  CHECK(quoted.root->entries[0].value->style == ScalarStyle::DoubleQuoted);
  CHECK(quoted.root->entries[0].value->text.size() == 2);

  Tree props = TreeParser().parse( "base: &b\n  x: 1\nother: *b\n" );
  CHECK(props.root->entries[0].value->properties == "&b");
  CHECK(props.root->entries[0].value->is_block_mapping());
  CHECK(props.root->entries[1].value->is_alias());

  Tree nulls = TreeParser().parse( "a:\nb: ~\nc: x\n" );
  CHECK(nulls.root->entries[0].value->is_null());
  CHECK(nulls.root->entries[1].value->is_null());
  CHECK_FALSE(nulls.root->entries[2].value->is_null());
}

TEST_CASE("Malformed documents raise ParseError", "[tree]")
{
  using namespace yamlfix;

  try {
    TreeParser().parse( "a: 1\n b: 2\n" );
    FAIL("bad indentation was accepted");
  }
  catch ( const ParseError& ex ) {
    CHECK(ex.line() == 2);
    CHECK(ex.column() == 2);
  }

  // Line numbers count from the start of the file
  try {
    TreeParser( 10 ).parse( "a: [1, 2\n" );
    FAIL("unterminated flow sequence was accepted");
  }
  catch ( const ParseError& ex ) {
    CHECK(ex.line() == 10);
  }

  CHECK_THROWS_AS(TreeParser().parse( "a:\n\tb: 1\n" ), ParseError);
  CHECK_THROWS_AS(TreeParser().parse( "? a\n: b\n" ), ParseError);
  CHECK_THROWS_AS(TreeParser().parse( "a: b: c\n" ), ParseError);
  CHECK_THROWS_AS(TreeParser().parse( "a: 'x' y\n" ), ParseError);
}
