// yamlfix: canonical YAML formatter
//  version 0.1.0 | MIT License
//  Tests for document splitting and joining
#include "yamlfix_splitter.hh"

#include <catch2/catch.hpp>

TEST_CASE("Streams split on document markers", "[splitter]")
{
  using namespace yamlfix;

  auto docs = split_documents( "a: 1\n---\nb: 2\n" );
  REQUIRE(docs.size() == 2);

  CHECK(docs[0].index == 0);
  CHECK_FALSE(docs[0].explicit_start);
  CHECK(docs[0].text == "a: 1");
  CHECK(docs[0].first_line == 1);

  CHECK(docs[1].index == 1);
  CHECK(docs[1].explicit_start);
  CHECK(docs[1].text == "b: 2");
  CHECK(docs[1].first_line == 3);
}

TEST_CASE("Directives, marker content and preambles", "[splitter]")
{
  using namespace yamlfix;

  auto directives = split_documents( "%YAML 1.2\n---\na: 1\n" );
  REQUIRE(directives.size() == 1);
  CHECK(directives[0].directives == std::vector< std::string >{ "%YAML 1.2" });
  CHECK(directives[0].explicit_start);
  CHECK(directives[0].text == "a: 1");

  auto commented = split_documents( "--- # hello\na: 1\n" );
  REQUIRE(commented.size() == 1);
  CHECK(commented[0].marker_comment == "# hello");
  CHECK(commented[0].marker_content.empty());

  auto scalar = split_documents( "--- |\n  text\n" );
  REQUIRE(scalar.size() == 1);
  CHECK(scalar[0].marker_content == "|");
  CHECK(scalar[0].text == "  text");

  auto preamble = split_documents( "# head\n---\na: 1\n" );
  REQUIRE(preamble.size() == 1);
  CHECK(preamble[0].preamble == std::vector< std::string >{ "# head" });
  CHECK(preamble[0].text == "a: 1");
}

TEST_CASE("Markers inside quoted scalars are content", "[splitter]")
{
  using namespace yamlfix;

  auto docs = split_documents( "a: \"x\n---\ny\"\nb: 1\n" );
  REQUIRE(docs.size() == 1);
  CHECK(docs[0].text == "a: \"x\n---\ny\"\nb: 1");
}

TEST_CASE("Document end markers close the current document", "[splitter]")
{
  using namespace yamlfix;

  auto docs = split_documents( "a: 1\n...\n---\nb: 2\n" );
  REQUIRE(docs.size() == 2);
  CHECK(docs[0].text == "a: 1");
  CHECK(docs[1].text == "b: 2");

  CHECK(split_documents( "" ).empty());
  CHECK(split_documents( "\n\n" ).empty());
}

TEST_CASE("Rendered documents are joined with separators", "[splitter]")
{
  using namespace yamlfix;

  std::vector< Document > docs( 3 );
  docs[0].rendered = "a: 1\n";
  docs[1].rendered = "b: 2\n";
  docs[2].explicit_start = true;
  docs[2].directives = { "%YAML 1.2" };
  docs[2].rendered = "%YAML 1.2\n---\nc: 3\n";

  CHECK(join_documents( docs )
    == "a: 1\n---\nb: 2\n...\n%YAML 1.2\n---\nc: 3\n");
}
