// yamlfix: canonical YAML formatter
//  version 0.1.0 | MIT License
//  End-to-end tests of fix_code
#include "yamlfix_fixer.hh"

#include <catch2/catch.hpp>

namespace {

  yamlfix::FormatOptions implicit_start() {
    yamlfix::FormatOptions options;
    options.explicit_start = false;
    return options;
  }

}

TEST_CASE("Small documents reach their canonical form", "[fixer]")
{
  using namespace yamlfix;

  CHECK(fix_code( "a: [1,2,3]", implicit_start() ) == "a: [1, 2, 3]\n");
  CHECK(fix_code( "flag: True", FormatOptions() ) == "---\nflag: true\n");
  CHECK(fix_code( "items:\n- name: a\n  value: 1\n", implicit_start() )
    == "items:\n  - name: a\n    value: 1\n");
  CHECK(fix_code( "list:\n  - a\n  - b\n", implicit_start() )
    == "list: [a, b]\n");
  CHECK(fix_code( "a: |\n  x\n  y\nb: 1\n", implicit_start() )
    == "a: |\n  x\n  y\nb: 1\n");
}

TEST_CASE("Comments are preserved with normalized spacing", "[fixer]")
{
  using namespace yamlfix;

  const std::string source = "# header\n"
    "a: 1 # inline\n"
    "#between\n"
    "b:\n"
    "  - x  # item\n"
    "  - y\n";
  CHECK(fix_code( source, FormatOptions() ) == "---\n"
    "# header\n"
    "a: 1  # inline\n"
    "# between\n"
    "b:\n"
    "  - x  # item\n"
    "  - y\n");

  CHECK(fix_code( "list:  # list comment\n  - item\n  - item\n",
    implicit_start() ) == "list: [item, item]  # list comment\n");
}

TEST_CASE("Multiple documents keep their separators", "[fixer]")
{
  using namespace yamlfix;

  CHECK(fix_code( "a: 1\n---\nb: 2\n", implicit_start() )
    == "a: 1\n---\nb: 2\n");
  CHECK(fix_code( "a: 1\n---\nb: 2\n", FormatOptions() )
    == "---\na: 1\n---\nb: 2\n");
  CHECK(fix_code( "--- # first\na: 1\n", implicit_start() )
    == "---  # first\na: 1\n");
}

TEST_CASE("Guarded and templated content is protected", "[fixer]")
{
  using namespace yamlfix;

  const std::string vault = "$ANSIBLE_VAULT;1.1;AES256\n3338\n";
  CHECK(fix_code( vault, FormatOptions() ) == vault);

  CHECK(fix_code( "#!/usr/bin/env ansible-playbook\na: yes\n",
    implicit_start() ) == "#!/usr/bin/env ansible-playbook\na: true\n");

  const std::string templated = "a: {{ x }}\nb: '{{ y }}'\nc: \"{{ z }}\"\n";
  CHECK(fix_code( templated, implicit_start() ) == templated);
}

TEST_CASE("Empty input stays empty", "[fixer]")
{
  using namespace yamlfix;

  CHECK(fix_code( "", FormatOptions() ).empty());
  CHECK(fix_code( "\n\n", FormatOptions() ).empty());
}

TEST_CASE("Formatting is idempotent", "[fixer]")
{
  using namespace yamlfix;

  const std::vector< std::string > sources = {
    "a: [1,2,3]\nb:\n  - x: 1\n    y: 2\n",
    "# c\n\n\nkey: value   # note\nother:\n    nested: yes\n",
    "k: [aaaa, bbbb, cccc, dddd, eeee, ffff, gggg, hhhh, iiii, jjjj, kkkk]\n",
    "text: one two three four five six seven eight nine ten eleven twelve "
      "thirteen fourteen fifteen\n",
    "a: 1\n---\nb: ~\n",
  };

  FormatOptions options;
  options.section_whitelines = 1;
  for ( const auto& source : sources ) {
    const std::string once = fix_code( source, options );
    CHECK(fix_code( once, options ) == once);
  }
}

TEST_CASE("Errors propagate out of fix_code", "[fixer]")
{
  using namespace yamlfix;

  CHECK_THROWS_AS(fix_code( "a: 1\na: 2\n", FormatOptions() ),
    DuplicateKeyError);
  CHECK_THROWS_AS(fix_code( "a: [1\n", FormatOptions() ), ParseError);
}

TEST_CASE("Aggregate status maps onto exit codes", "[fixer]")
{
  using namespace yamlfix;

  FixResultAggregate aggregate;
  CHECK(aggregate.status() == FixStatus::all_unchanged);
  CHECK(exit_code( aggregate.status() ) == 0);

  aggregate.n_changed = 1;
  CHECK(exit_code( aggregate.status() ) == 1);

  aggregate.failures.push_back( { "bad.yaml", "boom" } );
  CHECK(aggregate.status() == FixStatus::contains_failures);
  CHECK(exit_code( aggregate.status() ) == 2);
}

TEST_CASE("Plain items with commas stay in block style", "[fixer]")
{
  using namespace yamlfix;

  const std::string source = "k:\n  - a, b\n  - c\n";
  CHECK(fix_code( source, implicit_start() ) == source);
}

TEST_CASE("Empty documents keep the marker that separates them", "[fixer]")
{
  using namespace yamlfix;

  const std::string source = "---\n---\na: 1\n";
  const std::string once = fix_code( source, implicit_start() );
  CHECK(once == source);
  CHECK(fix_code( once, implicit_start() ) == once);

  CHECK(fix_code( "---\na: 1\n", implicit_start() ) == "a: 1\n");
}

TEST_CASE("Width checks count the restored template expressions", "[fixer]")
{
  using namespace yamlfix;

  // 86 columns once the expressions are back in place
  const std::string source = "k: [\"{{ some_really_long_variable_name_here }}\""
    ", \"{{ another_long_variable_name_x }}\"]\n";
  const std::string expected = "k:\n"
    "  - \"{{ some_really_long_variable_name_here }}\"\n"
    "  - \"{{ another_long_variable_name_x }}\"\n";
  const std::string once = fix_code( source, implicit_start() );
  CHECK(once == expected);
  CHECK(fix_code( once, implicit_start() ) == expected);

  const std::string narrow = "k: [\"{{ a }}\", \"{{ b }}\"]\n";
  CHECK(fix_code( narrow, implicit_start() ) == narrow);
}

TEST_CASE("Redundant quotes go unless preserve_quotes is set", "[fixer]")
{
  using namespace yamlfix;

  FormatOptions options = implicit_start();
  CHECK(fix_code( "a: 'hello'\nb: \"big world\"\n'k': 1\ng: ['p', \"q\"]\n",
    options ) == "a: hello\nb: big world\nk: 1\ng: [p, q]\n");

  // Text whose plain form would read differently
  const std::string kept = "c: 'yes'\nd: '123'\ne: 'a: b'\nf: \"x\\ty\"\n"
    "h: 'a, b'\ni: ''\nj: '~'\nl: '-x'\nm: 'a #b'\n";
  CHECK(fix_code( kept, options ) == kept);

  options.preserve_quotes = true;
  const std::string source = "str_key1: \"value\"\nstr_key2: 'value'\n"
    "str_key3: value\n";
  CHECK(fix_code( source, options ) == source);

  options.preserve_quotes = false;
  options.quote_basic_values = true;
  CHECK(fix_code( source, options )
    == "str_key1: 'value'\nstr_key2: 'value'\nstr_key3: 'value'\n");

  options.preserve_quotes = true;
  options.quote_representation = "\"";
  CHECK(fix_code( source, options )
    == "str_key1: \"value\"\nstr_key2: 'value'\nstr_key3: \"value\"\n");
}
