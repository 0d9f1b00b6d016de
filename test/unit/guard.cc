// yamlfix: canonical YAML formatter
//  version 0.1.0 | MIT License
//  Tests for vault and shebang detection
#include "yamlfix_guard.hh"

#include <catch2/catch.hpp>

TEST_CASE("Plain text passes through the guard", "[guard]")
{
  using namespace yamlfix;

  SourceDocument src = inspect_source( "a: 1\n" );
  CHECK(src.mode == SourceMode::plain);
  CHECK(src.shebang.empty());
  CHECK(src.body == "a: 1\n");
}

TEST_CASE("Vault payloads are returned whole", "[guard]")
{
  using namespace yamlfix;

  const std::string vault = "$ANSIBLE_VAULT;1.1;AES256\n"
    "62313365396662343061393464336163383764373764613633653634306231386433626436\n";
  SourceDocument src = inspect_source( vault );
  CHECK(src.mode == SourceMode::vault);
  CHECK(src.body == vault);

  // The signature only counts at the very start
  CHECK(inspect_source( "# $ANSIBLE_VAULT;1.1\n" ).mode == SourceMode::plain);
}

TEST_CASE("Shebang lines are carved out", "[guard]")
{
  using namespace yamlfix;

  SourceDocument src = inspect_source(
    "#!/usr/bin/env ansible-playbook\n- hosts: all\n" );
  CHECK(src.mode == SourceMode::shebang);
  CHECK(src.shebang == "#!/usr/bin/env ansible-playbook\n");
  CHECK(src.body == "- hosts: all\n");

  SourceDocument bare = inspect_source( "#!/bin/sh" );
  CHECK(bare.mode == SourceMode::shebang);
  CHECK(bare.shebang == "#!/bin/sh\n");
  CHECK(bare.body.empty());
}
