// yamlfix: canonical YAML formatter
//  version 0.1.0 | MIT License
//  Catch2 runner for the unit tests
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

int main( int argc, char* argv[] ) {
  // Only errors reach the console while the tests run
  boost::log::core::get()->set_filter(
    boost::log::trivial::severity >= boost::log::trivial::error );
  return Catch::Session().run( argc, argv );
}
