// yamlfix: canonical YAML formatter
//  version 0.1.0 | MIT License
//  Command line front end
#include <algorithm>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include <boost/program_options.hpp>
#include <boost/version.hpp>

#include "yamlfix.hh"

namespace po = boost::program_options;

namespace {

  std::string read_stream( std::istream& in ) {
    return std::string( std::istreambuf_iterator< char >( in ),
      std::istreambuf_iterator< char >() );
  }

  // -v may repeat; program_options keeps one occurrence per key, so count
  // and drop them before storing
  int take_verbosity( po::parsed_options& parsed ) {
    auto& opts = parsed.options;
    const int count = static_cast< int >( std::count_if( opts.begin(),
      opts.end(), []( const po::option& o ) {
        return o.string_key == "verbose";
      } ) );
    opts.erase( std::remove_if(opts.begin(), opts.end(),
      []( const po::option& o ) { return o.string_key == "verbose"; }),
      opts.end() );
    return count;
  }

}

int main( int argc, char** argv ) {
  po::options_description visible( "Usage: yamlfix [options] [files...]\n"
    "Options" );
  visible.add_options()
    ( "help,h", "show this help message and exit" )
    ( "version", "print the version and exit" )
    ( "verbose,v", "log debug messages (repeatable)" )
    ( "check", "report files that would change without writing them" )
    ( "config-file,c", po::value< std::vector< std::string > >()->composing(),
      "INI configuration file, later files override earlier ones" )
    ( "env-prefix", po::value< std::string >()->default_value(
      yamlfix::internal::DEFAULT_ENV_PREFIX ),
      "prefix of the environment variables overriding options" )
    ( "jobs,j", po::value< unsigned >()->default_value( 1 ),
      "number of files formatted in parallel" );

  po::options_description hidden;
  hidden.add_options()
    ( "files", po::value< std::vector< std::string > >(), "input files" );

  po::options_description all;
  all.add( visible ).add( hidden );

  po::positional_options_description positional;
  positional.add( "files", -1 );

  try {
    po::parsed_options parsed = po::command_line_parser( argc, argv )
      .options( all ).positional( positional ).run();
    const int verbosity = take_verbosity( parsed );

    po::variables_map vm;
    po::store( parsed, vm );
    po::notify( vm );

    if ( vm.count("help") ) {
      std::cout << visible << "\n";
      return 0;
    }
    if ( vm.count("version") ) {
      std::cout << "yamlfix " << YAMLFIX_VERSION << " (boost "
        << BOOST_LIB_VERSION << ")\n";
      return 0;
    }

    yamlfix::init_logging( verbosity );

    // 1) Configuration, fatal before any file is touched
    yamlfix::FormatOptions options;
    try {
      yamlfix::ConfigLoader loader( vm["env-prefix"].as< std::string >() );
      if ( vm.count("config-file") ) {
        for ( const auto& path
          : vm["config-file"].as< std::vector< std::string > >() )
        {
          loader.add_file( path );
        }
      }
      options = loader.load();
    }
    catch ( const yamlfix::ConfigValidationError& ex ) {
      std::cerr << "[yamlfix] error: " << ex.what() << "\n";
      return 2;
    }

    std::vector< std::string > files;
    if ( vm.count("files") ) {
      files = vm["files"].as< std::vector< std::string > >();
    }

    // 2) stdin to stdout
    if ( files.empty() || (files.size() == 1 && files.front() == "-") ) {
      const std::string source = read_stream( std::cin );
      const std::string fixed = yamlfix::fix_code( source, options );
      if ( !vm.count("check") ) std::cout << fixed;
      return fixed == source ? 0 : 1;
    }

    // 3) Files in place
    const bool dry_run = vm.count( "check" ) > 0;
    yamlfix::FixResultAggregate aggregate = yamlfix::fix_files( files,
      options, dry_run, vm["jobs"].as< unsigned >() );

    YAMLFIX_LOG_INFO << ( dry_run ? "Checked " : "Fixed " )
      << aggregate.n_files << " file(s), " << aggregate.n_changed
      << ( dry_run ? " would change, " : " changed, " )
      << aggregate.failures.size() << " failed";
    return yamlfix::exit_code( aggregate.status() );
  }
  catch ( const po::error& ex ) {
    std::cerr << "[yamlfix] error: " << ex.what() << "\n" << visible << "\n";
    return 2;
  }
  catch ( const std::exception& ex ) {
    std::cerr << "[yamlfix] error: " << ex.what() << "\n";
    return 2;
  }
}
