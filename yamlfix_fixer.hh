// yamlfix: canonical YAML formatter
//  version 0.1.0 | MIT License
//  In-memory and on-disk entry points, batch processing and change detection
#pragma once

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "yamlfix_config.hh"
#include "yamlfix_errors.hh"
#include "yamlfix_guard.hh"
#include "yamlfix_jinja.hh"
#include "yamlfix_log.hh"
#include "yamlfix_normalizer.hh"
#include "yamlfix_passes.hh"
#include "yamlfix_splitter.hh"

namespace yamlfix {

  struct FixResult {
    std::string path;
    bool changed = false;
    bool skipped = false; // vault content, left untouched
  };

  struct FixFailure {
    std::string path;
    std::string message;
  };

  enum class FixStatus { all_unchanged, some_changed, contains_failures };

  struct FixResultAggregate {
    std::size_t n_files = 0;
    std::size_t n_changed = 0;
    std::vector< FixResult > results; // input order, failed files excluded
    std::vector< FixFailure > failures; // input order

    FixStatus status() const {
      if ( !failures.empty() ) return FixStatus::contains_failures;
      if ( n_changed > 0 ) return FixStatus::some_changed;
      return FixStatus::all_unchanged;
    }
  };

  // Process exit status for an aggregate status
  inline int exit_code( FixStatus status ) {
    switch ( status ) {
      case FixStatus::all_unchanged: return 0;
      case FixStatus::some_changed: return 1;
      case FixStatus::contains_failures: return 2;
    }
    return 2;
  }

  // Formats a whole source text. Vault content comes back unmodified.
  inline std::string fix_code( const std::string& source,
    const FormatOptions& options );

  // Formats one file in place, unless dry_run is set or nothing changed
  inline FixResult fix_file( const std::string& path,
    const FormatOptions& options, bool dry_run );

  // Formats several files on a pool of `jobs` worker threads. Errors are
  // recorded per file and never stop the remaining files.
  inline FixResultAggregate fix_files( const std::vector< std::string >& paths,
    const FormatOptions& options, bool dry_run, unsigned jobs = 1 );

namespace internal {

  // Runs the pipeline, throwing UnsupportedContentError for vault content
  inline std::string format_source( const std::string& source,
    const FormatOptions& options )
  {
    SourceDocument src = inspect_source( source );
    if ( src.mode == SourceMode::vault ) {
      throw UnsupportedContentError( "ansible vault content is not "
        "reformatted" );
    }

    JinjaEscaper escaper;
    const std::string escaped = escaper.escape( src.body );

    std::vector< Document > docs = split_documents( escaped );
    YAMLFIX_LOG_DEBUG << "Split source into " << docs.size()
      << " document(s)";

    Normalizer normalizer( options );
    PassChain chain( options, &escaper );
    for ( auto& doc : docs ) {
      normalizer.normalize( doc );
      chain.run( doc );
    }

    std::vector< RenderedLine > joined;
    RenderedLine all;
    all.text = join_documents( docs );
    // Documents already end in '\n'; drop it so the enforcer adds just one
    while ( !all.text.empty() && all.text.back() == '\n' ) all.text.pop_back();
    if ( !all.text.empty() ) joined.push_back( all );

    return src.shebang + escaper.unescape( enforce_trailing_newline(joined) );
  }

  inline std::string read_file( const std::string& path ) {
    std::ifstream in( path, std::ios::in | std::ios::binary );
    if ( !in ) {
      std::ostringstream oss;
      oss << "unable to open " << path << " for reading";
      throw std::runtime_error( oss.str() );
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    return contents.str();
  }

  // Replaces `path` through a sibling temporary file and a rename
  inline void write_file( const std::string& path, const std::string& text ) {
    const std::string tmp = path + ".yamlfix.tmp";
    {
      std::ofstream out( tmp, std::ios::out | std::ios::binary
        | std::ios::trunc );
      if ( !out ) {
        std::ostringstream oss;
        oss << "unable to open " << tmp << " for writing";
        throw std::runtime_error( oss.str() );
      }
      out << text;
      out.close();
      if ( !out ) {
        std::error_code ignored;
        std::filesystem::remove( tmp, ignored );
        std::ostringstream oss;
        oss << "failed to write " << tmp;
        throw std::runtime_error( oss.str() );
      }
    }

    std::error_code ec;
    std::filesystem::rename( tmp, path, ec );
    if ( ec ) {
      std::error_code ignored;
      std::filesystem::remove( tmp, ignored );
      std::ostringstream oss;
      oss << "failed to replace " << path << ": " << ec.message();
      throw std::runtime_error( oss.str() );
    }
  }

} // namespace yamlfix::internal

} // namespace yamlfix

inline std::string yamlfix::fix_code( const std::string& source,
  const FormatOptions& options )
{
  try {
    return internal::format_source( source, options );
  }
  catch ( const UnsupportedContentError& ex ) {
    YAMLFIX_LOG_DEBUG << "Returning source unmodified: " << ex.what();
    return source;
  }
}

inline yamlfix::FixResult yamlfix::fix_file( const std::string& path,
  const FormatOptions& options, bool dry_run )
{
  FixResult result;
  result.path = path;

  const std::string source = internal::read_file( path );
  std::string fixed;
  try {
    fixed = internal::format_source( source, options );
  }
  catch ( const UnsupportedContentError& ex ) {
    YAMLFIX_LOG_INFO << "Skipped " << path << ": " << ex.what();
    result.skipped = true;
    return result;
  }

  result.changed = fixed != source;
  if ( !result.changed ) {
    YAMLFIX_LOG_DEBUG << "Left " << path << " unmodified";
    return result;
  }

  if ( dry_run ) {
    YAMLFIX_LOG_INFO << "Would fix " << path;
  }
  else {
    internal::write_file( path, fixed );
    YAMLFIX_LOG_INFO << "Fixed " << path;
  }
  return result;
}

inline yamlfix::FixResultAggregate yamlfix::fix_files(
  const std::vector< std::string >& paths, const FormatOptions& options,
  bool dry_run, unsigned jobs )
{
  struct Slot {
    FixResult result;
    bool failed = false;
    std::string message;
  };

  // Each task owns one slot, so no locking is needed
  std::vector< Slot > slots( paths.size() );
  {
    boost::asio::thread_pool pool( jobs > 0 ? jobs : 1 );
    for ( std::size_t i = 0; i < paths.size(); ++i ) {
      boost::asio::post( pool, [&, i]() {
        Slot& slot = slots[i];
        try {
          slot.result = fix_file( paths[i], options, dry_run );
        }
        catch ( const Error& ex ) {
          slot.failed = true;
          slot.message = ex.what();
        }
        catch ( const std::exception& ex ) {
          slot.failed = true;
          slot.message = ex.what();
        }
      } );
    }
    pool.join();
  }

  FixResultAggregate aggregate;
  aggregate.n_files = paths.size();
  for ( std::size_t i = 0; i < slots.size(); ++i ) {
    const Slot& slot = slots[i];
    if ( slot.failed ) {
      YAMLFIX_LOG_ERROR << "Failed to fix " << paths[i] << ": "
        << slot.message;
      aggregate.failures.push_back( { paths[i], slot.message } );
      continue;
    }
    if ( slot.result.changed ) ++aggregate.n_changed;
    aggregate.results.push_back( slot.result );
  }
  return aggregate;
}
