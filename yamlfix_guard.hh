// yamlfix: canonical YAML formatter
//  version 0.1.0 | MIT License
//  Detection of content that must bypass formatting
#pragma once

#include <string>

namespace yamlfix {

  enum class SourceMode { plain, vault, shebang };

  struct SourceDocument {
    SourceMode mode = SourceMode::plain;
    std::string shebang; // first line including its newline, if any
    std::string body;    // text handed to the formatting pipeline
  };

namespace internal {

  inline const std::string VAULT_PREFIX = "$ANSIBLE_VAULT;";
  inline const std::string SHEBANG_PREFIX = "#!";

} // namespace yamlfix::internal

  // Classifies the raw input. Vault payloads are returned whole in body and
  // must be written back unmodified.
  inline SourceDocument inspect_source( const std::string& text ) {
    SourceDocument src;
    if ( text.compare(0, internal::VAULT_PREFIX.size(),
      internal::VAULT_PREFIX) == 0 )
    {
      src.mode = SourceMode::vault;
      src.body = text;
      return src;
    }

    if ( text.compare(0, internal::SHEBANG_PREFIX.size(),
      internal::SHEBANG_PREFIX) == 0 )
    {
      src.mode = SourceMode::shebang;
      std::size_t eol = text.find( '\n' );
      if ( eol == std::string::npos ) {
        src.shebang = text + '\n';
      }
      else {
        src.shebang = text.substr( 0, eol + 1 );
        src.body = text.substr( eol + 1 );
      }
      return src;
    }

    src.body = text;
    return src;
  }

} // namespace yamlfix
