// yamlfix: canonical YAML formatter
//  version 0.1.0 | MIT License
//  Error taxonomy shared by every pipeline stage
#pragma once

#include <sstream>
#include <stdexcept>
#include <string>

namespace yamlfix {

  // Base class for every error raised by the formatter
  class Error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  // Malformed document. Fatal to the file that contains it, never to a batch.
  class ParseError : public Error {
  public:
    ParseError( const std::string& msg, int line, int column )
      : Error( compose(msg, line, column) ), line_( line ), column_( column ) {}

    int line() const { return line_; }
    int column() const { return column_; }

  protected:
    static std::string compose( const std::string& msg, int line,
      int column )
    {
      std::ostringstream oss;
      oss << msg;
      if ( line > 0 ) {
        oss << " (at line " << line << ", column " << column << ')';
      }
      return oss.str();
    }

  private:
    int line_;
    int column_;
  };

  // A mapping repeats a key while allow_duplicate_keys is false
  class DuplicateKeyError : public Error {
  public:
    DuplicateKeyError( const std::string& key, int line, int column )
      : Error( compose(key, line, column) ), key_( key ), line_( line ),
      column_( column ) {}

    const std::string& key() const { return key_; }
    int line() const { return line_; }
    int column() const { return column_; }

  private:
    static std::string compose( const std::string& key, int line,
      int column )
    {
      std::ostringstream oss;
      oss << "found duplicate key \"" << key << "\" (at line " << line
        << ", column " << column << ')';
      return oss.str();
    }

    std::string key_;
    int line_;
    int column_;
  };

  // Content the formatter refuses to touch (encrypted vaults). Signals a
  // deliberate skip rather than a failure.
  class UnsupportedContentError : public Error {
  public:
    using Error::Error;
  };

  // Invalid option name, type or value. Raised before any file is processed.
  class ConfigValidationError : public Error {
  public:
    ConfigValidationError( const std::string& option, const std::string& msg )
      : Error( "invalid configuration option '" + option + "': " + msg ),
      option_( option ) {}

    const std::string& option() const { return option_; }

  private:
    std::string option_;
  };

} // namespace yamlfix
