// ╺┳╸┏━┓┏┓ ╻ ╻╻  ┏━┓
//  ┃ ┣━┫┣┻┓┃ ┃┃  ┣━┫
//  ╹ ╹ ╹┗━┛┗━┛┗━╸╹ ╹
//  Random table & template generation engine
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <ostream>
#include <string>
#include <vector>

#include "tabula/util.hh"

namespace tabula {

  enum class Severity { Info, Warning, Error };

  inline const char* severity_name( Severity s ) {
    switch ( s ) {
      case Severity::Info: return "info";
      case Severity::Error: return "error";
      default: return "warning";
    }
  }

  // Codes for non-fatal conditions reported while evaluating patterns
namespace diag {
  inline const std::string REFERENCE_ERROR = "REFERENCE_ERROR";
  inline const std::string CAPTURE_FORWARD_REF = "CAPTURE_FORWARD_REF";
  inline const std::string CAPTURE_INDEX_OUT_OF_BOUNDS = "CAPTURE_INDEX_OUT_OF_BOUNDS";
  inline const std::string CAPTURE_MISSING_PROPERTY = "CAPTURE_MISSING_PROPERTY";
  inline const std::string CAPTURE_NAME_CONFLICT = "CAPTURE_NAME_CONFLICT";
  inline const std::string INVALID_AGAIN = "INVALID_AGAIN";
  inline const std::string MATH_SYNTAX_ERROR = "MATH_SYNTAX_ERROR";
  inline const std::string DIVISION_BY_ZERO = "DIVISION_BY_ZERO";
  inline const std::string COERCION_FAILURE = "COERCION_FAILURE";
  inline const std::string CIRCULAR_REFERENCE = "CIRCULAR_REFERENCE";
  inline const std::string SWITCH_NO_MATCH = "SWITCH_NO_MATCH";
  inline const std::string INVALID_REGEX = "INVALID_REGEX";
} // namespace tabula::diag

  struct Diagnostic {
    Severity severity = Severity::Warning;
    std::string code;
    std::string message;
  };

  // Collects recoverable problems. Optionally echoes each record to a
  // stream as it arrives.
  class Diagnostics {
  public:
    inline explicit Diagnostics( std::ostream* echo = nullptr )
      : echo_( echo ) {}

    inline void report( Severity severity, const std::string& code,
      const std::string& message );

    inline void warn( const std::string& code, const std::string& message ) {
      report( Severity::Warning, code, message );
    }

    inline void info( const std::string& code, const std::string& message ) {
      report( Severity::Info, code, message );
    }

    inline void set_echo( std::ostream* echo ) { echo_ = echo; }

    inline const std::vector< Diagnostic >& entries() const { return entries_; }
    inline size_t size() const { return entries_.size(); }
    inline bool empty() const { return entries_.empty(); }
    inline void clear() { entries_.clear(); }

    inline bool has_code( const std::string& code ) const;

    // Records added since a previous size() snapshot
    inline std::vector< Diagnostic > since( size_t mark ) const;

  private:
    std::vector< Diagnostic > entries_;
    std::ostream* echo_ = nullptr;
  };

  inline ordered_node to_node( const Diagnostic& d ) {
    ordered_node n = ordered_node::mapping();
    n[ "severity" ] = internal::make_node_from(
      std::string( severity_name(d.severity) ) );
    n[ "code" ] = internal::make_node_from( d.code );
    n[ "message" ] = internal::make_node_from( d.message );
    return n;
  }

} // namespace tabula

inline void tabula::Diagnostics::report( Severity severity,
  const std::string& code, const std::string& message )
{
  entries_.push_back( Diagnostic{ severity, code, message } );
  if ( echo_ ) {
    *echo_ << "[tabula] " << severity_name( severity ) << ": " << message
      << " (" << code << ")\n";
  }
}

inline bool tabula::Diagnostics::has_code( const std::string& code ) const {
  for ( const auto& d : entries_ ) {
    if ( d.code == code ) return true;
  }
  return false;
}

inline std::vector< tabula::Diagnostic >
  tabula::Diagnostics::since( size_t mark ) const
{
  if ( mark >= entries_.size() ) return {};
  return std::vector< Diagnostic >( entries_.begin() + mark, entries_.end() );
}
