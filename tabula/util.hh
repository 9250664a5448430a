// ╺┳╸┏━┓┏┓ ╻ ╻╻  ┏━┓
//  ┃ ┣━┫┣┻┓┃ ┃┃  ┣━┫
//  ╹ ╹ ╹┗━┛┗━┛┗━╸╹ ╹
//  Random table & template generation engine
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <cctype>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

namespace tabula {

  // Specialized version of the fkYAML basic_node template. In particular,
  // the choice of fkyaml::ordered_map preserves the lexical order of the input
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

namespace internal {

  inline constexpr char PATH_DELIMITER = '.';

  // Divide a dotted reference string by PATH_DELIMITER instances
  inline std::vector< std::string > split_segments( const std::string& tok,
    char delim = PATH_DELIMITER )
  {
    std::vector< std::string > segs;
    size_t start = 0;
    while ( true ) {
      size_t pos = tok.find( delim, start );
      if ( pos == std::string::npos ) {
        segs.push_back( tok.substr(start) );
        break;
      }
      segs.push_back( tok.substr(start, pos - start) );
      start = pos + 1;
    }
    return segs;
  }

  // Connects segments into a full path string with PATH_DELIMITER
  inline std::string join_path( const std::vector< std::string >& segs,
    size_t first = 0, size_t last = std::string::npos )
  {
    std::string s;
    if ( last > segs.size() ) last = segs.size();
    for ( size_t i = first; i < last; ++i ) {
      if ( i > first ) s += PATH_DELIMITER;
      s += segs[ i ];
    }
    return s;
  }

  inline std::string join( const std::vector< std::string >& parts,
    const std::string& sep )
  {
    std::string s;
    for ( size_t i = 0; i < parts.size(); ++i ) {
      if ( i ) s += sep;
      s += parts[ i ];
    }
    return s;
  }

  // Append a numerical index to the end of a base path string
  inline std::string seq_indexed( const std::string& base, size_t idx ) {
    return base + '[' + std::to_string( idx ) + ']';
  }

  inline void replace_all( std::string& s, const std::string& from,
    const std::string& to )
  {
    if ( from.empty() ) return;
    std::string::size_type pos = 0;
    while ( (pos = s.find( from, pos )) != std::string::npos ) {
      s.replace( pos, from.size(), to );
      pos += to.size();
    }
  }

  inline bool is_space( char ch ) {
    return std::isspace( static_cast< unsigned char >(ch) ) != 0;
  }

  inline bool is_digit( char ch ) {
    return std::isdigit( static_cast< unsigned char >(ch) ) != 0;
  }

  inline bool is_word_char( char ch ) {
    return std::isalnum( static_cast< unsigned char >(ch) ) != 0 || ch == '_';
  }

  inline std::string trim( const std::string& s ) {
    size_t b = 0, e = s.size();
    while ( b < e && is_space(s[b]) ) ++b;
    while ( e > b && is_space(s[e - 1]) ) --e;
    return s.substr( b, e - b );
  }

  inline bool starts_with( const std::string& s, const std::string& prefix ) {
    return s.rfind( prefix, 0 ) == 0;
  }

  inline bool ends_with( const std::string& s, const std::string& suffix ) {
    return s.size() >= suffix.size()
      && s.compare( s.size() - suffix.size(), suffix.size(), suffix ) == 0;
  }

  inline bool contains( const std::string& s, const std::string& needle ) {
    return s.find( needle ) != std::string::npos;
  }

  inline std::string to_lower( std::string s ) {
    for ( auto& c : s ) {
      c = static_cast< char >( std::tolower( static_cast< unsigned char >(c) ) );
    }
    return s;
  }

  inline bool is_all_digits( const std::string& s ) {
    if ( s.empty() ) return false;
    for ( char c : s ) if ( !is_digit(c) ) return false;
    return true;
  }

  // Generated entry ids are the table id followed by a zero-padded index
  inline std::string generated_entry_id( const std::string& table_id,
    size_t index )
  {
    std::ostringstream oss;
    oss << table_id << std::setw( 3 ) << std::setfill( '0' ) << index;
    return oss.str();
  }

  // Leading integer of a string, ignoring leading whitespace and trailing
  // garbage ("12 goblins" -> 12). Empty result when no digits are present.
  inline std::optional< std::int64_t > parse_int_prefix( const std::string& s ) {
    size_t i = 0;
    while ( i < s.size() && is_space(s[i]) ) ++i;
    bool negative = false;
    if ( i < s.size() && (s[i] == '+' || s[i] == '-') ) {
      negative = ( s[i] == '-' );
      ++i;
    }
    const size_t digits_start = i;
    constexpr std::int64_t max_value = std::numeric_limits< std::int64_t >::max();
    std::int64_t value = 0;
    while ( i < s.size() && is_digit(s[i]) ) {
      const std::int64_t d = s[ i ] - '0';
      value = ( value > (max_value - d) / 10 ) ? max_value : value * 10 + d;
      ++i;
    }
    if ( i == digits_start ) return std::nullopt;
    return negative ? -value : value;
  }

  // Leading decimal number of a string ("3.5kg" -> 3.5). Only finite
  // values are returned.
  inline std::optional< double > parse_float_prefix( const std::string& s ) {
    static const std::regex number_prefix(
      R"(^\s*([+-]?(\d+\.?\d*|\.\d+)([eE][+-]?\d+)?))" );
    std::smatch m;
    if ( !std::regex_search( s, m, number_prefix ) ) return std::nullopt;
    const double v = std::strtod( m[ 1 ].str().c_str(), nullptr );
    if ( !std::isfinite(v) ) return std::nullopt;
    return v;
  }

  // Strict numeric conversion of a whole string. Blank text is zero,
  // anything that is not entirely a number is NaN.
  inline double strict_number( const std::string& s ) {
    static const std::regex decimal(
      R"(^[+-]?(\d+\.?\d*|\.\d+)([eE][+-]?\d+)?$)" );
    static const std::regex hex( R"(^0[xX][0-9a-fA-F]+$)" );
    const std::string t = trim( s );
    if ( t.empty() ) return 0.0;
    if ( std::regex_match( t, decimal ) ) {
      return std::strtod( t.c_str(), nullptr );
    }
    if ( std::regex_match( t, hex ) ) {
      return static_cast< double >( std::strtoll( t.c_str() + 2, nullptr, 16 ) );
    }
    if ( t == "Infinity" || t == "+Infinity" ) {
      return std::numeric_limits< double >::infinity();
    }
    if ( t == "-Infinity" ) return -std::numeric_limits< double >::infinity();
    return std::numeric_limits< double >::quiet_NaN();
  }

  // Shortest text form of a number: integral values print without a
  // fractional part ("5", not "5.000000")
  inline std::string format_number( double v ) {
    if ( std::isnan(v) ) return "NaN";
    if ( std::isinf(v) ) return v > 0 ? "Infinity" : "-Infinity";
    if ( v == std::floor(v) && std::fabs(v) < 1e21 ) {
      std::ostringstream oss;
      oss << std::fixed << std::setprecision( 0 ) << v;
      return oss.str();
    }
    for ( int precision = 1; precision <= 17; ++precision ) {
      std::ostringstream oss;
      oss << std::setprecision( precision ) << v;
      if ( std::strtod( oss.str().c_str(), nullptr ) == v ) return oss.str();
    }
    std::ostringstream oss;
    oss << std::setprecision( 17 ) << v;
    return oss.str();
  }

  // Double-quoted literal with backslash escapes, as used when a value is
  // substituted into a conditional expression
  inline std::string quote_string( const std::string& s ) {
    std::string out = "\"";
    for ( char c : s ) {
      switch ( c ) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default: out += c;
      }
    }
    out += '"';
    return out;
  }

  // Helper that checks whether an ordered_node is a non-null scalar field
  inline bool is_non_null_scalar( const ordered_node& n ) {
    return ( n.is_scalar() && !n.is_null() );
  }

  // Helpers for conversions to/from the ordered_node type

  template < typename T >
  inline T to_native_checked( const ordered_node& n ) {
    T out;
    fkyaml::node_value_converter< T >::from_node( n, out );
    return out;
  }

  template < typename T >
  inline ordered_node make_node_from( const T& value ) {
    ordered_node n;
    fkyaml::node_value_converter< T >::to_node( n, value );
    return n;
  }

  inline ordered_node make_string_sequence(
    const std::vector< std::string >& values )
  {
    std::vector< ordered_node > out;
    out.reserve( values.size() );
    for ( const auto& v : values ) out.push_back( make_node_from(v) );
    return make_node_from( out );
  }

  inline ordered_node make_int_sequence(
    const std::vector< std::int64_t >& values )
  {
    std::vector< ordered_node > out;
    out.reserve( values.size() );
    for ( auto v : values ) out.push_back( make_node_from(v) );
    return make_node_from( out );
  }

  inline std::string to_string_any( const ordered_node& n ) {
    if ( n.is_string() ) return to_native_checked< std::string >( n );
    if ( n.is_integer() ) return std::to_string(
      to_native_checked< std::int64_t >( n )
    );
    if ( n.is_boolean() ) return n.get_value< bool >() ? "true" : "false";
    if ( n.is_float_number() ) return format_number(
      to_native_checked< double >( n )
    );
    if ( n.is_null() ) return "";

    // We did not match any of the scalar types, so fall back to serialization
    return ordered_node::serialize( n );
  }

} // namespace tabula::internal

} // namespace tabula
