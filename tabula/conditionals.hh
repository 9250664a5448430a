// ╺┳╸┏━┓┏┓ ╻ ╻╻  ┏━┓
//  ┃ ┣━┫┣┻┓┃ ┃┃  ┣━┫
//  ╹ ╹ ╹┗━┛┗━┛┗━╸╹ ╹
//  Random table & template generation engine
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <cmath>
#include <regex>
#include <string>
#include <variant>
#include <vector>

#include "tabula/context.hh"
#include "tabula/util.hh"

namespace tabula {

  // Boolean "when" expressions used by switch clauses:
  //   operands   @name[.prop]  $name  $name.@prop  "quoted"  123  bare
  //   compare    ==  !=  >  <  >=  <=  contains  matches
  //   logic      !  &&  ||  ( )        && binds tighter than ||
  // An invalid "matches" pattern is false and reports INVALID_REGEX
  inline bool evaluate_when_clause( const std::string& when,
    GenerationContext& ctx );

namespace internal {

  // An operand: missing, number or text
  using CondValue = std::variant< std::monostate, double, std::string >;

  inline std::vector< std::string > tokenize_condition( const std::string& expr ) {
    std::vector< std::string > tokens;
    std::string current;
    bool in_quote = false;
    char quote_char = '\0';

    auto flush = [&]() {
      if ( !current.empty() ) tokens.push_back( current );
      current.clear();
    };

    for ( size_t i = 0; i < expr.size(); ++i ) {
      const char c = expr[ i ];
      const char next = i + 1 < expr.size() ? expr[ i + 1 ] : '\0';

      if ( in_quote ) {
        if ( c == quote_char ) {
          tokens.push_back( current );
          current.clear();
          in_quote = false;
        } else {
          current += c;
        }
      }
      else if ( c == '"' || c == '\'' ) {
        flush();
        in_quote = true;
        quote_char = c;
      }
      else if ( c == ' ' || c == '\t' ) flush();
      else if ( c == '(' || c == ')' ) {
        flush();
        tokens.push_back( std::string(1, c) );
      }
      else if ( c == '&' && next == '&' ) {
        flush();
        tokens.push_back( "&&" );
        ++i;
      }
      else if ( c == '|' && next == '|' ) {
        flush();
        tokens.push_back( "||" );
        ++i;
      }
      else if ( (c == '=' || c == '!' || c == '>' || c == '<') && next == '=' ) {
        flush();
        tokens.push_back( std::string(1, c) + '=' );
        ++i;
      }
      else if ( c == '!' || c == '>' || c == '<' ) {
        flush();
        tokens.push_back( std::string(1, c) );
      }
      else {
        current += c;
      }
    }
    flush();

    std::vector< std::string > out;
    for ( auto& t : tokens ) if ( !t.empty() ) out.push_back( std::move(t) );
    return out;
  }

  inline CondValue resolve_condition_value( const std::string& ref,
    const GenerationContext& ctx )
  {
    static const std::regex shared_prop_re(
      R"(^\$([a-zA-Z_][a-zA-Z0-9_]*)\.@([a-zA-Z_][a-zA-Z0-9_]*)$)" );

    if ( starts_with(ref, "@") ) {
      const std::vector< std::string > parts = split_segments( ref.substr(1) );
      const std::string property = parts.size() > 1 ? parts[ 1 ] : "";
      if ( auto v = ctx.get_placeholder(parts[0], property) ) return *v;
      return std::monostate{};
    }

    if ( starts_with(ref, "$") ) {
      std::smatch m;
      if ( std::regex_match( ref, m, shared_prop_re ) ) {
        if ( auto item = ctx.get_shared_variable(m[1].str()) ) {
          if ( const SetValue* v = item->sets.get(m[2].str()) ) {
            return set_value_text( *v );
          }
          return std::monostate{};
        }
      }
      if ( auto v = ctx.resolve_variable(ref.substr(1)) ) return *v;
      return std::monostate{};
    }

    if ( auto num = parse_float_prefix(ref) ) return *num;
    return ref;
  }

  inline std::string cond_to_string( const CondValue& v ) {
    if ( const auto* d = std::get_if< double >( &v ) ) return format_number( *d );
    if ( const auto* s = std::get_if< std::string >( &v ) ) return *s;
    return "";
  }

  inline double cond_to_number( const CondValue& v ) {
    if ( const auto* d = std::get_if< double >( &v ) ) return *d;
    if ( const auto* s = std::get_if< std::string >( &v ) ) return strict_number( *s );
    return 0.0;
  }

  inline bool cond_truthy( const CondValue& v ) {
    if ( const auto* d = std::get_if< double >( &v ) ) {
      return *d != 0.0 && !std::isnan( *d );
    }
    if ( const auto* s = std::get_if< std::string >( &v ) ) return !s->empty();
    return false;
  }

  inline bool compare_values( const CondValue& left, const std::string& op,
    const CondValue& right, GenerationContext& ctx )
  {
    if ( op == "==" ) return cond_to_string( left ) == cond_to_string( right );
    if ( op == "!=" ) return cond_to_string( left ) != cond_to_string( right );
    if ( op == ">" ) return cond_to_number( left ) > cond_to_number( right );
    if ( op == "<" ) return cond_to_number( left ) < cond_to_number( right );
    if ( op == ">=" ) return cond_to_number( left ) >= cond_to_number( right );
    if ( op == "<=" ) return cond_to_number( left ) <= cond_to_number( right );
    if ( op == "contains" ) {
      return contains( to_lower(cond_to_string(left)),
        to_lower(cond_to_string(right)) );
    }
    if ( op == "matches" ) {
      try {
        const std::regex re( cond_to_string(right),
          std::regex::ECMAScript | std::regex::icase );
        return std::regex_search( cond_to_string(left), re );
      }
      catch ( const std::regex_error& e ) {
        ctx.warn( diag::INVALID_REGEX, "Invalid regex in matches: \""
          + cond_to_string(right) + "\" (" + e.what() + ')' );
        return false;
      }
    }
    return false;
  }

  inline bool evaluate_condition_tokens( const std::vector< std::string >& tokens,
    size_t begin, size_t end, GenerationContext& ctx )
  {
    if ( begin >= end ) return false;

    if ( tokens[begin] == "!" ) {
      return !evaluate_condition_tokens( tokens, begin + 1, end, ctx );
    }

    if ( tokens[begin] == "(" ) {
      int depth = 1;
      size_t i = begin + 1;
      while ( i < end && depth > 0 ) {
        if ( tokens[i] == "(" ) ++depth;
        if ( tokens[i] == ")" ) --depth;
        ++i;
      }
      const size_t inner_end = i - 1;
      const bool inner = evaluate_condition_tokens( tokens, begin + 1, inner_end, ctx );
      if ( i >= end ) return inner;
      if ( tokens[i] == "&&" ) {
        return inner && evaluate_condition_tokens( tokens, i + 1, end, ctx );
      }
      if ( tokens[i] == "||" ) {
        return inner || evaluate_condition_tokens( tokens, i + 1, end, ctx );
      }
      return inner;
    }

    // Left-most top-level || splits first, then &&
    int depth = 0;
    size_t or_at = end, and_at = end;
    for ( size_t i = begin; i < end; ++i ) {
      if ( tokens[i] == "(" ) ++depth;
      else if ( tokens[i] == ")" ) --depth;
      else if ( depth == 0 ) {
        if ( tokens[i] == "||" && or_at == end ) or_at = i;
        else if ( tokens[i] == "&&" && and_at == end ) and_at = i;
      }
    }

    if ( or_at != end ) {
      const bool l = evaluate_condition_tokens( tokens, begin, or_at, ctx );
      const bool r = evaluate_condition_tokens( tokens, or_at + 1, end, ctx );
      return l || r;
    }
    if ( and_at != end ) {
      const bool l = evaluate_condition_tokens( tokens, begin, and_at, ctx );
      const bool r = evaluate_condition_tokens( tokens, and_at + 1, end, ctx );
      return l && r;
    }

    const size_t n = end - begin;
    if ( n >= 3 ) {
      std::vector< std::string > rhs( tokens.begin() + begin + 2,
        tokens.begin() + end );
      const CondValue left = resolve_condition_value( tokens[begin], ctx );
      const CondValue right = resolve_condition_value( join(rhs, " "), ctx );
      return compare_values( left, tokens[begin + 1], right, ctx );
    }
    if ( n == 1 ) {
      return cond_truthy( resolve_condition_value(tokens[begin], ctx) );
    }
    return false;
  }

} // namespace tabula::internal

} // namespace tabula

inline bool tabula::evaluate_when_clause( const std::string& when,
  GenerationContext& ctx )
{
  const std::vector< std::string > tokens = internal::tokenize_condition( when );
  return internal::evaluate_condition_tokens( tokens, 0, tokens.size(), ctx );
}
