// ╺┳╸┏━┓┏┓ ╻ ╻╻  ┏━┓
//  ┃ ┣━┫┣┻┓┃ ┃┃  ┣━┫
//  ╹ ╹ ╹┗━┛┗━┛┗━╸╹ ╹
//  Random table & template generation engine
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "tabula/context.hh"
#include "tabula/diagnostics.hh"
#include "tabula/dice.hh"
#include "tabula/util.hh"

namespace tabula {

  // Integer arithmetic over numbers, $variables, @placeholders, dice:XdY
  // and $var.@prop chains. Division truncates toward zero and division by
  // zero yields 0. A malformed or overflowing expression yields nothing.
  // Unrecognized characters are skipped with a MATH_SYNTAX_ERROR warning.
  inline std::optional< std::int64_t > evaluate_math( const std::string& expr,
    GenerationContext& ctx );

namespace internal {

  enum class MathTokenType {
    Number,
    Operator,
    LParen,
    RParen,
    Variable,
    Placeholder,
    CaptureAccess,
    Dice,
    End
  };

  struct MathLexeme {
    MathTokenType type = MathTokenType::End;
    std::string text;
    std::int64_t number = 0;
    std::vector< std::string > properties; // CaptureAccess only
  };

  inline bool is_ident_char( char c ) { return is_word_char( c ); }

  // Characters that start no token are appended to skipped
  inline std::vector< MathLexeme > tokenize_math( const std::string& expr,
    std::string& skipped )
  {
    std::vector< MathLexeme > tokens;
    size_t i = 0;
    const size_t n = expr.size();

    while ( i < n ) {
      const char c = expr[ i ];

      if ( is_space(c) ) { ++i; continue; }

      if ( is_digit(c) ) {
        std::string num;
        while ( i < n && is_digit(expr[i]) ) num += expr[ i++ ];
        MathLexeme t;
        t.type = MathTokenType::Number;
        t.text = num;
        t.number = parse_int_prefix( num ).value_or( 0 );
        tokens.push_back( t );
        continue;
      }

      if ( c == '+' || c == '-' || c == '*' || c == '/' ) {
        tokens.push_back( MathLexeme{ MathTokenType::Operator, std::string(1, c), 0, {} } );
        ++i;
        continue;
      }

      if ( c == '(' ) {
        tokens.push_back( MathLexeme{ MathTokenType::LParen, "(", 0, {} } );
        ++i;
        continue;
      }
      if ( c == ')' ) {
        tokens.push_back( MathLexeme{ MathTokenType::RParen, ")", 0, {} } );
        ++i;
        continue;
      }

      if ( c == '$' ) {
        ++i;
        std::string name;
        while ( i < n && is_ident_char(expr[i]) ) name += expr[ i++ ];

        // $var.@prop[.@prop...]
        std::vector< std::string > props;
        while ( i + 1 < n && expr[i] == '.' && expr[i + 1] == '@' ) {
          i += 2;
          std::string prop;
          while ( i < n && is_ident_char(expr[i]) ) prop += expr[ i++ ];
          if ( !prop.empty() ) props.push_back( prop );
        }

        MathLexeme t;
        t.text = name;
        if ( !props.empty() ) {
          t.type = MathTokenType::CaptureAccess;
          t.properties = props;
        } else {
          t.type = MathTokenType::Variable;
        }
        tokens.push_back( t );
        continue;
      }

      if ( c == '@' ) {
        ++i;
        std::string ph;
        while ( i < n && (is_ident_char(expr[i]) || expr[i] == '.') ) ph += expr[ i++ ];
        tokens.push_back( MathLexeme{ MathTokenType::Placeholder, ph, 0, {} } );
        continue;
      }

      if ( expr.compare(i, 5, "dice:") == 0 ) {
        i += 5;
        std::string dice;
        while ( i < n && !is_space(expr[i]) && expr[i] != '+' && expr[i] != '-'
          && expr[i] != '*' && expr[i] != '/' && expr[i] != '(' && expr[i] != ')' )
        {
          dice += expr[ i++ ];
        }
        tokens.push_back( MathLexeme{ MathTokenType::Dice, dice, 0, {} } );
        continue;
      }

      skipped += c;
      ++i;
    }

    tokens.push_back( MathLexeme{} );
    return tokens;
  }

  // Checked int64 arithmetic, throwing on overflow
  inline std::int64_t checked_math( char op, std::int64_t a, std::int64_t b ) {
    std::int64_t out = 0;
    bool overflow = false;
    switch ( op ) {
      case '+': overflow = __builtin_add_overflow( a, b, &out ); break;
      case '-': overflow = __builtin_sub_overflow( a, b, &out ); break;
      case '*': overflow = __builtin_mul_overflow( a, b, &out ); break;
      default:
        overflow = b == -1 && a == std::numeric_limits< std::int64_t >::min();
        if ( !overflow ) out = a / b;
    }
    if ( overflow ) {
      throw Error( ErrorCode::Parse, "Integer overflow in '"
        + std::to_string(a) + ' ' + op + ' ' + std::to_string(b) + '\'' );
    }
    return out;
  }

  class MathParser {
  public:
    inline MathParser( std::vector< MathLexeme > tokens, GenerationContext& ctx )
      : tokens_( std::move(tokens) ), ctx_( ctx ) {}

    inline std::int64_t parse();

  private:
    inline const MathLexeme& current() const {
      static const MathLexeme end;
      return pos_ < tokens_.size() ? tokens_[ pos_ ] : end;
    }

    inline const MathLexeme& advance() {
      const MathLexeme& t = current();
      if ( t.type != MathTokenType::End ) ++pos_;
      return t;
    }

    inline bool at_operator( char a, char b ) const {
      const MathLexeme& t = current();
      return t.type == MathTokenType::Operator
        && ( t.text[0] == a || t.text[0] == b );
    }

    inline std::int64_t parse_expression();
    inline std::int64_t parse_term();
    inline std::int64_t parse_factor();
    inline std::int64_t parse_primary();
    inline std::int64_t capture_access( const MathLexeme& t );

    inline std::int64_t coerce( const std::optional< std::string >& value,
      const std::string& source );

    std::vector< MathLexeme > tokens_;
    size_t pos_ = 0;
    GenerationContext& ctx_;
  };

} // namespace tabula::internal

} // namespace tabula

inline std::int64_t tabula::internal::MathParser::parse() {
  const std::int64_t result = parse_expression();
  if ( current().type != MathTokenType::End ) {
    throw Error( ErrorCode::Parse, "Unexpected token: " + current().text );
  }
  return result;
}

inline std::int64_t tabula::internal::MathParser::parse_expression() {
  std::int64_t left = parse_term();
  while ( at_operator('+', '-') ) {
    const char op = advance().text[ 0 ];
    const std::int64_t right = parse_term();
    left = checked_math( op, left, right );
  }
  return left;
}

inline std::int64_t tabula::internal::MathParser::parse_term() {
  std::int64_t left = parse_factor();
  while ( at_operator('*', '/') ) {
    const char op = advance().text[ 0 ];
    const std::int64_t right = parse_factor();
    if ( op == '*' ) {
      left = checked_math( '*', left, right );
    } else if ( right == 0 ) {
      ctx_.warn( diag::DIVISION_BY_ZERO,
        "Division by zero in math expression, returning 0" );
      left = 0;
    } else {
      left = checked_math( '/', left, right );
    }
  }
  return left;
}

inline std::int64_t tabula::internal::MathParser::parse_factor() {
  const MathLexeme& t = current();
  if ( t.type == MathTokenType::Operator && t.text == "-" ) {
    advance();
    return checked_math( '-', 0, parse_factor() );
  }
  if ( t.type == MathTokenType::LParen ) {
    advance();
    const std::int64_t result = parse_expression();
    if ( current().type != MathTokenType::RParen ) {
      throw Error( ErrorCode::Parse, "Expected ')'" );
    }
    advance();
    return result;
  }
  return parse_primary();
}

inline std::int64_t tabula::internal::MathParser::parse_primary() {
  const MathLexeme t = advance();
  switch ( t.type ) {
    case MathTokenType::Number:
      return t.number;

    case MathTokenType::Variable:
      return coerce( ctx_.resolve_variable(t.text), '$' + t.text );

    case MathTokenType::Placeholder: {
      const std::vector< std::string > parts = split_segments( t.text );
      const std::string property = parts.size() > 1 ? parts[ 1 ] : "";
      return coerce( ctx_.get_placeholder(parts[0], property), '@' + t.text );
    }

    case MathTokenType::Dice:
      return roll_dice( t.text, ctx_.rng(), ctx_.config().max_exploding_dice ).total;

    case MathTokenType::CaptureAccess:
      return capture_access( t );

    default:
      throw Error( ErrorCode::Parse, t.type == MathTokenType::End
        ? "Unexpected end of expression" : "Unexpected token: " + t.text );
  }
}

// $var.@a.@b walks nested items of a shared variable
inline std::int64_t tabula::internal::MathParser::capture_access(
  const MathLexeme& t )
{
  const std::string full = '$' + t.text + ".@" + join( t.properties, ".@" );

  CaptureItemPtr current = ctx_.get_shared_variable( t.text );
  if ( !current ) {
    ctx_.warn( diag::COERCION_FAILURE, "Capture variable not found: $" + t.text );
    return 0;
  }

  for ( size_t i = 0; i < t.properties.size(); ++i ) {
    const SetValue* v = current->sets.get( t.properties[i] );
    const std::string walked = '$' + t.text + ".@" + join(
      std::vector< std::string >( t.properties.begin(),
        t.properties.begin() + i + 1 ), ".@" );
    if ( !v ) {
      ctx_.warn( diag::COERCION_FAILURE, "Property not found: " + walked );
      return 0;
    }
    if ( i + 1 == t.properties.size() ) return coerce( set_value_text(*v), full );

    CaptureItemPtr next = set_value_item( *v );
    if ( !next ) {
      ctx_.warn( diag::COERCION_FAILURE, "Cannot chain through string property: "
        + walked );
      return 0;
    }
    current = next;
  }
  return 0;
}

inline std::int64_t tabula::internal::MathParser::coerce(
  const std::optional< std::string >& value, const std::string& source )
{
  if ( !value ) {
    ctx_.warn( diag::COERCION_FAILURE, "Undefined value for " + source
      + ", using 0" );
    return 0;
  }
  if ( auto num = parse_int_prefix(*value) ) return *num;
  ctx_.warn( diag::COERCION_FAILURE, "Non-numeric value \"" + *value + "\" for "
    + source + ", using 0" );
  return 0;
}

inline std::optional< std::int64_t > tabula::evaluate_math(
  const std::string& expr, GenerationContext& ctx )
{
  try {
    std::string skipped;
    std::vector< internal::MathLexeme > tokens = internal::tokenize_math( expr, skipped );
    if ( !skipped.empty() ) {
      ctx.warn( diag::MATH_SYNTAX_ERROR, "Ignored characters \"" + skipped
        + "\" in math expression: " + expr );
    }
    internal::MathParser parser( std::move(tokens), ctx );
    return parser.parse();
  }
  catch ( const Error& e ) {
    ctx.warn( diag::MATH_SYNTAX_ERROR, "Math evaluation error: " + expr
      + " (" + e.what() + ")" );
    return std::nullopt;
  }
}
