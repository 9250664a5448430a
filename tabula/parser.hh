// ╺┳╸┏━┓┏┓ ╻ ╻╻  ┏━┓
//  ┃ ┣━┫┣┻┓┃ ┃┃  ┣━┫
//  ╹ ╹ ╹┗━┛┗━┛┗━╸╹ ╹
//  Random table & template generation engine
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>
#include <regex>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "tabula/types.hh"
#include "tabula/util.hh"

namespace tabula {

  // Token payloads. Optional fields that the expression did not spell out
  // are left empty; empty property lists mean "no property access".

  struct LiteralToken {
    std::string text;
  };

  struct TableToken {
    std::string table_id;
    std::optional< std::string > alias;
    std::optional< std::string > ns;
    std::vector< std::string > properties;
  };

  struct DiceToken {
    std::string expression;
  };

  struct MathToken {
    std::string expression;
  };

  struct VariableToken {
    std::string name;
    std::optional< std::string > alias;
  };

  struct PlaceholderToken {
    std::string name;
    std::vector< std::string > properties; // without '@'
  };

  struct AgainToken {
    std::optional< int > count;
    bool unique = false;
    std::optional< std::string > separator;
  };

  // A repeat count is either a literal or the name of a variable
  using RollCount = std::variant< int, std::string >;

  struct MultiRollToken {
    RollCount count = 1;
    std::optional< std::string > dice_count; // e.g. "1d4" in dice:1d4*table
    std::string table_id;
    std::optional< std::string > alias;
    std::optional< std::string > ns;
    bool unique = false;
    std::optional< std::string > separator;
  };

  struct InstanceToken {
    std::string table_id;
    std::string instance_name;
  };

  struct CaptureMultiRollToken {
    RollCount count = 0;
    std::optional< std::string > dice_count;
    std::string table_id;
    std::optional< std::string > alias;
    std::optional< std::string > ns;
    bool unique = false;
    std::string capture_var; // without '$'
    std::optional< std::string > separator;
    bool silent = false;
  };

  struct CaptureAccessToken {
    std::string var_name;
    std::optional< int > index; // negative counts from the end
    std::vector< std::string > properties;
    std::optional< std::string > separator;
  };

  struct CollectToken {
    std::string var_name;
    std::string property; // without '@'
    bool unique = false;
    std::optional< std::string > separator;
  };

  struct SwitchClause {
    std::string condition;
    std::string result_expr;
  };

  struct SwitchModifiers {
    std::vector< SwitchClause > clauses; // first match wins
    std::optional< std::string > else_expr;
  };

  struct SwitchToken {
    std::vector< SwitchClause > clauses;
    std::optional< std::string > else_expr;
  };

  using TokenPayload = std::variant<
    LiteralToken,
    TableToken,
    DiceToken,
    MathToken,
    VariableToken,
    PlaceholderToken,
    AgainToken,
    MultiRollToken,
    InstanceToken,
    CaptureMultiRollToken,
    CaptureAccessToken,
    CollectToken,
    SwitchToken
  >;

  // A parsed expression. Any token other than a standalone switch may carry
  // trailing .switch[...].else[...] modifiers.
  struct ExpressionToken {
    TokenPayload payload;
    std::optional< SwitchModifiers > switch_modifiers;

    template < typename T >
    bool is() const { return std::holds_alternative< T >( payload ); }

    template < typename T >
    const T& as() const { return std::get< T >( payload ); }
  };

  // Location of one {{...}} span within a pattern
  struct ExpressionMatch {
    size_t start = 0;
    size_t end = 0; // one past the closing braces
    std::string expression; // trimmed body
    std::string raw; // including braces
  };

  inline std::vector< ExpressionMatch > extract_expressions(
    const std::string& text );
  inline ExpressionToken parse_expression( const std::string& expr );
  inline std::vector< ExpressionToken > parse_template( const std::string& pattern );
  inline bool has_expressions( const std::string& text );
  inline std::vector< std::string > get_referenced_tables(
    const std::string& pattern );
  inline std::vector< std::string > get_referenced_variables(
    const std::string& pattern );

  // Lookup key for a reference: "ns.id", "alias.id" or "id"
  template < typename RefToken >
  inline std::string qualified_ref( const RefToken& t ) {
    if ( t.ns ) return *t.ns + '.' + t.table_id;
    if ( t.alias ) return *t.alias + '.' + t.table_id;
    return t.table_id;
  }

  inline const char* token_type_name( const ExpressionToken& token );
  inline ordered_node to_node( const ExpressionToken& token );

namespace internal {

  inline constexpr char ESCAPE = '\\';
  inline const std::string OPEN_EXPR = "{{";
  inline const std::string CLOSE_EXPR = "}}";

  [[noreturn]] inline void throw_parse_error( const std::string& msg ) {
    throw Error( ErrorCode::Parse, msg );
  }

  inline bool at( const std::string& s, size_t i, const std::string& what ) {
    return s.compare( i, what.size(), what ) == 0;
  }

  inline std::string unescape_braces( std::string text ) {
    replace_all( text, "\\{{", OPEN_EXPR );
    replace_all( text, "\\}}", CLOSE_EXPR );
    return text;
  }

  inline bool contains_part( const std::vector< std::string >& parts,
    const std::string& p )
  {
    return std::find( parts.begin(), parts.end(), p ) != parts.end();
  }

  inline int to_count( const std::string& digits ) {
    const std::int64_t v = parse_int_prefix( digits ).value_or( 0 );
    if ( v > std::numeric_limits< int >::max() ) {
      return std::numeric_limits< int >::max();
    }
    if ( v < std::numeric_limits< int >::min() ) {
      return std::numeric_limits< int >::min();
    }
    return static_cast< int >( v );
  }

  // Digits, "$name" (stored without the '$'), or 1
  inline RollCount parse_roll_count( const std::string& part ) {
    if ( is_all_digits(part) ) return to_count( part );
    if ( starts_with(part, "$") ) return part.substr( 1 );
    return 1;
  }

  // Table named by a "*"-split multi-roll body: the last part, skipping a
  // trailing "unique"
  inline std::string multi_roll_table_part( const std::vector< std::string >& parts )
  {
    std::string table = parts.back();
    if ( table == "unique" && parts.size() > 2 ) table = parts[ parts.size() - 2 ];
    return table;
  }

  // Splits a trailing |"sep" off an expression. The main part ends at the
  // first '|'.
  inline std::optional< std::string > split_separator( const std::string& expr,
    const std::regex& re, std::string& main )
  {
    std::smatch m;
    main = expr;
    if ( !std::regex_search( expr, m, re ) ) return std::nullopt;
    main = expr.substr( 0, expr.find('|') );
    return m[ 1 ].str();
  }

  inline std::vector< std::string > parse_property_chain( const std::string& part ) {
    std::vector< std::string > props = split_segments( part );
    for ( auto& p : props ) {
      if ( starts_with(p, "@") ) p = p.substr( 1 );
    }
    return props;
  }

  // Index of the first colon outside quotes and brackets, or npos
  inline size_t find_unquoted_colon( const std::string& str ) {
    int depth = 0;
    bool in_quote = false;
    char quote_char = '\0';
    for ( size_t i = 0; i < str.size(); ++i ) {
      const char c = str[ i ];
      const char prev = i > 0 ? str[ i - 1 ] : '\0';
      if ( in_quote ) {
        if ( c == quote_char && prev != ESCAPE ) in_quote = false;
      }
      else if ( c == '"' || c == '\'' ) {
        in_quote = true;
        quote_char = c;
      }
      else if ( c == '[' || c == '(' || c == '{' ) ++depth;
      else if ( c == ']' || c == ')' || c == '}' ) --depth;
      else if ( c == ':' && depth == 0 ) return i;
    }
    return std::string::npos;
  }

  struct TrailingModifier {
    std::string content;
    std::string remaining;
  };

  // Finds the right-most ".name[...]" whose brackets close exactly at the
  // end of expr. Quotes and nested brackets are honored.
  inline std::optional< TrailingModifier > extract_trailing_modifier(
    const std::string& expr, const std::string& name )
  {
    const std::string suffix = '.' + name + '[';
    size_t search_pos = expr.size();
    while ( search_pos > 0 ) {
      const size_t mod_start = expr.rfind( suffix, search_pos - 1 );
      if ( mod_start == std::string::npos ) return std::nullopt;

      int depth = 1;
      size_t i = mod_start + suffix.size();
      bool in_quote = false;
      char quote_char = '\0';
      while ( i < expr.size() && depth > 0 ) {
        const char c = expr[ i ];
        const char prev = i > 0 ? expr[ i - 1 ] : '\0';
        if ( in_quote ) {
          if ( c == quote_char && prev != ESCAPE ) in_quote = false;
        }
        else if ( c == '"' || c == '\'' ) {
          in_quote = true;
          quote_char = c;
        }
        else if ( c == '[' ) ++depth;
        else if ( c == ']' ) --depth;
        ++i;
      }

      if ( depth == 0 && i == expr.size() ) {
        const size_t content_start = mod_start + suffix.size();
        return TrailingModifier{ expr.substr( content_start, i - 1 - content_start ),
          expr.substr( 0, mod_start ) };
      }
      search_pos = mod_start;
    }
    return std::nullopt;
  }

  inline SwitchClause make_clause( const std::string& content,
    const std::string& shown )
  {
    const size_t colon = find_unquoted_colon( content );
    if ( colon == std::string::npos ) {
      throw_parse_error( "Invalid switch syntax - missing colon: " + shown );
    }
    return SwitchClause{ trim( content.substr(0, colon) ),
      trim( content.substr(colon + 1) ) };
  }

  // Strips trailing .else[...] and .switch[...] clauses off remaining,
  // keeping declaration order
  inline SwitchModifiers strip_switch_clauses( std::string& remaining ) {
    SwitchModifiers mods;
    if ( auto else_match = extract_trailing_modifier(remaining, "else") ) {
      mods.else_expr = else_match->content;
      remaining = else_match->remaining;
    }
    while ( auto sw = extract_trailing_modifier(remaining, "switch") ) {
      mods.clauses.insert( mods.clauses.begin(),
        make_clause( sw->content, ".switch[" + sw->content + "]" ) );
      remaining = sw->remaining;
    }
    return mods;
  }

  inline SwitchToken parse_switch_expression( const std::string& expr ) {
    static const std::regex initial_re( R"(^switch\[(.+)\]$)" );

    std::string remaining = expr;
    SwitchModifiers mods = strip_switch_clauses( remaining );

    std::smatch m;
    if ( std::regex_match( remaining, m, initial_re ) ) {
      const std::string body = m[ 1 ].str();
      mods.clauses.insert( mods.clauses.begin(),
        make_clause( body, "switch[" + body + "]" ) );
    }
    else if ( !remaining.empty() ) {
      throw_parse_error( "Invalid switch expression: " + expr );
    }

    if ( mods.clauses.empty() ) {
      throw_parse_error( "Switch expression has no clauses: " + expr );
    }
    return SwitchToken{ mods.clauses, mods.else_expr };
  }

  inline TableToken parse_table_reference( const std::string& expr ) {
    const std::vector< std::string > parts = split_segments( expr );
    TableToken t;
    if ( parts.size() == 1 ) {
      t.table_id = parts[ 0 ];
      return t;
    }

    size_t first_at = parts.size();
    for ( size_t i = 0; i < parts.size(); ++i ) {
      if ( starts_with(parts[i], "@") ) { first_at = i; break; }
    }

    if ( first_at < parts.size() ) {
      for ( size_t i = first_at; i < parts.size(); ++i ) {
        const std::string& p = parts[ i ];
        t.properties.push_back( starts_with(p, "@") ? p.substr(1) : p );
      }
      if ( first_at == 0 ) {
        // Unresolvable as written; keeps the whole text as the id
        t.table_id = expr;
        t.properties.clear();
        return t;
      }
    }

    const size_t n_table = first_at; // parts before any property
    if ( n_table == 1 ) {
      t.table_id = parts[ 0 ];
    } else if ( n_table == 2 ) {
      t.alias = parts[ 0 ];
      t.table_id = parts[ 1 ];
    } else {
      t.ns = join_path( parts, 0, n_table - 1 );
      t.table_id = parts[ n_table - 1 ];
    }
    return t;
  }

  inline bool is_capture_access_pattern( const std::string& expr ) {
    const std::string after = expr.substr( 1 );
    return contains( after, "[" )
      || ends_with( after, ".count" )
      || ends_with( after, ".value" )
      || contains( after, "|\"" )
      || contains( after, ".@" );
  }

  inline AgainToken parse_again( const std::string& expr ) {
    static const std::regex sep_re( R"(\|\s*"([^"]*)"$)" );
    AgainToken t;
    std::string main;
    t.separator = split_separator( expr, sep_re, main );
    if ( main == "again" ) return t;

    const std::vector< std::string > parts = split_segments( main, '*' );
    if ( parts.size() >= 2 ) {
      if ( is_all_digits(parts[0]) ) t.count = to_count( parts[0] );
      if ( contains_part(parts, "unique") ) t.unique = true;
    }
    return t;
  }

  inline MultiRollToken parse_multi_roll_with_dice_count( const std::string& expr ) {
    static const std::regex sep_re( R"(\|"([^"]*)"$)" );
    MultiRollToken t;
    std::string main;
    t.separator = split_separator( expr, sep_re, main );

    const std::vector< std::string > parts = split_segments( main, '*' );
    t.count = 0;
    t.dice_count = parts[ 0 ];
    t.unique = contains_part( parts, "unique" );

    const TableToken ref = parse_table_reference( multi_roll_table_part(parts) );
    t.table_id = ref.table_id;
    t.alias = ref.alias;
    t.ns = ref.ns;
    return t;
  }

  inline MultiRollToken parse_multi_roll( const std::string& expr ) {
    static const std::regex sep_re( R"(\|"([^"]*)"$)" );
    MultiRollToken t;
    std::string main;
    t.separator = split_separator( expr, sep_re, main );

    const std::vector< std::string > parts = split_segments( main, '*' );
    t.count = parse_roll_count( parts[0] );
    t.unique = contains_part( parts, "unique" );

    const TableToken ref = parse_table_reference( multi_roll_table_part(parts) );
    t.table_id = ref.table_id;
    t.alias = ref.alias;
    t.ns = ref.ns;
    return t;
  }

  inline CaptureMultiRollToken parse_capture_multi_roll( const std::string& expr ) {
    static const std::regex capture_re( R"((.+?)\s*>>\s*\$(\w+)(.*)$)" );
    static const std::regex sep_re( R"(\|"([^"]*)")" );

    std::smatch m;
    if ( !std::regex_search( expr, m, capture_re ) ) {
      throw_parse_error( "Invalid capture multi-roll syntax: " + expr );
    }
    const std::string roll_part = trim( m[1].str() );
    CaptureMultiRollToken t;
    t.capture_var = m[ 2 ].str();

    std::optional< std::string > separator;
    const std::string modifiers = trim( m[3].str() );
    if ( !modifiers.empty() ) {
      if ( contains(modifiers, "|silent") ) t.silent = true;
      std::smatch sm;
      if ( std::regex_search( modifiers, sm, sep_re ) ) separator = sm[ 1 ].str();
    }
    if ( !t.silent ) t.separator = separator;

    std::string main = roll_part;
    if ( starts_with(roll_part, "dice:") ) {
      main = trim( roll_part.substr(5) );
      const size_t star = main.find( '*' );
      if ( star != std::string::npos && star > 0 ) {
        t.dice_count = main.substr( 0, star );
        main = main.substr( star + 1 );
      }
    }

    const std::vector< std::string > parts = split_segments( main, '*' );
    t.unique = contains_part( parts, "unique" );

    std::string table;
    if ( t.dice_count && !t.dice_count->empty() ) {
      t.count = 0;
      for ( const auto& p : parts ) if ( p != "unique" ) table = p;
    } else {
      t.count = parse_roll_count( parts[0] );
      table = multi_roll_table_part( parts );
    }

    const TableToken ref = parse_table_reference( table );
    t.table_id = ref.table_id;
    t.alias = ref.alias;
    t.ns = ref.ns;
    return t;
  }

  inline CaptureAccessToken parse_capture_access( const std::string& expr ) {
    static const std::regex sep_re( R"(^(.+?)\|"([^"]*)"$)" );
    static const std::regex index_re( R"(^(\w+)\[(-?\d+)\](?:\.(.+))?$)" );
    static const std::regex prop_re( R"(^(\w+)\.(.+)$)" );
    static const std::regex simple_re( R"(^(\w+)$)" );

    std::string content = expr.substr( 1 );
    CaptureAccessToken t;

    std::smatch m;
    if ( std::regex_match( content, m, sep_re ) ) {
      t.separator = m[ 2 ].str();
      content = m[ 1 ].str();
    }

    if ( std::regex_match( content, m, index_re ) ) {
      t.var_name = m[ 1 ].str();
      t.index = to_count( m[2].str() );
      if ( m[3].matched ) t.properties = parse_property_chain( m[3].str() );
      return t;
    }
    if ( std::regex_match( content, m, prop_re ) ) {
      t.var_name = m[ 1 ].str();
      t.properties = parse_property_chain( m[2].str() );
      return t;
    }
    if ( std::regex_match( content, m, simple_re ) ) {
      t.var_name = m[ 1 ].str();
      return t;
    }
    throw_parse_error( "Invalid capture access syntax: " + expr );
  }

  inline CollectToken parse_collect( const std::string& expr ) {
    static const std::regex collect_re( R"(^\$(\w+)\.(@?\w+)(.*)$)" );
    static const std::regex sep_re( R"(\|"([^"]*)")" );

    const std::string content = trim( expr.substr(8) );
    std::smatch m;
    if ( !std::regex_match( content, m, collect_re ) ) {
      throw_parse_error( "Invalid collect syntax: " + expr );
    }

    CollectToken t;
    t.var_name = m[ 1 ].str();
    const std::string prop = m[ 2 ].str();
    t.property = starts_with( prop, "@" ) ? prop.substr( 1 ) : prop;

    const std::string modifiers = m[ 3 ].str();
    if ( !modifiers.empty() ) {
      if ( contains(modifiers, "|unique") ) t.unique = true;
      std::smatch sm;
      if ( std::regex_search( modifiers, sm, sep_re ) ) t.separator = sm[ 1 ].str();
    }
    return t;
  }

  // Classifies an expression body that carries no switch modifiers
  inline TokenPayload parse_base_expression( const std::string& expr ) {
    static const std::regex dice_multi_re( R"(^[^*]+\*[a-zA-Z])" );
    static const std::regex again_re( R"(\*again(\|\s*"[^"]*")?$)" );
    static const std::regex multi_re( R"(^(\d+\*|\$\w+(\.\w+)?\*))" );

    const std::string t = trim( expr );
    const bool has_capture = contains( t, " >> $" ) || contains( t, ">>$" );

    if ( starts_with(t, "collect:") ) return parse_collect( t );

    if ( has_capture ) return parse_capture_multi_roll( t );

    if ( starts_with(t, "$") && !contains(t, "*") && is_capture_access_pattern(t) ) {
      return parse_capture_access( t );
    }

    if ( starts_with(t, "dice:") ) {
      const std::string after = trim( t.substr(5) );
      if ( std::regex_search(after, dice_multi_re) ) {
        return parse_multi_roll_with_dice_count( after );
      }
      return DiceToken{ after };
    }

    if ( starts_with(t, "math:") ) return MathToken{ trim( t.substr(5) ) };

    if ( starts_with(t, "$") && !contains(t, "*") ) {
      const std::string var = t.substr( 1 );
      const size_t dot = var.find( '.' );
      VariableToken v;
      if ( dot != std::string::npos && dot > 0 ) {
        v.alias = var.substr( 0, dot );
        v.name = var.substr( dot + 1 );
      } else {
        v.name = var;
      }
      return v;
    }

    if ( starts_with(t, "@") ) {
      const std::string body = t.substr( 1 );
      const size_t dot = body.find( '.' );
      PlaceholderToken p;
      if ( dot != std::string::npos && dot > 0 ) {
        p.name = body.substr( 0, dot );
        p.properties = parse_property_chain( body.substr(dot + 1) );
      } else {
        p.name = body;
      }
      return p;
    }

    if ( t == "again" || starts_with(t, "again|") || std::regex_search(t, again_re) ) {
      return parse_again( t );
    }

    if ( contains(t, "#") ) {
      const size_t sep_start = t.find( "|\"" );
      const size_t hash = t.find( '#' );
      if ( sep_start == std::string::npos || hash < sep_start ) {
        const std::vector< std::string > parts = split_segments( t, '#' );
        return InstanceToken{ trim( parts[0] ), trim( parts[1] ) };
      }
    }

    if ( std::regex_search(t, multi_re) ) return parse_multi_roll( t );

    return parse_table_reference( t );
  }

  inline void add_unique( std::vector< std::string >& out, const std::string& s ) {
    if ( !contains_part(out, s) ) out.push_back( s );
  }

} // namespace tabula::internal

} // namespace tabula

inline std::vector< tabula::ExpressionMatch > tabula::extract_expressions(
  const std::string& text )
{
  using internal::at;
  using internal::ESCAPE;
  using internal::OPEN_EXPR;
  using internal::CLOSE_EXPR;

  std::vector< ExpressionMatch > matches;
  size_t i = 0;
  while ( i < text.size() ) {
    if ( text[i] == ESCAPE && at(text, i + 1, OPEN_EXPR) ) {
      i += 3;
      continue;
    }
    if ( !at(text, i, OPEN_EXPR) ) {
      ++i;
      continue;
    }

    const size_t start = i;
    i += 2;
    const size_t expr_start = i;
    int depth = 1;
    while ( i < text.size() && depth > 0 ) {
      if ( text[i] == ESCAPE && at(text, i + 1, CLOSE_EXPR) ) {
        i += 3;
        continue;
      }
      if ( at(text, i, OPEN_EXPR) ) {
        ++depth;
        i += 2;
      }
      else if ( at(text, i, CLOSE_EXPR) ) {
        --depth;
        if ( depth == 0 ) {
          ExpressionMatch m;
          m.start = start;
          m.end = i + 2;
          m.expression = internal::trim( text.substr(expr_start, i - expr_start) );
          m.raw = text.substr( start, i + 2 - start );
          matches.push_back( std::move(m) );
        }
        i += 2;
      }
      else {
        ++i;
      }
    }
  }
  return matches;
}

inline tabula::ExpressionToken tabula::parse_expression( const std::string& expr )
{
  const std::string t = internal::trim( expr );
  if ( internal::starts_with(t, "switch[") ) {
    return ExpressionToken{ internal::parse_switch_expression( t ), std::nullopt };
  }

  std::string base = t;
  SwitchModifiers mods = internal::strip_switch_clauses( base );
  if ( mods.clauses.empty() && !mods.else_expr ) {
    return ExpressionToken{ internal::parse_base_expression( t ), std::nullopt };
  }
  return ExpressionToken{ internal::parse_base_expression( base ), mods };
}

inline std::vector< tabula::ExpressionToken > tabula::parse_template(
  const std::string& pattern )
{
  std::vector< ExpressionToken > tokens;
  size_t last_end = 0;

  auto push_literal = [&]( size_t from, size_t to ) {
    const std::string text = internal::unescape_braces(
      pattern.substr( from, to - from ) );
    if ( !text.empty() ) {
      tokens.push_back( ExpressionToken{ LiteralToken{ text }, std::nullopt } );
    }
  };

  for ( const auto& m : extract_expressions(pattern) ) {
    if ( m.start > last_end ) push_literal( last_end, m.start );
    tokens.push_back( parse_expression(m.expression) );
    last_end = m.end;
  }
  if ( last_end < pattern.size() ) push_literal( last_end, pattern.size() );

  return tokens;
}

inline bool tabula::has_expressions( const std::string& text ) {
  return !extract_expressions( text ).empty();
}

inline std::vector< std::string > tabula::get_referenced_tables(
  const std::string& pattern )
{
  std::vector< std::string > ids;
  for ( const auto& token : parse_template(pattern) ) {
    if ( token.is< TableToken >() ) {
      internal::add_unique( ids, token.as< TableToken >().table_id );
    } else if ( token.is< MultiRollToken >() ) {
      internal::add_unique( ids, token.as< MultiRollToken >().table_id );
    } else if ( token.is< InstanceToken >() ) {
      internal::add_unique( ids, token.as< InstanceToken >().table_id );
    } else if ( token.is< CaptureMultiRollToken >() ) {
      internal::add_unique( ids, token.as< CaptureMultiRollToken >().table_id );
    }
  }
  return ids;
}

inline std::vector< std::string > tabula::get_referenced_variables(
  const std::string& pattern )
{
  std::vector< std::string > names;
  for ( const auto& token : parse_template(pattern) ) {
    if ( token.is< VariableToken >() ) {
      internal::add_unique( names, token.as< VariableToken >().name );
    }
    else if ( token.is< MultiRollToken >() ) {
      const auto& count = token.as< MultiRollToken >().count;
      if ( const auto* s = std::get_if< std::string >( &count ) ) {
        internal::add_unique( names, *s );
      }
    }
    else if ( token.is< CaptureMultiRollToken >() ) {
      const auto& cmr = token.as< CaptureMultiRollToken >();
      if ( const auto* s = std::get_if< std::string >( &cmr.count ) ) {
        internal::add_unique( names, *s );
      }
      internal::add_unique( names, cmr.capture_var );
    }
    else if ( token.is< CaptureAccessToken >() ) {
      internal::add_unique( names, token.as< CaptureAccessToken >().var_name );
    }
    else if ( token.is< CollectToken >() ) {
      internal::add_unique( names, token.as< CollectToken >().var_name );
    }
  }
  return names;
}

inline const char* tabula::token_type_name( const ExpressionToken& token ) {
  static const char* const names[] = { "literal", "table", "dice", "math",
    "variable", "placeholder", "again", "multiRoll", "instance",
    "captureMultiRoll", "captureAccess", "collect", "switch" };
  return names[ token.payload.index() ];
}

// Compact description of a token, used as parsed trace input
inline tabula::ordered_node tabula::to_node( const ExpressionToken& token ) {
  using internal::make_node_from;

  ordered_node n = ordered_node::mapping();
  n[ "type" ] = make_node_from( std::string( token_type_name(token) ) );

  auto put_opt = [&]( const char* key, const std::optional< std::string >& v ) {
    if ( v ) n[ key ] = make_node_from( *v );
  };
  auto put_count = [&]( const RollCount& c ) {
    if ( const auto* i = std::get_if< int >( &c ) ) {
      n[ "count" ] = make_node_from( static_cast< std::int64_t >( *i ) );
    } else {
      n[ "count" ] = make_node_from( std::get< std::string >( c ) );
    }
  };
  auto put_props = [&]( const std::vector< std::string >& props ) {
    if ( !props.empty() ) n[ "properties" ] = internal::make_string_sequence( props );
  };

  std::visit( [&]( const auto& t ) {
    using T = std::decay_t< decltype(t) >;
    if constexpr ( std::is_same_v< T, LiteralToken > ) {
      n[ "text" ] = make_node_from( t.text );
    }
    else if constexpr ( std::is_same_v< T, TableToken > ) {
      n[ "tableId" ] = make_node_from( t.table_id );
      put_opt( "alias", t.alias );
      put_opt( "namespace", t.ns );
      put_props( t.properties );
    }
    else if constexpr ( std::is_same_v< T, DiceToken >
      || std::is_same_v< T, MathToken > )
    {
      n[ "expression" ] = make_node_from( t.expression );
    }
    else if constexpr ( std::is_same_v< T, VariableToken > ) {
      n[ "name" ] = make_node_from( t.name );
      put_opt( "alias", t.alias );
    }
    else if constexpr ( std::is_same_v< T, PlaceholderToken > ) {
      n[ "name" ] = make_node_from( t.name );
      put_props( t.properties );
    }
    else if constexpr ( std::is_same_v< T, AgainToken > ) {
      if ( t.count ) n[ "count" ] = make_node_from( static_cast< std::int64_t >( *t.count ) );
      n[ "unique" ] = make_node_from( t.unique );
      put_opt( "separator", t.separator );
    }
    else if constexpr ( std::is_same_v< T, MultiRollToken > ) {
      put_count( t.count );
      put_opt( "diceCount", t.dice_count );
      n[ "tableId" ] = make_node_from( t.table_id );
      put_opt( "alias", t.alias );
      put_opt( "namespace", t.ns );
      n[ "unique" ] = make_node_from( t.unique );
      put_opt( "separator", t.separator );
    }
    else if constexpr ( std::is_same_v< T, InstanceToken > ) {
      n[ "tableId" ] = make_node_from( t.table_id );
      n[ "instanceName" ] = make_node_from( t.instance_name );
    }
    else if constexpr ( std::is_same_v< T, CaptureMultiRollToken > ) {
      put_count( t.count );
      put_opt( "diceCount", t.dice_count );
      n[ "tableId" ] = make_node_from( t.table_id );
      put_opt( "alias", t.alias );
      put_opt( "namespace", t.ns );
      n[ "unique" ] = make_node_from( t.unique );
      n[ "captureVar" ] = make_node_from( t.capture_var );
      put_opt( "separator", t.separator );
      n[ "silent" ] = make_node_from( t.silent );
    }
    else if constexpr ( std::is_same_v< T, CaptureAccessToken > ) {
      n[ "varName" ] = make_node_from( t.var_name );
      if ( t.index ) n[ "index" ] = make_node_from( static_cast< std::int64_t >( *t.index ) );
      put_props( t.properties );
      put_opt( "separator", t.separator );
    }
    else if constexpr ( std::is_same_v< T, CollectToken > ) {
      n[ "varName" ] = make_node_from( t.var_name );
      n[ "property" ] = make_node_from( t.property );
      n[ "unique" ] = make_node_from( t.unique );
      put_opt( "separator", t.separator );
    }
    else if constexpr ( std::is_same_v< T, SwitchToken > ) {
      n[ "clauses" ] = make_node_from(
        static_cast< std::int64_t >( t.clauses.size() ) );
      put_opt( "else", t.else_expr );
    }
  }, token.payload );

  if ( token.switch_modifiers ) {
    n[ "switchClauses" ] = make_node_from(
      static_cast< std::int64_t >( token.switch_modifiers->clauses.size() ) );
  }
  return n;
}
