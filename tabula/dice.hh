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
#include <functional>
#include <optional>
#include <random>
#include <regex>
#include <sstream>
#include <string>
#include <vector>

#include "tabula/types.hh"

namespace tabula {

  // Parsed form of NdS[kN|khN|klN][!][+M|-M|*M]
  struct DiceSpec {
    int count = 1;
    int sides = 6;
    std::optional< int > keep_highest;
    std::optional< int > keep_lowest;
    bool exploding = false;
    char modifier = '\0'; // '+', '-', '*' or none
    std::int64_t modifier_value = 0;
  };

  struct DiceResult {
    std::int64_t total = 0;
    std::vector< std::int64_t > rolls;
    std::vector< std::int64_t > kept;
    std::string expression; // canonical form
    std::string breakdown;
  };

namespace internal {

  inline constexpr int MAX_DICE_COUNT = 10000;
  inline constexpr int MAX_DICE_SIDES = 10000;

  inline std::string join_numbers( const std::vector< std::int64_t >& v ) {
    std::ostringstream oss;
    for ( size_t i = 0; i < v.size(); ++i ) {
      if ( i ) oss << ", ";
      oss << v[ i ];
    }
    return oss.str();
  }

  [[noreturn]] inline void throw_dice_error( const std::string& msg ) {
    throw Error( ErrorCode::Dice, msg );
  }

} // namespace tabula::internal

  inline DiceSpec parse_dice( const std::string& expression ) {
    static const std::regex dice_regex(
      R"(^(\d+)d(\d+)(k[hl]?\d+)?(!)?([+\-*]\d+)?$)" );

    std::string cleaned;
    for ( char c : expression ) {
      if ( !internal::is_space(c) ) cleaned += c;
    }
    cleaned = internal::to_lower( cleaned );

    std::smatch m;
    if ( !std::regex_match( cleaned, m, dice_regex ) ) {
      internal::throw_dice_error( "Invalid dice expression: " + expression );
    }

    const std::int64_t count = internal::parse_int_prefix( m[1].str() ).value_or( 0 );
    const std::int64_t sides = internal::parse_int_prefix( m[2].str() ).value_or( 0 );

    std::ostringstream nds;
    nds << count << 'd' << sides;
    if ( count < 1 || sides < 1 ) {
      internal::throw_dice_error( "Invalid dice: " + nds.str()
        + " - count and sides must be positive" );
    }
    if ( count > internal::MAX_DICE_COUNT ) {
      internal::throw_dice_error( "Too many dice: " + nds.str()
        + " - maximum 10,000 dice per roll" );
    }
    if ( sides > internal::MAX_DICE_SIDES ) {
      internal::throw_dice_error( "Dice sides too large: " + nds.str()
        + " - maximum 10,000 sides" );
    }

    DiceSpec spec;
    spec.count = static_cast< int >( count );
    spec.sides = static_cast< int >( sides );

    if ( m[3].matched ) {
      // "k3" and "kh3" both keep the highest dice
      const std::string keep = m[ 3 ].str();
      const bool lowest = keep.size() > 1 && keep[ 1 ] == 'l';
      const size_t digits_at = ( keep[1] == 'h' || keep[1] == 'l' ) ? 2 : 1;
      const std::int64_t value =
        internal::parse_int_prefix( keep.substr(digits_at) ).value_or( 0 );
      if ( value < 1 || value > count ) {
        std::ostringstream oss;
        oss << "Cannot keep " << value << " dice from " << nds.str();
        internal::throw_dice_error( oss.str() );
      }
      if ( lowest ) spec.keep_lowest = static_cast< int >( value );
      else spec.keep_highest = static_cast< int >( value );
    }

    spec.exploding = m[ 4 ].matched;

    if ( m[5].matched ) {
      const std::string mod = m[ 5 ].str();
      spec.modifier = mod[ 0 ];
      spec.modifier_value = internal::parse_int_prefix( mod.substr(1) ).value_or( 0 );
    }

    return spec;
  }

  // Canonical notation: keep modifiers are always written kh/kl
  inline std::string canonical_expression( const DiceSpec& spec ) {
    std::ostringstream oss;
    oss << spec.count << 'd' << spec.sides;
    if ( spec.keep_highest ) oss << "kh" << *spec.keep_highest;
    if ( spec.keep_lowest ) oss << "kl" << *spec.keep_lowest;
    if ( spec.exploding ) oss << '!';
    if ( spec.modifier ) oss << spec.modifier << spec.modifier_value;
    return oss.str();
  }

  inline DiceResult roll_dice( const DiceSpec& spec, std::mt19937& rng,
    int max_exploding_dice = EngineConfig::DEFAULT_MAX_EXPLODING_DICE )
  {
    std::uniform_int_distribution< int > face( 1, spec.sides );

    DiceResult result;
    int explosions = 0;
    for ( int i = 0; i < spec.count; ++i ) {
      int roll = face( rng );
      result.rolls.push_back( roll );

      // Exploding dice reroll on the maximum face, capped per expression
      if ( spec.exploding ) {
        while ( roll == spec.sides && explosions < max_exploding_dice ) {
          roll = face( rng );
          result.rolls.push_back( roll );
          ++explosions;
        }
      }
    }

    if ( spec.keep_highest || spec.keep_lowest ) {
      std::vector< std::int64_t > sorted = result.rolls;
      size_t keep = 0;
      if ( spec.keep_highest ) {
        std::sort( sorted.begin(), sorted.end(), std::greater< std::int64_t >() );
        keep = static_cast< size_t >( *spec.keep_highest );
      } else {
        std::sort( sorted.begin(), sorted.end() );
        keep = static_cast< size_t >( *spec.keep_lowest );
      }
      if ( keep < sorted.size() ) sorted.resize( keep );
      result.kept = sorted;
    } else {
      result.kept = result.rolls;
    }

    std::int64_t base = 0;
    for ( auto k : result.kept ) base += k;

    result.total = base;
    switch ( spec.modifier ) {
      case '+': result.total += spec.modifier_value; break;
      case '-': result.total -= spec.modifier_value; break;
      case '*': result.total *= spec.modifier_value; break;
      default: break;
    }

    result.expression = canonical_expression( spec );

    std::ostringstream bd;
    bd << '[' << internal::join_numbers( result.rolls ) << ']';
    if ( spec.keep_highest || spec.keep_lowest ) {
      bd << " → keep [" << internal::join_numbers( result.kept ) << ']';
    }
    if ( spec.modifier ) {
      bd << " → " << base << ' ' << spec.modifier << ' ' << spec.modifier_value;
    }
    bd << " = " << result.total;
    result.breakdown = bd.str();

    return result;
  }

  inline DiceResult roll_dice( const std::string& expression, std::mt19937& rng,
    int max_exploding_dice = EngineConfig::DEFAULT_MAX_EXPLODING_DICE )
  {
    return roll_dice( parse_dice(expression), rng, max_exploding_dice );
  }

  inline bool is_valid_dice_expression( const std::string& expression ) {
    try {
      parse_dice( expression );
      return true;
    } catch ( const Error& ) {
      return false;
    }
  }

  // Bodies of every {{dice:...}} expression in a pattern
  inline std::vector< std::string > extract_dice_expressions(
    const std::string& pattern )
  {
    static const std::regex dice_expr( R"(\{\{dice:([^}]+)\}\})" );
    std::vector< std::string > out;
    for ( auto it = std::sregex_iterator( pattern.begin(), pattern.end(), dice_expr );
      it != std::sregex_iterator(); ++it )
    {
      out.push_back( (*it)[1].str() );
    }
    return out;
  }

} // namespace tabula
