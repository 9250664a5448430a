// Standard library includes
#include <random>
#include <string>

#include <gtest/gtest.h>

#include "tabula/dice.hh"

using namespace tabula;

TEST( Dice, ParsesFullNotation ) {
  DiceSpec spec = parse_dice( "4d6kh3!+2" );
  EXPECT_EQ( spec.count, 4 );
  EXPECT_EQ( spec.sides, 6 );
  EXPECT_EQ( spec.keep_highest.value(), 3 );
  EXPECT_FALSE( spec.keep_lowest.has_value() );
  EXPECT_TRUE( spec.exploding );
  EXPECT_EQ( spec.modifier, '+' );
  EXPECT_EQ( spec.modifier_value, 2 );
}

TEST( Dice, ShortKeepMeansHighest ) {
  DiceSpec spec = parse_dice( "4d6k3" );
  EXPECT_EQ( spec.keep_highest.value(), 3 );
  EXPECT_EQ( canonical_expression(spec), "4d6kh3" );
}

TEST( Dice, IgnoresCaseAndSpaces ) {
  DiceSpec spec = parse_dice( " 2D8 KL1 * 3 " );
  EXPECT_EQ( spec.count, 2 );
  EXPECT_EQ( spec.sides, 8 );
  EXPECT_EQ( spec.keep_lowest.value(), 1 );
  EXPECT_EQ( spec.modifier, '*' );
  EXPECT_EQ( spec.modifier_value, 3 );
}

TEST( Dice, RejectsBadExpressions ) {
  EXPECT_THROW( parse_dice("d6"), Error );
  EXPECT_THROW( parse_dice("0d6"), Error );
  EXPECT_THROW( parse_dice("2d0"), Error );
  EXPECT_THROW( parse_dice("10001d6"), Error );
  EXPECT_THROW( parse_dice("1d10001"), Error );
  EXPECT_THROW( parse_dice("2d6kh3"), Error );
  EXPECT_THROW( parse_dice("2d6/2"), Error );

  try {
    parse_dice( "2d6kh3" );
    FAIL() << "expected a dice error";
  } catch ( const Error& e ) {
    EXPECT_EQ( e.code(), ErrorCode::Dice );
    EXPECT_EQ( std::string(e.what()), "Cannot keep 3 dice from 2d6" );
  }
}

TEST( Dice, RollsStayInRange ) {
  std::mt19937 rng( 42 );
  for ( int i = 0; i < 200; ++i ) {
    DiceResult r = roll_dice( "3d6+1", rng );
    EXPECT_GE( r.total, 4 );
    EXPECT_LE( r.total, 19 );
    EXPECT_EQ( r.rolls.size(), 3u );
    EXPECT_EQ( r.kept, r.rolls );
    EXPECT_EQ( r.expression, "3d6+1" );
  }
}

TEST( Dice, KeepHighestKeepsLargestDice ) {
  std::mt19937 rng( 7 );
  DiceResult r = roll_dice( "4d6kh3", rng );
  ASSERT_EQ( r.rolls.size(), 4u );
  ASSERT_EQ( r.kept.size(), 3u );
  std::int64_t smallest = r.rolls[ 0 ];
  std::int64_t sum = 0;
  for ( auto v : r.rolls ) {
    sum += v;
    if ( v < smallest ) smallest = v;
  }
  EXPECT_EQ( r.total, sum - smallest );
  EXPECT_NE( r.breakdown.find("keep"), std::string::npos );
}

TEST( Dice, ExplodingDiceAreCapped ) {
  // A one-sided die always shows its maximum face
  std::mt19937 rng( 1 );
  DiceResult r = roll_dice( "1d1!", rng, 5 );
  EXPECT_EQ( r.rolls.size(), 6u );
  EXPECT_EQ( r.total, 6 );
}

TEST( Dice, SameSeedSameRolls ) {
  std::mt19937 a( 99 ), b( 99 );
  for ( int i = 0; i < 20; ++i ) {
    EXPECT_EQ( roll_dice("2d20", a).rolls, roll_dice("2d20", b).rolls );
  }
}

TEST( Dice, BreakdownShowsModifier ) {
  std::mt19937 rng( 3 );
  DiceResult r = roll_dice( "1d1*4", rng );
  EXPECT_EQ( r.total, 4 );
  EXPECT_EQ( r.breakdown, "[1] → 1 * 4 = 4" );
}

TEST( Dice, ValidityAndExtraction ) {
  EXPECT_TRUE( is_valid_dice_expression("1d20") );
  EXPECT_FALSE( is_valid_dice_expression("banana") );
  auto exprs = extract_dice_expressions( "hit {{dice:1d8+2}} and {{dice:2d6}}" );
  ASSERT_EQ( exprs.size(), 2u );
  EXPECT_EQ( exprs[0], "1d8+2" );
  EXPECT_EQ( exprs[1], "2d6" );
}
