// Standard library includes
#include <cstdint>
#include <limits>
#include <memory>
#include <random>
#include <string>

#include <gtest/gtest.h>

#include "tabula/context.hh"
#include "tabula/math.hh"

using namespace tabula;

namespace {

  GenerationContext make_context( Sets statics = Sets() ) {
    return GenerationContext( EngineConfig(), std::move(statics),
      std::make_shared< std::mt19937 >( 1234 ), std::make_shared< Diagnostics >() );
  }

} // anonymous namespace

TEST( Math, Precedence ) {
  auto ctx = make_context();
  EXPECT_EQ( evaluate_math("2 + 3 * 4", ctx).value(), 14 );
  EXPECT_EQ( evaluate_math("(2 + 3) * 4", ctx).value(), 20 );
  EXPECT_EQ( evaluate_math("10 - 4 - 3", ctx).value(), 3 );
  EXPECT_EQ( evaluate_math("-3 + 5", ctx).value(), 2 );
}

TEST( Math, DivisionTruncatesTowardZero ) {
  auto ctx = make_context();
  EXPECT_EQ( evaluate_math("10 / 3", ctx).value(), 3 );
  EXPECT_EQ( evaluate_math("-7 / 3", ctx).value(), -2 );
  EXPECT_TRUE( ctx.diagnostics().empty() );
}

TEST( Math, DivisionByZeroYieldsZero ) {
  auto ctx = make_context();
  EXPECT_EQ( evaluate_math("10 / 0", ctx).value(), 0 );
  EXPECT_TRUE( ctx.diagnostics().has_code(diag::DIVISION_BY_ZERO) );
}

TEST( Math, VariablesAndPlaceholders ) {
  auto ctx = make_context( Sets{ { "level", "5" }, { "name", "Bob" } } );
  ctx.merge_placeholders( "stats", to_evaluated_sets(Sets{ { "str", "3" } }) );
  EXPECT_EQ( evaluate_math("$level * 2 + @stats.str", ctx).value(), 13 );

  // Non-numeric and missing values coerce to zero with a warning
  EXPECT_EQ( evaluate_math("$name + 1", ctx).value(), 1 );
  EXPECT_EQ( evaluate_math("$missing + 1", ctx).value(), 1 );
  EXPECT_TRUE( ctx.diagnostics().has_code(diag::COERCION_FAILURE) );
}

TEST( Math, SharedVariablesWinOverStatics ) {
  auto ctx = make_context( Sets{ { "hp", "5" } } );
  ctx.set_shared_variable( "hp", make_capture_item("9") );
  EXPECT_EQ( evaluate_math("$hp", ctx).value(), 9 );
}

TEST( Math, CapturePropertyChains ) {
  auto ctx = make_context();
  EvaluatedSets inner = to_evaluated_sets( Sets{ { "age", "40" } } );
  EvaluatedSets outer;
  outer.set( "parent", make_capture_item("Hilda", inner) );
  outer.set( "age", std::string("12") );
  ctx.set_shared_variable( "hero", make_capture_item("Tom", outer) );

  EXPECT_EQ( evaluate_math("$hero.@age + 1", ctx).value(), 13 );
  EXPECT_EQ( evaluate_math("$hero.@parent.@age", ctx).value(), 40 );
  EXPECT_EQ( evaluate_math("$hero.@age.@years", ctx).value(), 0 );
  EXPECT_TRUE( ctx.diagnostics().has_code(diag::COERCION_FAILURE) );
}

TEST( Math, DiceOperands ) {
  auto ctx = make_context();
  for ( int i = 0; i < 50; ++i ) {
    const std::int64_t v = evaluate_math( "dice:1d6 + 10", ctx ).value();
    EXPECT_GE( v, 11 );
    EXPECT_LE( v, 16 );
  }
}

TEST( Math, MalformedExpressionsYieldNothing ) {
  auto ctx = make_context();
  EXPECT_FALSE( evaluate_math("2 +", ctx).has_value() );
  EXPECT_FALSE( evaluate_math("(1 + 2", ctx).has_value() );
  EXPECT_FALSE( evaluate_math("3 4", ctx).has_value() );
  EXPECT_TRUE( ctx.diagnostics().has_code(diag::MATH_SYNTAX_ERROR) );
}

TEST( Math, OverflowIsAnError ) {
  auto ctx = make_context();
  EXPECT_FALSE( evaluate_math("9223372036854775807 + 1", ctx).has_value() );
  EXPECT_FALSE( evaluate_math("99999999999 * 99999999999", ctx).has_value() );
  EXPECT_FALSE( evaluate_math("0 - 9223372036854775807 - 2", ctx).has_value() );
  EXPECT_TRUE( ctx.diagnostics().has_code(diag::MATH_SYNTAX_ERROR) );

  auto fine = make_context();
  EXPECT_EQ( evaluate_math("9223372036854775806 + 1", fine).value(),
    std::numeric_limits< std::int64_t >::max() );
  EXPECT_TRUE( fine.diagnostics().empty() );
}

TEST( Math, UnknownCharactersAreReported ) {
  auto ctx = make_context();
  EXPECT_EQ( evaluate_math("2 + 3 #", ctx).value(), 5 );
  EXPECT_TRUE( ctx.diagnostics().has_code(diag::MATH_SYNTAX_ERROR) );
}
