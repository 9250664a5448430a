// Standard library includes
#include <memory>
#include <random>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "tabula/conditionals.hh"

using namespace tabula;

namespace {

  GenerationContext make_context() {
    GenerationContext ctx( EngineConfig(),
      Sets{ { "gender", "female" }, { "level", "7" }, { "title", "Lady of the Lake" } },
      std::make_shared< std::mt19937 >( 5 ), std::make_shared< Diagnostics >() );
    ctx.merge_placeholders( "race", to_evaluated_sets(
      Sets{ { "value", "Elf" }, { "size", "medium" } }) );
    ctx.set_shared_variable( "hero", make_capture_item( "Aria",
      to_evaluated_sets(Sets{ { "class", "wizard" } }) ) );
    return ctx;
  }

} // anonymous namespace

TEST( Conditionals, Tokenizer ) {
  auto tokens = internal::tokenize_condition( "($a >= 3 && @b.c != \"x y\") || !$d" );
  const std::vector< std::string > expected{ "(", "$a", ">=", "3", "&&", "@b.c",
    "!=", "x y", ")", "||", "!", "$d" };
  EXPECT_EQ( tokens, expected );
}

TEST( Conditionals, Equality ) {
  auto ctx = make_context();
  EXPECT_TRUE( evaluate_when_clause("$gender == \"female\"", ctx) );
  EXPECT_FALSE( evaluate_when_clause("$gender == \"male\"", ctx) );
  EXPECT_TRUE( evaluate_when_clause("$gender != 'male'", ctx) );
  EXPECT_TRUE( evaluate_when_clause("@race == Elf", ctx) );
  EXPECT_TRUE( evaluate_when_clause("@race.size == medium", ctx) );
  EXPECT_TRUE( evaluate_when_clause("$hero.@class == wizard", ctx) );
}

TEST( Conditionals, NumericComparison ) {
  auto ctx = make_context();
  EXPECT_TRUE( evaluate_when_clause("$level > 5", ctx) );
  EXPECT_TRUE( evaluate_when_clause("$level >= 7", ctx) );
  EXPECT_FALSE( evaluate_when_clause("$level < 7", ctx) );
  EXPECT_TRUE( evaluate_when_clause("$level <= 7.5", ctx) );
}

TEST( Conditionals, ContainsAndMatches ) {
  auto ctx = make_context();
  EXPECT_TRUE( evaluate_when_clause("$title contains \"LAKE\"", ctx) );
  EXPECT_FALSE( evaluate_when_clause("$title contains sea", ctx) );
  EXPECT_TRUE( evaluate_when_clause("$title matches \"^lady\"", ctx) );
  EXPECT_TRUE( ctx.diagnostics().empty() );

  // An invalid pattern never matches and is reported
  EXPECT_FALSE( evaluate_when_clause("$title matches \"[\"", ctx) );
  EXPECT_TRUE( ctx.diagnostics().has_code(diag::INVALID_REGEX) );
}

TEST( Conditionals, AndBindsTighterThanOr ) {
  auto ctx = make_context();
  // true || (false && false)
  EXPECT_TRUE( evaluate_when_clause(
    "$gender == female || $level == 1 && $level == 2", ctx) );
  // (true || false) && false
  EXPECT_FALSE( evaluate_when_clause(
    "($gender == female || $level == 1) && $level == 2", ctx) );
  EXPECT_TRUE( evaluate_when_clause(
    "$level == 1 && $level == 2 || $gender == female", ctx) );
}

TEST( Conditionals, NegationAndTruthiness ) {
  auto ctx = make_context();
  EXPECT_TRUE( evaluate_when_clause("$gender", ctx) );
  EXPECT_FALSE( evaluate_when_clause("$missing", ctx) );
  EXPECT_TRUE( evaluate_when_clause("!$missing", ctx) );
  EXPECT_FALSE( evaluate_when_clause("0", ctx) );
  EXPECT_FALSE( evaluate_when_clause("", ctx) );
}

TEST( Conditionals, MissingValuesCompareAsEmpty ) {
  auto ctx = make_context();
  EXPECT_TRUE( evaluate_when_clause("$missing != anything", ctx) );
  EXPECT_FALSE( evaluate_when_clause("$missing > 0", ctx) );
  EXPECT_TRUE( evaluate_when_clause("@nothing.here != x", ctx) );
}
