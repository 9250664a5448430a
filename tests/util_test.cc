// Standard library includes
#include <cmath>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "tabula/types.hh"
#include "tabula/util.hh"

using namespace tabula;

TEST( Util, SplitAndJoinPaths ) {
  auto segs = internal::split_segments( "a.b.c" );
  ASSERT_EQ( segs.size(), 3u );
  EXPECT_EQ( segs[1], "b" );
  EXPECT_EQ( internal::join_path(segs, 1), "b.c" );
  EXPECT_EQ( internal::join_path(segs, 0, 2), "a.b" );
  EXPECT_EQ( internal::split_segments("plain").size(), 1u );
}

TEST( Util, TrimAndAffixes ) {
  EXPECT_EQ( internal::trim("  x y \t"), "x y" );
  EXPECT_EQ( internal::trim("   "), "" );
  EXPECT_TRUE( internal::starts_with("dice:2d6", "dice:") );
  EXPECT_FALSE( internal::starts_with("di", "dice:") );
  EXPECT_TRUE( internal::ends_with("$x.count", ".count") );
  EXPECT_EQ( internal::to_lower("2D6KH1"), "2d6kh1" );
}

TEST( Util, GeneratedEntryIdsArePadded ) {
  EXPECT_EQ( internal::generated_entry_id("color", 0), "color000" );
  EXPECT_EQ( internal::generated_entry_id("color", 12), "color012" );
  EXPECT_EQ( internal::generated_entry_id("t", 1234), "t1234" );
}

TEST( Util, IntegerPrefix ) {
  EXPECT_EQ( internal::parse_int_prefix("12 goblins").value(), 12 );
  EXPECT_EQ( internal::parse_int_prefix("  -4").value(), -4 );
  EXPECT_FALSE( internal::parse_int_prefix("goblins").has_value() );
  EXPECT_FALSE( internal::parse_int_prefix("").has_value() );
}

TEST( Util, StrictNumber ) {
  EXPECT_DOUBLE_EQ( internal::strict_number(" 3.5 "), 3.5 );
  EXPECT_DOUBLE_EQ( internal::strict_number(""), 0.0 );
  EXPECT_DOUBLE_EQ( internal::strict_number("0x10"), 16.0 );
  EXPECT_TRUE( std::isnan(internal::strict_number("3 apples")) );
  EXPECT_TRUE( std::isinf(internal::strict_number("-Infinity")) );
}

TEST( Util, FormatNumber ) {
  EXPECT_EQ( internal::format_number(5.0), "5" );
  EXPECT_EQ( internal::format_number(-2.0), "-2" );
  EXPECT_EQ( internal::format_number(0.5), "0.5" );
  EXPECT_EQ( internal::format_number(0.1), "0.1" );
}

TEST( Util, QuoteString ) {
  EXPECT_EQ( internal::quote_string("say \"hi\""), "\"say \\\"hi\\\"\"" );
  EXPECT_EQ( internal::quote_string("a\\b"), "\"a\\\\b\"" );
}

TEST( Util, ScalarText ) {
  EXPECT_EQ( internal::to_string_any(internal::make_node_from(std::string("x"))), "x" );
  EXPECT_EQ( internal::to_string_any(internal::make_node_from(std::int64_t(7))), "7" );
  EXPECT_EQ( internal::to_string_any(internal::make_node_from(true)), "true" );
  EXPECT_EQ( internal::to_string_any(internal::make_node_from(2.5)), "2.5" );
}

TEST( OrderedMap, KeepsInsertionOrder ) {
  Sets m;
  m.set( "b", "1" );
  m.set( "a", "2" );
  m.set( "b", "3" );
  ASSERT_EQ( m.size(), 2u );
  EXPECT_EQ( m.keys(), (std::vector< std::string >{ "b", "a" }) );
  EXPECT_EQ( *m.get("b"), "3" );

  Sets overlay{ { "c", "4" }, { "a", "5" } };
  m.merge( overlay );
  EXPECT_EQ( m.keys(), (std::vector< std::string >{ "b", "a", "c" }) );
  EXPECT_EQ( *m.get("a"), "5" );

  EXPECT_TRUE( m.erase("b") );
  EXPECT_FALSE( m.erase("b") );
  EXPECT_EQ( m.get("b"), nullptr );
}

TEST( Types, UniqueOverflowNames ) {
  EXPECT_EQ( parse_unique_overflow("cycle").value(), UniqueOverflow::Cycle );
  EXPECT_FALSE( parse_unique_overflow("sometimes").has_value() );
  EXPECT_EQ( to_string(UniqueOverflow::Error), "error" );
}

TEST( Types, SetValueText ) {
  SetValue plain = std::string( "red" );
  SetValue nested = make_capture_item( "Elf",
    to_evaluated_sets(Sets{ { "firstName", "Aria" } }) );
  EXPECT_EQ( set_value_text(plain), "red" );
  EXPECT_EQ( set_value_item(plain), nullptr );
  EXPECT_EQ( set_value_text(nested), "Elf" );
  ASSERT_NE( set_value_item(nested), nullptr );
  EXPECT_EQ( set_value_text(*set_value_item(nested)->sets.get("firstName")), "Aria" );
}

TEST( Types, ErrorCarriesCode ) {
  Error e( ErrorCode::RecursionLimit, "too deep" );
  EXPECT_EQ( e.code(), ErrorCode::RecursionLimit );
  EXPECT_STREQ( e.what(), "too deep" );
  EXPECT_STREQ( error_code_name(e.code()), "RECURSION_LIMIT" );
}
