// Standard library includes
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "tabula/parser.hh"

using namespace tabula;

TEST( Parser, ExtractsExpressionSpans ) {
  auto matches = extract_expressions( "A {{ race }} and {{dice:1d6}}." );
  ASSERT_EQ( matches.size(), 2u );
  EXPECT_EQ( matches[0].expression, "race" );
  EXPECT_EQ( matches[0].raw, "{{ race }}" );
  EXPECT_EQ( matches[0].start, 2u );
  EXPECT_EQ( matches[1].expression, "dice:1d6" );
  EXPECT_TRUE( has_expressions("{{x}}") );
  EXPECT_FALSE( has_expressions("no braces here") );
}

TEST( Parser, EscapedBracesStayLiteral ) {
  auto tokens = parse_template( "\\{{not}} {{real}}" );
  ASSERT_EQ( tokens.size(), 2u );
  ASSERT_TRUE( tokens[0].is< LiteralToken >() );
  EXPECT_EQ( tokens[0].as< LiteralToken >().text, "{{not}} " );
  EXPECT_TRUE( tokens[1].is< TableToken >() );
}

TEST( Parser, NestedBracesBalance ) {
  auto matches = extract_expressions( "{{race.switch[$x==\"a\":{{b}}]}} end" );
  ASSERT_EQ( matches.size(), 1u );
  EXPECT_EQ( matches[0].expression, "race.switch[$x==\"a\":{{b}}]" );
}

TEST( Parser, SpansRebuildThePattern ) {
  const std::string pattern = "Say \\{{hi}} to {{race.switch[$==\"Elf\":{{elfName}}]"
    ".else[\"x\"]}}, roll {{ dice:1d6 }}{{$n}}!";
  auto matches = extract_expressions( pattern );
  ASSERT_EQ( matches.size(), 3u );

  std::string rebuilt;
  size_t last = 0;
  for ( const auto& m : matches ) {
    ASSERT_LE( last, m.start );
    EXPECT_EQ( pattern.substr(m.start, m.end - m.start), m.raw );
    rebuilt += pattern.substr( last, m.start - last ) + m.raw;
    last = m.end;
  }
  rebuilt += pattern.substr( last );
  EXPECT_EQ( rebuilt, pattern );
  EXPECT_EQ( matches[0].expression,
    "race.switch[$==\"Elf\":{{elfName}}].else[\"x\"]" );
}

TEST( Parser, TemplateAlternatesLiteralsAndExpressions ) {
  auto tokens = parse_template( "The {{color}} {{animal}}!" );
  ASSERT_EQ( tokens.size(), 5u );
  EXPECT_EQ( tokens[0].as< LiteralToken >().text, "The " );
  EXPECT_EQ( tokens[1].as< TableToken >().table_id, "color" );
  EXPECT_EQ( tokens[2].as< LiteralToken >().text, " " );
  EXPECT_EQ( tokens[3].as< TableToken >().table_id, "animal" );
  EXPECT_EQ( tokens[4].as< LiteralToken >().text, "!" );
}

TEST( Parser, TableReferences ) {
  TableToken plain = parse_expression( "race" ).as< TableToken >();
  EXPECT_EQ( plain.table_id, "race" );
  EXPECT_FALSE( plain.alias.has_value() );

  TableToken aliased = parse_expression( "common.colors" ).as< TableToken >();
  EXPECT_EQ( aliased.alias.value(), "common" );
  EXPECT_EQ( aliased.table_id, "colors" );

  TableToken namespaced = parse_expression( "fantasy.core.races" ).as< TableToken >();
  EXPECT_EQ( namespaced.ns.value(), "fantasy.core" );
  EXPECT_EQ( namespaced.table_id, "races" );
  EXPECT_EQ( qualified_ref(namespaced), "fantasy.core.races" );

  TableToken prop = parse_expression( "race.@firstName" ).as< TableToken >();
  EXPECT_EQ( prop.table_id, "race" );
  EXPECT_EQ( prop.properties, (std::vector< std::string >{ "firstName" }) );
}

TEST( Parser, DiceAndMath ) {
  EXPECT_EQ( parse_expression("dice:2d6+1").as< DiceToken >().expression, "2d6+1" );
  EXPECT_EQ( parse_expression("math: 2 + 3").as< MathToken >().expression, "2 + 3" );

  MultiRollToken m = parse_expression( "dice:1d4*goblin" ).as< MultiRollToken >();
  EXPECT_EQ( m.dice_count.value(), "1d4" );
  EXPECT_EQ( m.table_id, "goblin" );
}

TEST( Parser, VariablesAndPlaceholders ) {
  VariableToken v = parse_expression( "$title" ).as< VariableToken >();
  EXPECT_EQ( v.name, "title" );
  EXPECT_FALSE( v.alias.has_value() );

  VariableToken av = parse_expression( "$common.title" ).as< VariableToken >();
  EXPECT_EQ( av.alias.value(), "common" );
  EXPECT_EQ( av.name, "title" );

  PlaceholderToken p = parse_expression( "@race.name" ).as< PlaceholderToken >();
  EXPECT_EQ( p.name, "race" );
  EXPECT_EQ( p.properties, (std::vector< std::string >{ "name" }) );
  EXPECT_TRUE( parse_expression("@self").as< PlaceholderToken >().properties.empty() );
}

TEST( Parser, Again ) {
  AgainToken a = parse_expression( "again" ).as< AgainToken >();
  EXPECT_FALSE( a.count.has_value() );
  EXPECT_FALSE( a.unique );

  AgainToken b = parse_expression( "2*unique*again|\", \"" ).as< AgainToken >();
  EXPECT_EQ( b.count.value(), 2 );
  EXPECT_TRUE( b.unique );
  EXPECT_EQ( b.separator.value(), ", " );
}

TEST( Parser, MultiRoll ) {
  MultiRollToken m = parse_expression( "3*unique*color|\" and \"" ).as< MultiRollToken >();
  EXPECT_EQ( std::get< int >(m.count), 3 );
  EXPECT_TRUE( m.unique );
  EXPECT_EQ( m.table_id, "color" );
  EXPECT_EQ( m.separator.value(), " and " );

  MultiRollToken v = parse_expression( "$n*color" ).as< MultiRollToken >();
  EXPECT_EQ( std::get< std::string >(v.count), "n" );
  EXPECT_FALSE( v.separator.has_value() );
}

TEST( Parser, Instance ) {
  InstanceToken t = parse_expression( "npc#guard" ).as< InstanceToken >();
  EXPECT_EQ( t.table_id, "npc" );
  EXPECT_EQ( t.instance_name, "guard" );
}

TEST( Parser, CaptureMultiRoll ) {
  CaptureMultiRollToken t =
    parse_expression( "3*unique*race >> $party|silent" ).as< CaptureMultiRollToken >();
  EXPECT_EQ( std::get< int >(t.count), 3 );
  EXPECT_TRUE( t.unique );
  EXPECT_EQ( t.table_id, "race" );
  EXPECT_EQ( t.capture_var, "party" );
  EXPECT_TRUE( t.silent );
  EXPECT_FALSE( t.separator.has_value() );

  CaptureMultiRollToken s =
    parse_expression( "2*race >> $pair|\" & \"" ).as< CaptureMultiRollToken >();
  EXPECT_FALSE( s.silent );
  EXPECT_EQ( s.separator.value(), " & " );

  CaptureMultiRollToken d =
    parse_expression( "dice:1d3*race >> $some" ).as< CaptureMultiRollToken >();
  EXPECT_EQ( d.dice_count.value(), "1d3" );
  EXPECT_EQ( d.table_id, "race" );
}

TEST( Parser, CaptureAccess ) {
  CaptureAccessToken last = parse_expression( "$party[-1].@firstName" ).as< CaptureAccessToken >();
  EXPECT_EQ( last.var_name, "party" );
  EXPECT_EQ( last.index.value(), -1 );
  EXPECT_EQ( last.properties, (std::vector< std::string >{ "firstName" }) );

  CaptureAccessToken count = parse_expression( "$party.count" ).as< CaptureAccessToken >();
  EXPECT_FALSE( count.index.has_value() );
  EXPECT_EQ( count.properties, (std::vector< std::string >{ "count" }) );

  CaptureAccessToken joined = parse_expression( "$party|\"; \"" ).as< CaptureAccessToken >();
  EXPECT_EQ( joined.var_name, "party" );
  EXPECT_EQ( joined.separator.value(), "; " );
}

TEST( Parser, Collect ) {
  CollectToken c = parse_expression( "collect:$party.@race|unique|\"/\"" ).as< CollectToken >();
  EXPECT_EQ( c.var_name, "party" );
  EXPECT_EQ( c.property, "race" );
  EXPECT_TRUE( c.unique );
  EXPECT_EQ( c.separator.value(), "/" );

  EXPECT_THROW( parse_expression("collect:party"), Error );
}

TEST( Parser, StandaloneSwitch ) {
  ExpressionToken t = parse_expression(
    "switch[$gender==\"male\":{{maleName}}].switch[$gender==\"female\":{{femaleName}}].else[{{anyName}}]" );
  ASSERT_TRUE( t.is< SwitchToken >() );
  const SwitchToken& s = t.as< SwitchToken >();
  ASSERT_EQ( s.clauses.size(), 2u );
  EXPECT_EQ( s.clauses[0].condition, "$gender==\"male\"" );
  EXPECT_EQ( s.clauses[0].result_expr, "{{maleName}}" );
  EXPECT_EQ( s.clauses[1].condition, "$gender==\"female\"" );
  EXPECT_EQ( s.else_expr.value(), "{{anyName}}" );
}

TEST( Parser, SwitchModifiersOnAnotherToken ) {
  ExpressionToken t = parse_expression( "race.switch[$x==\"a\":\"A\"].else[\"B\"]" );
  ASSERT_TRUE( t.is< TableToken >() );
  EXPECT_EQ( t.as< TableToken >().table_id, "race" );
  ASSERT_TRUE( t.switch_modifiers.has_value() );
  EXPECT_EQ( t.switch_modifiers->clauses.size(), 1u );
  EXPECT_EQ( t.switch_modifiers->else_expr.value(), "\"B\"" );
}

TEST( Parser, SwitchSyntaxErrors ) {
  try {
    parse_expression( "switch[nocolon]" );
    FAIL() << "expected a parse error";
  } catch ( const Error& e ) {
    EXPECT_EQ( e.code(), ErrorCode::Parse );
    EXPECT_NE( std::string(e.what()).find("missing colon"), std::string::npos );
  }
}

TEST( Parser, ReferencedTablesAndVariables ) {
  const std::string pattern =
    "{{race}} {{3*color}} {{race}} {{npc#a}} {{$title}} {{2*beast >> $pack}} {{$pack[0]}}";
  EXPECT_EQ( get_referenced_tables(pattern),
    (std::vector< std::string >{ "race", "color", "npc", "beast" }) );
  EXPECT_EQ( get_referenced_variables(pattern),
    (std::vector< std::string >{ "title", "pack" }) );
}

TEST( Parser, TokenNames ) {
  EXPECT_STREQ( token_type_name(parse_expression("race")), "table" );
  EXPECT_STREQ( token_type_name(parse_expression("2*race >> $x")), "captureMultiRoll" );
  EXPECT_STREQ( token_type_name(parse_expression("collect:$x.@y")), "collect" );
}
