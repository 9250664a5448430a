// Standard library includes
#include <memory>
#include <random>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "tabula/context.hh"
#include "tabula/trace.hh"

using namespace tabula;

namespace {

  TraceOutput output_of( const std::string& value ) {
    TraceOutput out;
    out.value = value;
    return out;
  }

  ordered_node rolls_metadata( int n ) {
    std::vector< std::int64_t > rolls( static_cast< size_t >( n ), 3 );
    ordered_node meta = ordered_node::mapping();
    meta[ "rolls" ] = internal::make_int_sequence( rolls );
    return meta;
  }

} // anonymous namespace

TEST( TraceRecorder, EmptyRecorderHasNoTrace ) {
  TraceRecorder rec;
  EXPECT_FALSE( rec.extract().has_value() );

  // Leaves with no open node are dropped
  rec.add_leaf( TraceNodeType::DiceRoll, "Dice", "1d6", output_of("3") );
  EXPECT_FALSE( rec.extract().has_value() );
}

TEST( TraceRecorder, BuildsNestedTree ) {
  TraceRecorder rec;
  rec.begin_node( TraceNodeType::Root, "Roll: race", "race" );
  rec.begin_node( TraceNodeType::TableRoll, "Table: Race", "race" );
  rec.add_leaf( TraceNodeType::EntrySelect, "Selected: Elf", "", output_of("Elf") );
  rec.add_leaf( TraceNodeType::DiceRoll, "Dice: 2d6", "2d6", output_of("7"),
    rolls_metadata(2) );
  EXPECT_EQ( rec.open_nodes(), 2u );
  rec.end_node( output_of("Elf") );
  rec.begin_node( TraceNodeType::TableRoll, "Table: Race", "race" );
  rec.end_node( output_of("Dwarf") );
  rec.end_node( output_of("Elf") );
  EXPECT_EQ( rec.open_nodes(), 0u );

  auto trace = rec.extract();
  ASSERT_TRUE( trace.has_value() );
  const TraceNode& root = *trace->root;
  EXPECT_EQ( root.type, TraceNodeType::Root );
  EXPECT_EQ( root.id, "trace-0" );
  ASSERT_EQ( root.children.size(), 2u );
  EXPECT_EQ( root.children[0]->children.size(), 2u );
  EXPECT_EQ( root.children[1]->output.value, "Dwarf" );

  EXPECT_EQ( trace->stats.node_count, 5 );
  EXPECT_EQ( trace->stats.max_depth, 2 );
  EXPECT_EQ( trace->stats.dice_rolled, 2 );
  EXPECT_EQ( trace->stats.type_breakdown.at("table_roll"), 2 );
  ASSERT_EQ( trace->stats.tables_accessed.size(), 1u );
  EXPECT_EQ( trace->stats.tables_accessed[0], "Race" );
  EXPECT_EQ( trace->version, "1.0" );
}

TEST( TraceRecorder, VariableStatsUseMetadata ) {
  TraceRecorder rec;
  rec.begin_node( TraceNodeType::Root, "root", "" );
  ordered_node var = ordered_node::mapping();
  var[ "name" ] = internal::make_node_from( std::string("title") );
  rec.add_leaf( TraceNodeType::VariableAccess, "$title", "$title", output_of("x"), var );
  ordered_node cap = ordered_node::mapping();
  cap[ "varName" ] = internal::make_node_from( std::string("party") );
  rec.add_leaf( TraceNodeType::CaptureAccess, "$party", "$party", output_of("y"), cap );
  rec.add_leaf( TraceNodeType::CaptureAccess, "$party", "$party", output_of("y"), cap );
  rec.end_node( output_of("") );

  auto trace = rec.extract();
  ASSERT_TRUE( trace.has_value() );
  EXPECT_EQ( trace->stats.variables_accessed,
    (std::vector< std::string >{ "title", "$party" }) );
}

TEST( TraceRecorder, SerializesToNode ) {
  TraceRecorder rec;
  rec.begin_node( TraceNodeType::Root, "root", "raw text" );
  TraceOutput failed;
  failed.error = std::string( "boom" );
  rec.end_node( failed );

  ordered_node n = to_node( *rec.extract() );
  ASSERT_TRUE( n.contains("root") );
  const ordered_node& root = n[ "root" ];
  EXPECT_EQ( root["type"].get_value< std::string >(), "root" );
  EXPECT_EQ( root["input"]["raw"].get_value< std::string >(), "raw text" );
  EXPECT_EQ( root["output"]["error"].get_value< std::string >(), "boom" );
  EXPECT_EQ( n["stats"]["nodeCount"].get_value< std::int64_t >(), 1 );
}

TEST( TraceScope, RecordsAbortedNodesOnUnwind ) {
  GenerationContext ctx( EngineConfig(), Sets(),
    std::make_shared< std::mt19937 >( 1 ), std::make_shared< Diagnostics >(), true );
  ctx.begin_trace( TraceNodeType::Root, "root", "" );
  try {
    TraceScope scope( ctx, TraceNodeType::TableRoll, "Table: T", "t" );
    throw std::runtime_error( "failure inside a roll" );
  } catch ( const std::runtime_error& ) {
  }
  {
    TraceScope scope( ctx, TraceNodeType::TableRoll, "Table: U", "u" );
    scope.fail( "bad table" );
  }
  ctx.end_trace( output_of("done") );

  auto trace = ctx.trace()->extract();
  ASSERT_TRUE( trace.has_value() );
  ASSERT_EQ( trace->root->children.size(), 2u );
  EXPECT_EQ( trace->root->children[0]->output.error.value(), "aborted" );
  EXPECT_EQ( trace->root->children[1]->output.error.value(), "bad table" );
  EXPECT_EQ( trace->root->output.value, "done" );
}

TEST( TraceScope, NoOpWithoutTracing ) {
  GenerationContext ctx( EngineConfig(), Sets(),
    std::make_shared< std::mt19937 >( 1 ), std::make_shared< Diagnostics >() );
  EXPECT_FALSE( ctx.tracing() );
  EXPECT_EQ( ctx.trace(), nullptr );
  TraceScope scope( ctx, TraceNodeType::TableRoll, "Table: T", "t" );
  scope.finish( output_of("x") );
  ctx.trace_leaf( TraceNodeType::DiceRoll, "d", "1d6", output_of("1") );
}
