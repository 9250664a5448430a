// Standard library includes
#include <map>
#include <memory>
#include <random>
#include <set>
#include <string>

#include <gtest/gtest.h>

#include "tabula/document.hh"
#include "tabula/tables.hh"

using namespace tabula;

namespace {

  GenerationContext make_context( UniqueOverflow overflow = UniqueOverflow::Stop ) {
    EngineConfig config;
    config.unique_overflow = overflow;
    return GenerationContext( config, Sets(), std::make_shared< std::mt19937 >( 77 ),
      std::make_shared< Diagnostics >() );
  }

  Document colors() {
    return load_document( R"(
tables:
  - id: color
    name: Color
    resultType: hue
    defaultSets:
      shade: plain
    entries:
      - id: red
        value: Red
        weight: 3
        sets:
          shade: dark
      - value: Green
      - value: Blue
        weight: 0
      - id: gold
        value: Gold
        range: [2, 5]
        resultType: metal
  - id: shape
    name: Shape
    resultType: form
    entries: [Circle, Square]
  - id: mixed
    name: Mixed
    type: composite
    sources:
      - tableId: color
        weight: 3
      - tableId: shape
)" );
  }

} // anonymous namespace

TEST( Tables, EntryWeights ) {
  Document doc = colors();
  const auto& entries = doc.tables[0].entries;
  EXPECT_DOUBLE_EQ( entry_weight(entries[0]), 3.0 );
  EXPECT_DOUBLE_EQ( entry_weight(entries[1]), 1.0 );
  EXPECT_DOUBLE_EQ( entry_weight(entries[2]), 0.0 );
  // Range span wins over weight
  EXPECT_DOUBLE_EQ( entry_weight(entries[3]), 4.0 );
}

TEST( Tables, PoolSkipsZeroWeightAndExcluded ) {
  Document doc = colors();
  auto pool = build_weighted_pool( doc.tables[0].entries, "color" );
  ASSERT_EQ( pool.size(), 3u );
  EXPECT_EQ( pool[0].id, "red" );
  EXPECT_EQ( pool[1].id, "color001" );
  EXPECT_EQ( pool[2].id, "gold" );
  EXPECT_DOUBLE_EQ( total_weight(pool), 8.0 );

  auto fewer = build_weighted_pool( doc.tables[0].entries, "color", { "red" } );
  EXPECT_EQ( fewer.size(), 2u );
}

TEST( Tables, SelectionIsDistributedByWeight ) {
  Document doc = colors();
  auto ctx = make_context();
  std::map< std::string, int > counts;
  for ( int i = 0; i < 4000; ++i ) {
    auto picked = roll_simple_table( doc.tables[0], ctx );
    ASSERT_TRUE( picked.has_value() );
    ++counts[ picked->id ];
  }
  EXPECT_EQ( counts.count("color002"), 0u );
  // Expected shares 3/8, 1/8 and 4/8
  EXPECT_NEAR( counts["red"] / 4000.0, 0.375, 0.05 );
  EXPECT_NEAR( counts["color001"] / 4000.0, 0.125, 0.05 );
  EXPECT_NEAR( counts["gold"] / 4000.0, 0.5, 0.05 );
}

TEST( Tables, SelectedEntryMergesSets ) {
  Document doc = colors();
  auto ctx = make_context();
  SelectionOptions only_red;
  only_red.exclude_ids = { "color001", "gold" };
  auto red = roll_simple_table( doc.tables[0], ctx, only_red );
  ASSERT_TRUE( red.has_value() );
  EXPECT_EQ( *red->merged_sets.get("shade"), "dark" );
  EXPECT_EQ( *red->merged_sets.get("value"), "Red" );
  EXPECT_EQ( red->result_type.value(), "hue" );

  SelectionOptions only_gold;
  only_gold.exclude_ids = { "red", "color001" };
  auto gold = roll_simple_table( doc.tables[0], ctx, only_gold );
  ASSERT_TRUE( gold.has_value() );
  EXPECT_EQ( *gold->merged_sets.get("shade"), "plain" );
  EXPECT_EQ( gold->result_type.value(), "metal" );
}

TEST( Tables, UniqueSelectionStopsWhenExhausted ) {
  Document doc = colors();
  auto ctx = make_context();
  SelectionOptions unique;
  unique.unique = true;
  std::set< std::string > seen;
  for ( int i = 0; i < 3; ++i ) {
    auto picked = roll_simple_table( doc.tables[0], ctx, unique );
    ASSERT_TRUE( picked.has_value() );
    seen.insert( picked->id );
  }
  EXPECT_EQ( seen.size(), 3u );
  EXPECT_FALSE( roll_simple_table(doc.tables[0], ctx, unique).has_value() );
}

TEST( Tables, UniqueOverflowCycles ) {
  Document doc = colors();
  auto ctx = make_context( UniqueOverflow::Cycle );
  SelectionOptions unique;
  unique.unique = true;
  for ( int i = 0; i < 3; ++i ) roll_simple_table( doc.tables[0], ctx, unique );
  EXPECT_TRUE( roll_simple_table(doc.tables[0], ctx, unique).has_value() );
}

TEST( Tables, UniqueOverflowThrows ) {
  Document doc = colors();
  auto ctx = make_context( UniqueOverflow::Error );
  SelectionOptions unique;
  unique.unique = true;
  for ( int i = 0; i < 3; ++i ) roll_simple_table( doc.tables[0], ctx, unique );
  try {
    roll_simple_table( doc.tables[0], ctx, unique );
    FAIL() << "expected an overflow error";
  } catch ( const Error& e ) {
    EXPECT_EQ( e.code(), ErrorCode::UniqueOverflow );
  }
}

TEST( Tables, CompositeSourceSelection ) {
  Document doc = colors();
  std::mt19937 rng( 3 );
  int color = 0;
  for ( int i = 0; i < 2000; ++i ) {
    auto s = select_source( doc.tables[2], rng );
    ASSERT_TRUE( s.has_value() );
    if ( s->table_id == "color" ) ++color;
  }
  EXPECT_NEAR( color / 2000.0, 0.75, 0.05 );

  auto probs = get_source_probabilities( doc.tables[2] );
  ASSERT_EQ( probs.size(), 2u );
  EXPECT_DOUBLE_EQ( probs[0].probability, 0.75 );
  EXPECT_EQ( probs[1].percentage, "25.00%" );
}

TEST( Tables, CollectionMergesSources ) {
  Document doc = colors();
  CollectionSources sources{ { "color", &doc.tables[0] }, { "shape", &doc.tables[1] } };
  auto merged = merge_table_entries( sources );
  ASSERT_EQ( merged.size(), 5u );
  EXPECT_EQ( merged[0].id, "color.red" );
  EXPECT_EQ( merged[3].id, "shape.shape000" );
  EXPECT_EQ( merged[3].source_table_id, "shape" );

  Table everything;
  everything.id = "everything";
  everything.type = TableType::Collection;
  auto ctx = make_context();
  SelectionOptions only_square;
  only_square.exclude_ids = { "color.red", "color.color001", "color.gold",
    "shape.shape000" };
  auto picked = roll_collection_table( everything, sources, ctx, only_square );
  ASSERT_TRUE( picked.has_value() );
  EXPECT_EQ( picked->id, "shape.shape001" );
  EXPECT_EQ( picked->source_table_id, "shape" );
  EXPECT_EQ( *picked->merged_sets.get("value"), "Square" );
  EXPECT_EQ( picked->result_type.value(), "form" );

  EXPECT_FALSE( roll_collection_table(everything, {}, ctx).has_value() );
}

TEST( Tables, Probabilities ) {
  Document doc = colors();
  auto probs = get_table_probabilities( doc.tables[0] );
  ASSERT_EQ( probs.size(), 3u );
  EXPECT_EQ( probs[0].value, "Red" );
  EXPECT_DOUBLE_EQ( probs[0].probability, 0.375 );
  EXPECT_EQ( probs[0].percentage, "37.50%" );
  EXPECT_EQ( probs[2].percentage, "50.00%" );

  CollectionSources sources{ { "shape", &doc.tables[1] } };
  auto coll = get_collection_probabilities( sources );
  ASSERT_EQ( coll.size(), 2u );
  EXPECT_EQ( coll[0].source_table_id, "shape" );
  EXPECT_DOUBLE_EQ( coll[1].probability, 0.5 );
}
