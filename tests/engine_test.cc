// Standard library includes
#include <algorithm>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "tabula/engine.hh"

using namespace tabula;

namespace {

  const std::string MAIN = R"(
metadata:
  name: Main
  namespace: game.main
  version: 1.0.0
  specVersion: '1.0'
variables:
  title: Hero
shared:
  $era: '{{king}}'
imports:
  - path: game.common
    alias: c
tables:
  - id: king
    name: King
    resultType: ruler
    entries:
      - value: Arthur
        sets:
          realm: Camelot
        assets:
          crest: dragon.png
  - id: secret
    name: Secret
    hidden: true
    entries: [Hidden]
  - id: outer
    name: Outer
    entries:
      - value: 'Outer {{inner}}'
        description: outer desc
  - id: inner
    name: Inner
    entries:
      - value: In
        description: inner desc
  - id: mixed
    name: Mixed
    type: composite
    sources:
      - tableId: king
  - id: court
    name: Court
    type: collection
    collections: [inner]
  - id: base
    name: Base
    entries:
      - id: a
        value: A
      - id: b
        value: B
  - id: child
    name: Child
    extends: base
    entries:
      - id: a
        value: AA
      - id: c
        value: C
  - id: duo
    name: Duo
    entries: [Left, Right]
templates:
  - id: greeting
    name: Greeting
    resultType: text
    pattern: 'Hail {{$era}}, {{$title}}'
)";

  const std::string COMMON = R"(
metadata:
  name: Common
  namespace: game.common
  version: 1.0.0
  specVersion: '1.0'
tables:
  - id: weapon
    name: Weapon
    entries: [Sword]
  - id: relic
    name: Relic
    hidden: true
    entries: [Grail]
templates:
  - id: farewell
    name: Farewell
    pattern: Farewell
)";

  void load_main( Engine& engine ) {
    ASSERT_TRUE( engine.load_from_text(MAIN, "main").valid );
  }

  void load_both( Engine& engine ) {
    load_main( engine );
    ASSERT_TRUE( engine.load_from_text(COMMON, "common").valid );
    engine.resolve_imports();
  }

  // Loads without validation, for documents the validator would reject
  void load_unchecked( Engine& engine, const std::string& id,
    const std::string& body )
  {
    engine.load_collection( load_document(body), id );
  }

  ErrorCode roll_error( Engine& engine, const std::string& table_id,
    const std::string& collection_id, std::string* message = nullptr )
  {
    try {
      engine.roll( table_id, collection_id );
    } catch ( const Error& e ) {
      if ( message ) *message = e.what();
      return e.code();
    }
    ADD_FAILURE() << "expected " << table_id << " to fail";
    return ErrorCode::Parse;
  }

} // anonymous namespace

TEST( Engine, InvalidDocumentsAreNotLoaded ) {
  Engine engine( EngineConfig(), 1u );
  ValidationResult v = engine.load_from_text( "tables:\n  - id: t\n    name: T\n"
    "    entries: [x]\n", "bad" );
  EXPECT_FALSE( v.valid );
  EXPECT_TRUE( v.has_code("MISSING_NAMESPACE") );
  EXPECT_FALSE( engine.has_collection("bad") );

  EXPECT_THROW( engine.load_from_text("tables: [unclosed", "broken"), Error );
  EXPECT_THROW( engine.load_from_file("/nonexistent/tabula.yaml", "x"), Error );
}

TEST( Engine, RollSimpleTable ) {
  Engine engine( EngineConfig(), 1u );
  load_main( engine );
  RollResult r = engine.roll( "king", "main" );
  EXPECT_EQ( r.text, "Arthur" );
  EXPECT_EQ( r.result_type.value(), "ruler" );
  EXPECT_EQ( *r.assets->get("crest"), "dragon.png" );
  EXPECT_EQ( set_value_text(*r.placeholders->get("realm")), "Camelot" );
  EXPECT_EQ( r.metadata.source_id, "king" );
  EXPECT_EQ( r.metadata.collection_id, "main" );
  EXPECT_EQ( r.metadata.entry_id.value(), "king000" );
  EXPECT_GT( r.metadata.timestamp, 0 );
  EXPECT_FALSE( r.trace.has_value() );

  ordered_node n = to_node( r );
  EXPECT_EQ( n["text"].get_value< std::string >(), "Arthur" );
  EXPECT_EQ( n["metadata"]["entryId"].get_value< std::string >(), "king000" );
}

TEST( Engine, MissingTablesAndCollections ) {
  Engine engine( EngineConfig(), 1u );
  load_main( engine );
  EXPECT_EQ( roll_error(engine, "nope", "main"), ErrorCode::Reference );
  EXPECT_EQ( roll_error(engine, "king", "elsewhere"), ErrorCode::Reference );
  EXPECT_THROW( engine.roll_template("nope", "main"), Error );
}

TEST( Engine, DescriptionsListParentsFirst ) {
  Engine engine( EngineConfig(), 1u );
  load_main( engine );
  RollResult r = engine.roll( "outer", "main" );
  EXPECT_EQ( r.text, "Outer In" );
  ASSERT_EQ( r.descriptions.size(), 2u );
  EXPECT_EQ( r.descriptions[0].table_id, "outer" );
  EXPECT_EQ( r.descriptions[0].description, "outer desc" );
  EXPECT_EQ( r.descriptions[1].table_id, "inner" );
  EXPECT_LT( r.descriptions[0].depth, r.descriptions[1].depth );
}

TEST( Engine, CompositeAndCollectionTables ) {
  Engine engine( EngineConfig(), 1u );
  load_main( engine );
  RollResult composite = engine.roll( "mixed", "main" );
  EXPECT_EQ( composite.text, "Arthur" );
  EXPECT_EQ( composite.result_type.value(), "ruler" );

  RollResult collection = engine.roll( "court", "main" );
  EXPECT_EQ( collection.text, "In" );
  EXPECT_EQ( collection.metadata.entry_id.value(), "inner.inner000" );
  ASSERT_EQ( collection.descriptions.size(), 1u );
  EXPECT_EQ( collection.descriptions[0].table_name, "Inner" );
  EXPECT_EQ( collection.descriptions[0].table_id, "inner" );
}

TEST( Engine, TemplatesSeeDocumentSharedVariables ) {
  Engine engine( EngineConfig(), 1u );
  load_main( engine );
  RollResult r = engine.roll_template( "greeting", "main" );
  EXPECT_EQ( r.text, "Hail Arthur, Hero" );
  EXPECT_EQ( r.result_type.value(), "text" );
  EXPECT_EQ( r.metadata.source_id, "greeting" );
  EXPECT_FALSE( r.metadata.entry_id.has_value() );
}

TEST( Engine, PatternPreview ) {
  Engine engine( EngineConfig(), 1u );
  load_main( engine );
  RollOptions options;
  options.shared = Sets{ { "mood", "calm" } };
  RollResult r = engine.evaluate_raw_pattern( "{{king}} is {{$mood}} in {{$era}}",
    "main", options );
  EXPECT_EQ( r.text, "Arthur is calm in Arthur" );
  EXPECT_EQ( r.expression_outputs,
    (std::vector< std::string >{ "Arthur", "calm", "Arthur" }) );
  EXPECT_EQ( r.metadata.source_id, "__preview__" );
  EXPECT_FALSE( r.result_type.has_value() );
}

TEST( Engine, TraceIsRecordedOnRequest ) {
  Engine engine( EngineConfig(), 1u );
  load_main( engine );
  RollOptions options;
  options.enable_trace = true;
  RollResult r = engine.roll( "outer", "main", options );
  ASSERT_TRUE( r.trace.has_value() );
  EXPECT_EQ( r.trace->root->type, TraceNodeType::Root );
  EXPECT_EQ( r.trace->root->output.value, "Outer In" );
  const auto& tables = r.trace->stats.tables_accessed;
  EXPECT_NE( std::find(tables.begin(), tables.end(), "Outer"), tables.end() );
  EXPECT_NE( std::find(tables.begin(), tables.end(), "Inner"), tables.end() );
  EXPECT_GE( r.trace->stats.max_depth, 2 );

  ordered_node n = to_node( r );
  EXPECT_TRUE( n.contains("trace") );
}

TEST( Engine, SelfReferenceHitsTheRecursionLimit ) {
  EngineConfig config;
  config.max_recursion_depth = 10;
  Engine engine( config, 1u );
  load_unchecked( engine, "loops", R"(
metadata:
  name: Loops
  namespace: test.loops
tables:
  - id: loop
    name: Loop
    entries: ['again {{loop}}']
)" );
  std::string message;
  EXPECT_EQ( roll_error(engine, "loop", "loops", &message),
    ErrorCode::RecursionLimit );
  EXPECT_NE( message.find("(10)"), std::string::npos );
}

TEST( Engine, TableSharedVariablesMayNotShadow ) {
  Engine engine( EngineConfig(), 1u );
  ASSERT_TRUE( engine.load_from_text(R"(
metadata:
  name: Shadow
  namespace: test.shadow
  version: 1.0.0
  specVersion: '1.0'
variables:
  title: Hero
shared:
  $era: old
tables:
  - id: bad
    name: Bad
    shared:
      era: new
    entries: [x]
  - id: worse
    name: Worse
    shared:
      title: Knight
    entries: [y]
)", "shadow").valid );

  std::string message;
  EXPECT_EQ( roll_error(engine, "bad", "shadow", &message), ErrorCode::SharedShadow );
  EXPECT_NE( message.find("SHARED_SHADOW in bad"), std::string::npos );
  EXPECT_EQ( roll_error(engine, "worse", "shadow"), ErrorCode::SharedShadow );
}

TEST( Engine, TableSharedVariablesAreEvaluatedBeforeEntries ) {
  Engine engine( EngineConfig(), 1u );
  ASSERT_TRUE( engine.load_from_text(R"(
metadata:
  name: Shared
  namespace: test.shared
  version: 1.0.0
  specVersion: '1.0'
tables:
  - id: pet
    name: Pet
    entries:
      - value: Cat
        sets:
          sound: meow
  - id: owner
    name: Owner
    shared:
      $animal: '{{pet}}'
    entries: ['{{$animal}} says {{$animal.@sound}}']
)", "shared").valid );
  EXPECT_EQ( engine.roll("owner", "shared").text, "Cat says meow" );
}

TEST( Engine, InheritanceMergesEntriesById ) {
  Engine engine( EngineConfig(), 1u );
  load_main( engine );
  auto probs = engine.probabilities( "child", "main" );
  ASSERT_EQ( probs.size(), 3u );
  EXPECT_EQ( probs[0].value, "AA" );
  EXPECT_EQ( probs[1].value, "B" );
  EXPECT_EQ( probs[2].value, "C" );
  EXPECT_EQ( probs[0].percentage, "33.33%" );

  for ( int i = 0; i < 10; ++i ) {
    const std::string text = engine.roll( "child", "main" ).text;
    EXPECT_NE( text, "A" );
  }
}

TEST( Engine, InheritanceErrors ) {
  Engine engine( EngineConfig(), 1u );
  load_unchecked( engine, "inherit", R"(
metadata:
  name: Inherit
  namespace: test.inherit
tables:
  - id: orphan
    name: Orphan
    extends: missing
    entries: [x]
  - id: combo
    name: Combo
    type: composite
    sources:
      - tableId: orphan
  - id: wrong
    name: Wrong
    extends: combo
    entries: [y]
  - id: first
    name: First
    extends: second
    entries: [a]
  - id: second
    name: Second
    extends: first
    entries: [b]
)" );
  std::string message;
  EXPECT_EQ( roll_error(engine, "orphan", "inherit", &message),
    ErrorCode::Inheritance );
  EXPECT_EQ( message, "Parent table not found: 'missing' for table 'orphan'" );

  EXPECT_EQ( roll_error(engine, "wrong", "inherit", &message),
    ErrorCode::Inheritance );
  EXPECT_NE( message.find("Cannot extend non-simple table"), std::string::npos );

  EXPECT_EQ( roll_error(engine, "first", "inherit", &message),
    ErrorCode::Inheritance );
  EXPECT_NE( message.find("depth limit"), std::string::npos );
}

TEST( Engine, UniqueOverflowFromMetadata ) {
  Engine engine( EngineConfig(), 1u );
  load_unchecked( engine, "strict", R"(
metadata:
  name: Strict
  namespace: test.strict
  uniqueOverflowBehavior: error
tables:
  - id: duo
    name: Duo
    entries: [Left, Right]
)" );
  EXPECT_THROW( engine.evaluate_raw_pattern("{{3*unique*duo}}", "strict"), Error );

  // The default stops quietly once the table is exhausted
  load_main( engine );
  RollResult r = engine.evaluate_raw_pattern( "{{3*unique*duo}}", "main" );
  EXPECT_TRUE( r.text == "Left, Right" || r.text == "Right, Left" );
}

TEST( Engine, ImportsResolveByNamespace ) {
  Engine engine( EngineConfig(), 1u );
  load_both( engine );
  ASSERT_NE( engine.get_collection("main")->imports.get("c"), nullptr );
  EXPECT_EQ( *engine.get_collection("main")->imports.get("c"), "common" );

  RollResult r = engine.evaluate_raw_pattern( "{{c.weapon}} / {{c.farewell}}", "main" );
  EXPECT_EQ( r.text, "Sword / Farewell" );
  EXPECT_EQ( engine.evaluate_raw_pattern("{{game.common.weapon}}", "main").text,
    "Sword" );
}

TEST( Engine, ImportsResolveThroughAPathMap ) {
  Engine engine( EngineConfig(), 1u );
  load_main( engine );
  ASSERT_TRUE( engine.load_from_text(COMMON, "lib/common.yaml").valid );
  engine.resolve_imports( { { "game.common", "lib/common.yaml" } } );
  EXPECT_EQ( *engine.get_collection("main")->imports.get("c"), "lib/common.yaml" );
}

TEST( Engine, ListingTablesAndTemplates ) {
  Engine engine( EngineConfig(), 1u );
  load_both( engine );

  auto visible = engine.list_tables( std::string("main") );
  auto all = engine.list_tables( std::string("main"), true );
  EXPECT_EQ( visible.size(), 8u );
  EXPECT_EQ( all.size(), 9u );
  EXPECT_EQ( visible[0].id, "king" );
  EXPECT_EQ( visible[0].entry_count.value(), 1u );
  EXPECT_EQ( visible[0].result_type.value(), "ruler" );
  EXPECT_EQ( engine.list_tables().size(), 9u );

  auto templates = engine.list_templates( "main" );
  ASSERT_EQ( templates.size(), 1u );
  EXPECT_EQ( templates[0].id, "greeting" );

  auto imported = engine.list_imported_tables( "main" );
  ASSERT_EQ( imported.size(), 2u );
  EXPECT_EQ( imported[0].table.id, "weapon" );
  EXPECT_EQ( imported[0].origin.alias, "c" );
  EXPECT_EQ( imported[0].origin.source_namespace, "game.common" );
  EXPECT_EQ( imported[0].origin.source_collection_name, "Common" );
  EXPECT_EQ( engine.list_imported_tables("main", false).size(), 1u );

  auto imported_templates = engine.list_imported_templates( "main" );
  ASSERT_EQ( imported_templates.size(), 1u );
  EXPECT_EQ( imported_templates[0].tmpl.id, "farewell" );

  ASSERT_NE( engine.get_table("weapon"), nullptr );
  EXPECT_EQ( engine.get_table("weapon", std::string("main")), nullptr );
  EXPECT_NE( engine.get_template("greeting", "main"), nullptr );
}

TEST( Engine, CompositeProbabilities ) {
  Engine engine( EngineConfig(), 1u );
  load_main( engine );
  auto probs = engine.probabilities( "mixed", "main" );
  ASSERT_EQ( probs.size(), 1u );
  EXPECT_EQ( probs[0].percentage, "100.00%" );
  EXPECT_THROW( engine.probabilities("nope", "main"), Error );
}

TEST( Engine, UnloadAndUpdate ) {
  Engine engine( EngineConfig(), 1u );
  load_both( engine );
  auto collections = engine.list_collections();
  ASSERT_EQ( collections.size(), 2u );
  EXPECT_EQ( collections[0].name, "Main" );

  Document doc = load_document( COMMON );
  doc.tables[0].entries[0].value = std::string( "Axe" );
  engine.update_document( "common", doc );
  EXPECT_EQ( engine.evaluate_raw_pattern("{{c.weapon}}", "main").text, "Axe" );

  EXPECT_TRUE( engine.unload_collection("common") );
  EXPECT_FALSE( engine.unload_collection("common") );
  EXPECT_FALSE( engine.has_collection("common") );
  RollResult r = engine.evaluate_raw_pattern( "[{{weapon}}]", "main" );
  EXPECT_EQ( r.text, "[]" );
  ASSERT_FALSE( r.diagnostics.empty() );
  EXPECT_EQ( r.diagnostics[0].code, diag::REFERENCE_ERROR );
}

TEST( Engine, DiagnosticsAccumulate ) {
  Engine engine( EngineConfig(), 1u );
  load_main( engine );
  engine.evaluate_raw_pattern( "{{ghost}}", "main" );
  RollResult clean = engine.roll( "king", "main" );
  EXPECT_TRUE( clean.diagnostics.empty() );
  EXPECT_TRUE( engine.diagnostics().has_code(diag::REFERENCE_ERROR) );
}
