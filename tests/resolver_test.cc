// Standard library includes
#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "tabula/document.hh"
#include "tabula/resolver.hh"

using namespace tabula;

namespace {

  CollectionPtr make_collection( const std::string& id, const std::string& yaml ) {
    auto c = std::make_shared< Collection >();
    c->id = id;
    c->document = load_document( yaml );
    c->rebuild_indexes();
    return c;
  }

  // main imports common under the alias "c"
  CollectionMap sample_collections() {
    CollectionMap map;
    map.set( "main", make_collection( "main", R"(
metadata:
  name: Main
  namespace: game.main
imports:
  - path: game.common
    alias: c
tables:
  - id: color
    name: Main Color
    entries: [Teal]
templates:
  - id: greeting
    name: Greeting
    pattern: hello
)" ) );
    map.set( "common", make_collection( "common", R"(
metadata:
  name: Common
  namespace: game.common
tables:
  - id: color
    name: Common Color
    entries: [Grey]
  - id: weapon
    name: Weapon
    entries: [Sword]
templates:
  - id: farewell
    name: Farewell
    pattern: bye
)" ) );
    return map;
  }

} // anonymous namespace

TEST( Collection, IndexesTablesAndTemplates ) {
  auto c = make_collection( "x", "tables:\n  - id: a\n    name: A\n    entries: [1]\n" );
  ASSERT_NE( c->find_table("a"), nullptr );
  EXPECT_EQ( c->find_table("a")->name, "A" );
  EXPECT_EQ( c->find_table("b"), nullptr );
  EXPECT_EQ( c->find_template("a"), nullptr );
}

TEST( Resolver, BareReferencePrefersCurrentCollection ) {
  CollectionMap map = sample_collections();
  auto r = resolve_table_ref( "color", "main", map );
  ASSERT_TRUE( r.has_value() );
  EXPECT_EQ( r->collection_id, "main" );
  EXPECT_EQ( r->item->name, "Main Color" );

  auto other = resolve_table_ref( "color", "common", map );
  ASSERT_TRUE( other.has_value() );
  EXPECT_EQ( other->collection_id, "common" );
}

TEST( Resolver, BareReferenceFallsBackToAnyCollection ) {
  CollectionMap map = sample_collections();
  auto r = resolve_table_ref( "weapon", "main", map );
  ASSERT_TRUE( r.has_value() );
  EXPECT_EQ( r->collection_id, "common" );
  EXPECT_FALSE( resolve_table_ref("armor", "main", map).has_value() );
}

TEST( Resolver, ResolvedAliasWins ) {
  CollectionMap map = sample_collections();
  ( *map.get("main") )->imports.set( "c", "common" );
  auto r = resolve_table_ref( "c.color", "main", map );
  ASSERT_TRUE( r.has_value() );
  EXPECT_EQ( r->item->name, "Common Color" );
}

TEST( Resolver, NamespaceReference ) {
  CollectionMap map = sample_collections();
  auto r = resolve_table_ref( "game.common.color", "main", map );
  ASSERT_TRUE( r.has_value() );
  EXPECT_EQ( r->collection_id, "common" );
  EXPECT_EQ( r->item->name, "Common Color" );
}

TEST( Resolver, UnboundImportFollowsItsPath ) {
  CollectionMap map = sample_collections();
  // No alias binding: the declared import path names common's namespace
  auto r = resolve_table_ref( "c.color", "main", map );
  ASSERT_TRUE( r.has_value() );
  EXPECT_EQ( r->collection_id, "common" );
}

TEST( Resolver, Templates ) {
  CollectionMap map = sample_collections();
  auto local = resolve_template_ref( "greeting", "main", map );
  ASSERT_TRUE( local.has_value() );
  EXPECT_EQ( local->item->pattern, "hello" );

  auto imported = resolve_template_ref( "c.farewell", "main", map );
  ASSERT_TRUE( imported.has_value() );
  EXPECT_EQ( imported->collection_id, "common" );
  EXPECT_FALSE( resolve_template_ref("c.missing", "main", map).has_value() );
}
