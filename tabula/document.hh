// ╺┳╸┏━┓┏┓ ╻ ╻╻  ┏━┓
//  ┃ ┣━┫┣┻┓┃ ┃┃  ┣━┫
//  ╹ ╹ ╹┗━┛┗━┛┗━╸╹ ╹
//  Random table & template generation engine
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <cstdint>
#include <istream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "tabula/types.hh"
#include "tabula/util.hh"

namespace tabula {

  struct Entry {
    std::optional< std::string > id;
    std::optional< std::string > value;
    std::optional< double > weight;
    std::optional< std::vector< double > > range; // [min, max]
    std::optional< std::string > description;
    std::vector< std::string > tags;
    std::optional< Sets > sets;
    std::optional< Sets > assets;
    std::optional< std::string > result_type;
  };

  enum class TableType { Simple, Composite, Collection };

  inline const char* table_type_name( TableType t ) {
    switch ( t ) {
      case TableType::Composite: return "composite";
      case TableType::Collection: return "collection";
      default: return "simple";
    }
  }

  struct CompositeSource {
    std::string table_id;
    std::optional< double > weight;
  };

  struct Table {
    std::string id;
    std::string name;
    TableType type = TableType::Simple;
    std::optional< std::string > description;
    std::vector< std::string > tags;
    bool hidden = false;
    std::optional< std::string > extends;
    std::optional< Sets > default_sets;
    std::optional< std::string > result_type;
    std::optional< Sets > shared;

    std::vector< Entry > entries; // simple
    std::vector< CompositeSource > sources; // composite
    std::vector< std::string > collections; // collection
  };

  struct Template {
    std::string id;
    std::string name;
    std::string pattern;
    std::optional< std::string > description;
    std::vector< std::string > tags;
    std::optional< std::string > result_type;
    std::optional< Sets > shared;
  };

  struct Import {
    std::string path;
    std::string alias;
    std::optional< std::string > description;
  };

  struct Metadata {
    std::string name;
    std::string ns; // "namespace" key
    std::string version;
    std::string spec_version;
    std::optional< std::string > author;
    std::optional< std::string > description;
    std::vector< std::string > tags;

    // Per-document overrides of EngineConfig
    std::optional< std::int64_t > max_recursion_depth;
    std::optional< std::int64_t > max_exploding_dice;
    std::optional< std::int64_t > max_inheritance_depth;
    std::optional< UniqueOverflow > unique_overflow;
  };

  struct Document {
    Metadata metadata;
    std::vector< Import > imports;
    std::vector< Table > tables;
    std::vector< Template > templates;
    Sets variables; // static
    Sets shared; // document-level shared
  };

namespace internal {

  // Document keys. This block provides a single location for easy editing
  // if the schema changes.
  inline const std::string METADATA = "metadata";
  inline const std::string IMPORTS = "imports";
  inline const std::string TABLES = "tables";
  inline const std::string TEMPLATES = "templates";
  inline const std::string VARIABLES = "variables";
  inline const std::string SHARED = "shared";
  inline const std::string ENTRIES = "entries";
  inline const std::string SOURCES = "sources";
  inline const std::string COLLECTIONS = "collections";
  inline const std::string DEFAULT_SETS = "defaultSets";
  inline const std::string RESULT_TYPE = "resultType";
  inline const std::string SETS = "sets";
  inline const std::string ASSETS = "assets";

} // namespace tabula::internal

  // Builds a Document from YAML (or JSON) text. Errors are thrown as
  // ErrorCode::Load and carry the path to the offending node.
  class DocumentLoader {
  public:
    inline DocumentLoader() = default;

    Document load( std::istream& in );
    Document load( const std::string& text );

  private:

    // Tracks the path using sequence-element indexing,
    // e.g., ["tables[2]", "entries[0]", "range"]
    std::vector< std::string > path_stack_;

    // Pushes a path segment for the lifetime of the object
    struct PathFrame {
      PathFrame( DocumentLoader& l, const std::string& seg ) : loader( l ) {
        loader.path_stack_.push_back( seg );
      }
      ~PathFrame() { loader.path_stack_.pop_back(); }
      PathFrame( const PathFrame& ) = delete;
      PathFrame& operator=( const PathFrame& ) = delete;
      DocumentLoader& loader;
    };

    Metadata read_metadata( const ordered_node& n );
    Import read_import( const ordered_node& n );
    Table read_table( const ordered_node& n );
    Entry read_entry( const ordered_node& n );
    CompositeSource read_source( const ordered_node& n );
    Template read_template( const ordered_node& n );

    // Field helpers. Each reads key from mapping n when present.
    std::optional< std::string > opt_string( const ordered_node& n,
      const std::string& key );
    std::string req_string( const ordered_node& n, const std::string& key );
    std::optional< double > opt_number( const ordered_node& n,
      const std::string& key );
    std::optional< std::int64_t > opt_integer( const ordered_node& n,
      const std::string& key );
    std::vector< std::string > string_list( const ordered_node& n,
      const std::string& key );
    std::optional< Sets > string_map( const ordered_node& n,
      const std::string& key );

    void expect_mapping( const ordered_node& n, const char* what );

    // Helper for building error messages
    [[noreturn]] void throw_error_at( const std::string& msg );

  }; // class DocumentLoader

  inline Document load_document( const std::string& text ) {
    DocumentLoader loader;
    return loader.load( text );
  }

  inline Document load_document( std::istream& in ) {
    DocumentLoader loader;
    return loader.load( in );
  }

} // namespace tabula

inline tabula::Document tabula::DocumentLoader::load( std::istream& in ) {
  std::ostringstream ss;
  ss << in.rdbuf();
  return this->load( ss.str() );
}

inline tabula::Document tabula::DocumentLoader::load( const std::string& text ) {
  path_stack_.clear();

  ordered_node root;
  try {
    root = ordered_node::deserialize( text );
  }
  catch ( const fkyaml::exception& e ) {
    throw Error( ErrorCode::Load, std::string( "YAML parse error: " ) + e.what() );
  }

  if ( !root.is_mapping() ) {
    throw_error_at( "document root must be a mapping" );
  }

  Document doc;

  if ( root.contains(internal::METADATA) ) {
    PathFrame f( *this, internal::METADATA );
    doc.metadata = read_metadata( root.at(internal::METADATA) );
  }

  if ( root.contains(internal::IMPORTS) ) {
    const ordered_node& seq = root.at( internal::IMPORTS );
    if ( !seq.is_null() ) {
      if ( !seq.is_sequence() ) {
        PathFrame f( *this, internal::IMPORTS );
        throw_error_at( "must be a sequence" );
      }
      for ( size_t i = 0; i < seq.size(); ++i ) {
        PathFrame f( *this, internal::seq_indexed(internal::IMPORTS, i) );
        doc.imports.push_back( read_import(seq.at(i)) );
      }
    }
  }

  if ( root.contains(internal::TABLES) ) {
    const ordered_node& seq = root.at( internal::TABLES );
    if ( !seq.is_null() ) {
      if ( !seq.is_sequence() ) {
        PathFrame f( *this, internal::TABLES );
        throw_error_at( "must be a sequence" );
      }
      for ( size_t i = 0; i < seq.size(); ++i ) {
        PathFrame f( *this, internal::seq_indexed(internal::TABLES, i) );
        doc.tables.push_back( read_table(seq.at(i)) );
      }
    }
  }

  if ( root.contains(internal::TEMPLATES) ) {
    const ordered_node& seq = root.at( internal::TEMPLATES );
    if ( !seq.is_null() ) {
      if ( !seq.is_sequence() ) {
        PathFrame f( *this, internal::TEMPLATES );
        throw_error_at( "must be a sequence" );
      }
      for ( size_t i = 0; i < seq.size(); ++i ) {
        PathFrame f( *this, internal::seq_indexed(internal::TEMPLATES, i) );
        doc.templates.push_back( read_template(seq.at(i)) );
      }
    }
  }

  if ( auto v = string_map(root, internal::VARIABLES) ) doc.variables = *v;
  if ( auto s = string_map(root, internal::SHARED) ) doc.shared = *s;

  return doc;
}

inline tabula::Metadata tabula::DocumentLoader::read_metadata(
  const ordered_node& n )
{
  expect_mapping( n, "metadata" );

  Metadata md;
  md.name = opt_string( n, "name" ).value_or( "" );
  md.ns = opt_string( n, "namespace" ).value_or( "" );
  md.version = opt_string( n, "version" ).value_or( "" );
  md.spec_version = opt_string( n, "specVersion" ).value_or( "" );
  md.author = opt_string( n, "author" );
  md.description = opt_string( n, "description" );
  md.tags = string_list( n, "tags" );
  md.max_recursion_depth = opt_integer( n, "maxRecursionDepth" );
  md.max_exploding_dice = opt_integer( n, "maxExplodingDice" );
  md.max_inheritance_depth = opt_integer( n, "maxInheritanceDepth" );

  if ( auto behavior = opt_string(n, "uniqueOverflowBehavior") ) {
    md.unique_overflow = parse_unique_overflow( *behavior );
    if ( !md.unique_overflow ) {
      PathFrame f( *this, "uniqueOverflowBehavior" );
      throw_error_at( "unknown behavior '" + *behavior
        + "' (expected stop, cycle or error)" );
    }
  }
  return md;
}

inline tabula::Import tabula::DocumentLoader::read_import( const ordered_node& n )
{
  expect_mapping( n, "import" );
  Import imp;
  imp.path = req_string( n, "path" );
  imp.alias = req_string( n, "alias" );
  imp.description = opt_string( n, "description" );
  return imp;
}

inline tabula::Table tabula::DocumentLoader::read_table( const ordered_node& n )
{
  expect_mapping( n, "table" );

  Table t;
  t.id = opt_string( n, "id" ).value_or( "" );
  t.name = opt_string( n, "name" ).value_or( "" );

  const std::string type = opt_string( n, "type" ).value_or( "simple" );
  if ( type == "simple" ) t.type = TableType::Simple;
  else if ( type == "composite" ) t.type = TableType::Composite;
  else if ( type == "collection" ) t.type = TableType::Collection;
  else {
    PathFrame f( *this, "type" );
    throw_error_at( "unknown table type '" + type + "'" );
  }

  t.description = opt_string( n, "description" );
  t.tags = string_list( n, "tags" );
  t.extends = opt_string( n, "extends" );
  t.default_sets = string_map( n, internal::DEFAULT_SETS );
  t.result_type = opt_string( n, internal::RESULT_TYPE );
  t.shared = string_map( n, internal::SHARED );

  if ( n.contains("hidden") ) {
    const ordered_node& h = n.at( "hidden" );
    if ( !h.is_boolean() ) {
      PathFrame f( *this, "hidden" );
      throw_error_at( "must be a boolean" );
    }
    t.hidden = h.get_value< bool >();
  }

  if ( n.contains(internal::ENTRIES) && !n.at(internal::ENTRIES).is_null() ) {
    const ordered_node& seq = n.at( internal::ENTRIES );
    if ( !seq.is_sequence() ) {
      PathFrame f( *this, internal::ENTRIES );
      throw_error_at( "must be a sequence" );
    }
    for ( size_t i = 0; i < seq.size(); ++i ) {
      PathFrame f( *this, internal::seq_indexed(internal::ENTRIES, i) );
      t.entries.push_back( read_entry(seq.at(i)) );
    }
  }

  if ( n.contains(internal::SOURCES) && !n.at(internal::SOURCES).is_null() ) {
    const ordered_node& seq = n.at( internal::SOURCES );
    if ( !seq.is_sequence() ) {
      PathFrame f( *this, internal::SOURCES );
      throw_error_at( "must be a sequence" );
    }
    for ( size_t i = 0; i < seq.size(); ++i ) {
      PathFrame f( *this, internal::seq_indexed(internal::SOURCES, i) );
      t.sources.push_back( read_source(seq.at(i)) );
    }
  }

  t.collections = string_list( n, internal::COLLECTIONS );

  return t;
}

inline tabula::Entry tabula::DocumentLoader::read_entry( const ordered_node& n )
{
  Entry e;

  // A bare scalar is shorthand for { value: ... }
  if ( internal::is_non_null_scalar(n) ) {
    e.value = internal::to_string_any( n );
    return e;
  }

  expect_mapping( n, "entry" );

  e.id = opt_string( n, "id" );
  e.value = opt_string( n, "value" );
  e.weight = opt_number( n, "weight" );
  e.description = opt_string( n, "description" );
  e.tags = string_list( n, "tags" );
  e.sets = string_map( n, internal::SETS );
  e.assets = string_map( n, internal::ASSETS );
  e.result_type = opt_string( n, internal::RESULT_TYPE );

  if ( n.contains("range") && !n.at("range").is_null() ) {
    PathFrame f( *this, "range" );
    const ordered_node& r = n.at( "range" );
    if ( !r.is_sequence() ) throw_error_at( "must be a sequence [min, max]" );
    std::vector< double > bounds;
    for ( size_t i = 0; i < r.size(); ++i ) {
      const ordered_node& b = r.at( i );
      if ( b.is_integer() ) {
        bounds.push_back( static_cast< double >( b.get_value< std::int64_t >() ) );
      } else if ( b.is_float_number() ) {
        bounds.push_back( b.get_value< double >() );
      } else {
        throw_error_at( "bound " + std::to_string(i) + " must be a number" );
      }
    }
    e.range = bounds;
  }

  return e;
}

inline tabula::CompositeSource tabula::DocumentLoader::read_source(
  const ordered_node& n )
{
  expect_mapping( n, "source" );
  CompositeSource s;
  s.table_id = req_string( n, "tableId" );
  s.weight = opt_number( n, "weight" );
  return s;
}

inline tabula::Template tabula::DocumentLoader::read_template(
  const ordered_node& n )
{
  expect_mapping( n, "template" );
  Template t;
  t.id = opt_string( n, "id" ).value_or( "" );
  t.name = opt_string( n, "name" ).value_or( "" );
  t.pattern = opt_string( n, "pattern" ).value_or( "" );
  t.description = opt_string( n, "description" );
  t.tags = string_list( n, "tags" );
  t.result_type = opt_string( n, internal::RESULT_TYPE );
  t.shared = string_map( n, internal::SHARED );
  return t;
}

inline std::optional< std::string > tabula::DocumentLoader::opt_string(
  const ordered_node& n, const std::string& key )
{
  if ( !n.contains(key) ) return std::nullopt;
  const ordered_node& v = n.at( key );
  if ( v.is_null() ) return std::nullopt;
  if ( !v.is_scalar() ) {
    PathFrame f( *this, key );
    throw_error_at( "expected a scalar value" );
  }
  return internal::to_string_any( v );
}

inline std::string tabula::DocumentLoader::req_string( const ordered_node& n,
  const std::string& key )
{
  auto s = opt_string( n, key );
  if ( !s ) {
    PathFrame f( *this, key );
    throw_error_at( "required field is missing" );
  }
  return *s;
}

inline std::optional< double > tabula::DocumentLoader::opt_number(
  const ordered_node& n, const std::string& key )
{
  if ( !n.contains(key) ) return std::nullopt;
  const ordered_node& v = n.at( key );
  if ( v.is_null() ) return std::nullopt;
  if ( v.is_integer() ) {
    return static_cast< double >( v.get_value< std::int64_t >() );
  }
  if ( v.is_float_number() ) return v.get_value< double >();
  PathFrame f( *this, key );
  throw_error_at( "expected a number" );
}

inline std::optional< std::int64_t > tabula::DocumentLoader::opt_integer(
  const ordered_node& n, const std::string& key )
{
  if ( !n.contains(key) ) return std::nullopt;
  const ordered_node& v = n.at( key );
  if ( v.is_null() ) return std::nullopt;
  if ( v.is_integer() ) return v.get_value< std::int64_t >();
  PathFrame f( *this, key );
  throw_error_at( "expected an integer" );
}

inline std::vector< std::string > tabula::DocumentLoader::string_list(
  const ordered_node& n, const std::string& key )
{
  std::vector< std::string > out;
  if ( !n.contains(key) ) return out;
  const ordered_node& seq = n.at( key );
  if ( seq.is_null() ) return out;

  PathFrame f( *this, key );
  if ( !seq.is_sequence() ) throw_error_at( "must be a sequence" );
  for ( size_t i = 0; i < seq.size(); ++i ) {
    const ordered_node& el = seq.at( i );
    if ( !internal::is_non_null_scalar(el) ) {
      throw_error_at( "element " + std::to_string(i) + " must be a scalar" );
    }
    out.push_back( internal::to_string_any(el) );
  }
  return out;
}

inline std::optional< tabula::Sets > tabula::DocumentLoader::string_map(
  const ordered_node& n, const std::string& key )
{
  if ( !n.contains(key) ) return std::nullopt;
  const ordered_node& m = n.at( key );
  if ( m.is_null() ) return std::nullopt;

  PathFrame f( *this, key );
  if ( !m.is_mapping() ) throw_error_at( "must be a mapping" );

  Sets out;
  for ( const auto& [mk, mv] : m.map_items() ) {
    const std::string k = internal::to_string_any( mk );
    if ( !mv.is_scalar() ) {
      PathFrame fk( *this, k );
      throw_error_at( "values must be scalars" );
    }
    out.set( k, internal::to_string_any(mv) );
  }
  return out;
}

inline void tabula::DocumentLoader::expect_mapping( const ordered_node& n,
  const char* what )
{
  if ( !n.is_mapping() ) {
    throw_error_at( std::string( what ) + " must be a mapping" );
  }
}

[[noreturn]] inline void tabula::DocumentLoader::throw_error_at(
  const std::string& msg )
{
  // Compose "tables[2].entries[0].range: message"
  std::ostringstream oss;
  const std::string path = internal::join_path( path_stack_ );
  if ( !path.empty() ) oss << path << ": ";
  oss << msg;
  throw Error( ErrorCode::Load, oss.str() );
}
