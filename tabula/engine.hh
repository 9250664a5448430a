// ╺┳╸┏━┓┏┓ ╻ ╻╻  ┏━┓
//  ┃ ┣━┫┣┻┓┃ ┃┃  ┣━┫
//  ╹ ╹ ╹┗━┛┗━┛┗━╸╹ ╹
//  Random table & template generation engine
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <vector>

#include "tabula/context.hh"
#include "tabula/diagnostics.hh"
#include "tabula/document.hh"
#include "tabula/evaluator.hh"
#include "tabula/resolver.hh"
#include "tabula/tables.hh"
#include "tabula/trace.hh"
#include "tabula/types.hh"
#include "tabula/util.hh"
#include "tabula/validator.hh"

namespace tabula {

  struct TableInfo {
    std::string id;
    std::string name;
    TableType type = TableType::Simple;
    std::optional< std::string > description;
    std::vector< std::string > tags;
    bool hidden = false;
    std::optional< size_t > entry_count; // simple tables only
    std::optional< std::string > result_type;
  };

  struct TemplateInfo {
    std::string id;
    std::string name;
    std::optional< std::string > description;
    std::vector< std::string > tags;
    std::optional< std::string > result_type;
  };

  // Where an imported item came from. alias is the dotted prefix to use in
  // references ("names" or "names.elvish" for nested imports).
  struct ImportOrigin {
    std::string alias;
    std::string source_namespace;
    std::string source_collection_name;
  };

  struct ImportedTableInfo {
    TableInfo table;
    ImportOrigin origin;
  };

  struct ImportedTemplateInfo {
    TemplateInfo tmpl;
    ImportOrigin origin;
  };

  struct CollectionInfo {
    std::string id;
    std::string name;
    bool preloaded = false;
  };

  struct RollOptions {
    bool enable_trace = false;
    Sets shared; // pattern previews only: extra shared variables
  };

  struct RollMetadata {
    std::string source_id;
    std::string collection_id;
    std::int64_t timestamp = 0; // ms since the epoch
    std::optional< std::string > entry_id;
  };

  struct RollResult {
    std::string text;
    std::optional< std::string > result_type;
    std::optional< Sets > assets;
    std::optional< EvaluatedSets > placeholders;
    RollMetadata metadata;
    std::optional< RollTrace > trace;
    OrderedMap< CaptureVariable > captures;
    std::vector< EntryDescription > descriptions; // parents before children
    std::vector< std::string > expression_outputs; // pattern previews only
    std::vector< Diagnostic > diagnostics;
  };

  inline ordered_node to_node( const TableInfo& info );
  inline ordered_node to_node( const TemplateInfo& info );
  inline ordered_node to_node( const RollResult& result );

  // Owns the loaded collections and runs generations against them
  class Engine {
  public:
    inline explicit Engine( EngineConfig config = EngineConfig(),
      std::optional< std::uint32_t > seed = std::nullopt );

    // The evaluator holds callbacks into this object
    Engine( const Engine& ) = delete;
    Engine& operator=( const Engine& ) = delete;

    // Loading
    inline void load_collection( Document document, const std::string& id,
      bool preloaded = false );

    // Parses and validates. The collection is loaded only when the document
    // is valid. YAML errors are thrown as ErrorCode::Load.
    inline ValidationResult load_from_text( const std::string& text,
      const std::string& id, bool preloaded = false );
    inline ValidationResult load_from_file( const std::string& path,
      const std::string& id, bool preloaded = false );

    inline bool unload_collection( const std::string& id );
    inline bool has_collection( const std::string& id ) const {
      return collections_.contains( id );
    }
    inline const Collection* get_collection( const std::string& id ) const;

    // Replaces the document of a loaded collection and re-resolves imports
    inline void update_document( const std::string& id, Document document );

    inline std::vector< CollectionInfo > list_collections() const;

    // Binds import aliases to loaded collections, trying for each import
    // the path map, then a collection namespace, then a collection id
    inline void resolve_imports(
      const std::map< std::string, std::string >& path_to_id = {} );

    inline ValidationResult validate( const Document& document ) const {
      return validate_document( document );
    }

    // Access
    inline const Table* get_table( const std::string& table_id,
      const std::optional< std::string >& collection_id = std::nullopt ) const;
    inline const Template* get_template( const std::string& template_id,
      const std::string& collection_id ) const;

    inline std::vector< TableInfo > list_tables(
      const std::optional< std::string >& collection_id = std::nullopt,
      bool include_hidden = false ) const;
    inline std::vector< TemplateInfo > list_templates(
      const std::string& collection_id ) const;
    inline std::vector< ImportedTableInfo > list_imported_tables(
      const std::string& collection_id, bool include_hidden = true ) const;
    inline std::vector< ImportedTemplateInfo > list_imported_templates(
      const std::string& collection_id ) const;

    // Selection chances of a table's entries (or a composite's sources)
    inline std::vector< Probability > probabilities( const std::string& table_id,
      const std::string& collection_id );

    // Generation
    inline RollResult roll( const std::string& table_id,
      const std::string& collection_id, const RollOptions& options = {} );
    inline RollResult roll_template( const std::string& template_id,
      const std::string& collection_id, const RollOptions& options = {} );
    inline RollResult evaluate_raw_pattern( const std::string& pattern,
      const std::string& collection_id, const RollOptions& options = {} );

    inline void clear_inheritance_cache() { resolved_tables_.clear(); }

    inline Diagnostics& diagnostics() { return *diagnostics_; }
    inline const EngineConfig& config() const { return config_; }

  private:
    inline const Collection& require_collection( const std::string& id ) const;

    inline GenerationContext create_context( const Collection& collection,
      const RollOptions& options );

    inline RollResult finish( GenerationContext& ctx, std::string text,
      const std::string& source_id, const std::string& collection_id,
      size_t diagnostics_mark );

    inline TableRollResult roll_table( const Table& table, GenerationContext& ctx,
      const std::string& collection_id, const SelectionOptions& options );
    inline TableRollResult roll_simple( const Table& table, GenerationContext& ctx,
      const std::string& collection_id, const SelectionOptions& options );
    inline TableRollResult roll_composite( const Table& table,
      GenerationContext& ctx, const std::string& collection_id,
      const SelectionOptions& options );
    inline TableRollResult roll_collection( const Table& table,
      GenerationContext& ctx, const std::string& collection_id,
      const SelectionOptions& options );

    // Shared tail of simple and collection rolls: sets, value, description
    inline TableRollResult evaluate_entry( const SelectedEntry& selected,
      const std::string& table_id, const std::string& description_table_name,
      const std::string& description_table_id, GenerationContext& ctx,
      const std::string& collection_id );

    inline CollectionSources collection_sources( const Table& table,
      const std::string& collection_id );

    // Parent entries first, child entries override by id
    inline const Table& resolve_table_inheritance( const Table& table,
      const std::string& collection_id, int depth = 0 );

    inline void collect_imported_tables( const Collection& c,
      const std::string& alias, bool include_hidden, std::set< std::string >& visited,
      std::vector< ImportedTableInfo >& out ) const;
    inline void collect_imported_templates( const Collection& c,
      const std::string& alias, std::set< std::string >& visited,
      std::vector< ImportedTemplateInfo >& out ) const;

    EngineConfig config_;
    std::shared_ptr< std::mt19937 > rng_;
    std::shared_ptr< Diagnostics > diagnostics_;
    CollectionMap collections_;
    std::map< std::string, Table > resolved_tables_; // "collection:table"
    Evaluator evaluator_;
  };

namespace internal {

  inline TableInfo table_info( const Table& t ) {
    TableInfo info;
    info.id = t.id;
    info.name = t.name;
    info.type = t.type;
    info.description = t.description;
    info.tags = t.tags;
    info.hidden = t.hidden;
    if ( t.type == TableType::Simple ) info.entry_count = t.entries.size();
    info.result_type = t.result_type;
    return info;
  }

  inline TemplateInfo template_info( const Template& t ) {
    return TemplateInfo{ t.id, t.name, t.description, t.tags, t.result_type };
  }

  // Restores the caller's current table and entry when a nested roll ends
  class SelfStateRestorer {
  public:
    inline explicit SelfStateRestorer( GenerationContext& ctx )
      : ctx_( ctx ), saved_( ctx.self() ) {}
    inline ~SelfStateRestorer() { ctx_.self() = saved_; }

    SelfStateRestorer( const SelfStateRestorer& ) = delete;
    SelfStateRestorer& operator=( const SelfStateRestorer& ) = delete;

  private:
    GenerationContext& ctx_;
    SelfState saved_;
  };

  inline int clamp_limit( std::int64_t v ) {
    return static_cast< int >( std::min< std::int64_t >( v,
      std::numeric_limits< int >::max() ) );
  }

  inline std::int64_t now_ms() {
    return std::chrono::duration_cast< std::chrono::milliseconds >(
      std::chrono::system_clock::now().time_since_epoch() ).count();
  }

  inline ordered_node string_list_node( const std::vector< std::string >& v ) {
    return make_string_sequence( v );
  }

} // namespace tabula::internal

} // namespace tabula

inline tabula::Engine::Engine( EngineConfig config,
  std::optional< std::uint32_t > seed )
  : config_( config ),
  rng_( std::make_shared< std::mt19937 >( seed ? *seed : std::random_device{}() ) ),
  diagnostics_( std::make_shared< Diagnostics >() ),
  evaluator_( EvaluatorDependencies{
    [this]( const std::string& ref, const std::string& cid ) {
      return resolve_table_ref( ref, cid, collections_ );
    },
    [this]( const std::string& ref, const std::string& cid ) {
      return resolve_template_ref( ref, cid, collections_ );
    },
    [this]( const Table& table, GenerationContext& ctx, const std::string& cid,
      const SelectionOptions& options )
    {
      return roll_table( table, ctx, cid, options );
    },
    [this]( const std::string& id ) { return get_collection( id ); },
    [this]( const std::string& table_id, const std::string& cid ) {
      return get_table( table_id, cid );
    }
  } )
{
}

inline void tabula::Engine::load_collection( Document document,
  const std::string& id, bool preloaded )
{
  auto c = std::make_shared< Collection >();
  c->id = id;
  c->document = std::move( document );
  c->preloaded = preloaded;
  c->source = preloaded ? "preloaded" : id;
  c->rebuild_indexes();
  collections_.set( id, c );
  clear_inheritance_cache();
}

inline tabula::ValidationResult tabula::Engine::load_from_text(
  const std::string& text, const std::string& id, bool preloaded )
{
  Document doc = load_document( text );
  ValidationResult validation = validate( doc );
  if ( validation.valid ) load_collection( std::move(doc), id, preloaded );
  return validation;
}

inline tabula::ValidationResult tabula::Engine::load_from_file(
  const std::string& path, const std::string& id, bool preloaded )
{
  std::ifstream in( path );
  if ( !in ) {
    throw Error( ErrorCode::Load, "Could not open document file: " + path );
  }
  Document doc;
  try {
    doc = load_document( in );
  }
  catch ( const Error& e ) {
    throw Error( e.code(), path + ": " + e.what() );
  }
  ValidationResult validation = validate( doc );
  if ( validation.valid ) load_collection( std::move(doc), id, preloaded );
  return validation;
}

inline bool tabula::Engine::unload_collection( const std::string& id ) {
  const bool removed = collections_.erase( id );
  if ( removed ) clear_inheritance_cache();
  return removed;
}

inline const tabula::Collection* tabula::Engine::get_collection(
  const std::string& id ) const
{
  const CollectionPtr* c = collections_.get( id );
  return c ? c->get() : nullptr;
}

inline void tabula::Engine::update_document( const std::string& id,
  Document document )
{
  CollectionPtr* c = collections_.get( id );
  if ( !c ) return;
  ( *c )->document = std::move( document );
  ( *c )->rebuild_indexes();
  clear_inheritance_cache();
  resolve_imports();
}

inline std::vector< tabula::CollectionInfo > tabula::Engine::list_collections()
  const
{
  std::vector< CollectionInfo > out;
  for ( const auto& [id, c] : collections_ ) {
    out.push_back( CollectionInfo{ id, c->document.metadata.name, c->preloaded } );
  }
  return out;
}

inline void tabula::Engine::resolve_imports(
  const std::map< std::string, std::string >& path_to_id )
{
  for ( auto& [id, c] : collections_ ) {
    if ( c->document.imports.empty() ) continue;
    c->imports.clear();

    for ( const auto& imp : c->document.imports ) {
      std::optional< std::string > target;

      auto mapped = path_to_id.find( imp.path );
      if ( mapped != path_to_id.end() && collections_.contains(mapped->second) ) {
        target = mapped->second;
      }
      if ( !target ) {
        for ( const auto& [cid, candidate] : collections_ ) {
          if ( candidate->document.metadata.ns == imp.path ) {
            target = cid;
            break;
          }
        }
      }
      if ( !target && collections_.contains(imp.path) ) target = imp.path;

      if ( target ) c->imports.set( imp.alias, *target );
    }
  }
  clear_inheritance_cache();
}

inline const tabula::Table* tabula::Engine::get_table( const std::string& table_id,
  const std::optional< std::string >& collection_id ) const
{
  if ( collection_id ) {
    const Collection* c = get_collection( *collection_id );
    return c ? c->find_table( table_id ) : nullptr;
  }
  for ( const auto& [id, c] : collections_ ) {
    if ( const Table* t = c->find_table(table_id) ) return t;
  }
  return nullptr;
}

inline const tabula::Template* tabula::Engine::get_template(
  const std::string& template_id, const std::string& collection_id ) const
{
  const Collection* c = get_collection( collection_id );
  return c ? c->find_template( template_id ) : nullptr;
}

inline std::vector< tabula::TableInfo > tabula::Engine::list_tables(
  const std::optional< std::string >& collection_id, bool include_hidden ) const
{
  std::vector< TableInfo > out;
  auto add = [&]( const Collection& c ) {
    for ( const auto& t : c.document.tables ) {
      if ( t.hidden && !include_hidden ) continue;
      out.push_back( internal::table_info(t) );
    }
  };

  if ( collection_id ) {
    if ( const Collection* c = get_collection(*collection_id) ) add( *c );
  } else {
    for ( const auto& [id, c] : collections_ ) add( *c );
  }
  return out;
}

inline std::vector< tabula::TemplateInfo > tabula::Engine::list_templates(
  const std::string& collection_id ) const
{
  std::vector< TemplateInfo > out;
  if ( const Collection* c = get_collection(collection_id) ) {
    for ( const auto& t : c->document.templates ) {
      out.push_back( internal::template_info(t) );
    }
  }
  return out;
}

inline std::vector< tabula::ImportedTableInfo > tabula::Engine::list_imported_tables(
  const std::string& collection_id, bool include_hidden ) const
{
  std::vector< ImportedTableInfo > out;
  const Collection* c = get_collection( collection_id );
  if ( !c ) return out;

  std::set< std::string > visited{ collection_id };
  for ( const auto& [alias, target_id] : c->imports ) {
    if ( const Collection* target = get_collection(target_id) ) {
      collect_imported_tables( *target, alias, include_hidden, visited, out );
    }
  }
  return out;
}

inline void tabula::Engine::collect_imported_tables( const Collection& c,
  const std::string& alias, bool include_hidden, std::set< std::string >& visited,
  std::vector< ImportedTableInfo >& out ) const
{
  if ( !visited.insert(c.id).second ) return;

  const ImportOrigin origin{ alias, c.document.metadata.ns,
    c.document.metadata.name };
  for ( const auto& t : c.document.tables ) {
    if ( t.hidden && !include_hidden ) continue;
    out.push_back( ImportedTableInfo{ internal::table_info(t), origin } );
  }

  for ( const auto& [nested_alias, target_id] : c.imports ) {
    if ( const Collection* target = get_collection(target_id) ) {
      collect_imported_tables( *target, alias + '.' + nested_alias,
        include_hidden, visited, out );
    }
  }
}

inline std::vector< tabula::ImportedTemplateInfo >
  tabula::Engine::list_imported_templates( const std::string& collection_id ) const
{
  std::vector< ImportedTemplateInfo > out;
  const Collection* c = get_collection( collection_id );
  if ( !c ) return out;

  std::set< std::string > visited{ collection_id };
  for ( const auto& [alias, target_id] : c->imports ) {
    if ( const Collection* target = get_collection(target_id) ) {
      collect_imported_templates( *target, alias, visited, out );
    }
  }
  return out;
}

inline void tabula::Engine::collect_imported_templates( const Collection& c,
  const std::string& alias, std::set< std::string >& visited,
  std::vector< ImportedTemplateInfo >& out ) const
{
  if ( !visited.insert(c.id).second ) return;

  const ImportOrigin origin{ alias, c.document.metadata.ns,
    c.document.metadata.name };
  for ( const auto& t : c.document.templates ) {
    out.push_back( ImportedTemplateInfo{ internal::template_info(t), origin } );
  }

  for ( const auto& [nested_alias, target_id] : c.imports ) {
    if ( const Collection* target = get_collection(target_id) ) {
      collect_imported_templates( *target, alias + '.' + nested_alias, visited,
        out );
    }
  }
}

inline std::vector< tabula::Probability > tabula::Engine::probabilities(
  const std::string& table_id, const std::string& collection_id )
{
  require_collection( collection_id );
  const Table* table = get_table( table_id, collection_id );
  if ( !table ) {
    throw Error( ErrorCode::Reference, "Table not found: " + table_id
      + " in collection " + collection_id );
  }
  switch ( table->type ) {
    case TableType::Composite:
      return get_source_probabilities( *table );
    case TableType::Collection:
      return get_collection_probabilities( collection_sources(*table,
        collection_id) );
    default:
      return get_table_probabilities( resolve_table_inheritance(*table,
        collection_id) );
  }
}

inline const tabula::Collection& tabula::Engine::require_collection(
  const std::string& id ) const
{
  const Collection* c = get_collection( id );
  if ( !c ) throw Error( ErrorCode::Reference, "Collection not found: " + id );
  return *c;
}

inline tabula::GenerationContext tabula::Engine::create_context(
  const Collection& collection, const RollOptions& options )
{
  const Metadata& md = collection.document.metadata;
  EngineConfig config = config_;
  if ( md.max_recursion_depth ) {
    config.max_recursion_depth = internal::clamp_limit( *md.max_recursion_depth );
  }
  if ( md.max_exploding_dice ) {
    config.max_exploding_dice = internal::clamp_limit( *md.max_exploding_dice );
  }
  if ( md.max_inheritance_depth ) {
    config.max_inheritance_depth = internal::clamp_limit( *md.max_inheritance_depth );
  }
  if ( md.unique_overflow ) config.unique_overflow = *md.unique_overflow;

  GenerationContext ctx( config, collection.document.variables, rng_,
    diagnostics_, options.enable_trace );

  // Names first, so table-level shared variables cannot shadow them
  for ( const auto& name : collection.document.shared.keys() ) {
    ctx.register_document_shared_name( name );
    ctx.register_document_shared_name( internal::strip_dollar(name) );
  }
  evaluator_.evaluate_shared_variables( collection.document.shared, ctx,
    collection.id );

  // Only descriptions from the roll itself are reported
  ctx.clear_descriptions();
  return ctx;
}

inline tabula::RollResult tabula::Engine::finish( GenerationContext& ctx,
  std::string text, const std::string& source_id,
  const std::string& collection_id, size_t diagnostics_mark )
{
  RollResult result;
  result.text = std::move( text );
  result.metadata.source_id = source_id;
  result.metadata.collection_id = collection_id;
  result.metadata.timestamp = internal::now_ms();
  if ( ctx.trace() ) result.trace = ctx.trace()->extract();
  result.captures = ctx.capture_variables();

  result.descriptions = ctx.descriptions();
  std::stable_sort( result.descriptions.begin(), result.descriptions.end(),
    []( const EntryDescription& a, const EntryDescription& b ) {
      return a.depth < b.depth;
    } );

  result.diagnostics = diagnostics_->since( diagnostics_mark );
  return result;
}

inline tabula::RollResult tabula::Engine::roll( const std::string& table_id,
  const std::string& collection_id, const RollOptions& options )
{
  const Collection& collection = require_collection( collection_id );
  const Table* table = collection.find_table( table_id );
  if ( !table ) {
    throw Error( ErrorCode::Reference, "Table not found: " + table_id
      + " in collection " + collection_id );
  }

  const size_t mark = diagnostics_->size();
  GenerationContext ctx = create_context( collection, options );

  ordered_node parsed;
  if ( ctx.tracing() ) {
    parsed = ordered_node::mapping();
    parsed[ "collectionId" ] = internal::make_node_from( collection_id );
    parsed[ "tableType" ] = internal::make_node_from(
      std::string( table_type_name(table->type) ) );
  }
  TraceScope root( ctx, TraceNodeType::Root, "Roll: "
    + ( table->name.empty() ? table_id : table->name ), table_id, parsed );

  const TableRollResult rolled = roll_table( *table, ctx, collection_id,
    SelectionOptions() );
  root.finish( TraceOutput{ rolled.text, false, {} } );

  RollResult result = finish( ctx, rolled.text, table_id, collection_id, mark );
  result.result_type = rolled.result_type;
  result.assets = rolled.assets;
  result.placeholders = rolled.placeholders;
  result.metadata.entry_id = rolled.entry_id;
  return result;
}

inline tabula::RollResult tabula::Engine::roll_template(
  const std::string& template_id, const std::string& collection_id,
  const RollOptions& options )
{
  const Collection& collection = require_collection( collection_id );
  const Template* tpl = collection.find_template( template_id );
  if ( !tpl ) {
    throw Error( ErrorCode::Reference, "Template not found: " + template_id
      + " in collection " + collection_id );
  }

  const size_t mark = diagnostics_->size();
  GenerationContext ctx = create_context( collection, options );

  ordered_node parsed;
  if ( ctx.tracing() ) {
    parsed = ordered_node::mapping();
    parsed[ "collectionId" ] = internal::make_node_from( collection_id );
    parsed[ "pattern" ] = internal::make_node_from( tpl->pattern );
  }
  TraceScope root( ctx, TraceNodeType::Root, "Template: "
    + ( tpl->name.empty() ? template_id : tpl->name ), template_id, parsed );

  if ( tpl->shared ) {
    evaluator_.evaluate_table_level_shared( *tpl->shared, ctx, collection_id,
      template_id );
  }
  const std::string text = evaluator_.evaluate_pattern( tpl->pattern, ctx,
    collection_id );
  root.finish( TraceOutput{ text, false, {} } );

  RollResult result = finish( ctx, text, template_id, collection_id, mark );
  result.result_type = tpl->result_type;
  return result;
}

inline tabula::RollResult tabula::Engine::evaluate_raw_pattern(
  const std::string& pattern, const std::string& collection_id,
  const RollOptions& options )
{
  static const std::string preview_id = "__preview__";
  const Collection& collection = require_collection( collection_id );

  const size_t mark = diagnostics_->size();
  GenerationContext ctx = create_context( collection, options );

  // Kept out of the trace
  if ( !options.shared.empty() ) {
    evaluator_.evaluate_table_level_shared( options.shared, ctx, collection_id,
      preview_id );
  }

  ordered_node parsed;
  if ( ctx.tracing() ) {
    parsed = ordered_node::mapping();
    parsed[ "collectionId" ] = internal::make_node_from( collection_id );
    parsed[ "pattern" ] = internal::make_node_from( pattern );
  }
  TraceScope root( ctx, TraceNodeType::Root, "Pattern Preview", pattern, parsed );

  PatternOutputs outputs = evaluator_.evaluate_pattern_with_outputs( pattern, ctx,
    collection_id );
  root.finish( TraceOutput{ outputs.text, false, {} } );

  RollResult result = finish( ctx, outputs.text, preview_id, collection_id, mark );
  result.expression_outputs = std::move( outputs.expression_outputs );
  return result;
}

inline tabula::TableRollResult tabula::Engine::roll_table( const Table& table,
  GenerationContext& ctx, const std::string& collection_id,
  const SelectionOptions& options )
{
  RecursionGuard guard( ctx, table.id );

  ordered_node parsed;
  if ( ctx.tracing() ) {
    parsed = ordered_node::mapping();
    parsed[ "type" ] = internal::make_node_from(
      std::string( table_type_name(table.type) ) );
    parsed[ "name" ] = internal::make_node_from( table.name );
  }
  TraceScope trace( ctx, TraceNodeType::TableRoll, "Table: "
    + ( table.name.empty() ? table.id : table.name ), table.id, parsed );

  internal::SelfStateRestorer restore( ctx );

  try {
    ctx.set_current_table( table.id );

    // Names already bound by an enclosing roll are skipped
    if ( table.shared ) {
      evaluator_.evaluate_table_level_shared( *table.shared, ctx, collection_id,
        table.id );
    }

    TableRollResult result;
    switch ( table.type ) {
      case TableType::Simple:
        result = roll_simple( table, ctx, collection_id, options );
        break;
      case TableType::Composite:
        result = roll_composite( table, ctx, collection_id, options );
        break;
      case TableType::Collection:
        result = roll_collection( table, ctx, collection_id, options );
        break;
    }

    trace.finish( TraceOutput{ result.text, false, {} } );
    return result;
  }
  catch ( const std::exception& e ) {
    trace.fail( e.what() );
    throw;
  }
}

inline tabula::TableRollResult tabula::Engine::roll_simple( const Table& table,
  GenerationContext& ctx, const std::string& collection_id,
  const SelectionOptions& options )
{
  const Table& resolved = resolve_table_inheritance( table, collection_id );

  const std::vector< WeightedEntry > pool = build_weighted_pool( resolved.entries,
    resolved.id, options.exclude_ids );
  const double total = total_weight( pool );

  const std::optional< SelectedEntry > selected = roll_simple_table( resolved, ctx,
    options );

  if ( ctx.tracing() ) {
    double weight = 0.0;
    if ( selected ) {
      weight = 1.0;
      for ( const auto& w : pool ) if ( w.id == selected->id ) weight = w.weight;
    }
    ordered_node meta = ordered_node::mapping();
    meta[ "type" ] = internal::make_node_from( std::string( "entry_select" ) );
    meta[ "tableId" ] = internal::make_node_from( table.id );
    meta[ "entryId" ] = internal::make_node_from(
      selected ? selected->id : std::string() );
    meta[ "selectedWeight" ] = internal::make_node_from( weight );
    meta[ "totalWeight" ] = internal::make_node_from( total );
    meta[ "probability" ] = internal::make_node_from(
      total > 0 ? weight / total : 0.0 );
    meta[ "poolSize" ] = internal::make_node_from(
      static_cast< std::int64_t >( pool.size() ) );
    meta[ "unique" ] = internal::make_node_from( options.unique );
    if ( !options.exclude_ids.empty() ) {
      meta[ "excludedIds" ] = internal::string_list_node( std::vector< std::string >(
        options.exclude_ids.begin(), options.exclude_ids.end() ) );
    }
    const std::string value = selected
      ? selected->entry->value.value_or( "" ) : std::string();
    ctx.trace_leaf( TraceNodeType::EntrySelect, selected ? "Selected: "
      + selected->id : std::string( "No entry selected" ), table.id,
      TraceOutput{ value, false, {} }, meta );
  }

  if ( !selected ) return TableRollResult();

  return evaluate_entry( *selected, table.id, resolved.name, resolved.id, ctx,
    collection_id );
}

inline tabula::TableRollResult tabula::Engine::evaluate_entry(
  const SelectedEntry& selected, const std::string& table_id,
  const std::string& description_table_name,
  const std::string& description_table_id, GenerationContext& ctx,
  const std::string& collection_id )
{
  const Entry& entry = *selected.entry;

  // Visible to @self.* and again while sets and value are evaluated
  ctx.set_current_table( table_id, selected.id );
  ctx.self().entry_description = entry.description;
  ctx.self().entry_value = entry.value;

  EvaluatedSets sets = to_evaluated_sets( selected.merged_sets );
  if ( !selected.merged_sets.empty() ) {
    sets = evaluator_.evaluate_set_values( selected.merged_sets, ctx,
      collection_id, table_id );
    ctx.merge_placeholders( table_id, sets );
  }

  const std::string text = evaluator_.evaluate_pattern( entry.value.value_or(""),
    ctx, collection_id );

  ctx.self().entry_description.reset();
  ctx.self().entry_value.reset();

  if ( entry.description ) {
    const std::string description = evaluator_.evaluate_pattern(
      *entry.description, ctx, collection_id );
    ctx.add_description( description_table_name, description_table_id, text,
      description );
  }

  TableRollResult result;
  result.text = text;
  result.result_type = selected.result_type;
  result.assets = selected.assets;
  result.placeholders = std::move( sets );
  result.entry_id = selected.id;
  return result;
}

inline tabula::TableRollResult tabula::Engine::roll_composite( const Table& table,
  GenerationContext& ctx, const std::string& collection_id,
  const SelectionOptions& options )
{
  const std::optional< SourceSelection > selection = select_source( table,
    ctx.rng() );
  if ( !selection ) return TableRollResult();

  if ( ctx.tracing() ) {
    const auto pool = build_source_pool( table.sources );
    double total = 0.0;
    for ( const auto& p : pool ) total += p.second;
    std::vector< ordered_node > sources;
    for ( const auto& [source, weight] : pool ) {
      ordered_node s = ordered_node::mapping();
      s[ "tableId" ] = internal::make_node_from( source->table_id );
      s[ "weight" ] = internal::make_node_from( weight );
      s[ "probability" ] = internal::make_node_from(
        total > 0 ? weight / total : 0.0 );
      sources.push_back( s );
    }
    ordered_node meta = ordered_node::mapping();
    meta[ "type" ] = internal::make_node_from( std::string( "composite_select" ) );
    meta[ "sources" ] = internal::make_node_from( sources );
    meta[ "selectedTableId" ] = internal::make_node_from( selection->table_id );
    ctx.trace_leaf( TraceNodeType::CompositeSelect, "Source: "
      + selection->table_id, table.id,
      TraceOutput{ selection->table_id, false, {} }, meta );
  }

  auto source = resolve_table_ref( selection->table_id, collection_id,
    collections_ );
  if ( !source ) {
    throw Error( ErrorCode::Reference, "Source table not found: "
      + selection->table_id );
  }

  TableRollResult result = roll_table( *source->item, ctx, source->collection_id,
    options );
  if ( !result.result_type ) {
    result.result_type = source->item->result_type ? source->item->result_type
      : table.result_type;
  }
  return result;
}

inline tabula::CollectionSources tabula::Engine::collection_sources(
  const Table& table, const std::string& collection_id )
{
  CollectionSources sources;
  for ( const auto& ref : table.collections ) {
    auto r = resolve_table_ref( ref, collection_id, collections_ );
    if ( !r || r->item->type != TableType::Simple ) continue;
    sources.emplace_back( ref, &resolve_table_inheritance( *r->item,
      r->collection_id ) );
  }
  return sources;
}

inline tabula::TableRollResult tabula::Engine::roll_collection( const Table& table,
  GenerationContext& ctx, const std::string& collection_id,
  const SelectionOptions& options )
{
  const CollectionSources sources = collection_sources( table, collection_id );

  if ( ctx.tracing() ) {
    std::int64_t entries = 0;
    double weight = 0.0;
    for ( const auto& [id, source] : sources ) {
      const auto pool = build_weighted_pool( source->entries, id,
        options.exclude_ids );
      entries += static_cast< std::int64_t >( pool.size() );
      weight += total_weight( pool );
    }
    ordered_node meta = ordered_node::mapping();
    meta[ "type" ] = internal::make_node_from( std::string( "collection_merge" ) );
    meta[ "sourceTables" ] = internal::string_list_node( table.collections );
    meta[ "totalEntries" ] = internal::make_node_from( entries );
    meta[ "totalWeight" ] = internal::make_node_from( weight );
    ctx.trace_leaf( TraceNodeType::CollectionMerge, "Merged "
      + std::to_string( table.collections.size() ) + " tables", table.id,
      TraceOutput{ std::to_string( entries ) + " entries", false, {} }, meta );
  }

  const std::optional< SelectedEntry > selected = roll_collection_table( table,
    sources, ctx, options );
  if ( !selected ) return TableRollResult();

  ctx.trace_leaf( TraceNodeType::EntrySelect, "Selected: " + selected->id,
    table.id, TraceOutput{ selected->entry->value.value_or(""), false, {} } );

  // Descriptions are attributed to the source table
  std::string source_name = selected->source_table_id;
  for ( const auto& [id, source] : sources ) {
    if ( id == selected->source_table_id && !source->name.empty() ) {
      source_name = source->name;
      break;
    }
  }

  return evaluate_entry( *selected, table.id, source_name,
    selected->source_table_id, ctx, collection_id );
}

inline const tabula::Table& tabula::Engine::resolve_table_inheritance(
  const Table& table, const std::string& collection_id, int depth )
{
  const std::string key = collection_id + ':' + table.id;
  auto cached = resolved_tables_.find( key );
  if ( cached != resolved_tables_.end() ) return cached->second;

  if ( !table.extends || table.extends->empty() ) return table;

  int max_depth = config_.max_inheritance_depth;
  if ( const Collection* c = get_collection(collection_id) ) {
    if ( c->document.metadata.max_inheritance_depth ) {
      max_depth = internal::clamp_limit( *c->document.metadata.max_inheritance_depth );
    }
  }
  if ( depth >= max_depth ) {
    throw Error( ErrorCode::Inheritance, "Inheritance depth limit exceeded for"
      " table '" + table.id + "' (max: " + std::to_string( max_depth ) + ")" );
  }

  const std::string& parent_ref = *table.extends;
  auto parent = resolve_table_ref( parent_ref, collection_id, collections_ );
  if ( !parent ) {
    throw Error( ErrorCode::Inheritance, "Parent table not found: '" + parent_ref
      + "' for table '" + table.id + "'" );
  }
  if ( parent->item->type != TableType::Simple ) {
    throw Error( ErrorCode::Inheritance, "Cannot extend non-simple table: '"
      + parent_ref + "' (type: " + table_type_name( parent->item->type ) + ")" );
  }

  const Table& base = resolve_table_inheritance( *parent->item,
    parent->collection_id, depth + 1 );

  // Entries keyed by id in first-seen order
  OrderedMap< Entry > merged;
  for ( size_t i = 0; i < base.entries.size(); ++i ) {
    Entry e = base.entries[ i ];
    const std::string id = e.id ? *e.id : internal::generated_entry_id( base.id, i );
    e.id = id;
    merged.set( id, std::move(e) );
  }
  for ( size_t i = 0; i < table.entries.size(); ++i ) {
    const Entry& child = table.entries[ i ];
    const std::string id = child.id ? *child.id
      : internal::generated_entry_id( table.id, i );

    Entry* existing = merged.get( id );
    if ( !existing ) {
      Entry e = child;
      e.id = id;
      merged.set( id, std::move(e) );
      continue;
    }
    if ( child.value ) existing->value = child.value;
    if ( child.weight ) existing->weight = child.weight;
    if ( child.range ) existing->range = child.range;
    if ( child.description ) existing->description = child.description;
    if ( !child.tags.empty() ) existing->tags = child.tags;
    if ( child.sets ) existing->sets = child.sets;
    if ( child.assets ) existing->assets = child.assets;
    if ( child.result_type ) existing->result_type = child.result_type;
  }

  Table resolved = table;
  resolved.entries.clear();
  for ( auto& kv : merged ) resolved.entries.push_back( std::move(kv.second) );

  Sets default_sets;
  if ( base.default_sets ) default_sets.merge( *base.default_sets );
  if ( table.default_sets ) default_sets.merge( *table.default_sets );
  resolved.default_sets = default_sets.empty() ? std::nullopt
    : std::optional< Sets >( default_sets );
  resolved.extends.reset();

  return resolved_tables_.emplace( key, std::move(resolved) ).first->second;
}

inline tabula::ordered_node tabula::to_node( const TableInfo& info ) {
  using internal::make_node_from;
  ordered_node n = ordered_node::mapping();
  n[ "id" ] = make_node_from( info.id );
  n[ "name" ] = make_node_from( info.name );
  n[ "type" ] = make_node_from( std::string( table_type_name(info.type) ) );
  if ( info.description ) n[ "description" ] = make_node_from( *info.description );
  if ( !info.tags.empty() ) n[ "tags" ] = internal::make_string_sequence( info.tags );
  if ( info.hidden ) n[ "hidden" ] = make_node_from( true );
  if ( info.entry_count ) {
    n[ "entryCount" ] = make_node_from(
      static_cast< std::int64_t >( *info.entry_count ) );
  }
  if ( info.result_type ) n[ "resultType" ] = make_node_from( *info.result_type );
  return n;
}

inline tabula::ordered_node tabula::to_node( const TemplateInfo& info ) {
  using internal::make_node_from;
  ordered_node n = ordered_node::mapping();
  n[ "id" ] = make_node_from( info.id );
  n[ "name" ] = make_node_from( info.name );
  if ( info.description ) n[ "description" ] = make_node_from( *info.description );
  if ( !info.tags.empty() ) n[ "tags" ] = internal::make_string_sequence( info.tags );
  if ( info.result_type ) n[ "resultType" ] = make_node_from( *info.result_type );
  return n;
}

inline tabula::ordered_node tabula::to_node( const RollResult& result ) {
  using internal::make_node_from;
  ordered_node n = ordered_node::mapping();
  n[ "text" ] = make_node_from( result.text );
  if ( result.result_type ) n[ "resultType" ] = make_node_from( *result.result_type );
  if ( result.assets && !result.assets->empty() ) {
    n[ "assets" ] = to_node( *result.assets );
  }
  if ( result.placeholders && !result.placeholders->empty() ) {
    n[ "placeholders" ] = to_node( *result.placeholders );
  }

  ordered_node meta = ordered_node::mapping();
  meta[ "sourceId" ] = make_node_from( result.metadata.source_id );
  meta[ "collectionId" ] = make_node_from( result.metadata.collection_id );
  meta[ "timestamp" ] = make_node_from( result.metadata.timestamp );
  if ( result.metadata.entry_id ) {
    meta[ "entryId" ] = make_node_from( *result.metadata.entry_id );
  }
  n[ "metadata" ] = meta;

  if ( !result.captures.empty() ) {
    ordered_node captures = ordered_node::mapping();
    for ( const auto& [name, var] : result.captures ) captures[ name ] = to_node( var );
    n[ "captures" ] = captures;
  }
  if ( !result.descriptions.empty() ) {
    std::vector< ordered_node > descriptions;
    for ( const auto& d : result.descriptions ) descriptions.push_back( to_node(d) );
    n[ "descriptions" ] = make_node_from( descriptions );
  }
  if ( !result.expression_outputs.empty() ) {
    n[ "expressionOutputs" ] = internal::make_string_sequence(
      result.expression_outputs );
  }
  if ( !result.diagnostics.empty() ) {
    std::vector< ordered_node > diagnostics;
    for ( const auto& d : result.diagnostics ) diagnostics.push_back( to_node(d) );
    n[ "diagnostics" ] = make_node_from( diagnostics );
  }
  if ( result.trace ) n[ "trace" ] = to_node( *result.trace );
  return n;
}
