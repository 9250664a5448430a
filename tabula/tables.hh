// ╺┳╸┏━┓┏┓ ╻ ╻╻  ┏━┓
//  ┃ ┣━┫┣┻┓┃ ┃┃  ┣━┫
//  ╹ ╹ ╹┗━┛┗━┛┗━╸╹ ╹
//  Random table & template generation engine
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <cstdio>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "tabula/context.hh"
#include "tabula/document.hh"
#include "tabula/types.hh"
#include "tabula/util.hh"

namespace tabula {

  // One selectable entry of a table (or of a merged collection pool)
  struct WeightedEntry {
    const Entry* entry = nullptr;
    std::string id;
    double weight = 1.0;
    std::string source_table_id; // collections only
  };

  struct SelectionOptions {
    bool unique = false;
    std::set< std::string > exclude_ids;
  };

  struct SelectedEntry {
    const Entry* entry = nullptr;
    std::string id;
    Sets merged_sets;
    std::optional< Sets > assets;
    std::optional< std::string > result_type;
    std::string source_table_id; // collections only
  };

  struct SourceSelection {
    std::string table_id;
    double weight = 1.0;
  };

  // Chance of one entry or source being picked
  struct Probability {
    std::string id;
    std::string source_table_id;
    std::string value;
    double weight = 0.0;
    double probability = 0.0;
    std::string percentage;
  };

  // Entry weight: the span of its range, else its weight, else 1
  inline double entry_weight( const Entry& entry );

  // Entries of a table with positive weight and no excluded id, in order
  inline std::vector< WeightedEntry > build_weighted_pool(
    const std::vector< Entry >& entries, const std::string& table_id,
    const std::set< std::string >& exclude_ids = {} );

  inline double total_weight( const std::vector< WeightedEntry >& pool );

  // Weighted pick; nullptr when the pool is empty or has no weight
  inline const WeightedEntry* select_by_weight(
    const std::vector< WeightedEntry >& pool, std::mt19937& rng );

  // Picks an entry of a simple table, honoring unique selection and the
  // context's overflow policy. Nothing is returned when no entry is left.
  inline std::optional< SelectedEntry > roll_simple_table( const Table& table,
    GenerationContext& ctx, const SelectionOptions& options = {} );

  inline std::vector< std::pair< const CompositeSource*, double > >
    build_source_pool( const std::vector< CompositeSource >& sources );

  inline std::optional< SourceSelection > select_source( const Table& table,
    std::mt19937& rng );

  // Source tables of a collection, each with the id it was listed under
  using CollectionSources = std::vector< std::pair< std::string, const Table* > >;

  inline std::vector< WeightedEntry > merge_table_entries(
    const CollectionSources& sources,
    const std::set< std::string >& exclude_ids = {} );

  inline std::optional< SelectedEntry > roll_collection_table( const Table& table,
    const CollectionSources& sources, GenerationContext& ctx,
    const SelectionOptions& options = {} );

  inline std::vector< Probability > get_table_probabilities( const Table& table );
  inline std::vector< Probability > get_source_probabilities( const Table& table );
  inline std::vector< Probability > get_collection_probabilities(
    const CollectionSources& sources );

  inline ordered_node to_node( const Probability& p );

namespace internal {

  inline std::string format_percentage( double probability ) {
    char buf[ 32 ];
    std::snprintf( buf, sizeof(buf), "%.2f%%", probability * 100.0 );
    return buf;
  }

  [[noreturn]] inline void overflow_error( const std::string& kind,
    const std::string& id )
  {
    throw Error( ErrorCode::UniqueOverflow, "Unique selection overflow: no more"
      " entries available in " + kind + " '" + id + '\'' );
  }

} // namespace tabula::internal

} // namespace tabula

inline double tabula::entry_weight( const Entry& entry ) {
  if ( entry.range && entry.range->size() == 2 ) {
    return ( *entry.range )[ 1 ] - ( *entry.range )[ 0 ] + 1;
  }
  return entry.weight.value_or( 1.0 );
}

inline std::vector< tabula::WeightedEntry > tabula::build_weighted_pool(
  const std::vector< Entry >& entries, const std::string& table_id,
  const std::set< std::string >& exclude_ids )
{
  std::vector< WeightedEntry > pool;
  for ( size_t i = 0; i < entries.size(); ++i ) {
    const Entry& e = entries[ i ];
    WeightedEntry w;
    w.entry = &e;
    w.id = e.id ? *e.id : internal::generated_entry_id( table_id, i );
    w.weight = entry_weight( e );
    if ( w.weight <= 0 || exclude_ids.count(w.id) ) continue;
    pool.push_back( std::move(w) );
  }
  return pool;
}

inline double tabula::total_weight( const std::vector< WeightedEntry >& pool ) {
  double sum = 0.0;
  for ( const auto& w : pool ) sum += w.weight;
  return sum;
}

inline const tabula::WeightedEntry* tabula::select_by_weight(
  const std::vector< WeightedEntry >& pool, std::mt19937& rng )
{
  const double total = total_weight( pool );
  if ( pool.empty() || total <= 0 ) return nullptr;

  std::uniform_real_distribution< double > dist( 0.0, total );
  const double roll = dist( rng );

  double cumulative = 0.0;
  for ( const auto& w : pool ) {
    cumulative += w.weight;
    if ( roll < cumulative ) return &w;
  }
  return &pool.back();
}

inline std::optional< tabula::SelectedEntry > tabula::roll_simple_table(
  const Table& table, GenerationContext& ctx, const SelectionOptions& options )
{
  std::set< std::string > exclude = options.exclude_ids;
  if ( options.unique ) {
    const auto& used = ctx.used_entries( table.id );
    exclude.insert( used.begin(), used.end() );
  }

  const std::vector< WeightedEntry > pool = build_weighted_pool( table.entries,
    table.id, exclude );

  if ( pool.empty() ) {
    switch ( ctx.config().unique_overflow ) {
      case UniqueOverflow::Error:
        internal::overflow_error( "table", table.id );
        break;
      case UniqueOverflow::Cycle: {
        ctx.clear_used_entries( table.id );
        if ( build_weighted_pool(table.entries, table.id).empty() ) {
          return std::nullopt;
        }
        SelectionOptions again = options;
        again.unique = false;
        return roll_simple_table( table, ctx, again );
      }
      default:
        return std::nullopt;
    }
  }

  const WeightedEntry* picked = select_by_weight( pool, ctx.rng() );
  if ( !picked ) return std::nullopt;

  if ( options.unique ) ctx.mark_entry_used( table.id, picked->id );

  SelectedEntry out;
  out.entry = picked->entry;
  out.id = picked->id;
  if ( table.default_sets ) out.merged_sets.merge( *table.default_sets );
  if ( picked->entry->sets ) out.merged_sets.merge( *picked->entry->sets );
  out.merged_sets.set( "value", picked->entry->value.value_or("") );
  out.assets = picked->entry->assets;
  out.result_type = picked->entry->result_type ? picked->entry->result_type
    : table.result_type;
  return out;
}

inline std::vector< std::pair< const tabula::CompositeSource*, double > >
  tabula::build_source_pool( const std::vector< CompositeSource >& sources )
{
  std::vector< std::pair< const CompositeSource*, double > > pool;
  for ( const auto& s : sources ) {
    const double w = s.weight.value_or( 1.0 );
    if ( w > 0 ) pool.emplace_back( &s, w );
  }
  return pool;
}

inline std::optional< tabula::SourceSelection > tabula::select_source(
  const Table& table, std::mt19937& rng )
{
  const auto pool = build_source_pool( table.sources );
  double total = 0.0;
  for ( const auto& p : pool ) total += p.second;
  if ( pool.empty() || total <= 0 ) return std::nullopt;

  std::uniform_real_distribution< double > dist( 0.0, total );
  const double roll = dist( rng );

  double cumulative = 0.0;
  for ( const auto& [source, weight] : pool ) {
    cumulative += weight;
    if ( roll < cumulative ) return SourceSelection{ source->table_id, weight };
  }
  return SourceSelection{ pool.back().first->table_id, pool.back().second };
}

inline std::vector< tabula::WeightedEntry > tabula::merge_table_entries(
  const CollectionSources& sources, const std::set< std::string >& exclude_ids )
{
  std::vector< WeightedEntry > merged;
  for ( const auto& [source_id, table] : sources ) {
    for ( auto& w : build_weighted_pool(table->entries, source_id) ) {
      w.id = source_id + '.' + w.id;
      if ( exclude_ids.count(w.id) ) continue;
      w.source_table_id = source_id;
      merged.push_back( std::move(w) );
    }
  }
  return merged;
}

inline std::optional< tabula::SelectedEntry > tabula::roll_collection_table(
  const Table& table, const CollectionSources& sources, GenerationContext& ctx,
  const SelectionOptions& options )
{
  if ( sources.empty() ) return std::nullopt;

  std::set< std::string > exclude = options.exclude_ids;
  if ( options.unique ) {
    const auto& used = ctx.used_entries( table.id );
    exclude.insert( used.begin(), used.end() );
  }

  const std::vector< WeightedEntry > pool = merge_table_entries( sources, exclude );
  if ( pool.empty() ) {
    switch ( ctx.config().unique_overflow ) {
      case UniqueOverflow::Error:
        internal::overflow_error( "collection", table.id );
        break;
      case UniqueOverflow::Cycle: {
        ctx.clear_used_entries( table.id );
        if ( merge_table_entries(sources).empty() ) return std::nullopt;
        SelectionOptions again = options;
        again.unique = false;
        return roll_collection_table( table, sources, ctx, again );
      }
      default:
        return std::nullopt;
    }
  }

  const WeightedEntry* picked = select_by_weight( pool, ctx.rng() );
  if ( !picked ) return std::nullopt;

  if ( options.unique ) ctx.mark_entry_used( table.id, picked->id );

  const Table* source = nullptr;
  for ( const auto& s : sources ) {
    if ( s.first == picked->source_table_id ) { source = s.second; break; }
  }

  SelectedEntry out;
  out.entry = picked->entry;
  out.id = picked->id;
  out.source_table_id = picked->source_table_id;
  if ( source && source->default_sets ) out.merged_sets.merge( *source->default_sets );
  if ( table.default_sets ) out.merged_sets.merge( *table.default_sets );
  if ( picked->entry->sets ) out.merged_sets.merge( *picked->entry->sets );
  out.merged_sets.set( "value", picked->entry->value.value_or("") );
  out.assets = picked->entry->assets;
  if ( picked->entry->result_type ) out.result_type = picked->entry->result_type;
  else if ( source && source->result_type ) out.result_type = source->result_type;
  else out.result_type = table.result_type;
  return out;
}

inline std::vector< tabula::Probability > tabula::get_table_probabilities(
  const Table& table )
{
  const auto pool = build_weighted_pool( table.entries, table.id );
  const double total = total_weight( pool );
  std::vector< Probability > out;
  if ( total <= 0 ) return out;

  for ( const auto& w : pool ) {
    Probability p;
    p.id = w.id;
    p.value = w.entry->value.value_or( "" );
    p.weight = w.weight;
    p.probability = w.weight / total;
    p.percentage = internal::format_percentage( p.probability );
    out.push_back( std::move(p) );
  }
  return out;
}

inline std::vector< tabula::Probability > tabula::get_source_probabilities(
  const Table& table )
{
  const auto pool = build_source_pool( table.sources );
  double total = 0.0;
  for ( const auto& s : pool ) total += s.second;
  std::vector< Probability > out;
  if ( total <= 0 ) return out;

  for ( const auto& [source, weight] : pool ) {
    Probability p;
    p.id = source->table_id;
    p.source_table_id = source->table_id;
    p.weight = weight;
    p.probability = weight / total;
    p.percentage = internal::format_percentage( p.probability );
    out.push_back( std::move(p) );
  }
  return out;
}

inline std::vector< tabula::Probability > tabula::get_collection_probabilities(
  const CollectionSources& sources )
{
  const auto pool = merge_table_entries( sources );
  const double total = total_weight( pool );
  std::vector< Probability > out;
  if ( total <= 0 ) return out;

  for ( const auto& w : pool ) {
    Probability p;
    p.id = w.id;
    p.source_table_id = w.source_table_id;
    p.value = w.entry->value.value_or( "" );
    p.weight = w.weight;
    p.probability = w.weight / total;
    p.percentage = internal::format_percentage( p.probability );
    out.push_back( std::move(p) );
  }
  return out;
}

inline tabula::ordered_node tabula::to_node( const Probability& p ) {
  using internal::make_node_from;
  ordered_node n = ordered_node::mapping();
  n[ "id" ] = make_node_from( p.id );
  if ( !p.source_table_id.empty() && p.source_table_id != p.id ) {
    n[ "sourceTableId" ] = make_node_from( p.source_table_id );
  }
  if ( !p.value.empty() ) n[ "value" ] = make_node_from( p.value );
  n[ "weight" ] = make_node_from( p.weight );
  n[ "probability" ] = make_node_from( p.probability );
  n[ "percentage" ] = make_node_from( p.percentage );
  return n;
}
