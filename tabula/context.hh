// ╺┳╸┏━┓┏┓ ╻ ╻╻  ┏━┓
//  ┃ ┣━┫┣┻┓┃ ┃┃  ┣━┫
//  ╹ ╹ ╹┗━┛┗━┛┗━╸╹ ╹
//  Random table & template generation engine
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <memory>
#include <optional>
#include <random>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "tabula/diagnostics.hh"
#include "tabula/trace.hh"
#include "tabula/types.hh"

namespace tabula {

  // What a single table roll hands back to its caller
  struct TableRollResult {
    std::string text;
    std::optional< std::string > result_type;
    std::optional< Sets > assets;
    std::optional< EvaluatedSets > placeholders;
    std::optional< std::string > entry_id;
  };

  // Memoized result of {{table#name}}
  struct InstanceResult {
    std::string text;
    std::string table_id;
    std::string collection_id;
    std::optional< std::string > result_type;
    std::optional< std::string > entry_id;
    EvaluatedSets placeholders;
  };

  // "Self" state of the table currently being rolled, for {{again}} and
  // {{@self.*}}. Not inherited across table boundaries.
  struct SelfState {
    std::optional< std::string > table_id;
    std::optional< std::string > entry_id;
    std::optional< std::string > entry_value;
    std::optional< std::string > entry_description;
  };

  // Mutable environment of one generation. Copies of a context share every
  // field by reference except the self state. isolated() additionally gives
  // the copy its own placeholders and a private copy of the shared variables.
  class GenerationContext {
  public:
    inline GenerationContext( EngineConfig config, Sets static_variables,
      std::shared_ptr< std::mt19937 > rng,
      std::shared_ptr< Diagnostics > diagnostics,
      bool enable_trace = false );

    inline GenerationContext isolated() const;

    inline const EngineConfig& config() const { return state_->config; }
    inline EngineConfig& config() { return state_->config; }
    inline std::mt19937& rng() { return *state_->rng; }
    inline Diagnostics& diagnostics() { return *state_->diagnostics; }

    inline void warn( const std::string& code, const std::string& message ) {
      state_->diagnostics->warn( code, message );
    }

    // Variables

    // Shared value first, then static
    inline std::optional< std::string > resolve_variable(
      const std::string& name ) const;

    inline const Sets& static_variables() const { return state_->statics; }
    inline bool has_static_variable( const std::string& name ) const {
      return state_->statics.contains( name );
    }

    inline CaptureItemPtr get_shared_variable( const std::string& name ) const;
    inline void set_shared_variable( const std::string& name, CaptureItemPtr item ) {
      shared_vars_->set( name, std::move(item) );
    }
    inline bool has_shared_variable( const std::string& name ) const {
      return shared_vars_->contains( name );
    }
    inline void erase_shared_variable( const std::string& name ) {
      shared_vars_->erase( name );
    }
    inline const OrderedMap< CaptureItemPtr >& shared_variables() const {
      return *shared_vars_;
    }

    inline void register_document_shared_name( const std::string& name ) {
      state_->document_shared_names.insert( name );
    }
    inline bool would_shadow_document_shared( const std::string& name ) const {
      return state_->document_shared_names.count( name ) > 0;
    }

    // Placeholders

    // Text of @name.property (the "value" set when property is empty).
    // Nested items yield their value.
    inline std::optional< std::string > get_placeholder( const std::string& name,
      const std::string& property = "" ) const;

    inline CaptureItemPtr get_placeholder_capture_item( const std::string& name,
      const std::string& property ) const;

    inline void merge_placeholders( const std::string& name,
      const EvaluatedSets& sets );

    inline const OrderedMap< EvaluatedSets >& placeholders() const {
      return *placeholders_;
    }

    // Recursion accounting, see RecursionGuard
    inline int recursion_depth() const { return state_->recursion_depth; }

    // Unique selection tracking
    inline const std::set< std::string >& used_entries( const std::string& table_id );
    inline void mark_entry_used( const std::string& table_id,
      const std::string& entry_id );
    inline bool is_entry_used( const std::string& table_id,
      const std::string& entry_id ) const;
    inline void clear_used_entries( const std::string& table_id ) {
      state_->used_entries.erase( table_id );
    }

    // Instances
    inline const InstanceResult* get_instance( const std::string& name ) const {
      return state_->instances.get( name );
    }
    inline void set_instance( const std::string& name, InstanceResult result ) {
      state_->instances.set( name, std::move(result) );
    }

    // Captures
    inline const CaptureVariable* get_capture_variable(
      const std::string& name ) const
    {
      return state_->captures.get( name );
    }

    // Returns true when an existing capture was overwritten
    inline bool set_capture_variable( const std::string& name,
      CaptureVariable var );

    inline const OrderedMap< CaptureVariable >& capture_variables() const {
      return state_->captures;
    }

    // "capture", "shared", "static" or nothing, in that priority
    inline std::optional< std::string > variable_conflict(
      const std::string& name ) const;

    // Self state
    inline SelfState& self() { return self_; }
    inline const SelfState& self() const { return self_; }
    inline void set_current_table( const std::string& table_id,
      std::optional< std::string > entry_id = std::nullopt )
    {
      self_.table_id = table_id;
      self_.entry_id = std::move( entry_id );
    }

    // Entry descriptions
    inline void add_description( const std::string& table_name,
      const std::string& table_id, const std::string& rolled_value,
      const std::string& description, std::optional< int > depth = std::nullopt );
    inline const std::vector< EntryDescription >& descriptions() const {
      return state_->descriptions;
    }
    inline void clear_descriptions() { state_->descriptions.clear(); }

    // Tracing. All calls are no-ops when tracing is off.
    inline bool tracing() const { return static_cast< bool >( state_->trace ); }
    inline TraceRecorder* trace() { return state_->trace.get(); }

    inline void begin_trace( TraceNodeType type, const std::string& label,
      const std::string& raw, ordered_node parsed = ordered_node() )
    {
      if ( state_->trace ) state_->trace->begin_node( type, label, raw,
        std::move(parsed) );
    }

    inline void end_trace( TraceOutput output,
      ordered_node metadata = ordered_node() )
    {
      if ( state_->trace ) state_->trace->end_node( std::move(output),
        std::move(metadata) );
    }

    inline void trace_leaf( TraceNodeType type, const std::string& label,
      const std::string& raw, TraceOutput output,
      ordered_node metadata = ordered_node() )
    {
      if ( state_->trace ) state_->trace->add_leaf( type, label, raw,
        std::move(output), std::move(metadata) );
    }

  private:
    friend class RecursionGuard;
    friend class SetEvaluationGuard;

    // Fields shared by every context of one generation
    struct State {
      EngineConfig config;
      Sets statics;
      std::shared_ptr< std::mt19937 > rng;
      std::shared_ptr< Diagnostics > diagnostics;
      std::set< std::string > document_shared_names;
      int recursion_depth = 0;
      OrderedMap< std::set< std::string > > used_entries;
      OrderedMap< InstanceResult > instances;
      OrderedMap< CaptureVariable > captures;
      std::vector< EntryDescription > descriptions;
      std::set< std::string > evaluating_set_keys;
      std::unique_ptr< TraceRecorder > trace;
    };

    std::shared_ptr< State > state_;
    std::shared_ptr< OrderedMap< CaptureItemPtr > > shared_vars_;
    std::shared_ptr< OrderedMap< EvaluatedSets > > placeholders_;
    SelfState self_;
  };

  // Counts one nested table/template entry for its lifetime
  class RecursionGuard {
  public:
    inline RecursionGuard( GenerationContext& ctx, const std::string& source_id );
    inline ~RecursionGuard();

    RecursionGuard( const RecursionGuard& ) = delete;
    RecursionGuard& operator=( const RecursionGuard& ) = delete;

  private:
    GenerationContext& ctx_;
  };

  // Marks a "tableId.prop" set key as mid-evaluation. acquired() is false
  // when the key was already in flight (a cycle).
  class SetEvaluationGuard {
  public:
    inline SetEvaluationGuard( GenerationContext& ctx, const std::string& key );
    inline ~SetEvaluationGuard();

    inline bool acquired() const { return acquired_; }

    SetEvaluationGuard( const SetEvaluationGuard& ) = delete;
    SetEvaluationGuard& operator=( const SetEvaluationGuard& ) = delete;

  private:
    GenerationContext& ctx_;
    std::string key_;
    bool acquired_ = false;
  };

  // Trace node that closes itself. An unfinished scope records the
  // in-flight exception as the node's error.
  class TraceScope {
  public:
    inline TraceScope( GenerationContext& ctx, TraceNodeType type,
      const std::string& label, const std::string& raw,
      ordered_node parsed = ordered_node() )
      : ctx_( ctx ), open_( ctx.tracing() )
    {
      if ( open_ ) ctx_.begin_trace( type, label, raw, std::move(parsed) );
    }

    inline ~TraceScope() {
      if ( open_ ) {
        TraceOutput out;
        out.error = std::string( "aborted" );
        ctx_.end_trace( std::move(out) );
      }
    }

    inline void finish( TraceOutput output, ordered_node metadata = ordered_node() )
    {
      if ( !open_ ) return;
      open_ = false;
      ctx_.end_trace( std::move(output), std::move(metadata) );
    }

    inline void fail( const std::string& error ) {
      TraceOutput out;
      out.error = error;
      finish( std::move(out) );
    }

    TraceScope( const TraceScope& ) = delete;
    TraceScope& operator=( const TraceScope& ) = delete;

  private:
    GenerationContext& ctx_;
    bool open_;
  };

} // namespace tabula

inline tabula::GenerationContext::GenerationContext( EngineConfig config,
  Sets static_variables, std::shared_ptr< std::mt19937 > rng,
  std::shared_ptr< Diagnostics > diagnostics, bool enable_trace )
  : state_( std::make_shared< State >() ),
  shared_vars_( std::make_shared< OrderedMap< CaptureItemPtr > >() ),
  placeholders_( std::make_shared< OrderedMap< EvaluatedSets > >() )
{
  state_->config = config;
  state_->statics = std::move( static_variables );
  state_->rng = rng ? std::move( rng ) : std::make_shared< std::mt19937 >(
    std::random_device{}() );
  state_->diagnostics = diagnostics ? std::move( diagnostics )
    : std::make_shared< Diagnostics >();
  if ( enable_trace ) state_->trace = std::make_unique< TraceRecorder >();
}

inline tabula::GenerationContext tabula::GenerationContext::isolated() const {
  GenerationContext copy( *this );
  copy.placeholders_ = std::make_shared< OrderedMap< EvaluatedSets > >();
  copy.shared_vars_ = std::make_shared< OrderedMap< CaptureItemPtr > >(
    *shared_vars_ );
  return copy;
}

inline std::optional< std::string > tabula::GenerationContext::resolve_variable(
  const std::string& name ) const
{
  if ( const auto* item = shared_vars_->get(name) ) {
    return *item ? (*item)->value : std::string();
  }
  if ( const auto* value = state_->statics.get(name) ) return *value;
  return std::nullopt;
}

inline tabula::CaptureItemPtr tabula::GenerationContext::get_shared_variable(
  const std::string& name ) const
{
  const auto* item = shared_vars_->get( name );
  return item ? *item : nullptr;
}

inline std::optional< std::string > tabula::GenerationContext::get_placeholder(
  const std::string& name, const std::string& property ) const
{
  const EvaluatedSets* sets = placeholders_->get( name );
  if ( !sets ) return std::nullopt;
  const SetValue* v = sets->get( property.empty() ? "value" : property );
  if ( !v ) return std::nullopt;
  return set_value_text( *v );
}

inline tabula::CaptureItemPtr
  tabula::GenerationContext::get_placeholder_capture_item(
  const std::string& name, const std::string& property ) const
{
  const EvaluatedSets* sets = placeholders_->get( name );
  if ( !sets ) return nullptr;
  const SetValue* v = sets->get( property );
  return v ? set_value_item( *v ) : nullptr;
}

inline void tabula::GenerationContext::merge_placeholders(
  const std::string& name, const EvaluatedSets& sets )
{
  ( *placeholders_ )[ name ].merge( sets );
}

inline const std::set< std::string >& tabula::GenerationContext::used_entries(
  const std::string& table_id )
{
  return state_->used_entries[ table_id ];
}

inline void tabula::GenerationContext::mark_entry_used(
  const std::string& table_id, const std::string& entry_id )
{
  state_->used_entries[ table_id ].insert( entry_id );
}

inline bool tabula::GenerationContext::is_entry_used(
  const std::string& table_id, const std::string& entry_id ) const
{
  const auto* used = state_->used_entries.get( table_id );
  return used && used->count( entry_id ) > 0;
}

inline bool tabula::GenerationContext::set_capture_variable(
  const std::string& name, CaptureVariable var )
{
  const bool existed = state_->captures.contains( name );
  state_->captures.set( name, std::move(var) );
  return existed;
}

inline std::optional< std::string > tabula::GenerationContext::variable_conflict(
  const std::string& name ) const
{
  if ( state_->captures.contains(name) ) return std::string( "capture" );
  if ( shared_vars_->contains(name) ) return std::string( "shared" );
  if ( state_->statics.contains(name) ) return std::string( "static" );
  return std::nullopt;
}

inline void tabula::GenerationContext::add_description(
  const std::string& table_name, const std::string& table_id,
  const std::string& rolled_value, const std::string& description,
  std::optional< int > depth )
{
  state_->descriptions.push_back( EntryDescription{ table_name, table_id,
    rolled_value, description, depth.value_or( state_->recursion_depth ) } );
}

inline tabula::RecursionGuard::RecursionGuard( GenerationContext& ctx,
  const std::string& source_id ) : ctx_( ctx )
{
  auto& depth = ctx_.state_->recursion_depth;
  ++depth;
  if ( depth > ctx_.config().max_recursion_depth ) {
    --depth;
    std::ostringstream oss;
    oss << "Recursion limit exceeded (" << ctx_.config().max_recursion_depth
      << ") while rolling '" << source_id << '\'';
    throw Error( ErrorCode::RecursionLimit, oss.str() );
  }
}

inline tabula::RecursionGuard::~RecursionGuard() {
  auto& depth = ctx_.state_->recursion_depth;
  if ( depth > 0 ) --depth;
}

inline tabula::SetEvaluationGuard::SetEvaluationGuard( GenerationContext& ctx,
  const std::string& key ) : ctx_( ctx ), key_( key )
{
  acquired_ = ctx_.state_->evaluating_set_keys.insert( key_ ).second;
}

inline tabula::SetEvaluationGuard::~SetEvaluationGuard() {
  if ( acquired_ ) ctx_.state_->evaluating_set_keys.erase( key_ );
}
