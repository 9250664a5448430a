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
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tabula/util.hh"

namespace tabula {

  enum class TraceNodeType {
    Root,
    TableRoll,
    TemplateRoll,
    TemplateRef,
    EntrySelect,
    Expression,
    DiceRoll,
    MathEval,
    VariableAccess,
    PlaceholderAccess,
    Conditional,
    MultiRoll,
    Instance,
    CompositeSelect,
    CollectionMerge,
    CaptureMultiRoll,
    CaptureAccess,
    Collect
  };

  inline const char* trace_node_type_name( TraceNodeType t ) {
    switch ( t ) {
      case TraceNodeType::Root: return "root";
      case TraceNodeType::TableRoll: return "table_roll";
      case TraceNodeType::TemplateRoll: return "template_roll";
      case TraceNodeType::TemplateRef: return "template_ref";
      case TraceNodeType::EntrySelect: return "entry_select";
      case TraceNodeType::Expression: return "expression";
      case TraceNodeType::DiceRoll: return "dice_roll";
      case TraceNodeType::MathEval: return "math_eval";
      case TraceNodeType::VariableAccess: return "variable_access";
      case TraceNodeType::PlaceholderAccess: return "placeholder_access";
      case TraceNodeType::Conditional: return "conditional";
      case TraceNodeType::MultiRoll: return "multi_roll";
      case TraceNodeType::Instance: return "instance";
      case TraceNodeType::CompositeSelect: return "composite_select";
      case TraceNodeType::CollectionMerge: return "collection_merge";
      case TraceNodeType::CaptureMultiRoll: return "capture_multi_roll";
      case TraceNodeType::CaptureAccess: return "capture_access";
      case TraceNodeType::Collect: return "collect";
    }
    return "expression";
  }

  struct TraceOutput {
    std::string value;
    bool cached = false;
    std::optional< std::string > error;
  };

  struct TraceNode {
    std::string id;
    TraceNodeType type = TraceNodeType::Expression;
    std::string label;
    std::string input_raw;
    ordered_node input_parsed; // null when absent
    TraceOutput output;
    ordered_node metadata; // null when absent
    std::chrono::steady_clock::time_point start;
    std::int64_t duration_ms = 0;
    std::vector< std::unique_ptr< TraceNode > > children;
  };

  struct TraceStats {
    int node_count = 0;
    int max_depth = 0;
    std::map< std::string, int > type_breakdown;
    int dice_rolled = 0;
    std::vector< std::string > tables_accessed;
    std::vector< std::string > variables_accessed;
  };

  struct RollTrace {
    std::shared_ptr< const TraceNode > root;
    std::int64_t total_time_ms = 0;
    TraceStats stats;
    std::string version = "1.0";
  };

  // Builds the execution tree for one generation. Nodes are opened and
  // closed in strict nesting order; leaves attach to the innermost open node.
  class TraceRecorder {
  public:
    inline TraceRecorder() : start_( std::chrono::steady_clock::now() ) {}

    inline void begin_node( TraceNodeType type, const std::string& label,
      const std::string& raw, ordered_node parsed = ordered_node() );

    inline void end_node( TraceOutput output,
      ordered_node metadata = ordered_node() );

    inline void add_leaf( TraceNodeType type, const std::string& label,
      const std::string& raw, TraceOutput output,
      ordered_node metadata = ordered_node() );

    inline size_t open_nodes() const { return stack_.size(); }

    // Snapshot of the finished tree, or nothing if no root was opened
    inline std::optional< RollTrace > extract() const;

  private:
    inline std::unique_ptr< TraceNode > make_node( TraceNodeType type,
      const std::string& label, const std::string& raw );

    std::shared_ptr< TraceNode > root_;
    std::vector< TraceNode* > stack_;
    int id_counter_ = 0;
    std::chrono::steady_clock::time_point start_;
  };

namespace internal {

  inline void collect_trace_stats( const TraceNode& node, int depth,
    TraceStats& stats )
  {
    ++stats.node_count;
    stats.max_depth = std::max( stats.max_depth, depth );
    ++stats.type_breakdown[ trace_node_type_name(node.type) ];

    const ordered_node& meta = node.metadata;
    const bool has_meta = meta.is_mapping();

    if ( node.type == TraceNodeType::DiceRoll && has_meta
      && meta.contains("rolls") )
    {
      stats.dice_rolled += static_cast< int >( meta.at( "rolls" ).size() );
    }

    if ( node.type == TraceNodeType::TableRoll ) {
      std::string name = node.label;
      const std::string prefix = "Table: ";
      if ( starts_with(name, prefix) ) name = name.substr( prefix.size() );
      stats.tables_accessed.push_back( name );
    }

    auto push_var = [&]( const char* key, const std::string& prefix ) {
      if ( has_meta && meta.contains(key) ) {
        const std::string v = to_string_any( meta.at(key) );
        if ( !v.empty() ) stats.variables_accessed.push_back( prefix + v );
      }
    };

    switch ( node.type ) {
      case TraceNodeType::VariableAccess: push_var( "name", "" ); break;
      case TraceNodeType::CaptureMultiRoll: push_var( "captureVar", "$" ); break;
      case TraceNodeType::CaptureAccess: push_var( "varName", "$" ); break;
      case TraceNodeType::Collect: push_var( "varName", "$" ); break;
      default: break;
    }

    for ( const auto& child : node.children ) {
      collect_trace_stats( *child, depth + 1, stats );
    }
  }

  inline void dedupe_in_order( std::vector< std::string >& v ) {
    std::vector< std::string > out;
    for ( const auto& s : v ) {
      if ( std::find(out.begin(), out.end(), s) == out.end() ) out.push_back( s );
    }
    v = std::move( out );
  }

} // namespace tabula::internal

  inline ordered_node to_node( const TraceNode& node ) {
    using internal::make_node_from;

    ordered_node n = ordered_node::mapping();
    n[ "id" ] = make_node_from( node.id );
    n[ "type" ] = make_node_from( std::string( trace_node_type_name(node.type) ) );
    n[ "label" ] = make_node_from( node.label );

    ordered_node input = ordered_node::mapping();
    input[ "raw" ] = make_node_from( node.input_raw );
    if ( !node.input_parsed.is_null() ) input[ "parsed" ] = node.input_parsed;
    n[ "input" ] = input;

    ordered_node output = ordered_node::mapping();
    output[ "value" ] = make_node_from( node.output.value );
    if ( node.output.cached ) output[ "cached" ] = make_node_from( true );
    if ( node.output.error ) {
      output[ "error" ] = make_node_from( *node.output.error );
    }
    n[ "output" ] = output;

    if ( !node.metadata.is_null() ) n[ "metadata" ] = node.metadata;
    n[ "duration" ] = make_node_from( node.duration_ms );

    std::vector< ordered_node > children;
    for ( const auto& c : node.children ) children.push_back( to_node(*c) );
    n[ "children" ] = make_node_from( children );
    return n;
  }

  inline ordered_node to_node( const RollTrace& trace ) {
    using internal::make_node_from;

    ordered_node stats = ordered_node::mapping();
    stats[ "nodeCount" ] = make_node_from(
      static_cast< std::int64_t >( trace.stats.node_count ) );
    stats[ "maxDepth" ] = make_node_from(
      static_cast< std::int64_t >( trace.stats.max_depth ) );
    ordered_node breakdown = ordered_node::mapping();
    for ( const auto& [type, count] : trace.stats.type_breakdown ) {
      breakdown[ type ] = make_node_from( static_cast< std::int64_t >( count ) );
    }
    stats[ "typeBreakdown" ] = breakdown;
    stats[ "diceRolled" ] = make_node_from(
      static_cast< std::int64_t >( trace.stats.dice_rolled ) );
    stats[ "tablesAccessed" ] =
      internal::make_string_sequence( trace.stats.tables_accessed );
    stats[ "variablesAccessed" ] =
      internal::make_string_sequence( trace.stats.variables_accessed );

    ordered_node n = ordered_node::mapping();
    if ( trace.root ) n[ "root" ] = to_node( *trace.root );
    n[ "totalTime" ] = make_node_from( trace.total_time_ms );
    n[ "stats" ] = stats;
    n[ "version" ] = make_node_from( trace.version );
    return n;
  }

} // namespace tabula

inline std::unique_ptr< tabula::TraceNode > tabula::TraceRecorder::make_node(
  TraceNodeType type, const std::string& label, const std::string& raw )
{
  auto node = std::make_unique< TraceNode >();
  node->id = "trace-" + std::to_string( id_counter_++ );
  node->type = type;
  node->label = label;
  node->input_raw = raw;
  node->start = std::chrono::steady_clock::now();
  return node;
}

inline void tabula::TraceRecorder::begin_node( TraceNodeType type,
  const std::string& label, const std::string& raw, ordered_node parsed )
{
  auto node = make_node( type, label, raw );
  node->input_parsed = std::move( parsed );

  if ( stack_.empty() ) {
    // A node opened with nothing on the stack becomes the new root
    root_ = std::shared_ptr< TraceNode >( std::move(node) );
    stack_.push_back( root_.get() );
  } else {
    TraceNode* parent = stack_.back();
    parent->children.push_back( std::move(node) );
    stack_.push_back( parent->children.back().get() );
  }
}

inline void tabula::TraceRecorder::end_node( TraceOutput output,
  ordered_node metadata )
{
  if ( stack_.empty() ) return;
  TraceNode* node = stack_.back();
  stack_.pop_back();

  node->duration_ms = std::chrono::duration_cast< std::chrono::milliseconds >(
    std::chrono::steady_clock::now() - node->start ).count();
  node->output = std::move( output );
  if ( !metadata.is_null() ) node->metadata = std::move( metadata );
}

inline void tabula::TraceRecorder::add_leaf( TraceNodeType type,
  const std::string& label, const std::string& raw, TraceOutput output,
  ordered_node metadata )
{
  // Leaves only attach to an open node
  if ( stack_.empty() ) return;

  auto node = make_node( type, label, raw );
  node->output = std::move( output );
  node->metadata = std::move( metadata );
  stack_.back()->children.push_back( std::move(node) );
}

inline std::optional< tabula::RollTrace > tabula::TraceRecorder::extract() const
{
  if ( !root_ ) return std::nullopt;

  RollTrace trace;
  trace.root = root_;
  trace.total_time_ms = std::chrono::duration_cast< std::chrono::milliseconds >(
    std::chrono::steady_clock::now() - start_ ).count();
  internal::collect_trace_stats( *root_, 0, trace.stats );
  internal::dedupe_in_order( trace.stats.tables_accessed );
  internal::dedupe_in_order( trace.stats.variables_accessed );
  return trace;
}
