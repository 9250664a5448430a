// ╺┳╸┏━┓┏┓ ╻ ╻╻  ┏━┓
//  ┃ ┣━┫┣┻┓┃ ┃┃  ┣━┫
//  ╹ ╹ ╹┗━┛┗━┛┗━╸╹ ╹
//  Random table & template generation engine
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "tabula/conditionals.hh"
#include "tabula/context.hh"
#include "tabula/diagnostics.hh"
#include "tabula/dice.hh"
#include "tabula/math.hh"
#include "tabula/parser.hh"
#include "tabula/resolver.hh"
#include "tabula/tables.hh"
#include "tabula/trace.hh"
#include "tabula/types.hh"
#include "tabula/util.hh"

namespace tabula {

  // Callbacks into the owner of the loaded collections. The evaluator never
  // touches collections directly.
  struct EvaluatorDependencies {
    std::function< std::optional< TableResolution >( const std::string& ref,
      const std::string& collection_id ) > resolve_table_ref;

    std::function< std::optional< TemplateResolution >( const std::string& ref,
      const std::string& collection_id ) > resolve_template_ref;

    std::function< TableRollResult( const Table& table, GenerationContext& ctx,
      const std::string& collection_id, const SelectionOptions& options ) >
      roll_table;

    std::function< const Collection*( const std::string& id ) > get_collection;

    std::function< const Table*( const std::string& table_id,
      const std::string& collection_id ) > get_table;
  };

  struct PatternOutputs {
    std::string text;
    std::vector< std::string > expression_outputs; // one per {{...}}
  };

  // Tree-walking evaluator for patterns and their expression tokens
  class Evaluator {
  public:
    inline explicit Evaluator( EvaluatorDependencies deps )
      : deps_( std::move(deps) ) {}

    inline std::string evaluate_pattern( const std::string& pattern,
      GenerationContext& ctx, const std::string& collection_id );

    inline PatternOutputs evaluate_pattern_with_outputs( const std::string& pattern,
      GenerationContext& ctx, const std::string& collection_id );

    // Evaluates {{...}} in set values and publishes each key as a
    // placeholder of table_id as soon as it is known
    inline EvaluatedSets evaluate_set_values( const Sets& sets,
      GenerationContext& ctx, const std::string& collection_id,
      const std::string& table_id );

    // Document-level shared variables, in declaration order
    inline void evaluate_shared_variables( const Sets& shared,
      GenerationContext& ctx, const std::string& collection_id );

    inline void evaluate_shared_variable( const std::string& var_name,
      const std::string& expression, GenerationContext& ctx,
      const std::string& collection_id );

    // Table- and template-level shared variables. Shadowing a document-level
    // shared or static variable throws; names already bound are skipped.
    inline void evaluate_table_level_shared( const Sets& shared,
      GenerationContext& ctx, const std::string& collection_id,
      const std::string& source_id );

    inline std::string evaluate_token( const ExpressionToken& token,
      GenerationContext& ctx, const std::string& collection_id );

  private:
    inline std::string evaluate( const LiteralToken& t, GenerationContext& ctx,
      const std::string& collection_id );
    inline std::string evaluate( const DiceToken& t, GenerationContext& ctx,
      const std::string& collection_id );
    inline std::string evaluate( const MathToken& t, GenerationContext& ctx,
      const std::string& collection_id );
    inline std::string evaluate( const VariableToken& t, GenerationContext& ctx,
      const std::string& collection_id );
    inline std::string evaluate( const PlaceholderToken& t, GenerationContext& ctx,
      const std::string& collection_id );
    inline std::string evaluate( const TableToken& t, GenerationContext& ctx,
      const std::string& collection_id );
    inline std::string evaluate( const MultiRollToken& t, GenerationContext& ctx,
      const std::string& collection_id );
    inline std::string evaluate( const AgainToken& t, GenerationContext& ctx,
      const std::string& collection_id );
    inline std::string evaluate( const InstanceToken& t, GenerationContext& ctx,
      const std::string& collection_id );
    inline std::string evaluate( const CaptureMultiRollToken& t,
      GenerationContext& ctx, const std::string& collection_id );
    inline std::string evaluate( const CaptureAccessToken& t,
      GenerationContext& ctx, const std::string& collection_id );
    inline std::string evaluate( const CollectToken& t, GenerationContext& ctx,
      const std::string& collection_id );
    inline std::string evaluate( const SwitchToken& t, GenerationContext& ctx,
      const std::string& collection_id );

    // Rolls a table and keeps the whole result: text, sets and the first
    // description recorded during the roll
    inline CaptureItemPtr capture_table_roll( const TableResolution& r,
      GenerationContext& ctx );

    // Binds var_name to the full result of a bare {{table}} or {{template}}
    // reference. False when ref names neither.
    inline bool capture_reference( const std::string& var_name,
      const std::string& ref, GenerationContext& ctx,
      const std::string& collection_id );

    inline std::string evaluate_template_internal( const Template& tpl,
      const std::string& collection_id, GenerationContext& ctx );
    inline CaptureItemPtr evaluate_template_with_capture( const Template& tpl,
      const std::string& collection_id, GenerationContext& ctx );
    inline EvaluatedSets evaluate_template_for_property_access(
      const Template& tpl, const std::string& collection_id,
      GenerationContext& ctx );

    // Fresh placeholders, private shared variables, and the template's own
    // shared names evaluated anew
    inline GenerationContext template_scope( const Template& tpl,
      const std::string& collection_id, GenerationContext& ctx );

    inline std::string access_property( const EvaluatedSets& sets,
      const std::vector< std::string >& properties, const std::string& source_ref,
      GenerationContext& ctx );

    inline std::string traverse_property_chain( const CaptureItem& item,
      const std::vector< std::string >& properties, std::string path_prefix,
      GenerationContext& ctx );

    inline int resolve_roll_count( const RollCount& count,
      const std::optional< std::string >& dice_count, GenerationContext& ctx,
      std::string& source );

    inline std::string multi_roll_template( const Template& tpl,
      const std::string& template_collection_id, int count,
      const std::string& count_source, const MultiRollToken& t,
      GenerationContext& ctx );

    inline std::string capture_shared_access( const CaptureAccessToken& t,
      const CaptureItem& item, GenerationContext& ctx, const std::string& label );

    // Switch support
    inline std::optional< std::string > select_switch_result(
      const std::vector< SwitchClause >& clauses,
      const std::optional< std::string >& else_expr,
      const std::optional< std::string >& base, GenerationContext& ctx,
      const std::string& collection_id );
    inline std::string evaluate_switch_modifiers( const std::string& base,
      const SwitchModifiers& mods, GenerationContext& ctx,
      const std::string& collection_id );
    inline bool evaluate_switch_condition( const std::string& condition,
      const std::optional< std::string >& base, GenerationContext& ctx,
      const std::string& collection_id );
    inline std::string evaluate_switch_result( const std::string& result_expr,
      GenerationContext& ctx, const std::string& collection_id );

    EvaluatorDependencies deps_;
  };

namespace internal {

  inline std::string strip_dollar( const std::string& name ) {
    return starts_with( name, "$" ) ? name.substr( 1 ) : name;
  }

  // value, count and description end a property chain
  inline bool is_terminal_property( const std::string& p ) {
    return p == "value" || p == "count" || p == "description";
  }

  // The single {{...}} that makes up all of text, if that is what it is
  inline std::optional< ExpressionMatch > sole_expression( const std::string& text ) {
    std::vector< ExpressionMatch > exprs = extract_expressions( text );
    if ( exprs.size() == 1 && trim(text) == exprs[0].raw ) return exprs[ 0 ];
    return std::nullopt;
  }

  // A bare table/template reference without property access
  inline const TableToken* bare_reference( const ExpressionToken& token ) {
    if ( !token.is< TableToken >() || token.switch_modifiers ) return nullptr;
    const TableToken& t = token.as< TableToken >();
    return t.properties.empty() ? &t : nullptr;
  }

  // Replaces each '$' that does not start a variable name with the quoted
  // base value
  inline std::string substitute_base_value( const std::string& condition,
    const std::string& base )
  {
    const std::string quoted = quote_string( base );
    std::string out;
    for ( size_t i = 0; i < condition.size(); ++i ) {
      const char c = condition[ i ];
      const char next = i + 1 < condition.size() ? condition[ i + 1 ] : '\0';
      const bool starts_name = std::isalpha( static_cast< unsigned char >( next ) )
        || next == '_';
      if ( c == '$' && !starts_name ) out += quoted;
      else out += c;
    }
    return out;
  }

  inline bool is_quoted( const std::string& s ) {
    if ( s.size() < 2 ) return false;
    return ( s.front() == '"' && s.back() == '"' )
      || ( s.front() == '\'' && s.back() == '\'' );
  }

  inline std::string capture_label( const CaptureAccessToken& t ) {
    std::string label = '$' + t.var_name;
    if ( t.index ) label += '[' + std::to_string( *t.index ) + ']';
    for ( const auto& p : t.properties ) label += ".@" + p;
    return label;
  }

  inline ordered_node int_node( std::int64_t v ) { return make_node_from( v ); }

} // namespace tabula::internal

} // namespace tabula

inline std::string tabula::Evaluator::evaluate_pattern( const std::string& pattern,
  GenerationContext& ctx, const std::string& collection_id )
{
  std::string out;
  for ( const auto& token : parse_template(pattern) ) {
    out += evaluate_token( token, ctx, collection_id );
  }
  return out;
}

inline tabula::PatternOutputs tabula::Evaluator::evaluate_pattern_with_outputs(
  const std::string& pattern, GenerationContext& ctx,
  const std::string& collection_id )
{
  PatternOutputs result;
  size_t last = 0;
  for ( const auto& m : extract_expressions(pattern) ) {
    if ( m.start > last ) {
      result.text += internal::unescape_braces( pattern.substr(last, m.start - last) );
    }
    const std::string output = evaluate_token( parse_expression(m.expression), ctx,
      collection_id );
    result.text += output;
    result.expression_outputs.push_back( output );
    last = m.end;
  }
  if ( last < pattern.size() ) {
    result.text += internal::unescape_braces( pattern.substr(last) );
  }
  return result;
}

inline tabula::EvaluatedSets tabula::Evaluator::evaluate_set_values(
  const Sets& sets, GenerationContext& ctx, const std::string& collection_id,
  const std::string& table_id )
{
  EvaluatedSets evaluated;

  auto publish = [&]( const std::string& key, const SetValue& value ) {
    evaluated.set( key, value );
    EvaluatedSets one;
    one.set( key, value );
    ctx.merge_placeholders( table_id, one );
  };

  for ( const auto& [key, raw] : sets ) {
    if ( !internal::contains(raw, "{{") ) {
      publish( key, raw );
      continue;
    }

    SetEvaluationGuard guard( ctx, table_id + '.' + key );
    if ( !guard.acquired() ) {
      // Cycle: dependents see the unevaluated text
      ctx.warn( diag::CIRCULAR_REFERENCE, "Circular set reference: " + table_id
        + ".@" + key + ", using raw value" );
      publish( key, raw );
      continue;
    }

    if ( auto m = internal::sole_expression(raw) ) {
      const ExpressionToken token = parse_expression( m->expression );
      if ( const TableToken* ref = internal::bare_reference(token) ) {
        if ( auto r = deps_.resolve_table_ref(qualified_ref(*ref), collection_id) ) {
          const TableRollResult result = deps_.roll_table( *r->item, ctx,
            r->collection_id, SelectionOptions() );
          publish( key, make_capture_item( result.text,
            result.placeholders.value_or( EvaluatedSets() ) ) );
          continue;
        }
      }
    }

    publish( key, evaluate_pattern(raw, ctx, collection_id) );
  }
  return evaluated;
}

inline void tabula::Evaluator::evaluate_shared_variables( const Sets& shared,
  GenerationContext& ctx, const std::string& collection_id )
{
  for ( const auto& [name, expression] : shared ) {
    evaluate_shared_variable( internal::strip_dollar(name), expression, ctx,
      collection_id );
  }
}

inline tabula::CaptureItemPtr tabula::Evaluator::capture_table_roll(
  const TableResolution& r, GenerationContext& ctx )
{
  const size_t before = ctx.descriptions().size();
  const TableRollResult result = deps_.roll_table( *r.item, ctx, r.collection_id,
    SelectionOptions() );

  std::optional< std::string > description;
  if ( ctx.descriptions().size() > before ) {
    description = ctx.descriptions()[ before ].description;
  }
  return make_capture_item( result.text,
    result.placeholders.value_or( EvaluatedSets() ), description );
}

inline bool tabula::Evaluator::capture_reference( const std::string& var_name,
  const std::string& ref, GenerationContext& ctx, const std::string& collection_id )
{
  if ( auto r = deps_.resolve_table_ref(ref, collection_id) ) {
    ctx.set_shared_variable( var_name, capture_table_roll(*r, ctx) );
    return true;
  }
  if ( auto r = deps_.resolve_template_ref(ref, collection_id) ) {
    ctx.set_shared_variable( var_name,
      evaluate_template_with_capture( *r->item, r->collection_id, ctx ) );
    return true;
  }
  return false;
}

inline void tabula::Evaluator::evaluate_shared_variable(
  const std::string& var_name, const std::string& expression,
  GenerationContext& ctx, const std::string& collection_id )
{
  if ( auto m = internal::sole_expression(expression) ) {
    const ExpressionToken token = parse_expression( m->expression );

    if ( const TableToken* ref = internal::bare_reference(token) ) {
      if ( capture_reference(var_name, qualified_ref(*ref), ctx, collection_id) ) {
        return;
      }
    }

    // $a: "{{$b.@prop}}" aliases a nested item of another shared variable
    if ( token.is< CaptureAccessToken >() && !token.switch_modifiers ) {
      const CaptureAccessToken& t = token.as< CaptureAccessToken >();
      CaptureItemPtr source = ctx.get_shared_variable( t.var_name );
      if ( source && !t.properties.empty() && !t.index
        && !internal::is_terminal_property(t.properties.back()) )
      {
        CaptureItemPtr current = source;
        for ( const auto& prop : t.properties ) {
          const SetValue* v = current->sets.get( prop );
          current = v ? set_value_item( *v ) : nullptr;
          if ( !current ) break;
        }
        if ( current ) {
          ctx.set_shared_variable( var_name, current );
          return;
        }
      }
    }

    // A switch choosing between table references still captures the roll
    if ( token.is< SwitchToken >() ) {
      const SwitchToken& sw = token.as< SwitchToken >();
      auto winner = select_switch_result( sw.clauses, sw.else_expr, std::nullopt,
        ctx, collection_id );
      if ( winner ) {
        const std::string expr = internal::trim( *winner );
        const bool quoted = internal::starts_with( expr, "\"" )
          || internal::starts_with( expr, "'" );

        if ( !quoted && !internal::contains(expr, "{{") ) {
          if ( auto r = deps_.resolve_table_ref(expr, collection_id) ) {
            ctx.set_shared_variable( var_name, capture_table_roll(*r, ctx) );
            return;
          }
        }
        if ( internal::contains(expr, "{{") ) {
          if ( auto inner = internal::sole_expression(expr) ) {
            const ExpressionToken inner_token = parse_expression( inner->expression );
            if ( const TableToken* ref = internal::bare_reference(inner_token) ) {
              if ( capture_reference(var_name, qualified_ref(*ref), ctx,
                collection_id) )
              {
                return;
              }
            }
          }
        }
        ctx.set_shared_variable( var_name, make_capture_item(
          evaluate_switch_result( *winner, ctx, collection_id ) ) );
        return;
      }
    }
  }

  ctx.set_shared_variable( var_name, make_capture_item(
    evaluate_pattern( expression, ctx, collection_id ) ) );
}

inline void tabula::Evaluator::evaluate_table_level_shared( const Sets& shared,
  GenerationContext& ctx, const std::string& collection_id,
  const std::string& source_id )
{
  for ( const auto& [name, expression] : shared ) {
    const std::string var_name = internal::strip_dollar( name );

    if ( ctx.would_shadow_document_shared(name)
      || ctx.would_shadow_document_shared(var_name) )
    {
      throw Error( ErrorCode::SharedShadow, "SHARED_SHADOW in " + source_id
        + ": Table/template-level shared variable '" + name + "' would shadow"
        " document-level shared variable. Document-level shared variables take"
        " precedence." );
    }
    if ( ctx.has_static_variable(var_name) ) {
      throw Error( ErrorCode::SharedShadow, "SHARED_SHADOW in " + source_id
        + ": Shared variable '" + name + "' would shadow static variable." );
    }

    // Already bound by an enclosing roll
    if ( ctx.has_shared_variable(var_name) ) continue;

    evaluate_shared_variable( var_name, expression, ctx, collection_id );
  }
}

inline std::string tabula::Evaluator::evaluate_token( const ExpressionToken& token,
  GenerationContext& ctx, const std::string& collection_id )
{
  // A standalone switch carries its own else handling
  if ( token.is< SwitchToken >() ) {
    return evaluate( token.as< SwitchToken >(), ctx, collection_id );
  }

  const std::string result = std::visit( [&]( const auto& payload ) {
    return this->evaluate( payload, ctx, collection_id );
  }, token.payload );

  if ( token.switch_modifiers ) {
    return evaluate_switch_modifiers( result, *token.switch_modifiers, ctx,
      collection_id );
  }
  return result;
}

inline std::string tabula::Evaluator::evaluate( const LiteralToken& t,
  GenerationContext&, const std::string& )
{
  return t.text;
}

inline std::string tabula::Evaluator::evaluate( const DiceToken& t,
  GenerationContext& ctx, const std::string& )
{
  const DiceResult result = roll_dice( t.expression, ctx.rng(),
    ctx.config().max_exploding_dice );

  if ( ctx.tracing() ) {
    const DiceSpec spec = parse_dice( t.expression );
    ordered_node meta = ordered_node::mapping();
    meta[ "type" ] = internal::make_node_from( std::string( "dice" ) );
    meta[ "expression" ] = internal::make_node_from( result.expression );
    meta[ "rolls" ] = internal::make_int_sequence( result.rolls );
    meta[ "kept" ] = internal::make_int_sequence( result.kept );
    if ( spec.modifier != '\0' ) {
      ordered_node mod = ordered_node::mapping();
      mod[ "operator" ] = internal::make_node_from( std::string(1, spec.modifier) );
      mod[ "value" ] = internal::int_node( spec.modifier_value );
      meta[ "modifier" ] = mod;
    }
    meta[ "exploded" ] = internal::make_node_from(
      result.rolls.size() > static_cast< size_t >( spec.count ) );
    meta[ "breakdown" ] = internal::make_node_from( result.breakdown );
    ctx.trace_leaf( TraceNodeType::DiceRoll, "Dice: " + t.expression,
      t.expression, TraceOutput{ std::to_string(result.total), false, {} }, meta );
  }
  return std::to_string( result.total );
}

inline std::string tabula::Evaluator::evaluate( const MathToken& t,
  GenerationContext& ctx, const std::string& )
{
  const std::optional< std::int64_t > value = evaluate_math( t.expression, ctx );
  const std::string out = value ? std::to_string( *value ) : "[math error]";
  ctx.trace_leaf( TraceNodeType::MathEval, "Math: " + t.expression, t.expression,
    TraceOutput{ out, false, value ? std::nullopt
      : std::optional< std::string >( "syntax error" ) } );
  return out;
}

inline std::string tabula::Evaluator::evaluate( const VariableToken& t,
  GenerationContext& ctx, const std::string& )
{
  std::string result;
  std::string source = "undefined";

  if ( const CaptureVariable* capture = ctx.get_capture_variable(t.name) ) {
    std::vector< std::string > values;
    for ( const auto& item : capture->items ) values.push_back( item.value );
    result = internal::join( values, ", " );
    source = "capture";
  }
  else if ( CaptureItemPtr item = ctx.get_shared_variable(t.name) ) {
    result = item->value;
    source = "shared";
  }
  else if ( auto value = ctx.resolve_variable(t.name) ) {
    result = *value;
    source = "static";
  }
  else {
    ctx.warn( diag::REFERENCE_ERROR, "Undefined variable: $" + t.name );
  }

  if ( ctx.tracing() ) {
    ordered_node meta = ordered_node::mapping();
    meta[ "type" ] = internal::make_node_from( std::string( "variable" ) );
    meta[ "name" ] = internal::make_node_from( t.name );
    meta[ "source" ] = internal::make_node_from( source );
    const std::string label = '$' + ( t.alias ? *t.alias + '.' : std::string() )
      + t.name;
    ctx.trace_leaf( TraceNodeType::VariableAccess, label, t.name,
      TraceOutput{ result, false, {} }, meta );
  }
  return result;
}

inline std::string tabula::Evaluator::evaluate( const PlaceholderToken& t,
  GenerationContext& ctx, const std::string& collection_id )
{
  std::string label = '@' + t.name;
  for ( const auto& p : t.properties ) label += ".@" + p;

  auto trace = [&]( const std::string& value, bool found, const std::string& prop,
    std::optional< std::string > error = std::nullopt )
  {
    if ( !ctx.tracing() ) return;
    ordered_node meta = ordered_node::mapping();
    meta[ "type" ] = internal::make_node_from( std::string( "placeholder" ) );
    meta[ "name" ] = internal::make_node_from( t.name );
    meta[ "property" ] = internal::make_node_from( prop );
    meta[ "found" ] = internal::make_node_from( found );
    ctx.trace_leaf( TraceNodeType::PlaceholderAccess, label, t.name,
      TraceOutput{ value, false, std::move(error) }, meta );
  };

  // @self.* reads the entry currently being rolled
  if ( t.name == "self" ) {
    const std::string first = t.properties.empty() ? "" : t.properties[ 0 ];
    if ( first == "description" ) {
      const std::string raw = ctx.self().entry_description.value_or( "" );
      const std::string result = raw.empty() ? ""
        : evaluate_pattern( raw, ctx, collection_id );
      trace( result, !raw.empty(), first );
      return result;
    }
    if ( first == "value" ) {
      const std::string raw = ctx.self().entry_value.value_or( "" );
      trace( raw, !raw.empty(), first );
      return raw;
    }
    return "";
  }

  if ( t.properties.size() > 1 ) {
    const std::string& first = t.properties[ 0 ];
    const std::string chain = internal::join( t.properties, "." );
    if ( CaptureItemPtr item = ctx.get_placeholder_capture_item(t.name, first) ) {
      const std::string result = traverse_property_chain( *item,
        std::vector< std::string >( t.properties.begin() + 1, t.properties.end() ),
        '@' + t.name + ".@" + first, ctx );
      trace( result, !result.empty(), chain );
      return result;
    }
    ctx.warn( diag::CAPTURE_MISSING_PROPERTY, "Cannot chain through non-CaptureItem"
      " property: @" + t.name + '.' + first );
    trace( "", false, chain, std::string( "Cannot chain through non-CaptureItem" ) );
    return "";
  }

  const std::string first = t.properties.empty() ? "" : t.properties[ 0 ];
  const std::optional< std::string > value = ctx.get_placeholder( t.name, first );
  trace( value.value_or(""), value.has_value(), first.empty() ? "value" : first );
  if ( !value ) {
    ctx.warn( diag::REFERENCE_ERROR, "Placeholder not found: " + label );
  }
  return value.value_or( "" );
}

inline std::string tabula::Evaluator::evaluate( const TableToken& t,
  GenerationContext& ctx, const std::string& collection_id )
{
  const std::string ref = qualified_ref( t );

  if ( auto r = deps_.resolve_table_ref(ref, collection_id) ) {
    const TableRollResult result = deps_.roll_table( *r->item, ctx,
      r->collection_id, SelectionOptions() );
    if ( !t.properties.empty() ) {
      return access_property( result.placeholders.value_or( EvaluatedSets() ),
        t.properties, ref, ctx );
    }
    return result.text;
  }

  if ( auto r = deps_.resolve_template_ref(ref, collection_id) ) {
    if ( !t.properties.empty() ) {
      const EvaluatedSets sets = evaluate_template_for_property_access( *r->item,
        r->collection_id, ctx );
      return access_property( sets, t.properties, ref, ctx );
    }
    return evaluate_template_internal( *r->item, r->collection_id, ctx );
  }

  ctx.warn( diag::REFERENCE_ERROR, "Table or template not found: " + ref );
  return "";
}

inline std::string tabula::Evaluator::access_property( const EvaluatedSets& sets,
  const std::vector< std::string >& properties, const std::string& source_ref,
  GenerationContext& ctx )
{
  if ( properties.empty() ) return "";

  const std::string& first = properties[ 0 ];
  const SetValue* value = sets.get( first );
  if ( !value ) {
    ctx.warn( diag::CAPTURE_MISSING_PROPERTY, "Property @" + first
      + " not found in " + source_ref );
    return "";
  }
  if ( properties.size() == 1 ) return set_value_text( *value );

  CaptureItemPtr item = set_value_item( *value );
  if ( !item ) {
    ctx.warn( diag::CAPTURE_MISSING_PROPERTY, "Cannot chain through string"
      " property: " + source_ref + ".@" + first );
    return "";
  }
  return traverse_property_chain( *item,
    std::vector< std::string >( properties.begin() + 1, properties.end() ),
    source_ref + ".@" + first, ctx );
}

inline std::string tabula::Evaluator::traverse_property_chain(
  const CaptureItem& item, const std::vector< std::string >& properties,
  std::string path_prefix, GenerationContext& ctx )
{
  const CaptureItem* current = &item;
  CaptureItemPtr hold; // keeps the walked node alive

  for ( size_t i = 0; i < properties.size(); ++i ) {
    const std::string& prop = properties[ i ];
    const std::string path = path_prefix + ".@" + prop;
    const bool last = ( i + 1 == properties.size() );

    if ( internal::is_terminal_property(prop) ) {
      if ( !last ) {
        ctx.warn( diag::CAPTURE_MISSING_PROPERTY, "Cannot access properties after ."
          + prop + ": " + path );
        return "";
      }
      if ( prop == "value" ) return current->value;
      if ( prop == "count" ) return "1";
      return current->description.value_or( "" );
    }

    const SetValue* value = current->sets.get( prop );
    if ( !value ) {
      ctx.warn( diag::CAPTURE_MISSING_PROPERTY, "Property not found: " + path );
      return "";
    }
    if ( last ) return set_value_text( *value );

    CaptureItemPtr next = set_value_item( *value );
    if ( !next ) {
      ctx.warn( diag::CAPTURE_MISSING_PROPERTY, "Cannot chain through string"
        " property: " + path );
      return "";
    }
    hold = next;
    current = hold.get();
    path_prefix = path;
  }
  return current->value;
}

inline tabula::GenerationContext tabula::Evaluator::template_scope(
  const Template& tpl, const std::string& collection_id, GenerationContext& ctx )
{
  GenerationContext scope = ctx.isolated();
  if ( tpl.shared ) {
    for ( const auto& name : tpl.shared->keys() ) {
      scope.erase_shared_variable( internal::strip_dollar(name) );
    }
    evaluate_table_level_shared( *tpl.shared, scope, collection_id, tpl.id );
  }
  return scope;
}

inline std::string tabula::Evaluator::evaluate_template_internal(
  const Template& tpl, const std::string& collection_id, GenerationContext& ctx )
{
  RecursionGuard guard( ctx, tpl.id );
  if ( !deps_.get_collection(collection_id) ) return "";

  ordered_node parsed;
  if ( ctx.tracing() ) {
    parsed = ordered_node::mapping();
    parsed[ "collectionId" ] = internal::make_node_from( collection_id );
    parsed[ "templateId" ] = internal::make_node_from( tpl.id );
    parsed[ "pattern" ] = internal::make_node_from( tpl.pattern );
  }
  TraceScope trace( ctx, TraceNodeType::TemplateRef, "Template: "
    + ( tpl.name.empty() ? tpl.id : tpl.name ), tpl.id, parsed );

  GenerationContext scope = template_scope( tpl, collection_id, ctx );
  const std::string text = evaluate_pattern( tpl.pattern, scope, collection_id );
  trace.finish( TraceOutput{ text, false, {} } );
  return text;
}

inline tabula::CaptureItemPtr tabula::Evaluator::evaluate_template_with_capture(
  const Template& tpl, const std::string& collection_id, GenerationContext& ctx )
{
  RecursionGuard guard( ctx, tpl.id );
  if ( !deps_.get_collection(collection_id) ) return make_capture_item( "" );

  TraceScope trace( ctx, TraceNodeType::TemplateRef, "Template: "
    + ( tpl.name.empty() ? tpl.id : tpl.name ), tpl.id );

  GenerationContext scope = template_scope( tpl, collection_id, ctx );
  const std::string text = evaluate_pattern( tpl.pattern, scope, collection_id );

  // The template's own shared variables become the capture's sets
  EvaluatedSets sets;
  if ( tpl.shared ) {
    for ( const auto& name : tpl.shared->keys() ) {
      const std::string var_name = internal::strip_dollar( name );
      if ( CaptureItemPtr item = scope.get_shared_variable(var_name) ) {
        sets.set( var_name, item );
      }
    }
  }
  trace.finish( TraceOutput{ text, false, {} } );
  return make_capture_item( text, sets );
}

inline tabula::EvaluatedSets tabula::Evaluator::evaluate_template_for_property_access(
  const Template& tpl, const std::string& collection_id, GenerationContext& ctx )
{
  RecursionGuard guard( ctx, tpl.id );
  EvaluatedSets sets;
  if ( !deps_.get_collection(collection_id) ) return sets;

  if ( tpl.shared ) {
    for ( const auto& [key, pattern] : *tpl.shared ) {
      const std::string var_name = internal::strip_dollar( key );
      if ( internal::starts_with(key, "$") ) {
        if ( auto m = internal::sole_expression(pattern) ) {
          const ExpressionToken token = parse_expression( m->expression );
          if ( const TableToken* ref = internal::bare_reference(token) ) {
            if ( auto r = deps_.resolve_table_ref(qualified_ref(*ref),
              collection_id) )
            {
              const TableRollResult result = deps_.roll_table( *r->item, ctx,
                r->collection_id, SelectionOptions() );
              sets.set( var_name, make_capture_item( result.text,
                result.placeholders.value_or( EvaluatedSets() ) ) );
              continue;
            }
          }
        }
      }
      sets.set( var_name, evaluate_pattern(pattern, ctx, collection_id) );
    }
  }

  // The pattern runs for its side effects only
  evaluate_pattern( tpl.pattern, ctx, collection_id );
  return sets;
}

inline int tabula::Evaluator::resolve_roll_count( const RollCount& count,
  const std::optional< std::string >& dice_count, GenerationContext& ctx,
  std::string& source )
{
  if ( dice_count ) {
    source = "dice";
    const std::int64_t total = roll_dice( *dice_count, ctx.rng(),
      ctx.config().max_exploding_dice ).total;
    return static_cast< int >( std::min< std::int64_t >( total,
      std::numeric_limits< int >::max() ) );
  }
  if ( const int* n = std::get_if< int >( &count ) ) {
    source = "literal";
    return *n;
  }

  source = "variable";
  const std::string& ref = std::get< std::string >( count );

  const size_t dot = ref.find( '.' );
  if ( dot != std::string::npos ) {
    const std::string name = ref.substr( 0, dot );
    const std::string property = ref.substr( dot + 1 );
    const CaptureVariable* capture = ctx.get_capture_variable( name );
    const bool shared = !capture && ctx.get_shared_variable( name );
    if ( capture || shared ) {
      if ( property == "count" ) return capture ? capture->count : 1;
      ctx.warn( diag::COERCION_FAILURE, "Cannot use capture property '$" + ref
        + "' as multi-roll count" );
      return 1;
    }
  }

  // Non-numeric or missing counts roll once
  const std::optional< std::string > value = ctx.resolve_variable( ref );
  const std::optional< std::int64_t > n = value ? internal::parse_int_prefix( *value )
    : std::nullopt;
  if ( !n ) return 1;
  return static_cast< int >( std::max< std::int64_t >(
    std::min< std::int64_t >( *n, std::numeric_limits< int >::max() ),
    std::numeric_limits< int >::min() ) );
}

inline std::string tabula::Evaluator::evaluate( const MultiRollToken& t,
  GenerationContext& ctx, const std::string& collection_id )
{
  std::string count_source;
  const int count = resolve_roll_count( t.count, t.dice_count, ctx, count_source );
  const std::string ref = qualified_ref( t );
  const std::string separator = t.separator.value_or( ", " );

  auto r = deps_.resolve_table_ref( ref, collection_id );
  if ( !r ) {
    if ( auto tr = deps_.resolve_template_ref(ref, collection_id) ) {
      return multi_roll_template( *tr->item, tr->collection_id, count,
        count_source, t, ctx );
    }
    ctx.warn( diag::REFERENCE_ERROR, "Table or template not found: " + ref );
    return "";
  }

  const std::string raw_count = t.dice_count ? *t.dice_count
    : std::holds_alternative< int >( t.count )
      ? std::to_string( std::get< int >( t.count ) )
      : '$' + std::get< std::string >( t.count );

  ordered_node parsed;
  if ( ctx.tracing() ) {
    parsed = ordered_node::mapping();
    parsed[ "count" ] = internal::int_node( count );
    parsed[ "tableId" ] = internal::make_node_from( t.table_id );
    parsed[ "unique" ] = internal::make_node_from( t.unique );
  }
  TraceScope trace( ctx, TraceNodeType::MultiRoll, std::to_string( count ) + "x "
    + t.table_id, raw_count + '*' + t.table_id, parsed );

  std::vector< std::string > results;
  SelectionOptions options;
  options.unique = t.unique;
  for ( int i = 0; i < count; ++i ) {
    const TableRollResult result = deps_.roll_table( *r->item, ctx,
      r->collection_id, options );
    if ( result.text.empty() ) continue;
    results.push_back( result.text );
    if ( t.unique && result.entry_id ) options.exclude_ids.insert( *result.entry_id );
  }

  const std::string text = internal::join( results, separator );
  ordered_node meta;
  if ( ctx.tracing() ) {
    meta = ordered_node::mapping();
    meta[ "type" ] = internal::make_node_from( std::string( "multi_roll" ) );
    meta[ "tableId" ] = internal::make_node_from( t.table_id );
    meta[ "countSource" ] = internal::make_node_from( count_source );
    meta[ "count" ] = internal::int_node( count );
    meta[ "unique" ] = internal::make_node_from( t.unique );
    meta[ "separator" ] = internal::make_node_from( separator );
  }
  trace.finish( TraceOutput{ text, false, {} }, meta );
  return text;
}

inline std::string tabula::Evaluator::multi_roll_template( const Template& tpl,
  const std::string& template_collection_id, int count,
  const std::string& count_source, const MultiRollToken& t,
  GenerationContext& ctx )
{
  const std::string separator = t.separator.value_or( ", " );
  TraceScope trace( ctx, TraceNodeType::MultiRoll, std::to_string( count ) + "x "
    + t.table_id + " (template)", t.table_id );

  // Each repetition re-evaluates the template's shared variables
  std::vector< std::string > results;
  for ( int i = 0; i < count; ++i ) {
    const std::string text = evaluate_template_internal( tpl,
      template_collection_id, ctx );
    if ( !text.empty() ) results.push_back( text );
  }

  const std::string text = internal::join( results, separator );
  ordered_node meta;
  if ( ctx.tracing() ) {
    meta = ordered_node::mapping();
    meta[ "type" ] = internal::make_node_from( std::string( "multi_roll" ) );
    meta[ "tableId" ] = internal::make_node_from( t.table_id );
    meta[ "countSource" ] = internal::make_node_from( count_source );
    meta[ "count" ] = internal::int_node( count );
    meta[ "unique" ] = internal::make_node_from( false );
    meta[ "separator" ] = internal::make_node_from( separator );
  }
  trace.finish( TraceOutput{ text, false, {} }, meta );
  return text;
}

inline std::string tabula::Evaluator::evaluate( const AgainToken& t,
  GenerationContext& ctx, const std::string& collection_id )
{
  if ( !ctx.self().table_id ) {
    ctx.warn( diag::INVALID_AGAIN, "{{again}} used outside of table context" );
    return "";
  }
  const Table* table = deps_.get_table( *ctx.self().table_id, collection_id );
  if ( !table ) return "";

  SelectionOptions options;
  options.unique = t.unique;
  if ( ctx.self().entry_id ) options.exclude_ids.insert( *ctx.self().entry_id );

  std::vector< std::string > results;
  const int count = t.count.value_or( 1 );
  for ( int i = 0; i < count; ++i ) {
    const TableRollResult result = deps_.roll_table( *table, ctx, collection_id,
      options );
    if ( result.text.empty() ) continue;
    results.push_back( result.text );
    if ( t.unique && result.entry_id ) options.exclude_ids.insert( *result.entry_id );
  }
  return internal::join( results, t.separator.value_or(", ") );
}

inline std::string tabula::Evaluator::evaluate( const InstanceToken& t,
  GenerationContext& ctx, const std::string& collection_id )
{
  const std::string raw = t.table_id + '#' + t.instance_name;

  auto meta = [&]( bool cached ) {
    ordered_node m;
    if ( !ctx.tracing() ) return m;
    m = ordered_node::mapping();
    m[ "type" ] = internal::make_node_from( std::string( "instance" ) );
    m[ "name" ] = internal::make_node_from( t.instance_name );
    m[ "cached" ] = internal::make_node_from( cached );
    m[ "tableId" ] = internal::make_node_from( t.table_id );
    return m;
  };

  if ( const InstanceResult* existing = ctx.get_instance(t.instance_name) ) {
    ctx.trace_leaf( TraceNodeType::Instance, "Instance: " + t.instance_name
      + " (cached)", raw, TraceOutput{ existing->text, true, {} }, meta(true) );
    return existing->text;
  }

  auto r = deps_.resolve_table_ref( t.table_id, collection_id );
  if ( !r ) {
    ctx.warn( diag::REFERENCE_ERROR, "Table not found: " + t.table_id );
    return "";
  }

  TraceScope trace( ctx, TraceNodeType::Instance, "Instance: " + t.instance_name,
    raw );
  const TableRollResult result = deps_.roll_table( *r->item, ctx,
    r->collection_id, SelectionOptions() );

  InstanceResult memo;
  memo.text = result.text;
  memo.table_id = t.table_id;
  memo.collection_id = r->collection_id;
  memo.result_type = result.result_type;
  memo.entry_id = result.entry_id;
  memo.placeholders = result.placeholders.value_or( EvaluatedSets() );
  ctx.set_instance( t.instance_name, std::move(memo) );

  trace.finish( TraceOutput{ result.text, false, {} }, meta(false) );
  return result.text;
}

inline std::string tabula::Evaluator::evaluate( const CaptureMultiRollToken& t,
  GenerationContext& ctx, const std::string& collection_id )
{
  if ( auto conflict = ctx.variable_conflict(t.capture_var) ) {
    ctx.warn( diag::CAPTURE_NAME_CONFLICT, "Capture variable '$" + t.capture_var
      + "' overwrites existing " + *conflict + " variable" );
  }

  std::string count_source;
  const int count = resolve_roll_count( t.count, t.dice_count, ctx, count_source );

  const std::string ref = qualified_ref( t );
  auto r = deps_.resolve_table_ref( ref, collection_id );
  if ( !r ) {
    ctx.warn( diag::REFERENCE_ERROR, "Table not found: " + ref );
    return "";
  }

  const std::string label = std::to_string( count ) + "x " + t.table_id + " >> $"
    + t.capture_var;
  TraceScope trace( ctx, TraceNodeType::CaptureMultiRoll, label, label );

  CaptureVariable capture;
  std::vector< std::string > results;
  SelectionOptions options;
  options.unique = t.unique;

  for ( int i = 0; i < count; ++i ) {
    const size_t before = ctx.descriptions().size();
    const TableRollResult result = deps_.roll_table( *r->item, ctx,
      r->collection_id, options );
    if ( result.text.empty() ) continue;

    results.push_back( result.text );
    CaptureItem item;
    item.value = result.text;
    item.sets = result.placeholders.value_or( EvaluatedSets() );
    if ( ctx.descriptions().size() > before ) {
      item.description = ctx.descriptions()[ before ].description;
    }
    capture.items.push_back( std::move(item) );
    if ( t.unique && result.entry_id ) options.exclude_ids.insert( *result.entry_id );
  }
  capture.count = static_cast< int >( capture.items.size() );

  ordered_node meta;
  if ( ctx.tracing() ) {
    meta = ordered_node::mapping();
    meta[ "type" ] = internal::make_node_from( std::string( "capture_multi_roll" ) );
    meta[ "tableId" ] = internal::make_node_from( t.table_id );
    meta[ "captureVar" ] = internal::make_node_from( t.capture_var );
    meta[ "count" ] = internal::int_node( capture.count );
    meta[ "unique" ] = internal::make_node_from( t.unique );
    meta[ "silent" ] = internal::make_node_from( t.silent );
    meta[ "separator" ] = internal::make_node_from( t.separator.value_or(", ") );
    std::vector< ordered_node > items;
    for ( const auto& item : capture.items ) items.push_back( to_node(item) );
    meta[ "capturedItems" ] = internal::make_node_from( items );
  }

  ctx.set_capture_variable( t.capture_var, std::move(capture) );

  const std::string text = t.silent ? ""
    : internal::join( results, t.separator.value_or(", ") );
  trace.finish( TraceOutput{ text, false, {} }, meta );
  return text;
}

inline std::string tabula::Evaluator::capture_shared_access(
  const CaptureAccessToken& t, const CaptureItem& item, GenerationContext& ctx,
  const std::string& label )
{
  const std::string result = t.properties.empty() ? item.value
    : traverse_property_chain( item, t.properties, '$' + t.var_name, ctx );

  if ( ctx.tracing() ) {
    ordered_node meta = ordered_node::mapping();
    meta[ "type" ] = internal::make_node_from( std::string( "capture_access" ) );
    meta[ "varName" ] = internal::make_node_from( t.var_name );
    meta[ "property" ] = internal::make_node_from(
      t.properties.empty() ? std::string( "value" ) : t.properties[0] );
    meta[ "found" ] = internal::make_node_from( true );
    meta[ "totalItems" ] = internal::int_node( 1 );
    meta[ "isCaptureShared" ] = internal::make_node_from( true );
    ctx.trace_leaf( TraceNodeType::CaptureAccess, label, label,
      TraceOutput{ result, false, {} }, meta );
  }
  return result;
}

inline std::string tabula::Evaluator::evaluate( const CaptureAccessToken& t,
  GenerationContext& ctx, const std::string& )
{
  const std::string label = internal::capture_label( t );
  const CaptureVariable* capture = ctx.get_capture_variable( t.var_name );
  const std::string first = t.properties.empty() ? "" : t.properties[ 0 ];

  auto trace = [&]( const std::string& value, bool found,
    std::optional< std::string > error = std::nullopt )
  {
    if ( !ctx.tracing() ) return;
    ordered_node meta = ordered_node::mapping();
    meta[ "type" ] = internal::make_node_from( std::string( "capture_access" ) );
    meta[ "varName" ] = internal::make_node_from( t.var_name );
    if ( t.index ) meta[ "index" ] = internal::int_node( *t.index );
    meta[ "property" ] = internal::make_node_from(
      first.empty() ? std::string( "value" ) : first );
    meta[ "found" ] = internal::make_node_from( found );
    if ( capture ) {
      meta[ "totalItems" ] = internal::int_node(
        static_cast< std::int64_t >( capture->items.size() ) );
    }
    ctx.trace_leaf( TraceNodeType::CaptureAccess, label, label,
      TraceOutput{ value, false, std::move(error) }, meta );
  };

  if ( !capture ) {
    if ( CaptureItemPtr shared = ctx.get_shared_variable(t.var_name) ) {
      return capture_shared_access( t, *shared, ctx, label );
    }
    ctx.warn( diag::CAPTURE_FORWARD_REF, "Capture variable not found: $"
      + t.var_name + " (forward reference?)" );
    trace( "", false, std::string( "Variable not found" ) );
    return "";
  }

  if ( first == "count" && !t.index ) {
    const std::string result = std::to_string( capture->count );
    trace( result, true );
    return result;
  }

  if ( t.index ) {
    const int size = static_cast< int >( capture->items.size() );
    const int index = *t.index < 0 ? size + *t.index : *t.index;
    if ( index < 0 || index >= size ) {
      ctx.warn( diag::CAPTURE_INDEX_OUT_OF_BOUNDS, "Capture access out of bounds: $"
        + t.var_name + '[' + std::to_string( *t.index ) + "] (length: "
        + std::to_string( size ) + ')' );
      trace( "", false, "Index out of bounds (" + std::to_string( size )
        + " items)" );
      return "";
    }
    const CaptureItem& item = capture->items[ index ];
    const std::string result = t.properties.empty() ? item.value
      : traverse_property_chain( item, t.properties, '$' + t.var_name + '['
        + std::to_string( *t.index ) + ']', ctx );
    trace( result, true );
    return result;
  }

  const std::string separator = t.separator.value_or( ", " );
  std::vector< std::string > values;
  if ( !first.empty() && first != "value" && first != "count" ) {
    // A property across every item; empty results are dropped
    for ( const auto& item : capture->items ) {
      std::string v = traverse_property_chain( item, t.properties,
        '$' + t.var_name, ctx );
      if ( !v.empty() ) values.push_back( std::move(v) );
    }
  } else {
    for ( const auto& item : capture->items ) values.push_back( item.value );
  }

  const std::string result = internal::join( values, separator );
  trace( result, true );
  return result;
}

inline std::string tabula::Evaluator::evaluate( const CollectToken& t,
  GenerationContext& ctx, const std::string& )
{
  const std::string label = "collect:$" + t.var_name + '.' + t.property
    + ( t.unique ? "|unique" : "" );
  const std::string separator = t.separator.value_or( ", " );

  auto property_of = [&]( const CaptureItem& item ) -> std::string {
    if ( t.property == "value" ) return item.value;
    if ( t.property == "description" ) return item.description.value_or( "" );
    const SetValue* v = item.sets.get( t.property );
    return v ? set_value_text( *v ) : std::string();
  };

  auto trace = [&]( const std::string& value, const std::vector< std::string >& all,
    const std::vector< std::string >& kept,
    std::optional< std::string > error = std::nullopt )
  {
    if ( !ctx.tracing() ) return;
    ordered_node meta = ordered_node::mapping();
    meta[ "type" ] = internal::make_node_from( std::string( "collect" ) );
    meta[ "varName" ] = internal::make_node_from( t.var_name );
    meta[ "property" ] = internal::make_node_from( t.property );
    meta[ "unique" ] = internal::make_node_from( t.unique );
    meta[ "separator" ] = internal::make_node_from( separator );
    meta[ "allValues" ] = internal::make_string_sequence( all );
    meta[ "resultValues" ] = internal::make_string_sequence( kept );
    ctx.trace_leaf( TraceNodeType::Collect, label, label,
      TraceOutput{ value, false, std::move(error) }, meta );
  };

  const CaptureVariable* capture = ctx.get_capture_variable( t.var_name );
  if ( !capture ) {
    if ( CaptureItemPtr shared = ctx.get_shared_variable(t.var_name) ) {
      const std::string result = property_of( *shared );
      std::vector< std::string > values;
      if ( !result.empty() ) values.push_back( result );
      trace( result, values, values );
      return result;
    }
    ctx.warn( diag::CAPTURE_FORWARD_REF, "Capture variable not found: $"
      + t.var_name + " (forward reference?)" );
    trace( "", {}, {}, std::string( "Variable not found" ) );
    return "";
  }

  std::vector< std::string > all;
  for ( const auto& item : capture->items ) {
    std::string v = property_of( item );
    if ( !v.empty() ) all.push_back( std::move(v) );
  }

  std::vector< std::string > kept;
  if ( t.unique ) {
    kept = all;
    internal::dedupe_in_order( kept );
  } else {
    kept = all;
  }

  const std::string result = internal::join( kept, separator );
  trace( result, all, kept );
  return result;
}

inline std::optional< std::string > tabula::Evaluator::select_switch_result(
  const std::vector< SwitchClause >& clauses,
  const std::optional< std::string >& else_expr,
  const std::optional< std::string >& base, GenerationContext& ctx,
  const std::string& collection_id )
{
  for ( const auto& clause : clauses ) {
    if ( evaluate_switch_condition(clause.condition, base, ctx, collection_id) ) {
      return clause.result_expr;
    }
  }
  return else_expr;
}

inline std::string tabula::Evaluator::evaluate( const SwitchToken& t,
  GenerationContext& ctx, const std::string& collection_id )
{
  auto winner = select_switch_result( t.clauses, t.else_expr, std::nullopt, ctx,
    collection_id );
  if ( !winner ) {
    ctx.warn( diag::SWITCH_NO_MATCH,
      "Switch expression: no clause matched and no else provided" );
    return "";
  }
  return evaluate_switch_result( *winner, ctx, collection_id );
}

inline std::string tabula::Evaluator::evaluate_switch_modifiers(
  const std::string& base, const SwitchModifiers& mods, GenerationContext& ctx,
  const std::string& collection_id )
{
  auto winner = select_switch_result( mods.clauses, mods.else_expr, base, ctx,
    collection_id );
  if ( !winner ) return base;
  return evaluate_switch_result( *winner, ctx, collection_id );
}

inline bool tabula::Evaluator::evaluate_switch_condition(
  const std::string& condition, const std::optional< std::string >& base,
  GenerationContext& ctx, const std::string& collection_id )
{
  const std::string prepared = base
    ? internal::substitute_base_value( condition, *base ) : condition;
  const std::string evaluated = evaluate_pattern( prepared, ctx, collection_id );
  const bool result = evaluate_when_clause( evaluated, ctx );
  ctx.trace_leaf( TraceNodeType::Conditional, "When: " + condition, prepared,
    TraceOutput{ result ? "true" : "false", false, {} } );
  return result;
}

inline std::string tabula::Evaluator::evaluate_switch_result(
  const std::string& result_expr, GenerationContext& ctx,
  const std::string& collection_id )
{
  const std::string trimmed = internal::trim( result_expr );
  if ( internal::is_quoted(trimmed) ) {
    const std::string inner = trimmed.substr( 1, trimmed.size() - 2 );
    if ( internal::contains(inner, "{{") ) {
      return evaluate_pattern( inner, ctx, collection_id );
    }
    return inner;
  }
  if ( !internal::contains(trimmed, "{{") ) {
    return evaluate_pattern( "{{" + trimmed + "}}", ctx, collection_id );
  }
  return evaluate_pattern( trimmed, ctx, collection_id );
}
