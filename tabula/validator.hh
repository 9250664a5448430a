// ╺┳╸┏━┓┏┓ ╻ ╻╻  ┏━┓
//  ┃ ┣━┫┣┻┓┃ ┃┃  ┣━┫
//  ╹ ╹ ╹┗━┛┗━┛┗━╸╹ ╹
//  Random table & template generation engine
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <map>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <vector>

#include "tabula/diagnostics.hh"
#include "tabula/document.hh"
#include "tabula/util.hh"

namespace tabula {

  struct ValidationIssue {
    Severity severity = Severity::Error;
    std::string code;
    std::string message;
    std::optional< std::string > path; // document path of the offending node
    std::optional< std::string > suggestion;
  };

  struct ValidationResult {
    bool valid = true;
    std::vector< ValidationIssue > issues;

    inline std::vector< ValidationIssue > errors() const {
      return filter( Severity::Error );
    }
    inline std::vector< ValidationIssue > warnings() const {
      return filter( Severity::Warning );
    }

    inline bool has_code( const std::string& code ) const {
      for ( const auto& i : issues ) if ( i.code == code ) return true;
      return false;
    }

  private:
    inline std::vector< ValidationIssue > filter( Severity s ) const {
      std::vector< ValidationIssue > out;
      for ( const auto& i : issues ) if ( i.severity == s ) out.push_back( i );
      return out;
    }
  };

  // Schema and semantic checks of a loaded document. Only references that
  // stay inside the document are checked; dotted references are left to
  // the resolver.
  inline ValidationResult validate_document( const Document& doc );

  inline ordered_node to_node( const ValidationIssue& issue );
  inline ordered_node to_node( const ValidationResult& result );

namespace internal {

  inline const std::set< std::string >& reserved_words() {
    static const std::set< std::string > words = {
      "dice", "unique", "again", "true", "false", "null", "and", "or", "not",
      "contains", "matches", "shared", "math"
    };
    return words;
  }

  inline bool is_reserved_word( const std::string& w ) {
    return reserved_words().count( w ) > 0;
  }

  inline bool is_identifier( const std::string& s ) {
    static const std::regex re( "^[a-zA-Z_][a-zA-Z0-9_]*$" );
    return std::regex_match( s, re );
  }

  inline bool is_namespace( const std::string& s ) {
    static const std::regex re(
      "^[a-zA-Z_][a-zA-Z0-9_]*(\\.[a-zA-Z_][a-zA-Z0-9_]*)*$" );
    return std::regex_match( s, re );
  }

  inline bool is_semver( const std::string& s ) {
    static const std::regex re(
      "^\\d+\\.\\d+\\.\\d+(-[a-zA-Z0-9.]+)?(\\+[a-zA-Z0-9.]+)?$" );
    return std::regex_match( s, re );
  }

  // A leading '$' marks a context-sensitive variable
  inline bool is_variable_name( const std::string& s ) {
    static const std::regex re( "^\\$?[a-zA-Z_][a-zA-Z0-9_]*$" );
    return std::regex_match( s, re );
  }

  inline std::string last_segment( const std::string& ref ) {
    return split_segments( ref ).back();
  }

  class DocumentValidator {
  public:
    inline explicit DocumentValidator( const Document& doc ) : doc_( doc ) {}

    inline ValidationResult run();

  private:
    inline void issue( Severity severity, const std::string& code,
      const std::string& message, std::optional< std::string > path = std::nullopt,
      std::optional< std::string > suggestion = std::nullopt )
    {
      result_.issues.push_back( ValidationIssue{ severity, code, message,
        std::move(path), std::move(suggestion) } );
    }

    inline void error( const std::string& code, const std::string& message,
      std::optional< std::string > path = std::nullopt,
      std::optional< std::string > suggestion = std::nullopt )
    {
      issue( Severity::Error, code, message, std::move(path),
        std::move(suggestion) );
    }

    inline void check_metadata();
    inline void check_table( const Table& table, const std::string& path );
    inline void check_simple( const Table& table, const std::string& path );
    inline void check_composite( const Table& table, const std::string& path );
    inline void check_collection( const Table& table, const std::string& path );
    inline void check_template( const Template& tpl, const std::string& path );
    inline void check_variables( const Sets& vars, const std::string& path );
    inline void check_inheritance();
    inline void check_identifier( const std::string& id, const std::string& path,
      const std::string& kind );

    // Dotted references may point outside the document
    inline bool unknown_local_ref( const std::string& ref ) const {
      return !contains( ref, "." ) && table_ids_.count( last_segment(ref) ) == 0;
    }

    const Document& doc_;
    std::set< std::string > table_ids_;
    std::set< std::string > template_ids_;
    ValidationResult result_;
  };

} // namespace tabula::internal

} // namespace tabula

inline tabula::ValidationResult tabula::internal::DocumentValidator::run() {
  check_metadata();

  for ( const auto& t : doc_.tables ) table_ids_.insert( t.id );
  for ( const auto& t : doc_.templates ) template_ids_.insert( t.id );

  for ( size_t i = 0; i < doc_.tables.size(); ++i ) {
    check_table( doc_.tables[i], seq_indexed("tables", i) );
  }
  for ( size_t i = 0; i < doc_.templates.size(); ++i ) {
    check_template( doc_.templates[i], seq_indexed("templates", i) );
  }

  check_variables( doc_.variables, "variables" );
  check_variables( doc_.shared, "shared" );

  for ( const auto& id : table_ids_ ) {
    if ( template_ids_.count(id) ) {
      issue( Severity::Warning, "ID_COLLISION",
        "Table and template share the same ID: " + id, std::nullopt,
        std::string( "Consider using unique IDs to avoid confusion" ) );
    }
  }

  check_inheritance();

  result_.valid = result_.errors().empty();
  return result_;
}

inline void tabula::internal::DocumentValidator::check_metadata() {
  const Metadata& md = doc_.metadata;

  if ( trim(md.name).empty() ) {
    error( "MISSING_NAME", "Metadata name is required", std::string( "metadata.name" ) );
  }

  if ( md.ns.empty() ) {
    error( "MISSING_NAMESPACE", "Metadata namespace is required",
      std::string( "metadata.namespace" ) );
  }
  else if ( !is_namespace(md.ns) ) {
    error( "INVALID_NAMESPACE", "Invalid namespace format: " + md.ns,
      std::string( "metadata.namespace" ),
      std::string( "Use dot-separated segments (e.g., \"fantasy.core\")" ) );
  }

  if ( md.version.empty() ) {
    error( "MISSING_VERSION", "Metadata version is required",
      std::string( "metadata.version" ) );
  }
  else if ( !is_semver(md.version) ) {
    issue( Severity::Warning, "INVALID_VERSION",
      "Version should follow semver format: " + md.version,
      std::string( "metadata.version" ),
      std::string( "Use semantic versioning (e.g., \"1.0.0\")" ) );
  }

  if ( md.spec_version != "1.0" ) {
    error( "INVALID_SPEC_VERSION", "Unsupported spec version: " + md.spec_version,
      std::string( "metadata.specVersion" ), std::string( "Use specVersion \"1.0\"" ) );
  }

  auto check_limit = [&]( const std::optional< std::int64_t >& v,
    const std::string& key )
  {
    if ( v && *v < 1 ) {
      error( "INVALID_CONFIG", key + " must be at least 1", "metadata." + key );
    }
  };
  check_limit( md.max_recursion_depth, "maxRecursionDepth" );
  check_limit( md.max_exploding_dice, "maxExplodingDice" );
  check_limit( md.max_inheritance_depth, "maxInheritanceDepth" );
}

inline void tabula::internal::DocumentValidator::check_identifier(
  const std::string& id, const std::string& path, const std::string& kind )
{
  if ( trim(id).empty() ) {
    error( "MISSING_ID", kind + " ID is required", path );
    return;
  }
  if ( contains(id, ".") ) {
    error( "INVALID_ID", kind + " ID cannot contain periods: " + id, path,
      std::string( "Use underscores or camelCase instead" ) );
  }
  if ( !is_identifier(id) ) {
    error( "INVALID_ID", "Invalid " + kind + " ID format: " + id, path,
      std::string( "IDs must start with a letter and contain only alphanumeric"
        " characters and underscores" ) );
  }
  if ( is_reserved_word(to_lower(id)) ) {
    error( "RESERVED_WORD", kind + " ID is a reserved word: " + id, path );
  }
}

inline void tabula::internal::DocumentValidator::check_table( const Table& table,
  const std::string& path )
{
  check_identifier( table.id, path + ".id", "Table" );

  if ( trim(table.name).empty() ) {
    error( "MISSING_TABLE_NAME", "Table name is required", path + ".name" );
  }

  if ( table.extends && !table.extends->empty() && unknown_local_ref(*table.extends) ) {
    error( "INVALID_EXTENDS", "Extends references unknown table: " + *table.extends,
      path + ".extends" );
  }

  switch ( table.type ) {
    case TableType::Simple: check_simple( table, path ); break;
    case TableType::Composite: check_composite( table, path ); break;
    case TableType::Collection: check_collection( table, path ); break;
  }

  if ( table.shared ) check_variables( *table.shared, path + ".shared" );
}

inline void tabula::internal::DocumentValidator::check_simple( const Table& table,
  const std::string& path )
{
  if ( table.entries.empty() ) {
    error( "EMPTY_ENTRIES", "Simple table must have at least one entry",
      path + ".entries" );
    return;
  }

  const bool extends = table.extends && !table.extends->empty();
  std::set< std::string > entry_ids;
  bool has_active = false;

  for ( size_t i = 0; i < table.entries.size(); ++i ) {
    const Entry& e = table.entries[ i ];
    const std::string entry_path = path + '.' + seq_indexed( "entries", i );

    if ( e.id ) {
      if ( !entry_ids.insert(*e.id).second ) {
        error( "DUPLICATE_ENTRY_ID", "Duplicate entry ID: " + *e.id,
          entry_path + ".id" );
      }
      check_identifier( *e.id, entry_path + ".id", "Entry" );
    }

    if ( e.weight && e.range ) {
      error( "WEIGHT_RANGE_CONFLICT", "Entry cannot have both weight and range",
        entry_path, std::string( "Use either weight or range, not both" ) );
    }

    if ( e.weight && *e.weight < 0 ) {
      error( "INVALID_WEIGHT", "Entry weight cannot be negative: "
        + format_number( *e.weight ), entry_path + ".weight" );
    }

    if ( e.range ) {
      const std::vector< double >& r = *e.range;
      if ( r.size() != 2 ) {
        error( "INVALID_RANGE", "Range must be a two-element array [min, max]",
          entry_path + ".range" );
      }
      else if ( r[0] > r[1] ) {
        error( "INVALID_RANGE", "Range min (" + format_number( r[0] )
          + ") cannot exceed max (" + format_number( r[1] ) + ")",
          entry_path + ".range" );
      }
    }

    // An id-carrying entry in a child table may only adjust the inherited one
    if ( !e.value && !(extends && e.id) ) {
      error( "MISSING_VALUE", "Entry value is required", entry_path + ".value" );
    }

    double weight = e.weight.value_or( 1.0 );
    if ( e.range && e.range->size() == 2 ) {
      weight = (*e.range)[ 1 ] - (*e.range)[ 0 ] + 1;
    }
    if ( weight > 0 ) has_active = true;
  }

  // A child's parent may supply the active entries
  if ( !extends && !has_active ) {
    error( "NO_ACTIVE_ENTRIES", "Table has no entries with positive weight",
      path + ".entries" );
  }
}

inline void tabula::internal::DocumentValidator::check_composite(
  const Table& table, const std::string& path )
{
  if ( table.sources.empty() ) {
    error( "EMPTY_SOURCES", "Composite table must have at least one source",
      path + ".sources" );
    return;
  }

  for ( size_t i = 0; i < table.sources.size(); ++i ) {
    const CompositeSource& s = table.sources[ i ];
    const std::string source_path = path + '.' + seq_indexed( "sources", i );

    if ( unknown_local_ref(s.table_id) ) {
      error( "INVALID_SOURCE", "Source references unknown table: " + s.table_id,
        source_path + ".tableId" );
    }
    if ( s.weight && *s.weight < 0 ) {
      error( "INVALID_WEIGHT", "Source weight cannot be negative: "
        + format_number( *s.weight ), source_path + ".weight" );
    }
  }
}

inline void tabula::internal::DocumentValidator::check_collection(
  const Table& table, const std::string& path )
{
  if ( table.collections.empty() ) {
    error( "EMPTY_COLLECTIONS", "Collection table must reference at least one table",
      path + ".collections" );
    return;
  }

  for ( size_t i = 0; i < table.collections.size(); ++i ) {
    const std::string& ref = table.collections[ i ];
    if ( unknown_local_ref(ref) ) {
      error( "INVALID_COLLECTION", "Collection references unknown table: " + ref,
        path + '.' + seq_indexed( "collections", i ) );
    }
  }
}

inline void tabula::internal::DocumentValidator::check_template(
  const Template& tpl, const std::string& path )
{
  check_identifier( tpl.id, path + ".id", "Template" );

  if ( trim(tpl.name).empty() ) {
    error( "MISSING_TEMPLATE_NAME", "Template name is required", path + ".name" );
  }
  if ( tpl.pattern.empty() ) {
    error( "MISSING_PATTERN", "Template pattern is required", path + ".pattern" );
  }

  if ( tpl.shared ) check_variables( *tpl.shared, path + ".shared" );
}

inline void tabula::internal::DocumentValidator::check_variables(
  const Sets& vars, const std::string& path )
{
  for ( const auto& name : vars.keys() ) {
    const std::string var_path = path + '.' + name;
    if ( !is_variable_name(name) ) {
      error( "INVALID_VARIABLE_NAME", "Invalid variable name: " + name, var_path,
        std::string( "Variable names must start with a letter (or $ for"
          " context-sensitive variables) and contain only alphanumeric"
          " characters and underscores" ) );
    }
    const std::string bare = starts_with( name, "$" ) ? name.substr( 1 ) : name;
    if ( is_reserved_word(bare) ) {
      error( "RESERVED_WORD", "Variable name is a reserved word: " + name, var_path );
    }
  }
}

inline void tabula::internal::DocumentValidator::check_inheritance() {
  std::map< std::string, const Table* > by_id;
  for ( const auto& t : doc_.tables ) by_id[ t.id ] = &t;

  for ( const auto& table : doc_.tables ) {
    std::set< std::string > chain;
    const Table* current = &table;
    while ( current && current->extends && !current->extends->empty() ) {
      if ( !chain.insert(current->id).second ) {
        error( "CIRCULAR_INHERITANCE", "Circular inheritance detected involving"
          " table: " + current->id, std::string( "tables" ) );
        break;
      }
      auto it = by_id.find( last_segment(*current->extends) );
      current = it == by_id.end() ? nullptr : it->second;
    }
  }
}

inline tabula::ValidationResult tabula::validate_document( const Document& doc ) {
  internal::DocumentValidator validator( doc );
  return validator.run();
}

inline tabula::ordered_node tabula::to_node( const ValidationIssue& issue ) {
  ordered_node n = ordered_node::mapping();
  n[ "severity" ] = internal::make_node_from(
    std::string( severity_name(issue.severity) ) );
  n[ "code" ] = internal::make_node_from( issue.code );
  n[ "message" ] = internal::make_node_from( issue.message );
  if ( issue.path ) n[ "path" ] = internal::make_node_from( *issue.path );
  if ( issue.suggestion ) {
    n[ "suggestion" ] = internal::make_node_from( *issue.suggestion );
  }
  return n;
}

inline tabula::ordered_node tabula::to_node( const ValidationResult& result ) {
  ordered_node n = ordered_node::mapping();
  n[ "valid" ] = internal::make_node_from( result.valid );
  std::vector< ordered_node > issues;
  for ( const auto& i : result.issues ) issues.push_back( to_node(i) );
  n[ "issues" ] = internal::make_node_from( issues );
  return n;
}
