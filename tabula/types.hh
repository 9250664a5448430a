// ╺┳╸┏━┓┏┓ ╻ ╻╻  ┏━┓
//  ┃ ┣━┫┣┻┓┃ ┃┃  ┣━┫
//  ╹ ╹ ╹┗━┛┗━┛┗━╸╹ ╹
//  Random table & template generation engine
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "tabula/util.hh"

namespace tabula {

  // Policy applied when unique selection has exhausted a table
  enum class UniqueOverflow { Stop, Cycle, Error };

  inline std::string to_string( UniqueOverflow u ) {
    switch ( u ) {
      case UniqueOverflow::Cycle: return "cycle";
      case UniqueOverflow::Error: return "error";
      default: return "stop";
    }
  }

  inline std::optional< UniqueOverflow > parse_unique_overflow(
    const std::string& s )
  {
    if ( s == "stop" ) return UniqueOverflow::Stop;
    if ( s == "cycle" ) return UniqueOverflow::Cycle;
    if ( s == "error" ) return UniqueOverflow::Error;
    return std::nullopt;
  }

  // Engine-wide limits. A document's metadata may override any of them
  // for generations started from that document.
  struct EngineConfig {
    static constexpr int DEFAULT_MAX_RECURSION_DEPTH = 50;
    static constexpr int DEFAULT_MAX_EXPLODING_DICE = 100;
    static constexpr int DEFAULT_MAX_INHERITANCE_DEPTH = 5;

    int max_recursion_depth = DEFAULT_MAX_RECURSION_DEPTH;
    int max_exploding_dice = DEFAULT_MAX_EXPLODING_DICE;
    int max_inheritance_depth = DEFAULT_MAX_INHERITANCE_DEPTH;
    UniqueOverflow unique_overflow = UniqueOverflow::Stop;
  };

  enum class ErrorCode {
    Parse,
    Load,
    Validation,
    Reference,
    RecursionLimit,
    SharedShadow,
    UniqueOverflow,
    Inheritance,
    Dice
  };

  inline const char* error_code_name( ErrorCode code ) {
    switch ( code ) {
      case ErrorCode::Parse: return "PARSE_ERROR";
      case ErrorCode::Load: return "LOAD_ERROR";
      case ErrorCode::Validation: return "VALIDATION_ERROR";
      case ErrorCode::Reference: return "REFERENCE_ERROR";
      case ErrorCode::RecursionLimit: return "RECURSION_LIMIT";
      case ErrorCode::SharedShadow: return "SHARED_SHADOW";
      case ErrorCode::UniqueOverflow: return "UNIQUE_OVERFLOW";
      case ErrorCode::Inheritance: return "INHERITANCE_ERROR";
      case ErrorCode::Dice: return "DICE_ERROR";
    }
    return "UNKNOWN";
  }

  // Every hard failure raised by the library
  class Error : public std::runtime_error {
  public:
    inline Error( ErrorCode code, const std::string& msg )
      : std::runtime_error( msg ), code_( code ) {}

    inline ErrorCode code() const { return code_; }

  private:
    ErrorCode code_;
  };

  // Insertion-ordered string-keyed map. Assigning to an existing key keeps
  // its position; new keys are appended.
  template < typename V >
  class OrderedMap {
  public:
    using value_type = std::pair< std::string, V >;
    using container_type = std::vector< value_type >;
    using iterator = typename container_type::iterator;
    using const_iterator = typename container_type::const_iterator;

    OrderedMap() = default;

    OrderedMap( std::initializer_list< value_type > init ) {
      for ( const auto& kv : init ) set( kv.first, kv.second );
    }

    iterator begin() { return items_.begin(); }
    iterator end() { return items_.end(); }
    const_iterator begin() const { return items_.begin(); }
    const_iterator end() const { return items_.end(); }

    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }
    void clear() { items_.clear(); }

    iterator find( const std::string& key ) {
      for ( auto it = items_.begin(); it != items_.end(); ++it ) {
        if ( it->first == key ) return it;
      }
      return items_.end();
    }

    const_iterator find( const std::string& key ) const {
      for ( auto it = items_.begin(); it != items_.end(); ++it ) {
        if ( it->first == key ) return it;
      }
      return items_.end();
    }

    bool contains( const std::string& key ) const {
      return find( key ) != items_.end();
    }

    const V* get( const std::string& key ) const {
      auto it = find( key );
      return it == items_.end() ? nullptr : &it->second;
    }

    V* get( const std::string& key ) {
      auto it = find( key );
      return it == items_.end() ? nullptr : &it->second;
    }

    void set( const std::string& key, V value ) {
      auto it = find( key );
      if ( it != items_.end() ) it->second = std::move( value );
      else items_.emplace_back( key, std::move(value) );
    }

    V& operator[]( const std::string& key ) {
      auto it = find( key );
      if ( it != items_.end() ) return it->second;
      items_.emplace_back( key, V() );
      return items_.back().second;
    }

    bool erase( const std::string& key ) {
      auto it = find( key );
      if ( it == items_.end() ) return false;
      items_.erase( it );
      return true;
    }

    // Overlay wins on conflicts
    void merge( const OrderedMap& overlay ) {
      for ( const auto& kv : overlay ) set( kv.first, kv.second );
    }

    std::vector< std::string > keys() const {
      std::vector< std::string > out;
      out.reserve( items_.size() );
      for ( const auto& kv : items_ ) out.push_back( kv.first );
      return out;
    }

  private:
    container_type items_;
  };

  // Raw key -> pattern maps as authored in a document
  using Sets = OrderedMap< std::string >;

  struct CaptureItem;
  using CaptureItemPtr = std::shared_ptr< CaptureItem >;

  // An evaluated set value is either plain text or a full nested roll result
  using SetValue = std::variant< std::string, CaptureItemPtr >;
  using EvaluatedSets = OrderedMap< SetValue >;

  // The unit of capture: a value plus a tree of further named sets
  struct CaptureItem {
    std::string value;
    EvaluatedSets sets;
    std::optional< std::string > description;
  };

  inline CaptureItemPtr make_capture_item( std::string value,
    EvaluatedSets sets = EvaluatedSets(),
    std::optional< std::string > description = std::nullopt )
  {
    auto item = std::make_shared< CaptureItem >();
    item->value = std::move( value );
    item->sets = std::move( sets );
    item->description = std::move( description );
    return item;
  }

  // Text of a set value (the captured value for a nested item)
  inline std::string set_value_text( const SetValue& v ) {
    if ( const auto* s = std::get_if< std::string >( &v ) ) return *s;
    const auto& item = std::get< CaptureItemPtr >( v );
    return item ? item->value : std::string();
  }

  // Nested item held by a set value, or nullptr for plain text
  inline CaptureItemPtr set_value_item( const SetValue& v ) {
    if ( const auto* p = std::get_if< CaptureItemPtr >( &v ) ) return *p;
    return nullptr;
  }

  inline EvaluatedSets to_evaluated_sets( const Sets& sets ) {
    EvaluatedSets out;
    for ( const auto& [k, v] : sets ) out.set( k, SetValue(v) );
    return out;
  }

  // Named, ordered collection of roll results from N*table >> $name
  struct CaptureVariable {
    std::vector< CaptureItem > items;
    int count = 0;
  };

  struct EntryDescription {
    std::string table_name;
    std::string table_id;
    std::string rolled_value;
    std::string description;
    int depth = 0;
  };

  // Serialization of the value types for reporting

  inline ordered_node to_node( const EvaluatedSets& sets );

  inline ordered_node to_node( const CaptureItem& item ) {
    ordered_node n = ordered_node::mapping();
    n[ "value" ] = internal::make_node_from( item.value );
    n[ "sets" ] = to_node( item.sets );
    if ( item.description ) {
      n[ "description" ] = internal::make_node_from( *item.description );
    }
    return n;
  }

  inline ordered_node to_node( const EvaluatedSets& sets ) {
    ordered_node n = ordered_node::mapping();
    for ( const auto& [k, v] : sets ) {
      if ( auto item = set_value_item(v) ) n[ k ] = to_node( *item );
      else n[ k ] = internal::make_node_from( set_value_text(v) );
    }
    return n;
  }

  inline ordered_node to_node( const Sets& sets ) {
    ordered_node n = ordered_node::mapping();
    for ( const auto& [k, v] : sets ) n[ k ] = internal::make_node_from( v );
    return n;
  }

  inline ordered_node to_node( const CaptureVariable& var ) {
    std::vector< ordered_node > items;
    for ( const auto& item : var.items ) items.push_back( to_node(item) );
    ordered_node n = ordered_node::mapping();
    n[ "items" ] = internal::make_node_from( items );
    n[ "count" ] = internal::make_node_from(
      static_cast< std::int64_t >( var.count ) );
    return n;
  }

  inline ordered_node to_node( const EntryDescription& d ) {
    ordered_node n = ordered_node::mapping();
    n[ "tableName" ] = internal::make_node_from( d.table_name );
    n[ "tableId" ] = internal::make_node_from( d.table_id );
    n[ "rolledValue" ] = internal::make_node_from( d.rolled_value );
    n[ "description" ] = internal::make_node_from( d.description );
    n[ "depth" ] = internal::make_node_from( static_cast< std::int64_t >( d.depth ) );
    return n;
  }

} // namespace tabula
