// ╺┳╸┏━┓┏┓ ╻ ╻╻  ┏━┓
//  ┃ ┣━┫┣┻┓┃ ┃┃  ┣━┫
//  ╹ ╹ ╹┗━┛┗━┛┗━╸╹ ╹
//  Random table & template generation engine
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tabula/document.hh"
#include "tabula/types.hh"
#include "tabula/util.hh"

namespace tabula {

  // A loaded document plus its lookup indexes and resolved import aliases
  struct Collection {
    std::string id;
    Document document;
    OrderedMap< std::string > imports; // alias -> collection id
    bool preloaded = false;
    std::string source;

    inline const Table* find_table( const std::string& table_id ) const;
    inline const Template* find_template( const std::string& template_id ) const;

    // Must be called whenever document.tables or document.templates change
    inline void rebuild_indexes();

  private:
    std::map< std::string, size_t > table_index_;
    std::map< std::string, size_t > template_index_;
  };

  using CollectionPtr = std::shared_ptr< Collection >;

  // Loaded collections in load order
  using CollectionMap = OrderedMap< CollectionPtr >;

  template < typename T >
  struct Resolution {
    const T* item = nullptr;
    std::string collection_id;
  };

  using TableResolution = Resolution< Table >;
  using TemplateResolution = Resolution< Template >;

  // Resolves tableId, alias.tableId or namespace.tableId against the
  // collection currently being evaluated. A dotted reference tries, in order,
  // the collection's resolved import aliases, every collection's namespace,
  // and finally the collection's raw import declarations. The bare reference
  // is then looked up in the current collection and in all others.
  inline std::optional< TableResolution > resolve_table_ref(
    const std::string& ref, const std::string& collection_id,
    const CollectionMap& collections );

  inline std::optional< TemplateResolution > resolve_template_ref(
    const std::string& ref, const std::string& collection_id,
    const CollectionMap& collections );

namespace internal {

  inline const Table* find_item( const Collection& c, const std::string& id,
    const Table* )
  {
    return c.find_table( id );
  }

  inline const Template* find_item( const Collection& c, const std::string& id,
    const Template* )
  {
    return c.find_template( id );
  }

  template < typename T >
  inline std::optional< Resolution< T > > resolve_ref( const std::string& ref,
    const std::string& collection_id, const CollectionMap& collections )
  {
    const T* tag = nullptr;
    const CollectionPtr* current = collections.get( collection_id );

    auto lookup = [&]( const Collection& c, const std::string& id )
      -> std::optional< Resolution< T > >
    {
      if ( const T* item = find_item(c, id, tag) ) {
        return Resolution< T >{ item, c.id };
      }
      return std::nullopt;
    };

    if ( contains(ref, ".") ) {
      const std::vector< std::string > parts = split_segments( ref );
      const std::string& alias = parts.front();
      const std::string& item_id = parts.back();

      // Resolved import aliases take priority
      if ( current && *current ) {
        if ( const std::string* target_id = (*current)->imports.get(alias) ) {
          if ( const CollectionPtr* target = collections.get(*target_id) ) {
            if ( auto r = lookup(**target, item_id) ) return r;
          }
        }
      }

      const std::string ns = join_path( parts, 0, parts.size() - 1 );
      for ( const auto& [id, c] : collections ) {
        if ( c->document.metadata.ns == ns ) {
          if ( auto r = lookup(*c, item_id) ) return r;
        }
      }

      // Import declared but never bound: follow its path by namespace or id
      if ( current && *current ) {
        for ( const auto& imp : (*current)->document.imports ) {
          if ( imp.alias != alias ) continue;
          for ( const auto& [id, c] : collections ) {
            if ( id == collection_id ) continue;
            if ( c->document.metadata.ns == imp.path || id == imp.path ) {
              if ( auto r = lookup(*c, item_id) ) return r;
            }
          }
          break;
        }
      }
    }

    if ( current && *current ) {
      if ( auto r = lookup(**current, ref) ) return r;
    }

    for ( const auto& [id, c] : collections ) {
      if ( auto r = lookup(*c, ref) ) return r;
    }
    return std::nullopt;
  }

} // namespace tabula::internal

} // namespace tabula

inline const tabula::Table* tabula::Collection::find_table(
  const std::string& table_id ) const
{
  auto it = table_index_.find( table_id );
  return it == table_index_.end() ? nullptr : &document.tables[ it->second ];
}

inline const tabula::Template* tabula::Collection::find_template(
  const std::string& template_id ) const
{
  auto it = template_index_.find( template_id );
  return it == template_index_.end() ? nullptr
    : &document.templates[ it->second ];
}

inline void tabula::Collection::rebuild_indexes() {
  table_index_.clear();
  template_index_.clear();
  // Later duplicates win, as with a plain map insert
  for ( size_t i = 0; i < document.tables.size(); ++i ) {
    table_index_[ document.tables[i].id ] = i;
  }
  for ( size_t i = 0; i < document.templates.size(); ++i ) {
    template_index_[ document.templates[i].id ] = i;
  }
}

inline std::optional< tabula::TableResolution > tabula::resolve_table_ref(
  const std::string& ref, const std::string& collection_id,
  const CollectionMap& collections )
{
  return internal::resolve_ref< Table >( ref, collection_id, collections );
}

inline std::optional< tabula::TemplateResolution > tabula::resolve_template_ref(
  const std::string& ref, const std::string& collection_id,
  const CollectionMap& collections )
{
  return internal::resolve_ref< Template >( ref, collection_id, collections );
}
