#pragma once

#include <bondcurve/state_db/types.hpp>

#include <cstdint>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <ranges>
#include <set>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

namespace bondcurve::state_db {

/**
 * A set of writes layered on top of an optional parent delta.
 *
 * Reads fall through to the parent unless the key was written or removed
 * here. A root delta (no parent) holds the full committed state. Squashing
 * moves this delta's writes into its parent and leaves this delta complete,
 * after which it rejects further writes.
 */
class state_delta final: public std::enable_shared_from_this< state_delta >
{
public:
  using object_map = std::map< std::vector< std::byte >, std::vector< std::byte > >;

  state_delta() noexcept = default;

  state_delta& operator=( const state_delta& ) = delete;
  state_delta& operator=( state_delta&& )      = delete;
  state_delta( const state_delta& )            = delete;
  state_delta( state_delta&& )                 = delete;

  ~state_delta() = default;

  template< std::ranges::range ValueType >
  std::int64_t put( std::vector< std::byte >&& key, const ValueType& value );
  std::int64_t remove( std::vector< std::byte >&& key );
  std::optional< std::span< const std::byte > > get( const std::vector< std::byte >& key ) const;

  std::shared_ptr< state_delta > make_child();
  void squash();

  /**
   * Returns the full state visible from this delta, merged from the root down.
   */
  object_map merged_objects() const;

  /**
   * Replaces the contents of a root delta.
   */
  void load( object_map&& objects, std::uint64_t revision );

  bool removed( const std::vector< std::byte >& key ) const;
  bool root() const;
  bool complete() const;

  std::uint64_t revision() const;
  const std::shared_ptr< state_delta >& parent() const;

private:
  std::shared_ptr< state_delta > _parent;
  object_map _objects;
  std::set< std::vector< std::byte > > _removed_objects;
  std::uint64_t _revision = 0;
  bool _complete          = false;
};

template< std::ranges::range ValueType >
std::int64_t state_delta::put( std::vector< std::byte >&& key, const ValueType& value )
{
  if( complete() )
    throw std::runtime_error( "cannot modify a complete state delta" );

  std::int64_t size = std::ssize( key ) + std::ssize( value );
  if( auto current_value = get( key ); current_value )
    size -= std::ssize( key ) + std::ssize( *current_value );

  _removed_objects.erase( key );
  _objects.insert_or_assign( std::move( key ), std::vector< std::byte >( std::ranges::begin( value ), std::ranges::end( value ) ) );

  return size;
}

} // namespace bondcurve::state_db
