#include <bondcurve/state_db/state_delta.hpp>

#include <vector>

namespace bondcurve::state_db {

std::int64_t state_delta::remove( std::vector< std::byte >&& key )
{
  if( complete() )
    throw std::runtime_error( "cannot modify a complete state delta" );

  std::int64_t size = 0;

  if( auto current_value = get( key ); current_value )
    size -= std::ssize( key ) + std::ssize( *current_value );

  _objects.erase( key );

  if( !root() && size )
    _removed_objects.emplace( std::move( key ) );

  return size;
}

std::optional< std::span< const std::byte > > state_delta::get( const std::vector< std::byte >& key ) const
{
  for( const state_delta* node = this; node != nullptr; node = node->_parent.get() )
  {
    if( node->removed( key ) )
      return {};

    if( auto itr = node->_objects.find( key ); itr != node->_objects.end() )
      return std::span< const std::byte >( itr->second );
  }

  return {};
}

std::shared_ptr< state_delta > state_delta::make_child()
{
  if( complete() )
    throw std::runtime_error( "cannot make a child of a complete state delta" );

  auto child       = std::make_shared< state_delta >();
  child->_parent   = shared_from_this();
  child->_revision = _revision + 1;
  return child;
}

void state_delta::squash()
{
  if( root() )
    throw std::runtime_error( "cannot squash a root state delta" );

  if( complete() )
    throw std::runtime_error( "state delta has already been squashed" );

  if( _parent->complete() )
    throw std::runtime_error( "cannot squash in to a complete state delta" );

  // Removals are applied first so that a key removed and then rewritten here
  // ends up holding the rewritten value in the parent.
  for( auto itr = _removed_objects.begin(); itr != _removed_objects.end(); itr = _removed_objects.begin() )
  {
    _parent->_objects.erase( *itr );

    if( !_parent->root() )
      _parent->_removed_objects.insert( _removed_objects.extract( itr ) );
    else
      _removed_objects.erase( itr );
  }

  while( !_objects.empty() )
  {
    auto node = _objects.extract( _objects.begin() );

    if( !_parent->root() )
      _parent->_removed_objects.erase( node.key() );

    _parent->_objects.insert_or_assign( std::move( node.key() ), std::move( node.mapped() ) );
  }

  _parent->_revision = _revision;
  _complete          = true;
}

state_delta::object_map state_delta::merged_objects() const
{
  std::vector< const state_delta* > lineage;
  for( const state_delta* node = this; node != nullptr; node = node->_parent.get() )
    lineage.push_back( node );

  object_map objects;
  for( auto itr = lineage.rbegin(); itr != lineage.rend(); ++itr )
  {
    for( const auto& key: ( *itr )->_removed_objects )
      objects.erase( key );

    for( const auto& [ key, value ]: ( *itr )->_objects )
      objects.insert_or_assign( key, value );
  }

  return objects;
}

void state_delta::load( object_map&& objects, std::uint64_t revision )
{
  if( !root() )
    throw std::runtime_error( "only a root state delta can be loaded" );

  _objects  = std::move( objects );
  _revision = revision;
  _removed_objects.clear();
}

bool state_delta::removed( const std::vector< std::byte >& key ) const
{
  return _removed_objects.contains( key );
}

bool state_delta::root() const
{
  return !_parent;
}

bool state_delta::complete() const
{
  return _complete;
}

std::uint64_t state_delta::revision() const
{
  return _revision;
}

const std::shared_ptr< state_delta >& state_delta::parent() const
{
  return _parent;
}

} // namespace bondcurve::state_db
