// NOLINTBEGIN

#include <gtest/gtest.h>

#include <algorithm>

#include <bondcurve/state_db/state_delta.hpp>
#include <bondcurve/state_db/state_node.hpp>

TEST( state_delta, crud )
{
  auto delta = std::make_shared< bondcurve::state_db::state_delta >();
  ASSERT_TRUE( delta );

  EXPECT_EQ( delta->revision(), 0 );
  EXPECT_FALSE( delta->complete() );
  EXPECT_TRUE( delta->root() );
  EXPECT_FALSE( delta->parent() );

  EXPECT_FALSE( delta->get( { std::byte{ 0x01 } } ) );

  std::vector< std::byte > key_1{ std::byte{ 0x01 } }, value_1{ std::byte{ 0x10 } };
  EXPECT_EQ( delta->put( std::vector< std::byte >( key_1 ), value_1 ), key_1.size() + value_1.size() );
  if( auto value = delta->get( key_1 ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_1 ) );
  else
    ADD_FAILURE() << "delta did not return a value";

  std::vector< std::byte > key_2{ std::byte{ 0x02 } }, value_2{ std::byte{ 0x20 }, std::byte{ 0x21 } };
  EXPECT_EQ( delta->put( std::vector< std::byte >( key_2 ), value_2 ), key_2.size() + value_2.size() );

  std::vector< std::byte > value_1a{ std::byte{ 0x10 }, std::byte{ 0x11 }, std::byte{ 0x12 } };
  EXPECT_EQ( delta->put( std::vector< std::byte >( key_1 ), value_1a ), value_1a.size() - value_1.size() );
  if( auto value = delta->get( key_1 ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_1a ) );
  else
    ADD_FAILURE() << "delta did not return a value";

  EXPECT_EQ( delta->remove( std::vector< std::byte >( key_1 ) ), -1 * std::ssize( key_1 ) - std::ssize( value_1a ) );
  EXPECT_FALSE( delta->get( key_1 ) );
  EXPECT_EQ( delta->remove( std::vector< std::byte >( key_1 ) ), 0 );

  // A root holds everything, so removals never need to be remembered
  EXPECT_FALSE( delta->removed( key_1 ) );
}

TEST( state_delta, children )
{
  auto parent = std::make_shared< bondcurve::state_db::state_delta >();

  std::vector< std::byte > key_1{ std::byte{ 0x01 } }, value_1{ std::byte{ 0x10 } };
  parent->put( std::vector< std::byte >( key_1 ), value_1 );

  std::vector< std::byte > key_2{ std::byte{ 0x02 } }, value_2{ std::byte{ 0x20 } };
  parent->put( std::vector< std::byte >( key_2 ), value_2 );

  std::vector< std::byte > key_3{ std::byte{ 0x03 } }, value_3{ std::byte{ 0x30 } };
  parent->put( std::vector< std::byte >( key_3 ), value_3 );

  auto child = parent->make_child();
  ASSERT_TRUE( child );
  EXPECT_EQ( child->parent(), parent );
  EXPECT_EQ( child->revision(), parent->revision() + 1 );
  EXPECT_FALSE( child->root() );

  std::vector< std::byte > key_4{ std::byte{ 0x04 } }, value_4{ std::byte{ 0x40 } };
  EXPECT_EQ( child->put( std::vector< std::byte >( key_4 ), value_4 ), key_4.size() + value_4.size() );
  EXPECT_FALSE( parent->get( key_4 ) );
  if( auto value = child->get( key_4 ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_4 ) );
  else
    ADD_FAILURE() << "child did not return a value";

  std::vector< std::byte > value_1a{ std::byte{ 0x10 }, std::byte{ 0x11 } };
  EXPECT_EQ( child->put( std::vector< std::byte >( key_1 ), value_1a ), value_1a.size() - value_1.size() );
  if( auto value = parent->get( key_1 ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_1 ) );
  else
    ADD_FAILURE() << "parent did not return a value";

  EXPECT_EQ( child->remove( std::vector< std::byte >( key_2 ) ), -1 * std::ssize( key_2 ) - std::ssize( value_2 ) );
  EXPECT_TRUE( parent->get( key_2 ) );
  EXPECT_FALSE( child->get( key_2 ) );
  EXPECT_TRUE( child->removed( key_2 ) );

  std::vector< std::byte > value_3a{ std::byte{ 0x30 }, std::byte{ 0x31 }, std::byte{ 0x32 } };
  EXPECT_EQ( child->put( std::vector< std::byte >( key_3 ), value_3a ), value_3a.size() - value_3.size() );
  EXPECT_EQ( child->remove( std::vector< std::byte >( key_3 ) ), -1 * std::ssize( key_3 ) - std::ssize( value_3a ) );
  EXPECT_TRUE( child->removed( key_3 ) );
  EXPECT_FALSE( parent->removed( key_3 ) );

  child->squash();
  EXPECT_TRUE( child->complete() );
  EXPECT_EQ( parent->revision(), 1 );

  if( auto value = parent->get( key_1 ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_1a ) );
  else
    ADD_FAILURE() << "parent did not return a value";

  EXPECT_FALSE( parent->get( key_2 ) );
  EXPECT_FALSE( parent->removed( key_2 ) );
  EXPECT_FALSE( parent->get( key_3 ) );
  EXPECT_TRUE( parent->get( key_4 ) );

  EXPECT_THROW( child->put( std::vector< std::byte >( key_1 ), value_1 ), std::runtime_error );
  EXPECT_THROW( child->squash(), std::runtime_error );

  child           = parent->make_child();
  auto grandchild = child->make_child();

  grandchild->remove( std::vector< std::byte >( key_1 ) );
  EXPECT_FALSE( grandchild->get( key_1 ) );
  EXPECT_TRUE( grandchild->removed( key_1 ) );
  EXPECT_TRUE( child->get( key_1 ) );
  EXPECT_FALSE( child->removed( key_1 ) );

  grandchild->squash();
  EXPECT_FALSE( child->get( key_1 ) );
  EXPECT_TRUE( child->removed( key_1 ) );
  EXPECT_TRUE( parent->get( key_1 ) );

  EXPECT_THROW( parent->squash(), std::runtime_error );
}

TEST( state_delta, merged_objects )
{
  auto parent = std::make_shared< bondcurve::state_db::state_delta >();

  std::vector< std::byte > key_1{ std::byte{ 0x01 } }, value_1{ std::byte{ 0x10 } };
  std::vector< std::byte > key_2{ std::byte{ 0x02 } }, value_2{ std::byte{ 0x20 } };
  std::vector< std::byte > key_3{ std::byte{ 0x03 } }, value_3{ std::byte{ 0x30 } };
  std::vector< std::byte > value_2a{ std::byte{ 0x21 } };

  parent->put( std::vector< std::byte >( key_1 ), value_1 );
  parent->put( std::vector< std::byte >( key_2 ), value_2 );

  auto child = parent->make_child();
  child->remove( std::vector< std::byte >( key_1 ) );
  child->put( std::vector< std::byte >( key_2 ), value_2a );
  child->put( std::vector< std::byte >( key_3 ), value_3 );

  auto objects = child->merged_objects();
  ASSERT_EQ( objects.size(), 2 );
  EXPECT_FALSE( objects.contains( key_1 ) );
  EXPECT_EQ( objects.at( key_2 ), value_2a );
  EXPECT_EQ( objects.at( key_3 ), value_3 );

  EXPECT_EQ( parent->merged_objects().size(), 2 );
  EXPECT_EQ( parent->merged_objects().at( key_2 ), value_2 );

  EXPECT_THROW( child->load( {}, 0 ), std::runtime_error );

  bondcurve::state_db::state_delta::object_map loaded{ { key_3, value_3 } };
  parent->load( std::move( loaded ), 7 );
  EXPECT_EQ( parent->revision(), 7 );
  EXPECT_FALSE( parent->get( key_1 ) );
  EXPECT_TRUE( parent->get( key_3 ) );
}

TEST( state_node, object_spaces )
{
  auto root = std::make_shared< bondcurve::state_db::permanent_state_node >(
    std::make_shared< bondcurve::state_db::state_delta >() );

  bondcurve::state_db::object_space space_a{ .id = 0 };
  bondcurve::state_db::object_space space_b{ .id = 1 };
  std::vector< std::byte > key{ std::byte{ 0x01 } }, value_a{ std::byte{ 0x0a } }, value_b{ std::byte{ 0x0b } };

  auto child = root->make_child();
  child->put( space_a, key, value_a );
  child->put( space_b, key, value_b );

  if( auto value = child->get( space_a, key ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_a ) );
  else
    ADD_FAILURE() << "child did not return a value";

  if( auto value = child->get( space_b, key ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_b ) );
  else
    ADD_FAILURE() << "child did not return a value";

  EXPECT_FALSE( root->get( space_a, key ) );

  child->remove( space_a, key );
  child->squash();

  EXPECT_FALSE( root->get( space_a, key ) );
  EXPECT_TRUE( root->get( space_b, key ) );
  EXPECT_EQ( root->revision(), 1 );

  EXPECT_THROW( child->get( space_b, key ), std::runtime_error );
  EXPECT_THROW( child->squash(), std::runtime_error );
}

// NOLINTEND
