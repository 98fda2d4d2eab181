#include <gtest/gtest.h>

#include <limits>

#include <bondcurve/numeric/uint128.hpp>

using bondcurve::numeric::numeric_errc;
using bondcurve::numeric::uint128;

TEST( uint128, checked_arithmetic )
{
  const uint128 max = std::numeric_limits< uint128 >::max();

  EXPECT_EQ( bondcurve::numeric::checked_add( 2, 3 ), uint128( 5 ) );
  EXPECT_EQ( bondcurve::numeric::checked_add( max - 1, 1 ), max );
  EXPECT_EQ( bondcurve::numeric::checked_add( max, 1 ).error(), numeric_errc::overflow );

  EXPECT_EQ( bondcurve::numeric::checked_sub( 3, 3 ), uint128( 0 ) );
  EXPECT_EQ( bondcurve::numeric::checked_sub( 2, 3 ).error(), numeric_errc::underflow );

  EXPECT_EQ( bondcurve::numeric::checked_mul( 0, max ), uint128( 0 ) );
  EXPECT_EQ( bondcurve::numeric::checked_mul( max, 1 ), max );
  EXPECT_EQ( bondcurve::numeric::checked_mul( uint128( 1 ) << 127, 2 ).error(), numeric_errc::overflow );
  EXPECT_EQ( bondcurve::numeric::checked_mul( ( uint128( 1 ) << 127 ) - 1, 2 ), max - 1 );
}

TEST( uint128, little_endian )
{
  auto bytes = bondcurve::numeric::to_little_endian( uint128( 0x0102 ) );
  EXPECT_EQ( bytes[ 0 ], std::byte{ 0x02 } );
  EXPECT_EQ( bytes[ 1 ], std::byte{ 0x01 } );
  for( std::size_t i = 2; i < bytes.size(); ++i )
    EXPECT_EQ( bytes[ i ], std::byte{ 0x00 } );

  auto high = bondcurve::numeric::to_little_endian( uint128( 0xab ) << 120 );
  EXPECT_EQ( high[ 15 ], std::byte{ 0xab } );
  for( std::size_t i = 0; i < 15; ++i )
    EXPECT_EQ( high[ i ], std::byte{ 0x00 } );
  EXPECT_EQ( bondcurve::numeric::from_little_endian( high ), uint128( 0xab ) << 120 );

  for( auto b: bondcurve::numeric::to_little_endian( uint128( 0 ) ) )
    EXPECT_EQ( b, std::byte{ 0x00 } );

  const uint128 max = std::numeric_limits< uint128 >::max();
  for( auto b: bondcurve::numeric::to_little_endian( max ) )
    EXPECT_EQ( b, std::byte{ 0xff } );

  EXPECT_EQ( bondcurve::numeric::from_little_endian( bytes ), uint128( 0x0102 ) );
  EXPECT_EQ( bondcurve::numeric::from_little_endian( bondcurve::numeric::to_little_endian( max ) ), max );

  std::array< std::byte, 15 > short_bytes{};
  EXPECT_EQ( bondcurve::numeric::from_little_endian( short_bytes ).error(), numeric_errc::invalid_length );

  std::array< std::byte, 17 > long_bytes{};
  EXPECT_EQ( bondcurve::numeric::from_little_endian( long_bytes ).error(), numeric_errc::invalid_length );
}

TEST( uint128, from_string )
{
  EXPECT_EQ( bondcurve::numeric::from_string( "0" ), uint128( 0 ) );
  EXPECT_EQ( bondcurve::numeric::from_string( "1000" ), uint128( 1'000 ) );
  EXPECT_EQ( bondcurve::numeric::from_string( "340282366920938463463374607431768211455" ),
             std::numeric_limits< uint128 >::max() );

  EXPECT_EQ( bondcurve::numeric::from_string( "340282366920938463463374607431768211456" ).error(),
             numeric_errc::overflow );
  EXPECT_EQ( bondcurve::numeric::from_string( "" ).error(), numeric_errc::invalid_format );
  EXPECT_EQ( bondcurve::numeric::from_string( "-1" ).error(), numeric_errc::invalid_format );
  EXPECT_EQ( bondcurve::numeric::from_string( "+1" ).error(), numeric_errc::invalid_format );
  EXPECT_EQ( bondcurve::numeric::from_string( "1 000" ).error(), numeric_errc::invalid_format );
  EXPECT_EQ( bondcurve::numeric::from_string( "0x10" ).error(), numeric_errc::invalid_format );
}

TEST( uint128, error_messages )
{
  EXPECT_EQ( std::error_code( numeric_errc::overflow ).category().name(), std::string( "numeric" ) );
  EXPECT_EQ( std::error_code( numeric_errc::overflow ).message(), "arithmetic overflow" );
  EXPECT_EQ( std::error_code( numeric_errc::precision_failure ).message(), "precision failure" );
}
