// NOLINTBEGIN

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

#include <vapp/numeric.hpp>

using vapp::numeric::numeric_errc;
using vapp::numeric::uint256;

static const uint256 max_value = std::numeric_limits< uint256 >::max();

TEST( checked, add )
{
  auto sum = vapp::numeric::add( 2, 3 );
  ASSERT_TRUE( sum );
  EXPECT_EQ( *sum, 5 );

  sum = vapp::numeric::add( max_value, 0 );
  ASSERT_TRUE( sum );
  EXPECT_EQ( *sum, max_value );

  sum = vapp::numeric::add( max_value, 1 );
  ASSERT_FALSE( sum );
  EXPECT_EQ( sum.error(), numeric_errc::overflow );

  sum = vapp::numeric::add( max_value - 10, 11 );
  ASSERT_FALSE( sum );
  EXPECT_EQ( sum.error(), numeric_errc::overflow );
}

TEST( checked, sub )
{
  auto difference = vapp::numeric::sub( 10, 4 );
  ASSERT_TRUE( difference );
  EXPECT_EQ( *difference, 6 );

  difference = vapp::numeric::sub( 4, 4 );
  ASSERT_TRUE( difference );
  EXPECT_EQ( *difference, 0 );

  difference = vapp::numeric::sub( 4, 5 );
  ASSERT_FALSE( difference );
  EXPECT_EQ( difference.error(), numeric_errc::overflow );

  difference = vapp::numeric::sub( 0, max_value );
  ASSERT_FALSE( difference );
  EXPECT_EQ( difference.error(), numeric_errc::overflow );
}

TEST( checked, mul )
{
  auto product = vapp::numeric::mul( 7, 6 );
  ASSERT_TRUE( product );
  EXPECT_EQ( *product, 42 );

  product = vapp::numeric::mul( 0, max_value );
  ASSERT_TRUE( product );
  EXPECT_EQ( *product, 0 );

  product = vapp::numeric::mul( max_value, 1 );
  ASSERT_TRUE( product );
  EXPECT_EQ( *product, max_value );

  product = vapp::numeric::mul( max_value, 2 );
  ASSERT_FALSE( product );
  EXPECT_EQ( product.error(), numeric_errc::overflow );

  uint256 half = uint256( 1 ) << 128;
  product      = vapp::numeric::mul( half, half );
  ASSERT_FALSE( product );
  EXPECT_EQ( product.error(), numeric_errc::overflow );

  product = vapp::numeric::mul( half, half - 1 );
  ASSERT_TRUE( product );
  EXPECT_EQ( *product, max_value - half + 1 );
}

TEST( checked, div )
{
  auto quotient = vapp::numeric::div( 10, 3 );
  ASSERT_TRUE( quotient );
  EXPECT_EQ( *quotient, 3 );

  quotient = vapp::numeric::div( 0, 3 );
  ASSERT_TRUE( quotient );
  EXPECT_EQ( *quotient, 0 );

  quotient = vapp::numeric::div( 10, 0 );
  ASSERT_FALSE( quotient );
  EXPECT_EQ( quotient.error(), numeric_errc::overflow );
}

TEST( checked, increment )
{
  auto next = vapp::numeric::increment( 0 );
  ASSERT_TRUE( next );
  EXPECT_EQ( *next, 1 );

  constexpr auto last = std::numeric_limits< std::uint64_t >::max();

  next = vapp::numeric::increment( last - 1 );
  ASSERT_TRUE( next );
  EXPECT_EQ( *next, last );

  next = vapp::numeric::increment( last );
  ASSERT_FALSE( next );
  EXPECT_EQ( next.error(), numeric_errc::overflow );
}

TEST( checked, bytes )
{
  auto bytes = vapp::numeric::to_bytes( 0x0102 );
  for( std::size_t i = 0; i < bytes.size() - 2; ++i )
    EXPECT_EQ( bytes[ i ], std::byte{ 0x00 } );

  EXPECT_EQ( bytes[ 30 ], std::byte{ 0x01 } );
  EXPECT_EQ( bytes[ 31 ], std::byte{ 0x02 } );
  EXPECT_EQ( vapp::numeric::from_bytes( bytes ), 0x0102 );

  auto zero = vapp::numeric::to_bytes( 0 );
  EXPECT_EQ( zero, vapp::numeric::uint256_bytes{} );
  EXPECT_EQ( vapp::numeric::from_bytes( zero ), 0 );

  auto max_bytes = vapp::numeric::to_bytes( max_value );
  for( auto b: max_bytes )
    EXPECT_EQ( b, std::byte{ 0xff } );
  EXPECT_EQ( vapp::numeric::from_bytes( max_bytes ), max_value );
}

// NOLINTEND
