// NOLINTBEGIN

#include <gtest/gtest.h>

#include <limits>

#include <vapp/protocol.hpp>

TEST( account, balance )
{
  vapp::protocol::account a;

  ASSERT_TRUE( a.add_balance( 100 ) );
  EXPECT_EQ( a.balance, 100 );

  ASSERT_TRUE( a.deduct_balance( 40 ) );
  EXPECT_EQ( a.balance, 60 );

  auto result = a.deduct_balance( 61 );
  ASSERT_FALSE( result );
  EXPECT_EQ( result.error(), vapp::numeric::numeric_errc::overflow );
  EXPECT_EQ( a.balance, 60 );

  result = a.add_balance( std::numeric_limits< vapp::numeric::uint256 >::max() );
  ASSERT_FALSE( result );
  EXPECT_EQ( result.error(), vapp::numeric::numeric_errc::overflow );
  EXPECT_EQ( a.balance, 60 );
}

TEST( account, prover )
{
  vapp::protocol::account a;
  EXPECT_FALSE( a.is_prover() );

  a.owner.bytes[ 0 ] = std::byte{ 0x01 };
  EXPECT_TRUE( a.is_prover() );
}

TEST( account, leaf )
{
  vapp::protocol::account a;
  EXPECT_EQ( vapp::state::leaf_hash( a ), vapp::crypto::digest{} );

  a.balance = 1;
  auto encoded = vapp::state::leaf_codec< vapp::protocol::account >::encode( a );
  EXPECT_EQ( encoded.size(), 104 );
  EXPECT_EQ( encoded[ 31 ], std::byte{ 0x01 } );
  EXPECT_NE( vapp::state::leaf_hash( a ), vapp::crypto::digest{} );

  vapp::protocol::account b = a;
  b.staker_fee_bips         = 1;
  EXPECT_NE( vapp::state::leaf_hash( a ), vapp::state::leaf_hash( b ) );
}

// NOLINTEND
