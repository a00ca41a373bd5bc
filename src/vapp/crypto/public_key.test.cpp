// NOLINTBEGIN

#include <gtest/gtest.h>

#include <algorithm>

#include <vapp/crypto/hash.hpp>
#include <vapp/crypto/public_key.hpp>
#include <vapp/crypto/secret_key.hpp>

TEST( public_key, verify )
{
  auto skey = vapp::crypto::secret_key::create( vapp::crypto::hash( "alice" ) );
  auto pkey = skey.public_key();

  auto data      = vapp::crypto::hash( "carpe diem" );
  auto signature = skey.sign( data );

  EXPECT_TRUE( pkey.verify( signature, data ) );
  EXPECT_FALSE( pkey.verify( signature, vapp::crypto::hash( "carpe noctem" ) ) );

  signature[ 0 ] ^= std::byte{ 0x01 };
  EXPECT_FALSE( pkey.verify( signature, data ) );
}

TEST( public_key, wrong_key )
{
  auto alice = vapp::crypto::secret_key::create( vapp::crypto::hash( "alice" ) );
  auto bob   = vapp::crypto::secret_key::create( vapp::crypto::hash( "bob" ) );

  auto data = vapp::crypto::hash( "carpe diem" );
  EXPECT_FALSE( bob.public_key().verify( alice.sign( data ), data ) );
  EXPECT_FALSE( vapp::crypto::public_key().verify( alice.sign( data ), data ) );
}

TEST( public_key, comparison )
{
  auto skey1 = vapp::crypto::secret_key::create( vapp::crypto::hash( "alice" ) );
  auto skey2 = vapp::crypto::secret_key::create( vapp::crypto::hash( "bob" ) );

  auto pkey1 = skey1.public_key();
  auto pkey2 = skey2.public_key();

  EXPECT_NE( pkey1, pkey2 );
  EXPECT_EQ( pkey1, pkey1 );
  EXPECT_EQ( pkey1, vapp::crypto::secret_key::create( vapp::crypto::hash( "alice" ) ).public_key() );
  EXPECT_FALSE( std::ranges::equal( pkey1.bytes(), pkey2.bytes() ) );
}

// NOLINTEND
