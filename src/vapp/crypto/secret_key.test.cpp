// NOLINTBEGIN

#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include <vapp/crypto/hash.hpp>
#include <vapp/crypto/secret_key.hpp>

TEST( secret_key, deterministic_seed )
{
  auto seed = vapp::crypto::hash( "seed" );

  auto key1 = vapp::crypto::secret_key::create( seed );
  auto key2 = vapp::crypto::secret_key::create( seed );

  EXPECT_EQ( key1, key2 );
  EXPECT_EQ( key1.bytes(), key2.bytes() );
  EXPECT_EQ( key1.public_key(), key2.public_key() );

  auto digest = vapp::crypto::hash( "message" );
  EXPECT_EQ( key1.sign( digest ), key2.sign( digest ) );
}

TEST( secret_key, random )
{
  auto key1 = vapp::crypto::secret_key::create();
  auto key2 = vapp::crypto::secret_key::create();

  EXPECT_NE( key1, key2 );

  auto digest = vapp::crypto::hash( "message" );
  EXPECT_TRUE( key1.public_key().verify( key1.sign( digest ), digest ) );
  EXPECT_FALSE( key2.public_key().verify( key1.sign( digest ), digest ) );
}

TEST( secret_key, layout )
{
  auto seed = vapp::crypto::hash( "seed" );
  auto key  = vapp::crypto::secret_key::create( seed );

  EXPECT_TRUE( std::equal( seed.begin(), seed.end(), key.bytes().begin() ) );
  EXPECT_TRUE( std::equal( key.public_key().bytes().begin(),
                           key.public_key().bytes().end(),
                           key.bytes().begin() + seed.size() ) );
}

TEST( secret_key, arbitrary_message )
{
  auto key = vapp::crypto::secret_key::create( vapp::crypto::hash( "seed" ) );

  std::vector< std::byte > message( 100, std::byte{ 0x2a } );
  auto sig = key.sign( message );

  EXPECT_TRUE( key.public_key().verify( sig, message ) );
  message.pop_back();
  EXPECT_FALSE( key.public_key().verify( sig, message ) );
}

// NOLINTEND
