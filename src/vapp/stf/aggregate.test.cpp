// NOLINTBEGIN

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include <test/fixture.hpp>

using vapp::protocol::address;
using vapp::stf::stf_errc;

class aggregate_test: public ::testing::Test,
                      public test::fixture
{
public:
  aggregate_test():
      test::fixture( "aggregate", "info" ),
      alice( address_of( vapp::crypto::secret_key::create( vapp::crypto::hash( "alice" ) ) ) ),
      bob( address_of( vapp::crypto::secret_key::create( vapp::crypto::hash( "bob" ) ) ) )
  {}

  void SetUp() override
  {
    genesis = _state.root();
    ASSERT_TRUE( apply( { make_deposit( alice, 10 ) } ) );
    ASSERT_TRUE( apply( { make_deposit( bob, 20 ), make_deposit( alice, 5 ) } ) );
    ASSERT_TRUE( apply( { make_deposit( bob, 1 ) } ) );
  }

  address alice;
  address bob;
  vapp::crypto::digest genesis{};
};

TEST_F( aggregate_test, chains_steps )
{
  auto aggregated = vapp::stf::aggregate( _vk, _steps, _verifier );
  ASSERT_TRUE( aggregated );

  EXPECT_EQ( aggregated->old_root, genesis );
  EXPECT_EQ( aggregated->new_root, _state.root() );
  EXPECT_EQ( aggregated->accounts_root, _state.accounts.root() );
  EXPECT_EQ( aggregated->requests_root, _state.requests.root() );
  EXPECT_EQ( aggregated->timestamp, _timestamp - 1 );

  ASSERT_EQ( aggregated->receipts.size(), 4 );
  for( std::size_t i = 0; i < aggregated->receipts.size(); ++i )
    EXPECT_EQ( vapp::protocol::onchain_tx_id( aggregated->receipts[ i ] ), i + 1 );
}

TEST_F( aggregate_test, single_step )
{
  std::vector< std::vector< std::byte > > steps{ _steps[ 1 ] };

  auto aggregated = vapp::stf::aggregate( _vk, steps, _verifier );
  ASSERT_TRUE( aggregated );

  auto step = vapp::protocol::from_binary< vapp::stf::step_public_values >( _steps[ 1 ] );
  ASSERT_TRUE( step );
  EXPECT_EQ( *aggregated, *step );
}

TEST_F( aggregate_test, empty )
{
  auto aggregated = vapp::stf::aggregate( _vk, {}, _verifier );
  ASSERT_FALSE( aggregated );
  EXPECT_EQ( aggregated.error(), stf_errc::empty_aggregation );
}

TEST_F( aggregate_test, root_mismatch )
{
  std::vector< std::vector< std::byte > > steps{ _steps[ 0 ], _steps[ 2 ] };

  auto aggregated = vapp::stf::aggregate( _vk, steps, _verifier );
  ASSERT_FALSE( aggregated );
  EXPECT_EQ( aggregated.error(), stf_errc::root_mismatch );

  steps = { _steps[ 1 ], _steps[ 0 ] };
  aggregated = vapp::stf::aggregate( _vk, steps, _verifier );
  ASSERT_FALSE( aggregated );
  EXPECT_EQ( aggregated.error(), stf_errc::root_mismatch );
}

TEST_F( aggregate_test, timestamp_order )
{
  auto first  = vapp::protocol::from_binary< vapp::stf::step_public_values >( _steps[ 0 ] );
  auto second = vapp::protocol::from_binary< vapp::stf::step_public_values >( _steps[ 1 ] );
  ASSERT_TRUE( first && second );

  second->timestamp = first->timestamp - 1;

  std::vector< std::vector< std::byte > > steps{ _steps[ 0 ], vapp::protocol::to_binary( *second ) };
  auto aggregated = vapp::stf::aggregate( _vk, steps, _verifier );
  ASSERT_FALSE( aggregated );
  EXPECT_EQ( aggregated.error(), stf_errc::timestamp_out_of_order );
}

TEST_F( aggregate_test, verification )
{
  vapp::verifier::reject_verifier reject;

  auto aggregated = vapp::stf::aggregate( _vk, _steps, reject );
  ASSERT_FALSE( aggregated );
  EXPECT_EQ( aggregated.error(), stf_errc::invalid_proof );

  std::vector< std::vector< std::byte > > steps{ _steps[ 0 ], std::vector< std::byte >( 5, std::byte{ 0x07 } ) };
  aggregated = vapp::stf::aggregate( _vk, steps, _verifier );
  ASSERT_FALSE( aggregated );
  EXPECT_EQ( aggregated.error(), stf_errc::malformed_public_values );

  steps      = { _steps[ 0 ], test::public_values_claiming( std::uint64_t( 1 ) << 44 ) };
  aggregated = vapp::stf::aggregate( _vk, steps, _verifier );
  ASSERT_FALSE( aggregated );
  EXPECT_EQ( aggregated.error(), stf_errc::malformed_public_values );
}

// NOLINTEND
