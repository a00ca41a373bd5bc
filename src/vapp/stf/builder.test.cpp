// NOLINTBEGIN

#include <gtest/gtest.h>

#include <test/fixture.hpp>

using vapp::protocol::address;
using vapp::stf::stf_errc;

class builder_test: public ::testing::Test,
                    public test::fixture
{
public:
  builder_test():
      test::fixture( "builder", "info" ),
      alice_secret_key( vapp::crypto::secret_key::create( vapp::crypto::hash( "alice" ) ) ),
      alice( address_of( alice_secret_key ) ),
      bob( address_of( vapp::crypto::secret_key::create( vapp::crypto::hash( "bob" ) ) ) ),
      carol( address_of( vapp::crypto::secret_key::create( vapp::crypto::hash( "carol" ) ) ) )
  {}

  vapp::crypto::secret_key alice_secret_key;
  address alice;
  address bob;
  address carol;
};

TEST_F( builder_test, witnesses_touched_keys )
{
  ASSERT_TRUE( apply( { make_deposit( alice, 100 ), make_deposit( carol, 7 ) } ) );

  auto root  = _state.root();
  auto input = make_input( { make_transfer( alice_secret_key, bob, 40 ) } );
  ASSERT_TRUE( input );
  EXPECT_EQ( _state.root(), root );

  EXPECT_EQ( input->root, root );
  EXPECT_EQ( input->accounts_root, _state.accounts.root() );
  EXPECT_EQ( input->requests_root, _state.requests.root() );
  EXPECT_EQ( input->state.tx_id, _state.tx_id );
  EXPECT_EQ( input->state.domain, _domain );
  EXPECT_EQ( input->timestamp, _timestamp );

  // Alice, Bob and the auctioneer; Carol is untouched
  EXPECT_EQ( input->account_proofs.size(), 3 );
  EXPECT_EQ( input->request_proofs.size(), 1 );
  EXPECT_EQ( input->state.accounts.size(), 1 );
  EXPECT_EQ( input->state.requests.size(), 0 );

  for( const auto& proof: input->account_proofs )
  {
    EXPECT_NE( proof.key, carol );
    EXPECT_TRUE( vapp::state::verify_proof( input->accounts_root, proof ) );
  }

  ASSERT_TRUE( input->state.accounts.values().contains( vapp::state::key_index( alice ) ) );
  EXPECT_EQ( input->state.accounts.values().at( vapp::state::key_index( alice ) ).balance, 100 );
}

TEST_F( builder_test, empty_batch )
{
  auto input = make_input( {} );
  ASSERT_TRUE( input );
  EXPECT_TRUE( input->transactions.empty() );
  EXPECT_TRUE( input->account_proofs.empty() );

  auto output = vapp::stf::apply( *input, _verifier );
  ASSERT_TRUE( output );
  EXPECT_EQ( output->new_root, _state.root() );
  EXPECT_TRUE( output->public_values.receipts.empty() );
}

TEST_F( builder_test, failing_batch )
{
  auto input = make_input( { make_transfer( alice_secret_key, bob, 1 ) } );
  ASSERT_FALSE( input );
  EXPECT_EQ( input.error(), stf_errc::insufficient_balance );
}

// NOLINTEND
