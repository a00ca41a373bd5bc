#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include <boost/serialization/array.hpp>
#include <boost/serialization/vector.hpp>

#include <vapp/crypto/hash.hpp>
#include <vapp/crypto/public_key.hpp>
#include <vapp/crypto/secret_key.hpp>
#include <vapp/numeric/checked.hpp>
#include <vapp/protocol/address.hpp>
#include <vapp/protocol/serialization.hpp>

namespace vapp::protocol {

enum class message_type : std::uint8_t
{
  transfer = 1,
  withdraw,
  delegate,
  request,
  bid,
  settle,
  execute,
  fulfill
};

enum class proof_mode : std::uint8_t
{
  core = 0,
  compressed,
  plonk,
  groth16
};

enum class execution_status : std::uint8_t
{
  unexecuted = 0,
  executed,
  unexecutable
};

using raw_bytes = std::vector< std::byte >;

/*
 * Off-chain message bodies. Addresses and request ids travel as raw bytes and are
 * parsed during execution.
 */
struct transfer_body
{
  crypto::digest domain{};
  std::uint64_t nonce = 0;
  raw_bytes to;
  numeric::uint256 amount;
  numeric::uint256 fee;
  raw_bytes auctioneer;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & domain;
    ar & nonce;
    ar & to;
    ar & amount;
    ar & fee;
    ar & auctioneer;
  }
};

struct withdraw_body
{
  crypto::digest domain{};
  std::uint64_t nonce = 0;
  raw_bytes account;
  numeric::uint256 amount;
  numeric::uint256 fee;
  raw_bytes auctioneer;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & domain;
    ar & nonce;
    ar & account;
    ar & amount;
    ar & fee;
    ar & auctioneer;
  }
};

struct delegate_body
{
  crypto::digest domain{};
  std::uint64_t nonce = 0;
  raw_bytes prover;
  raw_bytes delegate;
  numeric::uint256 fee;
  raw_bytes auctioneer;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & domain;
    ar & nonce;
    ar & prover;
    ar & delegate;
    ar & fee;
    ar & auctioneer;
  }
};

struct request_body
{
  crypto::digest domain{};
  std::uint64_t nonce = 0;
  crypto::digest vk_hash{};
  proof_mode mode = proof_mode::compressed;
  std::uint64_t gas_limit = 0;
  numeric::uint256 base_fee;
  numeric::uint256 max_price_per_pgu;
  std::vector< raw_bytes > whitelist;
  raw_bytes auctioneer;
  raw_bytes executor;
  raw_bytes verifier;
  raw_bytes treasury;
  std::optional< raw_bytes > public_values_hash;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & domain;
    ar & nonce;
    ar & vk_hash;
    ar & mode;
    ar & gas_limit;
    ar & base_fee;
    ar & max_price_per_pgu;
    ar & whitelist;
    ar & auctioneer;
    ar & executor;
    ar & verifier;
    ar & treasury;
    ar & public_values_hash;
  }
};

struct bid_body
{
  crypto::digest domain{};
  std::uint64_t nonce = 0;
  raw_bytes request_id;
  raw_bytes prover;
  numeric::uint256 amount;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & domain;
    ar & nonce;
    ar & request_id;
    ar & prover;
    ar & amount;
  }
};

struct settle_body
{
  crypto::digest domain{};
  std::uint64_t nonce = 0;
  raw_bytes request_id;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & domain;
    ar & nonce;
    ar & request_id;
  }
};

struct execute_body
{
  crypto::digest domain{};
  std::uint64_t nonce = 0;
  raw_bytes request_id;
  execution_status status = execution_status::unexecuted;
  std::optional< raw_bytes > public_values_hash;
  std::optional< std::uint64_t > pgus;
  std::optional< numeric::uint256 > punishment;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & domain;
    ar & nonce;
    ar & request_id;
    ar & status;
    ar & public_values_hash;
    ar & pgus;
    ar & punishment;
  }
};

struct fulfill_body
{
  crypto::digest domain{};
  std::uint64_t nonce = 0;
  raw_bytes request_id;
  raw_bytes proof;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & domain;
    ar & nonce;
    ar & request_id;
    ar & proof;
  }
};

// Digest that is signed for a body. The message type is committed first.
crypto::digest body_hash( const transfer_body& body ) noexcept;
crypto::digest body_hash( const withdraw_body& body ) noexcept;
crypto::digest body_hash( const delegate_body& body ) noexcept;
crypto::digest body_hash( const request_body& body ) noexcept;
crypto::digest body_hash( const bid_body& body ) noexcept;
crypto::digest body_hash( const settle_body& body ) noexcept;
crypto::digest body_hash( const execute_body& body ) noexcept;
crypto::digest body_hash( const fulfill_body& body ) noexcept;

// Identifier of a body as submitted by a particular signer.
crypto::digest hash_with_signer( const crypto::digest& body_digest, const address& signer ) noexcept;

template< typename Body >
crypto::digest hash_with_signer( const Body& body, const address& signer ) noexcept
{
  return hash_with_signer( body_hash( body ), signer );
}

template< typename Body >
struct signed_message
{
  Body body;
  crypto::public_key signer;
  crypto::signature signature{};

  // The signer's address, or nullopt when the signature does not cover the body.
  std::optional< address > verify() const
  {
    if( !signer.verify( signature, body_hash( body ) ) )
      return std::nullopt;

    return address_of( signer );
  }

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & body;
    ar & signer;
    ar & signature;
  }
};

template< typename Body >
signed_message< Body > sign( const crypto::secret_key& key, Body body )
{
  auto digest = body_hash( body );
  return signed_message< Body >{ .body      = std::move( body ),
                                 .signer    = key.public_key(),
                                 .signature = key.sign( digest ) };
}

/*
 * A signature by a request's designated verifier over a fulfillment id, standing in for
 * proof verification in the plonk and groth16 modes.
 */
struct attestation
{
  crypto::public_key signer;
  crypto::signature signature{};

  std::optional< address > verify( const crypto::digest& d ) const;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & signer;
    ar & signature;
  }
};

attestation attest( const crypto::secret_key& key, const crypto::digest& d );

} // namespace vapp::protocol
