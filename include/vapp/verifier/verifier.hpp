#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include <vapp/crypto/hash.hpp>
#include <vapp/verifier/error.hpp>

namespace vapp::verifier {

constexpr std::size_t vk_digest_words = 8;

using vk_digest = std::array< std::uint32_t, vk_digest_words >;
using pv_digest = std::array< std::byte, crypto::digest_length >;

/*
 * Checks that a proof exists for the program identified by vk over the public values
 * hashing to pv. The proof itself is supplied out of band by the proving environment.
 */
struct verifier
{
  verifier()                  = default;
  verifier( const verifier& ) = delete;
  verifier( verifier&& )      = delete;
  virtual ~verifier()         = default;

  verifier& operator=( const verifier& ) = delete;
  verifier& operator=( verifier&& )      = delete;

  virtual result< void > verify( const vk_digest& vk, const pv_digest& pv ) const = 0;
};

// Accepts everything. For hosts that execute outside the proving environment.
struct mock_verifier final: verifier
{
  result< void > verify( const vk_digest& vk, const pv_digest& pv ) const override;
};

struct reject_verifier final: verifier
{
  result< void > verify( const vk_digest& vk, const pv_digest& pv ) const override;
};

// Reads a 32 byte verifying key hash as eight big-endian words.
vk_digest to_vk_digest( const crypto::digest& bytes ) noexcept;
crypto::digest from_vk_digest( const vk_digest& words ) noexcept;

} // namespace vapp::verifier
