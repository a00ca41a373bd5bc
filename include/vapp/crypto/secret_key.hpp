#pragma once

#include <array>
#include <cstddef>
#include <span>

#include <vapp/crypto/hash.hpp>
#include <vapp/crypto/public_key.hpp>

namespace vapp::crypto {

constexpr std::size_t secret_key_length = 64;

using secret_key_data = std::array< std::byte, secret_key_length >;

/*
 * Ed25519 signing key in libsodium's layout, the 32 byte seed followed by the public
 * key. Keys created from the same seed are identical, which the test fixtures and
 * tooling rely on to derive participants from names.
 */
class secret_key
{
public:
  secret_key() noexcept = default;

  bool operator==( const secret_key& ) const noexcept = default;

  static secret_key create();
  static secret_key create( const digest& seed );

  signature sign( std::span< const std::byte > message ) const;
  crypto::public_key public_key() const noexcept;
  const secret_key_data& bytes() const noexcept;

private:
  secret_key_data _secret_bytes{};
  public_key_data _public_bytes{};
};

} // namespace vapp::crypto
