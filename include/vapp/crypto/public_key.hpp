#pragma once

#include <array>
#include <cstddef>
#include <span>

#include <vapp/crypto/hash.hpp>

namespace vapp::crypto {

constexpr std::size_t public_key_length = 32;
constexpr std::size_t signature_length  = 64;

using public_key_data = std::array< std::byte, public_key_length >;
using signature       = std::array< std::byte, signature_length >;

// Ed25519 verifying key. A default constructed key rejects every signature.
class public_key
{
public:
  public_key() noexcept = default;
  public_key( const public_key_data& bytes ) noexcept;

  bool operator==( const public_key& ) const noexcept = default;

  bool verify( const signature& sig, std::span< const std::byte > message ) const noexcept;
  const public_key_data& bytes() const noexcept;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & _bytes;
  }

private:
  public_key_data _bytes{};
};

namespace detail {

// Throws if libsodium cannot be initialized.
void initialize_sodium();

} // namespace detail

} // namespace vapp::crypto
