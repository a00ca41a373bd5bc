#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include <boost/serialization/array.hpp>

#include <vapp/crypto/hash.hpp>
#include <vapp/crypto/public_key.hpp>
#include <vapp/state/storage.hpp>

namespace vapp::protocol {

constexpr std::size_t address_length    = 20;
constexpr std::size_t request_id_length = 32;

struct address
{
  std::array< std::byte, address_length > bytes{};

  auto operator<=>( const address& ) const = default;

  bool is_zero() const noexcept;
  std::vector< std::byte > raw() const;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & bytes;
  }
};

struct request_id
{
  std::array< std::byte, request_id_length > bytes{};

  auto operator<=>( const request_id& ) const = default;

  std::vector< std::byte > raw() const;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & bytes;
  }
};

// Both return nullopt unless the input has exactly the expected length.
std::optional< address > make_address( std::span< const std::byte > bytes ) noexcept;
std::optional< request_id > make_request_id( std::span< const std::byte > bytes ) noexcept;

request_id to_request_id( const crypto::digest& d ) noexcept;

// The trailing 20 bytes of the BLAKE3 hash of the key.
address address_of( const crypto::public_key& key ) noexcept;

} // namespace vapp::protocol

namespace vapp::state {

template<>
struct key_traits< protocol::address >
{
  static constexpr std::size_t bits = protocol::address_length * 8;

  static merkle_index index( const protocol::address& key );
};

// Only the leading 16 bytes address the leaf.
template<>
struct key_traits< protocol::request_id >
{
  static constexpr std::size_t bits = 128;

  static merkle_index index( const protocol::request_id& key );
};

} // namespace vapp::state
