#pragma once

#include <concepts>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include <vapp/crypto/hash.hpp>
#include <vapp/crypto/merkle_tree.hpp>
#include <vapp/numeric/checked.hpp>
#include <vapp/state/error.hpp>

namespace vapp::state {

using crypto::merkle_index;

/*
 * Maps a key onto its leaf position. Specializations provide a static index( key ) and
 * the tree width `bits`; two distinct keys of one type never share an index.
 */
template< typename K >
struct key_traits;

/*
 * Canonical byte encoding of a stored value. Only the hash of this encoding is
 * committed, so it must be deterministic across platforms.
 */
template< typename V >
struct leaf_codec;

template< typename K >
concept storage_key = std::totally_ordered< K > && std::copyable< K > && requires( const K& k ) {
  { key_traits< K >::index( k ) } -> std::same_as< merkle_index >;
  { key_traits< K >::bits } -> std::convertible_to< std::size_t >;
};

template< typename V >
concept storage_value = std::regular< V > && requires( const V& v ) {
  { leaf_codec< V >::encode( v ) } -> std::same_as< std::vector< std::byte > >;
};

template< typename S, typename K, typename V >
concept storage = storage_key< K > && storage_value< V > && std::default_initializable< S >
                  && requires( S& s, const S& cs, const K& k, const V& v ) {
                       { s.insert( k, v ) } -> std::same_as< result< void > >;
                       { s.remove( k ) } -> std::same_as< result< void > >;
                       { cs.get( k ) } -> std::same_as< result< std::optional< V > > >;
                       { *( *s.entry( k ) ) } -> std::same_as< V& >;
                     };

template< storage_key K >
merkle_index key_index( const K& key )
{
  return key_traits< K >::index( key );
}

template< storage_key K >
constexpr std::size_t key_bits() noexcept
{
  return key_traits< K >::bits;
}

// A value equal to V{} hashes to the empty leaf, exactly like an absent key.
template< storage_value V >
crypto::digest leaf_hash( const V& value )
{
  if( value == V{} )
    return crypto::digest{};

  auto bytes = leaf_codec< V >::encode( value );
  return crypto::hash( std::span< const std::byte >( bytes ) );
}

template< storage_value V >
crypto::digest leaf_hash( const std::optional< V >& value )
{
  return value ? leaf_hash( *value ) : crypto::digest{};
}

template<>
struct key_traits< numeric::uint256 >
{
  static constexpr std::size_t bits = 256;

  static merkle_index index( const numeric::uint256& key )
  {
    return key;
  }
};

template<>
struct leaf_codec< numeric::uint256 >
{
  static std::vector< std::byte > encode( const numeric::uint256& value )
  {
    auto bytes = numeric::to_bytes( value );
    return std::vector< std::byte >( bytes.begin(), bytes.end() );
  }
};

template<>
struct leaf_codec< bool >
{
  static std::vector< std::byte > encode( bool value )
  {
    return std::vector< std::byte >{ value ? std::byte{ 0x01 } : std::byte{ 0x00 } };
  }
};

} // namespace vapp::state
