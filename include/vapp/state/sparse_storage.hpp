#pragma once

#include <map>
#include <optional>
#include <set>
#include <span>

#include <boost/serialization/map.hpp>

#include <vapp/state/error.hpp>
#include <vapp/state/proof.hpp>
#include <vapp/state/storage.hpp>

namespace vapp::state {

/*
 * Witness storage holding only the leaves a batch reads or writes. Reading a key that
 * is neither stored nor covered by a verified proof fails with state_errc::missing_proof,
 * since its value cannot be known. Default values are retained so that writes back to
 * V{} still reach the new root.
 */
template< storage_key K, storage_value V >
class sparse_storage final
{
public:
  using key_type   = K;
  using value_type = V;

  class entry_handle final
  {
  public:
    explicit entry_handle( V& value ) noexcept:
        _value( &value )
    {}

    V& operator*() noexcept
    {
      return *_value;
    }

    V* operator->() noexcept
    {
      return _value;
    }

  private:
    V* _value;
  };

  sparse_storage() = default;

  result< void > insert( const K& key, const V& value )
  {
    _values.insert_or_assign( key_index( key ), value );
    return {};
  }

  result< void > remove( const K& key )
  {
    _values.insert_or_assign( key_index( key ), V{} );
    return {};
  }

  result< std::optional< V > > get( const K& key ) const
  {
    auto index = key_index( key );

    if( auto itr = _values.find( index ); itr != _values.end() )
    {
      if( itr->second == V{} )
        return std::nullopt;

      return itr->second;
    }

    if( !_witnessed.contains( index ) )
      return std::unexpected( state_errc::missing_proof );

    return std::nullopt;
  }

  result< entry_handle > entry( const K& key )
  {
    auto index = key_index( key );

    auto itr = _values.find( index );
    if( itr == _values.end() )
    {
      if( !_witnessed.contains( index ) )
        return std::unexpected( state_errc::missing_proof );

      itr = _values.emplace( index, V{} ).first;
    }

    return entry_handle( itr->second );
  }

  /*
   * Checks the stored leaves against root. Every stored value needs a proof carrying the
   * same value, proofs for keys that are not stored must prove absence, and all proofs
   * must authenticate. On success the proven keys become readable.
   */
  result< void > verify( const crypto::digest& root, std::span< const merkle_proof< K, V > > proofs )
  {
    std::map< merkle_index, const merkle_proof< K, V >* > by_index;
    for( const auto& proof: proofs )
      by_index.emplace( key_index( proof.key ), &proof );

    for( const auto& [ index, value ]: _values )
    {
      auto itr = by_index.find( index );
      if( itr == by_index.end() )
        return std::unexpected( state_errc::missing_proof );

      if( itr->second->value.value_or( V{} ) != value )
        return std::unexpected( state_errc::proof_value_mismatch );

      if( auto verified = verify_proof( root, *itr->second ); !verified )
        return std::unexpected( verified.error() );
    }

    for( const auto& proof: proofs )
    {
      auto index = key_index( proof.key );
      if( _values.contains( index ) )
        continue;

      if( proof.value )
        return std::unexpected( state_errc::unexpected_proof_value );

      if( auto verified = verify_proof( root, proof ); !verified )
        return std::unexpected( verified.error() );
    }

    for( const auto& [ index, proof ]: by_index )
      _witnessed.insert( index );

    return {};
  }

  const std::map< merkle_index, V >& values() const noexcept
  {
    return _values;
  }

  bool empty() const noexcept
  {
    return _values.empty();
  }

  std::size_t size() const noexcept
  {
    return _values.size();
  }

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & _values;
  }

private:
  std::map< merkle_index, V > _values;
  std::set< merkle_index > _witnessed;
};

} // namespace vapp::state
