#pragma once

#include <map>
#include <optional>
#include <utility>

#include <vapp/crypto/merkle_tree.hpp>
#include <vapp/state/error.hpp>
#include <vapp/state/proof.hpp>
#include <vapp/state/storage.hpp>

namespace vapp::state {

/*
 * Fully materialized merkleized map. Values equal to V{} are not retained, so the root
 * only depends on the set of non-default entries. Every key handed to get(), entry(),
 * insert() or remove() is recorded in touched() until clear_touched().
 */
template< storage_key K, storage_value V >
class merkle_storage final
{
public:
  using key_type   = K;
  using value_type = V;
  using tree_type  = crypto::sparse_merkle_tree< key_bits< K >() >;
  using position   = typename tree_type::position;

  class entry_handle final
  {
  public:
    entry_handle( merkle_storage& storage, const position& pos ):
        _storage( &storage ),
        _position( pos ),
        _value( storage.get_or_default( pos.index() ) )
    {}

    entry_handle( const entry_handle& )            = delete;
    entry_handle& operator=( const entry_handle& ) = delete;

    entry_handle( entry_handle&& other ) noexcept:
        _storage( std::exchange( other._storage, nullptr ) ),
        _position( std::move( other._position ) ),
        _value( std::move( other._value ) )
    {}

    entry_handle& operator=( entry_handle&& ) = delete;

    ~entry_handle()
    {
      if( _storage )
        _storage->write( _position, _value );
    }

    V& operator*() noexcept
    {
      return _value;
    }

    V* operator->() noexcept
    {
      return &_value;
    }

  private:
    merkle_storage* _storage;
    position _position;
    V _value;
  };

  merkle_storage() = default;

  result< void > insert( const K& key, const V& value )
  {
    touch( key );

    auto pos = _tree.locate( key_index( key ) );
    if( !pos )
      return std::unexpected( pos.error() );

    write( *pos, value );
    return {};
  }

  result< void > remove( const K& key )
  {
    return insert( key, V{} );
  }

  result< std::optional< V > > get( const K& key ) const
  {
    touch( key );
    if( auto itr = _values.find( key_index( key ) ); itr != _values.end() )
      return itr->second;

    return std::nullopt;
  }

  result< entry_handle > entry( const K& key )
  {
    touch( key );

    auto pos = _tree.locate( key_index( key ) );
    if( !pos )
      return std::unexpected( pos.error() );

    return entry_handle( *this, *pos );
  }

  const crypto::digest& root() const
  {
    return _tree.root();
  }

  merkle_proof< K, V > prove( const K& key ) const
  {
    merkle_proof< K, V > proof;
    proof.key = key;
    proof.path = _tree.path( key_index( key ) );

    if( auto itr = _values.find( key_index( key ) ); itr != _values.end() )
      proof.value = itr->second;

    return proof;
  }

  static bool verify( const merkle_proof< K, V >& proof, const crypto::digest& root, const K& key, const V& value )
  {
    if( proof.key != key || leaf_hash( proof.value ) != leaf_hash( value ) )
      return false;

    return verify_proof( root, proof ).has_value();
  }

  std::size_t size() const noexcept
  {
    return _values.size();
  }

  const std::map< merkle_index, V >& values() const noexcept
  {
    return _values;
  }

  const std::map< merkle_index, K >& touched() const noexcept
  {
    return _touched;
  }

  void clear_touched() noexcept
  {
    _touched.clear();
  }

private:
  void touch( const K& key ) const
  {
    _touched.emplace( key_index( key ), key );
  }

  V get_or_default( const merkle_index& index ) const
  {
    if( auto itr = _values.find( index ); itr != _values.end() )
      return itr->second;

    return V{};
  }

  void write( const position& pos, const V& value )
  {
    if( value == V{} )
      _values.erase( pos.index() );
    else
      _values.insert_or_assign( pos.index(), value );

    _tree.update( pos, leaf_hash( value ) );
  }

  std::map< merkle_index, V > _values;
  tree_type _tree;
  mutable std::map< merkle_index, K > _touched;
};

} // namespace vapp::state
