#pragma once

#include <map>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include <boost/serialization/array.hpp>
#include <boost/serialization/std_optional.hpp>
#include <boost/serialization/vector.hpp>

#include <vapp/crypto/merkle_tree.hpp>
#include <vapp/state/error.hpp>
#include <vapp/state/storage.hpp>

namespace vapp::state {

/*
 * Inclusion proof for one key. An empty value proves absence and is interchangeable
 * with a value of V{}.
 */
template< storage_key K, storage_value V >
struct merkle_proof
{
  K key{};
  std::optional< V > value;
  std::vector< crypto::digest > path;

  bool operator==( const merkle_proof& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & key;
    ar & value;
    ar & path;
  }
};

template< storage_key K, storage_value V >
result< void > verify_proof( const crypto::digest& root, const merkle_proof< K, V >& proof )
{
  if( proof.path.size() != key_bits< K >() )
    return std::unexpected( state_errc::invalid_proof_length );

  auto leaf = leaf_hash( proof.value );
  if( crypto::path_root( key_index( proof.key ), leaf, proof.path ) != root )
    return std::unexpected( state_errc::invalid_proof );

  return {};
}

/*
 * Computes the root that results from writing `updates` into the tree committed to by
 * old_root, using only the supplied proofs. Every proof must authenticate against
 * old_root and every updated index needs a proof. Siblings that are themselves updated
 * take their new value.
 */
template< storage_key K, storage_value V >
result< crypto::digest > compute_root( const crypto::digest& old_root,
                                       std::span< const merkle_proof< K, V > > proofs,
                                       const std::map< merkle_index, V >& updates )
{
  constexpr std::size_t depth = key_bits< K >();

  using node_key = std::pair< std::size_t, merkle_index >;
  std::map< node_key, crypto::digest > nodes;
  std::map< merkle_index, std::size_t > proof_indices;

  for( std::size_t i = 0; i < proofs.size(); ++i )
  {
    if( auto verified = verify_proof( old_root, proofs[ i ] ); !verified )
      return std::unexpected( verified.error() );

    auto index = key_index( proofs[ i ].key );
    proof_indices.emplace( index, i );

    nodes.insert_or_assign( node_key{ 0, index }, leaf_hash( proofs[ i ].value ) );
    for( std::size_t level = 0; level < depth; ++level )
      nodes.emplace( node_key{ level, crypto::sibling_index( index, level ) }, proofs[ i ].path[ level ] );
  }

  if( updates.empty() )
    return old_root;

  std::vector< merkle_index > dirty;
  dirty.reserve( updates.size() );

  for( const auto& [ index, value ]: updates )
  {
    if( !proof_indices.contains( index ) )
      return std::unexpected( state_errc::missing_proof );

    nodes.insert_or_assign( node_key{ 0, index }, leaf_hash( value ) );
    dirty.push_back( index );
  }

  for( std::size_t level = 0; level < depth; ++level )
  {
    std::vector< merkle_index > parents;
    parents.reserve( dirty.size() );

    for( const auto& index: dirty )
    {
      merkle_index parent = index >> 1;
      if( !parents.empty() && parents.back() == parent )
        continue;

      merkle_index left_index  = parent << 1;
      merkle_index right_index = left_index | 1;

      auto left  = nodes.find( node_key{ level, left_index } );
      auto right = nodes.find( node_key{ level, right_index } );
      if( left == nodes.end() || right == nodes.end() )
        return std::unexpected( state_errc::missing_proof );

      nodes.insert_or_assign( node_key{ level + 1, parent }, crypto::node_hash( left->second, right->second ) );
      parents.push_back( parent );
    }

    dirty = std::move( parents );
  }

  return nodes.at( node_key{ depth, 0 } );
}

} // namespace vapp::state
