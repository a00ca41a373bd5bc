#pragma once

#include <cstddef>
#include <map>
#include <span>
#include <utility>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

#include <vapp/crypto/error.hpp>
#include <vapp/crypto/hash.hpp>

namespace vapp::crypto {

using merkle_index = boost::multiprecision::uint256_t;

constexpr std::size_t max_merkle_depth = 256;

/*
 * Hash of an empty subtree whose leaves sit `level` layers below it. Level 0 is the
 * all-zero leaf that stands for an absent or default value.
 */
const digest& zero_hash( std::size_t level );

digest node_hash( const digest& left, const digest& right ) noexcept;

// Whether the node on the path of index at the given level is a right child.
bool is_right_child( const merkle_index& index, std::size_t level ) noexcept;

merkle_index sibling_index( const merkle_index& index, std::size_t level ) noexcept;

/*
 * Folds a leaf up its authentication path. path[ 0 ] is the sibling of the leaf and
 * path.back() the sibling of the root's child on the path.
 */
digest path_root( const merkle_index& index, const digest& leaf, std::span< const digest > path ) noexcept;

template< std::size_t Depth >
concept merkle_depth = ( Depth > 0 && Depth <= max_merkle_depth );

/*
 * Fixed-depth sparse merkle tree. Only nodes that differ from the empty subtree hash
 * of their level are held; an update rehashes the Depth nodes on one path.
 */
template< std::size_t Depth >
  requires merkle_depth< Depth >
class sparse_merkle_tree final
{
public:
  // A leaf index known to fit the tree. Only locate() hands these out.
  class position final
  {
  public:
    const merkle_index& index() const noexcept
    {
      return _index;
    }

  private:
    friend class sparse_merkle_tree;

    explicit position( const merkle_index& index ):
        _index( index )
    {}

    merkle_index _index;
  };

  static constexpr std::size_t depth() noexcept
  {
    return Depth;
  }

  const digest& root() const
  {
    return node( Depth, 0 );
  }

  const digest& leaf( const merkle_index& index ) const
  {
    return node( 0, index );
  }

  result< position > locate( const merkle_index& index ) const
  {
    if( boost::multiprecision::msb( index | 1 ) >= Depth )
      return std::unexpected( crypto_errc::index_out_of_bounds );

    return position( index );
  }

  void update( const position& pos, const digest& leaf )
  {
    set_node( 0, pos.index(), leaf );

    merkle_index current = pos.index();
    digest value         = leaf;

    for( std::size_t level = 0; level < Depth; ++level )
    {
      const auto& sibling = node( level, current ^ 1 );

      if( boost::multiprecision::bit_test( current, 0 ) )
        value = node_hash( sibling, value );
      else
        value = node_hash( value, sibling );

      current >>= 1;
      set_node( level + 1, current, value );
    }
  }

  result< void > update( const merkle_index& index, const digest& leaf )
  {
    auto pos = locate( index );
    if( !pos )
      return std::unexpected( pos.error() );

    update( *pos, leaf );
    return {};
  }

  std::vector< digest > path( const merkle_index& index ) const
  {
    std::vector< digest > siblings;
    siblings.reserve( Depth );

    for( std::size_t level = 0; level < Depth; ++level )
      siblings.push_back( node( level, sibling_index( index, level ) ) );

    return siblings;
  }

  // Non-default nodes currently held, leaves included.
  std::size_t size() const noexcept
  {
    return _nodes.size();
  }

private:
  using node_key = std::pair< std::size_t, merkle_index >;

  const digest& node( std::size_t level, const merkle_index& index ) const
  {
    if( auto itr = _nodes.find( node_key{ level, index } ); itr != _nodes.end() )
      return itr->second;

    return zero_hash( level );
  }

  void set_node( std::size_t level, const merkle_index& index, const digest& value )
  {
    if( value == zero_hash( level ) )
      _nodes.erase( node_key{ level, index } );
    else
      _nodes.insert_or_assign( node_key{ level, index }, value );
  }

  std::map< node_key, digest > _nodes;
};

} // namespace vapp::crypto
