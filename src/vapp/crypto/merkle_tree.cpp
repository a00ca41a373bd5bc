#include <vapp/crypto/merkle_tree.hpp>

#include <array>

namespace vapp::crypto {

namespace {

const std::array< digest, max_merkle_depth + 1 >& zero_hashes()
{
  static const auto hashes = []
  {
    std::array< digest, max_merkle_depth + 1 > zeros{};
    for( std::size_t level = 1; level < zeros.size(); ++level )
      zeros[ level ] = node_hash( zeros[ level - 1 ], zeros[ level - 1 ] );

    return zeros;
  }();

  return hashes;
}

} // namespace

const digest& zero_hash( std::size_t level )
{
  return zero_hashes().at( level );
}

digest node_hash( const digest& left, const digest& right ) noexcept
{
  return hasher().update( left ).update( right ).finalize();
}

bool is_right_child( const merkle_index& index, std::size_t level ) noexcept
{
  return boost::multiprecision::bit_test( index, static_cast< unsigned >( level ) );
}

merkle_index sibling_index( const merkle_index& index, std::size_t level ) noexcept
{
  return ( index >> level ) ^ 1;
}

digest path_root( const merkle_index& index, const digest& leaf, std::span< const digest > path ) noexcept
{
  digest current = leaf;

  for( std::size_t level = 0; level < path.size(); ++level )
  {
    if( is_right_child( index, level ) )
      current = node_hash( path[ level ], current );
    else
      current = node_hash( current, path[ level ] );
  }

  return current;
}

} // namespace vapp::crypto
