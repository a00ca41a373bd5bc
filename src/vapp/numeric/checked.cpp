#include <vapp/numeric/checked.hpp>

#include <algorithm>
#include <iterator>
#include <limits>
#include <vector>

namespace vapp::numeric {

result< uint256 > add( const uint256& a, const uint256& b )
{
  if( std::numeric_limits< uint256 >::max() - a < b )
    return std::unexpected( numeric_errc::overflow );

  return a + b;
}

result< uint256 > sub( const uint256& a, const uint256& b )
{
  if( b > a )
    return std::unexpected( numeric_errc::overflow );

  return a - b;
}

result< uint256 > mul( const uint256& a, const uint256& b )
{
  if( a != 0 && b > std::numeric_limits< uint256 >::max() / a )
    return std::unexpected( numeric_errc::overflow );

  return a * b;
}

result< uint256 > div( const uint256& a, const uint256& b )
{
  if( b == 0 )
    return std::unexpected( numeric_errc::overflow );

  return a / b;
}

result< std::uint64_t > increment( std::uint64_t value )
{
  if( value == std::numeric_limits< std::uint64_t >::max() )
    return std::unexpected( numeric_errc::overflow );

  return value + 1;
}

uint256_bytes to_bytes( const uint256& value ) noexcept
{
  std::vector< unsigned char > exported;
  exported.reserve( uint256_length );
  boost::multiprecision::export_bits( value, std::back_inserter( exported ), 8 );

  uint256_bytes bytes{};
  auto count  = std::min( exported.size(), bytes.size() );
  auto offset = bytes.size() - count;

  for( std::size_t i = 0; i < count; ++i )
    bytes[ offset + i ] = static_cast< std::byte >( exported[ exported.size() - count + i ] );

  return bytes;
}

uint256 from_bytes( std::span< const std::byte > bytes ) noexcept
{
  std::vector< unsigned char > imported;
  imported.reserve( bytes.size() );

  for( auto b: bytes )
    imported.push_back( static_cast< unsigned char >( b ) );

  uint256 value;
  if( !imported.empty() )
    boost::multiprecision::import_bits( value, imported.begin(), imported.end(), 8 );

  return value;
}

} // namespace vapp::numeric
