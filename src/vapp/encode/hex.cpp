#include <vapp/encode/hex.hpp>

#include <cstdint>

namespace vapp::encode {

namespace {

constexpr std::string_view hex_digits = "0123456789abcdef";
constexpr std::uint8_t hex_offset     = 10;
constexpr std::uint8_t nibble_bits    = 4;
constexpr std::uint8_t nibble_mask    = 0x0f;

result< std::uint8_t > nibble( char in ) noexcept
{
  if( in >= '0' && in <= '9' )
    return static_cast< std::uint8_t >( in - '0' );
  if( in >= 'a' && in <= 'f' )
    return static_cast< std::uint8_t >( in - 'a' + hex_offset );
  if( in >= 'A' && in <= 'F' )
    return static_cast< std::uint8_t >( in - 'A' + hex_offset );

  return std::unexpected( encode_errc::invalid_character );
}

} // namespace

std::string to_hex( std::span< const std::byte > s ) noexcept
{
  std::string encoded;
  encoded.reserve( 2 + s.size() * 2 );
  encoded += "0x";

  for( auto b: s )
  {
    auto value = std::to_integer< std::uint8_t >( b );
    encoded.push_back( hex_digits[ value >> nibble_bits ] );
    encoded.push_back( hex_digits[ value & nibble_mask ] );
  }

  return encoded;
}

result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept
{
  if( sv.starts_with( "0x" ) || sv.starts_with( "0X" ) )
    sv.remove_prefix( 2 );

  if( sv.size() % 2 != 0 )
    return std::unexpected( encode_errc::odd_length );

  std::vector< std::byte > bytes;
  bytes.reserve( sv.size() / 2 );

  for( std::size_t i = 0; i < sv.size(); i += 2 )
  {
    auto high = nibble( sv[ i ] );
    if( !high )
      return std::unexpected( high.error() );

    auto low = nibble( sv[ i + 1 ] );
    if( !low )
      return std::unexpected( low.error() );

    bytes.push_back( static_cast< std::byte >( *high << nibble_bits | *low ) );
  }

  return bytes;
}

} // namespace vapp::encode
