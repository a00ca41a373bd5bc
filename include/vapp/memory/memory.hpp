#pragma once

#include <cstddef>
#include <ranges>
#include <span>
#include <type_traits>

namespace vapp::memory {

template< typename T, typename U >
  requires( std::is_pointer_v< T > && std::is_trivially_copyable_v< std::remove_pointer_t< T > > )
T pointer_cast( U* p )
{
  return reinterpret_cast< T >( p ); // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
}

// libsodium and BLAKE3 take their buffers as unsigned char.
inline const unsigned char* c_bytes( std::span< const std::byte > bytes ) noexcept
{
  return pointer_cast< const unsigned char* >( bytes.data() );
}

inline unsigned char* c_writable_bytes( std::span< std::byte > bytes ) noexcept
{
  return pointer_cast< unsigned char* >( bytes.data() );
}

template< std::ranges::contiguous_range R >
  requires std::is_trivially_copyable_v< std::ranges::range_value_t< R > >
std::span< const std::byte > as_bytes( const R& r ) noexcept
{
  return std::as_bytes( std::span( std::ranges::data( r ), std::ranges::size( r ) ) );
}

} // namespace vapp::memory
