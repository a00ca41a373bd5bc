#pragma once

#include <array>
#include <bit>
#include <cstddef>
#include <span>
#include <string_view>
#include <type_traits>

#include <blake3.h>

namespace vapp::crypto {

constexpr std::size_t digest_length = 32;

using digest = std::array< std::byte, digest_length >;

namespace detail {

template< typename T >
struct is_span: std::false_type
{};

template< typename T, std::size_t Extent >
struct is_span< std::span< T, Extent > >: std::true_type
{};

template< typename T >
concept hashable_object = std::is_trivially_copyable_v< T > && !std::is_integral_v< T > && !std::is_pointer_v< T >
                          && !is_span< T >::value;

} // namespace detail

/*
 * Incremental BLAKE3. Integers are absorbed little-endian, spans by their contents and
 * other trivially copyable objects by their object representation.
 */
class hasher
{
public:
  hasher() noexcept;

  hasher& update( const void* ptr, std::size_t len ) noexcept;
  hasher& update( std::string_view sv ) noexcept;
  hasher& update( const char* s ) noexcept;

  template< typename T, std::size_t Extent >
  hasher& update( std::span< T, Extent > s ) noexcept
  {
    return update( s.data(), s.size_bytes() );
  }

  template< typename T >
    requires std::is_integral_v< T >
  hasher& update( T t ) noexcept
  {
    if constexpr( std::endian::native != std::endian::little )
      t = std::byteswap( t );

    return update( &t, sizeof( T ) );
  }

  template< typename T >
    requires detail::hashable_object< T >
  hasher& update( const T& t ) noexcept
  {
    return update( &t, sizeof( T ) );
  }

  digest finalize() const noexcept;

private:
  blake3_hasher _state{};
};

digest hash( const void* ptr, std::size_t len ) noexcept;

template< typename T >
digest hash( const T& t ) noexcept
{
  return hasher().update( t ).finalize();
}

} // namespace vapp::crypto
