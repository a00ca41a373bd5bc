#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <vapp/encode/error.hpp>

namespace vapp::encode {

/*
 * Hex encodes with a leading "0x". Decoding accepts the prefix as optional and either
 * letter case.
 */
std::string to_hex( std::span< const std::byte > s ) noexcept;
result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept;

template< std::size_t N >
result< std::array< std::byte, N > > from_hex( std::string_view sv ) noexcept
{
  auto bytes = from_hex( sv );
  if( !bytes )
    return std::unexpected( bytes.error() );

  if( bytes->size() != N )
    return std::unexpected( encode_errc::size_mismatch );

  std::array< std::byte, N > fixed{};
  std::ranges::copy( *bytes, fixed.begin() );
  return fixed;
}

} // namespace vapp::encode
