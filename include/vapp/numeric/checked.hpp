#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include <boost/multiprecision/cpp_int.hpp>

#include <vapp/numeric/error.hpp>

namespace vapp::numeric {

using uint256 = boost::multiprecision::uint256_t;

constexpr std::size_t uint256_length = 32;

using uint256_bytes = std::array< std::byte, uint256_length >;

/*
 * Checked operations over the ledger's monetary unit. Each operation returns the exact
 * result or numeric_errc::overflow, which also covers underflow and division by zero.
 */
result< uint256 > add( const uint256& a, const uint256& b );
result< uint256 > sub( const uint256& a, const uint256& b );
result< uint256 > mul( const uint256& a, const uint256& b );
result< uint256 > div( const uint256& a, const uint256& b );

// Successor of a counter, or numeric_errc::overflow at the largest value.
result< std::uint64_t > increment( std::uint64_t value );

// Big-endian, zero padded to 32 bytes.
uint256_bytes to_bytes( const uint256& value ) noexcept;
uint256 from_bytes( std::span< const std::byte > bytes ) noexcept;

} // namespace vapp::numeric
