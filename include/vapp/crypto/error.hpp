#pragma once

#include <expected>
#include <system_error>

namespace vapp::crypto {

enum class crypto_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  index_out_of_bounds
};

const std::error_category& crypto_category() noexcept;

std::error_code make_error_code( crypto_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace vapp::crypto

template<>
struct std::is_error_code_enum< vapp::crypto::crypto_errc >: public std::true_type
{};
