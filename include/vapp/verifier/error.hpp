#pragma once

#include <expected>
#include <system_error>

namespace vapp::verifier {

enum class verifier_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_proof
};

const std::error_category& verifier_category() noexcept;

std::error_code make_error_code( verifier_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace vapp::verifier

template<>
struct std::is_error_code_enum< vapp::verifier::verifier_errc >: public std::true_type
{};
