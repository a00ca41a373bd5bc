#pragma once

#include <expected>
#include <system_error>

namespace vapp::state {

enum class state_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_proof,
  invalid_proof_length,
  missing_proof,
  proof_value_mismatch,
  unexpected_proof_value
};

const std::error_category& state_category() noexcept;

std::error_code make_error_code( state_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace vapp::state

template<>
struct std::is_error_code_enum< vapp::state::state_errc >: public std::true_type
{};
