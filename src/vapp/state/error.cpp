#include <vapp/state/error.hpp>

#include <string>
#include <utility>

namespace vapp::state {

struct _state_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "state";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< state_errc >( condition ) )
    {
      case state_errc::ok:
        return "ok"s;
      case state_errc::invalid_proof:
        return "merkle proof does not authenticate against the root"s;
      case state_errc::invalid_proof_length:
        return "merkle proof path length does not match the key width"s;
      case state_errc::missing_proof:
        return "no merkle proof for the accessed key"s;
      case state_errc::proof_value_mismatch:
        return "merkle proof value differs from the stored value"s;
      case state_errc::unexpected_proof_value:
        return "merkle proof carries a value for a key that is not stored"s;
    }
    std::unreachable();
  }
};

const std::error_category& state_category() noexcept
{
  static _state_category category;
  return category;
}

std::error_code make_error_code( state_errc e )
{
  return std::error_code( static_cast< int >( e ), state_category() );
}

} // namespace vapp::state
