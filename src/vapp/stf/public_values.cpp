#include <vapp/stf/public_values.hpp>

namespace vapp::stf {

verifier::pv_digest public_values_digest( std::span< const std::byte > encoded ) noexcept
{
  return crypto::hash( encoded );
}

} // namespace vapp::stf
