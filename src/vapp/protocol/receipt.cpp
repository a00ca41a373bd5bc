#include <vapp/protocol/receipt.hpp>

namespace vapp::protocol {

std::uint64_t onchain_tx_id( const receipt& r ) noexcept
{
  if( std::holds_alternative< onchain_receipt< deposit > >( r ) )
    return std::get< onchain_receipt< deposit > >( r ).onchain_tx_id;
  else if( std::holds_alternative< onchain_receipt< create_prover > >( r ) )
    return std::get< onchain_receipt< create_prover > >( r ).onchain_tx_id;

  return offchain_tx_id;
}

} // namespace vapp::protocol
