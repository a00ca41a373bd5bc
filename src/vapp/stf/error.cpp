#include <vapp/stf/error.hpp>

#include <string>
#include <utility>

#include <vapp/state/error.hpp>
#include <vapp/verifier/error.hpp>

namespace vapp::stf {

struct _stf_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "stf";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< stf_errc >( condition ) )
    {
      case stf_errc::ok:
        return "ok"s;
      case stf_errc::unsupported_version:
        return "unsupported input version"s;
      case stf_errc::malformed_public_values:
        return "public values could not be decoded"s;
      case stf_errc::missing_prior_step:
        return "a prior step proof is required"s;
      case stf_errc::invalid_proof:
        return "invalid proof"s;
      case stf_errc::state_root_mismatch:
        return "state does not match the claimed root"s;
      case stf_errc::protocol_fee_mismatch:
        return "protocol fee differs from the configured value"s;
      case stf_errc::sequence_order_violation:
        return "transaction sequence numbers are not contiguous"s;
      case stf_errc::status_monotonicity_violation:
        return "transaction already processed"s;
      case stf_errc::address_deserialization_failed:
        return "address deserialization failed"s;
      case stf_errc::onchain_tx_out_of_order:
        return "on-chain transaction out of order"s;
      case stf_errc::block_number_out_of_order:
        return "block number out of order"s;
      case stf_errc::log_index_out_of_order:
        return "log index out of order"s;
      case stf_errc::insufficient_balance:
        return "insufficient balance"s;
      case stf_errc::invalid_signature:
        return "invalid signature"s;
      case stf_errc::domain_mismatch:
        return "domain mismatch"s;
      case stf_errc::prover_does_not_exist:
        return "prover does not exist"s;
      case stf_errc::only_owner_can_delegate:
        return "only the prover owner can delegate"s;
      case stf_errc::only_account_can_withdraw:
        return "only the account can withdraw"s;
      case stf_errc::account_does_not_exist:
        return "account does not exist"s;
      case stf_errc::request_id_mismatch:
        return "request id mismatch"s;
      case stf_errc::prover_delegated_signer_mismatch:
        return "bid not signed by the prover's delegated signer"s;
      case stf_errc::prover_not_in_whitelist:
        return "prover not in whitelist"s;
      case stf_errc::auctioneer_mismatch:
        return "settlement not signed by the request auctioneer"s;
      case stf_errc::executor_mismatch:
        return "execution not signed by the request executor"s;
      case stf_errc::max_price_per_pgu_exceeded:
        return "bid exceeds max price per pgu"s;
      case stf_errc::missing_punishment:
        return "missing punishment"s;
      case stf_errc::punishment_exceeds_max_cost:
        return "punishment exceeds max cost"s;
      case stf_errc::execution_failed:
        return "execution failed"s;
      case stf_errc::missing_fulfill:
        return "missing fulfillment"s;
      case stf_errc::missing_public_values_hash:
        return "missing public values hash"s;
      case stf_errc::malformed_public_values_hash:
        return "public values hash must be 32 bytes"s;
      case stf_errc::public_values_hash_mismatch:
        return "public values hash mismatch"s;
      case stf_errc::unsupported_proof_mode:
        return "unsupported proof mode"s;
      case stf_errc::missing_verifier_signature:
        return "missing verifier signature"s;
      case stf_errc::invalid_verifier_signature:
        return "invalid verifier signature"s;
      case stf_errc::missing_pgus_used:
        return "missing pgus used"s;
      case stf_errc::gas_limit_exceeded:
        return "gas limit exceeded"s;
      case stf_errc::root_mismatch:
        return "consecutive steps do not chain"s;
      case stf_errc::timestamp_out_of_order:
        return "timestamp out of order"s;
      case stf_errc::empty_aggregation:
        return "nothing to aggregate"s;
    }
    std::unreachable();
  }
};

const std::error_category& stf_category() noexcept
{
  static _stf_category category;
  return category;
}

std::error_code make_error_code( stf_errc e )
{
  return std::error_code( static_cast< int >( e ), stf_category() );
}

struct _stf_condition_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "stf condition";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< stf_condition >( condition ) )
    {
      case stf_condition::invalid_proof:
        return "invalid proof"s;
    }
    return "unknown condition"s;
  }

  bool equivalent( const std::error_code& code, int condition ) const noexcept final
  {
    switch( static_cast< stf_condition >( condition ) )
    {
      case stf_condition::invalid_proof:
        return code == state::state_errc::invalid_proof || code == verifier::verifier_errc::invalid_proof
               || code == stf_errc::invalid_proof;
    }
    return false;
  }
};

const std::error_category& stf_condition_category() noexcept
{
  static _stf_condition_category category;
  return category;
}

std::error_condition make_error_condition( stf_condition c )
{
  return std::error_condition( static_cast< int >( c ), stf_condition_category() );
}

} // namespace vapp::stf
