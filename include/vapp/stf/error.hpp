#pragma once

#include <expected>
#include <system_error>

namespace vapp::stf {

enum class stf_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  unsupported_version,
  malformed_public_values,
  missing_prior_step,
  invalid_proof,
  state_root_mismatch,
  protocol_fee_mismatch,
  sequence_order_violation,
  status_monotonicity_violation,
  address_deserialization_failed,
  onchain_tx_out_of_order,
  block_number_out_of_order,
  log_index_out_of_order,
  insufficient_balance,
  invalid_signature,
  domain_mismatch,
  prover_does_not_exist,
  only_owner_can_delegate,
  only_account_can_withdraw,
  account_does_not_exist,
  request_id_mismatch,
  prover_delegated_signer_mismatch,
  prover_not_in_whitelist,
  auctioneer_mismatch,
  executor_mismatch,
  max_price_per_pgu_exceeded,
  missing_punishment,
  punishment_exceeds_max_cost,
  execution_failed,
  missing_fulfill,
  missing_public_values_hash,
  malformed_public_values_hash,
  public_values_hash_mismatch,
  unsupported_proof_mode,
  missing_verifier_signature,
  invalid_verifier_signature,
  missing_pgus_used,
  gas_limit_exceeded,
  root_mismatch,
  timestamp_out_of_order,
  empty_aggregation
};

const std::error_category& stf_category() noexcept;

std::error_code make_error_code( stf_errc e );

/*
 * Failure kinds that span categories. invalid_proof matches the invalid_proof codes of
 * the state, verifier and stf categories, so a host can test for any rejected proof
 * with a single comparison.
 */
enum class stf_condition : int // NOLINT(performance-enum-size)
{
  invalid_proof = 1
};

const std::error_category& stf_condition_category() noexcept;

std::error_condition make_error_condition( stf_condition c );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace vapp::stf

template<>
struct std::is_error_code_enum< vapp::stf::stf_errc >: public std::true_type
{};

template<>
struct std::is_error_condition_enum< vapp::stf::stf_condition >: public std::true_type
{};
