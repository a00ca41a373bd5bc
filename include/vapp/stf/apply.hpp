#pragma once

#include <optional>

#include <vapp/crypto/hash.hpp>
#include <vapp/numeric/checked.hpp>
#include <vapp/stf/error.hpp>
#include <vapp/stf/input.hpp>
#include <vapp/verifier/verifier.hpp>

namespace vapp::stf {

// Parameters a host pins independently of the input it is handed.
struct apply_options
{
  bool require_prior_proof = false;
  std::optional< crypto::digest > domain;
  std::optional< numeric::uint256 > protocol_fee_bips;
};

/*
 * Runs one proven step. The prior step, the state root and every witness are checked
 * before any transaction executes, the batch runs against a copy of the witness state,
 * and the new roots are recomputed from the proofs. Any failure rejects the whole batch
 * and the input is left untouched.
 */
result< transition_output >
apply( const transition_input& input, const verifier::verifier& v, const apply_options& options = {} );

} // namespace vapp::stf
