#pragma once

#include <cstdint>
#include <optional>
#include <span>

#include <vapp/protocol/transaction.hpp>
#include <vapp/stf/error.hpp>
#include <vapp/stf/input.hpp>
#include <vapp/stf/types.hpp>
#include <vapp/verifier/verifier.hpp>

namespace vapp::stf {

/*
 * Builds the transition input for a batch by dry running it on a copy of the full state.
 * Every key the batch reads or writes is snapshotted into the witness state together with
 * its proof against the current roots. Fails if the batch itself fails. The given state
 * is not modified.
 */
result< transition_input > make_input( const full_state& state,
                                       std::span< const protocol::transaction > transactions,
                                       std::uint64_t timestamp,
                                       const verifier::verifier& v,
                                       std::optional< prior_step > prior = std::nullopt );

} // namespace vapp::stf
