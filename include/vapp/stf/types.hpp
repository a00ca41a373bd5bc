#pragma once

#include <vapp/protocol/account.hpp>
#include <vapp/protocol/address.hpp>
#include <vapp/state/merkle_storage.hpp>
#include <vapp/state/proof.hpp>
#include <vapp/state/sparse_storage.hpp>
#include <vapp/state/vapp_state.hpp>

namespace vapp::stf {

using account_proof = state::merkle_proof< protocol::address, protocol::account >;
using request_proof = state::merkle_proof< protocol::request_id, bool >;

// State held by the sequencer, with every leaf materialized.
using full_state = state::vapp_state< state::merkle_storage< protocol::address, protocol::account >,
                                      state::merkle_storage< protocol::request_id, bool > >;

// State carried by a transition input, holding only the leaves a batch touches.
using sparse_state = state::vapp_state< state::sparse_storage< protocol::address, protocol::account >,
                                        state::sparse_storage< protocol::request_id, bool > >;

} // namespace vapp::stf
