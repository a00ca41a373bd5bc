#pragma once

#include <optional>

#include <vapp/protocol/receipt.hpp>
#include <vapp/protocol/transaction.hpp>
#include <vapp/state/vapp_state.hpp>
#include <vapp/stf/error.hpp>
#include <vapp/stf/types.hpp>
#include <vapp/verifier/verifier.hpp>

namespace vapp::stf {

/*
 * Applies a single transaction to the state and advances tx_id. Returns the receipt the
 * settlement contract must act on, if any. On error the state may be partially written
 * and must be discarded by the caller.
 */
template< typename A, typename R >
result< std::optional< protocol::receipt > >
execute( state::vapp_state< A, R >& state, const protocol::transaction& tx, const verifier::verifier& v );

extern template result< std::optional< protocol::receipt > >
execute( full_state& state, const protocol::transaction& tx, const verifier::verifier& v );

extern template result< std::optional< protocol::receipt > >
execute( sparse_state& state, const protocol::transaction& tx, const verifier::verifier& v );

} // namespace vapp::stf
