#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include <vapp/stf/error.hpp>
#include <vapp/stf/public_values.hpp>
#include <vapp/verifier/verifier.hpp>

namespace vapp::stf {

/*
 * Folds consecutive proven steps into one. Every step must verify under vk, each step
 * must start from the root the previous one ended at, and timestamps may not decrease.
 * The result spans the first old root to the last new root and carries every receipt
 * in order.
 */
result< step_public_values > aggregate( const verifier::vk_digest& vk,
                                        std::span< const std::vector< std::byte > > steps,
                                        const verifier::verifier& v );

} // namespace vapp::stf
