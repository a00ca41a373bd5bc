#pragma once

#include <vapp/state/error.hpp>
#include <vapp/state/merkle_storage.hpp>
#include <vapp/state/proof.hpp>
#include <vapp/state/sparse_storage.hpp>
#include <vapp/state/storage.hpp>
#include <vapp/state/vapp_state.hpp>
