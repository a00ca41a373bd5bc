#pragma once

#include <vapp/crypto/error.hpp>
#include <vapp/crypto/hash.hpp>
#include <vapp/crypto/merkle_tree.hpp>
#include <vapp/crypto/public_key.hpp>
#include <vapp/crypto/secret_key.hpp>
