#pragma once

#include <vapp/encode/error.hpp>
#include <vapp/encode/hex.hpp>
