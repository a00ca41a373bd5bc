#pragma once

#include <vapp/numeric/checked.hpp>
#include <vapp/numeric/error.hpp>
#include <vapp/numeric/fee.hpp>
