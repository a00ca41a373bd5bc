#pragma once

#include <vapp/stf/aggregate.hpp>
#include <vapp/stf/apply.hpp>
#include <vapp/stf/builder.hpp>
#include <vapp/stf/error.hpp>
#include <vapp/stf/execute.hpp>
#include <vapp/stf/input.hpp>
#include <vapp/stf/public_values.hpp>
#include <vapp/stf/types.hpp>
