#pragma once

#include <vapp/config/error.hpp>
#include <vapp/config/options.hpp>
#include <vapp/config/stf_config.hpp>
