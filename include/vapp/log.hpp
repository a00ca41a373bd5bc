#pragma once

#include <vapp/log/formatter.hpp>
#include <vapp/log/frontend.hpp>
#include <vapp/log/log.hpp>
