#pragma once

#include <vapp/memory/memory.hpp>
