#pragma once

#include <vapp/verifier/error.hpp>
#include <vapp/verifier/verifier.hpp>
