// include/padist/padist.hpp — Umbrella header that exposes padist components.

#pragma once

// Users should generally include only this file.

#include <padist/action/weight_k_action.hpp>
#include <padist/config.hpp>
#include <padist/core/arith.hpp>
#include <padist/core/matrix2.hpp>
#include <padist/core/padic_number.hpp>
#include <padist/core/sigma0.hpp>
#include <padist/dist/distribution.hpp>
#include <padist/dist/space.hpp>
#include <padist/errors.hpp>
#include <padist/io/format.hpp>
#include <padist/io/serialize.hpp>
#include <padist/util/debug.hpp>
#include <padist/util/random.hpp>
#include <padist/util/verbose.hpp>
