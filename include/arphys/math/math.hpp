#pragma once

/// @file math.hpp
/// @brief Umbrella header for arphys_math

#include "fwd.hpp"
#include "constants.hpp"
#include "types.hpp"
#include "vec.hpp"
#include "quat.hpp"
#include "mat.hpp"
#include "plane.hpp"
#include "bounds.hpp"
