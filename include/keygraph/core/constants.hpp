#pragma once

#include <limits>

namespace keygraph::core {

// Engine distance for an unreachable target in a distance matrix.
inline constexpr double kInfDistance = std::numeric_limits<double>::infinity();

} // namespace keygraph::core
