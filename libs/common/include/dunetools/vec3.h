#pragma once

#include <array>

namespace dunetools {

// Vec3 is a position (X, Y, Z) as read from the authoring scene.
// Coordinates keep full double precision end to end.
using Vec3 = std::array<double, 3>;

} // namespace dunetools
