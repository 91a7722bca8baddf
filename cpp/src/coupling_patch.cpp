#include "rotorlink/coupling_patch.hpp"
#include <cmath>
#include <stdexcept>

namespace rotorlink {

CouplingPatch make_coupling_patch(double position,
                                  double length,
                                  const std::string& color,
                                  std::optional<int> index,
                                  double scale_factor) {
    if (!std::isfinite(position)) {
        throw std::invalid_argument("CouplingPatch: Position must be finite");
    }
    if (!std::isfinite(length) || length < 0.0) {
        throw std::invalid_argument("CouplingPatch: Length must be finite and non-negative");
    }
    if (!std::isfinite(scale_factor) || scale_factor <= 0.0) {
        throw std::invalid_argument("CouplingPatch: Scale factor must be positive");
    }

    const double z0 = position;
    const double z1 = position + length;
    const double h = 2.0 * scale_factor;

    CouplingPatch patch;

    // Upper outline, then the same outline mirrored below the axis
    const double z_upper[5] = {z0, z0, z1, z1, z0};
    const double y_upper[5] = {0.0, h, h, 0.0, 0.0};

    patch.z.reserve(10);
    patch.y.reserve(10);
    for (int i = 0; i < 5; ++i) {
        patch.z.push_back(z_upper[i]);
        patch.y.push_back(y_upper[i]);
    }
    for (int i = 0; i < 5; ++i) {
        patch.z.push_back(z_upper[i]);
        patch.y.push_back(-y_upper[i]);
    }

    patch.fill_color = color;
    patch.element_index = index;
    patch.hover_text = "Element Number: " +
        (index.has_value() ? std::to_string(*index) : std::string("None"));

    return patch;
}

} // namespace rotorlink
