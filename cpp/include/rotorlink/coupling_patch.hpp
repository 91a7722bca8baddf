#pragma once

#include <optional>
#include <string>
#include <vector>

namespace rotorlink {

/**
 * @brief 2-D drawing of a coupling in the rotor side view
 *
 * A filled outline spanning the element length, mirrored about the
 * shaft axis. z runs along the shaft [m], y is the radial offset [m].
 * Both outlines are closed (first point repeated at the end).
 *
 * The patch is plain data; any plotting front end can draw it as a
 * filled, dashed polyline.
 */
struct CouplingPatch {
    std::vector<double> z;                ///< Axial coordinates of the outline
    std::vector<double> y;                ///< Radial coordinates of the outline
    std::string fill_color;               ///< Fill color of the patch
    std::string line_color = "black";     ///< Outline color
    std::string line_dash = "dash";       ///< Outline style
    double line_width = 1.5;              ///< Outline width
    double opacity = 0.5;                 ///< Fill opacity
    std::string legend = "Coupling";      ///< Legend group
    std::optional<int> element_index;     ///< Element number shown on hover
    std::string hover_text;               ///< "Element Number: <n>"
};

/**
 * @brief Build the patch for a coupling located at a shaft position
 *
 * Shared by the 4-DOF and 6-DOF couplings.
 *
 * @param position Axial position of the left station [m]
 * @param length Element length [m]
 * @param color Fill color
 * @param index Element number, if already assigned
 * @param scale_factor Outline reaches 2 * scale_factor above and below
 *        the axis, so it is 4 * scale_factor tall [m]
 * @return CouplingPatch with 10 outline points
 *
 * @throws std::invalid_argument for non-finite position, negative or
 *         non-finite length, or non-positive scale factor
 */
CouplingPatch make_coupling_patch(double position,
                                  double length,
                                  const std::string& color,
                                  std::optional<int> index,
                                  double scale_factor = 0.15);

} // namespace rotorlink
