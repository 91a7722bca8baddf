#pragma once

#include <string>

namespace rotorlink {

/**
 * @brief DOF model of a coupling element
 *
 * - FourDoF: 4 DOFs per node [UX, UY, RX, RY], planar bending only
 * - SixDoF: 6 DOFs per node [UX, UY, UZ, RX, RY, RZ], adds axial and torsion
 *
 * The shaft axis is z in both models.
 */
enum class CouplingDofModel {
    FourDoF = 4,  ///< Lateral translations and tilts
    SixDoF = 6    ///< Lateral, axial, tilt and torsional DOFs
};

/**
 * @brief End node of a coupling element
 */
enum class Station {
    Left = 0,   ///< Node n_l
    Right = 1   ///< Node n_r = n_l + 1
};

/**
 * @brief Physical channel connecting the two stations
 *
 * Each channel is one direction of motion that exists at both stations.
 * Stiffness and damping act independently per channel.
 */
enum class Channel {
    TransX = 0,   ///< Translation in x
    TransY = 1,   ///< Translation in y
    Axial = 2,    ///< Translation in z (6-DOF only)
    RotX = 3,     ///< Rotation about x
    RotY = 4,     ///< Rotation about y
    Torsion = 5   ///< Rotation about z (6-DOF only)
};

/// All channels in storage order
constexpr Channel kAllChannels[] = {
    Channel::TransX, Channel::TransY, Channel::Axial,
    Channel::RotX, Channel::RotY, Channel::Torsion
};

/**
 * @brief Number of DOFs per node (4 or 6)
 */
int dofs_per_node(CouplingDofModel model);

/**
 * @brief Total element DOFs (8 or 12)
 */
int num_element_dofs(CouplingDofModel model);

/**
 * @brief Check if the model carries a channel
 * @return false for Axial and Torsion in the 4-DOF model
 */
bool has_channel(CouplingDofModel model, Channel channel);

/**
 * @brief Local DOF index of a channel within one node
 *
 * 4-DOF layout: [UX, UY, RX, RY]
 * 6-DOF layout: [UX, UY, UZ, RX, RY, RZ]
 *
 * @throws std::invalid_argument if the model does not carry the channel
 */
int local_dof(CouplingDofModel model, Channel channel);

/**
 * @brief Element DOF index (0 .. num_element_dofs - 1)
 *
 * Right-station DOFs follow the left-station DOFs.
 */
int element_dof(CouplingDofModel model, Station station, Channel channel);

/**
 * @brief Short display name ("4-DOF" / "6-DOF")
 */
std::string model_name(CouplingDofModel model);

/**
 * @brief Display name of a channel ("x", "y", "z", "rx", "ry", "rz")
 */
std::string channel_name(Channel channel);

} // namespace rotorlink
