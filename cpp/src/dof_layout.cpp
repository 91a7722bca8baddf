#include "rotorlink/dof_layout.hpp"
#include <stdexcept>

namespace rotorlink {

int dofs_per_node(CouplingDofModel model) {
    return static_cast<int>(model);
}

int num_element_dofs(CouplingDofModel model) {
    return 2 * dofs_per_node(model);
}

bool has_channel(CouplingDofModel model, Channel channel) {
    if (model == CouplingDofModel::SixDoF) return true;
    return channel != Channel::Axial && channel != Channel::Torsion;
}

int local_dof(CouplingDofModel model, Channel channel) {
    if (!has_channel(model, channel)) {
        throw std::invalid_argument("Channel '" + channel_name(channel) +
                                    "' is not part of the " + model_name(model) + " model");
    }

    if (model == CouplingDofModel::SixDoF) {
        // Channel order matches the 6-DOF node layout
        return static_cast<int>(channel);
    }

    switch (channel) {
        case Channel::TransX: return 0;
        case Channel::TransY: return 1;
        case Channel::RotX: return 2;
        case Channel::RotY: return 3;
        default: break;
    }
    throw std::invalid_argument("Unknown channel");
}

int element_dof(CouplingDofModel model, Station station, Channel channel) {
    int offset = (station == Station::Right) ? dofs_per_node(model) : 0;
    return offset + local_dof(model, channel);
}

std::string model_name(CouplingDofModel model) {
    return model == CouplingDofModel::SixDoF ? "6-DOF" : "4-DOF";
}

std::string channel_name(Channel channel) {
    switch (channel) {
        case Channel::TransX: return "x";
        case Channel::TransY: return "y";
        case Channel::Axial: return "z";
        case Channel::RotX: return "rx";
        case Channel::RotY: return "ry";
        case Channel::Torsion: return "rz";
    }
    return "unknown";
}

} // namespace rotorlink
