#include "rotorlink/coupling_element.hpp"
#include "rotorlink/logger.hpp"
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace rotorlink {

void CouplingProperties::set_translational_stiffness(double kx, double ky, double kz) {
    kt_x = kx;
    kt_y = ky;
    kt_z = kz;
}

void CouplingProperties::set_rotational_stiffness(double krx, double kry, double krz) {
    kr_x = krx;
    kr_y = kry;
    kr_z = krz;
}

void CouplingProperties::set_translational_damping(double cx, double cy, double cz) {
    ct_x = cx;
    ct_y = cy;
    ct_z = cz;
}

void CouplingProperties::set_rotational_damping(double crx, double cry, double crz) {
    cr_x = crx;
    cr_y = cry;
    cr_z = crz;
}

namespace {

using NamedValue = std::pair<const char*, double>;

std::vector<NamedValue> coefficient_values(const CouplingProperties& p) {
    return {{"kt_x", p.kt_x}, {"kt_y", p.kt_y}, {"kt_z", p.kt_z},
            {"kr_x", p.kr_x}, {"kr_y", p.kr_y}, {"kr_z", p.kr_z},
            {"ct_x", p.ct_x}, {"ct_y", p.ct_y}, {"ct_z", p.ct_z},
            {"cr_x", p.cr_x}, {"cr_y", p.cr_y}, {"cr_z", p.cr_z}};
}

const char* const kElementNumberRange =
    "element number must be non-negative and below the largest int";

/// The right node n + 1 must still be representable
bool valid_element_number(int n) {
    return n >= 0 && n < std::numeric_limits<int>::max();
}

/// Id = Ip / 2 unless a non-zero value was given
double normalized_diametral(const std::optional<double>& Id, double Ip) {
    if (Id.has_value() && *Id != 0.0) {
        return *Id;
    }
    return Ip / 2.0;
}

} // namespace

RotorlinkError CouplingElement::validate_properties(CouplingDofModel model,
                                                    const CouplingProperties& props) {
    const std::pair<const char*, const std::optional<double>*> inertias[] = {
        {"m_l", &props.m_l}, {"m_r", &props.m_r},
        {"Ip_l", &props.Ip_l}, {"Ip_r", &props.Ip_r},
        {"Id_l", &props.Id_l}, {"Id_r", &props.Id_r}
    };

    // Required station properties (Id_l / Id_r have a default)
    for (int i = 0; i < 4; ++i) {
        if (!inertias[i].second->has_value()) {
            return RotorlinkError::missing_property(inertias[i].first);
        }
    }

    for (const auto& entry : inertias) {
        if (entry.second->has_value() && !std::isfinite(**entry.second)) {
            return RotorlinkError::invalid_property(entry.first, "value must be finite");
        }
    }

    for (const auto& entry : coefficient_values(props)) {
        if (!std::isfinite(entry.second)) {
            return RotorlinkError::invalid_property(entry.first, "value must be finite");
        }
    }

    if (props.L.has_value() && (!std::isfinite(*props.L) || *props.L < 0.0)) {
        return RotorlinkError::invalid_property("L", "length must be finite and non-negative");
    }

    if (props.n.has_value() && !valid_element_number(*props.n)) {
        return RotorlinkError::invalid_property("n", kElementNumberRange);
    }

    if (model == CouplingDofModel::FourDoF) {
        const NamedValue out_of_plane[] = {
            {"kt_z", props.kt_z}, {"kr_z", props.kr_z},
            {"ct_z", props.ct_z}, {"cr_z", props.cr_z}
        };
        for (const auto& entry : out_of_plane) {
            if (entry.second != 0.0) {
                return RotorlinkError::unsupported_channel(entry.first, model_name(model));
            }
        }
    }

    return RotorlinkError();
}

CouplingElement::CouplingElement(CouplingDofModel model, const CouplingProperties& props)
    : model_(model), props_(props) {
    RotorlinkError err = validate_properties(model, props);
    if (err.is_error()) {
        throw std::invalid_argument("CouplingElement: " + err.to_string());
    }

    // Diametral inertia defaults to half the polar inertia. A supplied zero
    // is indistinguishable from "not supplied" and is reported.
    if (props.Id_l.has_value() && *props.Id_l == 0.0) {
        warnings_.add(RotorlinkWarning::diametral_inertia_defaulted("Id_l", *props.Ip_l / 2.0));
    }
    if (props.Id_r.has_value() && *props.Id_r == 0.0) {
        warnings_.add(RotorlinkWarning::diametral_inertia_defaulted("Id_r", *props.Ip_r / 2.0));
    }
    props_.Id_l = normalized_diametral(props.Id_l, *props.Ip_l);
    props_.Id_r = normalized_diametral(props.Id_r, *props.Ip_r);

    const NamedValue inertias[] = {
        {"m_l", m_l()}, {"m_r", m_r()},
        {"Ip_l", Ip_l()}, {"Ip_r", Ip_r()},
        {"Id_l", Id_l()}, {"Id_r", Id_r()}
    };
    for (const auto& entry : inertias) {
        if (entry.second < 0.0) {
            warnings_.add(RotorlinkWarning::negative_inertia(entry.first, entry.second));
        }
    }

    for (const auto& entry : coefficient_values(props_)) {
        if (entry.second < 0.0) {
            warnings_.add(RotorlinkWarning::negative_coefficient(entry.first, entry.second));
        }
    }

    for (const auto& w : warnings_.warnings) {
        ROTORLINK_LOG_WARN("{}: {}", to_string(), w.to_string());
    }

    if (Logger::instance().get()->should_log(spdlog::level::debug)) {
        ROTORLINK_LOG_DEBUG("Created {} coupling: m={} Im={} ({})",
                            model_name(model_), total_mass(), Im(), warnings_.summary());
    }
}

std::optional<int> CouplingElement::n_r() const {
    if (!props_.n.has_value()) {
        return std::nullopt;
    }
    return *props_.n + 1;
}

void CouplingElement::set_element_number(int n) {
    if (!valid_element_number(n)) {
        throw std::invalid_argument("CouplingElement: " +
            RotorlinkError::invalid_property("n", kElementNumberRange).to_string());
    }
    props_.n = n;
}

double CouplingElement::channel_stiffness(Channel channel) const {
    if (!has_channel(model_, channel)) return 0.0;
    return props_.stiffness_coefficients()[static_cast<int>(channel)];
}

double CouplingElement::channel_damping(Channel channel) const {
    if (!has_channel(model_, channel)) return 0.0;
    return props_.damping_coefficients()[static_cast<int>(channel)];
}

Eigen::MatrixXd CouplingElement::mass_matrix() const {
    const int n_dofs = num_dofs();
    Eigen::MatrixXd M = Eigen::MatrixXd::Zero(n_dofs, n_dofs);

    struct StationInertia {
        Station station;
        double m;
        double Id;
        double Ip;
    };
    const StationInertia stations[] = {
        {Station::Left, m_l(), Id_l(), Ip_l()},
        {Station::Right, m_r(), Id_r(), Ip_r()}
    };

    for (const auto& st : stations) {
        const Station s = st.station;

        M(element_dof(model_, s, Channel::TransX), element_dof(model_, s, Channel::TransX)) = st.m;
        M(element_dof(model_, s, Channel::TransY), element_dof(model_, s, Channel::TransY)) = st.m;
        M(element_dof(model_, s, Channel::RotX), element_dof(model_, s, Channel::RotX)) = st.Id;
        M(element_dof(model_, s, Channel::RotY), element_dof(model_, s, Channel::RotY)) = st.Id;

        // Axial mass and torsional (polar) inertia
        if (model_ == CouplingDofModel::SixDoF) {
            M(element_dof(model_, s, Channel::Axial), element_dof(model_, s, Channel::Axial)) = st.m;
            M(element_dof(model_, s, Channel::Torsion), element_dof(model_, s, Channel::Torsion)) = st.Ip;
        }
    }

    return M;
}

Eigen::MatrixXd CouplingElement::channel_matrix(const std::array<double, 6>& coefficients) const {
    const int n_dofs = num_dofs();
    Eigen::MatrixXd K = Eigen::MatrixXd::Zero(n_dofs, n_dofs);

    // For each channel (left dof i, right dof j):
    //   K(i,i) = K(j,j) = +c
    //   K(i,j) = K(j,i) = -c
    for (Channel channel : kAllChannels) {
        if (!has_channel(model_, channel)) continue;

        const double c = coefficients[static_cast<int>(channel)];
        const int i = element_dof(model_, Station::Left, channel);
        const int j = element_dof(model_, Station::Right, channel);

        K(i, i) = c;
        K(i, j) = -c;
        K(j, i) = -c;
        K(j, j) = c;
    }

    return K;
}

Eigen::MatrixXd CouplingElement::stiffness_matrix() const {
    return channel_matrix(props_.stiffness_coefficients());
}

Eigen::MatrixXd CouplingElement::damping_matrix() const {
    return channel_matrix(props_.damping_coefficients());
}

Eigen::MatrixXd CouplingElement::gyroscopic_matrix() const {
    const int n_dofs = num_dofs();
    Eigen::MatrixXd G = Eigen::MatrixXd::Zero(n_dofs, n_dofs);

    const std::pair<Station, double> stations[] = {
        {Station::Left, Ip_l()},
        {Station::Right, Ip_r()}
    };

    for (const auto& station : stations) {
        const int rx = element_dof(model_, station.first, Channel::RotX);
        const int ry = element_dof(model_, station.first, Channel::RotY);
        G(ry, rx) = station.second;
        G(rx, ry) = -station.second;
    }

    return G;
}

Eigen::MatrixXd CouplingElement::stiffening_matrix() const {
    if (!has_stiffening_matrix()) {
        throw std::logic_error("CouplingElement: Stiffening matrix is only defined for the 6-DOF model");
    }
    return Eigen::MatrixXd::Zero(num_dofs(), num_dofs());
}

Eigen::MatrixXd CouplingElement::matrix(MatrixKind kind) const {
    switch (kind) {
        case MatrixKind::Mass: return mass_matrix();
        case MatrixKind::Stiffness: return stiffness_matrix();
        case MatrixKind::Damping: return damping_matrix();
        case MatrixKind::Gyroscopic: return gyroscopic_matrix();
        case MatrixKind::Stiffening: return stiffening_matrix();
    }
    throw std::invalid_argument("CouplingElement: Unknown matrix kind");
}

CouplingPatch CouplingElement::patch(double position, double scale_factor) const {
    if (!props_.L.has_value()) {
        throw std::logic_error("CouplingElement: Element length must be set to draw the element");
    }
    return make_coupling_patch(position, *props_.L, props_.color, props_.n, scale_factor);
}

std::string CouplingElement::to_string() const {
    std::ostringstream oss;
    oss << (model_ == CouplingDofModel::SixDoF ? "CouplingElement6DoF" : "CouplingElement");
    oss << "(L=";
    if (props_.L.has_value()) {
        oss.precision(5);
        oss << *props_.L;
    } else {
        oss << "None";
    }
    oss << ", n=";
    if (props_.n.has_value()) {
        oss << *props_.n;
    } else {
        oss << "None";
    }
    oss << ")";
    return oss.str();
}

} // namespace rotorlink
