#pragma once

#include "rotorlink/dof_layout.hpp"
#include "rotorlink/coupling_patch.hpp"
#include "rotorlink/errors.hpp"
#include "rotorlink/warnings.hpp"
#include <Eigen/Dense>
#include <array>
#include <optional>
#include <string>

namespace rotorlink {

/**
 * @brief Matrix produced by an element
 *
 * Stiffening is only defined for the 6-DOF model.
 */
enum class MatrixKind {
    Mass,
    Stiffness,
    Damping,
    Gyroscopic,
    Stiffening
};

/**
 * @brief Input properties of a coupling element
 *
 * All values in consistent SI units. Station masses and polar inertias
 * are required; everything else has a default:
 * - Id_l / Id_r: Ip / 2 when not given (or given as exactly zero)
 * - stiffness and damping coefficients: 0 (uncoupled channel)
 *
 * Axial (kt_z, ct_z) and torsional (kr_z, cr_z) coefficients are only
 * accepted by the 6-DOF model.
 *
 * Usage:
 *   CouplingProperties props;
 *   props.m_l = 151.55;
 *   props.m_r = 151.55;
 *   props.Ip_l = 1.2;
 *   props.Ip_r = 1.2;
 *   props.set_translational_stiffness(1e6, 2e6);
 *   CouplingElement coupling(CouplingDofModel::FourDoF, props);
 */
struct CouplingProperties {
    std::optional<double> m_l;   ///< Mass of the left station [kg]
    std::optional<double> m_r;   ///< Mass of the right station [kg]
    std::optional<double> Ip_l;  ///< Polar moment of inertia, left station [kg·m²]
    std::optional<double> Ip_r;  ///< Polar moment of inertia, right station [kg·m²]
    std::optional<double> Id_l;  ///< Diametral moment of inertia, left station [kg·m²]
    std::optional<double> Id_r;  ///< Diametral moment of inertia, right station [kg·m²]

    // Translational stiffness [N/m]
    double kt_x = 0.0;  ///< Stiffness in x
    double kt_y = 0.0;  ///< Stiffness in y
    double kt_z = 0.0;  ///< Axial stiffness (6-DOF only)

    // Rotational stiffness [N·m/rad]
    double kr_x = 0.0;  ///< Rotational stiffness about x
    double kr_y = 0.0;  ///< Rotational stiffness about y
    double kr_z = 0.0;  ///< Torsional stiffness (6-DOF only)

    // Translational damping [N·s/m]
    double ct_x = 0.0;  ///< Damping in x
    double ct_y = 0.0;  ///< Damping in y
    double ct_z = 0.0;  ///< Axial damping (6-DOF only)

    // Rotational damping [N·m·s/rad]
    double cr_x = 0.0;  ///< Rotational damping about x
    double cr_y = 0.0;  ///< Rotational damping about y
    double cr_z = 0.0;  ///< Torsional damping (6-DOF only)

    std::optional<double> L;          ///< Element length [m]
    std::optional<int> n;             ///< Element number (= left node number)
    std::string tag;                  ///< Element name
    std::string color = "#add8e6";    ///< Fill color used when drawn

    void set_translational_stiffness(double kx, double ky, double kz = 0.0);
    void set_rotational_stiffness(double krx, double kry, double krz = 0.0);
    void set_translational_damping(double cx, double cy, double cz = 0.0);
    void set_rotational_damping(double crx, double cry, double crz = 0.0);

    /**
     * @brief Stiffness coefficients in channel order (x, y, z, rx, ry, rz)
     */
    std::array<double, 6> stiffness_coefficients() const {
        return {{kt_x, kt_y, kt_z, kr_x, kr_y, kr_z}};
    }

    /**
     * @brief Damping coefficients in channel order (x, y, z, rx, ry, rz)
     */
    std::array<double, 6> damping_coefficients() const {
        return {{ct_x, ct_y, ct_z, cr_x, cr_y, cr_z}};
    }
};

/**
 * @brief Coupling element joining two rotor shaft segments
 *
 * Lumped-parameter element between node n_l = n and node n_r = n + 1.
 * Each station carries its own mass and inertia; the stations are linked
 * by independent linear springs and dampers per channel.
 *
 * Matrix structure (per station block, 4-DOF [x, y, rx, ry]):
 *   M = diag(m, m, Id, Id)              (6-DOF: diag(m, m, m, Id, Id, Ip))
 *   G(ry, rx) = +Ip, G(rx, ry) = -Ip
 *
 * and for every channel with coefficient k (stiffness or damping):
 *   [+k  -k]   at (left dof, right dof)
 *   [-k  +k]
 *
 * Mass and gyroscopic matrices have no cross-station terms.
 *
 * Physical properties are fixed at construction; only the element number
 * may be assigned later (by the assembler).
 */
class CouplingElement {
public:
    /**
     * @brief Construct a coupling element
     * @param model DOF model (4-DOF or 6-DOF)
     * @param props Physical properties
     *
     * @throws std::invalid_argument if a required property is missing, a
     *         value is not finite, L or n is negative, n is INT_MAX, or an axial/torsional
     *         coefficient is non-zero for the 4-DOF model
     */
    CouplingElement(CouplingDofModel model, const CouplingProperties& props);

    /**
     * @brief Check properties without constructing
     * @return OK, or the first error construction would report
     */
    static RotorlinkError validate_properties(CouplingDofModel model,
                                              const CouplingProperties& props);

    CouplingDofModel dof_model() const { return model_; }

    /**
     * @brief Get the number of DOFs for this element
     * @return 8 (4-DOF) or 12 (6-DOF)
     */
    int num_dofs() const { return num_element_dofs(model_); }

    int dofs_per_node() const { return rotorlink::dofs_per_node(model_); }

    // Element numbering
    std::optional<int> n() const { return props_.n; }
    std::optional<int> n_l() const { return props_.n; }

    /**
     * @brief Right node number (n + 1), absent until n is known
     */
    std::optional<int> n_r() const;

    /**
     * @brief Assign the element number (left node)
     * @throws std::invalid_argument if n is negative or n + 1 does not fit in an int
     */
    void set_element_number(int n);

    // Station properties (normalized)
    double m_l() const { return *props_.m_l; }
    double m_r() const { return *props_.m_r; }
    double Ip_l() const { return *props_.Ip_l; }
    double Ip_r() const { return *props_.Ip_r; }
    double Id_l() const { return *props_.Id_l; }
    double Id_r() const { return *props_.Id_r; }

    /**
     * @brief Total mass m_l + m_r
     */
    double total_mass() const { return m_l() + m_r(); }

    /**
     * @brief Combined diametral inertia Id_l + Id_r
     *
     * Used by rotor-level center-of-gravity estimates; not used by the
     * element matrices.
     */
    double Im() const { return Id_l() + Id_r(); }

    /**
     * @brief Coefficient of a channel
     * @return 0 for channels the model does not carry
     */
    double channel_stiffness(Channel channel) const;
    double channel_damping(Channel channel) const;

    std::optional<double> L() const { return props_.L; }
    const std::string& tag() const { return props_.tag; }
    const std::string& color() const { return props_.color; }

    /**
     * @brief Normalized properties (Id_l / Id_r always set)
     */
    const CouplingProperties& properties() const { return props_; }

    /**
     * @brief Warnings raised while normalizing the properties
     */
    const WarningList& warnings() const { return warnings_; }

    /**
     * @brief Beam center of gravity; not applicable to a coupling
     * @return Always std::nullopt
     */
    std::optional<double> beam_cg() const { return std::nullopt; }

    /**
     * @brief Beam slenderness ratio; not applicable to a coupling
     * @return Always std::nullopt
     */
    std::optional<double> slenderness_ratio() const { return std::nullopt; }

    /**
     * @brief Mass matrix (block diagonal, no cross-station terms)
     */
    Eigen::MatrixXd mass_matrix() const;

    /**
     * @brief Stiffness matrix ([+k -k; -k +k] per channel)
     */
    Eigen::MatrixXd stiffness_matrix() const;

    /**
     * @brief Damping matrix (same pattern as stiffness)
     */
    Eigen::MatrixXd damping_matrix() const;

    /**
     * @brief Gyroscopic matrix (skew-symmetric station blocks)
     *
     * Multiply by the spin speed before use in the equations of motion.
     */
    Eigen::MatrixXd gyroscopic_matrix() const;

    /**
     * @brief Stiffening matrix
     * @return 12×12 zero matrix; a coupling carries no centrifugal or
     *         geometric stiffening
     * @throws std::logic_error for the 4-DOF model
     */
    Eigen::MatrixXd stiffening_matrix() const;

    bool has_stiffening_matrix() const { return model_ == CouplingDofModel::SixDoF; }

    /**
     * @brief Matrix by kind, for callers that iterate over matrix types
     */
    Eigen::MatrixXd matrix(MatrixKind kind) const;

    /**
     * @brief Drawing of the element at the given axial position
     * @throws std::logic_error if the element length is not set
     */
    CouplingPatch patch(double position, double scale_factor = 0.15) const;

    /**
     * @brief Short description, e.g. "CouplingElement(L=0.25, n=3)"
     */
    std::string to_string() const;

private:
    CouplingDofModel model_;
    CouplingProperties props_;
    WarningList warnings_;

    /// [+c -c; -c +c] pattern for every channel of the model
    Eigen::MatrixXd channel_matrix(const std::array<double, 6>& coefficients) const;
};

} // namespace rotorlink
