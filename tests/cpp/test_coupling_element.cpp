/**
 * @file test_coupling_element.cpp
 * @brief C++ tests for the 4-DOF coupling element
 *
 * Tests include:
 * - Property normalization (diametral inertia default, warnings, errors)
 * - Mass, stiffness, damping and gyroscopic matrix structure
 * - Symmetry, zero cross-station inertia and channel independence
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "rotorlink/coupling_element.hpp"
#include "rotorlink/logger.hpp"

#include <Eigen/Dense>
#include <spdlog/sinks/ostream_sink.h>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

using namespace rotorlink;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::ContainsSubstring;

namespace {

/// m = 1, Ip = 2 at both stations, no stiffness or damping
CouplingProperties unit_properties() {
    CouplingProperties props;
    props.m_l = 1.0;
    props.m_r = 1.0;
    props.Ip_l = 2.0;
    props.Ip_r = 2.0;
    return props;
}

/// All lateral channels active with distinct values
CouplingProperties loaded_properties() {
    CouplingProperties props;
    props.m_l = 3.0;
    props.m_r = 4.0;
    props.Ip_l = 1.5;
    props.Ip_r = 2.5;
    props.Id_l = 0.8;
    props.Id_r = 1.1;
    props.set_translational_stiffness(1.0e6, 2.0e6);
    props.set_rotational_stiffness(3.0e4, 4.0e4);
    props.set_translational_damping(10.0, 20.0);
    props.set_rotational_damping(30.0, 40.0);
    return props;
}

void set_stiffness(CouplingProperties& props, Channel channel, double value) {
    switch (channel) {
        case Channel::TransX: props.kt_x = value; break;
        case Channel::TransY: props.kt_y = value; break;
        case Channel::Axial: props.kt_z = value; break;
        case Channel::RotX: props.kr_x = value; break;
        case Channel::RotY: props.kr_y = value; break;
        case Channel::Torsion: props.kr_z = value; break;
    }
}

void set_damping(CouplingProperties& props, Channel channel, double value) {
    switch (channel) {
        case Channel::TransX: props.ct_x = value; break;
        case Channel::TransY: props.ct_y = value; break;
        case Channel::Axial: props.ct_z = value; break;
        case Channel::RotX: props.cr_x = value; break;
        case Channel::RotY: props.cr_y = value; break;
        case Channel::Torsion: props.cr_z = value; break;
    }
}

long count_nonzeros(const Eigen::MatrixXd& A) {
    return (A.array() != 0.0).count();
}

const Channel kLateralChannels[] = {
    Channel::TransX, Channel::TransY, Channel::RotX, Channel::RotY
};

} // namespace

// =============================================================================
// Construction and property normalization
// =============================================================================

TEST_CASE("Diametral inertia defaults to half the polar inertia", "[CouplingElement][properties]") {
    CouplingProperties props = unit_properties();
    props.Ip_l = 3.0;
    props.Ip_r = 5.0;

    CouplingElement coupling(CouplingDofModel::FourDoF, props);

    REQUIRE_THAT(coupling.Id_l(), WithinAbs(1.5, 1e-15));
    REQUIRE_THAT(coupling.Id_r(), WithinAbs(2.5, 1e-15));
    REQUIRE(coupling.properties().Id_l.has_value());
    REQUIRE(coupling.properties().Id_r.has_value());
    REQUIRE_FALSE(coupling.warnings().has_warnings());
}

TEST_CASE("Explicit zero diametral inertia is replaced and flagged", "[CouplingElement][properties][warnings]") {
    CouplingProperties props = unit_properties();
    props.Id_l = 0.0;
    props.Id_r = 0.4;

    CouplingElement coupling(CouplingDofModel::FourDoF, props);

    REQUIRE_THAT(coupling.Id_l(), WithinAbs(1.0, 1e-15));
    REQUIRE_THAT(coupling.Id_r(), WithinAbs(0.4, 1e-15));
    REQUIRE(coupling.warnings().count() == 1);
    REQUIRE(coupling.warnings().contains(WarningCode::DIAMETRAL_INERTIA_DEFAULTED));
    REQUIRE(coupling.warnings().warnings[0].details.at("property") == "Id_l");
    REQUIRE(coupling.warnings().warnings[0].severity == WarningSeverity::Low);
}

TEST_CASE("Missing station mass or polar inertia fails construction", "[CouplingElement][errors]") {
    SECTION("Missing right mass") {
        CouplingProperties props = unit_properties();
        props.m_r.reset();

        REQUIRE_THROWS_AS(CouplingElement(CouplingDofModel::FourDoF, props), std::invalid_argument);

        RotorlinkError err = CouplingElement::validate_properties(CouplingDofModel::FourDoF, props);
        REQUIRE(err.code == ErrorCode::MISSING_PROPERTY);
        REQUIRE(err.details.at("property") == "m_r");
    }

    SECTION("Missing right polar inertia") {
        CouplingProperties props = unit_properties();
        props.Ip_r.reset();

        REQUIRE_THROWS_WITH(CouplingElement(CouplingDofModel::FourDoF, props),
                            ContainsSubstring("MISSING_PROPERTY") && ContainsSubstring("Ip_r"));
    }

    SECTION("Diametral inertia may be omitted") {
        CouplingProperties props = unit_properties();
        REQUIRE(CouplingElement::validate_properties(CouplingDofModel::FourDoF, props).is_ok());
        REQUIRE_NOTHROW(CouplingElement(CouplingDofModel::FourDoF, props));
    }
}

TEST_CASE("Non-finite and out-of-range values are rejected", "[CouplingElement][errors]") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    SECTION("NaN mass") {
        CouplingProperties props = unit_properties();
        props.m_l = nan;
        RotorlinkError err = CouplingElement::validate_properties(CouplingDofModel::FourDoF, props);
        REQUIRE(err.code == ErrorCode::INVALID_PROPERTY);
        REQUIRE_THROWS_AS(CouplingElement(CouplingDofModel::FourDoF, props), std::invalid_argument);
    }

    SECTION("Infinite stiffness") {
        CouplingProperties props = unit_properties();
        props.kr_y = inf;
        RotorlinkError err = CouplingElement::validate_properties(CouplingDofModel::FourDoF, props);
        REQUIRE(err.code == ErrorCode::INVALID_PROPERTY);
        REQUIRE(err.details.at("property") == "kr_y");
    }

    SECTION("Negative length") {
        CouplingProperties props = unit_properties();
        props.L = -0.1;
        REQUIRE_THROWS_AS(CouplingElement(CouplingDofModel::FourDoF, props), std::invalid_argument);
    }

    SECTION("Negative element number") {
        CouplingProperties props = unit_properties();
        props.n = -1;
        REQUIRE_THROWS_AS(CouplingElement(CouplingDofModel::FourDoF, props), std::invalid_argument);
    }
}

TEST_CASE("4-DOF coupling rejects axial and torsional coefficients", "[CouplingElement][errors]") {
    CouplingProperties props = unit_properties();
    props.kr_z = 100.0;

    RotorlinkError err = CouplingElement::validate_properties(CouplingDofModel::FourDoF, props);
    REQUIRE(err.code == ErrorCode::UNSUPPORTED_CHANNEL);
    REQUIRE(err.details.at("property") == "kr_z");
    REQUIRE_THROWS_AS(CouplingElement(CouplingDofModel::FourDoF, props), std::invalid_argument);

    // Same properties are valid for the 6-DOF model
    REQUIRE(CouplingElement::validate_properties(CouplingDofModel::SixDoF, props).is_ok());
}

TEST_CASE("Zero and negative coefficients do not fail construction", "[CouplingElement][properties][warnings]") {
    CouplingProperties props = unit_properties();
    props.kt_x = -5.0;
    props.cr_y = -1.0;

    CouplingElement coupling(CouplingDofModel::FourDoF, props);

    REQUIRE(coupling.warnings().count() == 2);
    REQUIRE(coupling.warnings().count_by_severity(WarningSeverity::Medium) == 2);
    REQUIRE(coupling.warnings().contains(WarningCode::NEGATIVE_COEFFICIENT));

    Eigen::MatrixXd K = coupling.stiffness_matrix();
    REQUIRE_THAT(K(0, 0), WithinAbs(-5.0, 1e-15));
    REQUIRE_THAT(K(0, 4), WithinAbs(5.0, 1e-15));
}

TEST_CASE("Negative station mass raises a high severity warning", "[CouplingElement][warnings]") {
    CouplingProperties props = unit_properties();
    props.m_r = -2.0;

    CouplingElement coupling(CouplingDofModel::FourDoF, props);

    REQUIRE(coupling.warnings().contains(WarningCode::NEGATIVE_INERTIA));
    REQUIRE(coupling.warnings().get_by_min_severity(WarningSeverity::High).size() == 1);
    REQUIRE_THAT(coupling.warnings().summary(), ContainsSubstring("1 high"));
}

TEST_CASE("Element numbering derives the right node", "[CouplingElement][numbering]") {
    SECTION("Unset element number") {
        CouplingElement coupling(CouplingDofModel::FourDoF, unit_properties());
        REQUIRE_FALSE(coupling.n().has_value());
        REQUIRE_FALSE(coupling.n_l().has_value());
        REQUIRE_FALSE(coupling.n_r().has_value());
    }

    SECTION("Element number given at construction") {
        CouplingProperties props = unit_properties();
        props.n = 3;
        CouplingElement coupling(CouplingDofModel::FourDoF, props);
        REQUIRE(*coupling.n_l() == 3);
        REQUIRE(*coupling.n_r() == 4);
    }

    SECTION("Element number assigned later") {
        CouplingElement coupling(CouplingDofModel::FourDoF, unit_properties());
        coupling.set_element_number(5);
        REQUIRE(*coupling.n() == 5);
        REQUIRE(*coupling.n_r() == 6);
        REQUIRE_THROWS_AS(coupling.set_element_number(-2), std::invalid_argument);
        REQUIRE(*coupling.n() == 5);
    }

    SECTION("Right node must fit in an int") {
        const int int_max = std::numeric_limits<int>::max();

        CouplingElement coupling(CouplingDofModel::FourDoF, unit_properties());
        REQUIRE_THROWS_AS(coupling.set_element_number(int_max), std::invalid_argument);
        REQUIRE_FALSE(coupling.n().has_value());

        coupling.set_element_number(int_max - 1);
        REQUIRE(*coupling.n_r() == int_max);

        CouplingProperties props = unit_properties();
        props.n = int_max;
        RotorlinkError err = CouplingElement::validate_properties(CouplingDofModel::FourDoF, props);
        REQUIRE(err.code == ErrorCode::INVALID_PROPERTY);
        REQUIRE(err.details.at("property") == "n");
        REQUIRE_THROWS_AS(CouplingElement(CouplingDofModel::SixDoF, props), std::invalid_argument);
    }
}

TEST_CASE("Aggregate attributes and beam placeholders", "[CouplingElement][properties]") {
    CouplingElement coupling(CouplingDofModel::FourDoF, loaded_properties());

    REQUIRE_THAT(coupling.total_mass(), WithinAbs(7.0, 1e-15));
    REQUIRE_THAT(coupling.Im(), WithinAbs(1.9, 1e-15));
    REQUIRE_FALSE(coupling.beam_cg().has_value());
    REQUIRE_FALSE(coupling.slenderness_ratio().has_value());
    REQUIRE(coupling.color() == "#add8e6");
}

TEST_CASE("String representation", "[CouplingElement]") {
    CouplingElement unnamed(CouplingDofModel::FourDoF, unit_properties());
    REQUIRE(unnamed.to_string() == "CouplingElement(L=None, n=None)");

    CouplingProperties props = unit_properties();
    props.L = 0.25;
    props.n = 2;
    CouplingElement placed(CouplingDofModel::FourDoF, props);
    REQUIRE(placed.to_string() == "CouplingElement(L=0.25, n=2)");
}

// =============================================================================
// Matrices
// =============================================================================

TEST_CASE("4-DOF matrices are 8x8", "[CouplingElement][dimensions]") {
    CouplingElement coupling(CouplingDofModel::FourDoF, loaded_properties());

    REQUIRE(coupling.num_dofs() == 8);
    REQUIRE(coupling.dofs_per_node() == 4);

    for (MatrixKind kind : {MatrixKind::Mass, MatrixKind::Stiffness,
                            MatrixKind::Damping, MatrixKind::Gyroscopic}) {
        Eigen::MatrixXd A = coupling.matrix(kind);
        REQUIRE(A.rows() == 8);
        REQUIRE(A.cols() == 8);
    }
}

TEST_CASE("Unit station scenario", "[CouplingElement][mass][gyroscopic]") {
    CouplingElement coupling(CouplingDofModel::FourDoF, unit_properties());

    SECTION("Mass matrix is the identity") {
        Eigen::MatrixXd M = coupling.mass_matrix();
        REQUIRE(M.isApprox(Eigen::MatrixXd::Identity(8, 8)));
    }

    SECTION("Stiffness and damping are zero") {
        REQUIRE(coupling.stiffness_matrix().isZero(0.0));
        REQUIRE(coupling.damping_matrix().isZero(0.0));
    }

    SECTION("Gyroscopic matrix couples the tilts of each station") {
        Eigen::MatrixXd G = coupling.gyroscopic_matrix();

        REQUIRE_THAT(G(2, 3), WithinAbs(-2.0, 1e-15));
        REQUIRE_THAT(G(3, 2), WithinAbs(2.0, 1e-15));
        REQUIRE_THAT(G(6, 7), WithinAbs(-2.0, 1e-15));
        REQUIRE_THAT(G(7, 6), WithinAbs(2.0, 1e-15));
        REQUIRE(count_nonzeros(G) == 4);
    }
}

TEST_CASE("Mass matrix carries station inertia on the diagonal", "[CouplingElement][mass]") {
    CouplingElement coupling(CouplingDofModel::FourDoF, loaded_properties());
    Eigen::MatrixXd M = coupling.mass_matrix();

    Eigen::VectorXd expected(8);
    expected << 3.0, 3.0, 0.8, 0.8, 4.0, 4.0, 1.1, 1.1;

    REQUIRE(M.diagonal().isApprox(expected));
    REQUIRE(count_nonzeros(M) == 8);
}

TEST_CASE("Single translational spring scenario", "[CouplingElement][stiffness]") {
    CouplingProperties props = unit_properties();
    props.kt_x = 5.0;

    CouplingElement coupling(CouplingDofModel::FourDoF, props);
    Eigen::MatrixXd K = coupling.stiffness_matrix();

    REQUIRE_THAT(K(0, 0), WithinAbs(5.0, 1e-15));
    REQUIRE_THAT(K(0, 4), WithinAbs(-5.0, 1e-15));
    REQUIRE_THAT(K(4, 0), WithinAbs(-5.0, 1e-15));
    REQUIRE_THAT(K(4, 4), WithinAbs(5.0, 1e-15));
    REQUIRE(count_nonzeros(K) == 4);
}

TEST_CASE("Damping uses its own coefficients with the stiffness pattern", "[CouplingElement][damping]") {
    CouplingProperties props = unit_properties();
    props.ct_y = 3.0;

    CouplingElement coupling(CouplingDofModel::FourDoF, props);
    Eigen::MatrixXd C = coupling.damping_matrix();

    REQUIRE(coupling.stiffness_matrix().isZero(0.0));
    REQUIRE_THAT(C(1, 1), WithinAbs(3.0, 1e-15));
    REQUIRE_THAT(C(1, 5), WithinAbs(-3.0, 1e-15));
    REQUIRE_THAT(C(5, 1), WithinAbs(-3.0, 1e-15));
    REQUIRE_THAT(C(5, 5), WithinAbs(3.0, 1e-15));
    REQUIRE(count_nonzeros(C) == 4);
    REQUIRE_THAT(coupling.channel_damping(Channel::TransY), WithinAbs(3.0, 1e-15));
}

TEST_CASE("Matrices are symmetric and gyroscopic is skew-symmetric", "[CouplingElement][symmetry]") {
    std::vector<CouplingProperties> cases = {unit_properties(), loaded_properties()};

    CouplingProperties negative = loaded_properties();
    negative.kt_y = -3.0e5;
    negative.cr_x = -2.0;
    cases.push_back(negative);

    CouplingProperties asymmetric = unit_properties();
    asymmetric.m_l = 120.0;
    asymmetric.Ip_r = 0.05;
    asymmetric.kr_x = 7.5e3;
    cases.push_back(asymmetric);

    for (const auto& props : cases) {
        CouplingElement coupling(CouplingDofModel::FourDoF, props);

        Eigen::MatrixXd M = coupling.mass_matrix();
        Eigen::MatrixXd K = coupling.stiffness_matrix();
        Eigen::MatrixXd C = coupling.damping_matrix();
        Eigen::MatrixXd G = coupling.gyroscopic_matrix();

        REQUIRE((M - M.transpose()).isZero(0.0));
        REQUIRE((K - K.transpose()).isZero(0.0));
        REQUIRE((C - C.transpose()).isZero(0.0));
        REQUIRE((G + G.transpose()).isZero(0.0));

        // No inertia shared between stations
        REQUIRE(M.topRightCorner(4, 4).isZero(0.0));
        REQUIRE(M.bottomLeftCorner(4, 4).isZero(0.0));
        REQUIRE(G.topRightCorner(4, 4).isZero(0.0));
        REQUIRE(G.bottomLeftCorner(4, 4).isZero(0.0));
    }
}

TEST_CASE("Stiffness cross-station blocks mirror the diagonal blocks", "[CouplingElement][stiffness]") {
    CouplingElement coupling(CouplingDofModel::FourDoF, loaded_properties());
    Eigen::MatrixXd K = coupling.stiffness_matrix();

    REQUIRE(K.topLeftCorner(4, 4).isApprox(K.bottomRightCorner(4, 4)));
    REQUIRE(K.topRightCorner(4, 4).isApprox(-K.topLeftCorner(4, 4)));

    // Rigid translation of both stations produces no force
    Eigen::VectorXd rigid = Eigen::VectorXd::Zero(8);
    rigid(0) = 1.0;
    rigid(4) = 1.0;
    REQUIRE((K * rigid).isZero(1e-9));
}

TEST_CASE("Zeroing one channel only clears that channel", "[CouplingElement][stiffness][damping]") {
    const CouplingProperties full = loaded_properties();
    CouplingElement reference(CouplingDofModel::FourDoF, full);
    const Eigen::MatrixXd K_full = reference.stiffness_matrix();
    const Eigen::MatrixXd C_full = reference.damping_matrix();

    for (Channel channel : kLateralChannels) {
        const int i = element_dof(CouplingDofModel::FourDoF, Station::Left, channel);
        const int j = element_dof(CouplingDofModel::FourDoF, Station::Right, channel);

        CouplingProperties props = full;
        set_stiffness(props, channel, 0.0);
        set_damping(props, channel, 0.0);
        CouplingElement coupling(CouplingDofModel::FourDoF, props);

        Eigen::MatrixXd K = coupling.stiffness_matrix();
        Eigen::MatrixXd C = coupling.damping_matrix();

        Eigen::MatrixXd K_expected = K_full;
        Eigen::MatrixXd C_expected = C_full;
        for (int a : {i, j}) {
            for (int b : {i, j}) {
                REQUIRE(K(a, b) == 0.0);
                REQUIRE(C(a, b) == 0.0);
                K_expected(a, b) = 0.0;
                C_expected(a, b) = 0.0;
            }
        }

        REQUIRE((K == K_expected));
        REQUIRE((C == C_expected));
    }
}

TEST_CASE("Gyroscopic matrix ignores stiffness and damping", "[CouplingElement][gyroscopic]") {
    CouplingProperties bare = loaded_properties();
    bare.set_translational_stiffness(0.0, 0.0);
    bare.set_rotational_stiffness(0.0, 0.0);
    bare.set_translational_damping(0.0, 0.0);
    bare.set_rotational_damping(0.0, 0.0);

    CouplingElement loaded(CouplingDofModel::FourDoF, loaded_properties());
    CouplingElement unloaded(CouplingDofModel::FourDoF, bare);

    REQUIRE((loaded.gyroscopic_matrix() == unloaded.gyroscopic_matrix()));
    REQUIRE((loaded.mass_matrix() == unloaded.mass_matrix()));
}

TEST_CASE("Stiffening matrix is not part of the 4-DOF model", "[CouplingElement][stiffening]") {
    CouplingElement coupling(CouplingDofModel::FourDoF, unit_properties());

    REQUIRE_FALSE(coupling.has_stiffening_matrix());
    REQUIRE_THROWS_AS(coupling.stiffening_matrix(), std::logic_error);
    REQUIRE_THROWS_AS(coupling.matrix(MatrixKind::Stiffening), std::logic_error);
}

TEST_CASE("Matrix dispatch matches the named operations", "[CouplingElement]") {
    CouplingElement coupling(CouplingDofModel::FourDoF, loaded_properties());

    REQUIRE((coupling.matrix(MatrixKind::Mass) == coupling.mass_matrix()));
    REQUIRE((coupling.matrix(MatrixKind::Stiffness) == coupling.stiffness_matrix()));
    REQUIRE((coupling.matrix(MatrixKind::Damping) == coupling.damping_matrix()));
    REQUIRE((coupling.matrix(MatrixKind::Gyroscopic) == coupling.gyroscopic_matrix()));
}

TEST_CASE("Logger level can be changed at runtime", "[Logger]") {
    Logger& logger = Logger::instance();
    const Logger::Level previous = logger.level();

    logger.set_level(Logger::Level::Debug);
    REQUIRE(logger.level() == Logger::Level::Debug);

    // Construction logs at debug level and must not interfere with the result
    CouplingElement coupling(CouplingDofModel::FourDoF, unit_properties());
    REQUIRE(coupling.num_dofs() == 8);

    logger.set_level(previous);
    REQUIRE(logger.level() == previous);
}

TEST_CASE("Construction summary is only logged at debug level", "[Logger]") {
    Logger& logger = Logger::instance();
    const Logger::Level previous = logger.level();

    std::ostringstream captured;
    auto capture_sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    auto& sinks = logger.get()->sinks();
    sinks.push_back(capture_sink);

    logger.set_level(Logger::Level::Warn);
    CouplingElement quiet(CouplingDofModel::FourDoF, unit_properties());
    REQUIRE(captured.str().find("Created 4-DOF coupling") == std::string::npos);

    logger.set_level(Logger::Level::Debug);
    CouplingElement traced(CouplingDofModel::FourDoF, unit_properties());
    REQUIRE_THAT(captured.str(), ContainsSubstring("Created 4-DOF coupling"));
    REQUIRE_THAT(captured.str(), ContainsSubstring("No warnings"));

    sinks.pop_back();
    logger.set_level(previous);
}
