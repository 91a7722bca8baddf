#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>

#include "rotorlink/dof_layout.hpp"
#include "rotorlink/coupling_element.hpp"
#include "rotorlink/coupling_patch.hpp"
#include "rotorlink/assembler.hpp"
#include "rotorlink/errors.hpp"
#include "rotorlink/warnings.hpp"
#include "rotorlink/logger.hpp"

namespace py = pybind11;

/**
 * rotorlink C++ Python bindings module.
 * Exposes the coupling elements and their assembly to Python.
 */
PYBIND11_MODULE(_rotorlink_cpp, m) {
    m.doc() = "rotorlink C++ core module - coupling elements for rotordynamic FE models";

    m.attr("__version__") = "0.1.0";

    // ========================================================================
    // DOF layout
    // ========================================================================

    py::enum_<rotorlink::CouplingDofModel>(m, "CouplingDofModel",
        "DOF model of a coupling element.\n\n"
        "- FourDoF: [x, y, rx, ry] per node (8×8 matrices)\n"
        "- SixDoF: [x, y, z, rx, ry, rz] per node (12×12 matrices)")
        .value("FourDoF", rotorlink::CouplingDofModel::FourDoF, "Lateral translations and tilts")
        .value("SixDoF", rotorlink::CouplingDofModel::SixDoF, "Adds axial and torsional DOFs")
        .export_values();

    py::enum_<rotorlink::Station>(m, "Station", "End node of a coupling element")
        .value("Left", rotorlink::Station::Left)
        .value("Right", rotorlink::Station::Right)
        .export_values();

    py::enum_<rotorlink::Channel>(m, "Channel",
        "Physical channel linking the two stations")
        .value("TransX", rotorlink::Channel::TransX, "Translation in x")
        .value("TransY", rotorlink::Channel::TransY, "Translation in y")
        .value("Axial", rotorlink::Channel::Axial, "Translation in z (6-DOF only)")
        .value("RotX", rotorlink::Channel::RotX, "Rotation about x")
        .value("RotY", rotorlink::Channel::RotY, "Rotation about y")
        .value("Torsion", rotorlink::Channel::Torsion, "Rotation about z (6-DOF only)")
        .export_values();

    py::enum_<rotorlink::MatrixKind>(m, "MatrixKind", "Element matrix type")
        .value("Mass", rotorlink::MatrixKind::Mass)
        .value("Stiffness", rotorlink::MatrixKind::Stiffness)
        .value("Damping", rotorlink::MatrixKind::Damping)
        .value("Gyroscopic", rotorlink::MatrixKind::Gyroscopic)
        .value("Stiffening", rotorlink::MatrixKind::Stiffening)
        .export_values();

    m.def("dofs_per_node", &rotorlink::dofs_per_node, py::arg("model"),
          "Number of DOFs per node (4 or 6)");
    m.def("num_element_dofs", &rotorlink::num_element_dofs, py::arg("model"),
          "Number of element DOFs (8 or 12)");
    m.def("element_dof", &rotorlink::element_dof,
          py::arg("model"), py::arg("station"), py::arg("channel"),
          "Element DOF index of a channel at a station");

    // ========================================================================
    // Errors and warnings
    // ========================================================================

    py::enum_<rotorlink::ErrorCode>(m, "ErrorCode", "Machine-readable error codes")
        .value("OK", rotorlink::ErrorCode::OK)
        .value("MISSING_PROPERTY", rotorlink::ErrorCode::MISSING_PROPERTY)
        .value("INVALID_PROPERTY", rotorlink::ErrorCode::INVALID_PROPERTY)
        .value("UNSUPPORTED_CHANNEL", rotorlink::ErrorCode::UNSUPPORTED_CHANNEL)
        .value("UNNUMBERED_ELEMENT", rotorlink::ErrorCode::UNNUMBERED_ELEMENT)
        .value("INVALID_NODE_REFERENCE", rotorlink::ErrorCode::INVALID_NODE_REFERENCE)
        .value("DOF_MODEL_MISMATCH", rotorlink::ErrorCode::DOF_MODEL_MISMATCH)
        .value("EMPTY_ASSEMBLY", rotorlink::ErrorCode::EMPTY_ASSEMBLY)
        .export_values();

    py::class_<rotorlink::RotorlinkError>(m, "RotorlinkError",
        "Structured error information with machine-readable code and diagnostics")
        .def(py::init<>(), "Create OK (no error) status")
        .def(py::init<rotorlink::ErrorCode, const std::string&>(),
             py::arg("code"), py::arg("message"))
        .def_readwrite("code", &rotorlink::RotorlinkError::code)
        .def_readwrite("message", &rotorlink::RotorlinkError::message)
        .def_readwrite("involved_elements", &rotorlink::RotorlinkError::involved_elements)
        .def_readwrite("involved_nodes", &rotorlink::RotorlinkError::involved_nodes)
        .def_readwrite("details", &rotorlink::RotorlinkError::details)
        .def_readwrite("suggestion", &rotorlink::RotorlinkError::suggestion)
        .def("is_ok", &rotorlink::RotorlinkError::is_ok)
        .def("is_error", &rotorlink::RotorlinkError::is_error)
        .def("code_string", &rotorlink::RotorlinkError::code_string)
        .def("to_string", &rotorlink::RotorlinkError::to_string)
        .def("__repr__", [](const rotorlink::RotorlinkError &e) {
            if (e.is_ok()) return std::string("<RotorlinkError OK>");
            return "<RotorlinkError " + e.code_string() + ": " + e.message + ">";
        })
        .def("__str__", &rotorlink::RotorlinkError::to_string)
        .def("__bool__", [](const rotorlink::RotorlinkError &e) {
            return e.is_error();  // True if error, False if OK
        });

    py::enum_<rotorlink::WarningCode>(m, "WarningCode", "Warning codes")
        .value("DIAMETRAL_INERTIA_DEFAULTED", rotorlink::WarningCode::DIAMETRAL_INERTIA_DEFAULTED)
        .value("NEGATIVE_INERTIA", rotorlink::WarningCode::NEGATIVE_INERTIA)
        .value("NEGATIVE_COEFFICIENT", rotorlink::WarningCode::NEGATIVE_COEFFICIENT)
        .export_values();

    py::enum_<rotorlink::WarningSeverity>(m, "WarningSeverity", "Warning severity levels")
        .value("Low", rotorlink::WarningSeverity::Low)
        .value("Medium", rotorlink::WarningSeverity::Medium)
        .value("High", rotorlink::WarningSeverity::High)
        .export_values();

    py::class_<rotorlink::RotorlinkWarning>(m, "RotorlinkWarning",
        "Structured warning for questionable coupling definitions")
        .def_readonly("code", &rotorlink::RotorlinkWarning::code)
        .def_readonly("severity", &rotorlink::RotorlinkWarning::severity)
        .def_readonly("message", &rotorlink::RotorlinkWarning::message)
        .def_readonly("details", &rotorlink::RotorlinkWarning::details)
        .def_readonly("suggestion", &rotorlink::RotorlinkWarning::suggestion)
        .def("to_string", &rotorlink::RotorlinkWarning::to_string)
        .def("__str__", &rotorlink::RotorlinkWarning::to_string);

    py::class_<rotorlink::WarningList>(m, "WarningList", "Collection of warnings")
        .def_readonly("warnings", &rotorlink::WarningList::warnings)
        .def("has_warnings", &rotorlink::WarningList::has_warnings)
        .def("count", &rotorlink::WarningList::count)
        .def("contains", &rotorlink::WarningList::contains, py::arg("code"))
        .def("summary", &rotorlink::WarningList::summary)
        .def("__len__", &rotorlink::WarningList::count);

    // ========================================================================
    // Coupling element
    // ========================================================================

    py::class_<rotorlink::CouplingProperties>(m, "CouplingProperties",
        "Physical properties of a coupling element (SI units).\n\n"
        "m_l, m_r, Ip_l and Ip_r are required. Id_l / Id_r default to Ip / 2.")
        .def(py::init<>())
        .def_readwrite("m_l", &rotorlink::CouplingProperties::m_l, "Left station mass [kg]")
        .def_readwrite("m_r", &rotorlink::CouplingProperties::m_r, "Right station mass [kg]")
        .def_readwrite("Ip_l", &rotorlink::CouplingProperties::Ip_l, "Left polar inertia [kg·m²]")
        .def_readwrite("Ip_r", &rotorlink::CouplingProperties::Ip_r, "Right polar inertia [kg·m²]")
        .def_readwrite("Id_l", &rotorlink::CouplingProperties::Id_l, "Left diametral inertia [kg·m²]")
        .def_readwrite("Id_r", &rotorlink::CouplingProperties::Id_r, "Right diametral inertia [kg·m²]")
        .def_readwrite("kt_x", &rotorlink::CouplingProperties::kt_x)
        .def_readwrite("kt_y", &rotorlink::CouplingProperties::kt_y)
        .def_readwrite("kt_z", &rotorlink::CouplingProperties::kt_z)
        .def_readwrite("kr_x", &rotorlink::CouplingProperties::kr_x)
        .def_readwrite("kr_y", &rotorlink::CouplingProperties::kr_y)
        .def_readwrite("kr_z", &rotorlink::CouplingProperties::kr_z)
        .def_readwrite("ct_x", &rotorlink::CouplingProperties::ct_x)
        .def_readwrite("ct_y", &rotorlink::CouplingProperties::ct_y)
        .def_readwrite("ct_z", &rotorlink::CouplingProperties::ct_z)
        .def_readwrite("cr_x", &rotorlink::CouplingProperties::cr_x)
        .def_readwrite("cr_y", &rotorlink::CouplingProperties::cr_y)
        .def_readwrite("cr_z", &rotorlink::CouplingProperties::cr_z)
        .def_readwrite("L", &rotorlink::CouplingProperties::L, "Element length [m]")
        .def_readwrite("n", &rotorlink::CouplingProperties::n, "Element number")
        .def_readwrite("tag", &rotorlink::CouplingProperties::tag)
        .def_readwrite("color", &rotorlink::CouplingProperties::color)
        .def("set_translational_stiffness", &rotorlink::CouplingProperties::set_translational_stiffness,
             py::arg("kx"), py::arg("ky"), py::arg("kz") = 0.0)
        .def("set_rotational_stiffness", &rotorlink::CouplingProperties::set_rotational_stiffness,
             py::arg("krx"), py::arg("kry"), py::arg("krz") = 0.0)
        .def("set_translational_damping", &rotorlink::CouplingProperties::set_translational_damping,
             py::arg("cx"), py::arg("cy"), py::arg("cz") = 0.0)
        .def("set_rotational_damping", &rotorlink::CouplingProperties::set_rotational_damping,
             py::arg("crx"), py::arg("cry"), py::arg("crz") = 0.0);

    py::class_<rotorlink::CouplingPatch>(m, "CouplingPatch",
        "Side-view drawing of a coupling (closed outline, mirrored about the axis)")
        .def_readonly("z", &rotorlink::CouplingPatch::z)
        .def_readonly("y", &rotorlink::CouplingPatch::y)
        .def_readonly("fill_color", &rotorlink::CouplingPatch::fill_color)
        .def_readonly("line_color", &rotorlink::CouplingPatch::line_color)
        .def_readonly("line_dash", &rotorlink::CouplingPatch::line_dash)
        .def_readonly("line_width", &rotorlink::CouplingPatch::line_width)
        .def_readonly("opacity", &rotorlink::CouplingPatch::opacity)
        .def_readonly("legend", &rotorlink::CouplingPatch::legend)
        .def_readonly("element_index", &rotorlink::CouplingPatch::element_index)
        .def_readonly("hover_text", &rotorlink::CouplingPatch::hover_text);

    m.def("make_coupling_patch", &rotorlink::make_coupling_patch,
          py::arg("position"), py::arg("length"), py::arg("color"),
          py::arg("index") = py::none(), py::arg("scale_factor") = 0.15,
          "Build the drawing of a coupling at an axial position");

    py::class_<rotorlink::CouplingElement>(m, "CouplingElement",
        "Coupling element joining two rotor shaft segments.\n\n"
        "Produces mass, stiffness, damping and gyroscopic matrices (and a\n"
        "zero stiffening matrix for the 6-DOF model).")
        .def(py::init<rotorlink::CouplingDofModel, const rotorlink::CouplingProperties&>(),
             py::arg("model"), py::arg("properties"))
        .def_static("validate_properties", &rotorlink::CouplingElement::validate_properties,
                    py::arg("model"), py::arg("properties"),
                    "Check properties without constructing")
        .def_property_readonly("dof_model", &rotorlink::CouplingElement::dof_model)
        .def("num_dofs", &rotorlink::CouplingElement::num_dofs)
        .def_property_readonly("n", &rotorlink::CouplingElement::n)
        .def_property_readonly("n_l", &rotorlink::CouplingElement::n_l)
        .def_property_readonly("n_r", &rotorlink::CouplingElement::n_r)
        .def("set_element_number", &rotorlink::CouplingElement::set_element_number, py::arg("n"))
        .def_property_readonly("m_l", &rotorlink::CouplingElement::m_l)
        .def_property_readonly("m_r", &rotorlink::CouplingElement::m_r)
        .def_property_readonly("m", &rotorlink::CouplingElement::total_mass)
        .def_property_readonly("Ip_l", &rotorlink::CouplingElement::Ip_l)
        .def_property_readonly("Ip_r", &rotorlink::CouplingElement::Ip_r)
        .def_property_readonly("Id_l", &rotorlink::CouplingElement::Id_l)
        .def_property_readonly("Id_r", &rotorlink::CouplingElement::Id_r)
        .def_property_readonly("Im", &rotorlink::CouplingElement::Im)
        .def_property_readonly("L", &rotorlink::CouplingElement::L)
        .def_property_readonly("tag", &rotorlink::CouplingElement::tag)
        .def_property_readonly("color", &rotorlink::CouplingElement::color)
        .def_property_readonly("beam_cg", &rotorlink::CouplingElement::beam_cg,
                               "Always None (not applicable to a coupling)")
        .def_property_readonly("slenderness_ratio", &rotorlink::CouplingElement::slenderness_ratio,
                               "Always None (not applicable to a coupling)")
        .def("properties", &rotorlink::CouplingElement::properties,
             py::return_value_policy::reference_internal)
        .def("warnings", &rotorlink::CouplingElement::warnings,
             py::return_value_policy::reference_internal)
        .def("channel_stiffness", &rotorlink::CouplingElement::channel_stiffness, py::arg("channel"))
        .def("channel_damping", &rotorlink::CouplingElement::channel_damping, py::arg("channel"))
        .def("M", &rotorlink::CouplingElement::mass_matrix, "Mass matrix")
        .def("K", &rotorlink::CouplingElement::stiffness_matrix, "Stiffness matrix")
        .def("C", &rotorlink::CouplingElement::damping_matrix, "Damping matrix")
        .def("G", &rotorlink::CouplingElement::gyroscopic_matrix, "Gyroscopic matrix")
        .def("Kst", &rotorlink::CouplingElement::stiffening_matrix,
             "Stiffening matrix (zero; 6-DOF model only)")
        .def("has_stiffening_matrix", &rotorlink::CouplingElement::has_stiffening_matrix)
        .def("matrix", &rotorlink::CouplingElement::matrix, py::arg("kind"))
        .def("patch", &rotorlink::CouplingElement::patch,
             py::arg("position"), py::arg("scale_factor") = 0.15)
        .def("__repr__", &rotorlink::CouplingElement::to_string);

    // ========================================================================
    // Assembly
    // ========================================================================

    py::class_<rotorlink::Assembler>(m, "Assembler",
        "Assembles rotor matrices from coupling element matrices")
        .def(py::init<rotorlink::CouplingDofModel, int>(),
             py::arg("model"), py::arg("num_nodes"))
        .def_static("number_elements", &rotorlink::Assembler::number_elements,
                    py::arg("elements"),
                    "Number unnumbered elements by their position in the list")
        .def("check_elements", &rotorlink::Assembler::check_elements, py::arg("elements"))
        .def("get_location_array", &rotorlink::Assembler::get_location_array, py::arg("element"))
        .def("assemble_mass", &rotorlink::Assembler::assemble_mass, py::arg("elements"))
        .def("assemble_stiffness", &rotorlink::Assembler::assemble_stiffness, py::arg("elements"))
        .def("assemble_damping", &rotorlink::Assembler::assemble_damping, py::arg("elements"))
        .def("assemble_gyroscopic", &rotorlink::Assembler::assemble_gyroscopic, py::arg("elements"))
        .def("assemble_stiffening", &rotorlink::Assembler::assemble_stiffening, py::arg("elements"))
        .def("compute_total_mass", &rotorlink::Assembler::compute_total_mass, py::arg("elements"))
        .def("total_dofs", &rotorlink::Assembler::total_dofs)
        .def("__repr__", [](const rotorlink::Assembler &asm_) {
            return "<Assembler total_dofs=" + std::to_string(asm_.total_dofs()) + ">";
        });

    // ========================================================================
    // Logging
    // ========================================================================

    py::enum_<rotorlink::Logger::Level>(m, "LogLevel", "Logger verbosity")
        .value("Trace", rotorlink::Logger::Level::Trace)
        .value("Debug", rotorlink::Logger::Level::Debug)
        .value("Info", rotorlink::Logger::Level::Info)
        .value("Warn", rotorlink::Logger::Level::Warn)
        .value("Error", rotorlink::Logger::Level::Error)
        .value("Critical", rotorlink::Logger::Level::Critical)
        .value("Off", rotorlink::Logger::Level::Off)
        .export_values();

    m.def("set_log_level", [](rotorlink::Logger::Level level) {
              rotorlink::Logger::instance().set_level(level);
          }, py::arg("level"), "Set the rotorlink log level");
}
