/**
 * @file errors.hpp
 * @brief Structured error handling for rotorlink.
 *
 * This file defines error codes and error structures for reporting
 * invalid coupling definitions and assembly failures in a
 * machine-readable format.
 */

#ifndef ROTORLINK_ERRORS_HPP
#define ROTORLINK_ERRORS_HPP

#include <string>
#include <vector>
#include <map>

namespace rotorlink {

/**
 * @brief Error codes for rotorlink failures.
 *
 * These codes provide machine-readable error identification.
 * Each code corresponds to a specific type of failure.
 */
enum class ErrorCode {
    /// No error - element or assembly is valid
    OK = 0,

    // === Element Errors (200-299) ===

    /// Required physical property was not supplied
    MISSING_PROPERTY = 201,

    /// Property value is invalid (non-finite, negative length, ...)
    INVALID_PROPERTY = 202,

    /// Coefficient given for a channel the DOF model does not carry
    UNSUPPORTED_CHANNEL = 203,

    // === Assembly Errors (300-399) ===

    /// Element has no element number at assembly time
    UNNUMBERED_ELEMENT = 300,

    /// Element references a node outside the rotor
    INVALID_NODE_REFERENCE = 301,

    /// Element DOF model differs from the assembler DOF model
    DOF_MODEL_MISMATCH = 302,

    /// Nothing to assemble
    EMPTY_ASSEMBLY = 303
};

/**
 * @brief Convert error code to string representation.
 */
inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::MISSING_PROPERTY: return "MISSING_PROPERTY";
        case ErrorCode::INVALID_PROPERTY: return "INVALID_PROPERTY";
        case ErrorCode::UNSUPPORTED_CHANNEL: return "UNSUPPORTED_CHANNEL";
        case ErrorCode::UNNUMBERED_ELEMENT: return "UNNUMBERED_ELEMENT";
        case ErrorCode::INVALID_NODE_REFERENCE: return "INVALID_NODE_REFERENCE";
        case ErrorCode::DOF_MODEL_MISMATCH: return "DOF_MODEL_MISMATCH";
        case ErrorCode::EMPTY_ASSEMBLY: return "EMPTY_ASSEMBLY";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Structured error information for rotorlink.
 *
 * Contains machine-readable error code, human-readable message,
 * and diagnostic information about involved elements and nodes.
 */
struct RotorlinkError {
    /// Machine-readable error code
    ErrorCode code;

    /// Human-readable error message
    std::string message;

    /// Element numbers involved in the error (position in the rotor when unnumbered)
    std::vector<int> involved_elements;

    /// Node numbers involved in the error
    std::vector<int> involved_nodes;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested fix for the error
    std::string suggestion;

    /**
     * @brief Default constructor creates OK status.
     */
    RotorlinkError()
        : code(ErrorCode::OK), message("OK") {}

    /**
     * @brief Construct error with code and message.
     */
    RotorlinkError(ErrorCode code, const std::string& message)
        : code(code), message(message) {}

    bool is_ok() const { return code == ErrorCode::OK; }

    bool is_error() const { return code != ErrorCode::OK; }

    std::string code_string() const { return error_code_to_string(code); }

    /**
     * @brief Get formatted error string for display.
     */
    std::string to_string() const {
        if (is_ok()) return "OK";

        std::string result = "[" + code_string() + "] " + message;

        if (!involved_elements.empty()) {
            result += "\n  Involved elements: ";
            for (size_t i = 0; i < involved_elements.size(); ++i) {
                if (i > 0) result += ", ";
                result += std::to_string(involved_elements[i]);
            }
        }

        if (!involved_nodes.empty()) {
            result += "\n  Involved nodes: ";
            for (size_t i = 0; i < involved_nodes.size(); ++i) {
                if (i > 0) result += ", ";
                result += std::to_string(involved_nodes[i]);
            }
        }

        for (const auto& kv : details) {
            result += "\n  " + kv.first + ": " + kv.second;
        }

        if (!suggestion.empty()) {
            result += "\n  Suggestion: " + suggestion;
        }

        return result;
    }

    // === Factory methods for common errors ===

    /**
     * @brief Create error for a required property that was not supplied.
     */
    static RotorlinkError missing_property(const std::string& property_name) {
        RotorlinkError err(ErrorCode::MISSING_PROPERTY,
            "Required property '" + property_name + "' is missing");
        err.details["property"] = property_name;
        err.suggestion = "Station masses and polar inertias have no default; "
                         "supply m_l, m_r, Ip_l and Ip_r.";
        return err;
    }

    /**
     * @brief Create error for an invalid property value.
     */
    static RotorlinkError invalid_property(const std::string& property_name,
                                           const std::string& reason) {
        RotorlinkError err(ErrorCode::INVALID_PROPERTY,
            "Invalid property '" + property_name + "': " + reason);
        err.details["property"] = property_name;
        return err;
    }

    /**
     * @brief Create error for a coefficient on a channel the model lacks.
     */
    static RotorlinkError unsupported_channel(const std::string& property_name,
                                              const std::string& model_name) {
        RotorlinkError err(ErrorCode::UNSUPPORTED_CHANNEL,
            "Property '" + property_name + "' is not available for the " +
            model_name + " coupling");
        err.details["property"] = property_name;
        err.details["dof_model"] = model_name;
        err.suggestion = "Axial and torsional coefficients require the 6-DOF model.";
        return err;
    }

    /**
     * @brief Create error for an element without element number.
     */
    static RotorlinkError unnumbered_element(int position) {
        RotorlinkError err(ErrorCode::UNNUMBERED_ELEMENT,
            "Element has no element number");
        err.involved_elements.push_back(position);
        err.suggestion = "Call Assembler::number_elements() or set n before assembly.";
        return err;
    }

    /**
     * @brief Create error for invalid node reference.
     */
    static RotorlinkError invalid_node(int element, int node, int num_nodes) {
        RotorlinkError err(ErrorCode::INVALID_NODE_REFERENCE,
            "Element references a node outside the rotor");
        err.involved_elements.push_back(element);
        err.involved_nodes.push_back(node);
        err.details["num_nodes"] = std::to_string(num_nodes);
        return err;
    }

    /**
     * @brief Create error for mixing 4-DOF and 6-DOF elements.
     */
    static RotorlinkError dof_model_mismatch(int element, const std::string& expected,
                                             const std::string& actual) {
        RotorlinkError err(ErrorCode::DOF_MODEL_MISMATCH,
            "Element DOF model does not match the assembler");
        err.involved_elements.push_back(element);
        err.details["expected"] = expected;
        err.details["actual"] = actual;
        return err;
    }

    /**
     * @brief Create error for empty element list.
     */
    static RotorlinkError empty_assembly() {
        RotorlinkError err(ErrorCode::EMPTY_ASSEMBLY, "No elements to assemble");
        err.suggestion = "Add at least one coupling element.";
        return err;
    }
};

}  // namespace rotorlink

#endif  // ROTORLINK_ERRORS_HPP
