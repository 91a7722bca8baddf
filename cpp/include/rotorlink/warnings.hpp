/**
 * @file warnings.hpp
 * @brief Warning system for questionable coupling definitions.
 *
 * Warnings indicate potential issues that don't prevent matrix
 * generation but may indicate modeling errors.
 */

#ifndef ROTORLINK_WARNINGS_HPP
#define ROTORLINK_WARNINGS_HPP

#include <string>
#include <vector>
#include <map>

namespace rotorlink {

/**
 * @brief Warning codes for questionable coupling definitions.
 */
enum class WarningCode {
    // === Property Warnings (300-399) ===

    /// Diametral inertia given as exactly zero was replaced by Ip/2
    DIAMETRAL_INERTIA_DEFAULTED = 300,

    /// Negative station mass or moment of inertia
    NEGATIVE_INERTIA = 301,

    /// Negative stiffness or damping coefficient
    NEGATIVE_COEFFICIENT = 302
};

/**
 * @brief Warning severity levels.
 */
enum class WarningSeverity {
    /// Minor issue, likely acceptable
    Low = 0,

    /// Potentially problematic, review recommended
    Medium = 1,

    /// Likely indicates a modeling error
    High = 2
};

inline std::string warning_code_to_string(WarningCode code) {
    switch (code) {
        case WarningCode::DIAMETRAL_INERTIA_DEFAULTED: return "DIAMETRAL_INERTIA_DEFAULTED";
        case WarningCode::NEGATIVE_INERTIA: return "NEGATIVE_INERTIA";
        case WarningCode::NEGATIVE_COEFFICIENT: return "NEGATIVE_COEFFICIENT";
        default: return "UNKNOWN_WARNING";
    }
}

inline std::string severity_to_string(WarningSeverity severity) {
    switch (severity) {
        case WarningSeverity::Low: return "LOW";
        case WarningSeverity::Medium: return "MEDIUM";
        case WarningSeverity::High: return "HIGH";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Structured warning information for rotorlink.
 */
struct RotorlinkWarning {
    /// Machine-readable warning code
    WarningCode code;

    /// Warning severity level
    WarningSeverity severity;

    /// Human-readable warning message
    std::string message;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested fix for the warning
    std::string suggestion;

    RotorlinkWarning(WarningCode code, WarningSeverity severity, const std::string& message)
        : code(code), severity(severity), message(message) {}

    std::string code_string() const { return warning_code_to_string(code); }

    std::string severity_string() const { return severity_to_string(severity); }

    /**
     * @brief Get formatted warning string for display.
     */
    std::string to_string() const {
        std::string result = "[" + severity_string() + "] [" + code_string() + "] " + message;

        for (const auto& kv : details) {
            result += "\n  " + kv.first + ": " + kv.second;
        }

        if (!suggestion.empty()) {
            result += "\n  Suggestion: " + suggestion;
        }

        return result;
    }

    // === Factory methods for common warnings ===

    /**
     * @brief Create warning for an explicit zero diametral inertia.
     *
     * A supplied zero cannot be told apart from "not supplied", so the
     * default Id = Ip / 2 is applied and the caller is told about it.
     */
    static RotorlinkWarning diametral_inertia_defaulted(const std::string& property_name,
                                                       double replacement) {
        RotorlinkWarning warn(WarningCode::DIAMETRAL_INERTIA_DEFAULTED, WarningSeverity::Low,
            "Zero diametral inertia replaced by half the polar inertia");
        warn.details["property"] = property_name;
        warn.details["value"] = std::to_string(replacement);
        warn.suggestion = "Use a small positive value if a near-zero diametral inertia is intended";
        return warn;
    }

    /**
     * @brief Create warning for negative mass or inertia.
     */
    static RotorlinkWarning negative_inertia(const std::string& property_name, double value) {
        RotorlinkWarning warn(WarningCode::NEGATIVE_INERTIA, WarningSeverity::High,
            "Negative mass or inertia makes the mass matrix indefinite");
        warn.details["property"] = property_name;
        warn.details["value"] = std::to_string(value);
        warn.suggestion = "Check property values and units";
        return warn;
    }

    /**
     * @brief Create warning for negative stiffness or damping.
     */
    static RotorlinkWarning negative_coefficient(const std::string& property_name, double value) {
        RotorlinkWarning warn(WarningCode::NEGATIVE_COEFFICIENT, WarningSeverity::Medium,
            "Negative coupling coefficient");
        warn.details["property"] = property_name;
        warn.details["value"] = std::to_string(value);
        warn.suggestion = "Negative stiffness or damping can destabilize the rotor model";
        return warn;
    }
};

/**
 * @brief Collection of warnings from element construction.
 */
class WarningList {
public:
    /// List of warnings
    std::vector<RotorlinkWarning> warnings;

    void add(const RotorlinkWarning& warning) {
        warnings.push_back(warning);
    }

    void add(RotorlinkWarning&& warning) {
        warnings.push_back(std::move(warning));
    }

    bool has_warnings() const { return !warnings.empty(); }

    size_t count() const { return warnings.size(); }

    /**
     * @brief Get count of warnings by severity.
     */
    size_t count_by_severity(WarningSeverity severity) const {
        size_t count = 0;
        for (const auto& w : warnings) {
            if (w.severity == severity) ++count;
        }
        return count;
    }

    /**
     * @brief Check if any warning carries the given code.
     */
    bool contains(WarningCode code) const {
        for (const auto& w : warnings) {
            if (w.code == code) return true;
        }
        return false;
    }

    /**
     * @brief Get all warnings with given severity or higher.
     */
    std::vector<RotorlinkWarning> get_by_min_severity(WarningSeverity min_severity) const {
        std::vector<RotorlinkWarning> result;
        for (const auto& w : warnings) {
            if (static_cast<int>(w.severity) >= static_cast<int>(min_severity)) {
                result.push_back(w);
            }
        }
        return result;
    }

    void clear() { warnings.clear(); }

    /**
     * @brief Get formatted summary string.
     */
    std::string summary() const {
        if (warnings.empty()) return "No warnings";

        std::string result = std::to_string(warnings.size()) + " warning(s): ";
        result += std::to_string(count_by_severity(WarningSeverity::High)) + " high, ";
        result += std::to_string(count_by_severity(WarningSeverity::Medium)) + " medium, ";
        result += std::to_string(count_by_severity(WarningSeverity::Low)) + " low";
        return result;
    }
};

}  // namespace rotorlink

#endif  // ROTORLINK_WARNINGS_HPP
