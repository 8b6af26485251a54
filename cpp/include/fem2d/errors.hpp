/**
 * @file errors.hpp
 * @brief Structured error handling for fem2d.
 *
 * Error codes and error structures used to report why a frame analysis
 * request could not be solved. Errors are raised as AnalysisException
 * inside the assemble/solve/extract pipeline and turned into a failure
 * response at the service boundary.
 */

#ifndef FEM2D_ERRORS_HPP
#define FEM2D_ERRORS_HPP

#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fem2d {

/**
 * @brief Error codes for fem2d analysis failures.
 */
enum class ErrorCode {
    /// No error - analysis completed successfully
    OK = 0,

    // === Request/Reference Errors (100-199) ===

    /// Request could not be decoded (malformed JSON, wrong field types)
    INVALID_REQUEST = 100,

    /// Request has no nodes
    NO_NODES = 101,

    /// Request has no beams
    NO_BEAMS = 102,

    /// Two entities of the same kind share an id
    DUPLICATE_ID = 103,

    /// Beam references a node that does not exist
    INVALID_NODE_REFERENCE = 104,

    /// Beam references a material that does not exist
    INVALID_MATERIAL_REFERENCE = 105,

    // === Element Errors (200-299) ===

    /// Invalid element definition (e.g. zero length beam, start == end)
    INVALID_ELEMENT = 200,

    /// Material has a non-positive or non-finite modulus
    INVALID_MATERIAL = 201,

    /// Section has a non-positive area or inertia
    INVALID_SECTION = 202,

    /// Spring support stiffness is negative or non-finite
    INVALID_SPRING = 203,

    /// Node coordinate is not finite
    INVALID_COORDINATE = 204,

    // === Load Errors (300-399) ===

    /// Distributed load extent is outside 0 <= startT <= endT <= 1
    INVALID_LOAD_EXTENT = 300,

    /// Load value is not finite
    INVALID_LOAD_VALUE = 301,

    // === Solver Errors (500-599) ===

    /// Engine analysis returned a nonzero status
    SOLVER_CONVERGENCE_FAILED = 500,

    /// Engine raised an error while building or solving the model
    ENGINE_FAILURE = 501,

    /// Analysis settings are out of range
    INVALID_SETTINGS = 502,

    // === Generic Errors (900-999) ===

    /// Unknown or unspecified error
    UNKNOWN_ERROR = 999
};

/**
 * @brief Convert error code to string representation.
 */
inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INVALID_REQUEST: return "INVALID_REQUEST";
        case ErrorCode::NO_NODES: return "NO_NODES";
        case ErrorCode::NO_BEAMS: return "NO_BEAMS";
        case ErrorCode::DUPLICATE_ID: return "DUPLICATE_ID";
        case ErrorCode::INVALID_NODE_REFERENCE: return "INVALID_NODE_REFERENCE";
        case ErrorCode::INVALID_MATERIAL_REFERENCE: return "INVALID_MATERIAL_REFERENCE";
        case ErrorCode::INVALID_ELEMENT: return "INVALID_ELEMENT";
        case ErrorCode::INVALID_MATERIAL: return "INVALID_MATERIAL";
        case ErrorCode::INVALID_SECTION: return "INVALID_SECTION";
        case ErrorCode::INVALID_SPRING: return "INVALID_SPRING";
        case ErrorCode::INVALID_COORDINATE: return "INVALID_COORDINATE";
        case ErrorCode::INVALID_LOAD_EXTENT: return "INVALID_LOAD_EXTENT";
        case ErrorCode::INVALID_LOAD_VALUE: return "INVALID_LOAD_VALUE";
        case ErrorCode::SOLVER_CONVERGENCE_FAILED: return "SOLVER_CONVERGENCE_FAILED";
        case ErrorCode::ENGINE_FAILURE: return "ENGINE_FAILURE";
        case ErrorCode::INVALID_SETTINGS: return "INVALID_SETTINGS";
        case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
        default: return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Structured error information for fem2d.
 *
 * Contains machine-readable error code, human-readable message,
 * and the caller ids of the nodes and beams involved.
 */
struct Fem2dError {
    /// Machine-readable error code
    ErrorCode code;

    /// Human-readable error message
    std::string message;

    /// Beam ids involved in the error
    std::vector<int> involved_beams;

    /// Node ids involved in the error
    std::vector<int> involved_nodes;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested fix for the error
    std::string suggestion;

    Fem2dError()
        : code(ErrorCode::OK), message("OK") {}

    Fem2dError(ErrorCode code, const std::string& message)
        : code(code), message(message) {}

    bool is_ok() const { return code == ErrorCode::OK; }

    std::string code_string() const { return error_code_to_string(code); }

    /**
     * @brief Get formatted multi-line error string for logs.
     */
    std::string to_string() const {
        if (is_ok()) return "OK";

        std::string result = "[" + code_string() + "] " + message;

        if (!involved_nodes.empty()) {
            result += "\n  Involved nodes: ";
            for (size_t i = 0; i < involved_nodes.size(); ++i) {
                if (i > 0) result += ", ";
                result += std::to_string(involved_nodes[i]);
            }
        }

        if (!involved_beams.empty()) {
            result += "\n  Involved beams: ";
            for (size_t i = 0; i < involved_beams.size(); ++i) {
                if (i > 0) result += ", ";
                result += std::to_string(involved_beams[i]);
            }
        }

        for (const auto& [key, value] : details) {
            result += "\n  " + key + ": " + value;
        }

        if (!suggestion.empty()) {
            result += "\n  Suggestion: " + suggestion;
        }

        return result;
    }

    // === Factory methods for common errors ===

    static Fem2dError invalid_request(const std::string& reason) {
        return Fem2dError(ErrorCode::INVALID_REQUEST, "Invalid request: " + reason);
    }

    static Fem2dError duplicate_id(const std::string& kind, int id) {
        Fem2dError err(ErrorCode::DUPLICATE_ID,
            "Duplicate " + kind + " id " + std::to_string(id));
        if (kind == "node") {
            err.involved_nodes.push_back(id);
        } else if (kind == "beam") {
            err.involved_beams.push_back(id);
        }
        return err;
    }

    /**
     * @brief Create error for a beam that references a missing node.
     */
    static Fem2dError invalid_node(int beam_id, int node_id) {
        Fem2dError err(ErrorCode::INVALID_NODE_REFERENCE,
            "Beam " + std::to_string(beam_id) + " references unknown node " +
            std::to_string(node_id));
        err.involved_beams.push_back(beam_id);
        err.involved_nodes.push_back(node_id);
        err.suggestion = "Add the node to the request or fix the beam's nodeIds.";
        return err;
    }

    /**
     * @brief Create error for a beam that references a missing material.
     */
    static Fem2dError invalid_material_reference(int beam_id, int material_id) {
        Fem2dError err(ErrorCode::INVALID_MATERIAL_REFERENCE,
            "Beam " + std::to_string(beam_id) + " references unknown material " +
            std::to_string(material_id));
        err.involved_beams.push_back(beam_id);
        err.details["material_id"] = std::to_string(material_id);
        return err;
    }

    static Fem2dError invalid_element(int beam_id, const std::string& reason) {
        Fem2dError err(ErrorCode::INVALID_ELEMENT,
            "Invalid beam " + std::to_string(beam_id) + ": " + reason);
        err.involved_beams.push_back(beam_id);
        return err;
    }

    static Fem2dError invalid_section(int beam_id, const std::string& reason) {
        Fem2dError err(ErrorCode::INVALID_SECTION,
            "Invalid section on beam " + std::to_string(beam_id) + ": " + reason);
        err.involved_beams.push_back(beam_id);
        return err;
    }

    static Fem2dError invalid_load_extent(int beam_id, double start_t, double end_t) {
        Fem2dError err(ErrorCode::INVALID_LOAD_EXTENT,
            "Distributed load on beam " + std::to_string(beam_id) +
            " must satisfy 0 <= startT <= endT <= 1");
        err.involved_beams.push_back(beam_id);
        err.details["startT"] = std::to_string(start_t);
        err.details["endT"] = std::to_string(end_t);
        return err;
    }

    /**
     * @brief Create error for a nonzero engine analysis status.
     */
    static Fem2dError not_converged(int status) {
        Fem2dError err(ErrorCode::SOLVER_CONVERGENCE_FAILED,
            "Analysis did not converge (code " + std::to_string(status) + ")");
        err.suggestion = "Check supports for mechanisms, or reduce the load for "
                         "geometrically nonlinear analysis.";
        return err;
    }

    static Fem2dError engine_failure(const std::string& what) {
        return Fem2dError(ErrorCode::ENGINE_FAILURE, what);
    }
};

/**
 * @brief Exception carrying a Fem2dError through the analysis pipeline.
 *
 * what() returns the plain message; the full diagnostic is available
 * from error().to_string().
 */
class AnalysisException : public std::runtime_error {
public:
    explicit AnalysisException(Fem2dError error)
        : std::runtime_error(error.message), error_(std::move(error)) {}

    const Fem2dError& error() const { return error_; }

    ErrorCode code() const { return error_.code; }

private:
    Fem2dError error_;
};

}  // namespace fem2d

#endif  // FEM2D_ERRORS_HPP
