#pragma once

#include "fem2d/analysis_settings.hpp"
#include "fem2d/engine.hpp"
#include "fem2d/equivalent_loads.hpp"
#include "fem2d/model_input.hpp"
#include <array>
#include <map>
#include <optional>
#include <vector>

namespace fem2d {

/**
 * @brief Allocates engine tags for auxiliary nodes and elements
 *
 * Tags come from one monotonically increasing counter that starts above
 * every caller node and beam id, so auxiliary tags never collide with
 * caller-visible ids.
 */
class AuxiliaryIdAllocator {
public:
    /**
     * @brief Allocator whose first tag is first_id
     */
    explicit AuxiliaryIdAllocator(int first_id);

    /**
     * @brief Allocator starting just above the largest id in the request
     *
     * Considers every node id and beam id (and 0, so tags are positive).
     * @throws AnalysisException (INVALID_REQUEST) if no tag is left
     */
    static AuxiliaryIdAllocator for_request(const SolveRequest& request);

    /**
     * @brief Next unused tag
     * @throws AnalysisException (INVALID_REQUEST) on integer overflow
     */
    int next();

    int first_id() const { return first_id_; }

    /// Number of tags handed out so far
    int allocated() const { return next_id_ - first_id_; }

    /// True if the tag was handed out by this allocator
    bool owns(int tag) const { return tag >= first_id_ && tag < next_id_; }

private:
    int first_id_;
    int next_id_;
};

/**
 * @brief How one caller beam was emitted to the engine
 */
struct BeamMapping {
    int beam_id = 0;            ///< Caller beam id
    int element_tag = 0;        ///< Engine element tag
    int start_node = 0;         ///< Caller start node id
    int end_node = 0;           ///< Caller end node id
    int engine_node_i = 0;      ///< Engine node the element starts at
    int engine_node_j = 0;      ///< Engine node the element ends at

    /// Duplicate node created for a start release (absent if not released)
    std::optional<int> start_release_node;

    /// Duplicate node created for an end release (absent if not released)
    std::optional<int> end_release_node;

    double length = 0.0;        ///< Member length [m]
    double angle = 0.0;         ///< Member angle [rad]

    /// Distributed load converted to local axes (absent if none or zero)
    std::optional<LocalLoad> local_load;

    /// True if the load was emitted as equivalent nodal loads
    bool load_as_nodal_equivalents = false;

    /// Local equivalent vector of a nodal-equivalent load (zero otherwise)
    Vector6 equivalent_local = Vector6::Zero();

    bool has_release() const {
        return start_release_node.has_value() || end_release_node.has_value();
    }
};

/**
 * @brief Identifier mapping produced by ModelAssembler::assemble()
 *
 * Consumed read-only by the ResultExtractor.
 */
struct AssemblyMap {
    /// Caller node ids in request order
    std::vector<int> node_id_order;

    /// Per-beam mappings in request order
    std::vector<BeamMapping> beams;

    /// Caller beam id -> engine element tag
    std::map<int, int> beam_to_element;

    /// Sprung caller node id -> fixed auxiliary ground node
    std::map<int, int> spring_ground_nodes;

    /// Sprung caller node id -> zero-length element tag
    std::map<int, int> spring_elements;

    /// Caller nodes whose rotation was fixed because no member restrains it
    std::vector<int> pinned_rotation_nodes;

    /// Transformation applied to every beam
    TransformationType transformation = TransformationType::Linear;

    /**
     * @brief Mapping of a caller beam
     * @throws std::out_of_range if the beam was not assembled
     */
    const BeamMapping& beam(int beam_id) const;

    /// Caller beam ids that received at least one release node
    std::vector<int> released_beams() const;
};

/**
 * @brief Translates a SolveRequest into primitive engine entities
 *
 * The whole request is validated before the first engine call, so a bad
 * reference never leaves a partial model behind. Emission order:
 * 1. wipe, caller nodes, fixity
 * 2. spring supports (fixed ground node + zero-length element)
 * 3. transformation policy (Linear, or P-Delta when geometric_nonlinear)
 * 4. release nodes tied by equal UX, UY to the caller node
 * 5. one elastic beam per caller beam (element tag = beam id)
 * 6. nodal loads; full-span distributed loads as native element loads;
 *    partial-span loads as global equivalent nodal loads at the element ends
 *
 * Usage:
 *   ModelAssembler assembler(settings);
 *   AssemblyMap map = assembler.assemble(request, engine);
 */
class ModelAssembler {
public:
    /**
     * @throws AnalysisException (INVALID_SETTINGS) if settings are invalid
     */
    explicit ModelAssembler(const AnalysisSettings& settings = AnalysisSettings());

    /**
     * @brief Validate the request without touching an engine
     * @throws AnalysisException on the first invalid input
     */
    void validate(const SolveRequest& request) const;

    /**
     * @brief Emit the request's model to the engine
     * @throws AnalysisException on invalid input (nothing emitted)
     */
    AssemblyMap assemble(const SolveRequest& request, Engine& engine) const;

    /**
     * @brief Convert a request load to local axes
     *
     * Global intensities are rotated by the member angle.
     */
    static LocalLoad to_local_load(const DistributedLoad& load, const MemberAxes& axes);

    /**
     * @brief Per-axis spring stiffness with zero axes made rigid
     */
    std::array<double, 3> spring_stiffness(const SpringSupport& springs) const;

    const AnalysisSettings& settings() const { return settings_; }

private:
    AnalysisSettings settings_;

    /// Caller nodes whose rotation has no member, spring or support restraint
    std::vector<int> find_unrestrained_rotations(const SolveRequest& request) const;

    void warn_on_stiffness_ratio(const SolveRequest& request) const;
};

}  // namespace fem2d
