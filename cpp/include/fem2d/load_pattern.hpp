#pragma once

#include "fem2d/dof_handler.hpp"
#include "fem2d/frame_element.hpp"
#include <Eigen/Dense>
#include <map>
#include <memory>
#include <vector>

namespace fem2d {

/**
 * @brief Concentrated nodal load in global axes
 */
struct NodalLoad {
    int node_id;      ///< Node where load is applied
    double fx;        ///< Force along X [N]
    double fy;        ///< Force along Y [N]
    double moment;    ///< Moment about Z [N·m]

    NodalLoad(int node, double fx, double fy, double moment)
        : node_id(node), fx(fx), fy(fy), moment(moment) {}
};

/**
 * @brief Full-span uniform load on a beam element (local axes)
 */
struct ElementUniformLoad {
    double wx = 0.0;  ///< Axial intensity [N/m]
    double wy = 0.0;  ///< Transverse intensity [N/m]
};

/**
 * @brief The single load pattern of an engine model
 *
 * Loads accumulate if added more than once for the same node or element.
 */
class LoadPattern {
public:
    void add_nodal_load(int node_id, double fx, double fy, double moment);

    void add_element_load(int element_id, double wy, double wx);

    /**
     * @brief Uniform load of an element (zero if none was added)
     */
    ElementUniformLoad element_load(int element_id) const;

    /**
     * @brief Assemble the global reference load vector
     *
     * Nodal loads plus the fixed-end load vectors of element loads rotated
     * into global axes.
     */
    Eigen::VectorXd assemble_load_vector(
        const DOFHandler& dof_handler,
        const std::map<int, std::unique_ptr<FrameElement>>& elements) const;

    bool empty() const { return nodal_loads_.empty() && element_loads_.empty(); }

    void clear();

private:
    std::vector<NodalLoad> nodal_loads_;
    std::map<int, ElementUniformLoad> element_loads_;
};

}  // namespace fem2d
