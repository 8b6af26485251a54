#pragma once

#include "fem2d/dof_handler.hpp"
#include "fem2d/frame_element.hpp"
#include "fem2d/load_pattern.hpp"
#include "fem2d/spring_element.hpp"
#include <Eigen/Dense>
#include <Eigen/Sparse>
#include <map>
#include <memory>
#include <vector>

namespace fem2d {

using FrameElementMap = std::map<int, std::unique_ptr<FrameElement>>;
using SpringElementMap = std::map<int, std::unique_ptr<SpringElement>>;

/**
 * @brief Assembles global matrices and vectors from element contributions
 *
 * Uses triplet lists to build sparse matrices. Element loads are read from
 * the load pattern because the P-Delta axial force depends on them.
 *
 * Usage:
 *   Assembler assembler(dof_handler);
 *   auto K = assembler.assemble_stiffness(beams, springs);
 *   auto K_t = assembler.assemble_tangent(beams, springs, pattern, u);
 */
class Assembler {
public:
    explicit Assembler(const DOFHandler& dof_handler);

    /**
     * @brief Assemble the elastic stiffness matrix
     */
    Eigen::SparseMatrix<double> assemble_stiffness(const FrameElementMap& beams,
                                                   const SpringElementMap& springs) const;

    /**
     * @brief Assemble the tangent stiffness matrix at displacements u
     *
     * Equals the elastic stiffness for beams with the Linear transformation.
     */
    Eigen::SparseMatrix<double> assemble_tangent(const FrameElementMap& beams,
                                                 const SpringElementMap& springs,
                                                 const LoadPattern& pattern,
                                                 const Eigen::VectorXd& u) const;

    /**
     * @brief Assemble the internal (resisting) force vector at displacements u
     */
    Eigen::VectorXd assemble_internal_forces(const FrameElementMap& beams,
                                             const SpringElementMap& springs,
                                             const LoadPattern& pattern,
                                             const Eigen::VectorXd& u) const;

    /**
     * @brief Add an element matrix to a global triplet list
     *
     * Entries with a negative location are skipped.
     */
    static void add_element_matrix(std::vector<Eigen::Triplet<double>>& triplets,
                                   const Matrix6& K_elem,
                                   const std::vector<int>& loc_array);

    /**
     * @brief Add an element vector to a global vector
     */
    static void add_element_vector(Eigen::VectorXd& F,
                                   const Vector6& f_elem,
                                   const std::vector<int>& loc_array);

private:
    const DOFHandler& dof_handler_;

    Vector6 gather(const Eigen::VectorXd& u, const std::vector<int>& loc_array) const;
};

}  // namespace fem2d
