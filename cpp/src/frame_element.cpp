#include "fem2d/frame_element.hpp"
#include "fem2d/dof_handler.hpp"
#include "fem2d/equivalent_loads.hpp"
#include <stdexcept>
#include <string>

namespace fem2d {

FrameElement::FrameElement(int id, Node* node_i, Node* node_j, double A, double E, double I,
                           TransformationType transformation)
    : id(id), node_i(node_i), node_j(node_j), A(A), E(E), I(I),
      transformation(transformation),
      axes(node_i->x, node_i->y, node_j->x, node_j->y) {
    if (!(A > 0.0) || !(E > 0.0) || !(I > 0.0)) {
        throw std::invalid_argument("Element " + std::to_string(id) +
                                    ": A, E and I must be positive");
    }
}

Matrix6 FrameElement::local_stiffness_matrix() const {
    Matrix6 K = Matrix6::Zero();

    double L = axes.length;
    double L2 = L * L;
    double L3 = L2 * L;

    // Axial (DOFs 0, 3)
    double k_axial = E * A / L;
    K(0, 0) = k_axial;
    K(0, 3) = -k_axial;
    K(3, 0) = -k_axial;
    K(3, 3) = k_axial;

    // Bending (DOFs 1, 2, 4, 5: v_i, θ_i, v_j, θ_j)
    double k1 = 12.0 * E * I / L3;
    double k2 = 6.0 * E * I / L2;
    double k3 = 4.0 * E * I / L;
    double k4 = 2.0 * E * I / L;

    K(1, 1) = k1;    K(1, 2) = k2;    K(1, 4) = -k1;   K(1, 5) = k2;
    K(2, 1) = k2;    K(2, 2) = k3;    K(2, 4) = -k2;   K(2, 5) = k4;
    K(4, 1) = -k1;   K(4, 2) = -k2;   K(4, 4) = k1;    K(4, 5) = -k2;
    K(5, 1) = k2;    K(5, 2) = k4;    K(5, 4) = -k2;   K(5, 5) = k3;

    return K;
}

Matrix6 FrameElement::local_geometric_stiffness(double N) const {
    Matrix6 Kg = Matrix6::Zero();
    double k = N / axes.length;
    Kg(1, 1) = k;
    Kg(1, 4) = -k;
    Kg(4, 1) = -k;
    Kg(4, 4) = k;
    return Kg;
}

Matrix6 FrameElement::global_stiffness_matrix() const {
    Matrix6 T = axes.transformation_matrix();
    return T.transpose() * local_stiffness_matrix() * T;
}

Matrix6 FrameElement::global_tangent_stiffness(const Vector6& u_local, double wx) const {
    Matrix6 K = local_stiffness_matrix();
    if (transformation == TransformationType::PDelta) {
        K += local_geometric_stiffness(axial_force(u_local, wx));
    }
    Matrix6 T = axes.transformation_matrix();
    return T.transpose() * K * T;
}

Vector6 FrameElement::local_equivalent_loads(double wx, double wy) const {
    return full_span_equivalent_forces(axes.length, wx, wy);
}

Vector6 FrameElement::local_displacements(const Eigen::VectorXd& global_displacements,
                                          const DOFHandler& dof_handler) const {
    std::vector<int> loc = dof_handler.get_location_array(*node_i, *node_j);

    Vector6 u_global = Vector6::Zero();
    for (int i = 0; i < 6; ++i) {
        int global_dof = loc[i];
        if (global_dof >= 0 && global_dof < global_displacements.size()) {
            u_global(i) = global_displacements(global_dof);
        }
    }

    return axes.transformation_matrix() * u_global;
}

double FrameElement::axial_force(const Vector6& u_local, double wx) const {
    return E * A / axes.length * (u_local(3) - u_local(0)) - 0.5 * wx * axes.length;
}

Vector6 FrameElement::local_resisting_forces(const Vector6& u_local, double wx) const {
    Vector6 f = local_stiffness_matrix() * u_local;
    if (transformation == TransformationType::PDelta) {
        f += local_geometric_stiffness(axial_force(u_local, wx)) * u_local;
    }
    return f;
}

Vector6 FrameElement::local_end_forces(const Vector6& u_local, double wx, double wy) const {
    return local_resisting_forces(u_local, wx) - local_equivalent_loads(wx, wy);
}

}  // namespace fem2d
