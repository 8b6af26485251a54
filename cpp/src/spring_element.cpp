#include "fem2d/spring_element.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace fem2d {

SpringElement::SpringElement(int id, Node* node_i, Node* node_j,
                             const std::array<double, 3>& stiffness)
    : id(id), node_i(node_i), node_j(node_j), stiffness(stiffness) {
    for (double k : stiffness) {
        if (!std::isfinite(k) || k < 0.0) {
            throw std::invalid_argument("Spring " + std::to_string(id) +
                                        ": stiffness must be finite and non-negative");
        }
    }
}

Matrix6 SpringElement::global_stiffness_matrix() const {
    Matrix6 K = Matrix6::Zero();
    for (int d = 0; d < 3; ++d) {
        double k = stiffness[d];
        K(d, d) = k;
        K(d, d + 3) = -k;
        K(d + 3, d) = -k;
        K(d + 3, d + 3) = k;
    }
    return K;
}

Vector6 SpringElement::forces(const Vector6& u_element) const {
    return global_stiffness_matrix() * u_element;
}

}  // namespace fem2d
