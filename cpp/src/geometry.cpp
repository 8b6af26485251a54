#include "fem2d/geometry.hpp"
#include <cmath>
#include <stdexcept>

namespace fem2d {

MemberAxes::MemberAxes(double x1, double y1, double x2, double y2) {
    double dx = x2 - x1;
    double dy = y2 - y1;
    length = std::hypot(dx, dy);

    if (!(length >= 1e-10)) {
        throw std::invalid_argument("Member length is too small (near-zero)");
    }

    angle = std::atan2(dy, dx);
    c = dx / length;
    s = dy / length;
}

Eigen::Matrix3d MemberAxes::rotation_matrix() const {
    Eigen::Matrix3d R;
    R <<  c,   s,   0.0,
         -s,   c,   0.0,
          0.0, 0.0, 1.0;
    return R;
}

Matrix6 MemberAxes::transformation_matrix() const {
    Matrix6 T = Matrix6::Zero();
    Eigen::Matrix3d R = rotation_matrix();
    T.block<3, 3>(0, 0) = R;   // Node i
    T.block<3, 3>(3, 3) = R;   // Node j
    return T;
}

Vector6 MemberAxes::to_global(const Vector6& local) const {
    Vector6 g;
    g << c * local(0) - s * local(1),
         s * local(0) + c * local(1),
         local(2),
         c * local(3) - s * local(4),
         s * local(3) + c * local(4),
         local(5);
    return g;
}

Vector6 MemberAxes::to_local(const Vector6& global) const {
    return transformation_matrix() * global;
}

Eigen::Vector2d MemberAxes::load_to_local(double qx_global, double qy_global) const {
    return Eigen::Vector2d(qx_global * c + qy_global * s,
                           -qx_global * s + qy_global * c);
}

}  // namespace fem2d
