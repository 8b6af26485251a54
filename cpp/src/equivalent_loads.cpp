#include "fem2d/equivalent_loads.hpp"

namespace fem2d {

namespace hermite {

// N1 = 1 - 3x^2/L^2 + 2x^3/L^3
double H1(double x, double L) {
    double L2 = L * L;
    double L3 = L2 * L;
    return x - x * x * x / L2 + x * x * x * x / (2.0 * L3);
}

// N2 = x - 2x^2/L + x^3/L^2
double H2(double x, double L) {
    double L2 = L * L;
    return x * x / 2.0 - 2.0 * x * x * x / (3.0 * L) + x * x * x * x / (4.0 * L2);
}

// N3 = 3x^2/L^2 - 2x^3/L^3
double H3(double x, double L) {
    double L2 = L * L;
    double L3 = L2 * L;
    return x * x * x / L2 - x * x * x * x / (2.0 * L3);
}

// N4 = -x^2/L + x^3/L^2
double H4(double x, double L) {
    double L2 = L * L;
    return -x * x * x / (3.0 * L) + x * x * x * x / (4.0 * L2);
}

}  // namespace hermite

Vector6 partial_equivalent_forces(double length, const LocalLoad& load) {
    double L = length;
    double a = load.start_t * L;
    double b = load.end_t * L;
    double span = b - a;

    // Axial: linear shape functions over [a, b]
    double mid_t = 0.5 * (load.start_t + load.end_t);
    double int_L1 = span * (1.0 - mid_t);
    double int_L2 = span * mid_t;

    // Transverse: Hermite shape functions over [a, b]
    double int_N1 = hermite::H1(b, L) - hermite::H1(a, L);
    double int_N2 = hermite::H2(b, L) - hermite::H2(a, L);
    double int_N3 = hermite::H3(b, L) - hermite::H3(a, L);
    double int_N4 = hermite::H4(b, L) - hermite::H4(a, L);

    Vector6 f;
    f << load.qx * int_L1,
         load.qy * int_N1,
         load.qy * int_N2,
         load.qx * int_L2,
         load.qy * int_N3,
         load.qy * int_N4;
    return f;
}

Vector6 full_span_equivalent_forces(double length, double qx, double qy) {
    double L = length;
    double L2 = L * L;

    Vector6 f;
    f << qx * L / 2.0,
         qy * L / 2.0,
         qy * L2 / 12.0,
         qx * L / 2.0,
         qy * L / 2.0,
         -qy * L2 / 12.0;
    return f;
}

Vector6 global_equivalent_forces(const MemberAxes& axes, const LocalLoad& load) {
    return axes.to_global(partial_equivalent_forces(axes.length, load));
}

}  // namespace fem2d
