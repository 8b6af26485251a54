#pragma once

#include "fem2d/equivalent_loads.hpp"
#include <vector>

namespace fem2d {

/**
 * @brief Internal force diagrams of one member sampled at stations
 */
struct StationDiagram {
    std::vector<double> stations;         ///< Distance from the start node [m]
    std::vector<double> normal_force;     ///< N(x) [N]
    std::vector<double> shear_force;      ///< V(x) [N]
    std::vector<double> bending_moment;   ///< M(x) [N·m]

    double max_n = 0.0;   ///< max |N|, floored
    double max_v = 0.0;   ///< max |V|, floored
    double max_m = 0.0;   ///< max |M|, floored
};

/**
 * @brief Closed-form N, V, M along a member with a uniform sub-span load
 *
 * Integrates the member equilibrium equations from the start-end forces
 * (N1, V1, M1) for a load (qx, qy) acting on [a, b] = [start_t L, end_t L]:
 *
 *   x < a:        N = N1,           V = V1,           M = M1 + V1 x
 *   a <= x <= b:  N = N1 + qx xi,   V = V1 + qy xi,   M = M1 + V1 x + qy xi²/2
 *   x > b:        N = N1 + qx s,    V = V1 + qy s,    M = M1 + V1 x + qy s (x - a - s/2)
 *
 * with xi = x - a and s = b - a. The three branches meet continuously at
 * x = a and x = b.
 *
 * Usage:
 *   StationInterpolator interpolator;   // 21 stations
 *   StationDiagram d = interpolator.interpolate(N1, V1, M1, L, load);
 */
class StationInterpolator {
public:
    /**
     * @param num_stations Number of evenly spaced stations from 0 to L (>= 2)
     * @param floor Lower bound for the reported maxima
     * @throws std::invalid_argument if num_stations < 2 or floor < 0
     */
    explicit StationInterpolator(int num_stations = 21, double floor = 1e-10);

    /**
     * @brief Sample the diagrams of one member
     *
     * @param N1 Axial force at the start (tension positive) [N]
     * @param V1 Shear at the start [N]
     * @param M1 Moment at the start [N·m]
     * @param length Member length [m]
     * @param load Local load intensities and extent
     * @throws std::invalid_argument if length is not positive
     */
    StationDiagram interpolate(double N1, double V1, double M1, double length,
                               const LocalLoad& load) const;

    int num_stations() const { return num_stations_; }

    double floor() const { return floor_; }

    /**
     * @brief Largest absolute value of a sequence, at least floor
     */
    static double max_abs(const std::vector<double>& values, double floor);

private:
    int num_stations_;
    double floor_;
};

}  // namespace fem2d
