#include "fem2d/station_interpolator.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace fem2d {

StationInterpolator::StationInterpolator(int num_stations, double floor)
    : num_stations_(num_stations), floor_(floor) {
    if (num_stations_ < 2) {
        throw std::invalid_argument("StationInterpolator needs at least 2 stations");
    }
    if (!(floor_ >= 0.0)) {
        throw std::invalid_argument("StationInterpolator floor must be non-negative");
    }
}

StationDiagram StationInterpolator::interpolate(double N1, double V1, double M1,
                                                double length,
                                                const LocalLoad& load) const {
    if (!(length > 0.0)) {
        throw std::invalid_argument("Member length must be positive");
    }

    const double a = load.start_t * length;
    const double b = load.end_t * length;
    const double span = b - a;
    const double qx = load.qx;
    const double qy = load.qy;

    StationDiagram d;
    d.stations.reserve(num_stations_);
    d.normal_force.reserve(num_stations_);
    d.shear_force.reserve(num_stations_);
    d.bending_moment.reserve(num_stations_);

    for (int i = 0; i < num_stations_; ++i) {
        const double x = static_cast<double>(i) / (num_stations_ - 1) * length;
        double N, V, M;

        if (x < a) {
            N = N1;
            V = V1;
            M = M1 + V1 * x;
        } else if (x <= b) {
            const double xi = x - a;
            N = N1 + qx * xi;
            V = V1 + qy * xi;
            M = M1 + V1 * x + qy * xi * xi / 2.0;
        } else {
            N = N1 + qx * span;
            V = V1 + qy * span;
            M = M1 + V1 * x + qy * span * (x - a - span / 2.0);
        }

        d.stations.push_back(x);
        d.normal_force.push_back(N);
        d.shear_force.push_back(V);
        d.bending_moment.push_back(M);
    }

    d.max_n = max_abs(d.normal_force, floor_);
    d.max_v = max_abs(d.shear_force, floor_);
    d.max_m = max_abs(d.bending_moment, floor_);
    return d;
}

double StationInterpolator::max_abs(const std::vector<double>& values, double floor) {
    double result = floor;
    for (double v : values) {
        result = std::max(result, std::abs(v));
    }
    return result;
}

}  // namespace fem2d
