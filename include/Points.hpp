#pragma once
#include <Eigen/Dense>
#include <cmath>
#include <string>

// Latitude/longitude in degrees.
struct GeodeticPoint {
    double lat = 0.0;
    double lon = 0.0;

    bool valid() const noexcept {
        return std::isfinite(lat) && std::isfinite(lon) && std::abs(lat) <= 90.0;
    }
};

// Local tangent-plane coordinates in km, east (x) and north (y) of a reference origin.
struct PlanarPoint {
    double x = 0.0;
    double y = 0.0;

    PlanarPoint() = default;
    PlanarPoint(double x_, double y_) : x(x_), y(y_) {}
    explicit PlanarPoint(const Eigen::Vector2d& v) : x(v[0]), y(v[1]) {}

    Eigen::Vector2d vec() const { return {x, y}; }
    bool finite() const noexcept { return std::isfinite(x) && std::isfinite(y); }

    bool operator==(const PlanarPoint& o) const noexcept { return x == o.x && y == o.y; }
    bool operator!=(const PlanarPoint& o) const noexcept { return !(*this == o); }
};

struct WeightedAmenity {
    PlanarPoint location;
    double weight = 1.0;
};

// Amenity as supplied by a caller; name is only used for reporting.
struct GeodeticAmenity {
    GeodeticPoint location;
    double weight = 1.0;
    std::string name;
};
