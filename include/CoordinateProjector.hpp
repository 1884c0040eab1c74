#pragma once
#include "Points.hpp"

struct ProjectorOptions {
    double earth_radius_km = 6371.0;
    double max_abs_latitude_deg = 85.0;  // flat-Earth error grows quickly past this
    double pole_epsilon_deg = 1e-9;
};

// Equirectangular (tangent-plane) approximation about a fixed reference origin:
//   x = R (λ - λ_ref) cos φ_ref,   y = R (φ - φ_ref)
// Valid for distances up to a few hundred km from the origin.
class CoordinateProjector {
public:
    explicit CoordinateProjector(GeodeticPoint origin, ProjectorOptions opt = {});

    const GeodeticPoint& origin() const noexcept { return origin_; }
    const ProjectorOptions& options() const noexcept { return opt_; }

    PlanarPoint to_planar(const GeodeticPoint& p) const;
    GeodeticPoint to_geodetic(const PlanarPoint& p) const;

private:
    GeodeticPoint origin_;
    ProjectorOptions opt_;
    double cos_lat_ref_;
};

// Convenience forms with default options.
PlanarPoint to_planar(const GeodeticPoint& origin, const GeodeticPoint& p);
GeodeticPoint to_geodetic(const GeodeticPoint& origin, const PlanarPoint& p);
