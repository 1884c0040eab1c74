#pragma once
#include "CoordinateProjector.hpp"
#include <utility>

// Planar solution -> geodetic, through (a copy of) the projector of the run that produced it.
class ResultMapper {
public:
    explicit ResultMapper(CoordinateProjector projector) : projector_(std::move(projector)) {}

    GeodeticPoint map(const PlanarPoint& p) const;

private:
    CoordinateProjector projector_;
};

GeodeticPoint map_to_geodetic(const GeodeticPoint& origin, const PlanarPoint& p);
