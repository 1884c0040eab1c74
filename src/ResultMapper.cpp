#include "ResultMapper.hpp"
#include "SpatialErrors.hpp"

GeodeticPoint ResultMapper::map(const PlanarPoint& p) const {
    if (!p.finite()) {
        throw ValidationError("ResultMapper::map: planar result is not finite.");
    }
    return projector_.to_geodetic(p);
}

GeodeticPoint map_to_geodetic(const GeodeticPoint& origin, const PlanarPoint& p) {
    return ResultMapper(CoordinateProjector(origin)).map(p);
}
