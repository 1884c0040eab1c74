#include "CoordinateProjector.hpp"
#include "SpatialErrors.hpp"
#include <cmath>
#include <sstream>

namespace {
constexpr double kPi = 3.14159265358979323846;

inline double deg2rad(double d) { return d * kPi / 180.0; }
inline double rad2deg(double r) { return r * 180.0 / kPi; }

// Wrap to [-180, 180).
inline double wrap_lon(double d) {
    double w = std::fmod(d + 180.0, 360.0);
    if (w < 0.0) w += 360.0;
    return w - 180.0;
}
}

CoordinateProjector::CoordinateProjector(GeodeticPoint origin, ProjectorOptions opt)
    : origin_(origin), opt_(opt), cos_lat_ref_(0.0)
{
    if (!(opt_.earth_radius_km > 0.0) || !std::isfinite(opt_.earth_radius_km)) {
        throw ValidationError("CoordinateProjector: earth radius must be positive.");
    }
    if (!(opt_.max_abs_latitude_deg > 0.0 && opt_.max_abs_latitude_deg <= 90.0)) {
        throw ValidationError("CoordinateProjector: max_abs_latitude_deg must lie in (0, 90].");
    }
    if (!(opt_.pole_epsilon_deg >= 0.0 && opt_.pole_epsilon_deg < 90.0)) {
        throw ValidationError("CoordinateProjector: pole_epsilon_deg must lie in [0, 90).");
    }
    if (!origin_.valid()) {
        throw ValidationError("CoordinateProjector: reference origin is not a valid lat/lon.");
    }
    if (std::abs(origin_.lat) >= 90.0 - opt_.pole_epsilon_deg) {
        throw DegenerateProjection("CoordinateProjector: reference origin at a pole.");
    }
    if (std::abs(origin_.lat) > opt_.max_abs_latitude_deg) {
        std::ostringstream os;
        os << "CoordinateProjector: reference latitude " << origin_.lat
           << " outside supported range [-" << opt_.max_abs_latitude_deg << ", "
           << opt_.max_abs_latitude_deg << "].";
        throw ValidationError(os.str());
    }
    cos_lat_ref_ = std::cos(deg2rad(origin_.lat));
}

PlanarPoint CoordinateProjector::to_planar(const GeodeticPoint& p) const {
    if (!p.valid()) {
        throw ValidationError("CoordinateProjector::to_planar: point is not a valid lat/lon.");
    }
    const double R = opt_.earth_radius_km;
    const double dlon = deg2rad(wrap_lon(p.lon - origin_.lon));
    const double dlat = deg2rad(p.lat - origin_.lat);
    return {R * dlon * cos_lat_ref_, R * dlat};
}

GeodeticPoint CoordinateProjector::to_geodetic(const PlanarPoint& p) const {
    if (!p.finite()) {
        throw ValidationError("CoordinateProjector::to_geodetic: planar point is not finite.");
    }
    const double R = opt_.earth_radius_km;
    const double denom = R * cos_lat_ref_;
    if (!(denom > 0.0)) {
        throw DegenerateProjection("CoordinateProjector::to_geodetic: cos(lat_ref) vanishes.");
    }
    GeodeticPoint out;
    out.lat = origin_.lat + rad2deg(p.y / R);
    out.lon = wrap_lon(origin_.lon + rad2deg(p.x / denom));
    return out;
}

PlanarPoint to_planar(const GeodeticPoint& origin, const GeodeticPoint& p) {
    return CoordinateProjector(origin).to_planar(p);
}

GeodeticPoint to_geodetic(const GeodeticPoint& origin, const PlanarPoint& p) {
    return CoordinateProjector(origin).to_geodetic(p);
}
