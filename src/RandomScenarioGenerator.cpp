#include "RandomScenarioGenerator.hpp"
#include "SpatialErrors.hpp"
#include <cmath>
#include <string>
#include <utility>

namespace {
constexpr double kPi = 3.14159265358979323846;
constexpr double kEarthRadiusKm = 6371.0;
}

RandomScenarioGenerator::RandomScenarioGenerator(Options opts)
    : opts_(std::move(opts)), rng_(opts_.seed)
{
    if (opts_.n <= 0) {
        throw ValidationError("RandomScenarioGenerator: n must be positive.");
    }
    if (!(opts_.spread_km > 0.0)) {
        throw ValidationError("RandomScenarioGenerator: spread_km must be positive.");
    }
    if (!(opts_.weight_min >= 0.0 && opts_.weight_max >= opts_.weight_min)) {
        throw ValidationError("RandomScenarioGenerator: require 0 <= weight_min <= weight_max.");
    }
    if (!opts_.origin.valid() || std::abs(opts_.origin.lat) > 85.0) {
        throw ValidationError("RandomScenarioGenerator: origin latitude must lie in [-85, 85].");
    }
}

RandomScenarioGenerator::Scenario RandomScenarioGenerator::generate() {
    Scenario s;
    s.origin = opts_.origin;
    s.amenities.reserve(static_cast<size_t>(opts_.n));

    std::uniform_real_distribution<double> W(opts_.weight_min, opts_.weight_max);
    for (int i = 0; i < opts_.n; ++i) {
        const double e = sample_offset();
        const double n = sample_offset();
        s.amenities.push_back({offset_origin(e, n), W(rng_), "amenity-" + std::to_string(i)});
    }

    const double ea = sample_offset();
    const double na = sample_offset();
    double eb = sample_offset();
    double nb = sample_offset();
    if (opts_.vertical_street) eb = ea;
    // keep the endpoints apart so the street is well defined
    if (std::abs(eb - ea) + std::abs(nb - na) < 1e-3 * opts_.spread_km) nb = na + opts_.spread_km;

    s.street_a = offset_origin(ea, na);
    s.street_b = offset_origin(eb, nb);
    return s;
}

double RandomScenarioGenerator::sample_offset() {
    std::uniform_real_distribution<double> U(-opts_.spread_km, opts_.spread_km);
    return U(rng_);
}

GeodeticPoint RandomScenarioGenerator::offset_origin(double east_km, double north_km) const {
    const double lat_ref = opts_.origin.lat * kPi / 180.0;
    GeodeticPoint p;
    p.lat = opts_.origin.lat + (north_km / kEarthRadiusKm) * 180.0 / kPi;
    p.lon = opts_.origin.lon + (east_km / (kEarthRadiusKm * std::cos(lat_ref))) * 180.0 / kPi;
    return p;
}
