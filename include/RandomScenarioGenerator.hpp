#pragma once
#include "Points.hpp"
#include <cstdint>
#include <random>
#include <vector>

// Reproducible random problem instances around a reference origin.
class RandomScenarioGenerator {
public:
    struct Options {
        int n = 5;                           // number of amenities
        GeodeticPoint origin{0.0, 0.0};
        double spread_km = 10.0;             // amenities and street endpoints in [-spread, spread]^2 km
        double weight_min = 0.5;
        double weight_max = 3.0;
        bool vertical_street = false;        // street endpoints share a longitude
        uint64_t seed = 42ULL;
    };

    struct Scenario {
        GeodeticPoint origin;
        std::vector<GeodeticAmenity> amenities;
        GeodeticPoint street_a;
        GeodeticPoint street_b;
    };

    explicit RandomScenarioGenerator(Options opts);

    Scenario generate();

private:
    Options opts_;
    std::mt19937_64 rng_;

    // Offset (east, north) in km -> lat/lon, spherical-Earth small-offset approximation
    GeodeticPoint offset_origin(double east_km, double north_km) const;
    double sample_offset();
};
