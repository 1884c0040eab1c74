#pragma once
#include "CoordinateProjector.hpp"
#include "LagrangeConstrainedSolver.hpp"
#include "LinearConstraint.hpp"
#include "SolverOptions.hpp"
#include "UnconstrainedSolver.hpp"
#include "WeightedUtilityModel.hpp"
#include <optional>
#include <vector>

struct OptimizerOptions {
    ProjectorOptions projector;
    SolverOptions solver;
};

struct OptimizationResult {
    PlanarPoint planar;
    std::optional<double> multiplier; // constrained solves only
    GeodeticPoint geodetic;
    double utility;                   // U at the solution
};

// One optimisation run: project amenities about the origin, build U, solve, map back.
// All inputs are validated in the constructor.
class SpatialOptimizer {
public:
    SpatialOptimizer(GeodeticPoint origin,
                     const std::vector<GeodeticAmenity>& amenities,
                     OptimizerOptions opt = {});

    const CoordinateProjector& projector() const noexcept { return projector_; }
    const WeightedUtilityModel& model() const noexcept { return model_; }
    const std::vector<WeightedAmenity>& planar_amenities() const noexcept { return planar_; }

    OptimizationResult optimize() const;
    // Street endpoints are projected through this run's projector, so the constraint
    // always shares the amenities' origin.
    OptimizationResult optimize_on_line(const GeodeticPoint& a, const GeodeticPoint& b) const;

private:
    OptimizerOptions opt_;
    CoordinateProjector projector_;
    std::vector<WeightedAmenity> planar_;
    WeightedUtilityModel model_;

    OptimizationResult solve_on_line(const LinearConstraint& constraint) const;

    static std::vector<WeightedAmenity> project_all(const CoordinateProjector& proj,
                                                    const std::vector<GeodeticAmenity>& amenities);
};
