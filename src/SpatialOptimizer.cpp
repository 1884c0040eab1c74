#include "SpatialOptimizer.hpp"
#include "ResultMapper.hpp"

SpatialOptimizer::SpatialOptimizer(GeodeticPoint origin,
                                   const std::vector<GeodeticAmenity>& amenities,
                                   OptimizerOptions opt)
    : opt_(opt),
      projector_(origin, opt_.projector),
      planar_(project_all(projector_, amenities)),
      model_(planar_)
{}

std::vector<WeightedAmenity> SpatialOptimizer::project_all(const CoordinateProjector& proj,
                                                           const std::vector<GeodeticAmenity>& amenities) {
    std::vector<WeightedAmenity> out;
    out.reserve(amenities.size());
    for (const auto& a : amenities) {
        out.push_back({proj.to_planar(a.location), a.weight});
    }
    return out;
}

OptimizationResult SpatialOptimizer::optimize() const {
    const PlanarPoint p = UnconstrainedSolver(opt_.solver).solve(model_);
    return {p, std::nullopt, ResultMapper(projector_).map(p), model_.evaluate(p)};
}

OptimizationResult SpatialOptimizer::optimize_on_line(const GeodeticPoint& a, const GeodeticPoint& b) const {
    const LinearConstraint constraint(projector_.to_planar(a), projector_.to_planar(b));
    return solve_on_line(constraint);
}

OptimizationResult SpatialOptimizer::solve_on_line(const LinearConstraint& constraint) const {
    const ConstrainedSolution s = LagrangeConstrainedSolver(opt_.solver).solve(model_, constraint);
    return {s.point, s.lambda, ResultMapper(projector_).map(s.point), model_.evaluate(s.point)};
}
