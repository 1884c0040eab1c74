#include "UnconstrainedSolver.hpp"
#include "SpatialErrors.hpp"
#include <Eigen/Cholesky>

PlanarPoint UnconstrainedSolver::solve(const WeightedUtilityModel& model) const {
    const AffineGradient g = model.gradient();

    // H = 2W I is SPD whenever W > 0; conditioning is judged relative to its largest entry
    Eigen::LLT<Eigen::Matrix2d> llt(g.H);
    const double dmax = g.H.diagonal().cwiseAbs().maxCoeff();
    if (llt.info() != Eigen::Success || !(dmax > 0.0) ||
        g.H.diagonal().minCoeff() <= opt_.singular_tolerance * dmax) {
        throw SolverError("UnconstrainedSolver: Hessian is not positive definite.");
    }
    const Eigen::Vector2d p = llt.solve(-g.c);
    if (llt.info() != Eigen::Success || !p.allFinite()) {
        throw SolverError("UnconstrainedSolver: gradient system has no finite solution.");
    }
    return PlanarPoint(p);
}
