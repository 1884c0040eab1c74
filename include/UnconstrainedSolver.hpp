#pragma once
#include "SolverOptions.hpp"
#include "WeightedUtilityModel.hpp"

// Stationary point of U: solves ∇U(p) = H p + c = 0.
class UnconstrainedSolver {
public:
    explicit UnconstrainedSolver(SolverOptions opt = {}) : opt_(opt) {}

    PlanarPoint solve(const WeightedUtilityModel& model) const;

private:
    SolverOptions opt_;
};
