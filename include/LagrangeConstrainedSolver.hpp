#pragma once
#include "LinearConstraint.hpp"
#include "SolverOptions.hpp"
#include "WeightedUtilityModel.hpp"

struct ConstrainedSolution {
    PlanarPoint point;
    double lambda;  // multiplier of g in L = U - λ g; 0 when the line passes through the global minimum
};

// Stationary point of L(x,y,λ) = U(x,y) - λ g(x,y):
//   ∂L/∂x = ∂U/∂x - λ ∂g/∂x = 0
//   ∂L/∂y = ∂U/∂y - λ ∂g/∂y = 0
//   ∂L/∂λ = -g(x,y)          = 0
// Linear in (x, y, λ) since U is quadratic and g affine; solved exactly by full-pivot LU.
class LagrangeConstrainedSolver {
public:
    explicit LagrangeConstrainedSolver(SolverOptions opt = {}) : opt_(opt) {}

    ConstrainedSolution solve(const WeightedUtilityModel& model,
                              const LinearConstraint& constraint) const;

private:
    SolverOptions opt_;

    ConstrainedSolution solve_general(const AffineGradient& dU, const LinearConstraint& g) const;
    ConstrainedSolution solve_fixed_x(const AffineGradient& dU, double x1) const;
};
