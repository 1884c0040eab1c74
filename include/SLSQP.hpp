#pragma once
#include "LinearConstraint.hpp"
#include "WeightedUtilityModel.hpp"
#include <nlopt.hpp>

struct NloptOptions {
    int max_evals = 2000;
    double rel_tol = 1e-10;
    double abs_tol = 1e-12;
    double constraint_tol = 1e-10;
};

struct NloptResult {
    PlanarPoint point;
    double fval;
    nlopt::result status;
};

// Numeric minimisation of U (optionally subject to g = 0) with nlopt's SLSQP.
// Cross-check for the analytic solvers; they never call it.
NloptResult minimize_slsqp(const WeightedUtilityModel& model,
                           const PlanarPoint& start,
                           const LinearConstraint* constraint,
                           const NloptOptions& opt);
