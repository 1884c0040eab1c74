#include "SLSQP.hpp"
#include <vector>

namespace {
double objective(unsigned /*n*/, const double* x, double* grad, void* data) {
    const auto* model = static_cast<const WeightedUtilityModel*>(data);
    if (grad) {
        const Eigen::Vector2d g = model->gradient().at(x[0], x[1]);
        grad[0] = g[0];
        grad[1] = g[1];
    }
    return model->evaluate(x[0], x[1]);
}

double equality(unsigned /*n*/, const double* x, double* grad, void* data) {
    const auto* g = static_cast<const LinearConstraint*>(data);
    if (grad) {
        const Eigen::Vector2d a = g->gradient();
        grad[0] = a[0];
        grad[1] = a[1];
    }
    return g->residual(x[0], x[1]);
}
}

NloptResult minimize_slsqp(const WeightedUtilityModel& model,
                           const PlanarPoint& start,
                           const LinearConstraint* constraint,
                           const NloptOptions& opt) {
    nlopt::opt opti(nlopt::LD_SLSQP, 2);

    // nlopt takes void*; the callbacks only read through it
    opti.set_min_objective(objective, const_cast<WeightedUtilityModel*>(&model));
    if (constraint) {
        opti.add_equality_constraint(equality, const_cast<LinearConstraint*>(constraint),
                                     opt.constraint_tol);
    }
    opti.set_maxeval(opt.max_evals);
    opti.set_xtol_rel(opt.rel_tol);
    opti.set_xtol_abs(opt.abs_tol);

    std::vector<double> x{start.x, start.y};
    double minf;
    nlopt::result status = opti.optimize(x, minf);

    return {PlanarPoint(x[0], x[1]), minf, status};
}
