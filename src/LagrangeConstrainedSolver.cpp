#include "LagrangeConstrainedSolver.hpp"
#include "SpatialErrors.hpp"
#include <Eigen/LU>
#include <cmath>
#include <string>

namespace {
template <class Mat, class Vec>
Vec solve_exact(const Mat& A, const Vec& rhs, double tol, const char* who) {
    Eigen::FullPivLU<Mat> lu(A);
    lu.setThreshold(tol);
    if (!lu.isInvertible()) {
        throw SolverError(std::string(who) + ": stationary-point system is singular.");
    }
    Vec z = lu.solve(rhs);
    if (!z.allFinite()) {
        throw SolverError(std::string(who) + ": stationary-point system has no finite solution.");
    }
    return z;
}

// Curvature scale of U; dividing the ∂L rows by it makes the system independent of Σ w_i.
double curvature_scale(const AffineGradient& dU, const char* who) {
    const double s = dU.H.cwiseAbs().maxCoeff();
    if (!(s > 0.0) || !std::isfinite(s)) {
        throw SolverError(std::string(who) + ": Hessian of U vanishes.");
    }
    return s;
}
}

ConstrainedSolution LagrangeConstrainedSolver::solve(const WeightedUtilityModel& model,
                                                     const LinearConstraint& constraint) const {
    const AffineGradient dU = model.gradient();
    if (constraint.vertical()) {
        return solve_fixed_x(dU, constraint.fixed_x());
    }
    return solve_general(dU, constraint);
}

ConstrainedSolution LagrangeConstrainedSolver::solve_general(const AffineGradient& dU,
                                                             const LinearConstraint& g) const {
    const double s = curvature_scale(dU, "LagrangeConstrainedSolver");
    const Eigen::Vector2d a = g.gradient();
    const double na = a.norm();
    const Eigen::Vector2d u = a / na;

    // With H' = H/s, c' = c/s, â = a/|a| and ν = λ|a|/s:
    // [ H'   -â ] [x y]^T   [ -c'      ]
    // [ â^T   0 ] [  ν  ] = [ -g0/|a|  ]
    Eigen::Matrix3d A = Eigen::Matrix3d::Zero();
    A.topLeftCorner<2, 2>() = dU.H / s;
    A.topRightCorner<2, 1>() = -u;
    A.bottomLeftCorner<1, 2>() = u.transpose();

    Eigen::Vector3d rhs;
    rhs << -dU.c / s, -g.offset() / na;

    const Eigen::Vector3d z = solve_exact(A, rhs, opt_.singular_tolerance, "LagrangeConstrainedSolver");
    return {PlanarPoint(z[0], z[1]), z[2] * s / na};
}

ConstrainedSolution LagrangeConstrainedSolver::solve_fixed_x(const AffineGradient& dU, double x1) const {
    const double s = curvature_scale(dU, "LagrangeConstrainedSolver");

    // g = x - x1, ∇g = (1, 0). With x = x1 substituted the unknowns are (y, ν = λ/s):
    //   H_xy/s y - ν = (-c_x - H_xx x1)/s
    //   H_yy/s y     = (-c_y - H_yx x1)/s
    Eigen::Matrix2d A;
    A << dU.H(0, 1) / s, -1.0,
         dU.H(1, 1) / s,  0.0;
    const Eigen::Vector2d rhs((-dU.c[0] - dU.H(0, 0) * x1) / s,
                              (-dU.c[1] - dU.H(1, 0) * x1) / s);

    const Eigen::Vector2d z = solve_exact(A, rhs, opt_.singular_tolerance, "LagrangeConstrainedSolver");
    return {PlanarPoint(x1, z[0]), z[1] * s};
}
