#include "gtest/gtest.h"

#include <cmath>
#include <random>
#include <vector>

#include "LagrangeConstrainedSolver.hpp"
#include "SpatialErrors.hpp"
#include "UnconstrainedSolver.hpp"

namespace {
std::vector<WeightedAmenity> RandomAmenities(std::mt19937_64& rng, int n) {
    std::uniform_real_distribution<double> coord(-20.0, 20.0);
    std::uniform_real_distribution<double> weight(0.1, 5.0);
    std::vector<WeightedAmenity> out;
    for (int i = 0; i < n; ++i) out.push_back({PlanarPoint(coord(rng), coord(rng)), weight(rng)});
    return out;
}
}

TEST(LagrangeConstrainedSolverTest, ProjectsSinglePointOntoXAxis) {
    const WeightedUtilityModel model({{PlanarPoint(111.19, 111.19), 1.0}});
    const LinearConstraint axis(PlanarPoint(0.0, 0.0), PlanarPoint(10.0, 0.0));

    const PlanarPoint free = UnconstrainedSolver().solve(model);
    const ConstrainedSolution s = LagrangeConstrainedSolver().solve(model, axis);

    EXPECT_NEAR(s.point.y, 0.0, 1e-9);
    EXPECT_NEAR(s.point.x, free.x, 1e-9);
    // ∂L/∂y = 2(y - y_1) - λ = 0
    EXPECT_NEAR(s.lambda, -2.0 * 111.19, 1e-9);
}

TEST(LagrangeConstrainedSolverTest, SatisfiesConstraintAndStationarity) {
    std::mt19937_64 rng(2024);
    std::uniform_real_distribution<double> coord(-30.0, 30.0);

    for (int trial = 0; trial < 100; ++trial) {
        const WeightedUtilityModel model(RandomAmenities(rng, 1 + trial % 8));
        const LinearConstraint g(PlanarPoint(coord(rng), coord(rng)), PlanarPoint(coord(rng), coord(rng)));

        const ConstrainedSolution s = LagrangeConstrainedSolver().solve(model, g);
        EXPECT_NEAR(g.residual(s.point), 0.0, 1e-9);

        // ∇U = λ ∇g at the optimum
        const Eigen::Vector2d r = model.gradient().at(s.point) - s.lambda * g.gradient();
        EXPECT_NEAR(r.norm(), 0.0, 1e-6);
    }
}

TEST(LagrangeConstrainedSolverTest, ConstrainedUtilityNeverBeatsUnconstrained) {
    std::mt19937_64 rng(99);
    std::uniform_real_distribution<double> coord(-30.0, 30.0);

    for (int trial = 0; trial < 100; ++trial) {
        const WeightedUtilityModel model(RandomAmenities(rng, 2 + trial % 5));
        const LinearConstraint g(PlanarPoint(coord(rng), coord(rng)), PlanarPoint(coord(rng), coord(rng)));

        const PlanarPoint free = UnconstrainedSolver().solve(model);
        const ConstrainedSolution s = LagrangeConstrainedSolver().solve(model, g);
        EXPECT_GE(model.evaluate(s.point), model.evaluate(free) - 1e-9);

        // no other point on the line does better
        const double t = 0.37;
        const auto ends = g.endpoints();
        const PlanarPoint other(ends.first.x + t * (ends.second.x - ends.first.x),
                                ends.first.y + t * (ends.second.y - ends.first.y));
        EXPECT_LE(model.evaluate(s.point), model.evaluate(other) + 1e-9 * (1.0 + model.evaluate(other)));
    }
}

TEST(LagrangeConstrainedSolverTest, LineThroughGlobalMinimumGivesZeroMultiplier) {
    const WeightedUtilityModel model({{PlanarPoint(-1.0, -1.0), 1.0}, {PlanarPoint(3.0, 3.0), 1.0}});
    const LinearConstraint diagonal(PlanarPoint(0.0, 0.0), PlanarPoint(2.0, 2.0));

    const PlanarPoint free = UnconstrainedSolver().solve(model);
    const ConstrainedSolution s = LagrangeConstrainedSolver().solve(model, diagonal);

    EXPECT_NEAR(s.point.x, free.x, 1e-12);
    EXPECT_NEAR(s.point.y, free.y, 1e-12);
    EXPECT_NEAR(s.lambda, 0.0, 1e-12);
    EXPECT_NEAR(model.evaluate(s.point), model.evaluate(free), 1e-12);
}

TEST(LagrangeConstrainedSolverTest, VerticalConstraintSubstitutesFixedX) {
    const WeightedUtilityModel model({
        {PlanarPoint(0.0, 0.0), 1.0},
        {PlanarPoint(4.0, 2.0), 3.0},
    });
    const LinearConstraint street(PlanarPoint(-1.0, -10.0), PlanarPoint(-1.0, 10.0));

    const ConstrainedSolution s = LagrangeConstrainedSolver().solve(model, street);
    EXPECT_DOUBLE_EQ(s.point.x, -1.0);
    // y stays at the weighted mean of y_i, λ = ∂U/∂x at (-1, y)
    EXPECT_NEAR(s.point.y, 1.5, 1e-12);
    EXPECT_NEAR(s.lambda, 2.0 * (1.0 * (-1.0 - 0.0) + 3.0 * (-1.0 - 4.0)), 1e-12);
    EXPECT_TRUE(std::isfinite(s.lambda));
}

TEST(LagrangeConstrainedSolverTest, NearlyVerticalAgreesWithVertical) {
    const WeightedUtilityModel model({{PlanarPoint(2.0, 1.0), 1.0}, {PlanarPoint(-3.0, 4.0), 2.0}});
    const LinearConstraint vertical(PlanarPoint(1.0, 0.0), PlanarPoint(1.0, 5.0));
    const LinearConstraint steep(PlanarPoint(1.0, 0.0), PlanarPoint(1.0 + 1e-7, 5.0));

    const ConstrainedSolution a = LagrangeConstrainedSolver().solve(model, vertical);
    const ConstrainedSolution b = LagrangeConstrainedSolver().solve(model, steep);
    EXPECT_NEAR(a.point.x, b.point.x, 1e-5);
    EXPECT_NEAR(a.point.y, b.point.y, 1e-5);
}

TEST(LagrangeConstrainedSolverTest, LargeWeightsOnTheXAxis) {
    const WeightedUtilityModel model({{PlanarPoint(1.0, 2.0), 4e5}, {PlanarPoint(3.0, 1.0), 6e5}});
    const LinearConstraint axis(PlanarPoint(0.0, 0.0), PlanarPoint(10.0, 0.0));

    const ConstrainedSolution s = LagrangeConstrainedSolver().solve(model, axis);
    EXPECT_NEAR(s.point.x, 2.2, 1e-9);
    EXPECT_NEAR(s.point.y, 0.0, 1e-9);
    // λ = ∂U/∂y on the axis = 2 Σ w_i (0 - y_i)
    EXPECT_NEAR(s.lambda, -2.0 * (4e5 * 2.0 + 6e5 * 1.0), 1e-3);
}

TEST(LagrangeConstrainedSolverTest, OptimumDoesNotDependOnWeightScale) {
    const std::vector<WeightedAmenity> unit = {
        {PlanarPoint(1.0, 2.0), 4.0},
        {PlanarPoint(3.0, 1.0), 6.0},
        {PlanarPoint(-2.0, 0.5), 1.0},
    };
    const LinearConstraint constraints[] = {
        LinearConstraint(PlanarPoint(0.0, 0.0), PlanarPoint(10.0, 0.0)),
        LinearConstraint(PlanarPoint(-1.0, 3.0), PlanarPoint(4.0, -2.5)),
        LinearConstraint(PlanarPoint(0.5, 0.0), PlanarPoint(0.5001, 40.0)),
        LinearConstraint(PlanarPoint(-1.0, -10.0), PlanarPoint(-1.0, 10.0)),
    };

    for (const auto& g : constraints) {
        const ConstrainedSolution reference = LagrangeConstrainedSolver().solve(WeightedUtilityModel(unit), g);
        for (double scale : {1e6, 1e9, 1e-6, 1e-13}) {
            std::vector<WeightedAmenity> scaled = unit;
            for (auto& a : scaled) a.weight *= scale;

            const ConstrainedSolution s = LagrangeConstrainedSolver().solve(WeightedUtilityModel(scaled), g);
            EXPECT_NEAR(s.point.x, reference.point.x, 1e-9) << "scale " << scale;
            EXPECT_NEAR(s.point.y, reference.point.y, 1e-9) << "scale " << scale;
            // λ carries the units of U, so it scales with the weights
            EXPECT_NEAR(s.lambda / scale, reference.lambda, 1e-9 * (1.0 + std::abs(reference.lambda)))
                << "scale " << scale;
        }
    }
}

TEST(LagrangeConstrainedSolverTest, RaisesSolverErrorWhenSystemIsRankDeficient) {
    SolverOptions opt;
    opt.singular_tolerance = 1.0;
    const WeightedUtilityModel model({{PlanarPoint(1.0, 2.0), 1.0}, {PlanarPoint(3.0, 1.0), 1.0}});

    const LinearConstraint sloped(PlanarPoint(0.0, 0.0), PlanarPoint(2.0, 1.0));
    EXPECT_THROW(LagrangeConstrainedSolver(opt).solve(model, sloped), SolverError);

    const LinearConstraint vertical(PlanarPoint(1.0, 0.0), PlanarPoint(1.0, 1.0));
    EXPECT_THROW(LagrangeConstrainedSolver(opt).solve(model, vertical), SolverError);
}
