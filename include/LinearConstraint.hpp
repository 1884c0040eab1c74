#pragma once
#include "Points.hpp"
#include <Eigen/Dense>
#include <utility>

// Line through two distinct planar points, as g(x,y) = 0 with
//   g(x,y) = y - m x - b      (slope-intercept form)
//   g(x,y) = x - x1           (fixed-x form, vertical segment)
class LinearConstraint {
public:
    enum class Form { SlopeIntercept, FixedX };

    LinearConstraint(PlanarPoint p1, PlanarPoint p2);

    Form form() const noexcept { return form_; }
    bool vertical() const noexcept { return form_ == Form::FixedX; }

    // Throw std::logic_error when called on the other form.
    double slope() const;
    double intercept() const;
    double fixed_x() const;

    double residual(double x, double y) const;
    double residual(const PlanarPoint& p) const { return residual(p.x, p.y); }

    // g is affine: g(p) = a·p + g0
    Eigen::Vector2d gradient() const;
    double offset() const;

    std::pair<PlanarPoint, PlanarPoint> endpoints() const { return {p1_, p2_}; }

private:
    PlanarPoint p1_, p2_;
    Form form_;
    double m_ = 0.0;
    double b_ = 0.0;
};
