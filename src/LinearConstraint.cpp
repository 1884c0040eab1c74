#include "LinearConstraint.hpp"
#include "SpatialErrors.hpp"

LinearConstraint::LinearConstraint(PlanarPoint p1, PlanarPoint p2)
    : p1_(p1), p2_(p2), form_(Form::SlopeIntercept)
{
    if (!p1_.finite() || !p2_.finite()) {
        throw ValidationError("LinearConstraint: endpoints must be finite.");
    }
    if (p1_ == p2_) {
        throw ValidationError("degenerate constraint: endpoints coincide");
    }
    if (p2_.x == p1_.x) {
        form_ = Form::FixedX;
        return;
    }
    m_ = (p2_.y - p1_.y) / (p2_.x - p1_.x);
    b_ = p1_.y - m_ * p1_.x;
}

double LinearConstraint::slope() const {
    if (form_ != Form::SlopeIntercept)
        throw std::logic_error("LinearConstraint::slope: vertical constraint has no slope");
    return m_;
}

double LinearConstraint::intercept() const {
    if (form_ != Form::SlopeIntercept)
        throw std::logic_error("LinearConstraint::intercept: vertical constraint has no intercept");
    return b_;
}

double LinearConstraint::fixed_x() const {
    if (form_ != Form::FixedX)
        throw std::logic_error("LinearConstraint::fixed_x: constraint is not vertical");
    return p1_.x;
}

double LinearConstraint::residual(double x, double y) const {
    if (form_ == Form::FixedX) return x - p1_.x;
    return y - m_ * x - b_;
}

Eigen::Vector2d LinearConstraint::gradient() const {
    if (form_ == Form::FixedX) return {1.0, 0.0};
    return {-m_, 1.0};
}

double LinearConstraint::offset() const {
    return form_ == Form::FixedX ? -p1_.x : -b_;
}
