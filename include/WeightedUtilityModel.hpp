#pragma once
#include "Points.hpp"
#include <Eigen/Dense>
#include <vector>

// ∇U as an affine map of p = (x, y): ∇U(p) = H p + c.
struct AffineGradient {
    Eigen::Matrix2d H;
    Eigen::Vector2d c;

    Eigen::Vector2d at(double x, double y) const { return H * Eigen::Vector2d(x, y) + c; }
    Eigen::Vector2d at(const PlanarPoint& p) const { return at(p.x, p.y); }
};

// U(x,y) = Σ w_i [(x - x_i)^2 + (y - y_i)^2]
// Data: locations p_i (km, shared origin) and weights w_i >= 0 with Σ w_i > 0.
class WeightedUtilityModel {
public:
    using Vec = Eigen::VectorXd;
    using Mat2X = Eigen::Matrix2Xd;

    explicit WeightedUtilityModel(const std::vector<WeightedAmenity>& amenities);

    int size() const noexcept { return static_cast<int>(w_.size()); }
    double total_weight() const noexcept { return W_; }
    WeightedAmenity amenity(int i) const;

    double evaluate(double x, double y) const;
    double evaluate(const PlanarPoint& p) const { return evaluate(p.x, p.y); }

    // ∂U/∂x = 2 Σ w_i (x - x_i),  ∂U/∂y = 2 Σ w_i (y - y_i)
    // collected as H = 2W I,  c = -2 Σ w_i p_i.
    AffineGradient gradient() const;
    const Eigen::Matrix2d& hessian() const noexcept { return H_; }

private:
    Mat2X P_;            // columns p_i
    Vec w_;
    double W_;           // Σ w_i
    Eigen::Vector2d wp_; // Σ w_i p_i
    Eigen::Matrix2d H_;
};
