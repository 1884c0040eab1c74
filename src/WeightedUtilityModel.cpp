#include "WeightedUtilityModel.hpp"
#include "SpatialErrors.hpp"
#include <cmath>
#include <sstream>

WeightedUtilityModel::WeightedUtilityModel(const std::vector<WeightedAmenity>& amenities)
: W_(0.0)
{
    const int k = static_cast<int>(amenities.size());
    if (k == 0)
        throw ValidationError("WeightedUtilityModel: need at least one amenity.");

    P_.resize(2, k);
    w_.resize(k);
    for (int i = 0; i < k; ++i) {
        const auto& a = amenities[static_cast<size_t>(i)];
        if (!std::isfinite(a.weight) || a.weight < 0.0) {
            std::ostringstream os;
            os << "WeightedUtilityModel: amenity " << i << " has invalid weight " << a.weight
               << " (weights must be finite and >= 0).";
            throw ValidationError(os.str());
        }
        if (!a.location.finite()) {
            std::ostringstream os;
            os << "WeightedUtilityModel: amenity " << i << " has a non-finite location.";
            throw ValidationError(os.str());
        }
        P_.col(i) = a.location.vec();
        w_[i] = a.weight;
    }

    W_ = w_.sum();
    if (!(W_ > 0.0))
        throw ValidationError("WeightedUtilityModel: total weight must be positive.");

    wp_ = P_ * w_;
    H_ = 2.0 * W_ * Eigen::Matrix2d::Identity();
}

WeightedAmenity WeightedUtilityModel::amenity(int i) const {
    if (i < 0 || i >= size())
        throw std::out_of_range("WeightedUtilityModel::amenity: index out of range");
    return {PlanarPoint(P_.col(i)), w_[i]};
}

double WeightedUtilityModel::evaluate(double x, double y) const {
    const Eigen::Vector2d p(x, y);
    // Σ w_i ||p - p_i||^2
    const Vec d2 = (P_.colwise() - p).colwise().squaredNorm().transpose();
    return w_.dot(d2);
}

AffineGradient WeightedUtilityModel::gradient() const {
    return {H_, -2.0 * wp_};
}
