#include "SpatialOptimizer.hpp"
#include "SLSQP.hpp"
#include "SpatialErrors.hpp"

#include <cmath>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

// Worked example: where to live around Microcentro (Buenos Aires), close to three
// amenities weighted 1, 2, 3, optionally restricted to Paraguay street.

namespace {

void print_planar(const char* label, const PlanarPoint& p) {
    std::cout << label << "(" << p.x << ", " << p.y << ") km\n";
}

void print_geodetic(const char* label, const GeodeticPoint& g) {
    std::cout << label << "lat " << g.lat << ", lon " << g.lon << "\n";
}

int run(bool verify) {
    const GeodeticPoint origin{-34.595228892628455, -58.37788955179407};

    const std::vector<GeodeticAmenity> amenities = {
        {{-34.596156182566006, -58.38467378144673}, 1.0, "disco"},
        {{-34.6034559421601,   -58.38094967105265}, 2.0, "obelisk"},
        {{-34.598868856938026, -58.37401050128944}, 3.0, "galerias-pacifico"},
    };
    const GeodeticPoint street_a{-34.598181576896955, -58.38358725902865};
    const GeodeticPoint street_b{-34.597792990501425, -58.38026132000657};

    const SpatialOptimizer opt(origin, amenities);

    std::cout.setf(std::ios::fixed);
    std::cout.precision(4);
    for (size_t i = 0; i < amenities.size(); ++i) {
        const auto& a = opt.planar_amenities()[i];
        std::cout << "Local coords - " << amenities[i].name << ": (" << a.location.x << ", "
                  << a.location.y << ") km, weight " << a.weight << "\n";
    }

    const OptimizationResult unc = opt.optimize();
    const OptimizationResult con = opt.optimize_on_line(street_a, street_b);

    std::cout.precision(9);
    std::cout << "\n";
    print_planar("Optimal point (unconstrained): ", unc.planar);
    print_planar("Optimal point (constrained):   ", con.planar);
    std::cout << "Lagrange multiplier:           " << *con.multiplier << "\n";
    std::cout << "Utility (unconstrained / constrained): " << unc.utility << " / " << con.utility << "\n";

    std::cout << "\n--- Global coordinates ---\n";
    std::cout.precision(12);
    print_geodetic("Unconstrained optimal location: ", unc.geodetic);
    print_geodetic("Constrained optimal location:   ", con.geodetic);

    if (verify) {
        const LinearConstraint street(opt.projector().to_planar(street_a), opt.projector().to_planar(street_b));
        const NloptResult num = minimize_slsqp(opt.model(), PlanarPoint(0.0, 0.0), &street, NloptOptions{});
        const double dx = num.point.x - con.planar.x;
        const double dy = num.point.y - con.planar.y;
        std::cout << "\nSLSQP cross-check (status " << static_cast<int>(num.status) << "): |Δ| = "
                  << std::sqrt(dx * dx + dy * dy) << " km\n";
    }
    return 0;
}

}

int main(int argc, char** argv) {
    bool verify = false;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--verify") == 0) {
            verify = true;
        } else {
            std::cerr << "usage: " << argv[0] << " [--verify]\n";
            return 1;
        }
    }

    try {
        return run(verify);
    } catch (const ValidationError& e) {
        std::cerr << "invalid input: " << e.what() << "\n";
    } catch (const DegenerateProjection& e) {
        std::cerr << "degenerate projection: " << e.what() << "\n";
    } catch (const SolverError& e) {
        std::cerr << "solver error: " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
    }
    return 1;
}
