#pragma once
#include <stdexcept>
#include <string>

// Malformed input detected before any solve attempt.
struct ValidationError : std::invalid_argument {
    explicit ValidationError(const std::string& what) : std::invalid_argument(what) {}
};

// Reference origin at/near a pole: the inverse longitude map is undefined.
struct DegenerateProjection : std::domain_error {
    explicit DegenerateProjection(const std::string& what) : std::domain_error(what) {}
};

// Stationary-point system singular or solution not finite.
struct SolverError : std::runtime_error {
    explicit SolverError(const std::string& what) : std::runtime_error(what) {}
};
