#pragma once

struct SolverOptions {
    // Relative pivot threshold below which the stationary system is treated as singular.
    double singular_tolerance = 1e-12;
};
