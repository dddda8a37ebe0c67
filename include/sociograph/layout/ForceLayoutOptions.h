#pragma once

#include <cstddef>

namespace sociograph {

/// Tuning of the force-directed solver
struct ForceLayoutOptions {
    // Forces
    double repulsion = 15000.0;    ///< Coulomb constant, force = repulsion / d^2
    double attraction = 0.04;      ///< Spring constant along edges
    double springLength = 60.0;    ///< Rest length of edge springs
    bool weightModulation = true;  ///< Scale spring strength by (1 + edge weight)
    double gravity = 0.1;          ///< Pull toward the centroid, scaled by temperature

    // Integration
    double damping = 0.85;         ///< Velocity retained per step, must be < 1
    double minDistance = 80.0;     ///< Lower clamp of d in the repulsion term
    double maxVelocity = 50.0;     ///< Speed cap per step

    // Cooling
    double initialTemperature = 1.0;
    double coolingRate = 0.999;
    double minTemperature = 0.01;

    std::size_t iterations = 150;  ///< Step budget of run()

    static ForceLayoutOptions defaults() { return {}; }

    /// Short springs and weak repulsion for dense, small drawings
    static ForceLayoutOptions compact() {
        ForceLayoutOptions options;
        options.repulsion = 6000.0;
        options.springLength = 40.0;
        options.minDistance = 50.0;
        options.gravity = 0.2;
        return options;
    }

    /// Strong repulsion and long springs for sparse, readable drawings
    static ForceLayoutOptions spread() {
        ForceLayoutOptions options;
        options.repulsion = 30000.0;
        options.springLength = 100.0;
        options.minDistance = 100.0;
        options.gravity = 0.05;
        return options;
    }
};

}  // namespace sociograph
