#pragma once

#include "Graph.h"

#include <cstdint>
#include <optional>

namespace sociograph {

struct SampleGraphOptions {
    std::size_t nodeCount = 20;
    double edgeProbability = 0.3;         ///< Chance of an edge between any pair
    Point center{400.0, 300.0};
    double minActivity = 0.1;
    double maxActivity = 1.0;
    double minInteraction = 1.0;
    double maxInteraction = 50.0;
    std::optional<uint64_t> seed;         ///< Fixed seed for reproducible graphs
};

/// Builds demonstration graphs: nodes evenly spaced on a circle with random
/// activity/interaction scores, connected by independent coin flips per pair.
class SampleGraphGenerator {
public:
    static Graph generate(const SampleGraphOptions& options = {});

    /// Circle radius used for a given node count
    static double radiusFor(std::size_t nodeCount);
};

}  // namespace sociograph
