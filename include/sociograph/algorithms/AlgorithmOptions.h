#pragma once

#include "../core/Types.h"

#include <cstddef>
#include <optional>

namespace sociograph {

/// Engine-wide tuning shared by all algorithm instances
struct AlgorithmOptions {
    /// Multiplier applied to the Euclidean distance in A*'s heuristic.
    /// An empirical calibration against cost = 1/weight >= 1, not a proven
    /// admissible bound; lower it if node coordinates are widely spread.
    double heuristicScale = 0.01;

    /// Top-k used by degree centrality when the caller gives none
    std::size_t defaultTopK = 5;
};

/// Per-invocation parameters. Each algorithm reads only what it needs.
struct AlgorithmParams {
    std::optional<NodeId> startId;
    std::optional<NodeId> targetId;
    std::optional<std::size_t> topK;

    static AlgorithmParams from(NodeId start) {
        AlgorithmParams params;
        params.startId = start;
        return params;
    }

    static AlgorithmParams between(NodeId start, NodeId target) {
        AlgorithmParams params;
        params.startId = start;
        params.targetId = target;
        return params;
    }

    static AlgorithmParams top(std::size_t k) {
        AlgorithmParams params;
        params.topK = k;
        return params;
    }
};

}  // namespace sociograph
