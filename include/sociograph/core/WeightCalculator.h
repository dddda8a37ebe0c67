#pragma once

#include "Graph.h"

namespace sociograph {

/// Per-attribute breakdown of the distance between two nodes
struct PropertyDifferences {
    double activity = 0.0;
    double interaction = 0.0;
    double connection = 0.0;
    double total = 0.0;  ///< Euclidean distance over the three attributes
};

/// Derives edge weights from endpoint similarity.
///
/// weight = 1 / (1 + sqrt(dActivity^2 + dInteraction^2 + dConnectionCount^2))
///
/// Weight lies in (0, 1] and is 1 exactly when both nodes carry identical
/// (activity, interaction, connectionCount) triples. Shortest-path algorithms
/// minimize cost = 1 / weight, so similar nodes are cheap to traverse between.
class WeightCalculator {
public:
    static double weight(const NodeData& a, const NodeData& b);
    static double cost(const NodeData& a, const NodeData& b);

    /// Weight expressed as a percentage (0, 100]
    static double similarityScore(const NodeData& a, const NodeData& b);

    static PropertyDifferences differences(const NodeData& a, const NodeData& b);

private:
    static double attributeDistance(const NodeData& a, const NodeData& b);
};

}  // namespace sociograph
