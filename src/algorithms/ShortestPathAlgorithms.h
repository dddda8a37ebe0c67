#pragma once

#include "sociograph/algorithms/IGraphAlgorithm.h"

#include <functional>

namespace sociograph {
namespace algorithms {

/// Best-first search over edge costs (1 / weight) shared by Dijkstra and A*.
///
/// Uses a binary heap with lazy deletion: improved entries are pushed again and
/// stale ones are skipped when popped. Equal keys are served in insertion order.
class ShortestPathSearch {
public:
    using Heuristic = std::function<double(NodeId)>;

    static AlgorithmResult run(const char* name, const Graph& graph,
                               const AlgorithmParams& params, const Heuristic& heuristic);
};

/// Single-pair shortest path with no heuristic
class DijkstraShortestPath : public IGraphAlgorithm {
public:
    DijkstraShortestPath() = default;

    AlgorithmResult execute(const Graph& graph, const AlgorithmParams& params) const override;

    AlgorithmKind kind() const override { return AlgorithmKind::Dijkstra; }
    const char* name() const override { return "Dijkstra"; }
    const char* description() const override { return "Minimum-cost path by Dijkstra's algorithm"; }
};

/// Single-pair shortest path guided by scaled Euclidean distance to the target
class AStarShortestPath : public IGraphAlgorithm {
public:
    explicit AStarShortestPath(double heuristicScale = 0.01) : heuristicScale_(heuristicScale) {}

    AlgorithmResult execute(const Graph& graph, const AlgorithmParams& params) const override;

    AlgorithmKind kind() const override { return AlgorithmKind::AStar; }
    const char* name() const override { return "AStar"; }
    const char* description() const override { return "Minimum-cost path by A* search"; }

    double heuristicScale() const { return heuristicScale_; }

private:
    double heuristicScale_;
};

}  // namespace algorithms
}  // namespace sociograph
