#pragma once

#include "sociograph/algorithms/IGraphAlgorithm.h"

namespace sociograph {
namespace algorithms {

/// Level-order traversal from a start node.
///
/// Nodes are marked at discovery, so each is enqueued once; levels are hop
/// counts from the start.
class BreadthFirstSearch : public IGraphAlgorithm {
public:
    BreadthFirstSearch() = default;

    AlgorithmResult execute(const Graph& graph, const AlgorithmParams& params) const override;

    AlgorithmKind kind() const override { return AlgorithmKind::BreadthFirstSearch; }
    const char* name() const override { return "BFS"; }
    const char* description() const override { return "Breadth-first traversal by hop level"; }
};

/// Iterative depth-first traversal from a start node.
///
/// Neighbors are pushed in reverse insertion order so the first-inserted
/// neighbor is explored first; nodes are marked visited when popped.
class DepthFirstSearch : public IGraphAlgorithm {
public:
    DepthFirstSearch() = default;

    AlgorithmResult execute(const Graph& graph, const AlgorithmParams& params) const override;

    AlgorithmKind kind() const override { return AlgorithmKind::DepthFirstSearch; }
    const char* name() const override { return "DFS"; }
    const char* description() const override { return "Depth-first traversal with explicit stack"; }
};

}  // namespace algorithms
}  // namespace sociograph
