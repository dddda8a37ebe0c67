#pragma once

#include "sociograph/algorithms/IGraphAlgorithm.h"

namespace sociograph {
namespace algorithms {

/// Partitions the graph into maximal connected subgraphs by repeated BFS.
/// Components are sorted largest first; equal sizes by smallest member id.
class ConnectedComponents : public IGraphAlgorithm {
public:
    ConnectedComponents() = default;

    AlgorithmResult execute(const Graph& graph, const AlgorithmParams& params) const override;

    AlgorithmKind kind() const override { return AlgorithmKind::ConnectedComponents; }
    const char* name() const override { return "ConnectedComponents"; }
    const char* description() const override { return "Connected components by BFS sweep"; }
};

}  // namespace algorithms
}  // namespace sociograph
