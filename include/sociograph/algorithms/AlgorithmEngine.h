#pragma once

#include "AlgorithmRegistry.h"

#include <string>

namespace sociograph {

/// Entry point for collaborators: dispatches a request by kind or name to the
/// registered algorithm and returns its result.
///
/// Every call returns an AlgorithmResult; unknown names produce a failed
/// result with AlgorithmError::InvalidOperation.
class AlgorithmEngine {
public:
    AlgorithmEngine() = default;
    explicit AlgorithmEngine(const AlgorithmOptions& options) : options_(options) {}

    void setOptions(const AlgorithmOptions& options) { options_ = options; }
    const AlgorithmOptions& options() const { return options_; }

    AlgorithmResult run(AlgorithmKind kind, const Graph& graph,
                        const AlgorithmParams& params = {}) const;
    AlgorithmResult run(const std::string& name, const Graph& graph,
                        const AlgorithmParams& params = {}) const;

    // Convenience wrappers
    AlgorithmResult breadthFirstSearch(const Graph& graph, NodeId start) const;
    AlgorithmResult depthFirstSearch(const Graph& graph, NodeId start) const;
    AlgorithmResult dijkstra(const Graph& graph, NodeId start, NodeId target) const;
    AlgorithmResult aStar(const Graph& graph, NodeId start, NodeId target) const;
    AlgorithmResult connectedComponents(const Graph& graph) const;
    AlgorithmResult degreeCentrality(const Graph& graph) const;
    AlgorithmResult degreeCentrality(const Graph& graph, std::size_t topK) const;
    AlgorithmResult welshPowell(const Graph& graph) const;

private:
    AlgorithmOptions options_;
};

}  // namespace sociograph
