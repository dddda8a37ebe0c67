#pragma once

#include "../core/Graph.h"
#include "AlgorithmOptions.h"
#include "AlgorithmResult.h"

namespace sociograph {

/// Common contract of the analysis algorithms: graph + parameters -> result.
///
/// Implementations are stateless apart from the options they were created
/// with, never mutate the graph, and report every failure through the
/// returned AlgorithmResult instead of throwing.
class IGraphAlgorithm {
public:
    virtual ~IGraphAlgorithm() = default;

    /// Run the algorithm to completion on the calling thread
    virtual AlgorithmResult execute(const Graph& graph, const AlgorithmParams& params) const = 0;

    virtual AlgorithmKind kind() const = 0;

    /// Registry name, also stored in AlgorithmResult::name
    virtual const char* name() const = 0;

    /// One-line human-readable description
    virtual const char* description() const = 0;
};

}  // namespace sociograph
