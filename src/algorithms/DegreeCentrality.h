#pragma once

#include "sociograph/algorithms/IGraphAlgorithm.h"

#include <cstddef>

namespace sociograph {
namespace algorithms {

/// centrality(v) = degree(v) / (n - 1), 0 for a single-node graph.
/// Ranking is by degree descending, ties by ascending id.
class DegreeCentrality : public IGraphAlgorithm {
public:
    explicit DegreeCentrality(std::size_t defaultTopK = 5) : defaultTopK_(defaultTopK) {}

    AlgorithmResult execute(const Graph& graph, const AlgorithmParams& params) const override;

    AlgorithmKind kind() const override { return AlgorithmKind::DegreeCentrality; }
    const char* name() const override { return "DegreeCentrality"; }
    const char* description() const override { return "Normalized degree centrality ranking"; }

private:
    std::size_t defaultTopK_;
};

}  // namespace algorithms
}  // namespace sociograph
