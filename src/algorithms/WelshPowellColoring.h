#pragma once

#include "sociograph/algorithms/IGraphAlgorithm.h"

namespace sociograph {
namespace algorithms {

/// Greedy proper coloring in Welsh-Powell order (degree descending, id
/// ascending). Each pass assigns the next color to every uncolored node with
/// no neighbor already holding it. Uses at most maxDegree + 1 colors.
class WelshPowellColoring : public IGraphAlgorithm {
public:
    WelshPowellColoring() = default;

    AlgorithmResult execute(const Graph& graph, const AlgorithmParams& params) const override;

    AlgorithmKind kind() const override { return AlgorithmKind::WelshPowell; }
    const char* name() const override { return "WelshPowell"; }
    const char* description() const override { return "Welsh-Powell greedy graph coloring"; }
};

}  // namespace algorithms
}  // namespace sociograph
