#include "WelshPowellColoring.h"
#include "ExecutionTrace.h"

#include <fmt/format.h>

#include <algorithm>

namespace sociograph {
namespace algorithms {

AlgorithmResult WelshPowellColoring::execute(const Graph& graph,
                                             const AlgorithmParams& /*params*/) const {
    ExecutionTrace trace;
    ColoringData data;

    if (graph.empty()) {
        return trace.succeed(name(), std::move(data), "graph is empty: 0 colors");
    }

    data.nodeOrder = graph.nodes();
    std::stable_sort(data.nodeOrder.begin(), data.nodeOrder.end(),
                     [&graph](NodeId a, NodeId b) { return graph.degree(a) > graph.degree(b); });
    trace.record(StepType::Sorted, data.nodeOrder.front(), INVALID_NODE,
                 static_cast<double>(data.nodeOrder.size()));

    auto hasNeighborWithColor = [&](NodeId node, int color) {
        for (NodeId neighbor : graph.neighbors(node)) {
            auto it = data.coloring.find(neighbor);
            if (it != data.coloring.end() && it->second == color) return true;
        }
        return false;
    };

    int color = 0;
    while (data.coloring.size() < data.nodeOrder.size()) {
        ++color;
        for (NodeId node : data.nodeOrder) {
            if (data.coloring.count(node)) continue;
            if (hasNeighborWithColor(node, color)) continue;
            data.coloring[node] = color;
            trace.record(StepType::Color, node, INVALID_NODE, 0.0, color);
        }
    }
    data.chromaticCount = color;

    std::string message = fmt::format("graph colored with {} colors", data.chromaticCount);
    return trace.succeed(name(), std::move(data), std::move(message));
}

}  // namespace algorithms
}  // namespace sociograph
