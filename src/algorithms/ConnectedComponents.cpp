#include "ConnectedComponents.h"
#include "ExecutionTrace.h"

#include <fmt/format.h>

#include <algorithm>
#include <queue>
#include <unordered_set>

namespace sociograph {
namespace algorithms {

AlgorithmResult ConnectedComponents::execute(const Graph& graph,
                                             const AlgorithmParams& /*params*/) const {
    ExecutionTrace trace;
    ComponentsData data;

    if (graph.empty()) {
        return trace.succeed(name(), std::move(data), "graph is empty: 0 components");
    }

    std::unordered_set<NodeId> visited;
    for (NodeId seed : graph.nodes()) {
        if (visited.count(seed)) continue;

        const int index = static_cast<int>(data.components.size());
        std::vector<NodeId> component;
        std::queue<NodeId> frontier;
        frontier.push(seed);
        visited.insert(seed);

        while (!frontier.empty()) {
            NodeId node = frontier.front();
            frontier.pop();
            component.push_back(node);
            trace.record(StepType::Visit, node, INVALID_NODE, 0.0, index);

            for (NodeId neighbor : graph.neighbors(node)) {
                if (visited.insert(neighbor).second) {
                    frontier.push(neighbor);
                }
            }
        }

        std::sort(component.begin(), component.end());
        trace.record(StepType::ComponentComplete, component.front(), INVALID_NODE,
                     static_cast<double>(component.size()), index);
        data.components.push_back(std::move(component));
    }

    // Seeds are visited in ascending order, so a stable sort keeps equal-sized
    // components ordered by their smallest member
    std::stable_sort(data.components.begin(), data.components.end(),
                     [](const auto& a, const auto& b) { return a.size() > b.size(); });

    for (std::size_t i = 0; i < data.components.size(); ++i) {
        for (NodeId id : data.components[i]) {
            data.componentOf[id] = i;
        }
    }

    std::string message = fmt::format("{} connected components, largest has {} nodes",
                                      data.count(), data.largestSize());
    return trace.succeed(name(), std::move(data), std::move(message));
}

}  // namespace algorithms
}  // namespace sociograph
