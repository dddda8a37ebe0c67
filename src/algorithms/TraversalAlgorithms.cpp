#include "TraversalAlgorithms.h"
#include "ExecutionTrace.h"

#include <fmt/format.h>

#include <queue>
#include <unordered_set>
#include <utility>
#include <vector>

namespace sociograph {
namespace algorithms {

AlgorithmResult BreadthFirstSearch::execute(const Graph& graph,
                                            const AlgorithmParams& params) const {
    ExecutionTrace trace;
    if (auto error = checkStartNode(graph, params); !error.empty()) {
        return trace.fail(name(), AlgorithmError::NotFound, std::move(error));
    }

    const NodeId start = *params.startId;
    TraversalData data;
    data.startNode = start;

    std::unordered_set<NodeId> discovered{start};
    std::queue<std::pair<NodeId, int>> frontier;
    frontier.emplace(start, 0);

    while (!frontier.empty()) {
        auto [node, level] = frontier.front();
        frontier.pop();

        data.discoveryIndex[node] = data.visitOrder.size();
        data.visitOrder.push_back(node);
        data.levels[node] = level;
        trace.record(StepType::Visit, node, INVALID_NODE, level);

        for (NodeId neighbor : graph.neighbors(node)) {
            if (discovered.insert(neighbor).second) {
                frontier.emplace(neighbor, level + 1);
                trace.record(StepType::Discover, neighbor, node, level + 1);
            }
        }
    }

    std::string message = fmt::format("BFS from {} visited {} of {} nodes", start,
                                      data.visitOrder.size(), graph.nodeCount());
    return trace.succeed(name(), std::move(data), std::move(message));
}

AlgorithmResult DepthFirstSearch::execute(const Graph& graph,
                                          const AlgorithmParams& params) const {
    ExecutionTrace trace;
    if (auto error = checkStartNode(graph, params); !error.empty()) {
        return trace.fail(name(), AlgorithmError::NotFound, std::move(error));
    }

    const NodeId start = *params.startId;
    TraversalData data;
    data.startNode = start;

    std::unordered_set<NodeId> visited;
    std::vector<std::pair<NodeId, int>> stack{{start, 0}};

    while (!stack.empty()) {
        auto [node, depth] = stack.back();
        stack.pop_back();

        // A node may be pushed by several neighbors before it is popped
        if (!visited.insert(node).second) continue;

        data.discoveryIndex[node] = data.visitOrder.size();
        data.visitOrder.push_back(node);
        data.levels[node] = depth;
        trace.record(StepType::Visit, node, INVALID_NODE, depth);

        const auto& neighbors = graph.neighbors(node);
        for (auto it = neighbors.rbegin(); it != neighbors.rend(); ++it) {
            if (visited.count(*it) == 0) {
                stack.emplace_back(*it, depth + 1);
                trace.record(StepType::ExploreEdge, *it, node, depth + 1);
            }
        }
    }

    std::string message = fmt::format("DFS from {} visited {} of {} nodes", start,
                                      data.visitOrder.size(), graph.nodeCount());
    return trace.succeed(name(), std::move(data), std::move(message));
}

}  // namespace algorithms
}  // namespace sociograph
