#include "ShortestPathAlgorithms.h"
#include "ExecutionTrace.h"

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <queue>
#include <unordered_map>
#include <vector>

namespace sociograph {
namespace algorithms {

namespace {

struct FrontierEntry {
    double key = 0.0;    // g + h
    uint64_t order = 0;  // insertion counter, breaks ties FIFO
    NodeId node = INVALID_NODE;
    double g = 0.0;

    bool operator>(const FrontierEntry& other) const {
        if (key != other.key) return key > other.key;
        return order > other.order;
    }
};

std::string checkTargetNode(const Graph& graph, const AlgorithmParams& params) {
    if (!params.targetId) {
        return "target node not specified";
    }
    if (!graph.hasNode(*params.targetId)) {
        return fmt::format("target node {} not found", *params.targetId);
    }
    return {};
}

}  // namespace

AlgorithmResult ShortestPathSearch::run(const char* name, const Graph& graph,
                                        const AlgorithmParams& params,
                                        const Heuristic& heuristic) {
    ExecutionTrace trace;
    if (auto error = checkStartNode(graph, params); !error.empty()) {
        return trace.fail(name, AlgorithmError::NotFound, std::move(error));
    }
    if (auto error = checkTargetNode(graph, params); !error.empty()) {
        return trace.fail(name, AlgorithmError::NotFound, std::move(error));
    }

    const NodeId start = *params.startId;
    const NodeId target = *params.targetId;

    PathData data;
    data.startNode = start;
    data.targetNode = target;

    // Trivial path
    if (start == target) {
        data.path = {start};
        data.nodesExplored = 1;
        data.distances[start] = 0.0;
        trace.record(StepType::Visit, start, INVALID_NODE, 0.0);
        return trace.succeed(name, std::move(data),
                             fmt::format("{} path {} -> {}: trivial", name, start, target));
    }

    std::priority_queue<FrontierEntry, std::vector<FrontierEntry>, std::greater<FrontierEntry>> openSet;
    std::unordered_map<NodeId, double>& bestCost = data.distances;
    std::unordered_map<NodeId, NodeId> cameFrom;
    uint64_t order = 0;

    bestCost[start] = 0.0;
    openSet.push({heuristic(start), order++, start, 0.0});

    bool found = false;
    while (!openSet.empty()) {
        FrontierEntry current = openSet.top();
        openSet.pop();

        // Stale entry superseded by a cheaper one
        if (current.g > bestCost.at(current.node)) continue;

        ++data.nodesExplored;
        trace.record(StepType::Visit, current.node, INVALID_NODE, current.g);

        if (current.node == target) {
            found = true;
            break;
        }

        for (NodeId neighbor : graph.neighbors(current.node)) {
            const double candidate = current.g + graph.getEdge(current.node, neighbor).cost();
            auto it = bestCost.find(neighbor);
            if (it != bestCost.end() && candidate >= it->second) continue;

            bestCost[neighbor] = candidate;
            cameFrom[neighbor] = current.node;
            openSet.push({candidate + heuristic(neighbor), order++, neighbor, candidate});
            trace.record(StepType::Update, neighbor, current.node, candidate);
        }
    }

    if (!found) {
        return trace.fail(name, AlgorithmError::Unreachable,
                          fmt::format("no path between {} and {}", start, target));
    }

    for (NodeId node = target; node != start; node = cameFrom.at(node)) {
        data.path.push_back(node);
    }
    data.path.push_back(start);
    std::reverse(data.path.begin(), data.path.end());
    data.totalCost = bestCost.at(target);

    std::string message = fmt::format("{} path {} -> {}: {} hops, cost {:.4f}, {} nodes explored",
                                      name, start, target, data.path.size() - 1,
                                      data.totalCost, data.nodesExplored);
    return trace.succeed(name, std::move(data), std::move(message));
}

AlgorithmResult DijkstraShortestPath::execute(const Graph& graph,
                                              const AlgorithmParams& params) const {
    return ShortestPathSearch::run(name(), graph, params, [](NodeId) { return 0.0; });
}

AlgorithmResult AStarShortestPath::execute(const Graph& graph,
                                           const AlgorithmParams& params) const {
    // Target validity is checked inside run() before the heuristic is used
    const NodeId target = params.targetId.value_or(INVALID_NODE);
    const double scale = heuristicScale_;
    auto heuristic = [&graph, target, scale](NodeId node) {
        return graph.getNode(node).distanceTo(graph.getNode(target)) * scale;
    };
    return ShortestPathSearch::run(name(), graph, params, heuristic);
}

}  // namespace algorithms
}  // namespace sociograph
