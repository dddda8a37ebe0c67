#include "sociograph/algorithms/AlgorithmResult.h"

#include <algorithm>

namespace sociograph {

const char* toString(AlgorithmKind kind) {
    switch (kind) {
        case AlgorithmKind::BreadthFirstSearch:  return "BFS";
        case AlgorithmKind::DepthFirstSearch:    return "DFS";
        case AlgorithmKind::Dijkstra:            return "Dijkstra";
        case AlgorithmKind::AStar:               return "AStar";
        case AlgorithmKind::ConnectedComponents: return "ConnectedComponents";
        case AlgorithmKind::DegreeCentrality:    return "DegreeCentrality";
        case AlgorithmKind::WelshPowell:         return "WelshPowell";
    }
    return "Unknown";
}

std::optional<AlgorithmKind> algorithmKindFromString(const std::string& name) {
    for (AlgorithmKind kind : allAlgorithmKinds()) {
        if (name == toString(kind)) return kind;
    }
    return std::nullopt;
}

std::vector<AlgorithmKind> allAlgorithmKinds() {
    return {AlgorithmKind::BreadthFirstSearch, AlgorithmKind::DepthFirstSearch,
            AlgorithmKind::Dijkstra,           AlgorithmKind::AStar,
            AlgorithmKind::ConnectedComponents, AlgorithmKind::DegreeCentrality,
            AlgorithmKind::WelshPowell};
}

const char* toString(AlgorithmError error) {
    switch (error) {
        case AlgorithmError::None:             return "None";
        case AlgorithmError::NotFound:         return "NotFound";
        case AlgorithmError::InvalidOperation: return "InvalidOperation";
        case AlgorithmError::Unreachable:      return "Unreachable";
        case AlgorithmError::DegenerateInput:  return "DegenerateInput";
    }
    return "Unknown";
}

int TraversalData::levelBucket(NodeId id) const {
    auto it = levels.find(id);
    if (it == levels.end()) return -1;
    return std::min(it->second, 5);
}

double TraversalData::normalizedDiscovery(NodeId id) const {
    auto it = discoveryIndex.find(id);
    if (it == discoveryIndex.end()) return -1.0;
    if (visitOrder.size() <= 1) return 0.0;
    return static_cast<double>(it->second) / static_cast<double>(visitOrder.size() - 1);
}

std::vector<EdgeKey> PathData::pathEdges() const {
    std::vector<EdgeKey> result;
    for (std::size_t i = 1; i < path.size(); ++i) {
        result.emplace_back(path[i - 1], path[i]);
    }
    return result;
}

std::vector<NodeId> ComponentsData::isolatedNodes() const {
    std::vector<NodeId> result;
    for (const auto& component : components) {
        if (component.size() == 1) result.push_back(component.front());
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<CentralityEntry> CentralityData::top(std::size_t k) const {
    const std::size_t count = std::min(k, ranking.size());
    return std::vector<CentralityEntry>(ranking.begin(),
                                        ranking.begin() + static_cast<std::ptrdiff_t>(count));
}

std::optional<double> CentralityData::centralityOf(NodeId id) const {
    for (const auto& entry : ranking) {
        if (entry.nodeId == id) return entry.centrality;
    }
    return std::nullopt;
}

std::map<int, std::vector<NodeId>> ColoringData::colorGroups() const {
    std::map<int, std::vector<NodeId>> groups;
    for (const auto& [node, color] : coloring) {
        groups[color].push_back(node);
    }
    for (auto& [color, members] : groups) {
        std::sort(members.begin(), members.end());
    }
    return groups;
}

}  // namespace sociograph
