#pragma once

#include "../core/Types.h"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace sociograph {

/// Built-in algorithm family
enum class AlgorithmKind {
    BreadthFirstSearch,
    DepthFirstSearch,
    Dijkstra,
    AStar,
    ConnectedComponents,
    DegreeCentrality,
    WelshPowell
};

/// Registry name of a built-in algorithm ("BFS", "DFS", "Dijkstra", ...)
const char* toString(AlgorithmKind kind);
std::optional<AlgorithmKind> algorithmKindFromString(const std::string& name);

/// All built-in kinds in declaration order
std::vector<AlgorithmKind> allAlgorithmKinds();

/// Failure category of an AlgorithmResult
enum class AlgorithmError {
    None,
    NotFound,          ///< Start/target node id absent or not supplied
    InvalidOperation,  ///< Request cannot be served (e.g. unknown algorithm)
    Unreachable,       ///< No path between start and target
    /// Empty or single-node input. Never returned: the built-in algorithms
    /// succeed on such graphs with empty or zero payloads. Kept for host
    /// algorithms registered through AlgorithmRegistry.
    DegenerateInput
};

const char* toString(AlgorithmError error);

/// Kind of an animation step record
enum class StepType {
    Visit,              ///< Node processed (dequeued, popped, extracted)
    Discover,           ///< Node first seen by BFS
    ExploreEdge,        ///< DFS pushed a neighbor
    Update,             ///< Shortest-path relaxation improved a node
    ComponentComplete,  ///< Component finished; index = component, value = size
    Calculate,          ///< Centrality computed; value = centrality
    Rank,               ///< Top-k entry; index = rank (1-based)
    Sorted,             ///< Coloring order established; value = node count
    Color               ///< Node colored; index = color (1-based)
};

/// Single entry of the append-only execution log used for stepwise replay
struct AlgorithmStep {
    StepType type = StepType::Visit;
    NodeId nodeId = INVALID_NODE;
    NodeId fromNode = INVALID_NODE;  ///< Predecessor for Discover/ExploreEdge/Update
    double value = 0.0;              ///< Level, depth, distance or score
    int index = 0;                   ///< Component, rank or color index
    double elapsedMs = 0.0;          ///< Time since the run started
};

/// BFS / DFS payload
struct TraversalData {
    NodeId startNode = INVALID_NODE;
    std::vector<NodeId> visitOrder;
    std::unordered_map<NodeId, int> levels;                 ///< BFS level or DFS depth
    std::unordered_map<NodeId, std::size_t> discoveryIndex; ///< Position in visitOrder

    std::size_t visitedCount() const { return visitOrder.size(); }
    bool visited(NodeId id) const { return levels.find(id) != levels.end(); }

    /// Level clamped to the display buckets 0..5 (5 means "5 or deeper"), -1 if unvisited
    int levelBucket(NodeId id) const;

    /// Discovery position scaled to [0, 1], -1 if unvisited
    double normalizedDiscovery(NodeId id) const;
};

/// Dijkstra / A* payload
struct PathData {
    NodeId startNode = INVALID_NODE;
    NodeId targetNode = INVALID_NODE;
    std::vector<NodeId> path;
    double totalCost = 0.0;
    std::size_t nodesExplored = 0;
    std::unordered_map<NodeId, double> distances;  ///< Best known cost per reached node

    /// Consecutive node pairs along the path
    std::vector<EdgeKey> pathEdges() const;
};

/// Connected-components payload
struct ComponentsData {
    std::vector<std::vector<NodeId>> components;  ///< Largest first, members ascending
    std::unordered_map<NodeId, std::size_t> componentOf;

    std::size_t count() const { return components.size(); }
    std::size_t largestSize() const { return components.empty() ? 0 : components.front().size(); }
    std::vector<NodeId> isolatedNodes() const;
};

struct CentralityEntry {
    NodeId nodeId = INVALID_NODE;
    std::size_t degree = 0;
    double centrality = 0.0;
};

/// Degree-centrality payload
struct CentralityData {
    std::vector<CentralityEntry> ranking;  ///< All nodes, best first
    std::size_t topK = 0;                  ///< Size of the highlighted prefix
    double averageCentrality = 0.0;
    double maxCentrality = 0.0;
    double minCentrality = 0.0;
    double averageDegree = 0.0;
    std::size_t maxDegree = 0;

    /// First k entries of the ranking (fewer if the graph is smaller)
    std::vector<CentralityEntry> top(std::size_t k) const;
    std::optional<double> centralityOf(NodeId id) const;
};

/// Welsh-Powell payload
struct ColoringData {
    std::unordered_map<NodeId, int> coloring;  ///< 1-based color index per node
    int chromaticCount = 0;
    std::vector<NodeId> nodeOrder;             ///< Degree-descending processing order

    std::map<int, std::vector<NodeId>> colorGroups() const;
};

using AlgorithmPayload = std::variant<std::monostate, TraversalData, PathData,
                                      ComponentsData, CentralityData, ColoringData>;

/// Uniform outcome of every algorithm run.
///
/// A failed run has success == false, an error category and a message, and
/// carries neither payload nor steps.
struct AlgorithmResult {
    std::string name;
    bool success = false;
    AlgorithmError error = AlgorithmError::None;
    double elapsedMs = 0.0;
    AlgorithmPayload payload;
    std::vector<AlgorithmStep> steps;
    std::string message;

    /// Typed payload access, nullptr if the payload holds another type
    template <typename T>
    const T* data() const {
        return std::get_if<T>(&payload);
    }
};

}  // namespace sociograph
