#pragma once

#include "Types.h"

#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace sociograph {

/// Caller-supplied attributes for a new node
struct NodeAttributes {
    std::string name;               ///< Empty name becomes "User_<id>"
    Point position;
    double activity = 0.5;
    double interaction = 1.0;
    Color color = DEFAULT_NODE_COLOR;

    NodeAttributes() = default;
    explicit NodeAttributes(std::string n) : name(std::move(n)) {}
    NodeAttributes(std::string n, double act, double inter)
        : name(std::move(n)), activity(act), interaction(inter) {}
    NodeAttributes(std::string n, Point pos, double act, double inter)
        : name(std::move(n)), position(pos), activity(act), interaction(inter) {}
};

/// Partial update for updateNode(); unset fields are left untouched
struct NodeUpdate {
    std::optional<std::string> name;
    std::optional<Point> position;
    std::optional<double> activity;
    std::optional<double> interaction;
    std::optional<bool> selected;
    std::optional<bool> highlighted;

    /// True if the update touches an attribute that feeds edge weights
    bool affectsWeights() const { return activity.has_value() || interaction.has_value(); }
};

struct NodeData {
    NodeId id = INVALID_NODE;
    std::string name;
    Point position;
    Point velocity;                 ///< Layout-only, zero outside a layout run
    double activity = 0.5;
    double interaction = 1.0;
    std::size_t connectionCount = 0;  ///< Maintained by Graph, always equals degree
    Color color = DEFAULT_NODE_COLOR;
    bool selected = false;
    bool highlighted = false;

    double distanceTo(const NodeData& other) const { return position.distanceTo(other.position); }
};

struct EdgeData {
    NodeId source = INVALID_NODE;
    NodeId target = INVALID_NODE;
    double weight = 1.0;            ///< Derived by WeightCalculator, in (0, 1]
    bool highlighted = false;
    uint64_t sequence = 0;          ///< Insertion order within the owning Graph

    EdgeData() = default;
    EdgeData(NodeId s, NodeId t) : source(s), target(t) {}

    EdgeKey key() const { return {source, target}; }
    bool contains(NodeId id) const { return source == id || target == id; }

    /// Traversal cost used by shortest-path algorithms
    double cost() const { return 1.0 / weight; }

    /// Endpoint opposite to id, or INVALID_NODE if id is not an endpoint
    NodeId other(NodeId id) const {
        if (id == source) return target;
        if (id == target) return source;
        return INVALID_NODE;
    }
};

struct GraphStatistics {
    std::size_t nodeCount = 0;
    std::size_t edgeCount = 0;
    double averageDegree = 0.0;
    double density = 0.0;
    std::size_t maxDegree = 0;
    std::size_t minDegree = 0;
};

/// Dense, symmetric weight matrix over the nodes in ascending id order
struct AdjacencyMatrix {
    std::vector<NodeId> nodeIds;
    std::vector<std::vector<double>> weights;
    std::unordered_map<NodeId, std::size_t> index;  ///< id -> row/column

    std::size_t size() const { return nodeIds.size(); }

    /// Weight between two nodes, 0 when unconnected or unknown
    double at(NodeId a, NodeId b) const;

    /// Row/column index of a node, if present
    std::optional<std::size_t> indexOf(NodeId id) const;
};

using AdjacencyList = std::map<NodeId, std::vector<NodeId>>;

/// Undirected, weighted graph owning all nodes and edges.
///
/// Edge weights are derived from endpoint attributes (see WeightCalculator) and
/// recomputed inside every mutation that can change them, so readers always see
/// consistent costs. Node ids start at 1 and are never reused within a Graph's
/// lifetime, even after clear().
class Graph {
public:
    Graph() = default;
    virtual ~Graph() = default;

    // Node operations
    NodeId addNode();
    NodeId addNode(const std::string& name);
    NodeId addNode(const NodeAttributes& attributes);

    /// Insert a node under a caller-chosen id (used when rebuilding from records)
    /// @return std::nullopt if the id is already taken or INVALID_NODE
    std::optional<NodeId> addNodeWithId(NodeId id, const NodeAttributes& attributes);

    /// Remove a node and every edge touching it
    bool removeNode(NodeId id);

    /// Apply a partial update; incident weights are recomputed if activity or
    /// interaction changed
    bool updateNode(NodeId id, const NodeUpdate& update);

    bool hasNode(NodeId id) const;

    // Node access API:
    // - getNode(): reference return, throws std::out_of_range for unknown ids.
    //   WARNING: the reference is invalidated by removeNode() or clear().
    // - tryGetNode(): returns a copy, std::nullopt for unknown ids.
    const NodeData& getNode(NodeId id) const;
    std::optional<NodeData> tryGetNode(NodeId id) const;

    // Display and layout state (not topology mutations)
    bool setNodePosition(NodeId id, Point position);
    bool setNodeVelocity(NodeId id, Point velocity);
    bool setNodeColor(NodeId id, Color color);
    bool setNodeSelected(NodeId id, bool selected);
    bool setNodeHighlighted(NodeId id, bool highlighted);
    bool setEdgeHighlighted(NodeId a, NodeId b, bool highlighted);
    void clearHighlights();
    void resetColors();
    void resetVelocities();

    // Edge operations

    /// Connect two nodes. Returns the existing edge unchanged if already connected.
    /// @return std::nullopt if an endpoint is missing or source == target
    std::optional<EdgeData> addEdge(NodeId source, NodeId target);

    bool removeEdge(NodeId source, NodeId target);
    bool hasEdge(NodeId a, NodeId b) const;

    const EdgeData& getEdge(NodeId a, NodeId b) const;
    std::optional<EdgeData> tryGetEdge(NodeId a, NodeId b) const;

    // Queries
    std::size_t nodeCount() const { return nodes_.size(); }
    std::size_t edgeCount() const { return edges_.size(); }
    bool empty() const { return nodes_.empty(); }

    /// Node ids in ascending order
    std::vector<NodeId> nodes() const;

    /// All edges in insertion order. Re-adding them in this order reproduces
    /// every neighbor list.
    std::vector<EdgeData> edges() const;

    /// Neighbor ids in edge insertion order
    const std::vector<NodeId>& neighbors(NodeId id) const;

    std::size_t degree(NodeId id) const;

    AdjacencyList adjacencyList() const;
    AdjacencyMatrix adjacencyMatrix() const;
    GraphStatistics statistics() const;

    /// Remove all nodes and edges. The id counter is not rewound.
    virtual void clear();

    /// Id the next addNode() call will assign
    NodeId nextNodeId() const { return nextNodeId_; }

    // Dirty tracking for collaborators that cache derived views
    bool isDirty() const { return dirty_; }
    void markDirty() { dirty_ = true; ++version_; }
    void markClean() { dirty_ = false; }
    uint64_t version() const { return version_; }

protected:
    void onGraphModified() { markDirty(); }
    NodeData* findNode(NodeId id);
    EdgeData* findEdge(NodeId a, NodeId b);

    /// Recompute the weight of every edge touching id
    void refreshIncidentWeights(NodeId id);

    std::map<NodeId, NodeData> nodes_;
    std::map<EdgeKey, EdgeData> edges_;

    // Neighbor lists in edge insertion order
    std::unordered_map<NodeId, std::vector<NodeId>> adjacency_;

    NodeId nextNodeId_ = 1;
    uint64_t nextEdgeSequence_ = 0;

    // Dirty tracking
    bool dirty_ = false;
    uint64_t version_ = 0;
};

}  // namespace sociograph
