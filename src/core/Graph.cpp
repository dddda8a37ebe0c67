#include "sociograph/core/Graph.h"
#include "sociograph/core/WeightCalculator.h"
#include "sociograph/common/Logger.h"

#include <algorithm>
#include <limits>

namespace sociograph {

double AdjacencyMatrix::at(NodeId a, NodeId b) const {
    auto ia = indexOf(a);
    auto ib = indexOf(b);
    if (!ia || !ib) return 0.0;
    return weights[*ia][*ib];
}

std::optional<std::size_t> AdjacencyMatrix::indexOf(NodeId id) const {
    auto it = index.find(id);
    if (it == index.end()) return std::nullopt;
    return it->second;
}

NodeId Graph::addNode() {
    return addNode(NodeAttributes{});
}

NodeId Graph::addNode(const std::string& name) {
    return addNode(NodeAttributes{name});
}

NodeId Graph::addNode(const NodeAttributes& attributes) {
    // nextNodeId_ always points past every live id; only exhaustion of the
    // id space can make this fail
    return addNodeWithId(nextNodeId_, attributes).value_or(INVALID_NODE);
}

std::optional<NodeId> Graph::addNodeWithId(NodeId id, const NodeAttributes& attributes) {
    if (id == INVALID_NODE) {
        LOG_WARN("Rejected node with reserved id {}", id);
        return std::nullopt;
    }
    if (hasNode(id)) {
        LOG_WARN("Rejected duplicate node id {}", id);
        return std::nullopt;
    }

    NodeData data;
    data.id = id;
    data.name = attributes.name.empty() ? "User_" + std::to_string(id) : attributes.name;
    data.position = attributes.position;
    data.activity = attributes.activity;
    data.interaction = attributes.interaction;
    data.color = attributes.color;

    // Reset before inserting so the new node keeps its requested color
    resetColors();
    nodes_.emplace(id, std::move(data));
    adjacency_[id] = {};

    if (id >= nextNodeId_) {
        nextNodeId_ = id + 1;
    }

    onGraphModified();
    LOG_TRACE("Added node {}", id);
    return id;
}

bool Graph::removeNode(NodeId id) {
    if (!hasNode(id)) return false;

    // Copy: the loop edits neighbor lists
    std::vector<NodeId> affected = adjacency_[id];
    for (NodeId neighbor : affected) {
        edges_.erase(EdgeKey{id, neighbor});

        auto& list = adjacency_[neighbor];
        list.erase(std::remove(list.begin(), list.end(), id), list.end());
        nodes_.at(neighbor).connectionCount = list.size();
    }

    adjacency_.erase(id);
    nodes_.erase(id);

    // Former neighbors changed degree, so every edge they still touch is stale
    for (NodeId neighbor : affected) {
        refreshIncidentWeights(neighbor);
    }

    resetColors();
    onGraphModified();
    LOG_TRACE("Removed node {} with {} incident edges", id, affected.size());
    return true;
}

bool Graph::updateNode(NodeId id, const NodeUpdate& update) {
    NodeData* node = findNode(id);
    if (!node) return false;

    if (update.name) node->name = *update.name;
    if (update.position) node->position = *update.position;
    if (update.activity) node->activity = *update.activity;
    if (update.interaction) node->interaction = *update.interaction;
    if (update.selected) node->selected = *update.selected;
    if (update.highlighted) node->highlighted = *update.highlighted;

    if (update.affectsWeights()) {
        refreshIncidentWeights(id);
        resetColors();
    }

    onGraphModified();
    return true;
}

bool Graph::hasNode(NodeId id) const {
    return nodes_.find(id) != nodes_.end();
}

const NodeData& Graph::getNode(NodeId id) const {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        throw std::out_of_range("Invalid node ID: " + std::to_string(id));
    }
    return it->second;
}

std::optional<NodeData> Graph::tryGetNode(NodeId id) const {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Graph::setNodePosition(NodeId id, Point position) {
    NodeData* node = findNode(id);
    if (!node) return false;
    node->position = position;
    onGraphModified();
    return true;
}

bool Graph::setNodeVelocity(NodeId id, Point velocity) {
    NodeData* node = findNode(id);
    if (!node) return false;
    node->velocity = velocity;
    return true;
}

bool Graph::setNodeColor(NodeId id, Color color) {
    NodeData* node = findNode(id);
    if (!node) return false;
    node->color = color;
    return true;
}

bool Graph::setNodeSelected(NodeId id, bool selected) {
    NodeData* node = findNode(id);
    if (!node) return false;
    node->selected = selected;
    return true;
}

bool Graph::setNodeHighlighted(NodeId id, bool highlighted) {
    NodeData* node = findNode(id);
    if (!node) return false;
    node->highlighted = highlighted;
    return true;
}

bool Graph::setEdgeHighlighted(NodeId a, NodeId b, bool highlighted) {
    EdgeData* edge = findEdge(a, b);
    if (!edge) return false;
    edge->highlighted = highlighted;
    return true;
}

void Graph::clearHighlights() {
    for (auto& [id, node] : nodes_) {
        node.highlighted = false;
    }
    for (auto& [key, edge] : edges_) {
        edge.highlighted = false;
    }
}

void Graph::resetColors() {
    for (auto& [id, node] : nodes_) {
        node.color = DEFAULT_NODE_COLOR;
    }
}

void Graph::resetVelocities() {
    for (auto& [id, node] : nodes_) {
        node.velocity = Point{};
    }
}

std::optional<EdgeData> Graph::addEdge(NodeId source, NodeId target) {
    if (!hasNode(source) || !hasNode(target)) {
        LOG_WARN("Rejected edge {}-{}: endpoint not found", source, target);
        return std::nullopt;
    }
    if (source == target) {
        LOG_WARN("Rejected self-loop on node {}", source);
        return std::nullopt;
    }

    EdgeKey key{source, target};
    auto existing = edges_.find(key);
    if (existing != edges_.end()) {
        return existing->second;
    }

    EdgeData edge{source, target};
    edge.sequence = nextEdgeSequence_++;
    edges_.emplace(key, edge);

    auto& sourceList = adjacency_[source];
    auto& targetList = adjacency_[target];
    sourceList.push_back(target);
    targetList.push_back(source);
    nodes_.at(source).connectionCount = sourceList.size();
    nodes_.at(target).connectionCount = targetList.size();

    // Degrees of both endpoints changed: refresh everything they touch,
    // including the new edge
    refreshIncidentWeights(source);
    refreshIncidentWeights(target);

    resetColors();
    onGraphModified();
    LOG_TRACE("Added edge {}-{} weight={:.4f}", source, target, edges_.at(key).weight);
    return edges_.at(key);
}

bool Graph::removeEdge(NodeId source, NodeId target) {
    auto it = edges_.find(EdgeKey{source, target});
    if (it == edges_.end()) return false;
    edges_.erase(it);

    for (auto [from, to] : {std::pair{source, target}, std::pair{target, source}}) {
        auto& list = adjacency_[from];
        list.erase(std::remove(list.begin(), list.end(), to), list.end());
        nodes_.at(from).connectionCount = list.size();
    }

    refreshIncidentWeights(source);
    refreshIncidentWeights(target);

    resetColors();
    onGraphModified();
    return true;
}

bool Graph::hasEdge(NodeId a, NodeId b) const {
    return edges_.find(EdgeKey{a, b}) != edges_.end();
}

const EdgeData& Graph::getEdge(NodeId a, NodeId b) const {
    auto it = edges_.find(EdgeKey{a, b});
    if (it == edges_.end()) {
        throw std::out_of_range("Invalid edge: " + std::to_string(a) + "-" + std::to_string(b));
    }
    return it->second;
}

std::optional<EdgeData> Graph::tryGetEdge(NodeId a, NodeId b) const {
    auto it = edges_.find(EdgeKey{a, b});
    if (it == edges_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<NodeId> Graph::nodes() const {
    std::vector<NodeId> result;
    result.reserve(nodes_.size());
    for (const auto& [id, node] : nodes_) {
        result.push_back(id);
    }
    return result;
}

std::vector<EdgeData> Graph::edges() const {
    std::vector<EdgeData> result;
    result.reserve(edges_.size());
    for (const auto& [key, edge] : edges_) {
        result.push_back(edge);
    }
    std::sort(result.begin(), result.end(), [](const EdgeData& a, const EdgeData& b) {
        return a.sequence < b.sequence;
    });
    return result;
}

const std::vector<NodeId>& Graph::neighbors(NodeId id) const {
    static const std::vector<NodeId> kEmpty;
    auto it = adjacency_.find(id);
    return it != adjacency_.end() ? it->second : kEmpty;
}

std::size_t Graph::degree(NodeId id) const {
    return neighbors(id).size();
}

AdjacencyList Graph::adjacencyList() const {
    AdjacencyList result;
    for (const auto& [id, node] : nodes_) {
        result[id] = neighbors(id);
    }
    return result;
}

AdjacencyMatrix Graph::adjacencyMatrix() const {
    AdjacencyMatrix matrix;
    matrix.nodeIds = nodes();

    const std::size_t n = matrix.nodeIds.size();
    matrix.weights.assign(n, std::vector<double>(n, 0.0));
    matrix.index.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        matrix.index[matrix.nodeIds[i]] = i;
    }

    for (const auto& [key, edge] : edges_) {
        std::size_t i = matrix.index.at(key.first);
        std::size_t j = matrix.index.at(key.second);
        matrix.weights[i][j] = edge.weight;
        matrix.weights[j][i] = edge.weight;
    }
    return matrix;
}

GraphStatistics Graph::statistics() const {
    GraphStatistics stats;
    stats.nodeCount = nodes_.size();
    stats.edgeCount = edges_.size();

    if (nodes_.empty()) {
        return stats;
    }

    std::size_t totalDegree = 0;
    stats.minDegree = std::numeric_limits<std::size_t>::max();
    for (const auto& [id, node] : nodes_) {
        std::size_t d = degree(id);
        totalDegree += d;
        stats.maxDegree = std::max(stats.maxDegree, d);
        stats.minDegree = std::min(stats.minDegree, d);
    }

    const double v = static_cast<double>(stats.nodeCount);
    stats.averageDegree = static_cast<double>(totalDegree) / v;
    if (stats.nodeCount > 1) {
        stats.density = 2.0 * static_cast<double>(stats.edgeCount) / (v * (v - 1.0));
    }
    return stats;
}

void Graph::clear() {
    nodes_.clear();
    edges_.clear();
    adjacency_.clear();

    onGraphModified();
}

NodeData* Graph::findNode(NodeId id) {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

EdgeData* Graph::findEdge(NodeId a, NodeId b) {
    auto it = edges_.find(EdgeKey{a, b});
    return it != edges_.end() ? &it->second : nullptr;
}

void Graph::refreshIncidentWeights(NodeId id) {
    const NodeData& node = nodes_.at(id);
    for (NodeId neighbor : neighbors(id)) {
        edges_.at(EdgeKey{id, neighbor}).weight =
            WeightCalculator::weight(node, nodes_.at(neighbor));
    }
}

}  // namespace sociograph
