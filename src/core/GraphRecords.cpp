#include "sociograph/core/GraphRecords.h"
#include "sociograph/common/Logger.h"

namespace sociograph {

GraphRecords GraphRecordConverter::flatten(const Graph& graph) {
    GraphRecords records;
    records.nodes.reserve(graph.nodeCount());
    records.edges.reserve(graph.edgeCount());

    for (NodeId id : graph.nodes()) {
        const NodeData& node = graph.getNode(id);
        NodeRecord record;
        record.id = node.id;
        record.name = node.name;
        record.x = node.position.x;
        record.y = node.position.y;
        record.activity = node.activity;
        record.interaction = node.interaction;
        record.connectionCount = node.connectionCount;
        record.color = node.color;
        record.selected = node.selected;
        record.highlighted = node.highlighted;
        records.nodes.push_back(std::move(record));
    }

    for (const EdgeData& edge : graph.edges()) {
        records.edges.push_back({edge.source, edge.target, edge.weight});
    }

    return records;
}

bool GraphRecordConverter::rebuild(const GraphRecords& records, Graph& out) {
    Graph graph;

    for (const NodeRecord& record : records.nodes) {
        NodeAttributes attributes{record.name, Point{record.x, record.y},
                                  record.activity, record.interaction};
        if (!graph.addNodeWithId(record.id, attributes)) {
            LOG_WARN("Record rebuild failed: node id {} is invalid or duplicated", record.id);
            return false;
        }
    }

    for (const EdgeRecord& record : records.edges) {
        if (!graph.addEdge(record.sourceId, record.targetId)) {
            LOG_WARN("Record rebuild failed: edge {}-{} is invalid",
                     record.sourceId, record.targetId);
            return false;
        }
    }

    // Display state last: topology mutations reset colors
    for (const NodeRecord& record : records.nodes) {
        graph.setNodeColor(record.id, record.color);
        graph.setNodeSelected(record.id, record.selected);
        graph.setNodeHighlighted(record.id, record.highlighted);

        if (graph.getNode(record.id).connectionCount != record.connectionCount) {
            LOG_DEBUG("Node {} record claims {} connections, topology has {}",
                      record.id, record.connectionCount, graph.getNode(record.id).connectionCount);
        }
    }

    out = graph;
    return true;
}

}  // namespace sociograph
