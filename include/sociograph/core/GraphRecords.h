#pragma once

#include "Graph.h"

#include <string>
#include <vector>

namespace sociograph {

/// Plain node record exchanged with import/export collaborators
struct NodeRecord {
    NodeId id = INVALID_NODE;
    std::string name;
    double x = 0.0;
    double y = 0.0;
    double activity = 0.5;
    double interaction = 1.0;
    std::size_t connectionCount = 0;
    Color color = DEFAULT_NODE_COLOR;
    bool selected = false;
    bool highlighted = false;
};

/// Plain edge record; weight is informational and re-derived on rebuild
struct EdgeRecord {
    NodeId sourceId = INVALID_NODE;
    NodeId targetId = INVALID_NODE;
    double weight = 0.0;
};

struct GraphRecords {
    std::vector<NodeRecord> nodes;
    std::vector<EdgeRecord> edges;
};

/// Flattens a Graph to plain records and rebuilds it again.
///
/// Round trip preserves ids, names, positions, attributes, display flags and
/// topology. Edge weights and connection counts are derived data and are
/// recomputed from the rebuilt topology rather than trusted from the records.
class GraphRecordConverter {
public:
    /// Nodes in ascending id order, edges ordered by endpoint pair
    static GraphRecords flatten(const Graph& graph);

    /// Rebuild a graph from records
    /// @param records Source records
    /// @param out Receives the rebuilt graph; left untouched on failure
    /// @return false on duplicate node ids, unknown endpoints or self-loops
    static bool rebuild(const GraphRecords& records, Graph& out);
};

}  // namespace sociograph
