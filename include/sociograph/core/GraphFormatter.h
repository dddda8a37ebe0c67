#pragma once

#include "Graph.h"

#include <string>

namespace sociograph {

/// Plain-text diagnostic views of a graph
class GraphFormatter {
public:
    /// One line per node: "id: n1, n2, ..." in neighbor insertion order
    static std::string adjacencyList(const Graph& graph);

    /// Header row of ids followed by one weight row per node (ascending ids)
    static std::string adjacencyMatrix(const Graph& graph, int precision = 3);

    /// Single-line summary of GraphStatistics
    static std::string statistics(const Graph& graph);
};

}  // namespace sociograph
