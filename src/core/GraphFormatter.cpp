#include "sociograph/core/GraphFormatter.h"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace sociograph {

std::string GraphFormatter::adjacencyList(const Graph& graph) {
    std::string out;
    for (const auto& [id, neighbors] : graph.adjacencyList()) {
        out += fmt::format("{}: {}\n", id, fmt::join(neighbors, ", "));
    }
    return out;
}

std::string GraphFormatter::adjacencyMatrix(const Graph& graph, int precision) {
    AdjacencyMatrix matrix = graph.adjacencyMatrix();

    std::string out = fmt::format("{:>6}", "");
    for (NodeId id : matrix.nodeIds) {
        out += fmt::format(" {:>8}", id);
    }
    out += '\n';

    for (std::size_t i = 0; i < matrix.size(); ++i) {
        out += fmt::format("{:>6}", matrix.nodeIds[i]);
        for (double w : matrix.weights[i]) {
            out += fmt::format(" {:>8.{}f}", w, precision);
        }
        out += '\n';
    }
    return out;
}

std::string GraphFormatter::statistics(const Graph& graph) {
    GraphStatistics stats = graph.statistics();
    return fmt::format("nodes={} edges={} density={:.4f} avgDegree={:.2f} maxDegree={} minDegree={}",
                       stats.nodeCount, stats.edgeCount, stats.density, stats.averageDegree,
                       stats.maxDegree, stats.minDegree);
}

}  // namespace sociograph
