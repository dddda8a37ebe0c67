#include "DegreeCentrality.h"
#include "ExecutionTrace.h"

#include <fmt/format.h>

#include <algorithm>

namespace sociograph {
namespace algorithms {

AlgorithmResult DegreeCentrality::execute(const Graph& graph,
                                          const AlgorithmParams& params) const {
    ExecutionTrace trace;
    CentralityData data;
    data.topK = params.topK.value_or(defaultTopK_);

    if (graph.empty()) {
        return trace.succeed(name(), std::move(data), "graph is empty: no centrality");
    }

    const std::size_t n = graph.nodeCount();
    const double denominator = n > 1 ? static_cast<double>(n - 1) : 0.0;

    data.ranking.reserve(n);
    for (NodeId id : graph.nodes()) {
        CentralityEntry entry;
        entry.nodeId = id;
        entry.degree = graph.degree(id);
        entry.centrality = denominator > 0.0 ? static_cast<double>(entry.degree) / denominator : 0.0;
        data.ranking.push_back(entry);
        trace.record(StepType::Calculate, id, INVALID_NODE, entry.centrality);
    }

    std::sort(data.ranking.begin(), data.ranking.end(),
              [](const CentralityEntry& a, const CentralityEntry& b) {
                  if (a.degree != b.degree) return a.degree > b.degree;
                  return a.nodeId < b.nodeId;
              });

    const std::size_t highlighted = std::min(data.topK, n);
    for (std::size_t rank = 0; rank < highlighted; ++rank) {
        const auto& entry = data.ranking[rank];
        trace.record(StepType::Rank, entry.nodeId, INVALID_NODE, entry.centrality,
                     static_cast<int>(rank + 1));
    }

    double sumCentrality = 0.0;
    std::size_t sumDegree = 0;
    for (const auto& entry : data.ranking) {
        sumCentrality += entry.centrality;
        sumDegree += entry.degree;
    }
    data.averageCentrality = sumCentrality / static_cast<double>(n);
    data.averageDegree = static_cast<double>(sumDegree) / static_cast<double>(n);
    data.maxCentrality = data.ranking.front().centrality;
    data.minCentrality = data.ranking.back().centrality;
    data.maxDegree = data.ranking.front().degree;

    const auto& best = data.ranking.front();
    std::string message = fmt::format("most central node {} (degree {}, centrality {:.3f})",
                                      best.nodeId, best.degree, best.centrality);
    return trace.succeed(name(), std::move(data), std::move(message));
}

}  // namespace algorithms
}  // namespace sociograph
