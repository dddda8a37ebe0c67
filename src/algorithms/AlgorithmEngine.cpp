#include "sociograph/algorithms/AlgorithmEngine.h"
#include "sociograph/common/Logger.h"

namespace sociograph {

AlgorithmResult AlgorithmEngine::run(AlgorithmKind kind, const Graph& graph,
                                     const AlgorithmParams& params) const {
    return run(std::string(toString(kind)), graph, params);
}

AlgorithmResult AlgorithmEngine::run(const std::string& name, const Graph& graph,
                                     const AlgorithmParams& params) const {
    auto algorithm = AlgorithmRegistry::instance().create(name, options_);
    if (!algorithm) {
        AlgorithmResult result;
        result.name = name;
        result.error = AlgorithmError::InvalidOperation;
        result.message = "unknown algorithm '" + name + "'";
        LOG_WARN("{}", result.message);
        return result;
    }

    LOG_DEBUG("Running {} on graph with {} nodes, {} edges", name, graph.nodeCount(),
              graph.edgeCount());
    return algorithm->execute(graph, params);
}

AlgorithmResult AlgorithmEngine::breadthFirstSearch(const Graph& graph, NodeId start) const {
    return run(AlgorithmKind::BreadthFirstSearch, graph, AlgorithmParams::from(start));
}

AlgorithmResult AlgorithmEngine::depthFirstSearch(const Graph& graph, NodeId start) const {
    return run(AlgorithmKind::DepthFirstSearch, graph, AlgorithmParams::from(start));
}

AlgorithmResult AlgorithmEngine::dijkstra(const Graph& graph, NodeId start, NodeId target) const {
    return run(AlgorithmKind::Dijkstra, graph, AlgorithmParams::between(start, target));
}

AlgorithmResult AlgorithmEngine::aStar(const Graph& graph, NodeId start, NodeId target) const {
    return run(AlgorithmKind::AStar, graph, AlgorithmParams::between(start, target));
}

AlgorithmResult AlgorithmEngine::connectedComponents(const Graph& graph) const {
    return run(AlgorithmKind::ConnectedComponents, graph);
}

AlgorithmResult AlgorithmEngine::degreeCentrality(const Graph& graph) const {
    return run(AlgorithmKind::DegreeCentrality, graph);
}

AlgorithmResult AlgorithmEngine::degreeCentrality(const Graph& graph, std::size_t topK) const {
    return run(AlgorithmKind::DegreeCentrality, graph, AlgorithmParams::top(topK));
}

AlgorithmResult AlgorithmEngine::welshPowell(const Graph& graph) const {
    return run(AlgorithmKind::WelshPowell, graph);
}

}  // namespace sociograph
