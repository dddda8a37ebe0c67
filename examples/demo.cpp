#include <sociograph/sociograph.h>
#include <sociograph/common/Logger.h>

#include <iomanip>
#include <iostream>

using namespace sociograph;

namespace {

void printResult(const AlgorithmResult& result) {
    std::cout << std::left << std::setw(20) << result.name
              << (result.success ? "ok    " : "FAILED")
              << std::right << std::setw(9) << std::fixed << std::setprecision(3)
              << result.elapsedMs << " ms  " << std::setw(5) << result.steps.size() << " steps  "
              << result.message << "\n";
}

}  // namespace

int main(int argc, char** argv) {
    Logger::initialize();

    EngineConfig config = EngineConfig::createDefault();
    if (argc > 1 && !EngineConfigSerializer::loadFromFile(argv[1], config)) {
        std::cerr << "Using default configuration\n";
    }

    std::cout << "=== Sociograph " << versionString() << " demo ===\n\n";

    SampleGraphOptions sample;
    sample.nodeCount = 20;
    sample.edgeProbability = 0.2;
    sample.seed = 42;
    Graph graph = SampleGraphGenerator::generate(sample);

    std::cout << GraphFormatter::statistics(graph) << "\n";
    std::cout << "Adjacency list:\n" << GraphFormatter::adjacencyList(graph) << "\n";

    const auto nodes = graph.nodes();
    const NodeId first = nodes.front();
    const NodeId last = nodes.back();

    AlgorithmEngine engine(config.algorithms);
    for (AlgorithmKind kind : allAlgorithmKinds()) {
        printResult(engine.run(kind, graph, AlgorithmParams::between(first, last)));
    }

    if (auto result = engine.dijkstra(graph, first, last); result.success) {
        std::cout << "\nShortest path " << first << " -> " << last << ":";
        for (NodeId id : result.data<PathData>()->path) {
            std::cout << " " << graph.getNode(id).name;
        }
        std::cout << "\n";
    }

    ForceDirectedLayout layout(config.layout);
    const std::size_t steps = layout.run(graph);
    std::cout << "\nLayout: " << steps << " steps, temperature " << layout.temperature()
              << ", max displacement " << layout.maxDisplacement() << "\n";
    for (NodeId id : nodes) {
        const NodeData& node = graph.getNode(id);
        std::cout << "  " << std::left << std::setw(14) << node.name << std::right
                  << std::setprecision(1) << "(" << node.position.x << ", "
                  << node.position.y << ")\n";
    }

    Logger::flush();
    return 0;
}
