#include "sociograph/core/SampleGraphGenerator.h"
#include "sociograph/common/Logger.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <numbers>
#include <random>
#include <string>

namespace sociograph {

namespace {

constexpr std::array<const char*, 30> kNames = {
    "Alex", "Blake", "Casey", "Dana", "Eli", "Finley",
    "Gray", "Harper", "Indy", "Jules", "Kai", "Lane",
    "Morgan", "Noel", "Oakley", "Parker", "Quinn", "Reese",
    "Sage", "Taylor", "Umi", "Val", "Wren", "Xen",
    "Yael", "Zion", "Avery", "Rowan", "Skyler", "Emery"
};

std::string nameFor(std::size_t index) {
    std::string name = kNames[index % kNames.size()];
    if (index >= kNames.size()) {
        name += "_" + std::to_string(index / kNames.size());
    }
    return name;
}

}  // namespace

double SampleGraphGenerator::radiusFor(std::size_t nodeCount) {
    return std::min(300.0, 50.0 + static_cast<double>(nodeCount) * 8.0);
}

Graph SampleGraphGenerator::generate(const SampleGraphOptions& options) {
    Graph graph;
    if (options.nodeCount == 0) {
        return graph;
    }

    std::mt19937 rng{static_cast<std::uint32_t>(options.seed.value_or(std::random_device{}()))};
    std::uniform_real_distribution<double> activity{options.minActivity, options.maxActivity};
    std::uniform_real_distribution<double> interaction{options.minInteraction, options.maxInteraction};
    std::uniform_real_distribution<double> coin{0.0, 1.0};

    const double radius = radiusFor(options.nodeCount);
    const double n = static_cast<double>(options.nodeCount);

    std::vector<NodeId> ids;
    ids.reserve(options.nodeCount);
    for (std::size_t i = 0; i < options.nodeCount; ++i) {
        double angle = 2.0 * std::numbers::pi * static_cast<double>(i) / n;
        Point position{options.center.x + radius * std::cos(angle),
                       options.center.y + radius * std::sin(angle)};
        ids.push_back(graph.addNode(
            NodeAttributes{nameFor(i), position, activity(rng), interaction(rng)}));
    }

    for (std::size_t i = 0; i < ids.size(); ++i) {
        for (std::size_t j = i + 1; j < ids.size(); ++j) {
            if (coin(rng) < options.edgeProbability && !graph.addEdge(ids[i], ids[j])) {
                LOG_WARN("Sample generator could not connect {} and {}", ids[i], ids[j]);
            }
        }
    }

    LOG_DEBUG("Generated sample graph: {} nodes, {} edges", graph.nodeCount(), graph.edgeCount());
    return graph;
}

}  // namespace sociograph
