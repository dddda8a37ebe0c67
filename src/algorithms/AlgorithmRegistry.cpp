#include "sociograph/algorithms/AlgorithmRegistry.h"
#include "ConnectedComponents.h"
#include "DegreeCentrality.h"
#include "ShortestPathAlgorithms.h"
#include "TraversalAlgorithms.h"
#include "WelshPowellColoring.h"

#include <algorithm>
#include <stdexcept>

namespace sociograph {

AlgorithmRegistry& AlgorithmRegistry::instance() {
    static AlgorithmRegistry instance;
    return instance;
}

AlgorithmRegistry::AlgorithmRegistry() {
    registerBuiltinAlgorithms();
}

void AlgorithmRegistry::registerBuiltinAlgorithms() {
    using namespace algorithms;

    registerAlgorithm(toString(AlgorithmKind::BreadthFirstSearch), [](const AlgorithmOptions&) {
        return std::make_unique<BreadthFirstSearch>();
    });
    registerAlgorithm(toString(AlgorithmKind::DepthFirstSearch), [](const AlgorithmOptions&) {
        return std::make_unique<DepthFirstSearch>();
    });
    registerAlgorithm(toString(AlgorithmKind::Dijkstra), [](const AlgorithmOptions&) {
        return std::make_unique<DijkstraShortestPath>();
    });
    registerAlgorithm(toString(AlgorithmKind::AStar), [](const AlgorithmOptions& options) {
        return std::make_unique<AStarShortestPath>(options.heuristicScale);
    });
    registerAlgorithm(toString(AlgorithmKind::ConnectedComponents), [](const AlgorithmOptions&) {
        return std::make_unique<ConnectedComponents>();
    });
    registerAlgorithm(toString(AlgorithmKind::DegreeCentrality), [](const AlgorithmOptions& options) {
        return std::make_unique<DegreeCentrality>(options.defaultTopK);
    });
    registerAlgorithm(toString(AlgorithmKind::WelshPowell), [](const AlgorithmOptions&) {
        return std::make_unique<WelshPowellColoring>();
    });
}

void AlgorithmRegistry::registerAlgorithm(const std::string& name, Creator creator) {
    if (name.empty()) {
        throw std::runtime_error("Cannot register algorithm with empty name");
    }
    if (!creator) {
        throw std::runtime_error("Cannot register null creator for '" + name + "'");
    }
    if (creators_.find(name) != creators_.end()) {
        throw std::runtime_error("Algorithm '" + name + "' already registered");
    }
    creators_[name] = std::move(creator);
}

bool AlgorithmRegistry::unregisterAlgorithm(const std::string& name) {
    return creators_.erase(name) > 0;
}

std::unique_ptr<IGraphAlgorithm> AlgorithmRegistry::create(const std::string& name,
                                                           const AlgorithmOptions& options) const {
    auto it = creators_.find(name);
    if (it == creators_.end()) {
        return nullptr;
    }
    return it->second(options);
}

bool AlgorithmRegistry::has(const std::string& name) const {
    return creators_.find(name) != creators_.end();
}

std::vector<std::string> AlgorithmRegistry::availableAlgorithms() const {
    std::vector<std::string> names;
    names.reserve(creators_.size());
    for (const auto& [name, _] : creators_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

}  // namespace sociograph
