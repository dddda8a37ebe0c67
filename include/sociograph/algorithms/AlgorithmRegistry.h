#pragma once

#include "IGraphAlgorithm.h"

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace sociograph {

/// Central registry of algorithm creators
///
/// Built-in algorithms are registered on first access under the names
/// returned by toString(AlgorithmKind): "BFS", "DFS", "Dijkstra", "AStar",
/// "ConnectedComponents", "DegreeCentrality", "WelshPowell".
///
/// Usage:
/// @code
/// auto& registry = AlgorithmRegistry::instance();
/// auto bfs = registry.create("BFS", AlgorithmOptions{});
/// AlgorithmResult result = bfs->execute(graph, AlgorithmParams::from(1));
///
/// registry.registerAlgorithm("Custom", [](const AlgorithmOptions& o) {
///     return std::make_unique<MyAlgorithm>(o);
/// });
/// @endcode
class AlgorithmRegistry {
public:
    using Creator = std::function<std::unique_ptr<IGraphAlgorithm>(const AlgorithmOptions&)>;

    /// Get singleton instance
    static AlgorithmRegistry& instance();

    // Non-copyable, non-movable (singleton)
    AlgorithmRegistry(const AlgorithmRegistry&) = delete;
    AlgorithmRegistry& operator=(const AlgorithmRegistry&) = delete;

    /// Register a creator
    /// @throws std::runtime_error if name is empty, creator is null or name is taken
    void registerAlgorithm(const std::string& name, Creator creator);

    /// @return true if a creator was found and removed
    bool unregisterAlgorithm(const std::string& name);

    /// Create an algorithm by name
    /// @return New instance, or nullptr if the name is unknown
    std::unique_ptr<IGraphAlgorithm> create(const std::string& name,
                                            const AlgorithmOptions& options) const;

    bool has(const std::string& name) const;

    /// Registered names, sorted
    std::vector<std::string> availableAlgorithms() const;

private:
    AlgorithmRegistry();
    ~AlgorithmRegistry() = default;

    void registerBuiltinAlgorithms();

    std::unordered_map<std::string, Creator> creators_;
};

}  // namespace sociograph
