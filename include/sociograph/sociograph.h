#pragma once

/// @file sociograph.h
/// @brief Main header for the Sociograph social-network analysis library
///
/// Sociograph models a small social network as an undirected weighted graph,
/// runs classic analysis algorithms over it and lays it out with a
/// force-directed simulation.
///
/// Example usage:
/// @code
/// #include <sociograph/sociograph.h>
///
/// sociograph::Graph graph;
/// auto alice = graph.addNode("Alice");
/// auto bob = graph.addNode("Bob");
/// graph.addEdge(alice, bob);
///
/// sociograph::AlgorithmEngine engine;
/// auto result = engine.dijkstra(graph, alice, bob);
///
/// sociograph::ForceDirectedLayout layout;
/// layout.run(graph);
/// @endcode

// Core module - Graph data structures
#include "core/Types.h"
#include "core/Graph.h"
#include "core/WeightCalculator.h"
#include "core/GraphRecords.h"
#include "core/GraphFormatter.h"
#include "core/SampleGraphGenerator.h"

// Algorithms module - Analysis algorithms and dispatch
#include "algorithms/AlgorithmOptions.h"
#include "algorithms/AlgorithmResult.h"
#include "algorithms/IGraphAlgorithm.h"
#include "algorithms/AlgorithmRegistry.h"
#include "algorithms/AlgorithmEngine.h"

// Layout module
#include "layout/ForceLayoutOptions.h"
#include "layout/ForceDirectedLayout.h"

// Configuration
#include "config/EngineConfig.h"

#include <string>

namespace sociograph {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace sociograph
