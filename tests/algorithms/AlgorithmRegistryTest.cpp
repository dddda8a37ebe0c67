#include <gtest/gtest.h>
#include <sociograph/algorithms/AlgorithmEngine.h>

#include <algorithm>
#include <stdexcept>

using namespace sociograph;

namespace {

// Counts nodes; used to exercise custom registration
class NodeCounter : public IGraphAlgorithm {
public:
    AlgorithmResult execute(const Graph& graph, const AlgorithmParams&) const override {
        AlgorithmResult result;
        result.name = name();
        result.success = true;
        result.message = std::to_string(graph.nodeCount());
        return result;
    }

    AlgorithmKind kind() const override { return AlgorithmKind::ConnectedComponents; }
    const char* name() const override { return "NodeCounter"; }
    const char* description() const override { return "Counts nodes"; }
};

}  // namespace

TEST(AlgorithmRegistryTest, BuiltinsAreRegistered) {
    auto& registry = AlgorithmRegistry::instance();
    for (AlgorithmKind kind : allAlgorithmKinds()) {
        EXPECT_TRUE(registry.has(toString(kind))) << toString(kind);
        auto algorithm = registry.create(toString(kind), AlgorithmOptions{});
        ASSERT_NE(algorithm, nullptr);
        EXPECT_EQ(algorithm->kind(), kind);
        EXPECT_STREQ(algorithm->name(), toString(kind));
        EXPECT_NE(std::string(algorithm->description()), "");
    }

    auto names = registry.availableAlgorithms();
    EXPECT_TRUE(std::is_sorted(names.begin(), names.end()));
    EXPECT_GE(names.size(), 7u);
}

TEST(AlgorithmRegistryTest, UnknownNameCreatesNothing) {
    EXPECT_EQ(AlgorithmRegistry::instance().create("PageRank", AlgorithmOptions{}), nullptr);
    EXPECT_FALSE(AlgorithmRegistry::instance().has("PageRank"));
}

TEST(AlgorithmRegistryTest, RejectsDuplicateAndInvalidRegistration) {
    auto& registry = AlgorithmRegistry::instance();
    auto creator = [](const AlgorithmOptions&) { return std::make_unique<NodeCounter>(); };

    EXPECT_THROW(registry.registerAlgorithm("BFS", creator), std::runtime_error);
    EXPECT_THROW(registry.registerAlgorithm("", creator), std::runtime_error);
    EXPECT_THROW(registry.registerAlgorithm("Null", nullptr), std::runtime_error);
}

TEST(AlgorithmRegistryTest, CustomAlgorithmRunsThroughEngine) {
    auto& registry = AlgorithmRegistry::instance();
    registry.registerAlgorithm("NodeCounter", [](const AlgorithmOptions&) {
        return std::make_unique<NodeCounter>();
    });

    Graph graph;
    graph.addNode();
    graph.addNode();
    AlgorithmResult result = AlgorithmEngine{}.run("NodeCounter", graph);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, "2");

    EXPECT_TRUE(registry.unregisterAlgorithm("NodeCounter"));
    EXPECT_FALSE(registry.unregisterAlgorithm("NodeCounter"));
}

TEST(AlgorithmRegistryTest, EngineReportsUnknownAlgorithm) {
    Graph graph;
    graph.addNode();

    AlgorithmResult result = AlgorithmEngine{}.run("Bogus", graph);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, AlgorithmError::InvalidOperation);
    EXPECT_EQ(result.name, "Bogus");
    EXPECT_NE(result.message.find("Bogus"), std::string::npos);
}

TEST(AlgorithmRegistryTest, EngineDispatchByNameMatchesKind) {
    Graph graph;
    for (int i = 0; i < 3; ++i) graph.addNode();
    graph.addEdge(1, 2);

    AlgorithmEngine engine;
    AlgorithmResult byName = engine.run("ConnectedComponents", graph);
    AlgorithmResult byKind = engine.run(AlgorithmKind::ConnectedComponents, graph);
    ASSERT_NE(byName.data<ComponentsData>(), nullptr);
    ASSERT_NE(byKind.data<ComponentsData>(), nullptr);
    EXPECT_EQ(byName.data<ComponentsData>()->components, byKind.data<ComponentsData>()->components);
}

TEST(AlgorithmRegistryTest, KindNamesRoundTrip) {
    for (AlgorithmKind kind : allAlgorithmKinds()) {
        EXPECT_EQ(algorithmKindFromString(toString(kind)), std::optional<AlgorithmKind>(kind));
    }
    EXPECT_FALSE(algorithmKindFromString("bfs").has_value());
    EXPECT_STREQ(toString(AlgorithmError::Unreachable), "Unreachable");
}

TEST(AlgorithmRegistryTest, FailureCarriesNoPayload) {
    Graph graph;
    AlgorithmResult result = AlgorithmEngine{}.dijkstra(graph, 1, 2);
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(std::holds_alternative<std::monostate>(result.payload));
    EXPECT_GE(result.elapsedMs, 0.0);
}

TEST(AlgorithmRegistryTest, SingleNodeGraphSucceedsForEveryKind) {
    Graph graph;
    graph.addNode("Solo");

    AlgorithmEngine engine;
    for (AlgorithmKind kind : allAlgorithmKinds()) {
        AlgorithmResult result = engine.run(kind, graph, AlgorithmParams::between(1, 1));
        EXPECT_TRUE(result.success) << toString(kind) << ": " << result.message;
        EXPECT_EQ(result.error, AlgorithmError::None) << toString(kind);
    }
}
