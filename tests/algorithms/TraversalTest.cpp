#include <gtest/gtest.h>
#include <sociograph/algorithms/AlgorithmEngine.h>

#include <algorithm>
#include <set>

using namespace sociograph;

namespace {

Graph makePath(std::size_t length) {
    Graph graph;
    NodeId previous = INVALID_NODE;
    for (std::size_t i = 0; i < length; ++i) {
        NodeId id = graph.addNode();
        if (previous != INVALID_NODE) {
            graph.addEdge(previous, id);
        }
        previous = id;
    }
    return graph;
}

}  // namespace

TEST(TraversalTest, BfsLevelsOnPath) {
    Graph graph = makePath(5);
    AlgorithmEngine engine;

    AlgorithmResult result = engine.breadthFirstSearch(graph, 1);
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.name, "BFS");

    const auto* data = result.data<TraversalData>();
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(data->visitOrder, (std::vector<NodeId>{1, 2, 3, 4, 5}));
    for (NodeId id = 1; id <= 5; ++id) {
        EXPECT_EQ(data->levels.at(id), static_cast<int>(id - 1));
    }
}

TEST(TraversalTest, BfsVisitsByLevel) {
    // 1 - {2, 3}, 2 - 4, 3 - 5, 4 - 6
    Graph graph;
    for (int i = 0; i < 6; ++i) graph.addNode();
    graph.addEdge(1, 2);
    graph.addEdge(1, 3);
    graph.addEdge(2, 4);
    graph.addEdge(3, 5);
    graph.addEdge(4, 6);

    AlgorithmResult result = AlgorithmEngine{}.breadthFirstSearch(graph, 1);
    const auto* data = result.data<TraversalData>();
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(data->visitOrder, (std::vector<NodeId>{1, 2, 3, 4, 5, 6}));
    EXPECT_EQ(data->levels.at(6), 3);
}

TEST(TraversalTest, BfsStaysInsideComponent) {
    Graph graph = makePath(3);
    NodeId island = graph.addNode();

    AlgorithmResult result = AlgorithmEngine{}.breadthFirstSearch(graph, 1);
    const auto* data = result.data<TraversalData>();
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(data->visitedCount(), 3u);
    EXPECT_FALSE(data->visited(island));
    EXPECT_EQ(data->levelBucket(island), -1);
}

TEST(TraversalTest, BfsRecordsSteps) {
    Graph graph = makePath(3);
    AlgorithmResult result = AlgorithmEngine{}.breadthFirstSearch(graph, 2);

    ASSERT_FALSE(result.steps.empty());
    EXPECT_EQ(result.steps.front().type, StepType::Visit);
    EXPECT_EQ(result.steps.front().nodeId, 2u);

    std::size_t visits = std::count_if(result.steps.begin(), result.steps.end(),
                                       [](const AlgorithmStep& s) { return s.type == StepType::Visit; });
    EXPECT_EQ(visits, 3u);

    for (std::size_t i = 1; i < result.steps.size(); ++i) {
        EXPECT_GE(result.steps[i].elapsedMs, result.steps[i - 1].elapsedMs);
    }
}

TEST(TraversalTest, LevelBucketsSaturateAtFive) {
    Graph graph = makePath(8);
    AlgorithmResult result = AlgorithmEngine{}.breadthFirstSearch(graph, 1);
    const auto* data = result.data<TraversalData>();
    ASSERT_NE(data, nullptr);

    EXPECT_EQ(data->levelBucket(1), 0);
    EXPECT_EQ(data->levelBucket(5), 4);
    EXPECT_EQ(data->levelBucket(6), 5);
    EXPECT_EQ(data->levelBucket(8), 5);
}

TEST(TraversalTest, DfsVisitsEveryNodeOnce) {
    Graph graph = makePath(5);
    AlgorithmResult result = AlgorithmEngine{}.depthFirstSearch(graph, 1);
    ASSERT_TRUE(result.success);

    const auto* data = result.data<TraversalData>();
    ASSERT_NE(data, nullptr);
    ASSERT_EQ(data->visitOrder.size(), 5u);
    std::set<NodeId> unique(data->visitOrder.begin(), data->visitOrder.end());
    EXPECT_EQ(unique.size(), 5u);
    EXPECT_EQ(data->visitOrder, (std::vector<NodeId>{1, 2, 3, 4, 5}));
}

TEST(TraversalTest, DfsFollowsFirstInsertedNeighbor) {
    Graph graph;
    for (int i = 0; i < 5; ++i) graph.addNode();
    graph.addEdge(1, 2);
    graph.addEdge(1, 3);
    graph.addEdge(1, 4);
    graph.addEdge(2, 5);

    AlgorithmResult result = AlgorithmEngine{}.depthFirstSearch(graph, 1);
    const auto* data = result.data<TraversalData>();
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(data->visitOrder, (std::vector<NodeId>{1, 2, 5, 3, 4}));
    EXPECT_EQ(data->levels.at(5), 2);
    EXPECT_EQ(data->levels.at(4), 1);
}

TEST(TraversalTest, DfsHandlesCycles) {
    Graph graph;
    for (int i = 0; i < 4; ++i) graph.addNode();
    graph.addEdge(1, 2);
    graph.addEdge(2, 3);
    graph.addEdge(3, 4);
    graph.addEdge(4, 1);

    AlgorithmResult result = AlgorithmEngine{}.depthFirstSearch(graph, 1);
    const auto* data = result.data<TraversalData>();
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(data->visitOrder, (std::vector<NodeId>{1, 2, 3, 4}));
}

TEST(TraversalTest, NormalizedDiscovery) {
    Graph graph = makePath(5);
    AlgorithmResult result = AlgorithmEngine{}.depthFirstSearch(graph, 1);
    const auto* data = result.data<TraversalData>();
    ASSERT_NE(data, nullptr);

    EXPECT_DOUBLE_EQ(data->normalizedDiscovery(1), 0.0);
    EXPECT_DOUBLE_EQ(data->normalizedDiscovery(3), 0.5);
    EXPECT_DOUBLE_EQ(data->normalizedDiscovery(5), 1.0);
    EXPECT_DOUBLE_EQ(data->normalizedDiscovery(42), -1.0);
}

TEST(TraversalTest, SingleNodeTraversal) {
    Graph graph;
    NodeId only = graph.addNode();

    for (auto kind : {AlgorithmKind::BreadthFirstSearch, AlgorithmKind::DepthFirstSearch}) {
        AlgorithmResult result = AlgorithmEngine{}.run(kind, graph, AlgorithmParams::from(only));
        ASSERT_TRUE(result.success);
        const auto* data = result.data<TraversalData>();
        ASSERT_NE(data, nullptr);
        EXPECT_EQ(data->visitOrder, std::vector<NodeId>{only});
        EXPECT_DOUBLE_EQ(data->normalizedDiscovery(only), 0.0);
    }
}

TEST(TraversalTest, MissingStartFails) {
    Graph graph = makePath(3);

    for (auto kind : {AlgorithmKind::BreadthFirstSearch, AlgorithmKind::DepthFirstSearch}) {
        AlgorithmResult missing = AlgorithmEngine{}.run(kind, graph, AlgorithmParams::from(99));
        EXPECT_FALSE(missing.success);
        EXPECT_EQ(missing.error, AlgorithmError::NotFound);
        EXPECT_TRUE(missing.steps.empty());
        EXPECT_EQ(missing.data<TraversalData>(), nullptr);
        EXPECT_FALSE(missing.message.empty());

        AlgorithmResult unspecified = AlgorithmEngine{}.run(kind, graph);
        EXPECT_FALSE(unspecified.success);
        EXPECT_EQ(unspecified.error, AlgorithmError::NotFound);
    }
}
