#include <gtest/gtest.h>
#include <sociograph/algorithms/AlgorithmEngine.h>

using namespace sociograph;

namespace {

void addTriangle(Graph& graph, NodeId a, NodeId b, NodeId c) {
    graph.addEdge(a, b);
    graph.addEdge(b, c);
    graph.addEdge(c, a);
}

}  // namespace

TEST(ConnectedComponentsTest, TwoDisjointTriangles) {
    Graph graph;
    for (int i = 0; i < 6; ++i) graph.addNode();
    addTriangle(graph, 1, 2, 3);
    addTriangle(graph, 4, 5, 6);

    AlgorithmResult result = AlgorithmEngine{}.connectedComponents(graph);
    ASSERT_TRUE(result.success);
    const auto* data = result.data<ComponentsData>();
    ASSERT_NE(data, nullptr);

    ASSERT_EQ(data->count(), 2u);
    EXPECT_EQ(data->components[0], (std::vector<NodeId>{1, 2, 3}));
    EXPECT_EQ(data->components[1], (std::vector<NodeId>{4, 5, 6}));
    EXPECT_EQ(data->largestSize(), 3u);
    EXPECT_TRUE(data->isolatedNodes().empty());
}

TEST(ConnectedComponentsTest, LargestComponentFirst) {
    Graph graph;
    for (int i = 0; i < 7; ++i) graph.addNode();
    graph.addEdge(2, 3);
    addTriangle(graph, 4, 5, 6);
    graph.addEdge(6, 7);

    AlgorithmResult result = AlgorithmEngine{}.connectedComponents(graph);
    const auto* data = result.data<ComponentsData>();
    ASSERT_NE(data, nullptr);

    ASSERT_EQ(data->count(), 3u);
    EXPECT_EQ(data->components[0].size(), 4u);
    EXPECT_EQ(data->components[1], (std::vector<NodeId>{2, 3}));
    EXPECT_EQ(data->components[2], std::vector<NodeId>{1});
    EXPECT_EQ(data->isolatedNodes(), std::vector<NodeId>{1});
    EXPECT_EQ(data->componentOf.at(7), 0u);
    EXPECT_EQ(data->componentOf.at(1), 2u);
}

TEST(ConnectedComponentsTest, EveryNodeInExactlyOneComponent) {
    Graph graph;
    for (int i = 0; i < 10; ++i) graph.addNode();
    graph.addEdge(1, 5);
    graph.addEdge(5, 9);
    graph.addEdge(2, 4);
    graph.addEdge(8, 10);

    AlgorithmResult result = AlgorithmEngine{}.connectedComponents(graph);
    const auto* data = result.data<ComponentsData>();
    ASSERT_NE(data, nullptr);

    std::size_t total = 0;
    for (const auto& component : data->components) {
        total += component.size();
    }
    EXPECT_EQ(total, graph.nodeCount());
    EXPECT_EQ(data->componentOf.size(), graph.nodeCount());
}

TEST(ConnectedComponentsTest, StepsMarkCompletion) {
    Graph graph;
    for (int i = 0; i < 3; ++i) graph.addNode();
    graph.addEdge(1, 2);

    AlgorithmResult result = AlgorithmEngine{}.connectedComponents(graph);
    std::size_t completions = 0;
    for (const auto& step : result.steps) {
        if (step.type == StepType::ComponentComplete) ++completions;
    }
    EXPECT_EQ(completions, 2u);
}

TEST(ConnectedComponentsTest, EmptyGraph) {
    Graph graph;
    AlgorithmResult result = AlgorithmEngine{}.connectedComponents(graph);
    ASSERT_TRUE(result.success);
    const auto* data = result.data<ComponentsData>();
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(data->count(), 0u);
    EXPECT_EQ(data->largestSize(), 0u);
}
