#include <gtest/gtest.h>
#include <sociograph/core/GraphFormatter.h>

using namespace sociograph;

TEST(GraphFormatterTest, AdjacencyList) {
    Graph graph;
    NodeId n1 = graph.addNode();
    NodeId n2 = graph.addNode();
    NodeId n3 = graph.addNode();
    graph.addEdge(n1, n2);
    graph.addEdge(n1, n3);

    EXPECT_EQ(GraphFormatter::adjacencyList(graph), "1: 2, 3\n2: 1\n3: 1\n");
}

TEST(GraphFormatterTest, AdjacencyMatrixHasRowPerNode) {
    Graph graph;
    NodeId n1 = graph.addNode();
    NodeId n2 = graph.addNode();
    graph.addEdge(n1, n2);

    std::string text = GraphFormatter::adjacencyMatrix(graph, 2);
    EXPECT_NE(text.find("1.00"), std::string::npos);
    EXPECT_NE(text.find("0.00"), std::string::npos);

    std::size_t lines = 0;
    for (char c : text) {
        if (c == '\n') ++lines;
    }
    EXPECT_EQ(lines, 3u);
}

TEST(GraphFormatterTest, StatisticsSummary) {
    Graph graph;
    graph.addNode();
    graph.addNode();

    std::string text = GraphFormatter::statistics(graph);
    EXPECT_NE(text.find("nodes=2"), std::string::npos);
    EXPECT_NE(text.find("edges=0"), std::string::npos);
}
