#include <gtest/gtest.h>
#include <sociograph/core/SampleGraphGenerator.h>

#include <set>
#include <string>

using namespace sociograph;

TEST(SampleGraphGeneratorTest, RadiusGrowsThenSaturates) {
    EXPECT_DOUBLE_EQ(SampleGraphGenerator::radiusFor(0), 50.0);
    EXPECT_DOUBLE_EQ(SampleGraphGenerator::radiusFor(10), 130.0);
    EXPECT_DOUBLE_EQ(SampleGraphGenerator::radiusFor(100), 300.0);
}

TEST(SampleGraphGeneratorTest, NodesLieOnCircle) {
    SampleGraphOptions options;
    options.nodeCount = 10;
    options.edgeProbability = 0.0;
    options.seed = 1;
    Graph graph = SampleGraphGenerator::generate(options);

    ASSERT_EQ(graph.nodeCount(), 10u);
    EXPECT_EQ(graph.edgeCount(), 0u);
    for (NodeId id : graph.nodes()) {
        EXPECT_NEAR(graph.getNode(id).position.distanceTo(options.center), 130.0, 1e-9);
    }
}

TEST(SampleGraphGeneratorTest, AttributesWithinRanges) {
    SampleGraphOptions options;
    options.nodeCount = 40;
    options.seed = 3;
    Graph graph = SampleGraphGenerator::generate(options);

    for (NodeId id : graph.nodes()) {
        const NodeData& node = graph.getNode(id);
        EXPECT_GE(node.activity, 0.1);
        EXPECT_LE(node.activity, 1.0);
        EXPECT_GE(node.interaction, 1.0);
        EXPECT_LE(node.interaction, 50.0);
        EXPECT_FALSE(node.name.empty());
    }
}

TEST(SampleGraphGeneratorTest, NamesAreUniqueBeyondNameList) {
    SampleGraphOptions options;
    options.nodeCount = 45;
    options.edgeProbability = 0.0;
    options.seed = 5;
    Graph graph = SampleGraphGenerator::generate(options);

    std::set<std::string> names;
    for (NodeId id : graph.nodes()) {
        names.insert(graph.getNode(id).name);
    }
    EXPECT_EQ(names.size(), 45u);
}

TEST(SampleGraphGeneratorTest, CompleteGraphWithProbabilityOne) {
    SampleGraphOptions options;
    options.nodeCount = 6;
    options.edgeProbability = 1.0;
    options.seed = 9;
    Graph graph = SampleGraphGenerator::generate(options);

    EXPECT_EQ(graph.edgeCount(), 15u);
    EXPECT_DOUBLE_EQ(graph.statistics().density, 1.0);
}

TEST(SampleGraphGeneratorTest, SameSeedSameGraph) {
    SampleGraphOptions options;
    options.nodeCount = 15;
    options.seed = 1234;
    Graph a = SampleGraphGenerator::generate(options);
    Graph b = SampleGraphGenerator::generate(options);

    EXPECT_EQ(a.edgeCount(), b.edgeCount());
    for (const auto& edge : a.edges()) {
        EXPECT_TRUE(b.hasEdge(edge.source, edge.target));
    }
    for (NodeId id : a.nodes()) {
        EXPECT_DOUBLE_EQ(a.getNode(id).activity, b.getNode(id).activity);
    }
}

TEST(SampleGraphGeneratorTest, ZeroNodesGivesEmptyGraph) {
    SampleGraphOptions options;
    options.nodeCount = 0;
    EXPECT_TRUE(SampleGraphGenerator::generate(options).empty());
}
