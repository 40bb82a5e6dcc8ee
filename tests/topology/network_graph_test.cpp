/**
 * @file network_graph_test.cpp
 * @brief Tests for the topology graph, clusters, bridges and paths
 */

#include <gtest/gtest.h>
#include "topology/network_graph.h"

namespace swarmnet {
namespace tests {

using topology::Cluster;
using topology::NetworkGraph;

class NetworkGraphTest : public ::testing::Test {
protected:
    void addNodes(std::initializer_list<const char*> ids) {
        for (const char* id : ids) {
            graph_.addNode(id);
        }
    }

    void link(const std::string& a, const std::string& b) {
        graph_.addEdge(a, b, 1);
        graph_.addEdge(b, a, 1);
    }

    NetworkGraph graph_;
};

TEST_F(NetworkGraphTest, NodesKeepInsertionOrder) {
    addNodes({"agent_2", "agent_0", "agent_1"});

    EXPECT_FALSE(graph_.addNode("agent_0"));
    EXPECT_EQ(graph_.nodes(), (std::vector<std::string>{"agent_2", "agent_0", "agent_1"}));
    EXPECT_EQ(graph_.nodeCount(), 3u);
}

TEST_F(NetworkGraphTest, EdgesRequireKnownDistinctNodes) {
    addNodes({"a", "b"});

    EXPECT_TRUE(graph_.addEdge("a", "b", 10));
    EXPECT_FALSE(graph_.addEdge("a", "a"));
    EXPECT_FALSE(graph_.addEdge("a", "ghost"));
    EXPECT_TRUE(graph_.hasEdge("a", "b"));
    EXPECT_FALSE(graph_.hasEdge("b", "a"));

    // Refreshing keeps a single edge with the newest activity time
    EXPECT_TRUE(graph_.addEdge("a", "b", 5));
    ASSERT_EQ(graph_.edgeCount(), 1u);
    EXPECT_EQ(graph_.edges()[0].last_activity, 10u);
    EXPECT_EQ(graph_.edges()[0].status, network::ConnectionStatus::CONNECTED);

    EXPECT_TRUE(graph_.removeEdge("a", "b"));
    EXPECT_FALSE(graph_.removeEdge("a", "b"));
    EXPECT_EQ(graph_.edgeCount(), 0u);
}

TEST_F(NetworkGraphTest, RemoveNodeDropsIncidentEdges) {
    addNodes({"a", "b", "c"});
    link("a", "b");
    link("b", "c");
    graph_.addEdge("c", "a");

    EXPECT_EQ(graph_.removeNode("b"), 4u);
    EXPECT_FALSE(graph_.hasNode("b"));
    EXPECT_EQ(graph_.edgeCount(), 1u);
    EXPECT_TRUE(graph_.neighbours("a").count("c"));
    EXPECT_EQ(graph_.removeNode("b"), 0u);
}

TEST_F(NetworkGraphTest, NeighboursIgnoreDirection) {
    addNodes({"a", "b", "c"});
    graph_.addEdge("a", "b");
    graph_.addEdge("c", "a");

    EXPECT_EQ(graph_.neighbours("a"), (std::set<std::string>{"b", "c"}));
    EXPECT_EQ(graph_.outNeighbours("a"), std::vector<std::string>{"b"});
}

TEST_F(NetworkGraphTest, ClustersSkipSingletons) {
    addNodes({"a", "b", "c", "d", "e", "lonely"});
    link("a", "b");
    graph_.addEdge("c", "d");
    graph_.addEdge("e", "d");

    std::vector<Cluster> clusters = graph_.computeClusters();
    ASSERT_EQ(clusters.size(), 2u);
    EXPECT_EQ(clusters[0].id, "cluster_0");
    EXPECT_EQ(clusters[0].members, (std::set<std::string>{"a", "b"}));
    EXPECT_EQ(clusters[1].id, "cluster_1");
    EXPECT_EQ(clusters[1].members, (std::set<std::string>{"c", "d", "e"}));
}

TEST_F(NetworkGraphTest, EmptyGraphHasNoClusters) {
    EXPECT_TRUE(graph_.computeClusters().empty());
    addNodes({"a", "b"});
    EXPECT_TRUE(graph_.computeClusters().empty());
}

TEST_F(NetworkGraphTest, BridgesTouchSeveralClusters) {
    addNodes({"a", "b", "hub", "c", "d"});
    link("a", "hub");
    link("hub", "c");
    link("a", "b");
    link("c", "d");

    // Connected components merge everything, so bridges only show up
    // against a finer partition supplied by the caller
    EXPECT_TRUE(graph_.computeBridges(graph_.computeClusters()).empty());

    std::vector<Cluster> clusters = {
        Cluster{"left", {"a", "b"}},
        Cluster{"right", {"c", "d"}}
    };
    auto bridges = graph_.computeBridges(clusters);
    ASSERT_EQ(bridges.size(), 1u);
    ASSERT_TRUE(bridges.count("hub"));
    EXPECT_EQ(bridges["hub"].cluster_ids, (std::set<std::string>{"left", "right"}));
}

TEST_F(NetworkGraphTest, FindPathFollowsDirectedEdges) {
    addNodes({"a", "b", "c", "d"});
    graph_.addEdge("a", "b");
    graph_.addEdge("b", "c");
    graph_.addEdge("a", "d");
    graph_.addEdge("d", "c");

    auto path = graph_.findPath("a", "c");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->size(), 3u);
    EXPECT_EQ(path->front(), "a");
    EXPECT_EQ(path->back(), "c");

    EXPECT_FALSE(graph_.findPath("c", "a").has_value());
}

TEST_F(NetworkGraphTest, FindPathEdgeCases) {
    addNodes({"a", "b"});

    auto self = graph_.findPath("a", "a");
    ASSERT_TRUE(self.has_value());
    EXPECT_EQ(*self, std::vector<std::string>{"a"});

    EXPECT_FALSE(graph_.findPath("a", "b").has_value());
    EXPECT_FALSE(graph_.findPath("a", "ghost").has_value());
    EXPECT_FALSE(graph_.findPath("ghost", "ghost").has_value());
}

TEST_F(NetworkGraphTest, ClearEmptiesGraph) {
    addNodes({"a", "b"});
    link("a", "b");
    graph_.clear();

    EXPECT_EQ(graph_.nodeCount(), 0u);
    EXPECT_EQ(graph_.edgeCount(), 0u);
    EXPECT_TRUE(graph_.addNode("a"));
}

} // namespace tests
} // namespace swarmnet
