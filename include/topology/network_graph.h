/**
 * @file network_graph.h
 * @brief Directed agent graph with cluster, bridge and path queries
 * @author SwarmNet Team
 * @version 1.0.0
 */

#pragma once

#include <string>
#include <vector>
#include <set>
#include <map>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

#include "network/transport.h"

namespace swarmnet {
namespace topology {

/**
 * @brief Connected component of two or more nodes
 */
struct Cluster {
    std::string id;
    std::set<std::string> members;

    nlohmann::json toJson() const;
};

/**
 * @brief Node whose neighbours span several clusters
 */
struct Bridge {
    std::string node_id;
    std::set<std::string> cluster_ids;

    nlohmann::json toJson() const;
};

/**
 * @brief Node and edge store used by the topology manager
 *
 * Nodes keep their insertion order, which makes cluster numbering
 * deterministic for a given edge set. Not thread safe.
 */
class NetworkGraph {
public:
    /**
     * @return False if the node already exists
     */
    bool addNode(const std::string& node_id);

    /**
     * @brief Remove a node together with every incident edge
     * @return Number of edges removed
     */
    size_t removeNode(const std::string& node_id);

    bool hasNode(const std::string& node_id) const;

    /**
     * @brief Add or refresh the directed edge from -> to
     * @return False if either node is unknown or from == to
     */
    bool addEdge(const std::string& from, const std::string& to, uint64_t timestamp = 0);

    bool removeEdge(const std::string& from, const std::string& to);
    bool hasEdge(const std::string& from, const std::string& to) const;

    const std::vector<std::string>& nodes() const { return order_; }
    size_t nodeCount() const { return order_.size(); }
    size_t edgeCount() const;

    std::vector<std::string> outNeighbours(const std::string& node_id) const;

    /**
     * @brief Neighbours in either direction
     */
    std::set<std::string> neighbours(const std::string& node_id) const;

    std::vector<network::Connection> edges() const;

    /**
     * @brief Connected components of the undirected view with at least two members
     *
     * Ids are cluster_<n>, numbered from 0 in node insertion order.
     */
    std::vector<Cluster> computeClusters() const;

    /**
     * @brief Nodes whose neighbours belong to at least two of the given clusters
     */
    std::map<std::string, Bridge> computeBridges(const std::vector<Cluster>& clusters) const;

    /**
     * @brief Shortest path by edge count over directed edges
     * @return [from] when from == to, nullopt when unreachable or unknown
     */
    std::optional<std::vector<std::string>> findPath(const std::string& from, const std::string& to) const;

    void clear();

private:
    std::vector<std::string> order_;
    std::map<std::string, std::map<std::string, network::Connection>> out_;
    std::map<std::string, std::set<std::string>> in_;
};

} // namespace topology
} // namespace swarmnet
