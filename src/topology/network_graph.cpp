/**
 * @file network_graph.cpp
 * @brief Graph algorithms over the agent topology
 * @author SwarmNet Team
 * @version 1.0.0
 */

#include "topology/network_graph.h"

#include <algorithm>
#include <deque>

namespace swarmnet {
namespace topology {

nlohmann::json Cluster::toJson() const {
    nlohmann::json json;
    json["id"] = id;
    json["members"] = members;
    return json;
}

nlohmann::json Bridge::toJson() const {
    nlohmann::json json;
    json["nodeId"] = node_id;
    json["clusters"] = cluster_ids;
    return json;
}

bool NetworkGraph::addNode(const std::string& node_id) {
    if (out_.count(node_id) > 0) {
        return false;
    }
    order_.push_back(node_id);
    out_[node_id];
    in_[node_id];
    return true;
}

size_t NetworkGraph::removeNode(const std::string& node_id) {
    auto out_it = out_.find(node_id);
    if (out_it == out_.end()) {
        return 0;
    }

    size_t removed = out_it->second.size();
    for (const auto& [to, connection] : out_it->second) {
        in_[to].erase(node_id);
    }

    for (const auto& from : in_[node_id]) {
        if (out_[from].erase(node_id) > 0) {
            removed++;
        }
    }

    out_.erase(out_it);
    in_.erase(node_id);
    order_.erase(std::remove(order_.begin(), order_.end(), node_id), order_.end());
    return removed;
}

bool NetworkGraph::hasNode(const std::string& node_id) const {
    return out_.count(node_id) > 0;
}

bool NetworkGraph::addEdge(const std::string& from, const std::string& to, uint64_t timestamp) {
    if (from == to || !hasNode(from) || !hasNode(to)) {
        return false;
    }

    network::Connection& connection = out_[from][to];
    connection.from = from;
    connection.to = to;
    connection.status = network::ConnectionStatus::CONNECTED;
    connection.last_activity = std::max(connection.last_activity, timestamp);
    in_[to].insert(from);
    return true;
}

bool NetworkGraph::removeEdge(const std::string& from, const std::string& to) {
    auto it = out_.find(from);
    if (it == out_.end() || it->second.erase(to) == 0) {
        return false;
    }
    in_[to].erase(from);
    return true;
}

bool NetworkGraph::hasEdge(const std::string& from, const std::string& to) const {
    auto it = out_.find(from);
    return it != out_.end() && it->second.count(to) > 0;
}

size_t NetworkGraph::edgeCount() const {
    size_t count = 0;
    for (const auto& [node_id, targets] : out_) {
        count += targets.size();
    }
    return count;
}

std::vector<std::string> NetworkGraph::outNeighbours(const std::string& node_id) const {
    std::vector<std::string> result;
    auto it = out_.find(node_id);
    if (it != out_.end()) {
        for (const auto& [to, connection] : it->second) {
            result.push_back(to);
        }
    }
    return result;
}

std::set<std::string> NetworkGraph::neighbours(const std::string& node_id) const {
    std::set<std::string> result;
    auto out_it = out_.find(node_id);
    if (out_it != out_.end()) {
        for (const auto& [to, connection] : out_it->second) {
            result.insert(to);
        }
    }
    auto in_it = in_.find(node_id);
    if (in_it != in_.end()) {
        result.insert(in_it->second.begin(), in_it->second.end());
    }
    return result;
}

std::vector<network::Connection> NetworkGraph::edges() const {
    std::vector<network::Connection> result;
    for (const auto& node_id : order_) {
        for (const auto& [to, connection] : out_.at(node_id)) {
            result.push_back(connection);
        }
    }
    return result;
}

std::vector<Cluster> NetworkGraph::computeClusters() const {
    std::vector<Cluster> clusters;
    std::set<std::string> visited;

    for (const auto& start : order_) {
        if (visited.count(start) > 0) {
            continue;
        }

        std::set<std::string> component;
        std::vector<std::string> stack{start};
        while (!stack.empty()) {
            std::string node_id = stack.back();
            stack.pop_back();
            if (!visited.insert(node_id).second) {
                continue;
            }
            component.insert(node_id);

            for (const auto& next : neighbours(node_id)) {
                if (visited.count(next) == 0) {
                    stack.push_back(next);
                }
            }
        }

        if (component.size() > 1) {
            Cluster cluster;
            cluster.id = "cluster_" + std::to_string(clusters.size());
            cluster.members = std::move(component);
            clusters.push_back(std::move(cluster));
        }
    }

    return clusters;
}

std::map<std::string, Bridge> NetworkGraph::computeBridges(const std::vector<Cluster>& clusters) const {
    std::map<std::string, std::string> membership;
    for (const auto& cluster : clusters) {
        for (const auto& member : cluster.members) {
            membership[member] = cluster.id;
        }
    }

    std::map<std::string, Bridge> bridges;
    for (const auto& node_id : order_) {
        std::set<std::string> touched;
        for (const auto& neighbour : neighbours(node_id)) {
            auto it = membership.find(neighbour);
            if (it != membership.end()) {
                touched.insert(it->second);
            }
        }

        if (touched.size() >= 2) {
            bridges[node_id] = Bridge{node_id, std::move(touched)};
        }
    }
    return bridges;
}

std::optional<std::vector<std::string>> NetworkGraph::findPath(const std::string& from, const std::string& to) const {
    if (!hasNode(from) || !hasNode(to)) {
        return std::nullopt;
    }
    if (from == to) {
        return std::vector<std::string>{from};
    }

    std::map<std::string, std::string> parent;
    std::set<std::string> visited{from};
    std::deque<std::string> queue{from};

    while (!queue.empty()) {
        std::string current = queue.front();
        queue.pop_front();

        for (const auto& [next, connection] : out_.at(current)) {
            if (!visited.insert(next).second) {
                continue;
            }
            parent[next] = current;

            if (next == to) {
                std::vector<std::string> path{to};
                while (path.back() != from) {
                    path.push_back(parent[path.back()]);
                }
                std::reverse(path.begin(), path.end());
                return path;
            }
            queue.push_back(next);
        }
    }

    return std::nullopt;
}

void NetworkGraph::clear() {
    order_.clear();
    out_.clear();
    in_.clear();
}

} // namespace topology
} // namespace swarmnet
