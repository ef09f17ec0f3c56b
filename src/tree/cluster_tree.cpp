#include "tree/cluster_tree.hpp"
#include <algorithm>
#include <fstream>
#include <set>
#include <stdexcept>

namespace cv {

nlohmann::json TreeStatistics::to_json() const {
    nlohmann::json j;
    j["num_nodes"] = num_nodes;
    j["num_leaves"] = num_leaves;
    j["num_fallback_centroids"] = num_fallback_centroids;
    j["max_depth"] = max_depth;
    j["avg_branching"] = avg_branching;
    j["max_branching"] = max_branching;
    return j;
}

// ==========================================
// Construction
// ==========================================

void ClusterTree::add_node(const ClusterNode& node) {
    nodes_[node.id] = node;
}

void ClusterTree::finalize() {
    std::vector<NodeId> roots;
    for (auto& [id, node] : nodes_) {
        node.children.clear();
        if (!node.parent_id) {
            roots.push_back(id);
        }
    }

    if (roots.empty()) {
        throw std::runtime_error("Cluster tree has no root node");
    }
    if (roots.size() > 1) {
        throw std::runtime_error("Cluster tree has " + std::to_string(roots.size()) +
                                 " root nodes, expected exactly one");
    }
    root_id_ = roots.front();

    for (auto& [id, node] : nodes_) {
        if (!node.parent_id) continue;
        auto parent_it = nodes_.find(*node.parent_id);
        if (parent_it == nodes_.end()) {
            throw std::runtime_error("Node " + std::to_string(id) +
                                     " references unknown parent " + std::to_string(*node.parent_id));
        }
        parent_it->second.children.push_back(id);
    }

    // Depths from the root downward; anything unreached sits on a cycle
    std::set<NodeId> reached;
    std::vector<NodeId> stack = {root_id_};
    nodes_[root_id_].depth = 0;
    while (!stack.empty()) {
        NodeId current = stack.back();
        stack.pop_back();
        reached.insert(current);
        auto& node = nodes_[current];
        std::sort(node.children.begin(), node.children.end());
        node.child_count = static_cast<int>(node.children.size());
        node.is_leaf = node.children.empty();
        for (NodeId child : node.children) {
            nodes_[child].depth = node.depth + 1;
            stack.push_back(child);
        }
    }

    if (reached.size() != nodes_.size()) {
        throw std::runtime_error("Cluster tree contains a parent cycle (" +
                                 std::to_string(nodes_.size() - reached.size()) +
                                 " nodes unreachable from root)");
    }
}

// ==========================================
// Queries
// ==========================================

const ClusterNode* ClusterTree::get_node(NodeId id) const {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

std::vector<ClusterNode> ClusterTree::get_children(NodeId id) const {
    std::vector<ClusterNode> result;
    const ClusterNode* node = get_node(id);
    if (!node) return result;
    for (NodeId child : node->children) {
        if (const ClusterNode* c = get_node(child)) {
            result.push_back(*c);
        }
    }
    return result;
}

std::vector<NodeId> ClusterTree::ancestor_chain(NodeId id) const {
    std::vector<NodeId> chain;
    const ClusterNode* node = get_node(id);
    while (node) {
        chain.push_back(node->id);
        if (!node->parent_id || chain.size() > nodes_.size()) break;
        node = get_node(*node->parent_id);
    }
    return chain;
}

TreeStatistics ClusterTree::compute_statistics() const {
    TreeStatistics stats;
    stats.num_nodes = nodes_.size();

    size_t internal = 0;
    size_t child_total = 0;
    for (const auto& [id, node] : nodes_) {
        if (node.children.empty()) {
            stats.num_leaves++;
        } else {
            internal++;
            child_total += node.children.size();
            stats.max_branching = std::max(stats.max_branching, node.children.size());
        }
        if (!node.has_valid_centroid) {
            stats.num_fallback_centroids++;
        }
        stats.max_depth = std::max(stats.max_depth, node.depth);
    }

    if (internal > 0) {
        stats.avg_branching = static_cast<double>(child_total) / internal;
    }
    return stats;
}

// ==========================================
// Serialization
// ==========================================

nlohmann::json ClusterTree::to_json() const {
    nlohmann::json j;
    j["namespace"] = namespace_;
    nlohmann::json nodes_arr = nlohmann::json::array();
    for (const auto& [id, node] : nodes_) {
        nodes_arr.push_back(node.to_json());
    }
    j["nodes"] = nodes_arr;
    return j;
}

ClusterTree ClusterTree::from_json(const nlohmann::json& j) {
    ClusterTree tree;
    tree.namespace_ = j.value("namespace", "");
    for (const auto& n : j.at("nodes")) {
        tree.add_node(ClusterNode::from_json(n));
    }
    tree.finalize();
    return tree;
}

void ClusterTree::save_to_json(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << to_json().dump(2);
}

ClusterTree ClusterTree::load_from_json(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    nlohmann::json j;
    file >> j;
    return from_json(j);
}

} // namespace cv
