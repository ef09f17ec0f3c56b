#pragma once

#include "tree/cluster_node.hpp"
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cv {

/**
 * @brief Statistics about the tree structure
 */
struct TreeStatistics {
    size_t num_nodes = 0;
    size_t num_leaves = 0;
    size_t num_fallback_centroids = 0;
    int max_depth = 0;
    double avg_branching = 0.0;                        // Mean child count over internal nodes
    size_t max_branching = 0;

    nlohmann::json to_json() const;
};

/**
 * @brief In-memory cluster tree
 *
 * Holds a complete namespace worth of nodes, typically loaded from a JSON
 * dump of the backend. Child lists are rebuilt from parent references on
 * load so the two always agree.
 */
class ClusterTree {
public:
    ClusterTree() = default;

    // ==========================================
    // Construction
    // ==========================================

    /**
     * @brief Add or replace a node
     *
     * Child lists of the parent are updated lazily by finalize().
     */
    void add_node(const ClusterNode& node);

    /**
     * @brief Rebuild child lists, leaf flags and depths from parent references
     *
     * @throws std::runtime_error if the tree has no root, several roots,
     *         a dangling parent reference, or a cycle
     */
    void finalize();

    // ==========================================
    // Queries
    // ==========================================

    const ClusterNode* get_node(NodeId id) const;
    bool has_node(NodeId id) const { return nodes_.count(id) > 0; }
    size_t num_nodes() const { return nodes_.size(); }

    NodeId root_id() const { return root_id_; }
    const std::string& name_space() const { return namespace_; }
    void set_namespace(const std::string& ns) { namespace_ = ns; }

    std::vector<ClusterNode> get_children(NodeId id) const;

    /**
     * @brief Ordered ids from the node up to the root (inclusive)
     *
     * Empty if the node is unknown.
     */
    std::vector<NodeId> ancestor_chain(NodeId id) const;

    TreeStatistics compute_statistics() const;

    // ==========================================
    // Serialization
    // ==========================================

    nlohmann::json to_json() const;
    static ClusterTree from_json(const nlohmann::json& j);

    void save_to_json(const std::string& path) const;
    static ClusterTree load_from_json(const std::string& path);

private:
    std::map<NodeId, ClusterNode> nodes_;
    NodeId root_id_ = 0;
    std::string namespace_;
};

} // namespace cv
