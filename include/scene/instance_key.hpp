#pragma once

#include "tree/cluster_node.hpp"
#include <cstddef>
#include <functional>
#include <string>
#include <tuple>

namespace cv {

/**
 * @brief Identifies one visual instance of a node: the node as seen from one cluster
 *
 * The same node id appears under several cluster ids at once (as focal node,
 * as a child, as a parent); each pair is a distinct instance with its own
 * position and enabled flag.
 */
struct InstanceKey {
    NodeId cluster_id = 0;
    NodeId node_id = 0;

    InstanceKey() = default;
    InstanceKey(NodeId cluster, NodeId node) : cluster_id(cluster), node_id(node) {}

    bool is_focal() const { return cluster_id == node_id; }

    bool operator==(const InstanceKey& o) const {
        return cluster_id == o.cluster_id && node_id == o.node_id;
    }
    bool operator!=(const InstanceKey& o) const { return !(*this == o); }
    bool operator<(const InstanceKey& o) const {
        return std::tie(cluster_id, node_id) < std::tie(o.cluster_id, o.node_id);
    }

    std::string to_string() const {
        return "cluster_" + std::to_string(cluster_id) + "_node_" + std::to_string(node_id);
    }
};

/**
 * @brief Identifies one link (parent -> child) rendered inside one cluster
 */
struct LinkKey {
    NodeId cluster_id = 0;
    NodeId parent_id = 0;
    NodeId child_id = 0;

    LinkKey() = default;
    LinkKey(NodeId cluster, NodeId parent, NodeId child)
        : cluster_id(cluster), parent_id(parent), child_id(child) {}

    bool operator==(const LinkKey& o) const {
        return cluster_id == o.cluster_id && parent_id == o.parent_id && child_id == o.child_id;
    }
    bool operator!=(const LinkKey& o) const { return !(*this == o); }
    bool operator<(const LinkKey& o) const {
        return std::tie(cluster_id, parent_id, child_id) <
               std::tie(o.cluster_id, o.parent_id, o.child_id);
    }

    std::string to_string() const {
        return "cluster_" + std::to_string(cluster_id) + "_link_" +
               std::to_string(parent_id) + "_" + std::to_string(child_id);
    }
};

struct InstanceKeyHash {
    size_t operator()(const InstanceKey& k) const {
        size_t h = std::hash<NodeId>()(k.cluster_id);
        return h ^ (std::hash<NodeId>()(k.node_id) + 0x9e3779b9 + (h << 6) + (h >> 2));
    }
};

struct LinkKeyHash {
    size_t operator()(const LinkKey& k) const {
        size_t h = std::hash<NodeId>()(k.cluster_id);
        h ^= std::hash<NodeId>()(k.parent_id) + 0x9e3779b9 + (h << 6) + (h >> 2);
        h ^= std::hash<NodeId>()(k.child_id) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

} // namespace cv
