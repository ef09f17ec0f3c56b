#pragma once

#include "scene/instance_key.hpp"
#include "tree/cluster_node.hpp"
#include <functional>
#include <set>
#include <unordered_map>
#include <unordered_set>

namespace cv {

/**
 * @brief Set of cluster ids currently shown (always an ancestor chain)
 */
using VisibleSet = std::set<NodeId>;

/**
 * @brief Resolves node data by id; returns nullptr if unknown
 */
using NodeLookup = std::function<const ClusterNode*(NodeId)>;

struct PositionConfig {
    double base_scale = 3.0;                           // Centroid units -> scene units
    double ancestor_multiplier = 3.0;                  // Extra stretch on ancestor links
    bool verbose = false;
};

/**
 * @brief Result of a single position computation
 */
struct PositionResult {
    Vec3 position;
    bool degraded = false;                             // Parent data missing somewhere up the chain
};

/**
 * @brief Computes cascaded, cluster-relative instance positions
 *
 * A node's position is its parent's position (computed recursively in the
 * same cluster context) plus its own centroid scaled by base_scale, and by
 * ancestor_multiplier when both the node and its parent are in the visible
 * set. The root sits at the origin. Unknown parent data degrades to the
 * un-cascaded absolute placement and is flagged instead of failing.
 *
 * Results are memoized per (cluster, node). The memo must be invalidated
 * whenever the visible set or the node data changes.
 */
class PositionCalculator {
public:
    explicit PositionCalculator(const PositionConfig& config = PositionConfig());

    /**
     * @brief Position of `node` inside cluster `cluster_id`
     *
     * @param node Node data
     * @param cluster_id Cluster context (memo key)
     * @param visible Visible cluster set to evaluate ancestor links against
     * @param lookup Resolves parent data
     */
    PositionResult compute(const ClusterNode& node, NodeId cluster_id,
                           const VisibleSet& visible, const NodeLookup& lookup);

    /**
     * @brief Drop all memoized positions
     */
    void invalidate();

    size_t memo_size() const { return memo_.size(); }
    size_t degraded_count() const { return degraded_count_; }

    const PositionConfig& get_config() const { return config_; }

private:
    PositionConfig config_;
    std::unordered_map<InstanceKey, PositionResult, InstanceKeyHash> memo_;
    std::unordered_set<NodeId> in_progress_;
    size_t degraded_count_ = 0;

    PositionResult compute_uncached(const ClusterNode& node, NodeId cluster_id,
                                    const VisibleSet& visible, const NodeLookup& lookup);
};

} // namespace cv
