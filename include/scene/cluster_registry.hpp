#pragma once

#include "scene/instance_key.hpp"
#include "scene/position_calculator.hpp"
#include "scene/renderer.hpp"
#include "tree/cluster_node.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace cv {

// ============================================================================
// Configuration
// ============================================================================

struct RegistryConfig {
    PositionConfig position;
    double node_diameter = 0.5;
    double link_diameter = 0.05;
    bool verbose = false;
};

// ============================================================================
// Instances
// ============================================================================

/**
 * @brief One rendered node inside one cluster context
 */
struct NodeInstance {
    InstanceKey key;
    PrimitiveHandle mesh = INVALID_PRIMITIVE;
    PrimitiveHandle label = INVALID_PRIMITIVE;         // Created on first label sync
    Vec3 position;                                     // Local to the cluster group
    bool enabled = false;
    bool label_enabled = false;
    bool degraded = false;
    int keep_alive = 0;                                // Reasons to survive the next sweep
    std::uint64_t layout_epoch = 0;                    // Epoch the position was computed in
};

/**
 * @brief One rendered parent -> child connector inside one cluster context
 */
struct LinkInstance {
    LinkKey key;
    PrimitiveHandle mesh = INVALID_PRIMITIVE;
    Vec3 from;
    Vec3 to;
    bool enabled = false;
    int keep_alive = 0;
    std::uint64_t layout_epoch = 0;
};

/**
 * @brief Counters of errors absorbed instead of thrown
 */
struct RegistryDiagnostics {
    size_t invariant_violations = 0;
    size_t degraded_positions = 0;
    std::vector<std::string> messages;                 // Oldest first, capped

    nlohmann::json to_json() const;
};

/**
 * @brief Resource usage snapshot
 */
struct RegistryStats {
    size_t visible_clusters = 0;
    size_t known_clusters = 0;
    size_t node_instances = 0;
    size_t enabled_node_instances = 0;
    size_t link_instances = 0;
    size_t enabled_link_instances = 0;
    size_t labels = 0;
    size_t live_primitives = 0;
    size_t sweep_candidates = 0;

    nlohmann::json to_json() const;
};

// ============================================================================
// Cluster Registry
// ============================================================================

/**
 * @brief Owns every node/link instance, cluster membership, and the visible set
 *
 * The registry is the only component that talks to the Renderer. Every
 * primitive it creates is parented to the group primitive of its cluster
 * and disposed again when the instance is swept.
 *
 * Enabled state follows one rule, re-evaluated on every visibility change:
 * an instance (c, n) is enabled iff cluster c is shown and either c == n or
 * cluster n is not in the visible set. A node whose own cluster is visible
 * therefore shows exactly once, at its focal position.
 *
 * Lifetime uses keep-alive counts: instances of clusters in the visible set
 * (the root cluster always is) hold one; instances that drop to zero become
 * sweep candidates and are disposed by cleanup_unused().
 */
class ClusterRegistry {
public:
    ClusterRegistry(Renderer& renderer, const RegistryConfig& config = RegistryConfig());
    ~ClusterRegistry();

    ClusterRegistry(const ClusterRegistry&) = delete;
    ClusterRegistry& operator=(const ClusterRegistry&) = delete;

    // ==========================================
    // Node data and root
    // ==========================================

    /**
     * @brief Record node data used to resolve parents during position calculation
     *
     * Replacing data that changes a node's placement invalidates all positions.
     */
    void remember_node(const ClusterNode& node);

    const ClusterNode* get_node_data(NodeId id) const;

    /**
     * @brief Designate the root; its cluster joins the visible set permanently
     */
    void set_root(NodeId root_id);
    std::optional<NodeId> root_id() const { return root_id_; }
    bool is_root(NodeId cluster_id) const { return root_id_ && *root_id_ == cluster_id; }

    // ==========================================
    // Instances
    // ==========================================

    /**
     * @brief Create-or-reuse the instance of `node` in `cluster_id`
     *
     * Idempotent: a second call with the same pair returns the same instance
     * and leaves membership unchanged.
     */
    const NodeInstance* add_node_instance(const ClusterNode& node, NodeId cluster_id);

    /**
     * @brief Create-or-reuse the link parent -> child in `cluster_id`
     *
     * Both endpoints must already have instances in that cluster; otherwise
     * the call is logged as an invariant violation and returns nullptr.
     */
    const LinkInstance* add_link_instance(const ClusterNode& parent, const ClusterNode& child,
                                          NodeId cluster_id);

    const NodeInstance* get_node_instance(const InstanceKey& key) const;
    const LinkInstance* get_link_instance(const LinkKey& key) const;

    /**
     * @brief Every instance of one node id, across all clusters
     */
    std::vector<const NodeInstance*> instances_of_node(NodeId node_id) const;

    std::vector<const NodeInstance*> enabled_node_instances() const;
    std::vector<const NodeInstance*> all_node_instances() const;
    std::vector<const LinkInstance*> all_link_instances() const;

    // ==========================================
    // Visibility
    // ==========================================

    /**
     * @brief Start of a synchronization pass: drop memoized positions
     */
    void begin_pass();

    /**
     * @brief Add to the visible set without touching enabled flags
     */
    void pre_register_visible(NodeId cluster_id);

    /**
     * @brief Undo pre_register_visible for a cluster that was never created
     *
     * Instances of the node in other clusters regain their enabled state.
     * No-op for the root and for clusters that have instances.
     *
     * @return True if the cluster left the visible set
     */
    bool withdraw_visible(NodeId cluster_id);

    void show_cluster(NodeId cluster_id);

    /**
     * @brief Remove from the visible set and disable members; no-op for the root
     */
    void hide_cluster(NodeId cluster_id);

    /**
     * @brief Re-apply the show rule and refresh stale positions
     */
    void ensure_visibility(NodeId cluster_id);

    /**
     * @brief Dispose every instance not kept alive by the visible set or root
     *
     * Surviving instances whose position predates the current visible set
     * are laid out again.
     *
     * @return Number of node and link instances disposed
     */
    size_t cleanup_unused();

    bool is_visible(NodeId cluster_id) const { return visible_.count(cluster_id) > 0; }
    bool is_shown(NodeId cluster_id) const { return shown_.count(cluster_id) > 0; }

    /**
     * @brief True once the cluster has at least one instance
     */
    bool is_created(NodeId cluster_id) const { return clusters_.count(cluster_id) > 0; }

    const VisibleSet& visible_clusters() const { return visible_; }

    /**
     * @brief Node ids that have an instance in the cluster
     */
    std::set<NodeId> cluster_members(NodeId cluster_id) const;

    // ==========================================
    // Labels
    // ==========================================

    /**
     * @brief Create or update the label of an instance
     *
     * @return false if the instance does not exist
     */
    bool set_label(const InstanceKey& key, const std::vector<std::string>& lines,
                   double width, double height);
    bool place_label(const InstanceKey& key, const Vec3& position);
    bool set_label_enabled(const InstanceKey& key, bool enabled);

    // ==========================================
    // Maintenance
    // ==========================================

    /**
     * @brief Dispose every primitive and forget all clusters (root is kept)
     */
    void clear_all();

    RegistryStats stats() const;
    const RegistryDiagnostics& diagnostics() const { return diagnostics_; }

    /**
     * @brief Positions of all instances computed against the current visible set
     */
    bool layout_is_current() const;

    std::uint64_t layout_epoch() const { return layout_epoch_; }
    const RegistryConfig& get_config() const { return config_; }

private:
    struct ClusterEntry {
        PrimitiveHandle group = INVALID_PRIMITIVE;
        std::set<NodeId> nodes;
        std::set<std::pair<NodeId, NodeId>> links;
    };

    Renderer& renderer_;
    RegistryConfig config_;
    PositionCalculator positions_;

    std::unordered_map<InstanceKey, NodeInstance, InstanceKeyHash> nodes_;
    std::unordered_map<LinkKey, LinkInstance, LinkKeyHash> links_;
    std::map<NodeId, ClusterEntry> clusters_;
    std::unordered_map<NodeId, std::set<NodeId>> node_clusters_;   // node id -> clusters holding it
    std::unordered_map<NodeId, ClusterNode> node_data_;

    VisibleSet visible_;
    std::set<NodeId> shown_;
    std::optional<NodeId> root_id_;

    std::set<InstanceKey> node_candidates_;
    std::set<LinkKey> link_candidates_;

    std::uint64_t layout_epoch_ = 1;
    RegistryDiagnostics diagnostics_;

    // Visibility bookkeeping
    void add_visible(NodeId cluster_id);
    void remove_visible(NodeId cluster_id);
    void grant_keep_alive(NodeId cluster_id);
    void revoke_keep_alive(NodeId cluster_id);
    void bump_epoch();

    // Enabled state
    bool should_enable(const InstanceKey& key) const;
    void refresh_cluster(NodeId cluster_id);
    void refresh_node(NodeId node_id);
    void apply_enabled(NodeInstance& inst, bool enabled);
    void apply_enabled(LinkInstance& link, bool enabled);

    // Layout
    void layout_node(NodeInstance& inst);
    void layout_link(LinkInstance& link);
    void relayout_cluster(NodeId cluster_id);

    // Disposal
    ClusterEntry& cluster_entry(NodeId cluster_id);
    void dispose_node(const InstanceKey& key);
    void dispose_link(const LinkKey& key);
    void drop_cluster_if_empty(NodeId cluster_id);

    void report_violation(const std::string& message);
};

} // namespace cv
