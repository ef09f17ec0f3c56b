#pragma once

#include "provider/data_provider.hpp"
#include "scene/camera_framer.hpp"
#include "scene/cluster_registry.hpp"
#include "scene/label_synchronizer.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cv {

// ============================================================================
// Configuration and Results
// ============================================================================

struct SyncConfig {
    std::string name_space;                            // Namespace passed to the data provider
    size_t max_history = 50;                           // Navigation history depth
    bool verbose = false;
};

/**
 * @brief A cluster that could not be created during a pass
 */
struct ClusterFailure {
    NodeId cluster_id = 0;
    FetchErrorKind kind = FetchErrorKind::TransientFailure;
    std::string message;

    nlohmann::json to_json() const;
};

/**
 * @brief Outcome of one focus change
 */
struct SyncResult {
    bool success = false;
    std::string error_message;
    std::optional<FetchErrorKind> error_kind;          // Set when the ancestor chain could not be fetched

    NodeId focus_id = 0;
    std::vector<NodeId> chain;                         // [focus, parent, ..., root]
    std::vector<NodeId> to_show;
    std::vector<NodeId> to_hide;
    std::vector<NodeId> remain;
    std::vector<ClusterFailure> failures;

    bool queued = false;                               // Request deferred behind a running pass
    bool superseded = false;                           // Pass stopped early for a newer request
    bool unchanged = false;                            // Focus was already current and complete
    size_t superseded_passes = 0;
    size_t instances_swept = 0;
    LabelSyncResult labels;

    bool has_failures() const { return !failures.empty(); }

    nlohmann::json to_json() const;
};

// ============================================================================
// View Synchronizer
// ============================================================================

/**
 * @brief Moves the scene from one focus node to another
 *
 * A pass runs these steps strictly in order:
 *  1. fetch the ancestor chain [F, parent(F), ..., root]
 *  2. diff it against the visible set (to_show / to_hide / remain)
 *  3. record chain node data and pre-register every chain id as visible
 *  4. fetch and create each to_show cluster (node, parent, children, links)
 *  5. show every chain cluster
 *  6. hide every to_hide cluster
 *  7. ensure visibility of every remain cluster
 *  8. sweep unused instances
 *  9. frame the camera and sync labels
 *
 * Only one pass runs at a time. A focus request arriving during a pass
 * (for instance from a callback inside a data provider call) is queued and
 * supersedes the running pass: that pass finishes the cluster it is
 * creating, skips steps 5-9, and the queued focus runs next.
 */
class ViewSynchronizer {
public:
    ViewSynchronizer(DataProvider& provider,
                     ClusterRegistry& registry,
                     LabelSynchronizer& labels,
                     CameraFramer& camera,
                     const SyncConfig& config = SyncConfig());

    /**
     * @brief Change focus to `node_id`
     *
     * @return Result of the last pass that ran, or a queued result if a pass
     *         was already in flight
     */
    SyncResult request_focus(NodeId node_id);

    /**
     * @brief Focus the namespace root, as returned by the data provider
     */
    SyncResult focus_root();

    /**
     * @brief Return to the previously focused node
     */
    SyncResult go_back();
    bool can_go_back() const { return !history_.empty(); }
    const std::vector<NodeId>& history() const { return history_; }

    bool is_cluster_visible(NodeId cluster_id) const { return registry_.is_visible(cluster_id); }
    std::optional<NodeId> current_focus() const { return current_focus_; }
    bool is_syncing() const { return in_flight_; }

    /**
     * @brief Step 1 on its own: ancestor chain from `node_id` to the root
     *
     * @throws DataFetchError if any node on the way cannot be fetched, or the
     *         parent references loop
     */
    std::vector<ClusterNode> compute_target_chain(NodeId node_id);

    const SyncConfig& get_config() const { return config_; }

private:
    DataProvider& provider_;
    ClusterRegistry& registry_;
    LabelSynchronizer& labels_;
    CameraFramer& camera_;
    SyncConfig config_;

    bool in_flight_ = false;
    std::optional<NodeId> pending_focus_;
    bool pending_records_history_ = true;
    std::optional<NodeId> current_focus_;
    std::vector<NodeId> current_chain_;
    bool current_complete_ = false;
    std::vector<NodeId> history_;

    SyncResult run_passes(NodeId node_id, bool record_history);
    SyncResult run_pass(NodeId node_id);
    bool create_cluster(NodeId cluster_id, SyncResult& result);
    void push_history(NodeId node_id);
};

} // namespace cv
