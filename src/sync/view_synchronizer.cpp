#include "sync/view_synchronizer.hpp"
#include <iostream>
#include <set>

namespace cv {

namespace {

// Marks a pass as in flight for the lifetime of the guard
class InFlightGuard {
public:
    explicit InFlightGuard(bool& flag) : flag_(flag) { flag_ = true; }
    ~InFlightGuard() { flag_ = false; }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    bool& flag_;
};

nlohmann::json ids_to_json(const std::vector<NodeId>& ids) {
    return nlohmann::json(ids);
}

} // anonymous namespace

nlohmann::json ClusterFailure::to_json() const {
    nlohmann::json j;
    j["cluster_id"] = cluster_id;
    j["kind"] = fetch_error_kind_to_string(kind);
    j["message"] = message;
    return j;
}

nlohmann::json SyncResult::to_json() const {
    nlohmann::json j;
    j["success"] = success;
    if (!error_message.empty()) {
        j["error_message"] = error_message;
    }
    if (error_kind) {
        j["error_kind"] = fetch_error_kind_to_string(*error_kind);
    }
    j["focus_id"] = focus_id;
    j["chain"] = ids_to_json(chain);
    j["to_show"] = ids_to_json(to_show);
    j["to_hide"] = ids_to_json(to_hide);
    j["remain"] = ids_to_json(remain);

    nlohmann::json failures_arr = nlohmann::json::array();
    for (const auto& f : failures) {
        failures_arr.push_back(f.to_json());
    }
    j["failures"] = failures_arr;

    j["queued"] = queued;
    j["superseded"] = superseded;
    j["unchanged"] = unchanged;
    j["superseded_passes"] = superseded_passes;
    j["instances_swept"] = instances_swept;
    j["labels_enabled"] = labels.labels_enabled;
    return j;
}

ViewSynchronizer::ViewSynchronizer(DataProvider& provider,
                                   ClusterRegistry& registry,
                                   LabelSynchronizer& labels,
                                   CameraFramer& camera,
                                   const SyncConfig& config)
    : provider_(provider), registry_(registry), labels_(labels), camera_(camera), config_(config) {}

// ==========================================
// Requests
// ==========================================

SyncResult ViewSynchronizer::request_focus(NodeId node_id) {
    return run_passes(node_id, true);
}

SyncResult ViewSynchronizer::focus_root() {
    ClusterNode root;
    try {
        root = provider_.get_root_node(config_.name_space);
    } catch (const DataFetchError& e) {
        SyncResult result;
        result.success = false;
        result.error_kind = e.kind();
        result.error_message = e.what();
        std::cerr << "[sync] Cannot fetch root node: " << e.what() << std::endl;
        return result;
    }
    return request_focus(root.id);
}

SyncResult ViewSynchronizer::go_back() {
    if (history_.empty()) {
        SyncResult result;
        result.success = false;
        result.error_message = "No navigation history";
        return result;
    }

    NodeId previous = history_.back();
    history_.pop_back();

    SyncResult result = run_passes(previous, false);
    if (result.error_kind) {
        history_.push_back(previous);
    }
    return result;
}

void ViewSynchronizer::push_history(NodeId node_id) {
    history_.push_back(node_id);
    if (history_.size() > config_.max_history) {
        history_.erase(history_.begin());
    }
}

SyncResult ViewSynchronizer::run_passes(NodeId node_id, bool record_history) {
    if (in_flight_) {
        pending_focus_ = node_id;
        pending_records_history_ = record_history;
        if (config_.verbose) {
            std::cout << "[sync] Focus " << node_id << " queued behind running pass" << std::endl;
        }
        SyncResult queued;
        queued.success = true;
        queued.queued = true;
        queued.focus_id = node_id;
        return queued;
    }

    InFlightGuard guard(in_flight_);

    NodeId next = node_id;
    bool record = record_history;
    size_t superseded = 0;
    SyncResult result;

    while (true) {
        std::optional<NodeId> previous = current_focus_;
        result = run_pass(next);

        bool completed = !result.superseded && !result.error_kind && !result.unchanged;
        if (completed && record && previous && *previous != next) {
            push_history(*previous);
        }

        if (!pending_focus_) break;

        if (result.superseded) {
            superseded++;
        }
        next = *pending_focus_;
        record = pending_records_history_;
        pending_focus_.reset();
    }

    result.superseded_passes = superseded;
    return result;
}

// ==========================================
// Pass
// ==========================================

std::vector<ClusterNode> ViewSynchronizer::compute_target_chain(NodeId node_id) {
    std::vector<ClusterNode> chain;
    std::set<NodeId> seen;
    NodeId current = node_id;

    while (true) {
        if (!seen.insert(current).second) {
            throw DataFetchError(FetchErrorKind::Malformed, current,
                                 "Parent references loop at node " + std::to_string(current));
        }
        ClusterNode node = provider_.get_node(config_.name_space, current);
        bool is_root = node.is_root();
        NodeId parent = is_root ? 0 : *node.parent_id;
        chain.push_back(std::move(node));
        if (is_root) break;
        current = parent;
    }
    return chain;
}

SyncResult ViewSynchronizer::run_pass(NodeId node_id) {
    SyncResult result;
    result.focus_id = node_id;

    if (current_focus_ && *current_focus_ == node_id && current_complete_ &&
        registry_.is_shown(node_id)) {
        result.success = true;
        result.unchanged = true;
        result.chain = current_chain_;
        return result;
    }

    if (config_.verbose) {
        std::cout << "[sync] Focus change to node " << node_id << std::endl;
    }

    registry_.begin_pass();

    // Step 1: ancestor chain
    std::vector<ClusterNode> chain_nodes;
    try {
        chain_nodes = compute_target_chain(node_id);
    } catch (const DataFetchError& e) {
        result.success = false;
        result.error_kind = e.kind();
        result.error_message = e.what();
        std::cerr << "[sync] Cannot focus node " << node_id << ": " << e.what() << std::endl;
        return result;
    }

    for (const auto& node : chain_nodes) {
        result.chain.push_back(node.id);
    }

    if (pending_focus_) {
        result.success = true;
        result.superseded = true;
        return result;
    }

    NodeId root_id = result.chain.back();
    if (!registry_.root_id() || *registry_.root_id() != root_id) {
        registry_.set_root(root_id);
    }

    // Step 2: diff against the visible set
    std::set<NodeId> chain_set(result.chain.begin(), result.chain.end());
    for (NodeId id : result.chain) {
        if (registry_.is_visible(id) && registry_.is_created(id)) {
            result.remain.push_back(id);
        } else {
            result.to_show.push_back(id);
        }
    }
    for (NodeId id : registry_.visible_clusters()) {
        if (!chain_set.count(id)) {
            result.to_hide.push_back(id);
        }
    }

    if (config_.verbose) {
        std::cout << "[sync] Chain of " << result.chain.size() << ": "
                  << result.to_show.size() << " to show, "
                  << result.to_hide.size() << " to hide, "
                  << result.remain.size() << " remain" << std::endl;
    }

    // Step 3: positions need the whole chain before any geometry exists.
    // From here until step 9 the scene no longer matches current_chain_.
    current_complete_ = false;
    for (const auto& node : chain_nodes) {
        registry_.remember_node(node);
        registry_.pre_register_visible(node.id);
    }

    // Step 4: create missing clusters
    for (NodeId id : result.to_show) {
        create_cluster(id, result);
        if (pending_focus_) {
            if (config_.verbose) {
                std::cout << "[sync] Pass for node " << node_id << " superseded by "
                          << *pending_focus_ << std::endl;
            }
            result.success = true;
            result.superseded = true;
            return result;
        }
    }

    // A cluster that failed to load keeps its old copies in the scene
    std::set<NodeId> failed;
    for (const auto& failure : result.failures) {
        if (registry_.withdraw_visible(failure.cluster_id)) {
            failed.insert(failure.cluster_id);
        }
    }

    // Steps 5-7
    for (NodeId id : result.chain) {
        if (failed.count(id)) continue;
        registry_.show_cluster(id);
    }
    for (NodeId id : result.to_hide) {
        registry_.hide_cluster(id);
    }
    for (NodeId id : result.remain) {
        registry_.ensure_visibility(id);
    }

    // Step 8
    result.instances_swept = registry_.cleanup_unused();

    // Step 9
    const CameraState& goal = camera_.frame(registry_, node_id);
    result.labels = labels_.sync(registry_, goal.position());

    result.success = result.failures.empty();
    if (!result.success) {
        result.error_message = std::to_string(result.failures.size()) + " cluster(s) failed to load";
    }

    current_focus_ = node_id;
    current_chain_ = result.chain;
    current_complete_ = result.success;

    if (config_.verbose) {
        std::cout << "[sync] Focus on node " << node_id << " complete, swept "
                  << result.instances_swept << " instances" << std::endl;
    }
    return result;
}

bool ViewSynchronizer::create_cluster(NodeId cluster_id, SyncResult& result) {
    NodeView view;
    try {
        view = provider_.get_node_view(config_.name_space, cluster_id);
        if (view.node.id != cluster_id) {
            throw DataFetchError(FetchErrorKind::Malformed, cluster_id,
                                 "Requested node " + std::to_string(cluster_id) +
                                 " but received " + std::to_string(view.node.id));
        }
    } catch (const DataFetchError& e) {
        ClusterFailure failure;
        failure.cluster_id = cluster_id;
        failure.kind = e.kind();
        failure.message = e.what();
        result.failures.push_back(failure);
        std::cerr << "[sync] Skipping cluster " << cluster_id << ": " << e.what() << std::endl;
        return false;
    }

    registry_.add_node_instance(view.node, cluster_id);
    if (view.parent) {
        registry_.add_node_instance(*view.parent, cluster_id);
    }
    for (const auto& child : view.children) {
        registry_.add_node_instance(child, cluster_id);
    }

    for (const auto& child : view.children) {
        registry_.add_link_instance(view.node, child, cluster_id);
    }
    if (view.parent) {
        registry_.add_link_instance(*view.parent, view.node, cluster_id);
    }

    if (config_.verbose) {
        std::cout << "[sync] Created cluster " << cluster_id << " with "
                  << view.children.size() << " children" << std::endl;
    }
    return true;
}

} // namespace cv
