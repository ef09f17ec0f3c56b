#include "scene/cluster_registry.hpp"
#include <iostream>

namespace cv {

namespace {

constexpr size_t MAX_DIAGNOSTIC_MESSAGES = 100;

} // anonymous namespace

nlohmann::json RegistryDiagnostics::to_json() const {
    nlohmann::json j;
    j["invariant_violations"] = invariant_violations;
    j["degraded_positions"] = degraded_positions;
    j["messages"] = messages;
    return j;
}

nlohmann::json RegistryStats::to_json() const {
    nlohmann::json j;
    j["visible_clusters"] = visible_clusters;
    j["known_clusters"] = known_clusters;
    j["node_instances"] = node_instances;
    j["enabled_node_instances"] = enabled_node_instances;
    j["link_instances"] = link_instances;
    j["enabled_link_instances"] = enabled_link_instances;
    j["labels"] = labels;
    j["live_primitives"] = live_primitives;
    j["sweep_candidates"] = sweep_candidates;
    return j;
}

ClusterRegistry::ClusterRegistry(Renderer& renderer, const RegistryConfig& config)
    : renderer_(renderer), config_(config), positions_(config.position) {}

ClusterRegistry::~ClusterRegistry() {
    clear_all();
}

// ==========================================
// Node data and root
// ==========================================

void ClusterRegistry::remember_node(const ClusterNode& node) {
    auto it = node_data_.find(node.id);
    if (it == node_data_.end()) {
        node_data_[node.id] = node;
        // New parent data can resolve positions that were degraded before
        for (const auto& [key, inst] : nodes_) {
            if (inst.degraded) {
                bump_epoch();
                break;
            }
        }
        return;
    }

    const ClusterNode& old = it->second;
    bool moved = old.centroid != node.centroid || old.parent_id != node.parent_id ||
                 old.depth != node.depth;
    it->second = node;
    if (moved) {
        bump_epoch();
    }
}

const ClusterNode* ClusterRegistry::get_node_data(NodeId id) const {
    auto it = node_data_.find(id);
    return it != node_data_.end() ? &it->second : nullptr;
}

void ClusterRegistry::set_root(NodeId root_id) {
    if (root_id_ && *root_id_ == root_id) {
        return;
    }

    if (root_id_) {
        NodeId old_root = *root_id_;
        root_id_.reset();
        shown_.erase(old_root);
        remove_visible(old_root);
        refresh_cluster(old_root);
    }

    root_id_ = root_id;
    add_visible(root_id);

    if (config_.verbose) {
        std::cout << "[registry] Root cluster set to " << root_id << std::endl;
    }
}

// ==========================================
// Instances
// ==========================================

const NodeInstance* ClusterRegistry::add_node_instance(const ClusterNode& node, NodeId cluster_id) {
    remember_node(node);

    InstanceKey key(cluster_id, node.id);
    auto it = nodes_.find(key);
    if (it != nodes_.end()) {
        return &it->second;
    }

    ClusterEntry& entry = cluster_entry(cluster_id);

    NodeInstance& inst = nodes_[key];
    inst.key = key;
    inst.mesh = renderer_.create_sphere(key.to_string(), config_.node_diameter);
    renderer_.set_parent(inst.mesh, entry.group);

    inst.keep_alive = is_visible(cluster_id) ? 1 : 0;
    if (inst.keep_alive == 0) {
        node_candidates_.insert(key);
    }

    layout_node(inst);

    inst.enabled = should_enable(key);
    renderer_.set_enabled(inst.mesh, inst.enabled);

    entry.nodes.insert(node.id);
    node_clusters_[node.id].insert(cluster_id);

    if (config_.verbose) {
        std::cout << "[registry] Created " << key.to_string() << " at ("
                  << inst.position.x << ", " << inst.position.y << ", " << inst.position.z << ")"
                  << (inst.enabled ? "" : " [disabled]") << std::endl;
    }

    return &inst;
}

const LinkInstance* ClusterRegistry::add_link_instance(const ClusterNode& parent, const ClusterNode& child,
                                                       NodeId cluster_id) {
    LinkKey key(cluster_id, parent.id, child.id);
    auto it = links_.find(key);
    if (it != links_.end()) {
        return &it->second;
    }

    if (!child.parent_id || *child.parent_id != parent.id) {
        report_violation("Link " + key.to_string() + " does not follow a parent reference");
        return nullptr;
    }
    if (!nodes_.count(InstanceKey(cluster_id, parent.id)) ||
        !nodes_.count(InstanceKey(cluster_id, child.id))) {
        report_violation("Link " + key.to_string() + " references a node without an instance in cluster " +
                         std::to_string(cluster_id));
        return nullptr;
    }

    ClusterEntry& entry = cluster_entry(cluster_id);

    LinkInstance& link = links_[key];
    link.key = key;
    link.mesh = renderer_.create_cylinder(key.to_string(), config_.link_diameter);
    renderer_.set_parent(link.mesh, entry.group);

    link.keep_alive = is_visible(cluster_id) ? 1 : 0;
    if (link.keep_alive == 0) {
        link_candidates_.insert(key);
    }

    layout_link(link);

    link.enabled = is_shown(cluster_id);
    renderer_.set_enabled(link.mesh, link.enabled);

    entry.links.insert({parent.id, child.id});
    return &link;
}

const NodeInstance* ClusterRegistry::get_node_instance(const InstanceKey& key) const {
    auto it = nodes_.find(key);
    return it != nodes_.end() ? &it->second : nullptr;
}

const LinkInstance* ClusterRegistry::get_link_instance(const LinkKey& key) const {
    auto it = links_.find(key);
    return it != links_.end() ? &it->second : nullptr;
}

std::vector<const NodeInstance*> ClusterRegistry::instances_of_node(NodeId node_id) const {
    std::vector<const NodeInstance*> result;
    auto it = node_clusters_.find(node_id);
    if (it == node_clusters_.end()) return result;
    for (NodeId cluster_id : it->second) {
        if (const NodeInstance* inst = get_node_instance(InstanceKey(cluster_id, node_id))) {
            result.push_back(inst);
        }
    }
    return result;
}

std::vector<const NodeInstance*> ClusterRegistry::enabled_node_instances() const {
    std::vector<const NodeInstance*> result;
    for (const auto& [cluster_id, entry] : clusters_) {
        for (NodeId node_id : entry.nodes) {
            const NodeInstance& inst = nodes_.at(InstanceKey(cluster_id, node_id));
            if (inst.enabled) {
                result.push_back(&inst);
            }
        }
    }
    return result;
}

std::vector<const NodeInstance*> ClusterRegistry::all_node_instances() const {
    std::vector<const NodeInstance*> result;
    for (const auto& [cluster_id, entry] : clusters_) {
        for (NodeId node_id : entry.nodes) {
            result.push_back(&nodes_.at(InstanceKey(cluster_id, node_id)));
        }
    }
    return result;
}

std::vector<const LinkInstance*> ClusterRegistry::all_link_instances() const {
    std::vector<const LinkInstance*> result;
    for (const auto& [cluster_id, entry] : clusters_) {
        for (const auto& [parent_id, child_id] : entry.links) {
            result.push_back(&links_.at(LinkKey(cluster_id, parent_id, child_id)));
        }
    }
    return result;
}

std::set<NodeId> ClusterRegistry::cluster_members(NodeId cluster_id) const {
    auto it = clusters_.find(cluster_id);
    return it != clusters_.end() ? it->second.nodes : std::set<NodeId>();
}

// ==========================================
// Visibility
// ==========================================

void ClusterRegistry::begin_pass() {
    positions_.invalidate();
}

void ClusterRegistry::pre_register_visible(NodeId cluster_id) {
    add_visible(cluster_id);
}

bool ClusterRegistry::withdraw_visible(NodeId cluster_id) {
    if (is_root(cluster_id) || is_created(cluster_id) || !is_visible(cluster_id)) {
        return false;
    }
    shown_.erase(cluster_id);
    remove_visible(cluster_id);

    if (config_.verbose) {
        std::cout << "[registry] Withdrew uncreated cluster " << cluster_id << std::endl;
    }
    return true;
}

void ClusterRegistry::show_cluster(NodeId cluster_id) {
    add_visible(cluster_id);
    shown_.insert(cluster_id);
    relayout_cluster(cluster_id);
    refresh_cluster(cluster_id);

    if (config_.verbose) {
        std::cout << "[registry] Showing cluster " << cluster_id << std::endl;
    }
}

void ClusterRegistry::hide_cluster(NodeId cluster_id) {
    if (is_root(cluster_id)) {
        report_violation("Refusing to hide root cluster " + std::to_string(cluster_id));
        return;
    }
    if (!is_visible(cluster_id) && !is_shown(cluster_id)) {
        return;
    }

    shown_.erase(cluster_id);
    remove_visible(cluster_id);
    refresh_cluster(cluster_id);

    if (config_.verbose) {
        std::cout << "[registry] Hiding cluster " << cluster_id << std::endl;
    }
}

void ClusterRegistry::ensure_visibility(NodeId cluster_id) {
    if (!is_visible(cluster_id) || !is_shown(cluster_id)) {
        show_cluster(cluster_id);
        return;
    }
    relayout_cluster(cluster_id);
    refresh_cluster(cluster_id);
}

size_t ClusterRegistry::cleanup_unused() {
    std::set<NodeId> touched;
    size_t disposed = 0;

    for (const LinkKey& key : link_candidates_) {
        auto it = links_.find(key);
        if (it == links_.end() || it->second.keep_alive > 0) continue;
        touched.insert(key.cluster_id);
        dispose_link(key);
        disposed++;
    }
    link_candidates_.clear();

    for (const InstanceKey& key : node_candidates_) {
        auto it = nodes_.find(key);
        if (it == nodes_.end() || it->second.keep_alive > 0) continue;
        touched.insert(key.cluster_id);
        dispose_node(key);
        disposed++;
    }
    node_candidates_.clear();

    for (NodeId cluster_id : touched) {
        drop_cluster_if_empty(cluster_id);
    }

    for (const auto& [cluster_id, entry] : clusters_) {
        relayout_cluster(cluster_id);
    }

    if (config_.verbose && disposed > 0) {
        std::cout << "[registry] Swept " << disposed << " instances from "
                  << touched.size() << " clusters" << std::endl;
    }
    return disposed;
}

// ==========================================
// Labels
// ==========================================

bool ClusterRegistry::set_label(const InstanceKey& key, const std::vector<std::string>& lines,
                                double width, double height) {
    auto it = nodes_.find(key);
    if (it == nodes_.end()) return false;

    NodeInstance& inst = it->second;
    if (inst.label == INVALID_PRIMITIVE) {
        inst.label = renderer_.create_plane("label_" + key.to_string(), width, height);
        renderer_.set_parent(inst.label, clusters_.at(key.cluster_id).group);
        inst.label_enabled = false;
        renderer_.set_enabled(inst.label, false);
    }
    renderer_.set_text(inst.label, lines);
    return true;
}

bool ClusterRegistry::place_label(const InstanceKey& key, const Vec3& position) {
    auto it = nodes_.find(key);
    if (it == nodes_.end() || it->second.label == INVALID_PRIMITIVE) return false;
    renderer_.set_position(it->second.label, position);
    return true;
}

bool ClusterRegistry::set_label_enabled(const InstanceKey& key, bool enabled) {
    auto it = nodes_.find(key);
    if (it == nodes_.end() || it->second.label == INVALID_PRIMITIVE) return false;

    NodeInstance& inst = it->second;
    // A label never shows for a disabled instance
    bool effective = enabled && inst.enabled;
    if (inst.label_enabled != effective) {
        inst.label_enabled = effective;
        renderer_.set_enabled(inst.label, effective);
    }
    return true;
}

// ==========================================
// Maintenance
// ==========================================

void ClusterRegistry::clear_all() {
    for (auto& [key, link] : links_) {
        renderer_.dispose(link.mesh);
    }
    for (auto& [key, inst] : nodes_) {
        if (inst.label != INVALID_PRIMITIVE) {
            renderer_.dispose(inst.label);
        }
        renderer_.dispose(inst.mesh);
    }
    for (auto& [cluster_id, entry] : clusters_) {
        renderer_.dispose(entry.group);
    }

    links_.clear();
    nodes_.clear();
    clusters_.clear();
    node_clusters_.clear();
    node_candidates_.clear();
    link_candidates_.clear();
    shown_.clear();
    visible_.clear();
    if (root_id_) {
        visible_.insert(*root_id_);
    }
    bump_epoch();
}

RegistryStats ClusterRegistry::stats() const {
    RegistryStats s;
    s.visible_clusters = visible_.size();
    s.known_clusters = clusters_.size();
    s.node_instances = nodes_.size();
    s.link_instances = links_.size();
    s.sweep_candidates = node_candidates_.size() + link_candidates_.size();

    for (const auto& [key, inst] : nodes_) {
        if (inst.enabled) s.enabled_node_instances++;
        if (inst.label != INVALID_PRIMITIVE) s.labels++;
    }
    for (const auto& [key, link] : links_) {
        if (link.enabled) s.enabled_link_instances++;
    }
    s.live_primitives = s.node_instances + s.link_instances + s.labels + s.known_clusters;
    return s;
}

bool ClusterRegistry::layout_is_current() const {
    for (const auto& [key, inst] : nodes_) {
        if (inst.layout_epoch != layout_epoch_) return false;
    }
    for (const auto& [key, link] : links_) {
        if (link.layout_epoch != layout_epoch_) return false;
    }
    return true;
}

// ==========================================
// Visibility bookkeeping
// ==========================================

void ClusterRegistry::add_visible(NodeId cluster_id) {
    if (!visible_.insert(cluster_id).second) {
        return;
    }
    grant_keep_alive(cluster_id);
    bump_epoch();
    refresh_node(cluster_id);
}

void ClusterRegistry::remove_visible(NodeId cluster_id) {
    if (visible_.erase(cluster_id) == 0) {
        return;
    }
    revoke_keep_alive(cluster_id);
    bump_epoch();
    refresh_node(cluster_id);
}

void ClusterRegistry::grant_keep_alive(NodeId cluster_id) {
    auto it = clusters_.find(cluster_id);
    if (it == clusters_.end()) return;

    for (NodeId node_id : it->second.nodes) {
        InstanceKey key(cluster_id, node_id);
        NodeInstance& inst = nodes_.at(key);
        if (++inst.keep_alive > 0) {
            node_candidates_.erase(key);
        }
    }
    for (const auto& [parent_id, child_id] : it->second.links) {
        LinkKey key(cluster_id, parent_id, child_id);
        LinkInstance& link = links_.at(key);
        if (++link.keep_alive > 0) {
            link_candidates_.erase(key);
        }
    }
}

void ClusterRegistry::revoke_keep_alive(NodeId cluster_id) {
    auto it = clusters_.find(cluster_id);
    if (it == clusters_.end()) return;

    for (NodeId node_id : it->second.nodes) {
        InstanceKey key(cluster_id, node_id);
        NodeInstance& inst = nodes_.at(key);
        if (inst.keep_alive > 0 && --inst.keep_alive == 0) {
            node_candidates_.insert(key);
        }
    }
    for (const auto& [parent_id, child_id] : it->second.links) {
        LinkKey key(cluster_id, parent_id, child_id);
        LinkInstance& link = links_.at(key);
        if (link.keep_alive > 0 && --link.keep_alive == 0) {
            link_candidates_.insert(key);
        }
    }
}

void ClusterRegistry::bump_epoch() {
    layout_epoch_++;
    positions_.invalidate();
}

// ==========================================
// Enabled state
// ==========================================

bool ClusterRegistry::should_enable(const InstanceKey& key) const {
    if (!is_shown(key.cluster_id)) return false;
    return key.is_focal() || !is_visible(key.node_id);
}

void ClusterRegistry::refresh_cluster(NodeId cluster_id) {
    auto it = clusters_.find(cluster_id);
    if (it == clusters_.end()) return;

    for (NodeId node_id : it->second.nodes) {
        InstanceKey key(cluster_id, node_id);
        apply_enabled(nodes_.at(key), should_enable(key));
    }
    bool shown = is_shown(cluster_id);
    for (const auto& [parent_id, child_id] : it->second.links) {
        apply_enabled(links_.at(LinkKey(cluster_id, parent_id, child_id)), shown);
    }
}

void ClusterRegistry::refresh_node(NodeId node_id) {
    auto it = node_clusters_.find(node_id);
    if (it == node_clusters_.end()) return;

    for (NodeId cluster_id : it->second) {
        InstanceKey key(cluster_id, node_id);
        apply_enabled(nodes_.at(key), should_enable(key));
    }
}

void ClusterRegistry::apply_enabled(NodeInstance& inst, bool enabled) {
    if (inst.enabled == enabled) return;
    inst.enabled = enabled;
    renderer_.set_enabled(inst.mesh, enabled);
    if (!enabled && inst.label_enabled) {
        inst.label_enabled = false;
        renderer_.set_enabled(inst.label, false);
    }
}

void ClusterRegistry::apply_enabled(LinkInstance& link, bool enabled) {
    if (link.enabled == enabled) return;
    link.enabled = enabled;
    renderer_.set_enabled(link.mesh, enabled);
}

// ==========================================
// Layout
// ==========================================

void ClusterRegistry::layout_node(NodeInstance& inst) {
    const ClusterNode* data = get_node_data(inst.key.node_id);
    if (!data) {
        report_violation("No node data for " + inst.key.to_string());
        return;
    }

    PositionResult result = positions_.compute(
        *data, inst.key.cluster_id, visible_,
        [this](NodeId id) { return get_node_data(id); }
    );

    if (result.degraded && !inst.degraded) {
        diagnostics_.degraded_positions++;
    }
    inst.degraded = result.degraded;
    inst.position = result.position;
    inst.layout_epoch = layout_epoch_;
    renderer_.set_position(inst.mesh, inst.position);
}

void ClusterRegistry::layout_link(LinkInstance& link) {
    const NodeInstance& parent = nodes_.at(InstanceKey(link.key.cluster_id, link.key.parent_id));
    const NodeInstance& child = nodes_.at(InstanceKey(link.key.cluster_id, link.key.child_id));

    link.from = parent.position;
    link.to = child.position;
    link.layout_epoch = layout_epoch_;

    renderer_.set_position(link.mesh, (link.from + link.to) * 0.5);
    renderer_.orient_towards(link.mesh, link.from, link.to);
}

void ClusterRegistry::relayout_cluster(NodeId cluster_id) {
    auto it = clusters_.find(cluster_id);
    if (it == clusters_.end()) return;

    for (NodeId node_id : it->second.nodes) {
        NodeInstance& inst = nodes_.at(InstanceKey(cluster_id, node_id));
        if (inst.layout_epoch != layout_epoch_) {
            layout_node(inst);
        }
    }
    for (const auto& [parent_id, child_id] : it->second.links) {
        LinkInstance& link = links_.at(LinkKey(cluster_id, parent_id, child_id));
        if (link.layout_epoch != layout_epoch_) {
            layout_link(link);
        }
    }
}

// ==========================================
// Disposal
// ==========================================

ClusterRegistry::ClusterEntry& ClusterRegistry::cluster_entry(NodeId cluster_id) {
    auto it = clusters_.find(cluster_id);
    if (it != clusters_.end()) {
        return it->second;
    }

    ClusterEntry& entry = clusters_[cluster_id];
    entry.group = renderer_.create_group("cluster_" + std::to_string(cluster_id));
    renderer_.set_position(entry.group, Vec3());
    return entry;
}

void ClusterRegistry::dispose_node(const InstanceKey& key) {
    auto it = nodes_.find(key);
    if (it == nodes_.end()) return;

    NodeInstance& inst = it->second;
    if (inst.label != INVALID_PRIMITIVE) {
        renderer_.dispose(inst.label);
    }
    renderer_.dispose(inst.mesh);

    auto cluster_it = clusters_.find(key.cluster_id);
    if (cluster_it != clusters_.end()) {
        cluster_it->second.nodes.erase(key.node_id);
    }
    auto index_it = node_clusters_.find(key.node_id);
    if (index_it != node_clusters_.end()) {
        index_it->second.erase(key.cluster_id);
        if (index_it->second.empty()) {
            node_clusters_.erase(index_it);
        }
    }
    nodes_.erase(it);
}

void ClusterRegistry::dispose_link(const LinkKey& key) {
    auto it = links_.find(key);
    if (it == links_.end()) return;

    renderer_.dispose(it->second.mesh);

    auto cluster_it = clusters_.find(key.cluster_id);
    if (cluster_it != clusters_.end()) {
        cluster_it->second.links.erase({key.parent_id, key.child_id});
    }
    links_.erase(it);
}

void ClusterRegistry::drop_cluster_if_empty(NodeId cluster_id) {
    auto it = clusters_.find(cluster_id);
    if (it == clusters_.end()) return;
    if (!it->second.nodes.empty() || !it->second.links.empty()) return;

    renderer_.dispose(it->second.group);
    clusters_.erase(it);
}

void ClusterRegistry::report_violation(const std::string& message) {
    diagnostics_.invariant_violations++;
    if (diagnostics_.messages.size() < MAX_DIAGNOSTIC_MESSAGES) {
        diagnostics_.messages.push_back(message);
    }
    std::cerr << "[registry] Invariant violation: " << message << std::endl;
}

} // namespace cv
