#include "scene/position_calculator.hpp"
#include <iostream>

namespace cv {

PositionCalculator::PositionCalculator(const PositionConfig& config) : config_(config) {}

void PositionCalculator::invalidate() {
    memo_.clear();
}

PositionResult PositionCalculator::compute(const ClusterNode& node, NodeId cluster_id,
                                           const VisibleSet& visible, const NodeLookup& lookup) {
    InstanceKey key(cluster_id, node.id);
    auto it = memo_.find(key);
    if (it != memo_.end()) {
        return it->second;
    }

    PositionResult result = compute_uncached(node, cluster_id, visible, lookup);
    memo_[key] = result;
    return result;
}

PositionResult PositionCalculator::compute_uncached(const ClusterNode& node, NodeId cluster_id,
                                                    const VisibleSet& visible, const NodeLookup& lookup) {
    PositionResult result;

    if (node.is_root()) {
        return result;
    }

    Vec3 offset = node.centroid * config_.base_scale;
    NodeId parent_id = *node.parent_id;

    const ClusterNode* parent = lookup ? lookup(parent_id) : nullptr;
    if (!parent || in_progress_.count(node.id)) {
        std::cerr << "[position] Node " << node.id << " in cluster " << cluster_id
                  << ": parent " << parent_id << " unresolved, using absolute placement" << std::endl;
        degraded_count_++;
        result.position = offset;
        result.degraded = true;
        return result;
    }

    in_progress_.insert(node.id);
    PositionResult parent_result = compute(*parent, cluster_id, visible, lookup);
    in_progress_.erase(node.id);

    bool ancestor_link = visible.count(node.id) > 0 && visible.count(parent_id) > 0;
    double multiplier = ancestor_link ? config_.ancestor_multiplier : 1.0;

    result.position = parent_result.position + offset * multiplier;
    result.degraded = parent_result.degraded;

    if (config_.verbose) {
        std::cout << "[position] Node " << node.id << " (depth " << node.depth << ") in cluster "
                  << cluster_id << " offset from parent " << parent_id
                  << (ancestor_link ? " [ancestor link]" : "") << std::endl;
    }

    return result;
}

} // namespace cv
