#include "scene/label_synchronizer.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>

namespace cv {

std::vector<std::string> wrap_label_text(const std::string& text, double max_width, double font_size) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string word;
    std::string current;
    double char_width = font_size / 2.0;

    while (stream >> word) {
        if (current.empty()) {
            current = word;
        } else if ((current.size() + word.size()) * char_width < max_width) {
            current += " " + word;
        } else {
            lines.push_back(current);
            current = word;
        }
    }
    if (!current.empty()) {
        lines.push_back(current);
    }
    return lines;
}

LabelSynchronizer::LabelSynchronizer(const LabelConfig& config) : config_(config) {}

Vec3 LabelSynchronizer::label_position(const ClusterRegistry& registry, const NodeInstance& inst) const {
    Vec3 above = inst.position + Vec3(0.0, config_.default_offset, 0.0);

    const ClusterNode* data = registry.get_node_data(inst.key.node_id);
    if (!data || !data->parent_id) {
        return above;
    }

    const NodeInstance* parent = registry.get_node_instance(InstanceKey(inst.key.cluster_id, *data->parent_id));
    if (!parent) {
        return above;
    }

    Vec3 direction = inst.position - parent->position;
    double length = direction.length();
    if (length < 1e-9) {
        return above;
    }

    double distance = config_.node_diameter / 2.0 + config_.margin;
    return inst.position + direction * (distance / length);
}

LabelSyncResult LabelSynchronizer::sync(ClusterRegistry& registry,
                                        const std::optional<Vec3>& camera_position) {
    LabelSyncResult result;

    for (const NodeInstance* inst : registry.all_node_instances()) {
        if (!inst->enabled) {
            if (inst->label != INVALID_PRIMITIVE && inst->label_enabled) {
                registry.set_label_enabled(inst->key, false);
                result.labels_disabled++;
            }
            continue;
        }

        if (inst->label == INVALID_PRIMITIVE) {
            const ClusterNode* data = registry.get_node_data(inst->key.node_id);
            std::string text = data ? data->label : "Cluster " + std::to_string(inst->key.node_id);
            auto lines = wrap_label_text(text, config_.max_line_width, config_.font_size);
            double height = std::max(0.5, lines.size() * config_.line_height);
            registry.set_label(inst->key, lines, config_.plane_width, height);
            result.labels_created++;
        }

        registry.place_label(inst->key, label_position(registry, *inst));

        bool visible = true;
        if (config_.lod_distance > 0.0 && camera_position &&
            inst->position.distance_to(*camera_position) > config_.lod_distance) {
            visible = false;
            result.culled_by_distance++;
        }

        registry.set_label_enabled(inst->key, visible);
        if (visible) {
            result.labels_enabled++;
        } else {
            result.labels_disabled++;
        }
    }

    if (config_.verbose) {
        std::cout << "[labels] " << result.labels_enabled << " enabled, "
                  << result.labels_disabled << " disabled, "
                  << result.labels_created << " created" << std::endl;
    }
    return result;
}

} // namespace cv
