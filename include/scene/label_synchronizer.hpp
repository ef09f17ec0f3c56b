#pragma once

#include "scene/cluster_registry.hpp"
#include <optional>
#include <string>
#include <vector>

namespace cv {

struct LabelConfig {
    double node_diameter = 0.5;
    double margin = 0.4;                               // Gap between node surface and label
    double default_offset = 0.6;                       // Vertical offset when there is no parent link
    double max_line_width = 600.0;                     // Pixels
    double font_size = 48.0;                           // Pixels
    double plane_width = 3.0;
    double line_height = 0.15;                         // Scene units per text line
    double lod_distance = 0.0;                         // 0 disables distance culling
    bool verbose = false;
};

struct LabelSyncResult {
    size_t labels_created = 0;
    size_t labels_enabled = 0;
    size_t labels_disabled = 0;
    size_t culled_by_distance = 0;
};

/**
 * @brief Word-wrap a label for a fixed-width billboard
 *
 * Character width is estimated as font_size / 2. A single word longer than
 * the line is kept on its own line.
 */
std::vector<std::string> wrap_label_text(const std::string& text, double max_width, double font_size);

/**
 * @brief Keeps one label per node instance in step with that instance
 *
 * Each label follows the (cluster, node) instance it belongs to, never another
 * instance of the same node id. Labels of disabled instances are disabled but
 * kept; they are only destroyed together with their instance.
 */
class LabelSynchronizer {
public:
    explicit LabelSynchronizer(const LabelConfig& config = LabelConfig());

    /**
     * @brief Update every label against the settled registry
     *
     * @param registry Registry whose positions are final for this pass
     * @param camera_position Enables distance culling when lod_distance > 0
     */
    LabelSyncResult sync(ClusterRegistry& registry,
                         const std::optional<Vec3>& camera_position = std::nullopt);

    /**
     * @brief Label position for one instance
     *
     * Collinear with the link from the parent instance in the same cluster,
     * past the node by its radius plus margin; straight above the node when
     * there is no parent instance.
     */
    Vec3 label_position(const ClusterRegistry& registry, const NodeInstance& inst) const;

    const LabelConfig& get_config() const { return config_; }

private:
    LabelConfig config_;
};

} // namespace cv
