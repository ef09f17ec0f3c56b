#pragma once

#include "scene/cluster_registry.hpp"
#include <nlohmann/json.hpp>

namespace cv {

struct CameraConfig {
    double base_distance = 25.0;
    double distance_factor = 1.5;                      // Added distance per unit of box size
    double fallback_distance = 20.0;                   // When only the focus node is framed
    double smoothing = 4.0;                            // Exponential easing rate per second
    double alpha = 1.5707963267948966;                 // Side view
    double beta = 0.7853981633974483;                  // Slightly above
    bool verbose = false;
};

/**
 * @brief Orbit camera parameters
 */
struct CameraState {
    Vec3 target;
    double radius = 20.0;
    double alpha = 1.5707963267948966;
    double beta = 0.7853981633974483;

    /**
     * @brief Eye position on the orbit around target
     */
    Vec3 position() const;

    nlohmann::json to_json() const;
};

/**
 * @brief Axis-aligned bounding box of enabled instances
 */
struct FramingBox {
    Vec3 min;
    Vec3 max;
    size_t count = 0;

    Vec3 center() const { return (min + max) * 0.5; }
    double max_dimension() const;
};

/**
 * @brief Frames the camera on the enabled part of the scene
 *
 * frame() only sets a goal; tick() eases the current state toward it so the
 * synchronizer never waits on camera motion.
 */
class CameraFramer {
public:
    explicit CameraFramer(const CameraConfig& config = CameraConfig());

    /**
     * @brief Compute and set the camera goal
     *
     * Target is the center of the box around all enabled node instances and
     * the distance grows with its largest side. With nothing enabled, the
     * focus node's own instance is framed at the fallback distance.
     */
    const CameraState& frame(const ClusterRegistry& registry, NodeId focus_id);

    /**
     * @brief Advance easing by `dt` seconds
     */
    void tick(double dt);

    /**
     * @brief Skip the easing and jump to the goal
     */
    void snap_to_goal() { current_ = goal_; }

    bool is_settled(double tolerance = 1e-3) const;

    const CameraState& current() const { return current_; }
    const CameraState& goal() const { return goal_; }

    static FramingBox compute_box(const ClusterRegistry& registry);

private:
    CameraConfig config_;
    CameraState current_;
    CameraState goal_;
};

} // namespace cv
