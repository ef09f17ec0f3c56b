#include "scene/camera_framer.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

namespace cv {

Vec3 CameraState::position() const {
    return target + Vec3(radius * std::cos(alpha) * std::sin(beta),
                         radius * std::cos(beta),
                         radius * std::sin(alpha) * std::sin(beta));
}

nlohmann::json CameraState::to_json() const {
    nlohmann::json j;
    j["target"] = target.to_json();
    j["radius"] = radius;
    j["alpha"] = alpha;
    j["beta"] = beta;
    j["position"] = position().to_json();
    return j;
}

double FramingBox::max_dimension() const {
    Vec3 size = max - min;
    return std::max({size.x, size.y, size.z});
}

CameraFramer::CameraFramer(const CameraConfig& config) : config_(config) {
    current_.alpha = goal_.alpha = config_.alpha;
    current_.beta = goal_.beta = config_.beta;
    current_.radius = goal_.radius = config_.fallback_distance;
}

FramingBox CameraFramer::compute_box(const ClusterRegistry& registry) {
    constexpr double inf = std::numeric_limits<double>::infinity();
    FramingBox box;
    box.min = Vec3(inf, inf, inf);
    box.max = Vec3(-inf, -inf, -inf);

    for (const NodeInstance* inst : registry.enabled_node_instances()) {
        const Vec3& p = inst->position;
        box.min = Vec3(std::min(box.min.x, p.x), std::min(box.min.y, p.y), std::min(box.min.z, p.z));
        box.max = Vec3(std::max(box.max.x, p.x), std::max(box.max.y, p.y), std::max(box.max.z, p.z));
        box.count++;
    }

    if (box.count == 0) {
        box.min = box.max = Vec3();
    }
    return box;
}

const CameraState& CameraFramer::frame(const ClusterRegistry& registry, NodeId focus_id) {
    FramingBox box = compute_box(registry);

    goal_.alpha = config_.alpha;
    goal_.beta = config_.beta;

    if (box.count > 0) {
        goal_.target = box.center();
        goal_.radius = config_.base_distance + config_.distance_factor * box.max_dimension();
    } else {
        const NodeInstance* focal = registry.get_node_instance(InstanceKey(focus_id, focus_id));
        goal_.target = focal ? focal->position : Vec3();
        goal_.radius = config_.fallback_distance;
    }

    if (config_.verbose) {
        std::cout << "[camera] Framing node " << focus_id << " at (" << goal_.target.x << ", "
                  << goal_.target.y << ", " << goal_.target.z << ") with distance "
                  << goal_.radius << " over " << box.count << " instances" << std::endl;
    }
    return goal_;
}

void CameraFramer::tick(double dt) {
    if (dt <= 0.0) return;

    double t = 1.0 - std::exp(-config_.smoothing * dt);
    current_.target = current_.target + (goal_.target - current_.target) * t;
    current_.radius += (goal_.radius - current_.radius) * t;
    current_.alpha += (goal_.alpha - current_.alpha) * t;
    current_.beta += (goal_.beta - current_.beta) * t;
}

bool CameraFramer::is_settled(double tolerance) const {
    return current_.target.distance_to(goal_.target) <= tolerance &&
           std::abs(current_.radius - goal_.radius) <= tolerance &&
           std::abs(current_.alpha - goal_.alpha) <= tolerance &&
           std::abs(current_.beta - goal_.beta) <= tolerance;
}

} // namespace cv
