#pragma once

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cv {

using NodeId = std::int64_t;

/**
 * @brief Minimal 3-component vector used for centroids and scene positions
 */
struct Vec3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    Vec3() = default;
    Vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    Vec3 operator+(const Vec3& o) const { return {x + o.x, y + o.y, z + o.z}; }
    Vec3 operator-(const Vec3& o) const { return {x - o.x, y - o.y, z - o.z}; }
    Vec3 operator*(double s) const { return {x * s, y * s, z * s}; }
    Vec3& operator+=(const Vec3& o) { x += o.x; y += o.y; z += o.z; return *this; }
    bool operator==(const Vec3& o) const { return x == o.x && y == o.y && z == o.z; }
    bool operator!=(const Vec3& o) const { return !(*this == o); }

    double length() const { return std::sqrt(x * x + y * y + z * z); }
    double distance_to(const Vec3& o) const { return (*this - o).length(); }

    bool is_finite() const {
        return std::isfinite(x) && std::isfinite(y) && std::isfinite(z);
    }

    nlohmann::json to_json() const { return nlohmann::json::array({x, y, z}); }
};

/**
 * @brief One node of the cluster tree as delivered by a data source
 *
 * The centroid is expressed in the node's own local frame, i.e. as an
 * offset from its parent. Instances are immutable once fetched.
 */
struct ClusterNode {
    NodeId id = 0;
    std::optional<NodeId> parent_id;                   // Empty for the root
    int depth = 0;                                     // Root = 0
    Vec3 centroid;
    bool is_leaf = false;
    std::string label;
    std::vector<NodeId> children;                      // Child ids (may be empty if unknown)
    int child_count = 0;
    bool has_valid_centroid = true;                    // False if a fallback centroid was substituted

    bool is_root() const { return !parent_id.has_value(); }

    /**
     * @brief Convert node to JSON (frontend shape)
     */
    nlohmann::json to_json() const;

    /**
     * @brief Create node from JSON
     *
     * Accepts both the frontend shape (id, label, centroid, is_leaf, children)
     * and the backend shape (node_id, final_label, centroid_3d, child_count).
     * Throws nlohmann::json::exception if no id is present.
     */
    static ClusterNode from_json(const nlohmann::json& j);
};

/**
 * @brief Everything needed to build one cluster: focal node, its children, its parent
 */
struct NodeView {
    ClusterNode node;
    std::vector<ClusterNode> children;
    std::optional<ClusterNode> parent;

    nlohmann::json to_json() const;
};

/**
 * @brief Deterministic ring placement for nodes without a usable centroid
 *
 * Successive calls walk around a circle of radius 10 in 45 degree steps,
 * alternating y between +1 and -1 so neighbours do not overlap.
 */
Vec3 fallback_centroid(int index);

} // namespace cv
