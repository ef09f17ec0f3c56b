#include "tree/cluster_node.hpp"
#include <iostream>

namespace cv {

namespace {

constexpr double FALLBACK_RADIUS = 10.0;
constexpr double PI = 3.14159265358979323846;
constexpr double FALLBACK_ANGLE_INCREMENT = PI / 4.0;

// Reads a 3-element numeric array; returns nullopt for anything else
std::optional<Vec3> read_centroid(const nlohmann::json& j) {
    if (!j.is_array() || j.size() != 3) {
        return std::nullopt;
    }
    for (const auto& v : j) {
        if (!v.is_number()) return std::nullopt;
    }
    Vec3 c(j[0].get<double>(), j[1].get<double>(), j[2].get<double>());
    if (!c.is_finite()) return std::nullopt;
    return c;
}

} // anonymous namespace

Vec3 fallback_centroid(int index) {
    double angle = index * FALLBACK_ANGLE_INCREMENT;
    double y = ((index + 1) % 2 == 0) ? 1.0 : -1.0;
    return Vec3(FALLBACK_RADIUS * std::cos(angle), y, FALLBACK_RADIUS * std::sin(angle));
}

// ==========================================
// ClusterNode Implementation
// ==========================================

nlohmann::json ClusterNode::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["label"] = label;
    j["depth"] = depth;
    j["is_leaf"] = is_leaf;
    j["centroid"] = centroid.to_json();
    j["children"] = children;
    j["child_count"] = child_count;
    if (parent_id) {
        j["parent_id"] = *parent_id;
    } else {
        j["parent_id"] = nullptr;
    }
    return j;
}

ClusterNode ClusterNode::from_json(const nlohmann::json& j) {
    ClusterNode node;
    node.id = j.contains("node_id") ? j.at("node_id").get<NodeId>() : j.at("id").get<NodeId>();
    node.depth = j.value("depth", 0);

    if (j.contains("parent_id") && !j["parent_id"].is_null()) {
        node.parent_id = j["parent_id"].get<NodeId>();
    }

    if (j.contains("final_label") && j["final_label"].is_string()) {
        node.label = j["final_label"].get<std::string>();
    } else if (j.contains("label") && j["label"].is_string()) {
        node.label = j["label"].get<std::string>();
    }
    if (node.label.empty()) {
        node.label = "Cluster " + std::to_string(node.id);
    }

    if (j.contains("children") && j["children"].is_array()) {
        node.children = j["children"].get<std::vector<NodeId>>();
    }
    node.child_count = j.value("child_count", static_cast<int>(node.children.size()));
    node.is_leaf = j.value("is_leaf", node.child_count == 0);

    std::optional<Vec3> c;
    if (j.contains("centroid")) {
        c = read_centroid(j["centroid"]);
    } else if (j.contains("centroid_3d")) {
        c = read_centroid(j["centroid_3d"]);
    }

    if (c) {
        node.centroid = *c;
    } else if (node.is_root()) {
        node.centroid = Vec3();
    } else {
        node.centroid = fallback_centroid(static_cast<int>(node.id % 8));
        node.has_valid_centroid = false;
        std::cerr << "[tree] Node " << node.id << " (" << node.label
                  << ") has no usable centroid, using fallback placement" << std::endl;
    }

    return node;
}

// ==========================================
// NodeView Implementation
// ==========================================

nlohmann::json NodeView::to_json() const {
    nlohmann::json j;
    j["node"] = node.to_json();
    nlohmann::json children_arr = nlohmann::json::array();
    for (const auto& c : children) {
        children_arr.push_back(c.to_json());
    }
    j["children"] = children_arr;
    j["parent"] = parent ? parent->to_json() : nlohmann::json(nullptr);
    return j;
}

} // namespace cv
