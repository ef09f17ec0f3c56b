#pragma once

#include "scene/renderer.hpp"
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cv {

enum class PrimitiveKind {
    Sphere,
    Cylinder,
    Plane,
    Group
};

std::string primitive_kind_to_string(PrimitiveKind kind);

/**
 * @brief State of one recorded primitive
 */
struct RecordedPrimitive {
    PrimitiveHandle handle = INVALID_PRIMITIVE;
    PrimitiveKind kind = PrimitiveKind::Group;
    std::string name;
    PrimitiveHandle parent = INVALID_PRIMITIVE;
    Vec3 position;                                     // Local to parent
    bool enabled = true;
    double width = 0.0;                                // Diameter for spheres/cylinders
    double height = 0.0;                               // Cylinder length after orient_towards
    Vec3 from;                                         // Cylinder endpoints
    Vec3 to;
    std::vector<std::string> text;

    nlohmann::json to_json() const;
};

/**
 * @brief Renderer that records every primitive in memory
 *
 * Used headless by the CLI and as the observable renderer in tests.
 * Operations on unknown or disposed handles throw std::runtime_error,
 * so handle leaks and double disposal surface immediately.
 */
class SceneRecorder : public Renderer {
public:
    SceneRecorder() = default;

    PrimitiveHandle create_sphere(const std::string& name, double diameter) override;
    PrimitiveHandle create_cylinder(const std::string& name, double diameter) override;
    PrimitiveHandle create_plane(const std::string& name, double width, double height) override;
    PrimitiveHandle create_group(const std::string& name) override;

    void set_parent(PrimitiveHandle handle, PrimitiveHandle parent) override;
    void set_position(PrimitiveHandle handle, const Vec3& position) override;
    void set_enabled(PrimitiveHandle handle, bool enabled) override;
    void orient_towards(PrimitiveHandle handle, const Vec3& from, const Vec3& to) override;
    void set_text(PrimitiveHandle handle, const std::vector<std::string>& lines) override;
    void dispose(PrimitiveHandle handle) override;

    bool is_enabled(PrimitiveHandle handle) const override;
    Vec3 get_position(PrimitiveHandle handle) const override;

    // ==========================================
    // Inspection
    // ==========================================

    const RecordedPrimitive* get(PrimitiveHandle handle) const;
    bool is_live(PrimitiveHandle handle) const { return primitives_.count(handle) > 0; }

    /**
     * @brief Position accumulated through the parent chain
     */
    Vec3 world_position(PrimitiveHandle handle) const;

    /**
     * @brief Enabled state accumulated through the parent chain
     */
    bool is_effectively_enabled(PrimitiveHandle handle) const;

    size_t num_live() const { return primitives_.size(); }
    size_t num_created() const { return created_count_; }
    size_t num_disposed() const { return disposed_count_; }
    size_t count_live(PrimitiveKind kind) const;

    /**
     * @brief Camera pose included in exports
     */
    void set_camera(const Vec3& position, const Vec3& target);

    // ==========================================
    // Export
    // ==========================================

    /**
     * @brief Enabled spheres, links and labels in world coordinates
     */
    nlohmann::json to_json() const;

    void save_to_json(const std::string& filename) const;

    /**
     * @brief Export the scene as a standalone interactive HTML page
     *
     * @param filename Output HTML file path
     * @param title Title shown in the page header
     */
    void export_html(const std::string& filename, const std::string& title = "Cluster View") const;

private:
    std::map<PrimitiveHandle, RecordedPrimitive> primitives_;
    PrimitiveHandle next_handle_ = 1;
    size_t created_count_ = 0;
    size_t disposed_count_ = 0;
    Vec3 camera_position_;
    Vec3 camera_target_;

    PrimitiveHandle create(PrimitiveKind kind, const std::string& name, double width, double height);
    RecordedPrimitive& require(PrimitiveHandle handle, const char* operation);
    const RecordedPrimitive& require(PrimitiveHandle handle, const char* operation) const;
};

} // namespace cv
