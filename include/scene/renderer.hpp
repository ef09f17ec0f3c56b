#pragma once

#include "tree/cluster_node.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace cv {

/**
 * @brief Opaque handle to a visual primitive owned by a Renderer
 *
 * 0 is never a valid handle.
 */
using PrimitiveHandle = std::uint64_t;

constexpr PrimitiveHandle INVALID_PRIMITIVE = 0;

/**
 * @brief Abstract rendering backend
 *
 * The scene core only ever creates, moves, enables/disables and disposes
 * primitives through this interface, and reads back enabled state and
 * position. Positions are local to the primitive's parent.
 */
class Renderer {
public:
    virtual ~Renderer() = default;

    // ==========================================
    // Creation
    // ==========================================

    virtual PrimitiveHandle create_sphere(const std::string& name, double diameter) = 0;

    /**
     * @brief Create a unit-height cylinder along the local y axis
     *
     * Its final length is set by orient_towards().
     */
    virtual PrimitiveHandle create_cylinder(const std::string& name, double diameter) = 0;

    /**
     * @brief Create a camera-facing plane (used for labels)
     */
    virtual PrimitiveHandle create_plane(const std::string& name, double width, double height) = 0;

    /**
     * @brief Create an empty transform node that other primitives can be parented to
     */
    virtual PrimitiveHandle create_group(const std::string& name) = 0;

    // ==========================================
    // Mutation
    // ==========================================

    virtual void set_parent(PrimitiveHandle handle, PrimitiveHandle parent) = 0;
    virtual void set_position(PrimitiveHandle handle, const Vec3& position) = 0;
    virtual void set_enabled(PrimitiveHandle handle, bool enabled) = 0;

    /**
     * @brief Point the primitive's y axis from `from` to `to` and stretch it to their distance
     */
    virtual void orient_towards(PrimitiveHandle handle, const Vec3& from, const Vec3& to) = 0;

    virtual void set_text(PrimitiveHandle handle, const std::vector<std::string>& lines) = 0;

    /**
     * @brief Destroy the primitive; the handle must not be used afterwards
     */
    virtual void dispose(PrimitiveHandle handle) = 0;

    // ==========================================
    // Read-back
    // ==========================================

    virtual bool is_enabled(PrimitiveHandle handle) const = 0;
    virtual Vec3 get_position(PrimitiveHandle handle) const = 0;
};

} // namespace cv
