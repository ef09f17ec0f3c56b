#pragma once

#include "provider/data_provider.hpp"
#include "scene/camera_framer.hpp"
#include "scene/cluster_registry.hpp"
#include "scene/label_synchronizer.hpp"
#include "sync/view_synchronizer.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace cv {

/**
 * @brief Complete configuration of the viewer
 *
 * Loaded from a JSON file (all keys optional) and split into the per-component
 * configuration structs.
 */
struct ViewerConfig {
    // Data source
    std::string api_base_url = "http://localhost:8000/api";
    std::string name_space;
    int timeout_seconds = 30;
    int max_retries = 3;
    int cache_ttl_seconds = 300;

    // Layout
    double base_scale = 3.0;
    double ancestor_multiplier = 3.0;
    double node_diameter = 0.5;
    double link_diameter = 0.05;

    // Labels
    double label_margin = 0.4;
    double label_default_offset = 0.6;
    double label_max_line_width = 600.0;
    double label_font_size = 48.0;
    double label_lod_distance = 0.0;

    // Camera
    double camera_base_distance = 25.0;
    double camera_distance_factor = 1.5;
    double camera_fallback_distance = 20.0;
    double camera_smoothing = 4.0;

    bool verbose = false;

    ProviderConfig provider_config() const;
    RegistryConfig registry_config() const;
    LabelConfig label_config() const;
    CameraConfig camera_config() const;
    SyncConfig sync_config() const;

    nlohmann::json to_json() const;

    /**
     * @brief Build from JSON; missing keys keep their defaults
     *
     * @throws std::runtime_error on a value of the wrong type or out of range
     */
    static ViewerConfig from_json(const nlohmann::json& j);

    /**
     * @brief Load configuration
     *
     * Tries `config_path` (if non-empty), then .clusterview.json in the current
     * directory and up to two parents. Defaults are used when no file is found.
     * Environment variables CLUSTERVIEW_API_BASE_URL, CLUSTERVIEW_NAMESPACE and
     * CLUSTERVIEW_VERBOSE override file values.
     *
     * @throws std::runtime_error if a file is found but cannot be parsed
     */
    static ViewerConfig load(const std::string& config_path = "");

    /**
     * @brief Apply CLUSTERVIEW_* environment overrides
     */
    void apply_env();
};

} // namespace cv
