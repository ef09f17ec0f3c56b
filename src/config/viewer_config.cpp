#include "config/viewer_config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace cv {

namespace {

template<typename T>
void read_field(const nlohmann::json& j, const char* key, T& target) {
    if (!j.contains(key) || j[key].is_null()) {
        return;
    }
    try {
        target = j[key].get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Invalid value for config key '") + key + "': " + e.what());
    }
}

void require_positive(double value, const char* key) {
    if (!(value > 0.0)) {
        throw std::runtime_error(std::string("Config key '") + key + "' must be positive");
    }
}

bool parse_bool(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

} // anonymous namespace

// ==========================================
// Component configs
// ==========================================

ProviderConfig ViewerConfig::provider_config() const {
    ProviderConfig c;
    c.api_base_url = api_base_url;
    c.timeout_seconds = timeout_seconds;
    c.max_retries = max_retries;
    c.cache_ttl_seconds = cache_ttl_seconds;
    c.verbose = verbose;
    return c;
}

RegistryConfig ViewerConfig::registry_config() const {
    RegistryConfig c;
    c.position.base_scale = base_scale;
    c.position.ancestor_multiplier = ancestor_multiplier;
    c.position.verbose = false;
    c.node_diameter = node_diameter;
    c.link_diameter = link_diameter;
    c.verbose = verbose;
    return c;
}

LabelConfig ViewerConfig::label_config() const {
    LabelConfig c;
    c.node_diameter = node_diameter;
    c.margin = label_margin;
    c.default_offset = label_default_offset;
    c.max_line_width = label_max_line_width;
    c.font_size = label_font_size;
    c.lod_distance = label_lod_distance;
    c.verbose = verbose;
    return c;
}

CameraConfig ViewerConfig::camera_config() const {
    CameraConfig c;
    c.base_distance = camera_base_distance;
    c.distance_factor = camera_distance_factor;
    c.fallback_distance = camera_fallback_distance;
    c.smoothing = camera_smoothing;
    c.verbose = verbose;
    return c;
}

SyncConfig ViewerConfig::sync_config() const {
    SyncConfig c;
    c.name_space = name_space;
    c.verbose = verbose;
    return c;
}

// ==========================================
// Serialization
// ==========================================

nlohmann::json ViewerConfig::to_json() const {
    nlohmann::json j;
    j["api_base_url"] = api_base_url;
    j["namespace"] = name_space;
    j["timeout_seconds"] = timeout_seconds;
    j["max_retries"] = max_retries;
    j["cache_ttl_seconds"] = cache_ttl_seconds;
    j["base_scale"] = base_scale;
    j["ancestor_multiplier"] = ancestor_multiplier;
    j["node_diameter"] = node_diameter;
    j["link_diameter"] = link_diameter;
    j["label_margin"] = label_margin;
    j["label_default_offset"] = label_default_offset;
    j["label_max_line_width"] = label_max_line_width;
    j["label_font_size"] = label_font_size;
    j["label_lod_distance"] = label_lod_distance;
    j["camera_base_distance"] = camera_base_distance;
    j["camera_distance_factor"] = camera_distance_factor;
    j["camera_fallback_distance"] = camera_fallback_distance;
    j["camera_smoothing"] = camera_smoothing;
    j["verbose"] = verbose;
    return j;
}

ViewerConfig ViewerConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Configuration must be a JSON object");
    }

    ViewerConfig config;
    read_field(j, "api_base_url", config.api_base_url);
    read_field(j, "namespace", config.name_space);
    read_field(j, "timeout_seconds", config.timeout_seconds);
    read_field(j, "max_retries", config.max_retries);
    read_field(j, "cache_ttl_seconds", config.cache_ttl_seconds);
    read_field(j, "base_scale", config.base_scale);
    read_field(j, "ancestor_multiplier", config.ancestor_multiplier);
    read_field(j, "node_diameter", config.node_diameter);
    read_field(j, "link_diameter", config.link_diameter);
    read_field(j, "label_margin", config.label_margin);
    read_field(j, "label_default_offset", config.label_default_offset);
    read_field(j, "label_max_line_width", config.label_max_line_width);
    read_field(j, "label_font_size", config.label_font_size);
    read_field(j, "label_lod_distance", config.label_lod_distance);
    read_field(j, "camera_base_distance", config.camera_base_distance);
    read_field(j, "camera_distance_factor", config.camera_distance_factor);
    read_field(j, "camera_fallback_distance", config.camera_fallback_distance);
    read_field(j, "camera_smoothing", config.camera_smoothing);
    read_field(j, "verbose", config.verbose);

    require_positive(config.base_scale, "base_scale");
    require_positive(config.ancestor_multiplier, "ancestor_multiplier");
    require_positive(config.node_diameter, "node_diameter");
    require_positive(config.label_font_size, "label_font_size");
    if (config.max_retries < 1) {
        throw std::runtime_error("Config key 'max_retries' must be at least 1");
    }
    if (config.cache_ttl_seconds < 0) {
        throw std::runtime_error("Config key 'cache_ttl_seconds' must not be negative");
    }
    return config;
}

// ==========================================
// Loading
// ==========================================

void ViewerConfig::apply_env() {
    if (const char* url = std::getenv("CLUSTERVIEW_API_BASE_URL")) {
        api_base_url = url;
    }
    if (const char* ns = std::getenv("CLUSTERVIEW_NAMESPACE")) {
        name_space = ns;
    }
    if (const char* v = std::getenv("CLUSTERVIEW_VERBOSE")) {
        verbose = parse_bool(v);
    }
}

ViewerConfig ViewerConfig::load(const std::string& config_path) {
    std::vector<std::string> paths_to_try;

    // If specific path provided, try it first
    if (!config_path.empty()) {
        paths_to_try.push_back(config_path);
    }

    // Try standard locations
    paths_to_try.push_back(".clusterview.json");           // Current directory
    paths_to_try.push_back("../.clusterview.json");        // From build/
    paths_to_try.push_back("../../.clusterview.json");     // From build/bin/

    std::string found_path;
    std::ifstream file;

    for (const auto& path : paths_to_try) {
        file.open(path);
        if (file.is_open()) {
            found_path = path;
            break;
        }
        file.clear();
    }

    ViewerConfig config;
    if (file.is_open()) {
        nlohmann::json config_json;
        try {
            file >> config_json;
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Failed to parse config file " + found_path + ": " + e.what());
        }
        config = from_json(config_json);
    }

    config.apply_env();
    return config;
}

} // namespace cv
