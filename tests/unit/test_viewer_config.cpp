#include <gtest/gtest.h>
#include "config/viewer_config.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace cv;

class ViewerConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear_env(); }
    void TearDown() override { clear_env(); }

    static void clear_env() {
        unsetenv("CLUSTERVIEW_API_BASE_URL");
        unsetenv("CLUSTERVIEW_NAMESPACE");
        unsetenv("CLUSTERVIEW_VERBOSE");
    }

    static std::string write_file(const std::string& name, const std::string& content) {
        std::string path = ::testing::TempDir() + name;
        std::ofstream out(path);
        out << content;
        return path;
    }
};

// ==========================================
// Defaults and JSON Tests
// ==========================================

TEST_F(ViewerConfigTest, Defaults) {
    ViewerConfig config;
    EXPECT_DOUBLE_EQ(config.base_scale, 3.0);
    EXPECT_DOUBLE_EQ(config.ancestor_multiplier, 3.0);
    EXPECT_EQ(config.cache_ttl_seconds, 300);

    RegistryConfig registry = config.registry_config();
    EXPECT_DOUBLE_EQ(registry.position.base_scale, 3.0);
    EXPECT_DOUBLE_EQ(registry.node_diameter, 0.5);

    CameraConfig camera = config.camera_config();
    EXPECT_DOUBLE_EQ(camera.base_distance, 25.0);
    EXPECT_DOUBLE_EQ(camera.distance_factor, 1.5);
}

TEST_F(ViewerConfigTest, FromJsonOverridesGivenKeys) {
    ViewerConfig config = ViewerConfig::from_json({
        {"namespace", "physics"},
        {"base_scale", 2.5},
        {"label_lod_distance", 40.0},
        {"verbose", true}
    });

    EXPECT_EQ(config.name_space, "physics");
    EXPECT_EQ(config.sync_config().name_space, "physics");
    EXPECT_DOUBLE_EQ(config.registry_config().position.base_scale, 2.5);
    EXPECT_DOUBLE_EQ(config.label_config().lod_distance, 40.0);
    EXPECT_TRUE(config.provider_config().verbose);
    EXPECT_EQ(config.max_retries, 3);
}

TEST_F(ViewerConfigTest, NullKeepsDefault) {
    ViewerConfig config = ViewerConfig::from_json({{"timeout_seconds", nullptr}});
    EXPECT_EQ(config.timeout_seconds, 30);
}

TEST_F(ViewerConfigTest, JsonRoundTripKeepsValues) {
    ViewerConfig config;
    config.api_base_url = "http://example.org/api";
    config.camera_smoothing = 8.0;

    ViewerConfig loaded = ViewerConfig::from_json(config.to_json());
    EXPECT_EQ(loaded.api_base_url, "http://example.org/api");
    EXPECT_DOUBLE_EQ(loaded.camera_smoothing, 8.0);
}

TEST_F(ViewerConfigTest, RejectsWrongType) {
    EXPECT_THROW(ViewerConfig::from_json({{"base_scale", "large"}}), std::runtime_error);
    EXPECT_THROW(ViewerConfig::from_json(nlohmann::json::array()), std::runtime_error);
}

TEST_F(ViewerConfigTest, RejectsOutOfRange) {
    EXPECT_THROW(ViewerConfig::from_json({{"base_scale", 0.0}}), std::runtime_error);
    EXPECT_THROW(ViewerConfig::from_json({{"ancestor_multiplier", -1.0}}), std::runtime_error);
    EXPECT_THROW(ViewerConfig::from_json({{"max_retries", 0}}), std::runtime_error);
    EXPECT_THROW(ViewerConfig::from_json({{"cache_ttl_seconds", -5}}), std::runtime_error);
}

// ==========================================
// Loading Tests
// ==========================================

TEST_F(ViewerConfigTest, LoadFromExplicitPath) {
    std::string path = write_file("clusterview_config_test.json",
                                  R"({"namespace": "biology", "max_retries": 5})");
    ViewerConfig config = ViewerConfig::load(path);
    EXPECT_EQ(config.name_space, "biology");
    EXPECT_EQ(config.max_retries, 5);
    std::remove(path.c_str());
}

TEST_F(ViewerConfigTest, LoadRejectsBrokenFile) {
    std::string path = write_file("clusterview_broken_config.json", "{ not json");
    EXPECT_THROW(ViewerConfig::load(path), std::runtime_error);
    std::remove(path.c_str());
}

TEST_F(ViewerConfigTest, EnvironmentOverridesFile) {
    std::string path = write_file("clusterview_env_config.json",
                                  R"({"namespace": "biology", "api_base_url": "http://file/api"})");
    setenv("CLUSTERVIEW_NAMESPACE", "chemistry", 1);
    setenv("CLUSTERVIEW_API_BASE_URL", "http://env/api", 1);
    setenv("CLUSTERVIEW_VERBOSE", "Yes", 1);

    ViewerConfig config = ViewerConfig::load(path);
    EXPECT_EQ(config.name_space, "chemistry");
    EXPECT_EQ(config.api_base_url, "http://env/api");
    EXPECT_TRUE(config.verbose);
    std::remove(path.c_str());
}

TEST_F(ViewerConfigTest, FalseyVerboseValue) {
    setenv("CLUSTERVIEW_VERBOSE", "0", 1);
    ViewerConfig config;
    config.verbose = true;
    config.apply_env();
    EXPECT_FALSE(config.verbose);
}
