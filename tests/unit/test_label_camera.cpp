#include <gtest/gtest.h>
#include "scene/camera_framer.hpp"
#include "scene/label_synchronizer.hpp"
#include "scene/scene_recorder.hpp"
#include "test_trees.hpp"
#include <cmath>

using namespace cv;
using namespace cv::testing_trees;

// Cluster 2 of the chain tree, shown with 1 and 2 visible:
//   (2,1) at origin (disabled, 1 is visible), (2,2) at [3,0,0], (2,3) at [3,1,0]
class SceneFixture : public ::testing::Test {
protected:
    ClusterTree tree = make_chain_tree();
    SceneRecorder recorder;
    ClusterRegistry registry{recorder, make_config()};

    static RegistryConfig make_config() {
        RegistryConfig c;
        c.position.base_scale = 1.0;
        return c;
    }

    void build_cluster_two() {
        registry.set_root(1);
        registry.pre_register_visible(2);
        registry.add_node_instance(*tree.get_node(1), 2);
        registry.add_node_instance(*tree.get_node(2), 2);
        registry.add_node_instance(*tree.get_node(3), 2);
        registry.add_link_instance(*tree.get_node(1), *tree.get_node(2), 2);
        registry.add_link_instance(*tree.get_node(2), *tree.get_node(3), 2);
        registry.show_cluster(2);
    }
};

// ==========================================
// Text Wrapping Tests
// ==========================================

TEST(WrapLabelTextTest, BreaksAtEstimatedWidth) {
    auto lines = wrap_label_text("Quantum optics and photonics", 600.0, 48.0);
    EXPECT_EQ(lines, (std::vector<std::string>{"Quantum optics and", "photonics"}));
}

TEST(WrapLabelTextTest, ShortTextIsOneLine) {
    EXPECT_EQ(wrap_label_text("Optics", 600.0, 48.0), (std::vector<std::string>{"Optics"}));
}

TEST(WrapLabelTextTest, LongWordKeepsOwnLine) {
    auto lines = wrap_label_text("a Supercalifragilisticexpialidocious b", 600.0, 48.0);
    EXPECT_EQ(lines, (std::vector<std::string>{"a", "Supercalifragilisticexpialidocious", "b"}));
}

TEST(WrapLabelTextTest, EmptyText) {
    EXPECT_TRUE(wrap_label_text("", 600.0, 48.0).empty());
    EXPECT_TRUE(wrap_label_text("   ", 600.0, 48.0).empty());
}

// ==========================================
// Label Tests
// ==========================================

TEST_F(SceneFixture, LabelSitsPastNodeAlongParentLink) {
    build_cluster_two();
    LabelSynchronizer labels;

    Vec3 p = labels.label_position(registry, *registry.get_node_instance(InstanceKey(2, 3)));
    EXPECT_NEAR(p.x, 3.0, 1e-9);
    EXPECT_NEAR(p.y, 1.65, 1e-9);
    EXPECT_NEAR(p.z, 0.0, 1e-9);
}

TEST_F(SceneFixture, RootLabelSitsAbove) {
    build_cluster_two();
    LabelSynchronizer labels;

    Vec3 p = labels.label_position(registry, *registry.get_node_instance(InstanceKey(2, 1)));
    EXPECT_NEAR(p.y, 0.6, 1e-9);
    EXPECT_NEAR(p.x, 0.0, 1e-9);
}

TEST_F(SceneFixture, SyncLabelsEnabledInstancesOnly) {
    build_cluster_two();
    LabelSynchronizer labels;

    LabelSyncResult result = labels.sync(registry);
    EXPECT_EQ(result.labels_created, 2u);
    EXPECT_EQ(result.labels_enabled, 2u);
    EXPECT_EQ(registry.get_node_instance(InstanceKey(2, 1))->label, INVALID_PRIMITIVE);

    const NodeInstance* inst = registry.get_node_instance(InstanceKey(2, 3));
    ASSERT_NE(inst->label, INVALID_PRIMITIVE);
    EXPECT_TRUE(recorder.is_enabled(inst->label));
    EXPECT_EQ(recorder.get(inst->label)->text, (std::vector<std::string>{"Cluster 3"}));
    EXPECT_DOUBLE_EQ(recorder.get(inst->label)->height, 0.5);
    EXPECT_NEAR(recorder.get_position(inst->label).y, 1.65, 1e-9);

    // A second sync reuses the planes
    result = labels.sync(registry);
    EXPECT_EQ(result.labels_created, 0u);
    EXPECT_EQ(recorder.count_live(PrimitiveKind::Plane), 2u);
}

TEST_F(SceneFixture, HiddenInstanceKeepsDisabledLabel) {
    build_cluster_two();
    LabelSynchronizer labels;
    labels.sync(registry);

    registry.hide_cluster(2);
    LabelSyncResult result = labels.sync(registry);
    EXPECT_EQ(result.labels_enabled, 0u);
    EXPECT_EQ(recorder.count_live(PrimitiveKind::Plane), 2u);
    for (const auto* inst : registry.all_node_instances()) {
        EXPECT_FALSE(inst->label_enabled) << inst->key.to_string();
    }
}

TEST_F(SceneFixture, DistantLabelsAreCulled) {
    build_cluster_two();
    LabelConfig config;
    config.lod_distance = 10.0;
    LabelSynchronizer labels(config);

    LabelSyncResult far = labels.sync(registry, Vec3(100, 0, 0));
    EXPECT_EQ(far.culled_by_distance, 2u);
    EXPECT_EQ(far.labels_enabled, 0u);

    LabelSyncResult near = labels.sync(registry, Vec3(3, 0, 5));
    EXPECT_EQ(near.culled_by_distance, 0u);
    EXPECT_EQ(near.labels_enabled, 2u);
}

// ==========================================
// Camera Tests
// ==========================================

TEST(CameraStateTest, OrbitPosition) {
    CameraState state;
    Vec3 p = state.position();
    EXPECT_NEAR(p.x, 0.0, 1e-9);
    EXPECT_NEAR(p.y, 20.0 * std::sqrt(0.5), 1e-9);
    EXPECT_NEAR(p.z, 20.0 * std::sqrt(0.5), 1e-9);
}

TEST_F(SceneFixture, EmptySceneFallsBackToFocus) {
    CameraFramer camera;
    FramingBox box = CameraFramer::compute_box(registry);
    EXPECT_EQ(box.count, 0u);

    const CameraState& goal = camera.frame(registry, 2);
    EXPECT_EQ(goal.target, Vec3());
    EXPECT_DOUBLE_EQ(goal.radius, 20.0);
}

TEST_F(SceneFixture, FramesEnabledInstances) {
    build_cluster_two();
    CameraFramer camera;

    FramingBox box = CameraFramer::compute_box(registry);
    EXPECT_EQ(box.count, 2u);
    EXPECT_EQ(box.center(), Vec3(3, 0.5, 0));
    EXPECT_DOUBLE_EQ(box.max_dimension(), 1.0);

    const CameraState& goal = camera.frame(registry, 2);
    EXPECT_EQ(goal.target, Vec3(3, 0.5, 0));
    EXPECT_DOUBLE_EQ(goal.radius, 26.5);
}

TEST_F(SceneFixture, TickEasesTowardGoal) {
    build_cluster_two();
    CameraFramer camera;
    camera.frame(registry, 2);
    EXPECT_FALSE(camera.is_settled());

    double before = camera.current().target.distance_to(camera.goal().target);
    camera.tick(0.1);
    double after = camera.current().target.distance_to(camera.goal().target);
    EXPECT_LT(after, before);
    EXPECT_GT(after, 0.0);

    for (int i = 0; i < 600; ++i) {
        camera.tick(1.0 / 60.0);
    }
    EXPECT_TRUE(camera.is_settled());
}

TEST_F(SceneFixture, SnapSkipsEasing) {
    build_cluster_two();
    CameraFramer camera;
    camera.frame(registry, 2);
    camera.tick(0.0);
    EXPECT_FALSE(camera.is_settled());

    camera.snap_to_goal();
    EXPECT_TRUE(camera.is_settled());
    EXPECT_DOUBLE_EQ(camera.current().radius, 26.5);
}
