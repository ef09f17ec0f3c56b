#include <gtest/gtest.h>
#include "scene/scene_recorder.hpp"
#include "sync/view_synchronizer.hpp"
#include "test_trees.hpp"
#include <map>

using namespace cv;
using namespace cv::testing_trees;

namespace {

// Everything a focus change touches, wired the way the CLI wires it
struct Harness {
    InMemoryDataProvider provider;
    SceneRecorder recorder;
    ClusterRegistry registry;
    LabelSynchronizer labels;
    CameraFramer camera;
    ViewSynchronizer sync;

    explicit Harness(ClusterTree tree)
        : provider(std::move(tree)),
          registry(recorder, registry_config()),
          sync(provider, registry, labels, camera, sync_config()) {}

    static RegistryConfig registry_config() {
        RegistryConfig c;
        c.position.base_scale = 1.0;
        return c;
    }

    static SyncConfig sync_config() {
        SyncConfig c;
        c.name_space = "test";
        return c;
    }

    Vec3 position(NodeId cluster, NodeId node) const {
        const NodeInstance* inst = registry.get_node_instance(InstanceKey(cluster, node));
        return inst ? inst->position : Vec3(-999, -999, -999);
    }

    std::map<InstanceKey, Vec3> enabled_positions() const {
        std::map<InstanceKey, Vec3> result;
        for (const auto* inst : registry.enabled_node_instances()) {
            result[inst->key] = inst->position;
        }
        return result;
    }
};

} // anonymous namespace

class ViewSynchronizerTest : public ::testing::Test {
protected:
    Harness h{make_bushy_tree()};
};

// ==========================================
// Focus Change Tests
// ==========================================

TEST_F(ViewSynchronizerTest, FocusRootShowsRootCluster) {
    SyncResult result = h.sync.focus_root();
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.chain, (std::vector<NodeId>{1}));
    EXPECT_EQ(h.sync.current_focus(), 1);
    EXPECT_TRUE(h.sync.is_cluster_visible(1));
    EXPECT_EQ(h.registry.root_id(), 1);
    EXPECT_EQ(h.registry.cluster_members(1), (std::set<NodeId>{1, 2, 5}));
}

TEST_F(ViewSynchronizerTest, DeepFocusBuildsWholeChain) {
    SyncResult result = h.sync.request_focus(4);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.chain, (std::vector<NodeId>{4, 3, 2, 1}));
    EXPECT_EQ(result.to_show, (std::vector<NodeId>{4, 3, 2, 1}));
    EXPECT_TRUE(result.to_hide.empty());

    EXPECT_EQ(h.position(2, 2), Vec3(3, 0, 0));
    EXPECT_EQ(h.position(3, 3), Vec3(3, 3, 0));
    EXPECT_EQ(h.position(4, 4), Vec3(3, 3, 3));
    EXPECT_TRUE(h.registry.layout_is_current());
}

TEST_F(ViewSynchronizerTest, FocusUpTheChainHidesAndSweeps) {
    ASSERT_TRUE(h.sync.request_focus(4).success);

    SyncResult result = h.sync.request_focus(2);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.chain, (std::vector<NodeId>{2, 1}));
    EXPECT_EQ(result.remain, (std::vector<NodeId>{2, 1}));
    EXPECT_EQ(result.to_hide, (std::vector<NodeId>{3, 4}));
    EXPECT_GT(result.instances_swept, 0u);

    EXPECT_EQ(h.registry.visible_clusters(), (VisibleSet{1, 2}));
    EXPECT_FALSE(h.registry.is_created(3));
    EXPECT_FALSE(h.registry.is_created(4));

    EXPECT_EQ(h.position(2, 2), Vec3(3, 0, 0));
    EXPECT_EQ(h.position(2, 3), Vec3(3, 1, 0));
    EXPECT_EQ(h.recorder.get_position(h.registry.get_node_instance(InstanceKey(2, 3))->mesh),
              Vec3(3, 1, 0));
    EXPECT_TRUE(h.registry.layout_is_current());
}

TEST_F(ViewSynchronizerTest, SiblingFocusSwapsBranches) {
    ASSERT_TRUE(h.sync.request_focus(3).success);
    SyncResult result = h.sync.request_focus(7);
    ASSERT_TRUE(result.success);

    EXPECT_EQ(result.chain, (std::vector<NodeId>{7, 5, 1}));
    EXPECT_EQ(result.to_hide, (std::vector<NodeId>{2, 3}));
    EXPECT_EQ(h.registry.visible_clusters(), (VisibleSet{1, 5, 7}));
    EXPECT_EQ(h.position(7, 7), Vec3(-3, -3, 0));
}

TEST_F(ViewSynchronizerTest, FinalSceneIsOrderIndependent) {
    Harness stepwise{make_bushy_tree()};
    ASSERT_TRUE(stepwise.sync.request_focus(2).success);
    ASSERT_TRUE(stepwise.sync.request_focus(5).success);
    ASSERT_TRUE(stepwise.sync.request_focus(3).success);
    ASSERT_TRUE(stepwise.sync.request_focus(4).success);

    ASSERT_TRUE(h.sync.request_focus(4).success);

    EXPECT_EQ(stepwise.enabled_positions(), h.enabled_positions());
    EXPECT_EQ(stepwise.registry.visible_clusters(), h.registry.visible_clusters());
    EXPECT_EQ(stepwise.registry.stats().node_instances, h.registry.stats().node_instances);
}

TEST_F(ViewSynchronizerTest, EveryChainNodeVisibleAtItsFocalInstance) {
    ASSERT_TRUE(h.sync.request_focus(4).success);
    for (NodeId id : {1, 2, 3, 4}) {
        size_t enabled = 0;
        for (const auto* inst : h.registry.instances_of_node(id)) {
            if (inst->enabled) {
                enabled++;
                EXPECT_TRUE(inst->key.is_focal()) << inst->key.to_string();
            }
        }
        EXPECT_EQ(enabled, 1u) << "node " << id;
    }
}

TEST_F(ViewSynchronizerTest, LabelsAndCameraFollowPass) {
    SyncResult result = h.sync.request_focus(2);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.labels.labels_enabled, h.registry.enabled_node_instances().size());
    EXPECT_EQ(h.recorder.count_live(PrimitiveKind::Plane), h.registry.stats().labels);

    FramingBox box = CameraFramer::compute_box(h.registry);
    EXPECT_EQ(h.camera.goal().target, box.center());
}

TEST_F(ViewSynchronizerTest, RefocusingCompleteFocusIsUnchanged) {
    ASSERT_TRUE(h.sync.request_focus(3).success);
    size_t fetches = h.provider.fetch_count();

    SyncResult result = h.sync.request_focus(3);
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.unchanged);
    EXPECT_EQ(result.chain, (std::vector<NodeId>{3, 2, 1}));
    EXPECT_EQ(h.provider.fetch_count(), fetches);
    EXPECT_TRUE(h.sync.history().empty());
}

// ==========================================
// Failure Tests
// ==========================================

TEST_F(ViewSynchronizerTest, ChainFailureLeavesSceneUntouched) {
    ASSERT_TRUE(h.sync.request_focus(2).success);
    VisibleSet before = h.registry.visible_clusters();
    size_t instances = h.registry.stats().node_instances;

    h.provider.fail_node(3);
    SyncResult result = h.sync.request_focus(4);

    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error_kind.has_value());
    EXPECT_EQ(*result.error_kind, FetchErrorKind::TransientFailure);
    EXPECT_EQ(h.registry.visible_clusters(), before);
    EXPECT_EQ(h.registry.stats().node_instances, instances);
    EXPECT_EQ(h.sync.current_focus(), 2);
    EXPECT_FALSE(h.sync.is_syncing());
}

TEST_F(ViewSynchronizerTest, UnknownFocusIsNotFound) {
    SyncResult result = h.sync.request_focus(42);
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error_kind.has_value());
    EXPECT_EQ(*result.error_kind, FetchErrorKind::NotFound);
    EXPECT_FALSE(h.sync.current_focus().has_value());
}

TEST_F(ViewSynchronizerTest, ClusterFailureIsIsolated) {
    h.provider.fail_view(3);
    SyncResult result = h.sync.request_focus(4);

    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error_kind.has_value());
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].cluster_id, 3);
    EXPECT_EQ(result.failures[0].kind, FetchErrorKind::TransientFailure);

    EXPECT_FALSE(h.registry.is_created(3));
    EXPECT_TRUE(h.registry.is_created(4));
    EXPECT_TRUE(h.registry.is_created(2));
    // 3 left the visible set, so the 3->4 edge is not stretched
    EXPECT_FALSE(h.registry.is_visible(3));
    EXPECT_EQ(h.position(4, 4), Vec3(3, 1, 1));
    EXPECT_EQ(h.sync.current_focus(), 4);
}

TEST_F(ViewSynchronizerTest, FailedFocalClusterKeepsNodeOnScreen) {
    ASSERT_TRUE(h.sync.request_focus(2).success);
    ASSERT_TRUE(h.registry.get_node_instance(InstanceKey(2, 3))->enabled);

    h.provider.fail_view(3);
    SyncResult result = h.sync.request_focus(3);
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].cluster_id, 3);

    size_t enabled = 0;
    for (const auto* inst : h.registry.instances_of_node(3)) {
        if (inst->enabled) enabled++;
    }
    EXPECT_EQ(enabled, 1u);
    EXPECT_TRUE(h.registry.get_node_instance(InstanceKey(2, 3))->enabled);
    EXPECT_TRUE(h.registry.get_link_instance(LinkKey(2, 2, 3))->enabled);
    EXPECT_EQ(h.registry.visible_clusters(), (VisibleSet{1, 2}));

    // The next attempt creates the focal cluster and hands the node over to it
    h.provider.heal_node(3);
    ASSERT_TRUE(h.sync.request_focus(3).success);
    EXPECT_TRUE(h.registry.get_node_instance(InstanceKey(3, 3))->enabled);
    EXPECT_FALSE(h.registry.get_node_instance(InstanceKey(2, 3))->enabled);
}

TEST_F(ViewSynchronizerTest, RefocusRetriesFailedCluster) {
    h.provider.fail_view(3);
    ASSERT_FALSE(h.sync.request_focus(4).success);

    h.provider.heal_node(3);
    SyncResult result = h.sync.request_focus(4);
    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.unchanged);
    EXPECT_EQ(result.to_show, (std::vector<NodeId>{3}));
    EXPECT_TRUE(h.registry.is_created(3));
    EXPECT_TRUE(h.registry.get_node_instance(InstanceKey(3, 3))->enabled);
}

TEST_F(ViewSynchronizerTest, ComputeTargetChain) {
    auto chain = h.sync.compute_target_chain(7);
    ASSERT_EQ(chain.size(), 3u);
    EXPECT_EQ(chain[0].id, 7);
    EXPECT_EQ(chain[1].id, 5);
    EXPECT_EQ(chain[2].id, 1);

    EXPECT_THROW(h.sync.compute_target_chain(99), DataFetchError);
}

// ==========================================
// Concurrency Tests
// ==========================================

TEST_F(ViewSynchronizerTest, RequestDuringPassSupersedesIt) {
    bool fired = false;
    SyncResult inner;
    h.provider.set_fetch_hook([&](NodeId) {
        if (!fired) {
            fired = true;
            inner = h.sync.request_focus(7);
        }
    });

    SyncResult result = h.sync.request_focus(4);

    EXPECT_TRUE(inner.queued);
    EXPECT_EQ(inner.focus_id, 7);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.focus_id, 7);
    EXPECT_EQ(result.superseded_passes, 1u);
    EXPECT_EQ(h.sync.current_focus(), 7);
    EXPECT_EQ(h.registry.visible_clusters(), (VisibleSet{1, 5, 7}));
    EXPECT_FALSE(h.registry.is_created(4));
    EXPECT_FALSE(h.registry.is_created(3));
    EXPECT_FALSE(h.sync.is_syncing());
    EXPECT_TRUE(h.registry.layout_is_current());
}

TEST_F(ViewSynchronizerTest, SupersedeBackToCurrentFocusRestoresScene) {
    ASSERT_TRUE(h.sync.request_focus(2).success);
    std::map<InstanceKey, Vec3> before = h.enabled_positions();

    bool fired = false;
    h.provider.set_fetch_hook([&](NodeId id) {
        if (!fired && id == 3) {
            fired = true;
            h.sync.request_focus(2);
        }
    });

    SyncResult result = h.sync.request_focus(3);
    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.unchanged);
    EXPECT_EQ(result.focus_id, 2);
    EXPECT_EQ(result.superseded_passes, 1u);
    EXPECT_EQ(h.sync.current_focus(), 2);

    EXPECT_EQ(h.registry.visible_clusters(), (VisibleSet{1, 2}));
    EXPECT_FALSE(h.registry.is_created(3));
    EXPECT_TRUE(h.registry.get_node_instance(InstanceKey(2, 3))->enabled);
    EXPECT_EQ(h.enabled_positions(), before);
}

TEST_F(ViewSynchronizerTest, NoPassRunsWhileAnotherIsInFlight) {
    bool observed_syncing = false;
    h.provider.set_fetch_hook([&](NodeId) {
        observed_syncing = observed_syncing || h.sync.is_syncing();
    });
    ASSERT_TRUE(h.sync.request_focus(2).success);
    EXPECT_TRUE(observed_syncing);
    EXPECT_FALSE(h.sync.is_syncing());
}

// ==========================================
// History Tests
// ==========================================

TEST_F(ViewSynchronizerTest, GoBackWalksHistory) {
    ASSERT_TRUE(h.sync.focus_root().success);
    ASSERT_TRUE(h.sync.request_focus(2).success);
    ASSERT_TRUE(h.sync.request_focus(3).success);
    EXPECT_EQ(h.sync.history(), (std::vector<NodeId>{1, 2}));

    SyncResult back = h.sync.go_back();
    EXPECT_TRUE(back.success);
    EXPECT_EQ(h.sync.current_focus(), 2);
    EXPECT_EQ(h.sync.history(), (std::vector<NodeId>{1}));

    ASSERT_TRUE(h.sync.go_back().success);
    EXPECT_EQ(h.sync.current_focus(), 1);
    EXPECT_FALSE(h.sync.can_go_back());

    SyncResult empty = h.sync.go_back();
    EXPECT_FALSE(empty.success);
    EXPECT_EQ(empty.error_message, "No navigation history");
}

TEST_F(ViewSynchronizerTest, FailedGoBackKeepsHistory) {
    ASSERT_TRUE(h.sync.request_focus(2).success);
    ASSERT_TRUE(h.sync.request_focus(5).success);

    h.provider.fail_node(2);
    EXPECT_FALSE(h.sync.go_back().success);
    EXPECT_EQ(h.sync.history(), (std::vector<NodeId>{2}));
}

TEST_F(ViewSynchronizerTest, HistoryIsBounded) {
    SyncConfig config;
    config.name_space = "test";
    config.max_history = 2;
    ViewSynchronizer bounded(h.provider, h.registry, h.labels, h.camera, config);

    for (NodeId id : {1, 2, 3, 4, 5}) {
        ASSERT_TRUE(bounded.request_focus(id).success);
    }
    EXPECT_EQ(bounded.history(), (std::vector<NodeId>{3, 4}));
}

TEST(SyncResultTest, JsonShape) {
    SyncResult result;
    result.success = false;
    result.focus_id = 4;
    result.chain = {4, 3};
    result.failures.push_back({3, FetchErrorKind::Malformed, "bad body"});

    auto j = result.to_json();
    EXPECT_EQ(j["focus_id"], 4);
    EXPECT_EQ(j["chain"].size(), 2u);
    EXPECT_EQ(j["failures"][0]["kind"], "malformed");
    EXPECT_FALSE(j.contains("error_kind"));
}
