#include <gtest/gtest.h>
#include "provider/data_provider.hpp"
#include "test_trees.hpp"
#include <cstdio>

using namespace cv;
using namespace cv::testing_trees;

class InMemoryProviderTest : public ::testing::Test {
protected:
    InMemoryDataProvider provider{make_bushy_tree()};
};

// ==========================================
// In-memory Provider Tests
// ==========================================

TEST_F(InMemoryProviderTest, NodeViewHasChildrenAndParent) {
    NodeView view = provider.get_node_view("test", 2);
    EXPECT_EQ(view.node.id, 2);
    ASSERT_EQ(view.children.size(), 2u);
    EXPECT_EQ(view.children[0].id, 3);
    EXPECT_EQ(view.children[1].id, 6);
    ASSERT_TRUE(view.parent.has_value());
    EXPECT_EQ(view.parent->id, 1);
}

TEST_F(InMemoryProviderTest, RootViewHasNoParent) {
    NodeView view = provider.get_node_view("test", 1);
    EXPECT_FALSE(view.parent.has_value());
    EXPECT_EQ(provider.get_root_node("test").id, 1);
}

TEST_F(InMemoryProviderTest, UnknownNodeIsNotFound) {
    try {
        provider.get_node_view("test", 99);
        FAIL() << "Expected DataFetchError";
    } catch (const DataFetchError& e) {
        EXPECT_EQ(e.kind(), FetchErrorKind::NotFound);
        EXPECT_EQ(e.node_id(), 99);
        EXPECT_FALSE(e.is_retryable());
    }
}

TEST_F(InMemoryProviderTest, UnknownNamespaceIsNotFound) {
    EXPECT_THROW(provider.get_node("other", 1), DataFetchError);
}

TEST_F(InMemoryProviderTest, InjectedFailureUntilHealed) {
    provider.fail_node(3);
    try {
        provider.get_node_view("test", 3);
        FAIL() << "Expected DataFetchError";
    } catch (const DataFetchError& e) {
        EXPECT_EQ(e.kind(), FetchErrorKind::TransientFailure);
        EXPECT_TRUE(e.is_retryable());
    }
    EXPECT_THROW(provider.get_node("test", 3), DataFetchError);

    provider.heal_node(3);
    EXPECT_EQ(provider.get_node_view("test", 3).node.id, 3);
}

TEST_F(InMemoryProviderTest, ViewFailureLeavesNodeLookupWorking) {
    provider.fail_view(2, FetchErrorKind::Malformed);
    EXPECT_EQ(provider.get_node("test", 2).id, 2);
    EXPECT_THROW(provider.get_node_view("test", 2), DataFetchError);
}

TEST_F(InMemoryProviderTest, FetchHookAndCount) {
    std::vector<NodeId> seen;
    provider.set_fetch_hook([&](NodeId id) { seen.push_back(id); });
    provider.get_node_view("test", 1);
    provider.get_node_view("test", 5);
    EXPECT_EQ(seen, (std::vector<NodeId>{1, 5}));
    EXPECT_EQ(provider.fetch_count(), 2u);
}

// ==========================================
// Caching Provider Tests
// ==========================================

class CachingProviderTest : public ::testing::Test {
protected:
    InMemoryDataProvider* inner = nullptr;
    std::unique_ptr<CachingDataProvider> cache;
    CachingDataProvider::Clock::time_point now = CachingDataProvider::Clock::now();

    void SetUp() override {
        auto memory = std::make_unique<InMemoryDataProvider>(make_bushy_tree());
        inner = memory.get();
        cache = std::make_unique<CachingDataProvider>(std::move(memory), std::chrono::seconds(300));
        cache->set_clock([this]() { return now; });
    }
};

TEST_F(CachingProviderTest, SecondFetchIsServedFromCache) {
    cache->get_node_view("test", 2);
    cache->get_node_view("test", 2);
    EXPECT_EQ(inner->fetch_count(), 1u);
    EXPECT_EQ(cache->hits(), 1u);
    EXPECT_EQ(cache->size(), 1u);
}

TEST_F(CachingProviderTest, EntriesExpireAfterTtl) {
    cache->get_node_view("test", 2);
    now += std::chrono::seconds(301);
    cache->get_node_view("test", 2);
    EXPECT_EQ(inner->fetch_count(), 2u);
}

TEST_F(CachingProviderTest, ExpiredEntriesAreEvictedOnMiss) {
    cache->get_node_view("test", 2);
    cache->get_node("test", 5);
    cache->get_root_node("test");
    EXPECT_EQ(cache->total_entries(), 3u);

    now += std::chrono::seconds(301);
    cache->get_node_view("test", 3);
    EXPECT_EQ(cache->total_entries(), 1u);
    EXPECT_EQ(cache->size(), 1u);

    now += std::chrono::seconds(100);
    EXPECT_EQ(cache->evict_expired(), 0u);
    now += std::chrono::seconds(201);
    EXPECT_EQ(cache->evict_expired(), 1u);
    EXPECT_EQ(cache->total_entries(), 0u);
}

TEST_F(CachingProviderTest, FailuresAreNotCached) {
    inner->fail_node(3);
    EXPECT_THROW(cache->get_node_view("test", 3), DataFetchError);
    EXPECT_EQ(cache->size(), 0u);

    inner->heal_node(3);
    EXPECT_EQ(cache->get_node_view("test", 3).node.id, 3);
}

TEST_F(CachingProviderTest, NodeLookupReusesCachedView) {
    cache->get_node_view("test", 4);
    EXPECT_EQ(cache->get_node("test", 4).id, 4);
    EXPECT_EQ(cache->hits(), 1u);
}

TEST_F(CachingProviderTest, ClearDropsEverything) {
    cache->get_node_view("test", 1);
    cache->get_root_node("test");
    cache->clear();
    EXPECT_EQ(cache->size(), 0u);
    cache->get_node_view("test", 1);
    EXPECT_EQ(inner->fetch_count(), 2u);
}

TEST_F(CachingProviderTest, ProviderName) {
    EXPECT_EQ(cache->get_provider_name(), "cached:memory");
}

// ==========================================
// Factory Tests
// ==========================================

TEST(DataProviderFactoryTest, TreeFileGivesCachedMemoryProvider) {
    std::string path = ::testing::TempDir() + "clusterview_factory_tree.json";
    make_chain_tree().save_to_json(path);

    ProviderConfig config;
    auto provider = DataProviderFactory::create(config, path);
    EXPECT_EQ(provider->get_provider_name(), "cached:memory");
    EXPECT_EQ(provider->get_node_view("test", 4).parent->id, 3);

    config.cache_ttl_seconds = 0;
    EXPECT_EQ(DataProviderFactory::create(config, path)->get_provider_name(), "memory");

    std::remove(path.c_str());
}

TEST(DataProviderFactoryTest, NoTreeGivesHttpProvider) {
    ProviderConfig config;
    config.cache_ttl_seconds = 0;
    auto provider = DataProviderFactory::create(config);
    EXPECT_EQ(provider->get_provider_name(), "http");
}

TEST(FetchErrorKindTest, Names) {
    EXPECT_EQ(fetch_error_kind_to_string(FetchErrorKind::NotFound), "not_found");
    EXPECT_EQ(fetch_error_kind_to_string(FetchErrorKind::TransientFailure), "transient_failure");
    EXPECT_EQ(fetch_error_kind_to_string(FetchErrorKind::Malformed), "malformed");
}
