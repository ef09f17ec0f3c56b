#pragma once

#include "tree/cluster_node.hpp"
#include "tree/cluster_tree.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace cv {

// ============================================================================
// Errors
// ============================================================================

enum class FetchErrorKind {
    NotFound,           ///< The node does not exist in the namespace
    TransientFailure,   ///< Network / server failure, worth retrying
    Malformed           ///< The source answered with data that cannot be used
};

std::string fetch_error_kind_to_string(FetchErrorKind kind);

/**
 * @brief Raised by data providers when a node view cannot be produced
 */
class DataFetchError : public std::runtime_error {
public:
    DataFetchError(FetchErrorKind kind, NodeId node_id, const std::string& message)
        : std::runtime_error(message), kind_(kind), node_id_(node_id) {}

    FetchErrorKind kind() const { return kind_; }
    NodeId node_id() const { return node_id_; }
    bool is_retryable() const { return kind_ == FetchErrorKind::TransientFailure; }

private:
    FetchErrorKind kind_;
    NodeId node_id_;
};

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Configuration for data providers
 */
struct ProviderConfig {
    std::string api_base_url = "http://localhost:8000/api";  ///< Backend base URL
    int timeout_seconds = 30;                                  ///< Per-request timeout
    int max_retries = 3;                                       ///< Attempts for transient failures
    int retry_backoff_ms = 1000;                               ///< First backoff, doubled per attempt
    int cache_ttl_seconds = 300;                               ///< 0 disables caching
    bool verbose = false;                                      ///< Enable verbose logging
};

// ============================================================================
// Data Provider Interface
// ============================================================================

/**
 * @brief Source of node/children/parent data for the scene
 *
 * Implementations must be idempotent and side-effect free from the
 * caller's point of view. Every failure is reported as DataFetchError.
 */
class DataProvider {
public:
    virtual ~DataProvider() = default;

    /**
     * @brief Fetch a node together with its children and parent
     *
     * @param name_space Namespace (dataset) the node belongs to
     * @param node_id Node to fetch
     * @throws DataFetchError
     */
    virtual NodeView get_node_view(const std::string& name_space, NodeId node_id) = 0;

    /**
     * @brief Fetch a single node without its neighbourhood
     *
     * @throws DataFetchError
     */
    virtual ClusterNode get_node(const std::string& name_space, NodeId node_id) = 0;

    /**
     * @brief Fetch the root node of a namespace
     *
     * @throws DataFetchError
     */
    virtual ClusterNode get_root_node(const std::string& name_space) = 0;

    virtual std::string get_provider_name() const = 0;
};

// ============================================================================
// In-memory Provider
// ============================================================================

/**
 * @brief Serves node views from a ClusterTree held in memory
 *
 * Supports fault injection: nodes marked with fail_node() or fail_view()
 * raise the given error kind until heal_node() is called. Used by the CLI for offline trees
 * and by tests.
 */
class InMemoryDataProvider : public DataProvider {
public:
    explicit InMemoryDataProvider(ClusterTree tree);

    NodeView get_node_view(const std::string& name_space, NodeId node_id) override;
    ClusterNode get_node(const std::string& name_space, NodeId node_id) override;
    ClusterNode get_root_node(const std::string& name_space) override;
    std::string get_provider_name() const override { return "memory"; }

    /**
     * @brief Make every request for this node fail
     */
    void fail_node(NodeId node_id, FetchErrorKind kind = FetchErrorKind::TransientFailure);

    /**
     * @brief Make only get_node_view() fail for this node
     */
    void fail_view(NodeId node_id, FetchErrorKind kind = FetchErrorKind::TransientFailure);

    void heal_node(NodeId node_id);

    /**
     * @brief Hook invoked at the start of every get_node_view call
     *
     * Lets tests simulate work happening while a fetch is suspended.
     */
    void set_fetch_hook(std::function<void(NodeId)> hook) { fetch_hook_ = std::move(hook); }

    size_t fetch_count() const { return fetch_count_; }
    const ClusterTree& tree() const { return tree_; }

private:
    ClusterTree tree_;
    std::map<NodeId, FetchErrorKind> failing_nodes_;
    std::map<NodeId, FetchErrorKind> failing_views_;
    std::function<void(NodeId)> fetch_hook_;
    size_t fetch_count_ = 0;

    const ClusterNode& lookup(const std::string& name_space, NodeId node_id) const;
};

// ============================================================================
// HTTP Provider
// ============================================================================

/**
 * @brief Fetches node views from the cluster REST API using libcurl
 *
 * Endpoints (relative to api_base_url):
 * - GET /namespace/{ns}/root_node
 * - GET /namespace/{ns}/node_id/{id}
 * - GET /namespace/{ns}/node_id/{id}/children
 * - GET /namespace/{ns}/node_id/{id}/parent   (JSON null when there is none)
 *
 * HTTP 404 maps to NotFound, other transport or status failures to
 * TransientFailure (retried with exponential backoff), unparsable bodies
 * to Malformed.
 */
class HttpDataProvider : public DataProvider {
public:
    explicit HttpDataProvider(const ProviderConfig& config);
    ~HttpDataProvider() override;

    HttpDataProvider(const HttpDataProvider&) = delete;
    HttpDataProvider& operator=(const HttpDataProvider&) = delete;

    NodeView get_node_view(const std::string& name_space, NodeId node_id) override;
    ClusterNode get_node(const std::string& name_space, NodeId node_id) override;
    ClusterNode get_root_node(const std::string& name_space) override;
    std::string get_provider_name() const override { return "http"; }

    const ProviderConfig& get_config() const { return config_; }

private:
    ProviderConfig config_;

    /**
     * @brief GET a URL and parse the body as JSON
     */
    nlohmann::json get_json(const std::string& url, NodeId node_id);

    /**
     * @brief Retry logic for transient failures
     */
    template<typename Func>
    auto retry_call(Func&& func, const std::string& operation_name) -> decltype(func());

    std::string node_url(const std::string& name_space, NodeId node_id) const;
};

// ============================================================================
// Caching Decorator
// ============================================================================

/**
 * @brief Memoizes successful node views for a fixed time-to-live
 *
 * Failures are never cached so that a retry reaches the wrapped provider.
 */
class CachingDataProvider : public DataProvider {
public:
    using Clock = std::chrono::steady_clock;

    CachingDataProvider(std::unique_ptr<DataProvider> inner, std::chrono::seconds ttl);

    NodeView get_node_view(const std::string& name_space, NodeId node_id) override;
    ClusterNode get_node(const std::string& name_space, NodeId node_id) override;
    ClusterNode get_root_node(const std::string& name_space) override;
    std::string get_provider_name() const override { return "cached:" + inner_->get_provider_name(); }

    void clear() { views_.clear(); nodes_.clear(); roots_.clear(); }
    size_t size() const { return views_.size(); }
    size_t total_entries() const { return views_.size() + nodes_.size() + roots_.size(); }

    /**
     * @brief Drop every entry older than the time-to-live
     *
     * Runs on each cache miss, so expired entries never outlive the next fetch.
     *
     * @return Number of entries removed
     */
    size_t evict_expired();
    size_t hits() const { return hits_; }

    /**
     * @brief Override the clock (tests)
     */
    void set_clock(std::function<Clock::time_point()> now) { now_ = std::move(now); }

private:
    template<typename T>
    struct Entry {
        T value;
        Clock::time_point stored_at;
    };

    std::unique_ptr<DataProvider> inner_;
    std::chrono::seconds ttl_;
    std::map<std::pair<std::string, NodeId>, Entry<NodeView>> views_;
    std::map<std::pair<std::string, NodeId>, Entry<ClusterNode>> nodes_;
    std::map<std::string, Entry<ClusterNode>> roots_;
    std::function<Clock::time_point()> now_;
    size_t hits_ = 0;

    bool fresh(Clock::time_point stored_at) const;
};

// ============================================================================
// Factory
// ============================================================================

class DataProviderFactory {
public:
    /**
     * @brief Create a provider
     *
     * @param config Provider configuration
     * @param tree_path If non-empty, serve from this JSON tree file instead of HTTP
     * @return Provider, wrapped in a cache when config.cache_ttl_seconds > 0
     */
    static std::unique_ptr<DataProvider> create(
        const ProviderConfig& config,
        const std::string& tree_path = ""
    );
};

} // namespace cv
