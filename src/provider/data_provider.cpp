#include "provider/data_provider.hpp"
#include <iostream>

namespace cv {

std::string fetch_error_kind_to_string(FetchErrorKind kind) {
    switch (kind) {
        case FetchErrorKind::NotFound: return "not_found";
        case FetchErrorKind::TransientFailure: return "transient_failure";
        case FetchErrorKind::Malformed: return "malformed";
        default: return "unknown";
    }
}

// ============================================================================
// In-memory Provider
// ============================================================================

InMemoryDataProvider::InMemoryDataProvider(ClusterTree tree) : tree_(std::move(tree)) {}

const ClusterNode& InMemoryDataProvider::lookup(const std::string& name_space, NodeId node_id) const {
    if (!tree_.name_space().empty() && !name_space.empty() && name_space != tree_.name_space()) {
        throw DataFetchError(FetchErrorKind::NotFound, node_id,
                             "Unknown namespace '" + name_space + "'");
    }

    const ClusterNode* node = tree_.get_node(node_id);
    if (!node) {
        throw DataFetchError(FetchErrorKind::NotFound, node_id,
                             "Cluster node " + std::to_string(node_id) + " not found");
    }
    return *node;
}

NodeView InMemoryDataProvider::get_node_view(const std::string& name_space, NodeId node_id) {
    fetch_count_++;
    if (fetch_hook_) {
        fetch_hook_(node_id);
    }

    for (const auto* failing : {&failing_nodes_, &failing_views_}) {
        auto it = failing->find(node_id);
        if (it != failing->end()) {
            throw DataFetchError(it->second, node_id,
                                 "Injected " + fetch_error_kind_to_string(it->second) +
                                 " for node " + std::to_string(node_id));
        }
    }

    const ClusterNode& node = lookup(name_space, node_id);

    NodeView view;
    view.node = node;
    view.children = tree_.get_children(node_id);
    if (node.parent_id) {
        if (const ClusterNode* parent = tree_.get_node(*node.parent_id)) {
            view.parent = *parent;
        }
    }
    return view;
}

ClusterNode InMemoryDataProvider::get_node(const std::string& name_space, NodeId node_id) {
    auto it = failing_nodes_.find(node_id);
    if (it != failing_nodes_.end()) {
        throw DataFetchError(it->second, node_id,
                             "Injected " + fetch_error_kind_to_string(it->second) +
                             " for node " + std::to_string(node_id));
    }
    return lookup(name_space, node_id);
}

ClusterNode InMemoryDataProvider::get_root_node(const std::string& name_space) {
    const ClusterNode* root = tree_.get_node(tree_.root_id());
    if (!root) {
        throw DataFetchError(FetchErrorKind::NotFound, 0,
                             "Root node not found for namespace '" + name_space + "'");
    }
    return *root;
}

void InMemoryDataProvider::fail_node(NodeId node_id, FetchErrorKind kind) {
    failing_nodes_[node_id] = kind;
}

void InMemoryDataProvider::fail_view(NodeId node_id, FetchErrorKind kind) {
    failing_views_[node_id] = kind;
}

void InMemoryDataProvider::heal_node(NodeId node_id) {
    failing_nodes_.erase(node_id);
    failing_views_.erase(node_id);
}

// ============================================================================
// Caching Decorator
// ============================================================================

CachingDataProvider::CachingDataProvider(std::unique_ptr<DataProvider> inner, std::chrono::seconds ttl)
    : inner_(std::move(inner)), ttl_(ttl), now_([]() { return Clock::now(); }) {}

bool CachingDataProvider::fresh(Clock::time_point stored_at) const {
    return now_() - stored_at < ttl_;
}

namespace {

template<typename Map, typename Fresh>
size_t erase_stale(Map& entries, const Fresh& fresh) {
    size_t removed = 0;
    for (auto it = entries.begin(); it != entries.end();) {
        if (fresh(it->second.stored_at)) {
            ++it;
        } else {
            it = entries.erase(it);
            removed++;
        }
    }
    return removed;
}

} // anonymous namespace

size_t CachingDataProvider::evict_expired() {
    auto is_fresh = [this](Clock::time_point stored_at) { return fresh(stored_at); };
    return erase_stale(views_, is_fresh) + erase_stale(nodes_, is_fresh) + erase_stale(roots_, is_fresh);
}

NodeView CachingDataProvider::get_node_view(const std::string& name_space, NodeId node_id) {
    auto key = std::make_pair(name_space, node_id);
    auto it = views_.find(key);
    if (it != views_.end() && fresh(it->second.stored_at)) {
        hits_++;
        return it->second.value;
    }

    evict_expired();

    // Throws through on failure, leaving the cache untouched
    NodeView view = inner_->get_node_view(name_space, node_id);
    views_[key] = Entry<NodeView>{view, now_()};
    return view;
}

ClusterNode CachingDataProvider::get_node(const std::string& name_space, NodeId node_id) {
    auto key = std::make_pair(name_space, node_id);
    auto view_it = views_.find(key);
    if (view_it != views_.end() && fresh(view_it->second.stored_at)) {
        hits_++;
        return view_it->second.value.node;
    }
    auto it = nodes_.find(key);
    if (it != nodes_.end() && fresh(it->second.stored_at)) {
        hits_++;
        return it->second.value;
    }

    evict_expired();
    ClusterNode node = inner_->get_node(name_space, node_id);
    nodes_[key] = Entry<ClusterNode>{node, now_()};
    return node;
}

ClusterNode CachingDataProvider::get_root_node(const std::string& name_space) {
    auto it = roots_.find(name_space);
    if (it != roots_.end() && fresh(it->second.stored_at)) {
        hits_++;
        return it->second.value;
    }

    evict_expired();
    ClusterNode root = inner_->get_root_node(name_space);
    roots_[name_space] = Entry<ClusterNode>{root, now_()};
    return root;
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<DataProvider> DataProviderFactory::create(
    const ProviderConfig& config,
    const std::string& tree_path
) {
    std::unique_ptr<DataProvider> provider;
    if (!tree_path.empty()) {
        if (config.verbose) {
            std::cout << "[provider] Loading tree from " << tree_path << std::endl;
        }
        provider = std::make_unique<InMemoryDataProvider>(ClusterTree::load_from_json(tree_path));
    } else {
        if (config.verbose) {
            std::cout << "[provider] Using HTTP API at " << config.api_base_url << std::endl;
        }
        provider = std::make_unique<HttpDataProvider>(config);
    }

    if (config.cache_ttl_seconds > 0) {
        provider = std::make_unique<CachingDataProvider>(
            std::move(provider), std::chrono::seconds(config.cache_ttl_seconds));
    }
    return provider;
}

} // namespace cv
