#include "provider/data_provider.hpp"
#include <nlohmann/json.hpp>
#include <curl/curl.h>
#include <iostream>
#include <chrono>
#include <thread>
#include <cmath>

using json = nlohmann::json;

namespace cv {

// ============================================================================
// Helper Functions for HTTP Requests
// ============================================================================

namespace {

// CURL write callback
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

// Make HTTP GET request with CURL, mapping failures onto fetch error kinds
std::string http_get(const std::string& url, NodeId node_id, int timeout_seconds) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw DataFetchError(FetchErrorKind::TransientFailure, node_id, "Failed to initialize CURL");
    }

    std::string response;
    struct curl_slist* header_list = curl_slist_append(nullptr, "Accept: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds));

    CURLcode res = curl_easy_perform(curl);

    if (header_list) {
        curl_slist_free_all(header_list);
    }

    if (res != CURLE_OK) {
        std::string error = curl_easy_strerror(res);
        curl_easy_cleanup(curl);
        throw DataFetchError(FetchErrorKind::TransientFailure, node_id,
                             "CURL request failed: " + error);
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    if (http_code == 404) {
        throw DataFetchError(FetchErrorKind::NotFound, node_id, "Not found: " + url);
    }
    if (http_code < 200 || http_code >= 300) {
        throw DataFetchError(
            FetchErrorKind::TransientFailure, node_id,
            "HTTP request failed with code " + std::to_string(http_code) + ": " + response
        );
    }

    return response;
}

} // anonymous namespace

// ============================================================================
// HttpDataProvider
// ============================================================================

HttpDataProvider::HttpDataProvider(const ProviderConfig& config) : config_(config) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    while (!config_.api_base_url.empty() && config_.api_base_url.back() == '/') {
        config_.api_base_url.pop_back();
    }
}

HttpDataProvider::~HttpDataProvider() {
    curl_global_cleanup();
}

std::string HttpDataProvider::node_url(const std::string& name_space, NodeId node_id) const {
    return config_.api_base_url + "/namespace/" + name_space + "/node_id/" + std::to_string(node_id);
}

template<typename Func>
auto HttpDataProvider::retry_call(Func&& func, const std::string& operation_name) -> decltype(func()) {
    int attempts = 0;
    while (true) {
        try {
            return func();
        } catch (const DataFetchError& e) {
            attempts++;
            if (!e.is_retryable() || attempts >= config_.max_retries) {
                throw;
            }

            if (config_.verbose) {
                std::cerr << "Attempt " << attempts << " failed for " << operation_name
                          << ": " << e.what() << ". Retrying..." << std::endl;
            }

            // Exponential backoff
            std::this_thread::sleep_for(std::chrono::milliseconds(
                static_cast<int>(config_.retry_backoff_ms * std::pow(2, attempts - 1))
            ));
        }
    }
}

json HttpDataProvider::get_json(const std::string& url, NodeId node_id) {
    std::string body = http_get(url, node_id, config_.timeout_seconds);
    try {
        return json::parse(body);
    } catch (const json::exception& e) {
        throw DataFetchError(FetchErrorKind::Malformed, node_id,
                             "Invalid JSON from " + url + ": " + e.what());
    }
}

NodeView HttpDataProvider::get_node_view(const std::string& name_space, NodeId node_id) {
    return retry_call([&]() {
        std::string base = node_url(name_space, node_id);
        json node_json = get_json(base, node_id);
        json children_json = get_json(base + "/children", node_id);

        NodeView view;
        try {
            view.node = ClusterNode::from_json(node_json);
            if (!children_json.is_array()) {
                throw DataFetchError(FetchErrorKind::Malformed, node_id,
                                     "Children response for node " + std::to_string(node_id) +
                                     " is not an array");
            }
            for (const auto& c : children_json) {
                view.children.push_back(ClusterNode::from_json(c));
            }
            if (view.node.children.empty()) {
                for (const auto& c : view.children) {
                    view.node.children.push_back(c.id);
                }
            }
        } catch (const json::exception& e) {
            throw DataFetchError(FetchErrorKind::Malformed, node_id,
                                 "Malformed node data for " + std::to_string(node_id) + ": " + e.what());
        }

        if (view.node.parent_id) {
            json parent_json = get_json(base + "/parent", node_id);
            if (!parent_json.is_null()) {
                try {
                    view.parent = ClusterNode::from_json(parent_json);
                } catch (const json::exception& e) {
                    throw DataFetchError(FetchErrorKind::Malformed, node_id,
                                         "Malformed parent data for " + std::to_string(node_id) +
                                         ": " + e.what());
                }
            }
        }

        if (config_.verbose) {
            std::cout << "[provider] Fetched node " << node_id << " with "
                      << view.children.size() << " children" << std::endl;
        }
        return view;
    }, "node " + std::to_string(node_id));
}

ClusterNode HttpDataProvider::get_node(const std::string& name_space, NodeId node_id) {
    return retry_call([&]() {
        json node_json = get_json(node_url(name_space, node_id), node_id);
        try {
            return ClusterNode::from_json(node_json);
        } catch (const json::exception& e) {
            throw DataFetchError(FetchErrorKind::Malformed, node_id,
                                 "Malformed node data for " + std::to_string(node_id) + ": " + e.what());
        }
    }, "node " + std::to_string(node_id));
}

ClusterNode HttpDataProvider::get_root_node(const std::string& name_space) {
    return retry_call([&]() {
        std::string url = config_.api_base_url + "/namespace/" + name_space + "/root_node";
        json root_json = get_json(url, 0);
        try {
            return ClusterNode::from_json(root_json);
        } catch (const json::exception& e) {
            throw DataFetchError(FetchErrorKind::Malformed, 0,
                                 "Malformed root node for namespace '" + name_space + "': " + e.what());
        }
    }, "root node of " + name_space);
}

} // namespace cv
