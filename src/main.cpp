#include "cli/cli.hpp"
#include "config/viewer_config.hpp"
#include "provider/data_provider.hpp"
#include "scene/camera_framer.hpp"
#include "scene/cluster_registry.hpp"
#include "scene/label_synchronizer.hpp"
#include "scene/scene_recorder.hpp"
#include "sync/view_synchronizer.hpp"
#include "tree/cluster_tree.hpp"
#include <iostream>
#include <memory>

using namespace cv;

// ============== Helper Functions ==============

// Load config and apply command-line overrides shared by all commands
ViewerConfig load_config(const ParsedOptions& args) {
    ViewerConfig config = ViewerConfig::load(args.text("config"));
    if (args.has("namespace")) {
        config.name_space = args.text("namespace");
    }
    if (args.has("api")) {
        config.api_base_url = args.text("api");
    }
    if (args.has("verbose")) {
        config.verbose = true;
    }
    return config;
}

void print_pass(const SyncResult& result) {
    std::cout << "Focus " << result.focus_id << ": ";
    if (result.error_kind) {
        std::cout << "FAILED (" << fetch_error_kind_to_string(*result.error_kind) << ") "
                  << result.error_message << "\n";
        return;
    }
    if (result.unchanged) {
        std::cout << "unchanged\n";
        return;
    }

    std::cout << "chain [";
    for (size_t i = 0; i < result.chain.size(); ++i) {
        std::cout << (i ? ", " : "") << result.chain[i];
    }
    std::cout << "], " << result.to_show.size() << " shown, "
              << result.to_hide.size() << " hidden, "
              << result.instances_swept << " swept\n";

    for (const auto& failure : result.failures) {
        std::cout << "  cluster " << failure.cluster_id << " failed ("
                  << fetch_error_kind_to_string(failure.kind) << "): " << failure.message << "\n";
    }
}

// ============== clusterview navigate ==============
int cmd_navigate(const ParsedOptions& args) {
    ViewerConfig config = load_config(args);
    std::string tree_path = args.text("tree");
    std::vector<NodeId> focus_ids = args.nodes("focus");
    int back_steps = args.count("back");
    double settle = args.seconds("settle");

    auto provider = DataProviderFactory::create(config.provider_config(), tree_path);

    SceneRecorder recorder;
    ClusterRegistry registry(recorder, config.registry_config());
    LabelSynchronizer labels(config.label_config());
    CameraFramer camera(config.camera_config());
    ViewSynchronizer sync(*provider, registry, labels, camera, config.sync_config());

    int failures = 0;

    if (focus_ids.empty()) {
        SyncResult result = sync.focus_root();
        print_pass(result);
        if (!result.success) failures++;
    }
    for (NodeId id : focus_ids) {
        SyncResult result = sync.request_focus(id);
        print_pass(result);
        if (!result.success) failures++;
    }
    for (int i = 0; i < back_steps && sync.can_go_back(); ++i) {
        SyncResult result = sync.go_back();
        print_pass(result);
        if (!result.success) failures++;
    }

    // Let the camera ease toward its goal at 60 fps
    for (double t = 0.0; t < settle; t += 1.0 / 60.0) {
        camera.tick(1.0 / 60.0);
    }
    recorder.set_camera(camera.current().position(), camera.current().target);

    auto stats = registry.stats();
    std::cout << "\nScene:\n";
    std::cout << "  Visible clusters: " << stats.visible_clusters << "\n";
    std::cout << "  Node instances: " << stats.node_instances
              << " (" << stats.enabled_node_instances << " enabled)\n";
    std::cout << "  Link instances: " << stats.link_instances
              << " (" << stats.enabled_link_instances << " enabled)\n";
    std::cout << "  Labels: " << stats.labels << "\n";
    std::cout << "  Live primitives: " << recorder.num_live() << "\n";

    const auto& diag = registry.diagnostics();
    if (diag.invariant_violations > 0 || diag.degraded_positions > 0) {
        std::cout << "  Invariant violations: " << diag.invariant_violations << "\n";
        std::cout << "  Degraded positions: " << diag.degraded_positions << "\n";
    }

    if (args.has("json")) {
        std::string json_path = args.text("json");
        recorder.save_to_json(json_path);
        std::cout << "\nScene JSON written to: " << json_path << "\n";
    }
    if (args.has("html")) {
        std::string html_path = args.text("html");
        recorder.export_html(html_path, args.text("title"));
        std::cout << "Scene HTML written to: " << html_path << "\n";
    }

    return failures == 0 ? 0 : 2;
}

// ============== clusterview chain ==============
int cmd_chain(const ParsedOptions& args) {
    ViewerConfig config = load_config(args);
    NodeId node_id = args.node("node");

    auto provider = DataProviderFactory::create(config.provider_config(), args.text("tree"));

    SceneRecorder recorder;
    ClusterRegistry registry(recorder, config.registry_config());
    LabelSynchronizer labels(config.label_config());
    CameraFramer camera(config.camera_config());
    ViewSynchronizer sync(*provider, registry, labels, camera, config.sync_config());

    std::vector<ClusterNode> chain;
    try {
        chain = sync.compute_target_chain(node_id);
    } catch (const DataFetchError& e) {
        std::cerr << "Error (" << fetch_error_kind_to_string(e.kind()) << "): " << e.what() << "\n";
        return 1;
    }

    std::cout << "Ancestor chain of node " << node_id << ":\n";
    for (const auto& node : chain) {
        std::cout << "  [" << node.depth << "] " << node.id << "  " << node.label << "\n";
    }
    return 0;
}

// ============== clusterview stats ==============
int cmd_stats(const ParsedOptions& args) {
    std::string input_path = args.text("tree");

    std::cout << "Loading cluster tree from: " << input_path << "\n";
    ClusterTree tree = ClusterTree::load_from_json(input_path);

    auto stats = tree.compute_statistics();

    std::cout << "\nCluster Tree Statistics:\n";
    if (!tree.name_space().empty()) {
        std::cout << "  Namespace: " << tree.name_space() << "\n";
    }
    std::cout << "  Root: " << tree.root_id() << "\n";
    std::cout << "  Nodes: " << stats.num_nodes << "\n";
    std::cout << "  Leaves: " << stats.num_leaves << "\n";
    std::cout << "  Max depth: " << stats.max_depth << "\n";
    std::cout << "  Avg branching: " << stats.avg_branching << "\n";
    std::cout << "  Max branching: " << stats.max_branching << "\n";
    std::cout << "  Fallback centroids: " << stats.num_fallback_centroids << "\n";

    return 0;
}

int main(int argc, char** argv) {
    CommandLine cli("clusterview", "1.0.0");

    std::vector<Option> navigate_options = data_source_options();
    navigate_options.insert(navigate_options.end(), {
        {"focus", 'f', OptionKind::NodeList, "Node ids to focus in order (default: root)", "", false},
        {"back", 'b', OptionKind::Count, "Number of go-back steps after the focus sequence", "0", false},
        {"settle", 's', OptionKind::Seconds, "Seconds of camera easing to simulate", "2.0", false},
        {"json", 'j', OptionKind::Path, "Write the final scene as JSON", "", false},
        {"html", 'o', OptionKind::Path, "Write the final scene as an HTML page", "", false},
        {"title", 'T', OptionKind::Text, "Title for the HTML page", "Cluster View", false}
    });
    cli.add({"navigate", "Apply a sequence of focus changes and report the resulting scene",
             navigate_options, cmd_navigate});

    std::vector<Option> chain_options = data_source_options();
    chain_options.insert(chain_options.begin(),
                         Option{"node", 'i', OptionKind::Node, "Node id", "", true});
    cli.add({"chain", "Print the ancestor chain of a node", chain_options, cmd_chain});

    cli.add({"stats", "Print statistics about a cluster tree file",
             {{"tree", 't', OptionKind::Path, "Cluster tree JSON file", "", true}},
             cmd_stats});

    return cli.run(argc, argv);
}
