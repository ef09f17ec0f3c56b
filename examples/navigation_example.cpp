#include "provider/data_provider.hpp"
#include "scene/camera_framer.hpp"
#include "scene/cluster_registry.hpp"
#include "scene/label_synchronizer.hpp"
#include "scene/scene_recorder.hpp"
#include "sync/view_synchronizer.hpp"
#include "tree/cluster_tree.hpp"
#include <iostream>
#include <sys/stat.h>
#include <sys/types.h>

using namespace cv;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

ClusterNode make_cluster(NodeId id, std::optional<NodeId> parent, int depth,
                         const std::string& label, const Vec3& centroid) {
    ClusterNode node;
    node.id = id;
    node.parent_id = parent;
    node.depth = depth;
    node.label = label;
    node.centroid = centroid;
    return node;
}

void print_scene(const ClusterRegistry& registry, const SceneRecorder& recorder) {
    auto stats = registry.stats();
    std::cout << "   Visible clusters:";
    for (NodeId id : registry.visible_clusters()) {
        std::cout << " " << id;
    }
    std::cout << "\n";
    std::cout << "   Enabled nodes: " << stats.enabled_node_instances << " of " << stats.node_instances << "\n";
    std::cout << "   Enabled links: " << stats.enabled_link_instances << " of " << stats.link_instances << "\n";
    std::cout << "   Live primitives: " << recorder.num_live() << "\n";
}

int main() {
    print_separator("Cluster Navigation Example - Focus Changes Over a Topic Tree");

    // Create output directory
    const std::string output_dir = "output_json";
    #ifdef _WIN32
        _mkdir(output_dir.c_str());
    #else
        mkdir(output_dir.c_str(), 0755);
    #endif

    // A small topic hierarchy with centroids relative to each parent
    ClusterTree tree;
    tree.set_namespace("demo");
    tree.add_node(make_cluster(1, std::nullopt, 0, "All research", Vec3(0, 0, 0)));
    tree.add_node(make_cluster(2, 1, 1, "Physical sciences", Vec3(1, 0, 0)));
    tree.add_node(make_cluster(3, 2, 2, "Optics", Vec3(0, 1, 0)));
    tree.add_node(make_cluster(4, 3, 3, "Quantum optics and photonics", Vec3(0, 0, 1)));
    tree.add_node(make_cluster(5, 3, 3, "Laser engineering", Vec3(0, 0, -1)));
    tree.add_node(make_cluster(6, 2, 2, "Condensed matter", Vec3(0, -1, 0)));
    tree.add_node(make_cluster(7, 1, 1, "Life sciences", Vec3(-1, 0, 0)));
    tree.add_node(make_cluster(8, 7, 2, "Genomics", Vec3(0, 1, 1)));
    tree.finalize();

    std::cout << "Built cluster tree with " << tree.num_nodes() << " nodes\n";

    InMemoryDataProvider provider(tree);
    SceneRecorder recorder;
    ClusterRegistry registry(recorder);
    LabelSynchronizer labels;
    CameraFramer camera;

    SyncConfig sync_config;
    sync_config.name_space = "demo";
    ViewSynchronizer sync(provider, registry, labels, camera, sync_config);

    // Step 1: start at the root
    std::cout << "\n1. Focusing the root:\n";
    SyncResult result = sync.focus_root();
    print_scene(registry, recorder);

    // Step 2: dive deep, every ancestor link stretches
    std::cout << "\n2. Focusing 'Quantum optics and photonics' (node 4):\n";
    result = sync.request_focus(4);
    std::cout << "   Chain:";
    for (NodeId id : result.chain) {
        std::cout << " " << id;
    }
    std::cout << "\n";
    print_scene(registry, recorder);

    const NodeInstance* focal = registry.get_node_instance(InstanceKey(4, 4));
    if (focal) {
        std::cout << "   Node 4 sits at (" << focal->position.x << ", "
                  << focal->position.y << ", " << focal->position.z << ")\n";
    }

    // Step 3: jump to another branch
    std::cout << "\n3. Focusing 'Genomics' (node 8):\n";
    result = sync.request_focus(8);
    std::cout << "   Hidden " << result.to_hide.size() << " clusters, swept "
              << result.instances_swept << " instances\n";
    print_scene(registry, recorder);

    // Step 4: back to where we were
    std::cout << "\n4. Going back:\n";
    result = sync.go_back();
    std::cout << "   Focus is now " << result.focus_id << "\n";
    print_scene(registry, recorder);

    // Let the camera settle before exporting
    camera.snap_to_goal();
    recorder.set_camera(camera.current().position(), camera.current().target);

    print_separator("Exporting Scene");

    std::string json_path = output_dir + "/navigation_scene.json";
    std::string html_path = output_dir + "/navigation_scene.html";
    recorder.save_to_json(json_path);
    recorder.export_html(html_path, "Cluster Navigation Example");

    std::cout << "Scene JSON: " << json_path << "\n";
    std::cout << "Scene HTML: " << html_path << "\n";

    return 0;
}
