#include "scene/scene_recorder.hpp"
#include <fstream>
#include <stdexcept>

namespace cv {

std::string primitive_kind_to_string(PrimitiveKind kind) {
    switch (kind) {
        case PrimitiveKind::Sphere: return "sphere";
        case PrimitiveKind::Cylinder: return "cylinder";
        case PrimitiveKind::Plane: return "plane";
        case PrimitiveKind::Group: return "group";
        default: return "unknown";
    }
}

nlohmann::json RecordedPrimitive::to_json() const {
    nlohmann::json j;
    j["handle"] = handle;
    j["kind"] = primitive_kind_to_string(kind);
    j["name"] = name;
    j["parent"] = parent;
    j["position"] = position.to_json();
    j["enabled"] = enabled;
    if (!text.empty()) {
        j["text"] = text;
    }
    return j;
}

// ==========================================
// Creation
// ==========================================

PrimitiveHandle SceneRecorder::create(PrimitiveKind kind, const std::string& name,
                                      double width, double height) {
    RecordedPrimitive p;
    p.handle = next_handle_++;
    p.kind = kind;
    p.name = name;
    p.width = width;
    p.height = height;
    primitives_[p.handle] = p;
    created_count_++;
    return p.handle;
}

PrimitiveHandle SceneRecorder::create_sphere(const std::string& name, double diameter) {
    return create(PrimitiveKind::Sphere, name, diameter, diameter);
}

PrimitiveHandle SceneRecorder::create_cylinder(const std::string& name, double diameter) {
    return create(PrimitiveKind::Cylinder, name, diameter, 1.0);
}

PrimitiveHandle SceneRecorder::create_plane(const std::string& name, double width, double height) {
    return create(PrimitiveKind::Plane, name, width, height);
}

PrimitiveHandle SceneRecorder::create_group(const std::string& name) {
    return create(PrimitiveKind::Group, name, 0.0, 0.0);
}

// ==========================================
// Mutation
// ==========================================

RecordedPrimitive& SceneRecorder::require(PrimitiveHandle handle, const char* operation) {
    auto it = primitives_.find(handle);
    if (it == primitives_.end()) {
        throw std::runtime_error(std::string(operation) + ": unknown primitive handle " +
                                 std::to_string(handle));
    }
    return it->second;
}

const RecordedPrimitive& SceneRecorder::require(PrimitiveHandle handle, const char* operation) const {
    auto it = primitives_.find(handle);
    if (it == primitives_.end()) {
        throw std::runtime_error(std::string(operation) + ": unknown primitive handle " +
                                 std::to_string(handle));
    }
    return it->second;
}

void SceneRecorder::set_parent(PrimitiveHandle handle, PrimitiveHandle parent) {
    RecordedPrimitive& p = require(handle, "set_parent");
    if (parent != INVALID_PRIMITIVE) {
        require(parent, "set_parent");
    }
    p.parent = parent;
}

void SceneRecorder::set_position(PrimitiveHandle handle, const Vec3& position) {
    require(handle, "set_position").position = position;
}

void SceneRecorder::set_enabled(PrimitiveHandle handle, bool enabled) {
    require(handle, "set_enabled").enabled = enabled;
}

void SceneRecorder::orient_towards(PrimitiveHandle handle, const Vec3& from, const Vec3& to) {
    RecordedPrimitive& p = require(handle, "orient_towards");
    p.from = from;
    p.to = to;
    p.height = from.distance_to(to);
}

void SceneRecorder::set_text(PrimitiveHandle handle, const std::vector<std::string>& lines) {
    require(handle, "set_text").text = lines;
}

void SceneRecorder::dispose(PrimitiveHandle handle) {
    require(handle, "dispose");
    primitives_.erase(handle);
    disposed_count_++;
}

// ==========================================
// Read-back
// ==========================================

bool SceneRecorder::is_enabled(PrimitiveHandle handle) const {
    return require(handle, "is_enabled").enabled;
}

Vec3 SceneRecorder::get_position(PrimitiveHandle handle) const {
    return require(handle, "get_position").position;
}

const RecordedPrimitive* SceneRecorder::get(PrimitiveHandle handle) const {
    auto it = primitives_.find(handle);
    return it != primitives_.end() ? &it->second : nullptr;
}

Vec3 SceneRecorder::world_position(PrimitiveHandle handle) const {
    Vec3 result;
    const RecordedPrimitive* p = get(handle);
    while (p) {
        result += p->position;
        p = p->parent != INVALID_PRIMITIVE ? get(p->parent) : nullptr;
    }
    return result;
}

bool SceneRecorder::is_effectively_enabled(PrimitiveHandle handle) const {
    const RecordedPrimitive* p = get(handle);
    if (!p) return false;
    while (p) {
        if (!p->enabled) return false;
        p = p->parent != INVALID_PRIMITIVE ? get(p->parent) : nullptr;
    }
    return true;
}

size_t SceneRecorder::count_live(PrimitiveKind kind) const {
    size_t count = 0;
    for (const auto& [handle, p] : primitives_) {
        if (p.kind == kind) count++;
    }
    return count;
}

void SceneRecorder::set_camera(const Vec3& position, const Vec3& target) {
    camera_position_ = position;
    camera_target_ = target;
}

// ==========================================
// Export
// ==========================================

nlohmann::json SceneRecorder::to_json() const {
    nlohmann::json nodes = nlohmann::json::array();
    nlohmann::json links = nlohmann::json::array();
    nlohmann::json labels = nlohmann::json::array();

    for (const auto& [handle, p] : primitives_) {
        if (!is_effectively_enabled(handle)) continue;

        switch (p.kind) {
            case PrimitiveKind::Sphere: {
                nlohmann::json n;
                n["name"] = p.name;
                n["position"] = world_position(handle).to_json();
                n["diameter"] = p.width;
                nodes.push_back(n);
                break;
            }
            case PrimitiveKind::Cylinder: {
                Vec3 offset = p.parent != INVALID_PRIMITIVE ? world_position(p.parent) : Vec3();
                nlohmann::json l;
                l["name"] = p.name;
                l["from"] = (p.from + offset).to_json();
                l["to"] = (p.to + offset).to_json();
                l["length"] = p.height;
                links.push_back(l);
                break;
            }
            case PrimitiveKind::Plane: {
                nlohmann::json t;
                t["name"] = p.name;
                t["position"] = world_position(handle).to_json();
                t["text"] = p.text;
                labels.push_back(t);
                break;
            }
            case PrimitiveKind::Group:
                break;
        }
    }

    nlohmann::json j;
    j["nodes"] = nodes;
    j["links"] = links;
    j["labels"] = labels;
    j["camera"] = {
        {"position", camera_position_.to_json()},
        {"target", camera_target_.to_json()}
    };
    j["statistics"] = {
        {"live_primitives", primitives_.size()},
        {"created", created_count_},
        {"disposed", disposed_count_}
    };
    return j;
}

void SceneRecorder::save_to_json(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }
    file << to_json().dump(2);
}

void SceneRecorder::export_html(const std::string& filename, const std::string& title) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }

    nlohmann::json scene = to_json();

    file << R"(<!DOCTYPE html>
<html lang="en">
<head>
    <meta charset="UTF-8">
    <meta name="viewport" content="width=device-width, initial-scale=1.0">
    <title>)" << title << R"(</title>
    <style>
        * {
            margin: 0;
            padding: 0;
            box-sizing: border-box;
        }
        body {
            font-family: 'Segoe UI', Tahoma, Geneva, Verdana, sans-serif;
            background: linear-gradient(135deg, #1a1a2e 0%, #16213e 100%);
            color: #eee;
            overflow: hidden;
        }
        #header {
            position: fixed;
            top: 0;
            left: 0;
            right: 0;
            padding: 15px 25px;
            background: rgba(0, 0, 0, 0.4);
            z-index: 100;
            display: flex;
            justify-content: space-between;
            align-items: center;
        }
        #header h1 {
            font-size: 1.5em;
            font-weight: 500;
        }
        #stats {
            font-size: 0.9em;
            opacity: 0.8;
        }
        #view {
            width: 100vw;
            height: 100vh;
            display: block;
        }
        #hint {
            position: fixed;
            bottom: 20px;
            left: 20px;
            background: rgba(0, 0, 0, 0.6);
            padding: 10px 15px;
            border-radius: 10px;
            font-size: 0.85em;
        }
    </style>
</head>
<body>
    <div id="header">
        <h1>)" << title << R"(</h1>
        <div id="stats">)" << scene["nodes"].size() << " nodes &middot; "
         << scene["links"].size() << " links &middot; "
         << scene["labels"].size() << R"( labels</div>
    </div>
    <canvas id="view"></canvas>
    <div id="hint">Drag to rotate &middot; scroll to zoom</div>
    <script>
        const scene = )" << scene.dump() << R"(;

        const canvas = document.getElementById('view');
        const ctx = canvas.getContext('2d');
        const target = scene.camera.target;
        let yaw = 0.6, pitch = 0.4, zoom = 25;
        let dragging = false, lastX = 0, lastY = 0;

        function resize() {
            canvas.width = window.innerWidth;
            canvas.height = window.innerHeight;
            draw();
        }

        function project(p) {
            const x = p[0] - target[0], y = p[1] - target[1], z = p[2] - target[2];
            const cx = Math.cos(yaw) * x - Math.sin(yaw) * z;
            const cz = Math.sin(yaw) * x + Math.cos(yaw) * z;
            const cy = Math.cos(pitch) * y - Math.sin(pitch) * cz;
            const depth = Math.sin(pitch) * y + Math.cos(pitch) * cz + 60;
            const f = 600 / Math.max(depth, 1);
            return [canvas.width / 2 + cx * f * zoom / 25, canvas.height / 2 - cy * f * zoom / 25, depth];
        }

        function draw() {
            ctx.clearRect(0, 0, canvas.width, canvas.height);

            ctx.strokeStyle = 'rgba(79, 195, 247, 0.6)';
            ctx.lineWidth = 1.5;
            for (const l of scene.links) {
                const a = project(l.from), b = project(l.to);
                ctx.beginPath();
                ctx.moveTo(a[0], a[1]);
                ctx.lineTo(b[0], b[1]);
                ctx.stroke();
            }

            const nodes = scene.nodes.map(n => ({ n, p: project(n.position) }));
            nodes.sort((a, b) => b.p[2] - a.p[2]);
            for (const { n, p } of nodes) {
                const r = Math.max(2, 300 * n.diameter / p[2] * zoom / 25);
                ctx.fillStyle = '#ffb74d';
                ctx.beginPath();
                ctx.arc(p[0], p[1], r, 0, 2 * Math.PI);
                ctx.fill();
            }

            ctx.fillStyle = '#eee';
            ctx.font = '12px sans-serif';
            ctx.textAlign = 'center';
            for (const t of scene.labels) {
                const p = project(t.position);
                t.text.forEach((line, i) => ctx.fillText(line, p[0], p[1] + i * 14));
            }
        }

        canvas.addEventListener('mousedown', e => { dragging = true; lastX = e.clientX; lastY = e.clientY; });
        window.addEventListener('mouseup', () => { dragging = false; });
        window.addEventListener('mousemove', e => {
            if (!dragging) return;
            yaw += (e.clientX - lastX) * 0.01;
            pitch = Math.max(-1.5, Math.min(1.5, pitch + (e.clientY - lastY) * 0.01));
            lastX = e.clientX;
            lastY = e.clientY;
            draw();
        });
        canvas.addEventListener('wheel', e => {
            zoom = Math.max(2, Math.min(200, zoom * (e.deltaY < 0 ? 1.1 : 0.9)));
            draw();
        });
        window.addEventListener('resize', resize);
        resize();
    </script>
</body>
</html>
)";
}

} // namespace cv
