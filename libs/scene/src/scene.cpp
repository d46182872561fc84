#include "dunetools/scene.h"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cmath>
#include <fstream>
#include <limits>
#include <set>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace dunetools::scene {

namespace {

[[noreturn]] void fail(const std::string& where, const std::string& what) {
    throw SceneError("scene: " + where + ": " + what);
}

std::string at_index(const std::string& where, size_t i) {
    return where + "[" + std::to_string(i) + "]";
}

const json& require_array(const json& parent, const char* key, const std::string& where) {
    if (!parent.contains(key)) fail(where, std::string("missing array field '") + key + "'");
    const auto& j = parent[key];
    if (!j.is_array()) fail(where + "." + key, "must be an array");
    return j;
}

Vec3 parse_vec3(const json& j, const std::string& where) {
    if (!j.is_array() || j.size() != 3) fail(where, "expected [x, y, z]");
    Vec3 v{};
    for (size_t i = 0; i < 3; ++i) {
        if (!j[i].is_number()) fail(where, "coordinates must be numbers");
        v[i] = j[i].get<double>();
        if (!std::isfinite(v[i])) fail(where, "coordinates must be finite");
    }
    return v;
}

uint32_t parse_index(const json& j, const std::string& where) {
    if (!j.is_number_integer() || j.get<int64_t>() < 0 ||
        j.get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
        fail(where, "expected a non-negative integer index");
    }
    return static_cast<uint32_t>(j.get<uint64_t>());
}

std::vector<uint32_t> parse_index_list(const json& j, const std::string& where) {
    if (!j.is_array()) fail(where, "must be an array");
    std::vector<uint32_t> out;
    out.reserve(j.size());
    for (size_t i = 0; i < j.size(); ++i) out.push_back(parse_index(j[i], at_index(where, i)));
    return out;
}

std::string parse_name(const json& j, const std::string& where) {
    if (!j.contains("name") || !j["name"].is_string()) fail(where, "missing string field 'name'");
    auto name = j["name"].get<std::string>();
    if (name.empty()) fail(where, "name must not be empty");
    return name;
}

selection::EditableMesh parse_mesh(const json& mesh_j) {
    const std::string where = "mesh";
    if (!mesh_j.is_object()) fail(where, "must be an object");

    selection::EditableMesh mesh;

    const auto& verts = require_array(mesh_j, "vertices", where);
    for (size_t i = 0; i < verts.size(); ++i) {
        mesh.add_vertex(parse_vec3(verts[i], at_index(where + ".vertices", i)));
    }

    const auto& faces = require_array(mesh_j, "faces", where);
    for (size_t i = 0; i < faces.size(); ++i) {
        const auto fw = at_index(where + ".faces", i);
        try {
            mesh.add_face(parse_index_list(faces[i], fw));
        } catch (const selection::SelectionError& e) {
            fail(fw, e.what());
        }
    }

    const auto& groups = require_array(mesh_j, "groups", where);
    for (size_t i = 0; i < groups.size(); ++i) {
        const auto gw = at_index(where + ".groups", i);
        const auto& g = groups[i];
        if (!g.is_object()) fail(gw, "must be an object");

        selection::VertexGroup group;
        group.name = parse_name(g, gw);
        group.vertices = parse_index_list(require_array(g, "vertices", gw), gw + ".vertices");
        if (g.contains("faces")) group.faces = parse_index_list(g["faces"], gw + ".faces");

        try {
            mesh.add_group(std::move(group));
        } catch (const selection::SelectionError& e) {
            fail(gw, e.what());
        }
    }

    return mesh;
}

markers::Collection parse_collection(const json& j, const std::string& where) {
    if (!j.is_object()) fail(where, "must be an object");

    markers::Collection c;
    c.name = parse_name(j, where);

    if (j.contains("objects")) {
        const auto& objs = require_array(j, "objects", where);
        for (size_t i = 0; i < objs.size(); ++i) {
            const auto ow = at_index(where + ".objects", i);
            if (!objs[i].is_object()) fail(ow, "must be an object");
            markers::MarkerObject obj;
            obj.name = objs[i].value("name", std::string{});
            if (!objs[i].contains("location")) fail(ow, "missing field 'location'");
            obj.location = parse_vec3(objs[i]["location"], ow + ".location");
            c.objects.push_back(std::move(obj));
        }
    }

    if (j.contains("children")) {
        const auto& kids = require_array(j, "children", where);
        for (size_t i = 0; i < kids.size(); ++i) {
            c.children.push_back(parse_collection(kids[i], at_index(where + ".children", i)));
        }
    }

    return c;
}

markers::MarkerHierarchy parse_markers(const json& root) {
    std::vector<markers::Collection> roots;
    if (root.contains("markers")) {
        const auto& arr = require_array(root, "markers", "scene");
        for (size_t i = 0; i < arr.size(); ++i) {
            roots.push_back(parse_collection(arr[i], at_index("markers", i)));
        }
    }
    try {
        return markers::MarkerHierarchy(std::move(roots));
    } catch (const markers::LookupError& e) {
        fail("markers", e.what());
    }
}

json parse_json(std::istream& r, const char* what) {
    try {
        return json::parse(r);
    } catch (const json::parse_error& e) {
        throw SceneError(std::string("scene: invalid ") + what + " JSON: " + e.what());
    }
}

std::ifstream open_input(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        const int err = errno != 0 ? errno : ENOENT;
        throw std::system_error(err, std::generic_category(), "scene: cannot open " + path.string());
    }
    return f;
}

std::set<std::string> parse_name_set(const json& root, const char* key) {
    const auto& arr = require_array(root, key, "terrain");
    std::set<std::string> out;
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr[i].is_string()) fail(at_index(std::string("terrain.") + key, i), "must be a string");
        out.insert(arr[i].get<std::string>());
    }
    return out;
}

} // namespace

Scene read(std::istream& r) {
    const json root = parse_json(r, "scene");
    if (!root.is_object()) fail("scene", "root must be an object");

    Scene scene;
    if (root.contains("schemaVersion")) {
        if (!root["schemaVersion"].is_number_integer()) fail("scene", "schemaVersion must be an integer");
        scene.schema_version = root["schemaVersion"].get<int>();
    }
    if (scene.schema_version != kSchemaVersion)
        fail("scene", "unsupported schemaVersion " + std::to_string(scene.schema_version));

    if (!root.contains("mesh")) fail("scene", "missing object field 'mesh'");
    scene.mesh = parse_mesh(root["mesh"]);
    scene.markers = parse_markers(root);
    return scene;
}

Scene load(const fs::path& path) {
    auto f = open_input(path);
    return read(f);
}

board::TerrainTable read_terrain(std::istream& r) {
    const json root = parse_json(r, "terrain");
    if (!root.is_object()) fail("terrain", "root must be an object");

    auto table = board::TerrainTable::defaults();
    if (root.contains("strongholds")) table.strongholds = parse_name_set(root, "strongholds");
    if (root.contains("rocks")) table.rocks = parse_name_set(root, "rocks");

    const auto both = table.overlap();
    if (!both.empty()) fail("terrain", "\"" + both.front() + "\" is listed as both stronghold and rock");
    return table;
}

board::TerrainTable load_terrain(const fs::path& path) {
    auto f = open_input(path);
    return read_terrain(f);
}

} // namespace dunetools::scene
