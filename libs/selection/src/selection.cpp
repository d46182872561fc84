#include "dunetools/selection.h"

#include <algorithm>
#include <cctype>

namespace dunetools::selection {

// ---------------------------------------------------------------------------
// EditableMesh
// ---------------------------------------------------------------------------

uint32_t EditableMesh::add_vertex(const Vec3& position) {
    vertices_.push_back(position);
    vertex_selected_.push_back(false);
    return static_cast<uint32_t>(vertices_.size() - 1);
}

uint32_t EditableMesh::add_face(Face face) {
    if (face.size() < 3)
        throw SelectionError("selection: face " + std::to_string(faces_.size()) +
                             " has " + std::to_string(face.size()) + " vertices (need at least 3)");
    for (uint32_t v : face) {
        if (v >= vertices_.size())
            throw SelectionError("selection: face " + std::to_string(faces_.size()) +
                                 " references vertex " + std::to_string(v) +
                                 " (mesh has " + std::to_string(vertices_.size()) + ")");
    }
    faces_.push_back(std::move(face));
    face_selected_.push_back(false);
    return static_cast<uint32_t>(faces_.size() - 1);
}

void EditableMesh::add_group(VertexGroup group) {
    for (const auto& g : groups_) {
        if (g.name == group.name)
            throw SelectionError("selection: duplicate group \"" + group.name + "\"");
    }
    for (uint32_t v : group.vertices) {
        if (v >= vertices_.size())
            throw SelectionError("selection: group \"" + group.name + "\" references vertex " +
                                 std::to_string(v));
    }
    if (group.faces) {
        for (uint32_t f : *group.faces) {
            if (f >= faces_.size())
                throw SelectionError("selection: group \"" + group.name + "\" references face " +
                                     std::to_string(f));
        }
    }
    groups_.push_back(std::move(group));
}

const Vec3& EditableMesh::vertex(uint32_t id) const {
    return vertices_.at(id);
}

const Face& EditableMesh::face(uint32_t index) const {
    return faces_.at(index);
}

std::vector<std::string> EditableMesh::group_names() const {
    std::vector<std::string> names;
    names.reserve(groups_.size());
    for (const auto& g : groups_) names.push_back(g.name);
    return names;
}

void EditableMesh::deselect_all() {
    std::fill(vertex_selected_.begin(), vertex_selected_.end(), false);
    std::fill(face_selected_.begin(), face_selected_.end(), false);
}

void EditableMesh::select_group(const std::string& name) {
    auto it = std::find_if(groups_.begin(), groups_.end(),
                           [&](const VertexGroup& g) { return g.name == name; });
    if (it == groups_.end())
        throw SelectionError("selection: unknown group \"" + name + "\"");

    for (uint32_t v : it->vertices) vertex_selected_[v] = true;

    if (it->faces) {
        for (uint32_t f : *it->faces) face_selected_[f] = true;
        return;
    }

    // Flush: a face is selected once all of its vertices are.
    for (size_t f = 0; f < faces_.size(); ++f) {
        const auto& face = faces_[f];
        if (std::all_of(face.begin(), face.end(), [&](uint32_t v) { return vertex_selected_[v]; }))
            face_selected_[f] = true;
    }
}

std::vector<SelectedVertex> EditableMesh::selected_vertices() const {
    std::vector<SelectedVertex> out;
    for (size_t v = 0; v < vertices_.size(); ++v) {
        if (vertex_selected_[v]) out.push_back({static_cast<uint32_t>(v), vertices_[v]});
    }
    return out;
}

std::vector<SelectedFace> EditableMesh::selected_faces() const {
    std::vector<SelectedFace> out;
    for (size_t f = 0; f < faces_.size(); ++f) {
        if (face_selected_[f]) out.push_back({static_cast<uint32_t>(f), faces_[f]});
    }
    return out;
}

// ---------------------------------------------------------------------------
// Resolver
// ---------------------------------------------------------------------------

std::vector<Vec3> Selection::positions() const {
    std::vector<Vec3> out;
    out.reserve(vertices.size());
    for (const auto& v : vertices) out.push_back(v.position);
    return out;
}

Selection SelectionResolver::resolve(const std::string& group) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Deselect first so nothing from the previous group carries over.
    host_.deselect_all();
    host_.select_group(group);

    Selection sel;
    sel.group = group;
    sel.vertices = host_.selected_vertices();
    sel.faces = host_.selected_faces();
    sel.local_index.reserve(sel.vertices.size());
    for (size_t i = 0; i < sel.vertices.size(); ++i) {
        sel.local_index.emplace(sel.vertices[i].id, static_cast<uint32_t>(i));
    }
    return sel;
}

// ---------------------------------------------------------------------------
// Topology
// ---------------------------------------------------------------------------

std::optional<FacePolicy> parse_face_policy(std::string_view name) {
    std::string s(name);
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (s == "hardened") return FacePolicy::Hardened;
    if (s == "faithful") return FacePolicy::Faithful;
    return std::nullopt;
}

const char* face_policy_name(FacePolicy policy) {
    switch (policy) {
        case FacePolicy::Hardened: return "hardened";
        case FacePolicy::Faithful: return "faithful";
    }
    return "hardened";
}

Topology extract_topology(const Selection& sel, FacePolicy policy) {
    Topology topo;

    for (const auto& face : sel.faces) {
        if (policy == FacePolicy::Hardened) {
            bool contained = std::all_of(face.vertices.begin(), face.vertices.end(),
                                         [&](uint32_t v) { return sel.local_index.count(v) != 0; });
            if (!contained) {
                topo.skipped_faces++;
                continue;
            }
        }

        for (uint32_t v : face.vertices) {
            auto it = sel.local_index.find(v);
            if (it == sel.local_index.end()) {
                throw IndexConsistencyError(
                    "selection: group \"" + sel.group + "\" face " + std::to_string(face.index) +
                    " references vertex " + std::to_string(v) + " which is not in the vertex selection");
            }
            topo.indices.push_back(it->second);
        }
        topo.faces++;
    }

    return topo;
}

} // namespace dunetools::selection
