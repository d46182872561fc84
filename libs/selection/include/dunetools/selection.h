#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "dunetools/vec3.h"

namespace dunetools::selection {

// SelectionError reports an unknown group or a malformed mesh edit.
class SelectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// IndexConsistencyError reports a selected face that references a vertex
// outside the vertex selection (faithful face policy only).
class IndexConsistencyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Face is an ordered loop of global vertex ids (3 or more).
using Face = std::vector<uint32_t>;

// SelectedVertex is one vertex of a resolved selection.
struct SelectedVertex {
    uint32_t id = 0; // global vertex id
    Vec3 position = {0.0, 0.0, 0.0};
};

// SelectedFace is a face whose selection flag was set when the group was resolved.
struct SelectedFace {
    uint32_t index = 0; // face index in the mesh
    Face vertices;
};

// SelectionHost is the editing environment: one mesh with exactly one mutable
// "current selection". Implementations are not required to be thread safe;
// SelectionResolver serializes access.
class SelectionHost {
public:
    virtual ~SelectionHost() = default;

    // Group names in the host's order.
    virtual std::vector<std::string> group_names() const = 0;

    virtual void deselect_all() = 0;

    // Adds the named group's vertices (and their faces) to the current
    // selection. Throws SelectionError for an unknown group.
    virtual void select_group(const std::string& name) = 0;

    // Currently selected vertices in native traversal order.
    virtual std::vector<SelectedVertex> selected_vertices() const = 0;

    // Currently selected faces in native traversal order.
    virtual std::vector<SelectedFace> selected_faces() const = 0;
};

// VertexGroup is a named vertex subset. When faces is set the group marks
// exactly those faces selected; otherwise selection flushes to every face
// whose vertices are all selected.
struct VertexGroup {
    std::string name;
    std::vector<uint32_t> vertices;
    std::optional<std::vector<uint32_t>> faces;
};

// EditableMesh is an in-memory SelectionHost.
class EditableMesh : public SelectionHost {
public:
    EditableMesh() = default;

    uint32_t add_vertex(const Vec3& position);
    uint32_t add_face(Face face);
    void add_group(VertexGroup group);

    [[nodiscard]] size_t vertex_count() const { return vertices_.size(); }
    [[nodiscard]] size_t face_count() const { return faces_.size(); }
    [[nodiscard]] const Vec3& vertex(uint32_t id) const;
    [[nodiscard]] const Face& face(uint32_t index) const;

    std::vector<std::string> group_names() const override;
    void deselect_all() override;
    void select_group(const std::string& name) override;
    std::vector<SelectedVertex> selected_vertices() const override;
    std::vector<SelectedFace> selected_faces() const override;

private:
    std::vector<Vec3> vertices_;
    std::vector<Face> faces_;
    std::vector<VertexGroup> groups_;
    std::vector<bool> vertex_selected_;
    std::vector<bool> face_selected_;
};

// Selection is an immutable snapshot of one resolved group. Local indices are
// private to the snapshot: the i-th selected vertex has local index i.
struct Selection {
    std::string group;
    std::vector<SelectedVertex> vertices;
    std::vector<SelectedFace> faces;
    std::unordered_map<uint32_t, uint32_t> local_index; // global id -> local index

    [[nodiscard]] std::vector<Vec3> positions() const;
};

// SelectionResolver reads one group at a time from a SelectionHost.
// Each resolve() completes deselect, select and read-back under a lock, so
// resolutions never interleave.
class SelectionResolver {
public:
    explicit SelectionResolver(SelectionHost& host) : host_(host) {}

    SelectionResolver(const SelectionResolver&) = delete;
    SelectionResolver& operator=(const SelectionResolver&) = delete;

    Selection resolve(const std::string& group);

private:
    SelectionHost& host_;
    std::mutex mutex_;
};

// FacePolicy decides which selected faces contribute indices.
enum class FacePolicy {
    Hardened, // only faces whose vertices are all in the vertex selection
    Faithful, // every selected face; a vertex without local index is fatal
};

std::optional<FacePolicy> parse_face_policy(std::string_view name);
const char* face_policy_name(FacePolicy policy);

struct Topology {
    std::vector<uint32_t> indices; // flattened face-vertex incidences, local indices
    size_t faces = 0;              // faces that contributed
    size_t skipped_faces = 0;      // selected faces dropped by the hardened policy
};

// ExtractTopology emits, for every selected face in mesh order and every
// vertex of that face, the vertex's local index.
Topology extract_topology(const Selection& sel, FacePolicy policy = FacePolicy::Hardened);

} // namespace dunetools::selection
