#pragma once

#include <filesystem>
#include <istream>
#include <stdexcept>
#include <string>

#include "dunetools/board.h"
#include "dunetools/markers.h"
#include "dunetools/selection.h"

namespace dunetools::scene {

inline constexpr int kSchemaVersion = 1;

// SceneError reports a malformed scene or terrain file. The message names
// the offending element ("mesh.faces[4]").
class SceneError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Scene is the exporter's input: the editing environment's mesh with its
// selection groups, and the scene graph's marker collections.
struct Scene {
    int schema_version = kSchemaVersion;
    selection::EditableMesh mesh;
    markers::MarkerHierarchy markers;
};

// Read parses a scene interchange document (JSON).
Scene read(std::istream& r);

// Load opens and parses path. Throws std::system_error or SceneError.
Scene load(const std::filesystem::path& path);

// ReadTerrain parses {"strongholds": [...], "rocks": [...]}. A missing key
// keeps the default set; a name in both sets is a SceneError.
board::TerrainTable read_terrain(std::istream& r);
board::TerrainTable load_terrain(const std::filesystem::path& path);

} // namespace dunetools::scene
