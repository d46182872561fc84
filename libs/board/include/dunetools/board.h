#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "dunetools/markers.h"
#include "dunetools/selection.h"
#include "dunetools/vec3.h"

namespace dunetools::board {

// Terrain classifies a location. Every name maps to exactly one value.
enum class Terrain { Rock, Stronghold, Sand };

const char* terrain_name(Terrain t);
std::optional<Terrain> parse_terrain(std::string_view name);

// Sector id used when a group name carries no ";<sector>" suffix.
inline constexpr int32_t kDefaultSector = -1;

// Sector is the geometry and spawn markers of one location sub-partition.
// Every entry of indices is a valid offset into vertices.
struct Sector {
    std::vector<Vec3> vertices;
    std::vector<uint32_t> indices;
    std::vector<Vec3> fighters;

    bool operator==(const Sector&) const = default;
};

// SectorMap and LocationModel keep first-insertion order, which is the
// order they are written in.
using SectorMap = nlohmann::ordered_map<int32_t, Sector>;

struct Location {
    std::string name;
    Terrain terrain = Terrain::Sand;
    std::optional<Vec3> spice;
    SectorMap sectors;

    bool operator==(const Location&) const = default;
};

using LocationModel = nlohmann::ordered_map<std::string, Location>;

// TerrainTable holds the static membership sets behind terrain().
struct TerrainTable {
    std::set<std::string> strongholds;
    std::set<std::string> rocks;

    // The board's stronghold and rock territories.
    static TerrainTable defaults();

    // Stronghold, then Rock, otherwise Sand.
    [[nodiscard]] Terrain classify(std::string_view name) const;

    // Names listed in both sets (must be empty for a usable table).
    [[nodiscard]] std::vector<std::string> overlap() const;
};

// GroupName is a parsed selection group name: "<location>" or
// "<location>;<sector>".
struct GroupName {
    std::string location;
    int32_t sector = kDefaultSector;
};

// Throws selection::SelectionError for an empty location or a sector suffix
// that is not a non-negative integer.
GroupName parse_group_name(std::string_view name);

// GroupReport describes what one selection group contributed.
struct GroupReport {
    std::string group;
    std::string location;
    int32_t sector = kDefaultSector;
    size_t vertices = 0;
    size_t indices = 0;
    size_t faces = 0;
    size_t skipped_faces = 0;
    bool replaced = false; // an earlier group already filled this sector
};

// LocationModelBuilder accumulates selection groups into a LocationModel and
// then fills marker data from the scene graph.
class LocationModelBuilder {
public:
    explicit LocationModelBuilder(TerrainTable terrain,
                                  selection::FacePolicy policy = selection::FacePolicy::Hardened);

    // Resolves one group and stores its geometry under its location and
    // sector. Re-adding a sector replaces it in place.
    GroupReport add_group(selection::SelectionResolver& resolver, const std::string& group);

    // Stores sector geometry directly; returns true if it replaced one.
    bool put_sector(const std::string& location, int32_t sector, Sector data);

    // Second pass: fighters for every (location, sector) present and the
    // location's spice marker. A missing location collection throws
    // markers::LookupError.
    void cross_reference(const markers::MarkerHierarchy& markers);

    [[nodiscard]] const LocationModel& model() const { return model_; }
    LocationModel take() { return std::move(model_); }

private:
    TerrainTable terrain_;
    selection::FacePolicy policy_;
    LocationModel model_;
};

struct BuildOptions {
    TerrainTable terrain = TerrainTable::defaults();
    selection::FacePolicy face_policy = selection::FacePolicy::Hardened;
};

struct BuildResult {
    LocationModel model;
    std::vector<GroupReport> groups;
};

// Build runs the whole extraction: every group of host in order, then the
// marker pass.
BuildResult build(selection::SelectionHost& host,
                  const markers::MarkerHierarchy& markers,
                  const BuildOptions& opts = {});

} // namespace dunetools::board
