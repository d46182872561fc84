#include "dunetools/board.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>

namespace dunetools::board {

// ---------------------------------------------------------------------------
// Terrain
// ---------------------------------------------------------------------------

const char* terrain_name(Terrain t) {
    switch (t) {
        case Terrain::Rock: return "Rock";
        case Terrain::Stronghold: return "Stronghold";
        case Terrain::Sand: return "Sand";
    }
    return "Sand";
}

std::optional<Terrain> parse_terrain(std::string_view name) {
    if (name == "Rock") return Terrain::Rock;
    if (name == "Stronghold") return Terrain::Stronghold;
    if (name == "Sand") return Terrain::Sand;
    return std::nullopt;
}

TerrainTable TerrainTable::defaults() {
    TerrainTable t;
    t.strongholds = {
        "Arrakeen",
        "Carthag",
        "Sietch Tabr",
        "Habbanya Sietch",
        "Tuek's Sietch",
    };
    t.rocks = {
        "False Wall South",
        "False Wall East",
        "False Wall West",
        "Pasty Mesa",
        "Shield Wall",
        "Rim Wall West",
        "Plastic Basin",
    };
    return t;
}

Terrain TerrainTable::classify(std::string_view name) const {
    const std::string key(name);
    if (strongholds.count(key)) return Terrain::Stronghold;
    if (rocks.count(key)) return Terrain::Rock;
    return Terrain::Sand;
}

std::vector<std::string> TerrainTable::overlap() const {
    std::vector<std::string> both;
    std::set_intersection(strongholds.begin(), strongholds.end(),
                          rocks.begin(), rocks.end(), std::back_inserter(both));
    return both;
}

// ---------------------------------------------------------------------------
// Group names
// ---------------------------------------------------------------------------

GroupName parse_group_name(std::string_view name) {
    GroupName out;
    auto semi = name.find(';');
    out.location = std::string(name.substr(0, semi));
    if (out.location.empty())
        throw selection::SelectionError("board: group \"" + std::string(name) + "\" has no location name");
    if (semi == std::string_view::npos) return out;

    auto suffix = name.substr(semi + 1);
    int32_t sector = 0;
    const bool digits = !suffix.empty() &&
        std::all_of(suffix.begin(), suffix.end(),
                    [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
    if (digits) {
        auto [ptr, ec] = std::from_chars(suffix.data(), suffix.data() + suffix.size(), sector);
        if (ec != std::errc{} || ptr != suffix.data() + suffix.size()) sector = -1;
    }
    if (!digits || sector < 0)
        throw selection::SelectionError("board: group \"" + std::string(name) +
                                        "\" has an invalid sector \"" + std::string(suffix) + "\"");
    out.sector = sector;
    return out;
}

// ---------------------------------------------------------------------------
// Builder
// ---------------------------------------------------------------------------

LocationModelBuilder::LocationModelBuilder(TerrainTable terrain, selection::FacePolicy policy)
    : terrain_(std::move(terrain)), policy_(policy) {}

bool LocationModelBuilder::put_sector(const std::string& location, int32_t sector, Sector data) {
    auto it = model_.find(location);
    if (it == model_.end()) {
        Location loc;
        loc.name = location;
        loc.terrain = terrain_.classify(location);
        it = model_.emplace(location, std::move(loc)).first;
    }

    auto& sectors = it->second.sectors;
    auto sit = sectors.find(sector);
    if (sit != sectors.end()) {
        sit->second = std::move(data);
        return true;
    }
    sectors.emplace(sector, std::move(data));
    return false;
}

GroupReport LocationModelBuilder::add_group(selection::SelectionResolver& resolver,
                                            const std::string& group) {
    const auto name = parse_group_name(group);
    const auto sel = resolver.resolve(group);
    auto topo = selection::extract_topology(sel, policy_);

    GroupReport rep;
    rep.group = group;
    rep.location = name.location;
    rep.sector = name.sector;
    rep.vertices = sel.vertices.size();
    rep.indices = topo.indices.size();
    rep.faces = topo.faces;
    rep.skipped_faces = topo.skipped_faces;

    Sector data;
    data.vertices = sel.positions();
    data.indices = std::move(topo.indices);
    rep.replaced = put_sector(name.location, name.sector, std::move(data));
    return rep;
}

void LocationModelBuilder::cross_reference(const markers::MarkerHierarchy& markers) {
    for (auto& [name, loc] : model_) {
        for (auto& [sector, data] : loc.sectors) {
            data.fighters = markers::fighters(markers, name, sector);
            // Recomputed on every sector pass; the value does not change.
            loc.spice = markers::spice(markers, name);
        }
    }
}

BuildResult build(selection::SelectionHost& host,
                  const markers::MarkerHierarchy& markers,
                  const BuildOptions& opts) {
    selection::SelectionResolver resolver(host);
    LocationModelBuilder builder(opts.terrain, opts.face_policy);

    BuildResult result;
    for (const auto& group : host.group_names()) {
        result.groups.push_back(builder.add_group(resolver, group));
    }
    builder.cross_reference(markers);
    result.model = builder.take();
    return result;
}

} // namespace dunetools::board
