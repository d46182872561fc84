#include "dunetools/markers.h"

#include <unordered_set>

namespace dunetools::markers {

namespace {

const Collection* find_in(const std::vector<Collection>& nodes, std::string_view name) {
    for (const auto& c : nodes) {
        if (c.name == name) return &c;
        if (const auto* hit = find_in(c.children, name)) return hit;
    }
    return nullptr;
}

void collect_names(const std::vector<Collection>& nodes, std::unordered_set<std::string>& seen) {
    for (const auto& c : nodes) {
        if (!seen.insert(c.name).second)
            throw LookupError("markers: duplicate collection \"" + c.name + "\"");
        collect_names(c.children, seen);
    }
}

} // namespace

const Collection* Collection::child(std::string_view child_name) const {
    for (const auto& c : children) {
        if (c.name == child_name) return &c;
    }
    return nullptr;
}

MarkerHierarchy::MarkerHierarchy(std::vector<Collection> roots)
    : roots_(std::move(roots)) {
    std::unordered_set<std::string> seen;
    collect_names(roots_, seen);
}

const Collection* MarkerHierarchy::find(std::string_view name) const {
    return find_in(roots_, name);
}

const Collection& MarkerHierarchy::at(std::string_view name) const {
    const auto* c = find(name);
    if (!c) throw LookupError("markers: no collection named \"" + std::string(name) + "\"");
    return *c;
}

std::string fighter_collection_name(std::string_view location, int32_t sector) {
    return std::string(location) + " " + std::to_string(sector);
}

std::string spice_collection_name(std::string_view location) {
    return std::string(location) + " Spice";
}

std::vector<Vec3> fighters(const MarkerHierarchy& h, std::string_view location, int32_t sector) {
    const auto& loc = h.at(location);
    const auto* sub = loc.child(fighter_collection_name(location, sector));
    if (!sub) return {};

    std::vector<Vec3> out;
    out.reserve(sub->objects.size());
    for (const auto& obj : sub->objects) out.push_back(obj.location);
    return out;
}

std::optional<Vec3> spice(const MarkerHierarchy& h, std::string_view location) {
    const auto& loc = h.at(location);
    const auto* sub = loc.child(spice_collection_name(location));
    if (!sub || sub->objects.empty()) return std::nullopt;
    return sub->objects.front().location;
}

} // namespace dunetools::markers
