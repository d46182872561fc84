#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "dunetools/vec3.h"

namespace dunetools::markers {

// LookupError reports a collection that must exist but does not.
class LookupError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// MarkerObject is a positioned object placed in the scene graph.
struct MarkerObject {
    std::string name;
    Vec3 location = {0.0, 0.0, 0.0};
};

// Collection is a named scene-graph node holding objects and child collections.
struct Collection {
    std::string name;
    std::vector<MarkerObject> objects;
    std::vector<Collection> children;

    // Direct child with the given name, or nullptr.
    [[nodiscard]] const Collection* child(std::string_view child_name) const;
};

// MarkerHierarchy is the scene's collection forest. Collection names are
// unique across the whole forest, so find() looks at every depth.
class MarkerHierarchy {
public:
    MarkerHierarchy() = default;
    explicit MarkerHierarchy(std::vector<Collection> roots);

    // Collection with the given name at any depth, or nullptr.
    [[nodiscard]] const Collection* find(std::string_view name) const;

    // Like find(), but a missing collection is a LookupError.
    [[nodiscard]] const Collection& at(std::string_view name) const;

private:
    std::vector<Collection> roots_;
};

// FighterCollectionName returns "<location> <sector>".
std::string fighter_collection_name(std::string_view location, int32_t sector);

// SpiceCollectionName returns "<location> Spice".
std::string spice_collection_name(std::string_view location);

// Fighters returns the positions of the objects in the location's
// "<location> <sector>" child collection, in scene order. A missing child
// collection yields an empty list. A missing location collection is a
// LookupError.
std::vector<Vec3> fighters(const MarkerHierarchy& h, std::string_view location, int32_t sector);

// Spice returns the position of the first object in the location's
// "<location> Spice" child collection, or std::nullopt if that collection is
// missing or empty. A missing location collection is a LookupError.
std::optional<Vec3> spice(const MarkerHierarchy& h, std::string_view location);

} // namespace dunetools::markers
