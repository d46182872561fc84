#include "dunetools/board.h"
#include "dunetools/ron.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "../common/cli_logger.h"

using json = nlohmann::ordered_json;

namespace {

struct SectorIssue {
    std::string location;
    int32_t sector = 0;
    std::string message;
};

std::vector<SectorIssue> check_model(const dunetools::board::LocationModel& model) {
    std::vector<SectorIssue> issues;
    for (const auto& [name, loc] : model) {
        for (const auto& [id, sector] : loc.sectors) {
            if (sector.indices.size() % 3 != 0) {
                issues.push_back({name, id, std::to_string(sector.indices.size()) +
                                                " indices is not a whole number of triangles"});
            }
            const auto bad = std::find_if(sector.indices.begin(), sector.indices.end(),
                                          [&](uint32_t i) { return i >= sector.vertices.size(); });
            if (bad != sector.indices.end()) {
                issues.push_back({name, id, "index " + std::to_string(*bad) + " out of range (" +
                                                std::to_string(sector.vertices.size()) + " vertices)"});
            }
        }
    }
    return issues;
}

json vec3_to_json(const dunetools::Vec3& v) {
    return json::array({v[0], v[1], v[2]});
}

json build_json(const dunetools::board::LocationModel& model,
                const std::vector<SectorIssue>& issues,
                const std::string& filename) {
    json locations = json::array();
    for (const auto& [name, loc] : model) {
        json sectors = json::array();
        for (const auto& [id, sector] : loc.sectors) {
            sectors.push_back({
                {"sector", id},
                {"vertices", sector.vertices.size()},
                {"triangles", sector.indices.size() / 3},
                {"fighters", sector.fighters.size()},
            });
        }
        json loc_json = {
            {"name", name},
            {"terrain", dunetools::board::terrain_name(loc.terrain)},
            {"spice", loc.spice ? vec3_to_json(*loc.spice) : json(nullptr)},
            {"sectors", std::move(sectors)},
        };
        locations.push_back(std::move(loc_json));
    }

    json issues_json = json::array();
    for (const auto& is : issues) {
        issues_json.push_back({{"location", is.location}, {"sector", is.sector}, {"message", is.message}});
    }

    return {
        {"schemaVersion", 1},
        {"filename", filename},
        {"locations", std::move(locations)},
        {"issues", std::move(issues_json)},
    };
}

void print_text(const dunetools::board::LocationModel& model) {
    size_t total_sectors = 0;
    for (const auto& [name, loc] : model) {
        std::cout << name << " (" << dunetools::board::terrain_name(loc.terrain) << ")";
        if (loc.spice) {
            std::cout << " spice at (" << dunetools::ron::format_float((*loc.spice)[0]) << ", "
                      << dunetools::ron::format_float((*loc.spice)[1]) << ", "
                      << dunetools::ron::format_float((*loc.spice)[2]) << ")";
        }
        std::cout << '\n';
        for (const auto& [id, sector] : loc.sectors) {
            std::cout << "  sector " << std::setw(2) << id << ": "
                      << sector.vertices.size() << " vertices, "
                      << sector.indices.size() / 3 << " triangles, "
                      << sector.fighters.size() << " fighters\n";
        }
        total_sectors += loc.sectors.size();
    }
    std::cout << "Locations: " << model.size() << ", sectors: " << total_sectors << '\n';
}

void print_usage() {
    dunetools::cli::print("Usage: board_info [flags] <locations.ron>");
    dunetools::cli::print("Summarizes a location document and checks its triangle indices.");
    dunetools::cli::print("");
    dunetools::cli::print("Flags:");
    dunetools::cli::print("  --json             Print the summary as JSON");
    dunetools::cli::print("  --pretty           Pretty-print JSON output");
    dunetools::cli::print("  -v, --verbose      Verbose logging");
    dunetools::cli::print("  -h, --help         Show help");
}

} // namespace

int main(int argc, char* argv[]) {
    bool as_json = false;
    bool pretty = false;
    int verbosity = 0;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--json") == 0) as_json = true;
        else if (std::strcmp(argv[i], "--pretty") == 0) pretty = true;
        else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0)
            verbosity = std::min(verbosity + 1, 2);
        else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage();
            return 0;
        } else {
            positional.push_back(argv[i]);
        }
    }

    dunetools::cli::set_verbosity(verbosity);

    if (positional.size() != 1) {
        print_usage();
        return 1;
    }

    const std::string& input_path = positional.front();

    dunetools::board::LocationModel model;
    try {
        model = dunetools::ron::read_file(input_path);
    } catch (const std::exception& e) {
        LOGE("reading", input_path, e.what());
        return 1;
    }
    LOGI("parsed", input_path, ":", model.size(), "locations");

    const auto issues = check_model(model);

    if (as_json) {
        const auto doc = build_json(model, issues, input_path);
        if (pretty) std::cout << std::setw(2) << doc << '\n';
        else std::cout << doc << '\n';
    } else {
        print_text(model);
    }

    for (const auto& is : issues) {
        LOGE(is.location, "sector", is.sector, ":", is.message);
    }
    return issues.empty() ? 0 : 1;
}
