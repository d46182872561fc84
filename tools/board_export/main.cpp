#include "dunetools/board.h"
#include "dunetools/ron.h"
#include "dunetools/scene.h"
#include "dunetools/selection.h"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "../common/cli_logger.h"

namespace fs = std::filesystem;

namespace {

constexpr const char* kDefaultOutput = "locations.ron";

struct Config {
    fs::path output_path = kDefaultOutput;
    std::optional<fs::path> terrain_path;
    dunetools::selection::FacePolicy face_policy = dunetools::selection::FacePolicy::Hardened;
    bool verify = false;
};

void print_usage() {
    dunetools::cli::print("Usage: board_export [flags] <scene.json>");
    dunetools::cli::print("Extracts board locations (sectors, triangle indices, fighter slots, spice");
    dunetools::cli::print("markers) from a scene interchange file and writes the location document.");
    dunetools::cli::print("");
    dunetools::cli::print("Flags:");
    dunetools::cli::print("  -o, --output <path>             Output path, '-' for stdout (default: locations.ron)");
    dunetools::cli::print("  --terrain <file.json>           Stronghold/rock name sets replacing the defaults");
    dunetools::cli::print("  --face-policy <hardened|faithful>");
    dunetools::cli::print("                                  hardened: drop selected faces with unselected vertices");
    dunetools::cli::print("                                  faithful: keep them, fail on a missing local index");
    dunetools::cli::print("  --verify                        Parse the rendered document back before writing");
    dunetools::cli::print("  -v, --verbose                   Verbose logging");
    dunetools::cli::print("  -vv, --debug                    Debug logging");
    dunetools::cli::print("  -h, --help                      Show help");
}

void log_groups(const std::vector<dunetools::board::GroupReport>& groups) {
    for (const auto& g : groups) {
        LOGI("group", "\"" + g.group + "\"", "->", g.location, "sector", g.sector, ":",
             g.vertices, "vertices,", g.indices, "indices,", g.faces, "faces");
        if (g.skipped_faces > 0) {
            LOGI("group", "\"" + g.group + "\":", g.skipped_faces,
                 "selected faces reference unselected vertices, skipped");
        }
        if (g.replaced) {
            LOGW("group", "\"" + g.group + "\" replaces an earlier", g.location, "sector", g.sector);
        }
    }
}

void log_model(const dunetools::board::LocationModel& model) {
    for (const auto& [name, loc] : model) {
        size_t fighters = 0;
        for (const auto& [id, sector] : loc.sectors) fighters += sector.fighters.size();
        LOGD("location", "\"" + name + "\"", dunetools::board::terrain_name(loc.terrain),
             "sectors:", loc.sectors.size(), "fighters:", fighters,
             "spice:", loc.spice ? "yes" : "no");
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc <= 1) {
        print_usage();
        return 1;
    }

    Config cfg;
    int verbosity = 0;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        if ((std::strcmp(argv[i], "-o") == 0 || std::strcmp(argv[i], "--output") == 0) && i + 1 < argc) {
            cfg.output_path = fs::path(argv[++i]);
        } else if (std::strcmp(argv[i], "--terrain") == 0 && i + 1 < argc) {
            cfg.terrain_path = fs::path(argv[++i]);
        } else if (std::strcmp(argv[i], "--face-policy") == 0 && i + 1 < argc) {
            auto policy = dunetools::selection::parse_face_policy(argv[++i]);
            if (!policy) {
                LOGE("invalid --face-policy", argv[i]);
                return 1;
            }
            cfg.face_policy = *policy;
        } else if (std::strcmp(argv[i], "--verify") == 0) {
            cfg.verify = true;
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) {
            verbosity = std::min(verbosity + 1, 2);
        } else if (std::strcmp(argv[i], "-vv") == 0 || std::strcmp(argv[i], "--debug") == 0) {
            verbosity = 2;
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else {
            positional.push_back(argv[i]);
        }
    }

    dunetools::cli::set_verbosity(verbosity);

    if (positional.size() != 1) {
        LOGE("expected one input scene path");
        print_usage();
        return 1;
    }

    const auto input_path = fs::path(positional.front());
    const bool to_stdout = cfg.output_path == "-";

    try {
        dunetools::board::BuildOptions opts;
        opts.face_policy = cfg.face_policy;
        if (cfg.terrain_path) {
            opts.terrain = dunetools::scene::load_terrain(*cfg.terrain_path);
            LOGI("terrain sets from", cfg.terrain_path->string());
        }

        auto scene = dunetools::scene::load(input_path);
        LOGI("scene", input_path.string(), ":", scene.mesh.vertex_count(), "vertices,",
             scene.mesh.face_count(), "faces,", scene.mesh.group_names().size(), "groups");
        LOGI("face policy:", dunetools::selection::face_policy_name(cfg.face_policy));

        auto result = dunetools::board::build(scene.mesh, scene.markers, opts);
        log_groups(result.groups);
        if (dunetools::log::debug_enabled()) log_model(result.model);

        if (cfg.verify) {
            const auto reread = dunetools::ron::parse(dunetools::ron::to_string(result.model));
            if (!(reread == result.model)) {
                LOGE("verify: parsed document differs from the exported model");
                return 1;
            }
            LOGI("verify: document parses back to the same model");
        }

        if (to_stdout) {
            dunetools::ron::write(std::cout, result.model);
            std::cout.flush();
            if (!std::cout) {
                LOGE("cannot write to stdout");
                return 1;
            }
        } else {
            if (!cfg.output_path.parent_path().empty()) {
                std::error_code out_ec;
                fs::create_directories(cfg.output_path.parent_path(), out_ec);
                if (out_ec) {
                    LOGE("cannot create output directory", out_ec.message());
                    return 1;
                }
            }
            dunetools::ron::write_file(cfg.output_path, result.model);
            LOGI("wrote", cfg.output_path.string());
            std::cerr << "Locations: " << result.model.size() << '\n';
            std::cerr << "Output: " << cfg.output_path.string() << '\n';
        }
    } catch (const std::exception& e) {
        LOGE("export failed:", e.what());
        return 1;
    }

    return 0;
}
