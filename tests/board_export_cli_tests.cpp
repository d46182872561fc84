#include <gtest/gtest.h>

#include "dunetools/ron.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string shell_quote(const fs::path& p) {
    std::string s = p.string();
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('\'');
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

int run_command(const std::string& cmd) {
    return std::system(cmd.c_str());
}

fs::path test_tmp_dir(const std::string& name) {
    const auto dir = fs::temp_directory_path() / "dunetools_board_export_tests" / name;
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);
    return dir;
}

fs::path fixture_root() {
    return fs::path(DUNETOOLS_SOURCE_DIR) / "tests/fixtures/board_export";
}

fs::path export_tool_path() {
#ifdef _WIN32
    return fs::path(DUNETOOLS_BINARY_DIR) / "tools/board_export/board_export.exe";
#else
    return fs::path(DUNETOOLS_BINARY_DIR) / "tools/board_export/board_export";
#endif
}

fs::path info_tool_path() {
#ifdef _WIN32
    return fs::path(DUNETOOLS_BINARY_DIR) / "tools/board_info/board_info.exe";
#else
    return fs::path(DUNETOOLS_BINARY_DIR) / "tools/board_info/board_info";
#endif
}

std::string export_cmd(const fs::path& scene, const fs::path& out, const std::string& extra = {}) {
    std::string cmd = shell_quote(export_tool_path()) + " " + shell_quote(scene) +
        " -o " + shell_quote(out);
    if (!extra.empty()) cmd += " " + extra;
    return cmd;
}

std::string read_all(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    EXPECT_TRUE(f.is_open()) << p;
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

json read_json(const fs::path& p) {
    std::ifstream f(p);
    EXPECT_TRUE(f.is_open()) << p;
    json j;
    f >> j;
    return j;
}

} // namespace

TEST(board_export_cli, single_stronghold_matches_reference_bytes) {
    const auto tmp = test_tmp_dir("carthag");
    const auto out = tmp / "locations.ron";

    EXPECT_EQ(run_command(export_cmd(fixture_root() / "carthag.json", out)), 0);
    EXPECT_EQ(read_all(out), read_all(fixture_root() / "carthag.ron"));
    EXPECT_FALSE(fs::exists(tmp / "locations.ron.tmp"));
}

TEST(board_export_cli, output_is_deterministic) {
    const auto tmp = test_tmp_dir("determinism");
    const auto first = tmp / "first.ron";
    const auto second = tmp / "second.ron";

    EXPECT_EQ(run_command(export_cmd(fixture_root() / "board.json", first, "--verify")), 0);
    EXPECT_EQ(run_command(export_cmd(fixture_root() / "board.json", second)), 0);
    EXPECT_EQ(read_all(first), read_all(second));
}

TEST(board_export_cli, stdout_output_matches_file_output) {
    const auto tmp = test_tmp_dir("stdout");
    const auto file_out = tmp / "locations.ron";
    const auto piped = tmp / "piped.ron";

    EXPECT_EQ(run_command(export_cmd(fixture_root() / "carthag.json", file_out)), 0);
    const auto cmd = shell_quote(export_tool_path()) + " " +
        shell_quote(fixture_root() / "carthag.json") + " -o - > " + shell_quote(piped);
    EXPECT_EQ(run_command(cmd), 0);
    EXPECT_EQ(read_all(piped), read_all(file_out));
}

TEST(board_export_cli, multi_location_board) {
    const auto tmp = test_tmp_dir("board");
    const auto out = tmp / "nested" / "locations.ron";

    EXPECT_EQ(run_command(export_cmd(fixture_root() / "board.json", out)), 0);

    const auto model = dunetools::ron::read_file(out);
    ASSERT_EQ(model.size(), 3U);
    auto it = model.begin();
    EXPECT_EQ(it->first, "Arrakeen");
    EXPECT_EQ((++it)->first, "Pasty Mesa");
    EXPECT_EQ((++it)->first, "Red Chasm");

    const auto& arrakeen = model.at("Arrakeen");
    EXPECT_EQ(arrakeen.terrain, dunetools::board::Terrain::Stronghold);
    ASSERT_EQ(arrakeen.sectors.size(), 2U);
    EXPECT_EQ(arrakeen.sectors.begin()->first, -1);
    EXPECT_EQ(arrakeen.sectors.at(-1).fighters.size(), 2U);
    EXPECT_TRUE(arrakeen.sectors.at(1).fighters.empty());
    ASSERT_TRUE(arrakeen.spice.has_value());

    const auto& mesa = model.at("Pasty Mesa");
    EXPECT_EQ(mesa.terrain, dunetools::board::Terrain::Rock);
    EXPECT_EQ(mesa.sectors.at(0).vertices.size(), 4U);
    EXPECT_EQ(mesa.sectors.at(0).indices.size(), 6U);

    const auto& chasm = model.at("Red Chasm");
    EXPECT_EQ(chasm.terrain, dunetools::board::Terrain::Sand);
    EXPECT_FALSE(chasm.spice.has_value());
    EXPECT_EQ(chasm.sectors.at(2).fighters.size(), 1U);
}

TEST(board_export_cli, terrain_file_overrides_defaults) {
    const auto tmp = test_tmp_dir("terrain");
    const auto out = tmp / "locations.ron";

    EXPECT_EQ(run_command(export_cmd(fixture_root() / "board.json", out,
                                     "--terrain " + shell_quote(fixture_root() / "terrain.json"))),
              0);

    const auto model = dunetools::ron::read_file(out);
    EXPECT_EQ(model.at("Red Chasm").terrain, dunetools::board::Terrain::Rock);
    EXPECT_EQ(model.at("Pasty Mesa").terrain, dunetools::board::Terrain::Sand);
    EXPECT_EQ(model.at("Arrakeen").terrain, dunetools::board::Terrain::Stronghold);
}

TEST(board_export_cli, board_info_summarizes_export) {
    const auto tmp = test_tmp_dir("info");
    const auto out = tmp / "locations.ron";
    const auto summary = tmp / "summary.json";

    ASSERT_EQ(run_command(export_cmd(fixture_root() / "board.json", out)), 0);
    const auto cmd = shell_quote(info_tool_path()) + " --json " + shell_quote(out) +
        " > " + shell_quote(summary);
    EXPECT_EQ(run_command(cmd), 0);

    const auto doc = read_json(summary);
    EXPECT_EQ(doc["schemaVersion"], 1);
    ASSERT_EQ(doc["locations"].size(), 3U);
    EXPECT_TRUE(doc["issues"].empty());

    const auto& arrakeen = doc["locations"][0];
    EXPECT_EQ(arrakeen["name"], "Arrakeen");
    EXPECT_EQ(arrakeen["terrain"], "Stronghold");
    ASSERT_TRUE(arrakeen["spice"].is_array());
    EXPECT_DOUBLE_EQ(arrakeen["spice"][0].get<double>(), 0.5);
    ASSERT_EQ(arrakeen["sectors"].size(), 2U);
    EXPECT_EQ(arrakeen["sectors"][0]["sector"], -1);
    EXPECT_EQ(arrakeen["sectors"][0]["triangles"], 1);
    EXPECT_EQ(arrakeen["sectors"][0]["fighters"], 2);

    const auto& mesa = doc["locations"][1];
    EXPECT_EQ(mesa["terrain"], "Rock");
    EXPECT_EQ(mesa["sectors"][0]["triangles"], 2);

    EXPECT_TRUE(doc["locations"][2]["spice"].is_null());
}

TEST(board_export_cli, board_info_flags_broken_document) {
    const auto tmp = test_tmp_dir("info_broken");
    const auto broken = tmp / "broken.ron";
    {
        std::ofstream f(broken, std::ios::binary);
        f << "[(name: \"Carthag\", terrain: Stronghold, spice: None, sectors: {"
             "0: (vertices: [(0.0, 0.0, 0.0)], indices: [0, 1], fighters: [])})]\n";
    }
    EXPECT_NE(run_command(shell_quote(info_tool_path()) + " " + shell_quote(broken)), 0);
}

TEST(board_export_cli, faithful_policy_rejects_malformed_selection) {
    const auto tmp = test_tmp_dir("malformed");
    const auto faithful = tmp / "faithful.ron";
    const auto hardened = tmp / "hardened.ron";

    EXPECT_NE(run_command(export_cmd(fixture_root() / "malformed.json", faithful,
                                     "--face-policy faithful")),
              0);
    EXPECT_FALSE(fs::exists(faithful));

    EXPECT_EQ(run_command(export_cmd(fixture_root() / "malformed.json", hardened,
                                     "--face-policy hardened")),
              0);
    const auto model = dunetools::ron::read_file(hardened);
    EXPECT_TRUE(model.at("Carthag").sectors.at(0).indices.empty());
}

TEST(board_export_cli, missing_location_collection_writes_nothing) {
    const auto tmp = test_tmp_dir("missing_location");
    const auto out = tmp / "locations.ron";

    EXPECT_NE(run_command(export_cmd(fixture_root() / "missing_location.json", out)), 0);
    EXPECT_FALSE(fs::exists(out));
    EXPECT_FALSE(fs::exists(tmp / "locations.ron.tmp"));
}

TEST(board_export_cli, location_details_logged_only_at_debug_level) {
    const auto tmp = test_tmp_dir("debug_log");
    const auto quiet_log = tmp / "quiet.log";
    const auto verbose_log = tmp / "verbose.log";
    const auto debug_log = tmp / "debug.log";

    EXPECT_EQ(run_command(export_cmd(fixture_root() / "board.json", tmp / "a.ron") +
                          " 2> " + shell_quote(quiet_log)),
              0);
    EXPECT_EQ(run_command(export_cmd(fixture_root() / "board.json", tmp / "b.ron", "-v") +
                          " 2> " + shell_quote(verbose_log)),
              0);
    EXPECT_EQ(run_command(export_cmd(fixture_root() / "board.json", tmp / "c.ron", "-vv") +
                          " 2> " + shell_quote(debug_log)),
              0);

    const auto quiet = read_all(quiet_log);
    const auto verbose = read_all(verbose_log);
    const auto debug = read_all(debug_log);

    EXPECT_EQ(quiet.find("group \"Arrakeen;1\""), std::string::npos);
    EXPECT_NE(verbose.find("group \"Arrakeen;1\""), std::string::npos);
    EXPECT_EQ(verbose.find("location \"Arrakeen\" Stronghold sectors: 2 fighters: 2 spice: yes"),
              std::string::npos);
    EXPECT_NE(debug.find("location \"Arrakeen\" Stronghold sectors: 2 fighters: 2 spice: yes"),
              std::string::npos);
    EXPECT_NE(debug.find("location \"Red Chasm\" Sand sectors: 1 fighters: 1 spice: no"),
              std::string::npos);
}

TEST(board_export_cli, rejects_bad_arguments) {
    EXPECT_NE(run_command(shell_quote(export_tool_path()) + " 2>/dev/null"), 0);
    EXPECT_NE(run_command(shell_quote(export_tool_path()) + " " +
                          shell_quote(fixture_root() / "carthag.json") +
                          " --face-policy lenient 2>/dev/null"),
              0);
}
