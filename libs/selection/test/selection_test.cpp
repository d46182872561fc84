#include "dunetools/selection.h"

#include <gtest/gtest.h>

#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace sel = dunetools::selection;

namespace {

// Six vertices on a strip:
//   3---4---5
//   | \ | \ |
//   0---1---2
// Faces 0..3 are triangles, face 4 is the quad 1-2-5-4.
sel::EditableMesh make_strip() {
    sel::EditableMesh mesh;
    mesh.add_vertex({0.0, 0.0, 0.0});
    mesh.add_vertex({1.0, 0.0, 0.0});
    mesh.add_vertex({2.0, 0.0, 0.0});
    mesh.add_vertex({0.0, 1.0, 0.0});
    mesh.add_vertex({1.0, 1.0, 0.0});
    mesh.add_vertex({2.0, 1.0, 0.0});
    mesh.add_face({0, 1, 3});
    mesh.add_face({1, 4, 3});
    mesh.add_face({1, 2, 4});
    mesh.add_face({2, 5, 4});
    mesh.add_face({1, 2, 5, 4});
    return mesh;
}

} // namespace

TEST(Selection, ResolveRenumbersInTraversalOrder) {
    auto mesh = make_strip();
    mesh.add_group({"Arrakeen", {4, 1, 3}, std::nullopt});

    sel::SelectionResolver resolver(mesh);
    const auto s = resolver.resolve("Arrakeen");

    ASSERT_EQ(s.vertices.size(), 3u);
    EXPECT_EQ(s.vertices[0].id, 1u);
    EXPECT_EQ(s.vertices[1].id, 3u);
    EXPECT_EQ(s.vertices[2].id, 4u);
    EXPECT_EQ(s.local_index.at(1), 0u);
    EXPECT_EQ(s.local_index.at(3), 1u);
    EXPECT_EQ(s.local_index.at(4), 2u);

    const auto pos = s.positions();
    ASSERT_EQ(pos.size(), 3u);
    EXPECT_DOUBLE_EQ(pos[1][1], 1.0);
}

TEST(Selection, ResolveDoesNotCarryOverPreviousGroup) {
    auto mesh = make_strip();
    mesh.add_group({"Carthag", {0, 1, 3}, std::nullopt});
    mesh.add_group({"Carthag;1", {2, 5, 4}, std::nullopt});

    sel::SelectionResolver resolver(mesh);
    const auto first = resolver.resolve("Carthag");
    const auto second = resolver.resolve("Carthag;1");

    ASSERT_EQ(first.vertices.size(), 3u);
    ASSERT_EQ(second.vertices.size(), 3u);
    EXPECT_EQ(second.vertices[0].id, 2u);
    EXPECT_EQ(second.vertices[1].id, 4u);
    EXPECT_EQ(second.vertices[2].id, 5u);
    ASSERT_EQ(second.faces.size(), 1u);
    EXPECT_EQ(second.faces[0].index, 3u);
}

TEST(Selection, ConcurrentResolvesDoNotInterleave) {
    auto mesh = make_strip();
    mesh.add_group({"Carthag", {0, 1, 3}, std::nullopt});
    mesh.add_group({"Carthag;1", {2, 5, 4}, std::nullopt});

    sel::SelectionResolver resolver(mesh);
    constexpr int kRounds = 500;

    auto worker = [&](const std::string& group, std::vector<uint32_t> expected_ids,
                      size_t expected_faces, int& mismatches) {
        for (int i = 0; i < kRounds; ++i) {
            const auto s = resolver.resolve(group);
            std::vector<uint32_t> ids;
            for (const auto& v : s.vertices) ids.push_back(v.id);
            if (ids != expected_ids || s.faces.size() != expected_faces) ++mismatches;
        }
    };

    int first_mismatches = 0;
    int second_mismatches = 0;
    std::thread first(worker, "Carthag", std::vector<uint32_t>{0, 1, 3}, 1, std::ref(first_mismatches));
    std::thread second(worker, "Carthag;1", std::vector<uint32_t>{2, 4, 5}, 1,
                       std::ref(second_mismatches));
    first.join();
    second.join();

    EXPECT_EQ(first_mismatches, 0);
    EXPECT_EQ(second_mismatches, 0);
}

TEST(Selection, UnknownGroupThrows) {
    auto mesh = make_strip();
    sel::SelectionResolver resolver(mesh);
    EXPECT_THROW(resolver.resolve("Polar Sink"), sel::SelectionError);
}

TEST(Selection, FlushSelectsOnlyFullyCoveredFaces) {
    auto mesh = make_strip();
    mesh.add_group({"g", {1, 2, 4, 5}, std::nullopt});
    mesh.deselect_all();
    mesh.select_group("g");

    const auto faces = mesh.selected_faces();
    ASSERT_EQ(faces.size(), 3u);
    EXPECT_EQ(faces[0].index, 2u);
    EXPECT_EQ(faces[1].index, 3u);
    EXPECT_EQ(faces[2].index, 4u);
}

TEST(Selection, TopologyEmitsLocalIndicesPerFaceVertex) {
    auto mesh = make_strip();
    mesh.add_group({"Sietch Tabr", {1, 2, 4}, std::nullopt});

    sel::SelectionResolver resolver(mesh);
    const auto topo = sel::extract_topology(resolver.resolve("Sietch Tabr"));

    // Face 2 is (1, 2, 4) -> local (0, 1, 2).
    EXPECT_EQ(topo.indices, (std::vector<uint32_t>{0, 1, 2}));
    EXPECT_EQ(topo.faces, 1u);
    EXPECT_EQ(topo.skipped_faces, 0u);
}

TEST(Selection, TopologyFlattensPolygons) {
    auto mesh = make_strip();
    mesh.add_group({"quad", {1, 2, 4, 5}, std::vector<uint32_t>{4}});

    sel::SelectionResolver resolver(mesh);
    const auto topo = sel::extract_topology(resolver.resolve("quad"));

    // Quad (1, 2, 5, 4) with locals 1->0, 2->1, 4->2, 5->3.
    EXPECT_EQ(topo.indices, (std::vector<uint32_t>{0, 1, 3, 2}));
}

// The group's face list claims face 1 (1, 4, 3) while its vertex list lacks
// vertex 3, so face and vertex selection disagree.
TEST(Selection, MalformedSelectionUnderBothPolicies) {
    auto mesh = make_strip();
    mesh.add_group({"broken", {0, 1, 4}, std::vector<uint32_t>{0, 1}});

    sel::SelectionResolver resolver(mesh);
    const auto s = resolver.resolve("broken");
    ASSERT_EQ(s.faces.size(), 2u);

    const auto hardened = sel::extract_topology(s, sel::FacePolicy::Hardened);
    EXPECT_TRUE(hardened.indices.empty());
    EXPECT_EQ(hardened.skipped_faces, 2u);

    EXPECT_THROW(sel::extract_topology(s, sel::FacePolicy::Faithful), sel::IndexConsistencyError);
}

TEST(Selection, HardenedKeepsContainedFacesOfMalformedSelection) {
    auto mesh = make_strip();
    mesh.add_group({"partial", {0, 1, 3}, std::vector<uint32_t>{0, 1}});

    sel::SelectionResolver resolver(mesh);
    const auto topo = sel::extract_topology(resolver.resolve("partial"), sel::FacePolicy::Hardened);

    EXPECT_EQ(topo.indices, (std::vector<uint32_t>{0, 1, 2}));
    EXPECT_EQ(topo.faces, 1u);
    EXPECT_EQ(topo.skipped_faces, 1u);
}

TEST(Selection, PoliciesAgreeOnWellFormedInput) {
    auto mesh = make_strip();
    mesh.add_group({"whole", {0, 1, 2, 3, 4, 5}, std::nullopt});

    sel::SelectionResolver resolver(mesh);
    const auto s = resolver.resolve("whole");
    const auto a = sel::extract_topology(s, sel::FacePolicy::Hardened);
    const auto b = sel::extract_topology(s, sel::FacePolicy::Faithful);

    EXPECT_EQ(a.indices, b.indices);
    EXPECT_EQ(a.indices.size(), 4u * 3u + 4u);
    for (uint32_t i : a.indices) EXPECT_LT(i, s.vertices.size());
}

TEST(Selection, MeshRejectsBadEdits) {
    sel::EditableMesh mesh;
    mesh.add_vertex({0.0, 0.0, 0.0});
    mesh.add_vertex({1.0, 0.0, 0.0});
    mesh.add_vertex({0.0, 1.0, 0.0});

    EXPECT_THROW(mesh.add_face({0, 1}), sel::SelectionError);
    EXPECT_THROW(mesh.add_face({0, 1, 7}), sel::SelectionError);
    EXPECT_THROW(mesh.add_group({"g", {0, 9}, std::nullopt}), sel::SelectionError);
    EXPECT_THROW(mesh.add_group({"g", {0}, std::vector<uint32_t>{3}}), sel::SelectionError);

    mesh.add_group({"g", {0, 1, 2}, std::nullopt});
    EXPECT_THROW(mesh.add_group({"g", {0}, std::nullopt}), sel::SelectionError);
}

TEST(Selection, FacePolicyNames) {
    EXPECT_EQ(sel::parse_face_policy("hardened"), sel::FacePolicy::Hardened);
    EXPECT_EQ(sel::parse_face_policy("Faithful"), sel::FacePolicy::Faithful);
    EXPECT_FALSE(sel::parse_face_policy("strict").has_value());
    EXPECT_STREQ(sel::face_policy_name(sel::FacePolicy::Faithful), "faithful");
}
