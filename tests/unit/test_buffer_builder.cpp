/**
 * @file test_buffer_builder.cpp
 * @brief Unit tests for packing meshes into GPU buffer bytes
 */

#include <catch2/catch_test_macros.hpp>

#include <facet/buffer_builder.h>
#include <facet/errors.h>
#include <facet/gpu_structs.h>

#include <cstring>
#include <memory>

using namespace facet;

namespace {

// Strip of n triangles sharing edges, (n + 2) vertices
Mesh makeStrip(uint32_t triangles) {
    std::vector<Vertex> verts;
    for (uint32_t i = 0; i < triangles + 2; ++i) {
        verts.emplace_back(glm::vec3(static_cast<float>(i / 2), static_cast<float>(i % 2), 0.0f),
                           glm::vec3(0, 0, 1));
    }
    std::vector<uint32_t> indices;
    for (uint32_t t = 0; t < triangles; ++t) {
        indices.push_back(t);
        indices.push_back(t + 1);
        indices.push_back(t + 2);
    }
    return Mesh(std::move(verts), std::move(indices), "strip");
}

GpuVertex readVertex(const GpuBufferLayout& layout, size_t i) {
    GpuVertex v;
    std::memcpy(&v, layout.vertexBytes.data() + i * sizeof(GpuVertex), sizeof(GpuVertex));
    return v;
}

} // namespace

TEST_CASE("buildBuffers for a single mesh", "[buffers]") {
    SECTION("N triangles produce exactly 3N indices covering every vertex reference") {
        for (uint32_t n : {1u, 2u, 7u, 64u}) {
            Mesh mesh = makeStrip(n);
            GpuBufferLayout layout = buildBuffers(mesh);

            REQUIRE(layout.indexCount == 3 * n);
            REQUIRE(layout.triangleCount() == n);
            REQUIRE(layout.indexBytes.size() == 3 * n * sizeof(uint32_t));
            REQUIRE(layout.vertexBytes.size() == mesh.vertexCount() * sizeof(GpuVertex));
            for (uint32_t i = 0; i < layout.indexCount; ++i) {
                REQUIRE(layout.index(i) < layout.vertexCount);
            }
        }
    }

    SECTION("vertex attributes are packed position, normal, color") {
        std::vector<Vertex> verts = {
            Vertex(glm::vec3(1, 2, 3), glm::vec3(0, 1, 0), glm::vec4(0.1f, 0.2f, 0.3f, 0.4f)),
            Vertex(glm::vec3(4, 5, 6), glm::vec3(0, 1, 0)),
            Vertex(glm::vec3(7, 8, 9), glm::vec3(0, 1, 0)),
        };
        GpuBufferLayout layout = buildBuffers(Mesh(verts, {0, 1, 2}));

        GpuVertex v = readVertex(layout, 0);
        REQUIRE(v.position[2] == 3.0f);
        REQUIRE(v.normal[1] == 1.0f);
        REQUIRE(v.color[3] == 0.4f);
    }

    SECTION("cube edges are listed once each") {
        GpuBufferLayout layout = buildBuffers(makeUnitCube());
        REQUIRE(layout.indexCount == 36);
        // 12 box edges plus one diagonal per face
        REQUIRE(layout.edgeIndexCount == 36);
        REQUIRE(layout.edgeBytes.size() == 36 * sizeof(uint32_t));
    }

    SECTION("invalid meshes are rejected before packing") {
        std::vector<Vertex> verts(3);
        REQUIRE_THROWS_AS(buildBuffers(Mesh(verts, {0, 1, 2, 0})), InvalidMeshError);
        REQUIRE_THROWS_AS(buildBuffers(Mesh(verts, {0, 1, 5})), InvalidMeshError);
    }
}

TEST_CASE("buildBuffers for a model", "[buffers][model]") {
    SECTION("later meshes are rebased onto the concatenated vertices") {
        Model model(makeStrip(1));
        model.meshes.push_back(std::make_shared<const Mesh>(makeStrip(2)));

        GpuBufferLayout layout = buildBuffers(model);
        REQUIRE(layout.vertexCount == 3 + 4);
        REQUIRE(layout.indexCount == 3 + 6);
        REQUIRE(layout.index(3) == 3);
        REQUIRE(layout.index(8) == 6);
    }

    SECTION("empty model") {
        REQUIRE_THROWS_AS(buildBuffers(Model()), InvalidMeshError);
    }

    SECTION("null mesh") {
        Model model;
        model.meshes.push_back(nullptr);
        REQUIRE_THROWS_AS(buildBuffers(model), InvalidMeshError);
    }
}
