#include <facet/mesh.h>
#include <facet/errors.h>

#include <glm/gtc/matrix_transform.hpp>

#include <algorithm>
#include <cstring>
#include <map>

namespace facet {

// =============================================================================
// Bounds
// =============================================================================

void Bounds::expand(const glm::vec3& p) {
    min = glm::min(min, p);
    max = glm::max(max, p);
}

void Bounds::expand(const Bounds& other) {
    if (other.empty()) return;
    expand(other.min);
    expand(other.max);
}

float Bounds::radius() const {
    if (empty()) return 0.0f;
    return glm::length(max - min) * 0.5f;
}

Bounds Bounds::transformed(const glm::mat4& m) const {
    Bounds result;
    if (empty()) return result;
    for (int i = 0; i < 8; ++i) {
        glm::vec3 corner((i & 1) ? max.x : min.x,
                         (i & 2) ? max.y : min.y,
                         (i & 4) ? max.z : min.z);
        result.expand(glm::vec3(m * glm::vec4(corner, 1.0f)));
    }
    return result;
}

bool Bounds::hits(const Ray& ray) const {
    if (empty()) return false;

    // Slab test
    float tmin = 0.0f;
    float tmax = std::numeric_limits<float>::max();
    for (int axis = 0; axis < 3; ++axis) {
        float o = ray.origin[axis];
        float d = ray.direction[axis];
        if (d == 0.0f) {
            if (o < min[axis] || o > max[axis]) return false;
            continue;
        }
        float t0 = (min[axis] - o) / d;
        float t1 = (max[axis] - o) / d;
        if (t0 > t1) std::swap(t0, t1);
        tmin = std::max(tmin, t0);
        tmax = std::min(tmax, t1);
        if (tmin > tmax) return false;
    }
    return true;
}

// =============================================================================
// Mesh
// =============================================================================

Mesh::Mesh(std::vector<Vertex> vertices, std::vector<uint32_t> indices, std::string name)
    : m_name(std::move(name))
    , m_vertices(std::move(vertices))
    , m_indices(std::move(indices)) {
    for (const auto& v : m_vertices) {
        m_bounds.expand(v.position);
    }
}

Mesh Mesh::recolored(const glm::vec4& color) const {
    std::vector<Vertex> vertices = m_vertices;
    for (auto& v : vertices) {
        v.color = color;
    }
    return Mesh(std::move(vertices), m_indices, m_name);
}

void validateMesh(const Mesh& mesh) {
    const std::string label = mesh.name().empty() ? "mesh" : "mesh '" + mesh.name() + "'";

    if (mesh.vertices().empty()) {
        throw InvalidMeshError(label + " has no vertices");
    }
    if (mesh.indices().empty()) {
        throw InvalidMeshError(label + " has no indices");
    }
    if (mesh.indexCount() % 3 != 0) {
        throw InvalidMeshError(label + ": index count " + std::to_string(mesh.indexCount()) +
                               " is not a multiple of 3");
    }
    const uint32_t vertexCount = mesh.vertexCount();
    for (size_t i = 0; i < mesh.indices().size(); ++i) {
        if (mesh.indices()[i] >= vertexCount) {
            throw InvalidMeshError(label + ": index " + std::to_string(mesh.indices()[i]) +
                                   " at position " + std::to_string(i) +
                                   " is out of range (vertex count " +
                                   std::to_string(vertexCount) + ")");
        }
    }
}

// =============================================================================
// Triangle soup ingestion
// =============================================================================

namespace {

// Vertices are merged on exact bit equality of all attributes
using VertexKey = std::array<uint32_t, 10>;

VertexKey makeKey(const Vertex& v) {
    float values[10] = {
        v.position.x, v.position.y, v.position.z,
        v.normal.x, v.normal.y, v.normal.z,
        v.color.r, v.color.g, v.color.b, v.color.a
    };
    VertexKey key;
    std::memcpy(key.data(), values, sizeof(values));
    return key;
}

} // namespace

Mesh meshFromTriangles(const std::vector<Triangle>& triangles, std::string name) {
    std::vector<Vertex> vertices;
    std::vector<uint32_t> indices;
    std::map<VertexKey, uint32_t> lookup;

    indices.reserve(triangles.size() * 3);

    for (const auto& tri : triangles) {
        for (const auto& p : tri.points) {
            Vertex v(p, tri.normal, tri.color);
            auto [it, inserted] = lookup.emplace(makeKey(v), static_cast<uint32_t>(vertices.size()));
            if (inserted) {
                vertices.push_back(v);
            }
            indices.push_back(it->second);
        }
    }

    return Mesh(std::move(vertices), std::move(indices), std::move(name));
}

Mesh makeUnitCube(const glm::vec4& color) {
    std::vector<Vertex> vertices;
    vertices.reserve(8);
    for (int i = 0; i < 8; ++i) {
        glm::vec3 p((i & 1) ? 0.5f : -0.5f,
                    (i & 2) ? 0.5f : -0.5f,
                    (i & 4) ? 0.5f : -0.5f);
        // Shared corners: the normal points away from the center
        vertices.emplace_back(p, glm::normalize(p), color);
    }

    std::vector<uint32_t> indices = {
        0, 2, 3,  0, 3, 1,  // -Z
        4, 5, 7,  4, 7, 6,  // +Z
        0, 4, 6,  0, 6, 2,  // -X
        1, 3, 7,  1, 7, 5,  // +X
        0, 1, 5,  0, 5, 4,  // -Y
        2, 6, 7,  2, 7, 3   // +Y
    };

    return Mesh(std::move(vertices), std::move(indices), "cube");
}

// =============================================================================
// Transform / Model
// =============================================================================

glm::mat4 Transform::matrix() const {
    glm::mat4 m = glm::translate(glm::mat4(1.0f), translation);
    m *= glm::mat4_cast(rotation);
    m = glm::scale(m, glm::vec3(scale));
    return m;
}

glm::mat4 Transform::normalMatrix() const {
    return glm::mat4(glm::transpose(glm::inverse(glm::mat3(matrix()))));
}

Bounds Model::localBounds() const {
    Bounds b;
    for (const auto& mesh : meshes) {
        if (mesh) b.expand(mesh->bounds());
    }
    return b;
}

uint32_t Model::indexCount() const {
    uint32_t count = 0;
    for (const auto& mesh : meshes) {
        if (mesh) count += mesh->indexCount();
    }
    return count;
}

} // namespace facet
