#pragma once

/**
 * @file mesh.h
 * @brief Triangulated surface data model (vertices, meshes, models)
 *
 * Meshes are immutable once constructed and shared between the scene and
 * anything that reads it through std::shared_ptr<const Mesh>. A displayed
 * model is replaced wholesale when its geometry changes.
 *
 * Normals are taken as supplied. Producers are expected to hand in unit or
 * near-unit normals; nothing in facet renormalizes them.
 */

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include <array>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace facet {

/// Vertex attributes: position, normal, RGBA color in [0, 1]
struct Vertex {
    glm::vec3 position;
    glm::vec3 normal;
    glm::vec4 color;

    Vertex() : position(0), normal(0, 1, 0), color(1) {}

    Vertex(glm::vec3 pos, glm::vec3 norm)
        : position(pos), normal(norm), color(1) {}

    Vertex(glm::vec3 pos, glm::vec3 norm, glm::vec4 col)
        : position(pos), normal(norm), color(col) {}
};

/// Half line in world space; direction is unit length
struct Ray {
    glm::vec3 origin = glm::vec3(0);
    glm::vec3 direction = glm::vec3(0, 0, -1);
};

/// Axis-aligned bounding box. A default constructed box is empty.
struct Bounds {
    glm::vec3 min = glm::vec3(std::numeric_limits<float>::max());
    glm::vec3 max = glm::vec3(std::numeric_limits<float>::lowest());

    bool empty() const { return min.x > max.x || min.y > max.y || min.z > max.z; }

    void expand(const glm::vec3& p);
    void expand(const Bounds& other);

    glm::vec3 center() const { return (min + max) * 0.5f; }
    glm::vec3 size() const { return max - min; }

    /// Radius of the bounding sphere around center(); 0 for an empty box
    float radius() const;

    /// Bounds of the eight corners after applying a transform
    Bounds transformed(const glm::mat4& m) const;

    /// True if the ray enters the box in front of its origin (or starts inside)
    bool hits(const Ray& ray) const;
};

/// Indexed triangle mesh (3 indices per triangle)
class Mesh {
public:
    Mesh() = default;
    Mesh(std::vector<Vertex> vertices, std::vector<uint32_t> indices,
         std::string name = "");

    const std::string& name() const { return m_name; }
    const std::vector<Vertex>& vertices() const { return m_vertices; }
    const std::vector<uint32_t>& indices() const { return m_indices; }

    uint32_t vertexCount() const { return static_cast<uint32_t>(m_vertices.size()); }
    uint32_t indexCount() const { return static_cast<uint32_t>(m_indices.size()); }
    uint32_t triangleCount() const { return indexCount() / 3; }

    /// Bounds of all vertex positions (computed once)
    const Bounds& bounds() const { return m_bounds; }

    /// Copy of this mesh with every vertex color replaced
    Mesh recolored(const glm::vec4& color) const;

private:
    std::string m_name;
    std::vector<Vertex> m_vertices;
    std::vector<uint32_t> m_indices;
    Bounds m_bounds;
};

/**
 * @brief Check the structural mesh invariants
 *
 * @throws InvalidMeshError if the vertex or index sequence is empty, the
 *         index count is not a multiple of 3, or an index is out of range
 */
void validateMesh(const Mesh& mesh);

/// One triangle of a triangle soup, as produced by a geometry kernel
struct Triangle {
    std::array<glm::vec3, 3> points;
    glm::vec3 normal = glm::vec3(0, 0, 1);
    glm::vec4 color = glm::vec4(1);
};

/// Build an indexed mesh from a triangle soup, merging identical vertices
Mesh meshFromTriangles(const std::vector<Triangle>& triangles, std::string name = "");

/// Axis aligned unit cube centered at the origin (8 vertices, 12 triangles)
Mesh makeUnitCube(const glm::vec4& color = glm::vec4(1));

/// Rigid transform with uniform scale
struct Transform {
    glm::quat rotation = glm::quat(1, 0, 0, 0);
    glm::vec3 translation = glm::vec3(0);
    float scale = 1.0f;

    glm::mat4 matrix() const;

    /// Inverse transpose of the upper 3x3, padded to a mat4 for uniforms
    glm::mat4 normalMatrix() const;
};

/// One or more meshes drawn with a shared transform
struct Model {
    std::vector<std::shared_ptr<const Mesh>> meshes;
    Transform transform;

    Model() = default;
    explicit Model(Mesh mesh, Transform t = Transform())
        : transform(t) {
        meshes.push_back(std::make_shared<const Mesh>(std::move(mesh)));
    }

    /// Bounds in model space
    Bounds localBounds() const;

    /// Bounds after applying the transform
    Bounds worldBounds() const { return localBounds().transformed(transform.matrix()); }

    uint32_t indexCount() const;
};

} // namespace facet
