#pragma once

/**
 * @file obj_loader.h
 * @brief OBJ import through Assimp
 *
 * Faces with more than three vertices are fan-triangulated around their
 * first vertex. Missing normals are generated as flat face normals. All
 * sub-meshes of the file are merged into one Mesh.
 */

#include <facet/mesh.h>

#include <glm/glm.hpp>
#include <string>

namespace facet {

/**
 * @brief Parse OBJ text
 * @param color Vertex color used when the file carries none
 * @throws InvalidMeshError if the text cannot be imported or holds no triangles
 */
Mesh parseObj(const std::string& text, const glm::vec4& color = glm::vec4(0.8f, 0.8f, 0.8f, 1.0f),
              const std::string& name = "obj");

/**
 * @brief Load an OBJ file
 * @throws InvalidMeshError if the file cannot be read or imported
 */
Mesh loadObj(const std::string& path, const glm::vec4& color = glm::vec4(0.8f, 0.8f, 0.8f, 1.0f));

} // namespace facet
