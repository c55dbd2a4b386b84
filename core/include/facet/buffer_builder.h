#pragma once

/**
 * @file buffer_builder.h
 * @brief Converts meshes into GPU-ready byte layouts
 *
 * The builder is a pure transform: it validates the mesh, packs vertices
 * into 40-byte GpuVertex records and indices into uint32 values, and derives
 * a line-list index buffer of unique edges for the wireframe overlay. It
 * never touches GPU handles; GpuResourceManager::uploadMesh() does that.
 */

#include <facet/mesh.h>

#include <cstdint>
#include <vector>

namespace facet {

/// Packed vertex/index bytes for one drawable
struct GpuBufferLayout {
    std::vector<uint8_t> vertexBytes;   ///< GpuVertex records, tightly packed
    std::vector<uint8_t> indexBytes;    ///< uint32 triangle indices
    std::vector<uint8_t> edgeBytes;     ///< uint32 line-list indices, each edge once

    uint32_t vertexCount = 0;
    uint32_t indexCount = 0;
    uint32_t edgeIndexCount = 0;

    uint32_t triangleCount() const { return indexCount / 3; }

    /// Decoded index at position i (for inspection and tests)
    uint32_t index(size_t i) const;
};

/**
 * @brief Pack a single mesh
 * @throws InvalidMeshError if the mesh violates its invariants
 */
GpuBufferLayout buildBuffers(const Mesh& mesh);

/**
 * @brief Pack every mesh of a model into one layout
 *
 * Indices of later meshes are rebased onto the concatenated vertex array,
 * so the whole model is drawn with one indexed draw call.
 *
 * @throws InvalidMeshError if the model has no meshes or any mesh is invalid
 */
GpuBufferLayout buildBuffers(const Model& model);

} // namespace facet
