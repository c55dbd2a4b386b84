#include <facet/buffer_builder.h>
#include <facet/errors.h>
#include <facet/gpu_structs.h>

#include <algorithm>
#include <cstring>
#include <set>
#include <utility>

namespace facet {

namespace {

void appendVertices(const Mesh& mesh, std::vector<uint8_t>& out) {
    size_t offset = out.size();
    out.resize(offset + mesh.vertices().size() * sizeof(GpuVertex));

    for (const auto& v : mesh.vertices()) {
        GpuVertex gv;
        gv.position[0] = v.position.x;
        gv.position[1] = v.position.y;
        gv.position[2] = v.position.z;
        gv.normal[0] = v.normal.x;
        gv.normal[1] = v.normal.y;
        gv.normal[2] = v.normal.z;
        gv.color[0] = v.color.r;
        gv.color[1] = v.color.g;
        gv.color[2] = v.color.b;
        gv.color[3] = v.color.a;
        std::memcpy(out.data() + offset, &gv, sizeof(GpuVertex));
        offset += sizeof(GpuVertex);
    }
}

void appendIndices(const std::vector<uint32_t>& indices, std::vector<uint8_t>& out) {
    size_t offset = out.size();
    out.resize(offset + indices.size() * sizeof(uint32_t));
    std::memcpy(out.data() + offset, indices.data(), indices.size() * sizeof(uint32_t));
}

std::vector<uint32_t> uniqueEdges(const std::vector<uint32_t>& indices) {
    std::set<std::pair<uint32_t, uint32_t>> seen;
    std::vector<uint32_t> edges;
    edges.reserve(indices.size() * 2);

    for (size_t t = 0; t + 2 < indices.size(); t += 3) {
        for (int e = 0; e < 3; ++e) {
            uint32_t a = indices[t + e];
            uint32_t b = indices[t + (e + 1) % 3];
            auto key = std::minmax(a, b);
            if (a == b || !seen.insert(key).second) continue;
            edges.push_back(a);
            edges.push_back(b);
        }
    }
    return edges;
}

void finish(GpuBufferLayout& layout, const std::vector<uint32_t>& indices) {
    appendIndices(indices, layout.indexBytes);
    layout.indexCount = static_cast<uint32_t>(indices.size());

    std::vector<uint32_t> edges = uniqueEdges(indices);
    appendIndices(edges, layout.edgeBytes);
    layout.edgeIndexCount = static_cast<uint32_t>(edges.size());
}

} // namespace

uint32_t GpuBufferLayout::index(size_t i) const {
    uint32_t value = 0;
    std::memcpy(&value, indexBytes.data() + i * sizeof(uint32_t), sizeof(uint32_t));
    return value;
}

GpuBufferLayout buildBuffers(const Mesh& mesh) {
    validateMesh(mesh);

    GpuBufferLayout layout;
    appendVertices(mesh, layout.vertexBytes);
    layout.vertexCount = mesh.vertexCount();
    finish(layout, mesh.indices());
    return layout;
}

GpuBufferLayout buildBuffers(const Model& model) {
    if (model.meshes.empty()) {
        throw InvalidMeshError("model has no meshes");
    }

    GpuBufferLayout layout;
    std::vector<uint32_t> indices;
    indices.reserve(model.indexCount());

    for (const auto& mesh : model.meshes) {
        if (!mesh) {
            throw InvalidMeshError("model contains a null mesh");
        }
        validateMesh(*mesh);

        const uint32_t base = layout.vertexCount;
        appendVertices(*mesh, layout.vertexBytes);
        for (uint32_t idx : mesh->indices()) {
            indices.push_back(base + idx);
        }
        layout.vertexCount += mesh->vertexCount();
    }

    finish(layout, indices);
    return layout;
}

} // namespace facet
