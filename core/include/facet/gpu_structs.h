#pragma once

/**
 * @file gpu_structs.h
 * @brief GPU vertex and uniform structures
 *
 * Struct definitions that match the WGSL layouts in the mesh shader.
 * All structs have static_assert size checks to ensure alignment.
 */

#include <glm/glm.hpp>
#include <glm/gtc/type_ptr.hpp>
#include <cstdint>
#include <cstring>

namespace facet {

// Vertex record (40 bytes, tightly packed)
struct GpuVertex {
    float position[3];    // 12 bytes, offset 0
    float normal[3];      // 12 bytes, offset 12
    float color[4];       // 16 bytes, offset 24
};

static_assert(sizeof(GpuVertex) == 40, "GpuVertex struct must be 40 bytes");

// Per-frame uniform block (binding 0, offset 0 of the uniform buffer)
struct FrameUniforms {
    float view[16];             // mat4x4f: 64 bytes, offset 0
    float projection[16];       // mat4x4f: 64 bytes, offset 64
    float lightDirection[3];    // vec3f: 12 bytes, offset 128 (direction the light travels)
    float lightIntensity;       // f32: 4 bytes, offset 140
    float lightColor[3];        // vec3f: 12 bytes, offset 144
    float ambientIntensity;     // f32: 4 bytes, offset 156
    float ambientColor[3];      // vec3f: 12 bytes, offset 160
    float _pad0;                // 4 bytes, offset 172
    float cameraPos[3];         // vec3f: 12 bytes, offset 176
    float _pad1;                // 4 bytes, offset 188
};                              // Total: 192 bytes

static_assert(sizeof(FrameUniforms) == 192, "FrameUniforms struct must be 192 bytes");

// Per-model uniform slot (binding 1, dynamic offset)
struct ModelUniforms {
    float model[16];            // mat4x4f: 64 bytes, offset 0
    float normalMatrix[16];     // mat4x4f: 64 bytes, offset 64
};                              // Total: 128 bytes

static_assert(sizeof(ModelUniforms) == 128, "ModelUniforms struct must be 128 bytes");

inline void copyMat4(float (&dst)[16], const glm::mat4& m) {
    std::memcpy(dst, glm::value_ptr(m), sizeof(dst));
}

inline void copyVec3(float (&dst)[3], const glm::vec3& v) {
    dst[0] = v.x;
    dst[1] = v.y;
    dst[2] = v.z;
}

} // namespace facet
