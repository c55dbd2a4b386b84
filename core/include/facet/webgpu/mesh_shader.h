#pragma once

/**
 * @file mesh_shader.h
 * @brief WGSL source for the shaded and wireframe mesh pipelines
 *
 * Struct layouts must match FrameUniforms, ModelUniforms and GpuVertex in
 * facet/gpu_structs.h.
 */

namespace facet::webgpu {

inline constexpr const char* MESH_SHADER_SOURCE = R"(
struct FrameData {
    view: mat4x4f,
    projection: mat4x4f,
    lightDirection: vec3f,
    lightIntensity: f32,
    lightColor: vec3f,
    ambientIntensity: f32,
    ambientColor: vec3f,
    cameraPos: vec3f,
}

struct DrawData {
    model: mat4x4f,
    normalMatrix: mat4x4f,
}

@group(0) @binding(0) var<uniform> frameData: FrameData;
@group(0) @binding(1) var<uniform> drawData: DrawData;

struct VertexInput {
    @location(0) position: vec3f,
    @location(1) normal: vec3f,
    @location(2) color: vec4f,
}

struct VertexOutput {
    @builtin(position) position: vec4f,
    @location(0) normal: vec3f,
    @location(1) color: vec4f,
}

@vertex
fn vs_main(input: VertexInput) -> VertexOutput {
    var output: VertexOutput;
    let world = drawData.model * vec4f(input.position, 1.0);
    output.position = frameData.projection * frameData.view * world;
    output.normal = (drawData.normalMatrix * vec4f(input.normal, 0.0)).xyz;
    output.color = input.color;
    return output;
}

@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    let n = normalize(input.normal);
    let toLight = normalize(-frameData.lightDirection);
    let diffuse = max(dot(n, toLight), 0.0) * frameData.lightIntensity * frameData.lightColor;
    let ambient = frameData.ambientColor * frameData.ambientIntensity;
    return vec4f(input.color.rgb * (ambient + diffuse), input.color.a);
}

@fragment
fn fs_wire(input: VertexOutput) -> @location(0) vec4f {
    return vec4f(0.0, 0.0, 0.0, 1.0);
}
)";

} // namespace facet::webgpu
