// Facet WebGPU - Pipeline Builder
// Fluent API for creating mesh render pipelines with less boilerplate

#pragma once

#include <webgpu/webgpu.h>
#include <cstdint>
#include <string>
#include <vector>

namespace facet::webgpu {

// Pipeline builder with fluent interface
class PipelineBuilder {
public:
    explicit PipelineBuilder(WGPUDevice device);
    ~PipelineBuilder();

    PipelineBuilder(const PipelineBuilder&) = delete;
    PipelineBuilder& operator=(const PipelineBuilder&) = delete;

    // Shader configuration
    PipelineBuilder& shader(const char* wgslSource);
    PipelineBuilder& shader(const std::string& wgslSource);
    PipelineBuilder& vertexEntry(const char* entryPoint);
    PipelineBuilder& fragmentEntry(const char* entryPoint);

    // Vertex input: one interleaved buffer
    PipelineBuilder& vertexLayout(uint64_t stride, std::vector<WGPUVertexAttribute> attributes);

    // Output configuration
    PipelineBuilder& colorTarget(WGPUTextureFormat format);
    PipelineBuilder& depth(WGPUTextureFormat format, WGPUCompareFunction compare = WGPUCompareFunction_Less);

    // Rasterization
    PipelineBuilder& topology(WGPUPrimitiveTopology topology);
    PipelineBuilder& cullMode(WGPUCullMode mode);

    // Group 0 layout, owned by the caller and shared between pipelines
    PipelineBuilder& bindGroupLayout(WGPUBindGroupLayout layout);

    // Build the pipeline (nullptr on failure or without a bind group layout)
    WGPURenderPipeline build();

private:
    void createPipelineLayout();
    void createShaderModule();

    WGPUDevice m_device;
    std::string m_shaderSource;
    std::string m_vertexEntry = "vs_main";
    std::string m_fragmentEntry = "fs_main";
    WGPUTextureFormat m_colorFormat = WGPUTextureFormat_BGRA8UnormSrgb;
    WGPUTextureFormat m_depthFormat = WGPUTextureFormat_Undefined;
    WGPUCompareFunction m_depthCompare = WGPUCompareFunction_Less;
    WGPUPrimitiveTopology m_topology = WGPUPrimitiveTopology_TriangleList;
    WGPUCullMode m_cullMode = WGPUCullMode_Back;

    uint64_t m_vertexStride = 0;
    std::vector<WGPUVertexAttribute> m_attributes;
    WGPUBindGroupLayout m_bindGroupLayout = nullptr;

    // Created resources
    WGPUShaderModule m_shaderModule = nullptr;
    WGPUPipelineLayout m_pipelineLayout = nullptr;
};

} // namespace facet::webgpu
