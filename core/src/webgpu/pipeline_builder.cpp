// Facet WebGPU - Pipeline Builder Implementation

#include <facet/webgpu/pipeline_builder.h>
#include <facet/webgpu/gpu_common.h>

namespace facet::webgpu {

PipelineBuilder::PipelineBuilder(WGPUDevice device)
    : m_device(device) {}

PipelineBuilder::~PipelineBuilder() {
    // The pipeline is returned to the caller, the bind group layout belongs to it
    release(m_shaderModule);
    release(m_pipelineLayout);
}

PipelineBuilder& PipelineBuilder::shader(const char* wgslSource) {
    m_shaderSource = wgslSource;
    return *this;
}

PipelineBuilder& PipelineBuilder::shader(const std::string& wgslSource) {
    m_shaderSource = wgslSource;
    return *this;
}

PipelineBuilder& PipelineBuilder::vertexEntry(const char* entryPoint) {
    m_vertexEntry = entryPoint;
    return *this;
}

PipelineBuilder& PipelineBuilder::fragmentEntry(const char* entryPoint) {
    m_fragmentEntry = entryPoint;
    return *this;
}

PipelineBuilder& PipelineBuilder::vertexLayout(uint64_t stride, std::vector<WGPUVertexAttribute> attributes) {
    m_vertexStride = stride;
    m_attributes = std::move(attributes);
    return *this;
}

PipelineBuilder& PipelineBuilder::colorTarget(WGPUTextureFormat format) {
    m_colorFormat = format;
    return *this;
}

PipelineBuilder& PipelineBuilder::depth(WGPUTextureFormat format, WGPUCompareFunction compare) {
    m_depthFormat = format;
    m_depthCompare = compare;
    return *this;
}

PipelineBuilder& PipelineBuilder::topology(WGPUPrimitiveTopology topology) {
    m_topology = topology;
    return *this;
}

PipelineBuilder& PipelineBuilder::cullMode(WGPUCullMode mode) {
    m_cullMode = mode;
    return *this;
}

PipelineBuilder& PipelineBuilder::bindGroupLayout(WGPUBindGroupLayout layout) {
    m_bindGroupLayout = layout;
    return *this;
}

void PipelineBuilder::createShaderModule() {
    WGPUShaderSourceWGSL wgslDesc = {};
    wgslDesc.chain.sType = WGPUSType_ShaderSourceWGSL;
    wgslDesc.code = toStringView(m_shaderSource.c_str());

    WGPUShaderModuleDescriptor shaderDesc = {};
    shaderDesc.nextInChain = &wgslDesc.chain;
    shaderDesc.label = toStringView("facet mesh shader");
    m_shaderModule = wgpuDeviceCreateShaderModule(m_device, &shaderDesc);
}

void PipelineBuilder::createPipelineLayout() {
    WGPUPipelineLayoutDescriptor pipelineLayoutDesc = {};
    pipelineLayoutDesc.bindGroupLayoutCount = 1;
    pipelineLayoutDesc.bindGroupLayouts = &m_bindGroupLayout;
    m_pipelineLayout = wgpuDeviceCreatePipelineLayout(m_device, &pipelineLayoutDesc);
}

WGPURenderPipeline PipelineBuilder::build() {
    if (!m_bindGroupLayout) return nullptr;
    createShaderModule();
    if (!m_shaderModule) return nullptr;
    createPipelineLayout();

    WGPUVertexBufferLayout vertexLayout = {};
    vertexLayout.arrayStride = m_vertexStride;
    vertexLayout.stepMode = WGPUVertexStepMode_Vertex;
    vertexLayout.attributeCount = m_attributes.size();
    vertexLayout.attributes = m_attributes.data();

    WGPUColorTargetState colorTarget = {};
    colorTarget.format = m_colorFormat;
    colorTarget.writeMask = WGPUColorWriteMask_All;

    WGPUFragmentState fragmentState = {};
    fragmentState.module = m_shaderModule;
    fragmentState.entryPoint = toStringView(m_fragmentEntry.c_str());
    fragmentState.targetCount = 1;
    fragmentState.targets = &colorTarget;

    WGPUDepthStencilState depthStencil = {};
    depthStencil.format = m_depthFormat;
    depthStencil.depthWriteEnabled = WGPUOptionalBool_True;
    depthStencil.depthCompare = m_depthCompare;
    depthStencil.stencilFront.compare = WGPUCompareFunction_Always;
    depthStencil.stencilFront.failOp = WGPUStencilOperation_Keep;
    depthStencil.stencilFront.depthFailOp = WGPUStencilOperation_Keep;
    depthStencil.stencilFront.passOp = WGPUStencilOperation_Keep;
    depthStencil.stencilBack = depthStencil.stencilFront;
    depthStencil.stencilReadMask = 0;
    depthStencil.stencilWriteMask = 0;

    WGPURenderPipelineDescriptor pipelineDesc = {};
    pipelineDesc.layout = m_pipelineLayout;
    pipelineDesc.vertex.module = m_shaderModule;
    pipelineDesc.vertex.entryPoint = toStringView(m_vertexEntry.c_str());
    if (m_vertexStride > 0) {
        pipelineDesc.vertex.bufferCount = 1;
        pipelineDesc.vertex.buffers = &vertexLayout;
    }
    pipelineDesc.primitive.topology = m_topology;
    pipelineDesc.primitive.frontFace = WGPUFrontFace_CCW;
    pipelineDesc.primitive.cullMode = m_cullMode;
    if (m_depthFormat != WGPUTextureFormat_Undefined) {
        pipelineDesc.depthStencil = &depthStencil;
    }
    pipelineDesc.multisample.count = 1;
    pipelineDesc.multisample.mask = ~0u;
    pipelineDesc.fragment = &fragmentState;

    return wgpuDeviceCreateRenderPipeline(m_device, &pipelineDesc);
}

} // namespace facet::webgpu
