#include <facet/webgpu/webgpu_device.h>
#include <facet/webgpu/gpu_common.h>
#include <facet/webgpu/mesh_shader.h>
#include <facet/webgpu/pipeline_builder.h>
#include <facet/errors.h>
#include <facet/gpu_structs.h>

#include <webgpu/wgpu.h>  // wgpu-native extensions (wgpuDevicePoll)

#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>

namespace facet::webgpu {

namespace {

constexpr WGPUTextureFormat kDepthFormat = WGPUTextureFormat_Depth24Plus;

} // namespace

// =============================================================================
// Session setup
// =============================================================================

WebGpuDevice::WebGpuDevice(SurfaceSource& source) {
    WGPUInstanceDescriptor instanceDesc = {};
    m_instance = wgpuCreateInstance(&instanceDesc);
    if (!m_instance) {
        throw std::runtime_error("[WebGpuDevice] Failed to create WebGPU instance");
    }

    m_surface = source.createSurface(m_instance);
    if (!m_surface) {
        shutdown();
        throw std::runtime_error("[WebGpuDevice] Failed to create surface");
    }

    if (!requestAdapter()) {
        shutdown();
        throw std::runtime_error("[WebGpuDevice] Failed to get adapter");
    }
    std::cout << "[WebGpuDevice] Adapter acquired" << std::endl;

    if (!requestDevice()) {
        shutdown();
        throw std::runtime_error("[WebGpuDevice] Failed to get device");
    }
    std::cout << "[WebGpuDevice] Device acquired" << std::endl;

    m_queue = wgpuDeviceGetQueue(m_device);

    WGPULimits limits = {};
    if (wgpuDeviceGetLimits(m_device, &limits) == WGPUStatus_Success &&
        limits.minUniformBufferOffsetAlignment > 0) {
        m_uniformAlignment = limits.minUniformBufferOffsetAlignment;
    }

    queryCapabilities();
    if (m_formats.empty()) {
        shutdown();
        throw std::runtime_error("[WebGpuDevice] Surface supports no usable color format");
    }

    createBindGroupLayout();
    std::cout << "[WebGpuDevice] WebGPU initialized (" << m_formats.size()
              << " surface formats, uniform alignment " << m_uniformAlignment << ")" << std::endl;
}

WebGpuDevice::~WebGpuDevice() {
    shutdown();
}

bool WebGpuDevice::requestAdapter() {
    WGPURequestAdapterOptions options = {};
    options.compatibleSurface = m_surface;
    options.powerPreference = WGPUPowerPreference_HighPerformance;

    struct AdapterUserData {
        WGPUAdapter adapter = nullptr;
        bool done = false;
    } userData;

    WGPURequestAdapterCallbackInfo callbackInfo = {};
    callbackInfo.mode = WGPUCallbackMode_AllowProcessEvents;
    callbackInfo.callback = [](WGPURequestAdapterStatus status, WGPUAdapter adapter,
                               WGPUStringView message, void* userdata1, void* userdata2) {
        auto* data = static_cast<AdapterUserData*>(userdata1);
        if (status == WGPURequestAdapterStatus_Success) {
            data->adapter = adapter;
        } else {
            std::cerr << "[WebGpuDevice] Adapter request failed: " << fromStringView(message) << std::endl;
        }
        data->done = true;
    };
    callbackInfo.userdata1 = &userData;
    callbackInfo.userdata2 = nullptr;

    wgpuInstanceRequestAdapter(m_instance, &options, callbackInfo);

    // Process events until callback fires
    while (!userData.done) {
        wgpuInstanceProcessEvents(m_instance);
    }

    m_adapter = userData.adapter;
    return m_adapter != nullptr;
}

bool WebGpuDevice::requestDevice() {
    WGPUDeviceDescriptor deviceDesc = {};
    deviceDesc.label = toStringView("facet device");

    deviceDesc.deviceLostCallbackInfo.mode = WGPUCallbackMode_AllowProcessEvents;
    deviceDesc.deviceLostCallbackInfo.callback = onDeviceLost;
    deviceDesc.deviceLostCallbackInfo.userdata1 = this;
    deviceDesc.uncapturedErrorCallbackInfo.callback = onDeviceError;
    deviceDesc.uncapturedErrorCallbackInfo.userdata1 = this;

    struct DeviceUserData {
        WGPUDevice device = nullptr;
        bool done = false;
    } userData;

    WGPURequestDeviceCallbackInfo callbackInfo = {};
    callbackInfo.mode = WGPUCallbackMode_AllowProcessEvents;
    callbackInfo.callback = [](WGPURequestDeviceStatus status, WGPUDevice device,
                               WGPUStringView message, void* userdata1, void* userdata2) {
        auto* data = static_cast<DeviceUserData*>(userdata1);
        if (status == WGPURequestDeviceStatus_Success) {
            data->device = device;
        } else {
            std::cerr << "[WebGpuDevice] Device request failed: " << fromStringView(message) << std::endl;
        }
        data->done = true;
    };
    callbackInfo.userdata1 = &userData;
    callbackInfo.userdata2 = nullptr;

    wgpuAdapterRequestDevice(m_adapter, &deviceDesc, callbackInfo);

    while (!userData.done) {
        wgpuInstanceProcessEvents(m_instance);
    }

    m_device = userData.device;
    return m_device != nullptr;
}

void WebGpuDevice::queryCapabilities() {
    WGPUSurfaceCapabilities capabilities = {};
    wgpuSurfaceGetCapabilities(m_surface, m_adapter, &capabilities);

    // Keep the surface's preference order, dropping formats we cannot render to
    for (size_t i = 0; i < capabilities.formatCount; ++i) {
        if (auto format = fromWGPUFormat(capabilities.formats[i])) {
            m_formats.push_back(*format);
        }
    }

    wgpuSurfaceCapabilitiesFreeMembers(capabilities);
}

void WebGpuDevice::onDeviceLost(WGPUDevice const* device, WGPUDeviceLostReason reason,
                                WGPUStringView message, void* userdata1, void* userdata2) {
    // Destroyed is our own teardown, not a loss
    if (reason == WGPUDeviceLostReason_Destroyed) return;

    auto* self = static_cast<WebGpuDevice*>(userdata1);
    std::cerr << "[WebGpuDevice] Device lost: " << fromStringView(message) << std::endl;
    if (self) self->m_lost = true;
}

void WebGpuDevice::onDeviceError(WGPUDevice const* device, WGPUErrorType type,
                                 WGPUStringView message, void* userdata1, void* userdata2) {
    std::cerr << "[WebGpuDevice] WebGPU error (" << static_cast<int>(type) << "): "
              << fromStringView(message) << std::endl;
}

// =============================================================================
// Surface
// =============================================================================

void WebGpuDevice::configureSurface(const SurfaceConfig& config) {
    bool supported = false;
    for (SurfaceFormat f : m_formats) {
        if (f == config.format) supported = true;
    }
    if (!supported) {
        throw SurfaceConfigError(std::string("surface does not support ") +
                                 surfaceFormatName(config.format));
    }

    releaseFrame();

    m_surfaceFormat = toWGPUFormat(config.format);

    WGPUSurfaceConfiguration surfaceConfig = {};
    surfaceConfig.device = m_device;
    surfaceConfig.format = m_surfaceFormat;
    surfaceConfig.usage = WGPUTextureUsage_RenderAttachment;
    surfaceConfig.width = config.width;
    surfaceConfig.height = config.height;
    surfaceConfig.presentMode = toWGPUPresentMode(config.presentMode);
    surfaceConfig.alphaMode = WGPUCompositeAlphaMode_Auto;
    wgpuSurfaceConfigure(m_surface, &surfaceConfig);
    m_surfaceConfigured = true;

    destroyDepthBuffer();
    createDepthBuffer(config.width, config.height);
}

void WebGpuDevice::createDepthBuffer(uint32_t width, uint32_t height) {
    WGPUTextureDescriptor depthDesc = {};
    depthDesc.label = toStringView("facet depth");
    depthDesc.size.width = width;
    depthDesc.size.height = height;
    depthDesc.size.depthOrArrayLayers = 1;
    depthDesc.mipLevelCount = 1;
    depthDesc.sampleCount = 1;
    depthDesc.dimension = WGPUTextureDimension_2D;
    depthDesc.format = kDepthFormat;
    depthDesc.usage = WGPUTextureUsage_RenderAttachment;
    m_depthTexture = wgpuDeviceCreateTexture(m_device, &depthDesc);

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = kDepthFormat;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.mipLevelCount = 1;
    viewDesc.arrayLayerCount = 1;
    viewDesc.aspect = WGPUTextureAspect_DepthOnly;
    m_depthView = wgpuTextureCreateView(m_depthTexture, &viewDesc);
}

void WebGpuDevice::destroyDepthBuffer() {
    release(m_depthView);
    release(m_depthTexture);
}

// =============================================================================
// Buffers
// =============================================================================

BufferId WebGpuDevice::createBuffer(BufferUsage usage, uint64_t size, const char* label) {
    WGPUBufferDescriptor desc = {};
    desc.label = toStringView(label);
    desc.size = size;
    switch (usage) {
        case BufferUsage::Vertex:  desc.usage = WGPUBufferUsage_Vertex | WGPUBufferUsage_CopyDst; break;
        case BufferUsage::Index:   desc.usage = WGPUBufferUsage_Index | WGPUBufferUsage_CopyDst; break;
        case BufferUsage::Uniform: desc.usage = WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst; break;
    }

    WGPUBuffer buffer = wgpuDeviceCreateBuffer(m_device, &desc);
    if (!buffer) {
        throw std::runtime_error(std::string("[WebGpuDevice] Failed to create buffer ") + label);
    }

    BufferId id = m_nextBuffer++;
    m_buffers[id] = buffer;
    return id;
}

WGPUBuffer WebGpuDevice::lookup(BufferId buffer) const {
    auto it = m_buffers.find(buffer);
    if (it == m_buffers.end()) {
        throw std::out_of_range("[WebGpuDevice] Unknown buffer id " + std::to_string(buffer));
    }
    return it->second;
}

void WebGpuDevice::writeBuffer(BufferId buffer, uint64_t offset, const void* data, uint64_t size) {
    wgpuQueueWriteBuffer(m_queue, lookup(buffer), offset, data, size);
}

void WebGpuDevice::destroyBuffer(BufferId buffer) {
    auto it = m_buffers.find(buffer);
    if (it == m_buffers.end()) return;
    release(it->second);
    m_buffers.erase(it);
}

// =============================================================================
// Pipelines
// =============================================================================

void WebGpuDevice::createBindGroupLayout() {
    WGPUBindGroupLayoutEntry entries[2] = {};

    entries[0].binding = 0;
    entries[0].visibility = WGPUShaderStage_Vertex | WGPUShaderStage_Fragment;
    entries[0].buffer.type = WGPUBufferBindingType_Uniform;
    entries[0].buffer.minBindingSize = sizeof(FrameUniforms);

    entries[1].binding = 1;
    entries[1].visibility = WGPUShaderStage_Vertex;
    entries[1].buffer.type = WGPUBufferBindingType_Uniform;
    entries[1].buffer.hasDynamicOffset = true;
    entries[1].buffer.minBindingSize = sizeof(ModelUniforms);

    WGPUBindGroupLayoutDescriptor layoutDesc = {};
    layoutDesc.label = toStringView("facet uniforms layout");
    layoutDesc.entryCount = 2;
    layoutDesc.entries = entries;
    m_bindGroupLayout = wgpuDeviceCreateBindGroupLayout(m_device, &layoutDesc);
}

void WebGpuDevice::bindUniformBuffer(BufferId buffer) {
    release(m_bindGroup);

    WGPUBuffer uniformBuffer = lookup(buffer);

    WGPUBindGroupEntry entries[2] = {};
    entries[0].binding = 0;
    entries[0].buffer = uniformBuffer;
    entries[0].offset = 0;
    entries[0].size = sizeof(FrameUniforms);

    entries[1].binding = 1;
    entries[1].buffer = uniformBuffer;
    entries[1].offset = 0;
    entries[1].size = sizeof(ModelUniforms);

    WGPUBindGroupDescriptor desc = {};
    desc.label = toStringView("facet uniforms");
    desc.layout = m_bindGroupLayout;
    desc.entryCount = 2;
    desc.entries = entries;
    m_bindGroup = wgpuDeviceCreateBindGroup(m_device, &desc);
}

void WebGpuDevice::createPipelines(SurfaceFormat colorFormat) {
    releasePipelines();

    std::vector<WGPUVertexAttribute> attributes(3);
    attributes[0] = {};
    attributes[0].format = WGPUVertexFormat_Float32x3;
    attributes[0].offset = offsetof(GpuVertex, position);
    attributes[0].shaderLocation = 0;
    attributes[1] = {};
    attributes[1].format = WGPUVertexFormat_Float32x3;
    attributes[1].offset = offsetof(GpuVertex, normal);
    attributes[1].shaderLocation = 1;
    attributes[2] = {};
    attributes[2].format = WGPUVertexFormat_Float32x4;
    attributes[2].offset = offsetof(GpuVertex, color);
    attributes[2].shaderLocation = 2;

    const WGPUTextureFormat format = toWGPUFormat(colorFormat);

    // Shader errors surface as validation errors; capture them instead of
    // letting the uncaptured-error callback print and carry on
    wgpuDevicePushErrorScope(m_device, WGPUErrorFilter_Validation);

    PipelineBuilder shaded(m_device);
    m_shadedPipeline = shaded.shader(MESH_SHADER_SOURCE)
        .vertexEntry("vs_main")
        .fragmentEntry("fs_main")
        .vertexLayout(sizeof(GpuVertex), attributes)
        .colorTarget(format)
        .depth(kDepthFormat, WGPUCompareFunction_Less)
        .topology(WGPUPrimitiveTopology_TriangleList)
        .cullMode(WGPUCullMode_Back)
        .bindGroupLayout(m_bindGroupLayout)
        .build();

    // Wireframe draws over the shaded surface, so equal depth must pass
    PipelineBuilder wire(m_device);
    m_wirePipeline = wire.shader(MESH_SHADER_SOURCE)
        .vertexEntry("vs_main")
        .fragmentEntry("fs_wire")
        .vertexLayout(sizeof(GpuVertex), attributes)
        .colorTarget(format)
        .depth(kDepthFormat, WGPUCompareFunction_LessEqual)
        .topology(WGPUPrimitiveTopology_LineList)
        .cullMode(WGPUCullMode_None)
        .bindGroupLayout(m_bindGroupLayout)
        .build();

    struct ScopeResult {
        bool done = false;
        bool failed = false;
        std::string message;
    } result;

    WGPUPopErrorScopeCallbackInfo scopeInfo = {};
    scopeInfo.mode = WGPUCallbackMode_AllowProcessEvents;
    scopeInfo.callback = [](WGPUPopErrorScopeStatus status, WGPUErrorType type,
                            WGPUStringView message, void* userdata1, void* userdata2) {
        auto* data = static_cast<ScopeResult*>(userdata1);
        if (status == WGPUPopErrorScopeStatus_Success && type != WGPUErrorType_NoError) {
            data->failed = true;
            data->message = fromStringView(message);
        }
        data->done = true;
    };
    scopeInfo.userdata1 = &result;
    scopeInfo.userdata2 = nullptr;
    wgpuDevicePopErrorScope(m_device, scopeInfo);

    while (!result.done) {
        wgpuInstanceProcessEvents(m_instance);
        wgpuDevicePoll(m_device, false, nullptr);
    }

    if (result.failed || !m_shadedPipeline || !m_wirePipeline) {
        releasePipelines();
        throw ShaderCompileError("mesh pipeline creation failed: " +
                                 (result.message.empty() ? std::string("no pipeline returned") : result.message));
    }

    std::cout << "[WebGpuDevice] Mesh pipelines built for " << surfaceFormatName(colorFormat) << std::endl;
}

void WebGpuDevice::releasePipelines() {
    release(m_wirePipeline);
    release(m_shadedPipeline);
}

// =============================================================================
// Frames
// =============================================================================

SurfaceStatus WebGpuDevice::acquireSurfaceTexture() {
    if (m_lost) return SurfaceStatus::DeviceLost;
    releaseFrame();

    WGPUSurfaceTexture surfaceTexture = {};
    wgpuSurfaceGetCurrentTexture(m_surface, &surfaceTexture);

    SurfaceStatus status;
    switch (surfaceTexture.status) {
        case WGPUSurfaceGetCurrentTextureStatus_SuccessOptimal:
            status = SurfaceStatus::Success;
            break;
        case WGPUSurfaceGetCurrentTextureStatus_SuccessSuboptimal:
            status = SurfaceStatus::Suboptimal;
            break;
        case WGPUSurfaceGetCurrentTextureStatus_Timeout:
            status = SurfaceStatus::Timeout;
            break;
        case WGPUSurfaceGetCurrentTextureStatus_Outdated:
            status = SurfaceStatus::Outdated;
            break;
        case WGPUSurfaceGetCurrentTextureStatus_Lost:
            status = SurfaceStatus::Lost;
            break;
        default:
            status = m_lost ? SurfaceStatus::DeviceLost : SurfaceStatus::Error;
            break;
    }

    if (status != SurfaceStatus::Success && status != SurfaceStatus::Suboptimal) {
        if (surfaceTexture.texture) {
            wgpuTextureRelease(surfaceTexture.texture);
        }
        return status;
    }

    m_frameTexture = surfaceTexture.texture;

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = m_surfaceFormat;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.mipLevelCount = 1;
    viewDesc.arrayLayerCount = 1;
    viewDesc.aspect = WGPUTextureAspect_All;
    m_frameView = wgpuTextureCreateView(m_frameTexture, &viewDesc);

    return m_frameView ? status : SurfaceStatus::Error;
}

void WebGpuDevice::submit(const DrawList& drawList) {
    if (!m_frameView) {
        std::cerr << "[WebGpuDevice] submit without an acquired frame" << std::endl;
        return;
    }

    WGPUCommandEncoderDescriptor encoderDesc = {};
    encoderDesc.label = toStringView("facet frame");
    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(m_device, &encoderDesc);

    WGPURenderPassColorAttachment colorAttachment = {};
    colorAttachment.view = m_frameView;
    colorAttachment.loadOp = WGPULoadOp_Clear;
    colorAttachment.storeOp = WGPUStoreOp_Store;
    colorAttachment.clearValue = {drawList.clearColor.r, drawList.clearColor.g,
                                  drawList.clearColor.b, drawList.clearColor.a};
    colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;

    WGPURenderPassDepthStencilAttachment depthAttachment = {};
    depthAttachment.view = m_depthView;
    depthAttachment.depthLoadOp = WGPULoadOp_Clear;
    depthAttachment.depthStoreOp = WGPUStoreOp_Store;
    depthAttachment.depthClearValue = 1.0f;

    WGPURenderPassDescriptor passDesc = {};
    passDesc.colorAttachmentCount = 1;
    passDesc.colorAttachments = &colorAttachment;
    passDesc.depthStencilAttachment = &depthAttachment;

    WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &passDesc);

    for (const DrawCommand& cmd : drawList.commands) {
        WGPURenderPipeline pipeline =
            cmd.pipeline == PipelineKind::Wireframe ? m_wirePipeline : m_shadedPipeline;
        wgpuRenderPassEncoderSetPipeline(pass, pipeline);
        wgpuRenderPassEncoderSetBindGroup(pass, 0, m_bindGroup, 1, &cmd.uniformOffset);
        wgpuRenderPassEncoderSetVertexBuffer(pass, 0, lookup(cmd.vertexBuffer), 0, cmd.vertexBytes);
        wgpuRenderPassEncoderSetIndexBuffer(pass, lookup(cmd.indexBuffer), WGPUIndexFormat_Uint32,
                                            0, cmd.indexBytes);
        wgpuRenderPassEncoderDrawIndexed(pass, cmd.indexCount, 1, 0, 0, 0);
    }

    wgpuRenderPassEncoderEnd(pass);
    wgpuRenderPassEncoderRelease(pass);

    WGPUCommandBufferDescriptor cmdDesc = {};
    WGPUCommandBuffer commands = wgpuCommandEncoderFinish(encoder, &cmdDesc);
    wgpuQueueSubmit(m_queue, 1, &commands);
    wgpuCommandBufferRelease(commands);
    wgpuCommandEncoderRelease(encoder);
}

void WebGpuDevice::present() {
    if (!m_frameTexture) return;
    wgpuSurfacePresent(m_surface);
    releaseFrame();

    // Deliver device-lost and error callbacks raised by this frame
    wgpuInstanceProcessEvents(m_instance);
}

void WebGpuDevice::releaseFrame() {
    release(m_frameView);
    // Surface textures are owned by the surface: release, never destroy
    if (m_frameTexture) {
        wgpuTextureRelease(m_frameTexture);
        m_frameTexture = nullptr;
    }
}

// =============================================================================
// Teardown
// =============================================================================

void WebGpuDevice::shutdown() {
    releaseFrame();
    for (auto& [id, buffer] : m_buffers) {
        release(buffer);
    }
    m_buffers.clear();
    release(m_bindGroup);
    releasePipelines();
    release(m_bindGroupLayout);
    destroyDepthBuffer();
    if (m_surfaceConfigured && m_surface) {
        wgpuSurfaceUnconfigure(m_surface);
        m_surfaceConfigured = false;
    }
    release(m_queue);
    release(m_device);
    release(m_adapter);
    release(m_surface);
    release(m_instance);
}

} // namespace facet::webgpu
