#pragma once

/**
 * @file webgpu_device.h
 * @brief GpuDevice implementation on wgpu-native
 *
 * Owns the whole WebGPU session: instance, surface, adapter, device, queue,
 * the depth buffer, the mesh pipelines and every buffer created through the
 * GpuDevice interface. Handles are released in reverse acquisition order.
 *
 * The device-lost callback only flags the session; GpuResourceManager turns
 * the flag into a DeviceLostError on its next call.
 */

#include <facet/gpu_device.h>

#include <webgpu/webgpu.h>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace facet::webgpu {

/// Anything that can produce a WGPUSurface for an instance (a window)
class SurfaceSource {
public:
    virtual ~SurfaceSource() = default;
    virtual WGPUSurface createSurface(WGPUInstance instance) = 0;
};

class WebGpuDevice : public GpuDevice {
public:
    /// @throws std::runtime_error if any part of the session cannot be created
    explicit WebGpuDevice(SurfaceSource& source);
    ~WebGpuDevice() override;

    // Non-copyable, non-movable (callbacks hold this)
    WebGpuDevice(const WebGpuDevice&) = delete;
    WebGpuDevice& operator=(const WebGpuDevice&) = delete;

    std::vector<SurfaceFormat> supportedFormats() const override { return m_formats; }
    void configureSurface(const SurfaceConfig& config) override;

    BufferId createBuffer(BufferUsage usage, uint64_t size, const char* label) override;
    void writeBuffer(BufferId buffer, uint64_t offset, const void* data, uint64_t size) override;
    void destroyBuffer(BufferId buffer) override;

    void createPipelines(SurfaceFormat colorFormat) override;
    void bindUniformBuffer(BufferId buffer) override;
    uint32_t uniformAlignment() const override { return m_uniformAlignment; }

    SurfaceStatus acquireSurfaceTexture() override;
    void submit(const DrawList& drawList) override;
    void present() override;

    bool isLost() const override { return m_lost; }

private:
    bool requestAdapter();
    bool requestDevice();
    void queryCapabilities();
    void createBindGroupLayout();
    void createDepthBuffer(uint32_t width, uint32_t height);
    void destroyDepthBuffer();
    void releaseFrame();
    void releasePipelines();
    void shutdown();
    WGPUBuffer lookup(BufferId buffer) const;

    static void onDeviceLost(WGPUDevice const* device, WGPUDeviceLostReason reason,
                             WGPUStringView message, void* userdata1, void* userdata2);
    static void onDeviceError(WGPUDevice const* device, WGPUErrorType type,
                              WGPUStringView message, void* userdata1, void* userdata2);

    WGPUInstance m_instance = nullptr;
    WGPUSurface m_surface = nullptr;
    WGPUAdapter m_adapter = nullptr;
    WGPUDevice m_device = nullptr;
    WGPUQueue m_queue = nullptr;

    std::vector<SurfaceFormat> m_formats;
    WGPUTextureFormat m_surfaceFormat = WGPUTextureFormat_Undefined;
    bool m_surfaceConfigured = false;
    uint32_t m_uniformAlignment = 256;

    // Depth buffer
    WGPUTexture m_depthTexture = nullptr;
    WGPUTextureView m_depthView = nullptr;

    // Pipelines
    WGPUBindGroupLayout m_bindGroupLayout = nullptr;
    WGPUBindGroup m_bindGroup = nullptr;
    WGPURenderPipeline m_shadedPipeline = nullptr;
    WGPURenderPipeline m_wirePipeline = nullptr;

    // Current frame
    WGPUTexture m_frameTexture = nullptr;
    WGPUTextureView m_frameView = nullptr;

    std::unordered_map<BufferId, WGPUBuffer> m_buffers;
    BufferId m_nextBuffer = 1;

    bool m_lost = false;
};

} // namespace facet::webgpu
