#pragma once

/**
 * @file gpu_resources.h
 * @brief GPU Resource Manager: surface, pipelines, mesh and uniform buffers
 *
 * Owns a GpuDevice and everything allocated on it. Each manager has a
 * generation number stamped into the MeshHandles it hands out; after a
 * device loss the manager is discarded and rebuilt, and handles from the
 * old session are recognized as stale instead of dereferenced.
 *
 * Uniform buffer layout (one buffer per manager):
 * @code
 *   offset 0              FrameUniforms (view, projection, lights)
 *   offset stride * 1     ModelUniforms for model 0
 *   offset stride * 2     ModelUniforms for model 1
 *   ...
 * @endcode
 * where stride is the device's dynamic offset alignment.
 */

#include <facet/buffer_builder.h>
#include <facet/gpu_device.h>
#include <facet/scene.h>

#include <glm/glm.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace facet {

/// GPU buffers backing one model
struct MeshHandle {
    BufferId vertexBuffer = kInvalidBuffer;
    BufferId indexBuffer = kInvalidBuffer;
    BufferId edgeBuffer = kInvalidBuffer;
    uint64_t vertexCapacity = 0;
    uint64_t indexCapacity = 0;
    uint64_t edgeCapacity = 0;
    uint64_t vertexBytes = 0;
    uint64_t indexBytes = 0;
    uint64_t edgeBytes = 0;
    uint32_t indexCount = 0;
    uint32_t edgeIndexCount = 0;
    uint64_t managerGeneration = 0;   ///< 0 means "never uploaded"

    bool valid() const { return managerGeneration != 0 && vertexBuffer != kInvalidBuffer; }
};

struct GpuResourceSettings {
    SurfaceFormat preferredFormat = SurfaceFormat::BGRA8UnormSrgb;
    PresentMode presentMode = PresentMode::Fifo;
    uint32_t initialModelSlots = 16;
    bool verbose = false;
};

/// Counters for logging and tests
struct GpuResourceStats {
    uint64_t buffersCreated = 0;
    uint64_t buffersDestroyed = 0;
    uint64_t inPlaceUploads = 0;
    uint64_t reallocations = 0;
    uint64_t surfaceConfigurations = 0;
    uint64_t pipelineBuilds = 0;
    uint64_t acquireRetries = 0;
    uint64_t droppedFrames = 0;
};

class GpuResourceManager {
public:
    /**
     * @brief Take ownership of a device and allocate the uniform buffer
     * @throws std::invalid_argument if device is null
     */
    GpuResourceManager(std::unique_ptr<GpuDevice> device, GpuResourceSettings settings = {});
    ~GpuResourceManager();

    // Non-copyable
    GpuResourceManager(const GpuResourceManager&) = delete;
    GpuResourceManager& operator=(const GpuResourceManager&) = delete;

    // -------------------------------------------------------------------------
    /// @name Surface
    /// @{

    /**
     * @brief (Re)configure the surface and rebuild pipelines if the format changed
     * @throws SurfaceConfigError if the current format is not supported
     * @throws ShaderCompileError if pipeline construction fails
     */
    void configureSurface(uint32_t width, uint32_t height);

    /// Switch to the first format the device supports
    /// @throws SurfaceConfigError if the device supports none
    void useFallbackFormat();

    bool surfaceConfigured() const { return m_configured; }
    uint32_t surfaceWidth() const { return m_width; }
    uint32_t surfaceHeight() const { return m_height; }
    SurfaceFormat format() const { return m_format; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Buffers
    /// @{

    /**
     * @brief Upload a layout, reusing existing's buffers when they are large enough
     *
     * Buffers of a handle from this manager are overwritten in place when the
     * new data fits and reallocated otherwise. Handles from another
     * generation are treated as empty.
     */
    MeshHandle uploadMesh(const GpuBufferLayout& layout, const MeshHandle& existing = MeshHandle());

    /// Free a handle's buffers (no-op for stale or empty handles)
    void releaseMesh(MeshHandle& handle);

    /// True if the handle was issued by this manager
    bool owns(const MeshHandle& handle) const { return handle.managerGeneration == m_generation; }

    /// Write frame and per-model uniforms; model i is read at modelUniformOffset(i)
    void updateUniforms(const glm::mat4& view, const glm::mat4& projection,
                        const std::vector<glm::mat4>& modelTransforms, const Lights& lights);

    uint32_t modelUniformOffset(size_t modelIndex) const;

    /// @}
    // -------------------------------------------------------------------------
    /// @name Frames
    /// @{

    /**
     * @brief Acquire the next presentable image
     *
     * Outdated, lost or timed out surfaces are reconfigured and retried once.
     * A second failure drops the frame (empty result).
     *
     * @throws DeviceLostError if the device is gone
     */
    std::optional<FrameTarget> acquireFrame();

    /// @throws DeviceLostError if the device is lost during submission
    void submitAndPresent(const DrawList& drawList, const FrameTarget& frame);

    /// @}

    uint64_t generation() const { return m_generation; }
    const GpuResourceStats& stats() const { return m_stats; }

private:
    BufferId allocate(BufferUsage usage, uint64_t size, const char* label);
    void release(BufferId& buffer);
    void ensureUniformCapacity(size_t modelCount);
    void checkDevice(const char* operation) const;

    std::unique_ptr<GpuDevice> m_device;
    GpuResourceSettings m_settings;
    GpuResourceStats m_stats;
    uint64_t m_generation = 0;

    // Surface state
    bool m_configured = false;
    uint32_t m_width = 0;
    uint32_t m_height = 0;
    SurfaceFormat m_format;
    uint64_t m_surfaceGeneration = 0;
    std::optional<SurfaceFormat> m_pipelineFormat;

    // Uniforms
    BufferId m_uniformBuffer = kInvalidBuffer;
    uint32_t m_uniformStride = 256;
    size_t m_modelSlots = 0;
};

} // namespace facet
