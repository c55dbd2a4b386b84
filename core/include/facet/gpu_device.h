#pragma once

/**
 * @file gpu_device.h
 * @brief Abstract GPU backend used by GpuResourceManager
 *
 * The resource manager only ever talks to this interface. The production
 * implementation is webgpu::WebGpuDevice; tests drive the manager and the
 * frame loop through a recording fake. Buffers are referred to by small
 * integer ids so no backend handle ever leaks into the core.
 */

#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace facet {

using BufferId = uint32_t;
constexpr BufferId kInvalidBuffer = 0;

enum class BufferUsage {
    Vertex,
    Index,
    Uniform
};

/// Color formats the engine knows how to request
enum class SurfaceFormat {
    BGRA8Unorm,
    BGRA8UnormSrgb,
    RGBA8Unorm,
    RGBA8UnormSrgb,
    RGBA16Float
};

const char* surfaceFormatName(SurfaceFormat format);

/// Parse names such as "bgra8unorm-srgb"; empty result for unknown names
std::optional<SurfaceFormat> parseSurfaceFormat(const std::string& name);

enum class PresentMode {
    Fifo,       ///< vsync
    Immediate
};

struct SurfaceConfig {
    uint32_t width = 0;
    uint32_t height = 0;
    SurfaceFormat format = SurfaceFormat::BGRA8UnormSrgb;
    PresentMode presentMode = PresentMode::Fifo;
};

/// Result of asking the surface for its next texture
enum class SurfaceStatus {
    Success,
    Suboptimal,     ///< Usable, but should be reconfigured soon
    Timeout,
    Outdated,
    Lost,
    DeviceLost,
    Error
};

const char* surfaceStatusName(SurfaceStatus status);

/// Presentable image acquired for one frame
struct FrameTarget {
    uint32_t width = 0;
    uint32_t height = 0;
    uint64_t surfaceGeneration = 0;  ///< Which surface configuration it belongs to
};

enum class PipelineKind {
    Shaded,     ///< Lit triangles
    Wireframe   ///< Line list over mesh edges
};

/// One indexed draw
struct DrawCommand {
    PipelineKind pipeline = PipelineKind::Shaded;
    BufferId vertexBuffer = kInvalidBuffer;
    uint64_t vertexBytes = 0;
    BufferId indexBuffer = kInvalidBuffer;
    uint64_t indexBytes = 0;
    uint32_t indexCount = 0;
    uint32_t uniformOffset = 0;     ///< Dynamic offset of the per-model uniform slot
};

/// Everything recorded for one frame, drawn in a single render pass
struct DrawList {
    glm::vec4 clearColor = glm::vec4(0, 0, 0, 1);
    std::vector<DrawCommand> commands;
};

class GpuDevice {
public:
    virtual ~GpuDevice() = default;

    /// Formats the surface accepts, preferred first
    virtual std::vector<SurfaceFormat> supportedFormats() const = 0;

    /// @throws SurfaceConfigError if the surface rejects the configuration
    virtual void configureSurface(const SurfaceConfig& config) = 0;

    virtual BufferId createBuffer(BufferUsage usage, uint64_t size, const char* label) = 0;
    virtual void writeBuffer(BufferId buffer, uint64_t offset, const void* data, uint64_t size) = 0;
    virtual void destroyBuffer(BufferId buffer) = 0;

    /**
     * @brief Build the shaded and wireframe pipelines for a color format
     * @throws ShaderCompileError if shader or pipeline creation fails
     */
    virtual void createPipelines(SurfaceFormat colorFormat) = 0;

    /// Bind the uniform buffer: frame block at offset 0, model slots via dynamic offset
    virtual void bindUniformBuffer(BufferId buffer) = 0;

    /// Required alignment of dynamic uniform offsets
    virtual uint32_t uniformAlignment() const = 0;

    virtual SurfaceStatus acquireSurfaceTexture() = 0;

    /// Record and submit one render pass into the acquired texture
    virtual void submit(const DrawList& drawList) = 0;

    /// Present the acquired texture and release it
    virtual void present() = 0;

    virtual bool isLost() const = 0;
};

} // namespace facet
