#include <facet/gpu_resources.h>
#include <facet/errors.h>
#include <facet/gpu_structs.h>

#include <algorithm>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace facet {

namespace {

// Generations are unique per process so handles never match a later manager
uint64_t s_nextGeneration = 1;

uint64_t roundUp(uint64_t value, uint64_t alignment) {
    return ((value + alignment - 1) / alignment) * alignment;
}

// WebGPU requires buffer write sizes to be a multiple of 4
uint64_t paddedSize(uint64_t size) {
    return roundUp(std::max<uint64_t>(size, 4), 4);
}

} // namespace

GpuResourceManager::GpuResourceManager(std::unique_ptr<GpuDevice> device, GpuResourceSettings settings)
    : m_device(std::move(device))
    , m_settings(settings)
    , m_generation(s_nextGeneration++)
    , m_format(settings.preferredFormat) {
    if (!m_device) {
        throw std::invalid_argument("GpuResourceManager: device is null");
    }

    uint32_t alignment = std::max<uint32_t>(m_device->uniformAlignment(), 16);
    uint64_t largest = std::max(sizeof(FrameUniforms), sizeof(ModelUniforms));
    m_uniformStride = static_cast<uint32_t>(roundUp(largest, alignment));

    ensureUniformCapacity(m_settings.initialModelSlots);

    std::cout << "[GpuResources] Session " << m_generation << " ready (uniform stride "
              << m_uniformStride << ")" << std::endl;
}

GpuResourceManager::~GpuResourceManager() {
    release(m_uniformBuffer);
}

// =============================================================================
// Surface
// =============================================================================

void GpuResourceManager::configureSurface(uint32_t width, uint32_t height) {
    if (width == 0 || height == 0) {
        throw std::invalid_argument("GpuResourceManager::configureSurface: zero-sized surface");
    }
    checkDevice("configureSurface");

    std::vector<SurfaceFormat> formats = m_device->supportedFormats();
    if (std::find(formats.begin(), formats.end(), m_format) == formats.end()) {
        throw SurfaceConfigError(std::string("surface format ") + surfaceFormatName(m_format) +
                                 " is not supported by the device");
    }

    SurfaceConfig config;
    config.width = width;
    config.height = height;
    config.format = m_format;
    config.presentMode = m_settings.presentMode;
    m_device->configureSurface(config);

    m_configured = true;
    m_width = width;
    m_height = height;
    ++m_surfaceGeneration;
    ++m_stats.surfaceConfigurations;

    if (m_pipelineFormat != m_format) {
        m_device->createPipelines(m_format);
        m_pipelineFormat = m_format;
        ++m_stats.pipelineBuilds;
    }

    if (m_settings.verbose) {
        std::cout << "[GpuResources] Surface configured " << width << "x" << height
                  << " (" << surfaceFormatName(m_format) << ")" << std::endl;
    }
}

void GpuResourceManager::useFallbackFormat() {
    std::vector<SurfaceFormat> formats = m_device->supportedFormats();
    if (formats.empty()) {
        throw SurfaceConfigError("device reports no supported surface formats");
    }
    std::cerr << "[GpuResources] Format " << surfaceFormatName(m_format)
              << " unsupported, falling back to " << surfaceFormatName(formats[0]) << std::endl;
    m_format = formats[0];
}

// =============================================================================
// Buffers
// =============================================================================

BufferId GpuResourceManager::allocate(BufferUsage usage, uint64_t size, const char* label) {
    BufferId id = m_device->createBuffer(usage, paddedSize(size), label);
    ++m_stats.buffersCreated;
    return id;
}

void GpuResourceManager::release(BufferId& buffer) {
    if (buffer == kInvalidBuffer) return;
    m_device->destroyBuffer(buffer);
    ++m_stats.buffersDestroyed;
    buffer = kInvalidBuffer;
}

MeshHandle GpuResourceManager::uploadMesh(const GpuBufferLayout& layout, const MeshHandle& existing) {
    checkDevice("uploadMesh");

    MeshHandle handle;
    if (owns(existing)) {
        handle = existing;
    }

    const bool fits = handle.valid() &&
                      handle.vertexCapacity >= layout.vertexBytes.size() &&
                      handle.indexCapacity >= layout.indexBytes.size() &&
                      handle.edgeCapacity >= layout.edgeBytes.size();

    if (fits) {
        ++m_stats.inPlaceUploads;
    } else {
        if (handle.valid()) {
            ++m_stats.reallocations;
        }
        releaseMesh(handle);
        handle.vertexCapacity = paddedSize(layout.vertexBytes.size());
        handle.indexCapacity = paddedSize(layout.indexBytes.size());
        handle.edgeCapacity = paddedSize(layout.edgeBytes.size());
        handle.vertexBuffer = allocate(BufferUsage::Vertex, handle.vertexCapacity, "facet vertices");
        handle.indexBuffer = allocate(BufferUsage::Index, handle.indexCapacity, "facet indices");
        handle.edgeBuffer = allocate(BufferUsage::Index, handle.edgeCapacity, "facet edges");
        handle.managerGeneration = m_generation;
    }

    // Index data is a multiple of 4 bytes; vertex records are 40 bytes
    m_device->writeBuffer(handle.vertexBuffer, 0, layout.vertexBytes.data(), layout.vertexBytes.size());
    m_device->writeBuffer(handle.indexBuffer, 0, layout.indexBytes.data(), layout.indexBytes.size());
    if (!layout.edgeBytes.empty()) {
        m_device->writeBuffer(handle.edgeBuffer, 0, layout.edgeBytes.data(), layout.edgeBytes.size());
    }

    handle.vertexBytes = layout.vertexBytes.size();
    handle.indexBytes = layout.indexBytes.size();
    handle.edgeBytes = layout.edgeBytes.size();
    handle.indexCount = layout.indexCount;
    handle.edgeIndexCount = layout.edgeIndexCount;
    return handle;
}

void GpuResourceManager::releaseMesh(MeshHandle& handle) {
    if (owns(handle)) {
        release(handle.vertexBuffer);
        release(handle.indexBuffer);
        release(handle.edgeBuffer);
    }
    handle = MeshHandle();
}

void GpuResourceManager::ensureUniformCapacity(size_t modelCount) {
    if (m_uniformBuffer != kInvalidBuffer && modelCount <= m_modelSlots) return;

    size_t slots = std::max<size_t>(m_modelSlots, 1);
    while (slots < modelCount) {
        slots *= 2;
    }

    release(m_uniformBuffer);
    m_uniformBuffer = allocate(BufferUsage::Uniform,
                               static_cast<uint64_t>(m_uniformStride) * (slots + 1),
                               "facet uniforms");
    m_modelSlots = slots;
    m_device->bindUniformBuffer(m_uniformBuffer);

    if (m_settings.verbose) {
        std::cout << "[GpuResources] Uniform buffer sized for " << slots << " models" << std::endl;
    }
}

uint32_t GpuResourceManager::modelUniformOffset(size_t modelIndex) const {
    return static_cast<uint32_t>(m_uniformStride * (modelIndex + 1));
}

void GpuResourceManager::updateUniforms(const glm::mat4& view, const glm::mat4& projection,
                                        const std::vector<glm::mat4>& modelTransforms,
                                        const Lights& lights) {
    checkDevice("updateUniforms");
    ensureUniformCapacity(modelTransforms.size());

    FrameUniforms frame = {};
    copyMat4(frame.view, view);
    copyMat4(frame.projection, projection);
    copyVec3(frame.lightDirection, glm::normalize(lights.direction));
    frame.lightIntensity = lights.intensity;
    copyVec3(frame.lightColor, lights.color);
    frame.ambientIntensity = lights.ambientIntensity;
    copyVec3(frame.ambientColor, lights.ambientColor);
    copyVec3(frame.cameraPos, glm::vec3(glm::inverse(view)[3]));

    std::vector<uint8_t> data(static_cast<size_t>(m_uniformStride) * (modelTransforms.size() + 1), 0);
    std::memcpy(data.data(), &frame, sizeof(frame));

    for (size_t i = 0; i < modelTransforms.size(); ++i) {
        ModelUniforms slot = {};
        copyMat4(slot.model, modelTransforms[i]);
        copyMat4(slot.normalMatrix, glm::mat4(glm::transpose(glm::inverse(glm::mat3(modelTransforms[i])))));
        std::memcpy(data.data() + modelUniformOffset(i), &slot, sizeof(slot));
    }

    m_device->writeBuffer(m_uniformBuffer, 0, data.data(), data.size());
}

// =============================================================================
// Frames
// =============================================================================

void GpuResourceManager::checkDevice(const char* operation) const {
    if (m_device->isLost()) {
        throw DeviceLostError(std::string("device lost (") + operation + ")");
    }
}

std::optional<FrameTarget> GpuResourceManager::acquireFrame() {
    checkDevice("acquireFrame");
    if (!m_configured) {
        std::cerr << "[GpuResources] acquireFrame called before surface configuration" << std::endl;
        return std::nullopt;
    }

    for (int attempt = 0; attempt < 2; ++attempt) {
        SurfaceStatus status = m_device->acquireSurfaceTexture();

        switch (status) {
            case SurfaceStatus::Success:
            case SurfaceStatus::Suboptimal: {
                FrameTarget target;
                target.width = m_width;
                target.height = m_height;
                target.surfaceGeneration = m_surfaceGeneration;
                return target;
            }
            case SurfaceStatus::DeviceLost:
                throw DeviceLostError("device lost while acquiring surface texture");
            case SurfaceStatus::Outdated:
            case SurfaceStatus::Lost:
            case SurfaceStatus::Timeout:
            case SurfaceStatus::Error:
                break;
        }

        if (attempt == 1) {
            std::cerr << "[GpuResources] " << errorKindName(ErrorKind::FrameAcquisitionFailed)
                      << ": surface status " << surfaceStatusName(status)
                      << ", dropping frame" << std::endl;
            break;
        }

        if (m_settings.verbose) {
            std::cout << "[GpuResources] Surface " << surfaceStatusName(status)
                      << ", reconfiguring and retrying" << std::endl;
        }
        ++m_stats.acquireRetries;
        if (status != SurfaceStatus::Timeout) {
            configureSurface(m_width, m_height);
        }
    }

    ++m_stats.droppedFrames;
    return std::nullopt;
}

void GpuResourceManager::submitAndPresent(const DrawList& drawList, const FrameTarget& frame) {
    checkDevice("submit");
    if (frame.surfaceGeneration != m_surfaceGeneration) {
        std::cerr << "[GpuResources] Frame target belongs to an old surface configuration" << std::endl;
    }
    m_device->submit(drawList);
    m_device->present();
    checkDevice("present");
}

} // namespace facet
