#include <facet/frame_loop.h>
#include <facet/buffer_builder.h>
#include <facet/errors.h>

#include <iostream>
#include <stdexcept>
#include <vector>

namespace facet {

const char* tickResultName(TickResult result) {
    switch (result) {
        case TickResult::Rendered: return "Rendered";
        case TickResult::Skipped:  return "Skipped";
        case TickResult::Idle:     return "Idle";
        case TickResult::Closed:   return "Closed";
    }
    return "Unknown";
}

FrameLoop::FrameLoop(Window& window, SceneState& scene, std::unique_ptr<GpuResourceManager> gpu,
                     FrameLoopSettings settings, InputSettings input)
    : m_window(window)
    , m_scene(scene)
    , m_gpu(std::move(gpu))
    , m_settings(settings)
    , m_input(input) {
    if (!m_gpu) {
        throw std::invalid_argument("FrameLoop: GPU resource manager is null");
    }
    m_input.focusPicker([this](glm::vec2 pixel) {
        return m_scene.raycast(m_scene.camera().rayThrough(pixel));
    });
}

FrameLoop::~FrameLoop() {
    shutdown();
}

// =============================================================================
// Tick
// =============================================================================

TickResult FrameLoop::tick() {
    if (m_closed) return TickResult::Closed;
    if (!m_gpu) {
        throw std::logic_error("FrameLoop::tick: no GPU session attached");
    }
    ++m_stats.ticks;

    // 1. Events. A close request skips every remaining phase.
    if (!drainEvents()) {
        std::cout << "[FrameLoop] Close requested, releasing GPU resources" << std::endl;
        shutdown();
        return TickResult::Closed;
    }

    if (m_scene.revision() != m_seenRevision) {
        m_dirty = true;
    }
    if (!m_settings.continuous && !m_dirty) {
        return TickResult::Idle;
    }

    // 2. Surface
    if (!ensureSurface()) {
        ++m_stats.framesSkipped;
        return TickResult::Skipped;
    }

    if (!m_scene.empty()) {
        m_scene.camera().fitPlanes(m_scene.bounds());
    }

    // 3. Acquire
    std::optional<FrameTarget> frame = m_gpu->acquireFrame();
    if (!frame) {
        ++m_stats.framesSkipped;
        return TickResult::Skipped;
    }

    // 4. Uploads
    syncUploads();

    // 5. Uniforms
    std::vector<glm::mat4> transforms;
    transforms.reserve(m_scene.modelCount());
    for (const auto& [id, entry] : m_scene.models()) {
        transforms.push_back(entry.model.transform.matrix());
    }
    const Camera& camera = m_scene.camera();
    float aspect = static_cast<float>(frame->width) / static_cast<float>(frame->height);
    m_gpu->updateUniforms(camera.viewMatrix(), camera.projectionMatrix(aspect),
                          transforms, m_scene.lights());

    // 6. Record
    DrawList drawList = recordDraws();

    // 7. Submit
    m_gpu->submitAndPresent(drawList, *frame);

    m_stats.lastDrawCalls = drawList.commands.size();
    m_stats.totalDrawCalls += drawList.commands.size();
    ++m_stats.framesRendered;
    m_lastDrawList = std::move(drawList);
    m_seenRevision = m_scene.revision();
    m_dirty = false;

    if (m_settings.verbose) {
        std::cout << "[FrameLoop] Frame " << m_stats.framesRendered << ": "
                  << m_stats.lastDrawCalls << " draw calls" << std::endl;
    }
    return TickResult::Rendered;
}

bool FrameLoop::drainEvents() {
    for (const WindowEvent& event : m_window.drainEvents()) {
        std::optional<LifecycleSignal> signal = m_input.apply(event, m_scene.camera());
        if (!signal) continue;
        if (signal->type == LifecycleSignal::Type::CloseRequested) {
            m_closed = true;
            return false;
        }
        handleSignal(*signal);
    }
    return true;
}

void FrameLoop::handleSignal(const LifecycleSignal& signal) {
    switch (signal.type) {
        case LifecycleSignal::Type::ResizeRequested:
            m_pendingSize = glm::uvec2(signal.width, signal.height);
            break;
        case LifecycleSignal::Type::RedrawRequested:
            break;
        case LifecycleSignal::Type::ToggleDrawModel:
            m_settings.draw.drawModel = !m_settings.draw.drawModel;
            std::cout << "[FrameLoop] Draw model: " << (m_settings.draw.drawModel ? "on" : "off") << std::endl;
            break;
        case LifecycleSignal::Type::ToggleDrawMesh:
            m_settings.draw.drawMesh = !m_settings.draw.drawMesh;
            std::cout << "[FrameLoop] Draw mesh: " << (m_settings.draw.drawMesh ? "on" : "off") << std::endl;
            break;
        case LifecycleSignal::Type::FrameScene:
            m_scene.camera().frame(m_scene.bounds());
            break;
        case LifecycleSignal::Type::CloseRequested:
            m_closed = true;
            break;
    }
    m_dirty = true;
}

bool FrameLoop::framePending() const {
    if (m_closed || !m_dirty) return false;
    glm::uvec2 size = m_window.framebufferSize();
    return size.x > 0 && size.y > 0;
}

bool FrameLoop::ensureSurface() {
    glm::uvec2 size = m_pendingSize ? *m_pendingSize : m_window.framebufferSize();
    if (size.x == 0 || size.y == 0) {
        // Minimized; keep the pending size for when the window comes back
        return false;
    }

    if (m_gpu->surfaceConfigured() &&
        m_gpu->surfaceWidth() == size.x && m_gpu->surfaceHeight() == size.y) {
        m_pendingSize.reset();
        return true;
    }

    try {
        m_gpu->configureSurface(size.x, size.y);
    } catch (const SurfaceConfigError& e) {
        std::cerr << "[FrameLoop] " << e.what() << std::endl;
        try {
            m_gpu->useFallbackFormat();
            m_gpu->configureSurface(size.x, size.y);
        } catch (const SurfaceConfigError& retry) {
            std::cerr << "[FrameLoop] Surface configuration failed again, skipping frame: "
                      << retry.what() << std::endl;
            return false;
        }
    }

    m_scene.camera().viewport(size.x, size.y);
    m_pendingSize.reset();
    return true;
}

void FrameLoop::syncUploads() {
    // Free buffers of models that left the scene
    for (auto it = m_uploaded.begin(); it != m_uploaded.end();) {
        if (!m_scene.find(it->first)) {
            m_gpu->releaseMesh(it->second.handle);
            it = m_uploaded.erase(it);
        } else {
            ++it;
        }
    }

    for (const auto& [id, entry] : m_scene.models()) {
        UploadedModel& uploaded = m_uploaded[id];
        if (uploaded.generation == entry.generation && m_gpu->owns(uploaded.handle)) {
            continue;
        }
        GpuBufferLayout layout = buildBuffers(entry.model);
        uploaded.handle = m_gpu->uploadMesh(layout, uploaded.handle);
        uploaded.generation = entry.generation;
        ++m_stats.uploads;

        if (m_settings.verbose) {
            std::cout << "[FrameLoop] Uploaded model " << id << " (" << layout.triangleCount()
                      << " triangles, generation " << entry.generation << ")" << std::endl;
        }
    }
}

DrawList FrameLoop::recordDraws() {
    DrawList list;
    list.clearColor = m_settings.clearColor;

    size_t slot = 0;
    for (const auto& [id, entry] : m_scene.models()) {
        const MeshHandle& handle = m_uploaded.at(id).handle;
        uint32_t offset = m_gpu->modelUniformOffset(slot++);

        if (m_settings.draw.drawModel) {
            DrawCommand cmd;
            cmd.pipeline = PipelineKind::Shaded;
            cmd.vertexBuffer = handle.vertexBuffer;
            cmd.vertexBytes = handle.vertexBytes;
            cmd.indexBuffer = handle.indexBuffer;
            cmd.indexBytes = handle.indexBytes;
            cmd.indexCount = handle.indexCount;
            cmd.uniformOffset = offset;
            list.commands.push_back(cmd);
        }
        if (m_settings.draw.drawMesh && handle.edgeIndexCount > 0) {
            DrawCommand cmd;
            cmd.pipeline = PipelineKind::Wireframe;
            cmd.vertexBuffer = handle.vertexBuffer;
            cmd.vertexBytes = handle.vertexBytes;
            cmd.indexBuffer = handle.edgeBuffer;
            cmd.indexBytes = handle.edgeBytes;
            cmd.indexCount = handle.edgeIndexCount;
            cmd.uniformOffset = offset;
            list.commands.push_back(cmd);
        }
    }
    return list;
}

// =============================================================================
// Session management
// =============================================================================

void FrameLoop::releaseUploads() {
    if (!m_gpu) {
        m_uploaded.clear();
        return;
    }
    // Mesh buffers go before the session that allocated them
    for (auto it = m_uploaded.rbegin(); it != m_uploaded.rend(); ++it) {
        m_gpu->releaseMesh(it->second.handle);
    }
    m_uploaded.clear();
}

void FrameLoop::resetGpu(std::unique_ptr<GpuResourceManager> gpu) {
    if (!gpu) {
        throw std::invalid_argument("FrameLoop::resetGpu: GPU resource manager is null");
    }
    // Handles of the lost session are stale; the old device owns their memory
    m_uploaded.clear();
    m_gpu = std::move(gpu);
    m_dirty = true;
    std::cout << "[FrameLoop] GPU session " << m_gpu->generation() << " attached" << std::endl;
}

void FrameLoop::dropGpu() {
    m_uploaded.clear();
    m_gpu.reset();
}

void FrameLoop::shutdown() {
    releaseUploads();
    m_gpu.reset();
    m_closed = true;
}

} // namespace facet
