#pragma once

/**
 * @file frame_loop.h
 * @brief Per-tick orchestration: events, surface, uploads, uniforms, draws
 *
 * A tick runs these phases in order:
 *  1. drain window events through the InputAdapter (the only scene writer)
 *  2. configure the surface on first use or after a size change
 *  3. acquire the frame target
 *  4. upload models whose generation changed, free removed ones
 *  5. write uniforms from the camera and lights
 *  6. record one draw per model (plus one wireframe draw with the mesh overlay)
 *  7. submit and present
 *
 * The loop never sleeps. The host decides when to call tick(); in on-demand
 * mode a tick with nothing new to show returns Idle without touching the GPU.
 */

#include <facet/gpu_resources.h>
#include <facet/input_adapter.h>
#include <facet/scene.h>
#include <facet/window.h>

#include <glm/glm.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>

namespace facet {

/// What gets drawn for every model
struct DrawConfig {
    bool drawModel = true;   ///< Shaded triangles
    bool drawMesh = false;   ///< Wireframe overlay
};

struct FrameLoopSettings {
    bool continuous = false;                            ///< Render every tick
    glm::vec4 clearColor = glm::vec4(0.12f, 0.12f, 0.14f, 1.0f);
    DrawConfig draw;
    bool verbose = false;
};

enum class TickResult {
    Rendered,   ///< A frame was presented
    Skipped,    ///< Nothing presented (minimized, dropped frame, surface error)
    Idle,       ///< On-demand mode and nothing changed
    Closed      ///< Close requested; GPU resources are released
};

const char* tickResultName(TickResult result);

struct FrameStats {
    uint64_t ticks = 0;
    uint64_t framesRendered = 0;
    uint64_t framesSkipped = 0;
    uint64_t uploads = 0;
    uint64_t lastDrawCalls = 0;
    uint64_t totalDrawCalls = 0;
};

class FrameLoop {
public:
    /// @throws std::invalid_argument if gpu is null
    FrameLoop(Window& window, SceneState& scene, std::unique_ptr<GpuResourceManager> gpu,
              FrameLoopSettings settings = FrameLoopSettings(),
              InputSettings input = InputSettings());
    ~FrameLoop();

    // Non-copyable
    FrameLoop(const FrameLoop&) = delete;
    FrameLoop& operator=(const FrameLoop&) = delete;

    /**
     * @brief Run one tick
     * @throws DeviceLostError if the GPU session is gone; call resetGpu()
     * @throws ShaderCompileError if pipelines cannot be built
     */
    TickResult tick();

    /// Replace the GPU session after a device loss. Every model is re-uploaded.
    void resetGpu(std::unique_ptr<GpuResourceManager> gpu);

    /// Discard a lost GPU session before its replacement is created.
    /// tick() throws std::logic_error until resetGpu() is called.
    void dropGpu();

    /// Release GPU resources in reverse acquisition order
    void shutdown();

    /// Force the next on-demand tick to render
    void requestRedraw() { m_dirty = true; }

    bool closed() const { return m_closed; }

    /**
     * @brief True while a frame is owed to a visible window
     *
     * Set after a dropped frame in on-demand mode. The host should keep
     * ticking instead of blocking for events until it clears. A minimized
     * window never has a frame pending.
     */
    bool framePending() const;

    DrawConfig& drawConfig() { return m_settings.draw; }
    const FrameStats& stats() const { return m_stats; }
    const DrawList& lastDrawList() const { return m_lastDrawList; }

    bool hasGpu() const { return m_gpu != nullptr; }
    GpuResourceManager& gpu() { return *m_gpu; }

private:
    struct UploadedModel {
        uint64_t generation = 0;
        MeshHandle handle;
    };

    bool drainEvents();
    void handleSignal(const LifecycleSignal& signal);
    bool ensureSurface();
    void syncUploads();
    DrawList recordDraws();
    void releaseUploads();

    Window& m_window;
    SceneState& m_scene;
    std::unique_ptr<GpuResourceManager> m_gpu;
    FrameLoopSettings m_settings;
    InputAdapter m_input;
    FrameStats m_stats;

    std::map<ModelId, UploadedModel> m_uploaded;
    std::optional<glm::uvec2> m_pendingSize;
    uint64_t m_seenRevision = 0;
    bool m_dirty = true;
    bool m_closed = false;
    DrawList m_lastDrawList;
};

} // namespace facet
