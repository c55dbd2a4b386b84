#pragma once

/**
 * @file input_adapter.h
 * @brief Maps host window events onto camera navigation and lifecycle signals
 *
 * - Primary drag: orbit (around the surface point under the cursor when
 *   orbitAroundCursor is set and a focus picker is installed)
 * - Secondary or middle drag, or primary drag with a modifier held: pan
 * - Scroll: zoom
 * - M / W: toggle shaded model / wireframe mesh, F: reframe, Escape: close
 *
 * Raw deltas are clamped per event so one oversized synthetic event cannot
 * make the camera jump.
 */

#include <facet/camera.h>
#include <facet/window.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <utility>

namespace facet {

struct InputSettings {
    float orbitSpeed = 0.01f;       ///< Radians per pixel of drag
    float maxOrbitStep = 0.35f;     ///< Radians per event
    float maxPanStep = 200.0f;      ///< Pixels per event
    float zoomSpeed = 1.0f;         ///< Zoom notches per scroll notch
    float maxZoomStep = 5.0f;       ///< Notches per event
    bool orbitAroundCursor = false; ///< Orbit about the picked point instead of the target
};

/// Maps a pointer position in pixels to the world point under it, if any
using FocusPicker = std::function<std::optional<glm::vec3>(glm::vec2)>;

/// Requests the adapter passes on to the frame loop
struct LifecycleSignal {
    enum class Type {
        ResizeRequested,
        RedrawRequested,
        CloseRequested,
        ToggleDrawModel,
        ToggleDrawMesh,
        FrameScene
    };

    Type type;
    uint32_t width = 0;
    uint32_t height = 0;

    bool operator==(const LifecycleSignal& other) const {
        return type == other.type && width == other.width && height == other.height;
    }
};

class InputAdapter {
public:
    explicit InputAdapter(InputSettings settings = InputSettings());

    /**
     * @brief Apply one event
     *
     * Camera navigation is applied directly and reported as RedrawRequested.
     * @return the signal the event produced, if any
     */
    std::optional<LifecycleSignal> apply(const WindowEvent& event, Camera& camera);

    const InputSettings& settings() const { return m_settings; }
    void settings(const InputSettings& s) { m_settings = s; }

    void focusPicker(FocusPicker picker) { m_picker = std::move(picker); }

    bool dragging() const { return m_dragMode != DragMode::None; }

    /// Pivot of the current orbit drag, when one was picked
    const std::optional<glm::vec3>& getFocusPoint() const { return m_focus; }

private:
    std::optional<LifecycleSignal> onPointerMoved(glm::vec2 position, Camera& camera);
    std::optional<LifecycleSignal> onKey(Key key);

    enum class DragMode { None, Orbit, Pan };

    InputSettings m_settings;
    glm::vec2 m_lastPointer = glm::vec2(0);
    bool m_havePointer = false;
    std::optional<MouseButton> m_dragButton;
    DragMode m_dragMode = DragMode::None;
    FocusPicker m_picker;
    std::optional<glm::vec3> m_focus;
};

} // namespace facet
