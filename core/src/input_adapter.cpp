#include <facet/input_adapter.h>

#include <glm/glm.hpp>

namespace facet {

namespace {

LifecycleSignal signal(LifecycleSignal::Type type) {
    LifecycleSignal s;
    s.type = type;
    return s;
}

} // namespace

InputAdapter::InputAdapter(InputSettings settings)
    : m_settings(settings) {}

std::optional<LifecycleSignal> InputAdapter::apply(const WindowEvent& event, Camera& camera) {
    using Type = WindowEvent::Type;

    switch (event.type) {
        case Type::PointerMoved:
            return onPointerMoved(event.position, camera);

        case Type::ButtonPressed:
            if (!m_dragButton) {
                m_dragButton = event.button;
                m_dragMode = (event.button == MouseButton::Primary && !event.modifiers.any())
                                 ? DragMode::Orbit : DragMode::Pan;
                if (m_dragMode == DragMode::Orbit && m_settings.orbitAroundCursor &&
                    m_picker && m_havePointer) {
                    m_focus = m_picker(m_lastPointer);
                }
            }
            return std::nullopt;

        case Type::ButtonReleased:
            if (m_dragButton == event.button) {
                m_dragButton.reset();
                m_dragMode = DragMode::None;
                m_focus.reset();
            }
            return std::nullopt;

        case Type::Scroll: {
            float notches = glm::clamp(event.scroll.y * m_settings.zoomSpeed,
                                       -m_settings.maxZoomStep, m_settings.maxZoomStep);
            if (notches == 0.0f) return std::nullopt;
            camera.zoom(notches);
            return signal(LifecycleSignal::Type::RedrawRequested);
        }

        case Type::Key:
            return onKey(event.key);

        case Type::Resized: {
            LifecycleSignal s = signal(LifecycleSignal::Type::ResizeRequested);
            s.width = event.width;
            s.height = event.height;
            return s;
        }

        case Type::Redraw:
            return signal(LifecycleSignal::Type::RedrawRequested);

        case Type::Close:
            return signal(LifecycleSignal::Type::CloseRequested);
    }
    return std::nullopt;
}

std::optional<LifecycleSignal> InputAdapter::onPointerMoved(glm::vec2 position, Camera& camera) {
    glm::vec2 delta = m_havePointer ? position - m_lastPointer : glm::vec2(0);
    m_lastPointer = position;
    m_havePointer = true;

    if (delta == glm::vec2(0)) return std::nullopt;

    if (m_dragMode == DragMode::Orbit) {
        float step = m_settings.maxOrbitStep;
        // Dragging right turns the model right, so the eye moves left
        float yaw = glm::clamp(-delta.x * m_settings.orbitSpeed, -step, step);
        float pitch = glm::clamp(delta.y * m_settings.orbitSpeed, -step, step);
        if (m_focus) {
            camera.orbitAround(*m_focus, yaw, pitch);
        } else {
            camera.orbit(yaw, pitch);
        }
        return signal(LifecycleSignal::Type::RedrawRequested);
    }

    if (m_dragMode == DragMode::Pan) {
        float step = m_settings.maxPanStep;
        camera.pan(glm::clamp(delta.x, -step, step), glm::clamp(delta.y, -step, step));
        return signal(LifecycleSignal::Type::RedrawRequested);
    }

    return std::nullopt;
}

std::optional<LifecycleSignal> InputAdapter::onKey(Key key) {
    switch (key) {
        case Key::M:      return signal(LifecycleSignal::Type::ToggleDrawModel);
        case Key::W:      return signal(LifecycleSignal::Type::ToggleDrawMesh);
        case Key::F:      return signal(LifecycleSignal::Type::FrameScene);
        case Key::Escape: return signal(LifecycleSignal::Type::CloseRequested);
        default:          return std::nullopt;
    }
}

} // namespace facet
