#pragma once

/**
 * @file window.h
 * @brief Abstract host window capability and window events
 *
 * The engine never talks to a windowing system directly. A Window reports
 * its framebuffer size and hands over the events that arrived since the
 * last drain; GlfwWindow is the implementation selected at startup.
 */

#include <glm/glm.hpp>
#include <cstdint>
#include <vector>

namespace facet {

// Key codes for the keys the viewer reacts to (matches GLFW values)
enum class Key : int {
    Unknown = -1,
    F = 70,
    M = 77,
    W = 87,
    Escape = 256,
};

enum class MouseButton : int {
    Primary = 0,
    Secondary = 1,
    Middle = 2
};

struct Modifiers {
    bool shift = false;
    bool ctrl = false;
    bool alt = false;
    bool super = false;

    bool any() const { return shift || ctrl || alt || super; }
};

/// One primitive host event
struct WindowEvent {
    enum class Type {
        PointerMoved,
        ButtonPressed,
        ButtonReleased,
        Scroll,
        Key,
        Resized,
        Redraw,
        Close
    };

    Type type = Type::Redraw;
    glm::vec2 position = glm::vec2(0);  ///< PointerMoved: cursor position in pixels
    glm::vec2 scroll = glm::vec2(0);    ///< Scroll: notches (+y = away from user)
    MouseButton button = MouseButton::Primary;
    Key key = Key::Unknown;
    Modifiers modifiers;
    uint32_t width = 0;                 ///< Resized: framebuffer size
    uint32_t height = 0;

    static WindowEvent pointerMoved(float x, float y);
    static WindowEvent buttonPressed(MouseButton button, Modifiers mods = Modifiers());
    static WindowEvent buttonReleased(MouseButton button, Modifiers mods = Modifiers());
    static WindowEvent scrolled(float dx, float dy);
    static WindowEvent keyPressed(Key key, Modifiers mods = Modifiers());
    static WindowEvent resized(uint32_t width, uint32_t height);
    static WindowEvent redraw();
    static WindowEvent close();
};

class Window {
public:
    virtual ~Window() = default;

    /// Current drawable size in pixels (0 while minimized)
    virtual glm::uvec2 framebufferSize() const = 0;

    /// Move all pending events out, oldest first
    virtual std::vector<WindowEvent> drainEvents() = 0;
};

} // namespace facet
