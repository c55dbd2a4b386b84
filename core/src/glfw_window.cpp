#include <facet/glfw_window.h>

#include <GLFW/glfw3.h>
#include <glfw3webgpu.h>

#include <iostream>
#include <stdexcept>
#include <algorithm>

namespace facet {

namespace {

GlfwWindow* windowFrom(GLFWwindow* w) {
    return static_cast<GlfwWindow*>(glfwGetWindowUserPointer(w));
}

Modifiers toModifiers(int mods) {
    Modifiers m;
    m.shift = (mods & GLFW_MOD_SHIFT) != 0;
    m.ctrl = (mods & GLFW_MOD_CONTROL) != 0;
    m.alt = (mods & GLFW_MOD_ALT) != 0;
    m.super = (mods & GLFW_MOD_SUPER) != 0;
    return m;
}

} // namespace

GlfwWindow::GlfwWindow(uint32_t width, uint32_t height, const std::string& title) {
    if (!glfwInit()) {
        throw std::runtime_error("Failed to initialize GLFW");
    }

    // No OpenGL context - we're using WebGPU
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);

    m_window = glfwCreateWindow(static_cast<int>(width), static_cast<int>(height),
                                title.c_str(), nullptr, nullptr);
    if (!m_window) {
        glfwTerminate();
        throw std::runtime_error("Failed to create window");
    }

    glfwSetWindowUserPointer(m_window, this);
    installCallbacks();
}

GlfwWindow::~GlfwWindow() {
    if (m_window) {
        glfwDestroyWindow(m_window);
        m_window = nullptr;
    }
    glfwTerminate();
}

void GlfwWindow::installCallbacks() {
    glfwSetCursorPosCallback(m_window, [](GLFWwindow* w, double x, double y) {
        // Cursor positions arrive in screen coordinates; the camera works in framebuffer pixels
        int windowWidth = 0, windowHeight = 0, fbWidth = 0, fbHeight = 0;
        glfwGetWindowSize(w, &windowWidth, &windowHeight);
        glfwGetFramebufferSize(w, &fbWidth, &fbHeight);
        double sx = windowWidth > 0 ? static_cast<double>(fbWidth) / windowWidth : 1.0;
        double sy = windowHeight > 0 ? static_cast<double>(fbHeight) / windowHeight : 1.0;
        windowFrom(w)->push(WindowEvent::pointerMoved(static_cast<float>(x * sx), static_cast<float>(y * sy)));
    });

    glfwSetMouseButtonCallback(m_window, [](GLFWwindow* w, int button, int action, int mods) {
        MouseButton b;
        switch (button) {
            case GLFW_MOUSE_BUTTON_LEFT:   b = MouseButton::Primary; break;
            case GLFW_MOUSE_BUTTON_RIGHT:  b = MouseButton::Secondary; break;
            case GLFW_MOUSE_BUTTON_MIDDLE: b = MouseButton::Middle; break;
            default: return;
        }
        if (action == GLFW_PRESS) {
            windowFrom(w)->push(WindowEvent::buttonPressed(b, toModifiers(mods)));
        } else if (action == GLFW_RELEASE) {
            windowFrom(w)->push(WindowEvent::buttonReleased(b, toModifiers(mods)));
        }
    });

    glfwSetScrollCallback(m_window, [](GLFWwindow* w, double xoffset, double yoffset) {
        windowFrom(w)->push(WindowEvent::scrolled(static_cast<float>(xoffset), static_cast<float>(yoffset)));
    });

    glfwSetKeyCallback(m_window, [](GLFWwindow* w, int key, int scancode, int action, int mods) {
        if (action != GLFW_PRESS) return;
        Key k;
        switch (key) {
            case GLFW_KEY_F:      k = Key::F; break;
            case GLFW_KEY_M:      k = Key::M; break;
            case GLFW_KEY_W:      k = Key::W; break;
            case GLFW_KEY_ESCAPE: k = Key::Escape; break;
            default: return;
        }
        windowFrom(w)->push(WindowEvent::keyPressed(k, toModifiers(mods)));
    });

    glfwSetFramebufferSizeCallback(m_window, [](GLFWwindow* w, int width, int height) {
        windowFrom(w)->push(WindowEvent::resized(static_cast<uint32_t>(std::max(width, 0)),
                                                 static_cast<uint32_t>(std::max(height, 0))));
    });

    glfwSetWindowRefreshCallback(m_window, [](GLFWwindow* w) {
        windowFrom(w)->push(WindowEvent::redraw());
    });

    glfwSetWindowCloseCallback(m_window, [](GLFWwindow* w) {
        windowFrom(w)->push(WindowEvent::close());
    });
}

glm::uvec2 GlfwWindow::framebufferSize() const {
    int width = 0, height = 0;
    glfwGetFramebufferSize(m_window, &width, &height);
    return glm::uvec2(static_cast<uint32_t>(std::max(width, 0)),
                      static_cast<uint32_t>(std::max(height, 0)));
}

std::vector<WindowEvent> GlfwWindow::drainEvents() {
    std::vector<WindowEvent> events;
    events.swap(m_events);
    return events;
}

WGPUSurface GlfwWindow::createSurface(WGPUInstance instance) {
    WGPUSurface surface = glfwCreateWindowWGPUSurface(instance, m_window);
    if (!surface) {
        std::cerr << "[GlfwWindow] Failed to create WebGPU surface" << std::endl;
    }
    return surface;
}

void GlfwWindow::pollEvents() {
    glfwPollEvents();
}

void GlfwWindow::waitEvents() {
    glfwWaitEvents();
}

} // namespace facet
