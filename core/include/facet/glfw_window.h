#pragma once

/**
 * @file glfw_window.h
 * @brief GLFW implementation of the Window capability
 *
 * GLFW callbacks append WindowEvents to a queue that drainEvents() hands to
 * the frame loop. The window is created without a client API; rendering
 * goes through a WebGPU surface created with glfw3webgpu.
 */

#include <facet/window.h>
#include <facet/webgpu/webgpu_device.h>

#include <cstdint>
#include <string>
#include <vector>

struct GLFWwindow;

namespace facet {

class GlfwWindow : public Window, public webgpu::SurfaceSource {
public:
    /// @throws std::runtime_error if GLFW or the window cannot be created
    GlfwWindow(uint32_t width, uint32_t height, const std::string& title);
    ~GlfwWindow() override;

    // Non-copyable
    GlfwWindow(const GlfwWindow&) = delete;
    GlfwWindow& operator=(const GlfwWindow&) = delete;

    glm::uvec2 framebufferSize() const override;
    std::vector<WindowEvent> drainEvents() override;

    WGPUSurface createSurface(WGPUInstance instance) override;

    /// Process pending host events without blocking
    void pollEvents();

    /// Block until at least one host event arrives
    void waitEvents();

    GLFWwindow* handle() const { return m_window; }

private:
    void installCallbacks();
    void push(const WindowEvent& event) { m_events.push_back(event); }

    GLFWwindow* m_window = nullptr;
    std::vector<WindowEvent> m_events;
};

} // namespace facet
