#pragma once

/**
 * @file fake_window.h
 * @brief Scripted Window for frame loop tests
 */

#include <facet/window.h>

#include <vector>

namespace facet::testing {

class FakeWindow : public Window {
public:
    FakeWindow(uint32_t width = 800, uint32_t height = 600) : m_size(width, height) {}

    glm::uvec2 framebufferSize() const override { return m_size; }

    std::vector<WindowEvent> drainEvents() override {
        std::vector<WindowEvent> events;
        events.swap(m_events);
        return events;
    }

    void push(const WindowEvent& event) { m_events.push_back(event); }

    /// Change the drawable size and queue the matching resize event
    void resize(uint32_t width, uint32_t height) {
        m_size = glm::uvec2(width, height);
        push(WindowEvent::resized(width, height));
    }

private:
    glm::uvec2 m_size;
    std::vector<WindowEvent> m_events;
};

} // namespace facet::testing
