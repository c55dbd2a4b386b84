#include <facet/window.h>

namespace facet {

WindowEvent WindowEvent::pointerMoved(float x, float y) {
    WindowEvent e;
    e.type = Type::PointerMoved;
    e.position = glm::vec2(x, y);
    return e;
}

WindowEvent WindowEvent::buttonPressed(MouseButton button, Modifiers mods) {
    WindowEvent e;
    e.type = Type::ButtonPressed;
    e.button = button;
    e.modifiers = mods;
    return e;
}

WindowEvent WindowEvent::buttonReleased(MouseButton button, Modifiers mods) {
    WindowEvent e;
    e.type = Type::ButtonReleased;
    e.button = button;
    e.modifiers = mods;
    return e;
}

WindowEvent WindowEvent::scrolled(float dx, float dy) {
    WindowEvent e;
    e.type = Type::Scroll;
    e.scroll = glm::vec2(dx, dy);
    return e;
}

WindowEvent WindowEvent::keyPressed(Key key, Modifiers mods) {
    WindowEvent e;
    e.type = Type::Key;
    e.key = key;
    e.modifiers = mods;
    return e;
}

WindowEvent WindowEvent::resized(uint32_t width, uint32_t height) {
    WindowEvent e;
    e.type = Type::Resized;
    e.width = width;
    e.height = height;
    return e;
}

WindowEvent WindowEvent::redraw() {
    WindowEvent e;
    e.type = Type::Redraw;
    return e;
}

WindowEvent WindowEvent::close() {
    WindowEvent e;
    e.type = Type::Close;
    return e;
}

} // namespace facet
