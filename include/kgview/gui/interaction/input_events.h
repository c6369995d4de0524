#ifndef KGVIEW_INPUT_EVENTS_H
#define KGVIEW_INPUT_EVENTS_H

#include <glm/vec2.hpp>

#include <vector>

namespace kgview {
namespace gui {

enum class MouseButton {
    PRIMARY,
    SECONDARY,
    MIDDLE
};

enum class Key {
    W, A, S, D, Q, E,
    SPACE,
    LEFT_SHIFT,
    F,
    ESCAPE,
    OTHER
};

// Pointer positions are window pixels, origin top-left.
struct PointerButtonEvent {
    MouseButton button;
    bool pressed;
    glm::vec2 position;
};

struct PointerMoveEvent {
    glm::vec2 position;
};

struct ScrollEvent {
    float delta; // Positive scrolls away from the user (zoom in)
};

struct KeyEvent {
    Key key;
    bool pressed;
};

struct ResizeEvent {
    int width;
    int height;
};

// Receiver of input events. Every handler defaults to ignoring the event.
class InputListener {
public:
    virtual ~InputListener() = default;

    virtual void OnPointerButton(const PointerButtonEvent&) {}
    virtual void OnPointerMove(const PointerMoveEvent&) {}
    virtual void OnScroll(const ScrollEvent&) {}
    virtual void OnKey(const KeyEvent&) {}
    virtual void OnResize(const ResizeEvent&) {}
};

// Where input comes from: a window, or a test harness.
class InputEventSource {
public:
    virtual ~InputEventSource() = default;

    virtual void AddListener(InputListener* listener) = 0;
    virtual void RemoveListener(InputListener* listener) = 0;
};

// Bounding box of the render surface inside the window, in pixels.
struct SurfaceRect {
    float x = 0.0f;
    float y = 0.0f;
    int width = 1;
    int height = 1;
};

class ViewportSizeProvider {
public:
    virtual ~ViewportSizeProvider() = default;
    virtual SurfaceRect GetSurfaceRect() const = 0;
};

/*
 * Listener registry that fans events out to every registered listener.
 * Window backends and tests feed it through the Dispatch* methods.
 */
class InputEventDispatcher : public InputEventSource {
public:
    void AddListener(InputListener* listener) override;
    void RemoveListener(InputListener* listener) override;

    std::size_t ListenerCount() const { return listeners_.size(); }

    void DispatchPointerButton(const PointerButtonEvent& event);
    void DispatchPointerMove(const PointerMoveEvent& event);
    void DispatchScroll(const ScrollEvent& event);
    void DispatchKey(const KeyEvent& event);
    void DispatchResize(const ResizeEvent& event);

private:
    template<typename Func>
    void ForEachListener(Func&& func);

    std::vector<InputListener*> listeners_;
};

} // namespace gui
} // namespace kgview

#endif // KGVIEW_INPUT_EVENTS_H
