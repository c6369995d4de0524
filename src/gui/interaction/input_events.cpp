#include <kgview/gui/interaction/input_events.h>

#include <algorithm>

namespace kgview {
namespace gui {

void InputEventDispatcher::AddListener(InputListener* listener) {
    if (!listener) return;
    if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end()) {
        listeners_.push_back(listener);
    }
}

void InputEventDispatcher::RemoveListener(InputListener* listener) {
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

// Iterates a copy so a listener may unregister itself from inside a handler.
template<typename Func>
void InputEventDispatcher::ForEachListener(Func&& func) {
    const std::vector<InputListener*> snapshot = listeners_;
    for (InputListener* listener : snapshot) {
        if (std::find(listeners_.begin(), listeners_.end(), listener) != listeners_.end()) {
            func(*listener);
        }
    }
}

void InputEventDispatcher::DispatchPointerButton(const PointerButtonEvent& event) {
    ForEachListener([&](InputListener& l) { l.OnPointerButton(event); });
}

void InputEventDispatcher::DispatchPointerMove(const PointerMoveEvent& event) {
    ForEachListener([&](InputListener& l) { l.OnPointerMove(event); });
}

void InputEventDispatcher::DispatchScroll(const ScrollEvent& event) {
    ForEachListener([&](InputListener& l) { l.OnScroll(event); });
}

void InputEventDispatcher::DispatchKey(const KeyEvent& event) {
    ForEachListener([&](InputListener& l) { l.OnKey(event); });
}

void InputEventDispatcher::DispatchResize(const ResizeEvent& event) {
    ForEachListener([&](InputListener& l) { l.OnResize(event); });
}

} // namespace gui
} // namespace kgview
