/*
 * Input Router
 *
 * Host side: applies mouse-event and keyboard-event payloads from the
 * viewer to the platform input injector. Mouse coordinates arrive
 * normalized to 0..1 and are scaled to the host screen.
 */

#ifndef INPUT_ROUTER_H
#define INPUT_ROUTER_H

#include "../../common/protocol/messages.h"
#include <atomic>
#include <string>

namespace input {

enum class MouseButton {
    LEFT,
    MIDDLE,
    RIGHT
};

struct Modifiers {
    bool ctrl = false;
    bool alt = false;
    bool shift = false;
    bool meta = false;
};

class InputInjector {
public:
    virtual ~InputInjector() = default;

    virtual void screen_size(int& width, int& height) const = 0;
    virtual void move_mouse(int x, int y) = 0;
    virtual void mouse_button(MouseButton button, bool down) = 0;

    // Positive scrolls up
    virtual void scroll(int amount) = 0;

    virtual void key(const std::string& key, bool down, const Modifiers& modifiers) = 0;
};

class InputRouter {
public:
    explicit InputRouter(InputInjector& injector);

    // Remote control allowed. Disabled routers drop all events.
    void set_enabled(bool enabled) { enabled_ = enabled; }
    bool enabled() const { return enabled_; }

    /**
     * Apply a mouse-event or keyboard-event
     * @return false if the message was not an input event or was dropped
     */
    bool apply(const protocol::Message& msg);

    bool apply_mouse(const protocol::json& event);
    bool apply_keyboard(const protocol::json& event);

private:
    InputInjector& injector_;
    std::atomic<bool> enabled_;
};

} // namespace input

#endif // INPUT_ROUTER_H
