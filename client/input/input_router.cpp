/*
 * Input Router Implementation
 */

#include "input_router.h"
#include "keyboard_map.h"
#include "../../common/utils/debug_flags.h"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace input {

static bool get_number(const protocol::json& j, const char* key, double& out) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return false;
    }
    out = it->get<double>();
    return true;
}

static MouseButton button_from(int button) {
    switch (button) {
        case 1:  return MouseButton::MIDDLE;
        case 2:  return MouseButton::RIGHT;
        default: return MouseButton::LEFT;
    }
}

InputRouter::InputRouter(InputInjector& injector)
    : injector_(injector)
    , enabled_(true)
{}

bool InputRouter::apply(const protocol::Message& msg) {
    if (const auto* mouse = std::get_if<protocol::MouseEvent>(&msg)) {
        return apply_mouse(mouse->event);
    }
    if (const auto* keyboard = std::get_if<protocol::KeyboardEvent>(&msg)) {
        return apply_keyboard(keyboard->event);
    }
    return false;
}

bool InputRouter::apply_mouse(const protocol::json& event) {
    if (!enabled_ || !event.is_object()) {
        return false;
    }

    std::string type = json_utils::get_string(event, "type");
    if (type == "move") {
        double x, y;
        if (!get_number(event, "x", x) || !get_number(event, "y", y)) {
            return false;
        }
        int width = 0, height = 0;
        injector_.screen_size(width, height);
        x = std::min(std::max(x, 0.0), 1.0);
        y = std::min(std::max(y, 0.0), 1.0);
        injector_.move_mouse(static_cast<int>(std::lround(x * width)),
                             static_cast<int>(std::lround(y * height)));
        return true;
    }
    if (type == "down" || type == "up") {
        injector_.mouse_button(button_from(json_utils::get_int(event, "button", 0)), type == "down");
        return true;
    }
    if (type == "scroll") {
        double delta;
        if (!get_number(event, "deltaY", delta)) {
            return false;
        }
        injector_.scroll(delta > 0 ? -3 : 3);
        return true;
    }

    if (g_debug_connection) {
        fprintf(stderr, "Client: Unknown mouse event '%s'\n", type.c_str());
    }
    return false;
}

bool InputRouter::apply_keyboard(const protocol::json& event) {
    if (!enabled_ || !event.is_object()) {
        return false;
    }

    std::string type = json_utils::get_string(event, "type");
    if (type != "down" && type != "up") {
        return false;
    }

    std::string key = keyboard_map::browser_to_injector_key(json_utils::get_string(event, "key"));
    if (key.empty()) {
        return false;
    }

    Modifiers modifiers;
    modifiers.ctrl = json_utils::get_bool(event, "ctrlKey");
    modifiers.alt = json_utils::get_bool(event, "altKey");
    modifiers.shift = json_utils::get_bool(event, "shiftKey");
    modifiers.meta = json_utils::get_bool(event, "metaKey");

    injector_.key(key, type == "down", modifiers);
    return true;
}

} // namespace input
