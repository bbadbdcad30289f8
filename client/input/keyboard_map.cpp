/*
 * Browser Key Name Conversion
 */

#include "keyboard_map.h"
#include <cctype>
#include <map>

namespace keyboard_map {

std::string browser_to_injector_key(const std::string& key) {
    // Printable characters map to themselves, letters lowercased
    if (key.size() == 1) {
        if (key[0] == ' ') return "space";
        return std::string(1, static_cast<char>(std::tolower(static_cast<unsigned char>(key[0]))));
    }

    static const std::map<std::string, std::string> special_keys = {
        {"Enter", "enter"},
        {"Tab", "tab"},
        {"Backspace", "backspace"},
        {"Delete", "delete"},
        {"Escape", "escape"},
        {"ArrowUp", "up"},
        {"ArrowDown", "down"},
        {"ArrowLeft", "left"},
        {"ArrowRight", "right"},
        {"Home", "home"},
        {"End", "end"},
        {"PageUp", "pageup"},
        {"PageDown", "pagedown"},
        {"Control", "control"},
        {"Alt", "alt"},
        {"Shift", "shift"},
        {"Meta", "command"},
        {"F1", "f1"}, {"F2", "f2"}, {"F3", "f3"}, {"F4", "f4"},
        {"F5", "f5"}, {"F6", "f6"}, {"F7", "f7"}, {"F8", "f8"},
        {"F9", "f9"}, {"F10", "f10"}, {"F11", "f11"}, {"F12", "f12"},
    };

    auto it = special_keys.find(key);
    return it == special_keys.end() ? std::string() : it->second;
}

} // namespace keyboard_map
