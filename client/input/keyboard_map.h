/*
 * Browser Key Name Conversion
 *
 * Converts KeyboardEvent.key values from the viewer into the key
 * names used by the host's input injector.
 */

#ifndef KEYBOARD_MAP_H
#define KEYBOARD_MAP_H

#include <string>

namespace keyboard_map {

/**
 * Convert a browser key name to an injector key name
 *
 * @param key KeyboardEvent.key value ("Enter", "ArrowUp", "a", ...)
 * @return Injector key name, or "" if not mapped
 */
std::string browser_to_injector_key(const std::string& key);

} // namespace keyboard_map

#endif // KEYBOARD_MAP_H
