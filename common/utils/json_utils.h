/*
 * JSON Utilities
 *
 * Wrapper around nlohmann/json for the wire protocol and config files.
 * The get_* helpers are lenient (return a default); the require_* helpers
 * are used at the protocol boundary and throw errors::ProtocolError.
 */

#ifndef JSON_UTILS_H
#define JSON_UTILS_H

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace json_utils {

// Type alias for convenience
using json = nlohmann::json;

/**
 * Parse JSON string
 * @param str JSON string
 * @return Parsed JSON value
 * @throws errors::ProtocolError on invalid JSON
 */
json parse(const std::string& str);

/**
 * Convert JSON to string
 * @param j JSON value
 * @param indent Indentation level (-1 for compact)
 */
std::string to_string(const json& j, int indent = -1);

std::string get_string(const json& j, const std::string& key,
                       const std::string& default_val = "");
int get_int(const json& j, const std::string& key, int default_val = 0);
int64_t get_int64(const json& j, const std::string& key, int64_t default_val = 0);
bool get_bool(const json& j, const std::string& key, bool default_val = false);
bool has_key(const json& j, const std::string& key);

/**
 * Get string array from JSON object
 * @return Vector of strings, or empty vector if key doesn't exist or is not an array
 */
std::vector<std::string> get_string_array(const json& j, const std::string& key);

// Strict accessors for wire messages. The error names the missing field.
std::string require_string(const json& j, const std::string& key);
int64_t require_int64(const json& j, const std::string& key);
bool require_bool(const json& j, const std::string& key);
const json& require_value(const json& j, const std::string& key);

/**
 * Parse JSON file
 * @param path Path to JSON file
 * @throws std::runtime_error on file read error, errors::ProtocolError on parse error
 */
json parse_file(const std::string& path);

} // namespace json_utils

#endif // JSON_UTILS_H
