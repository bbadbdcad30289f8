/*
 * JSON Utilities Implementation
 */

#include "json_utils.h"
#include "../errors.h"
#include <fstream>

namespace json_utils {

json parse(const std::string& str) {
    try {
        return json::parse(str);
    } catch (const json::parse_error& e) {
        throw errors::ProtocolError(std::string("invalid JSON: ") + e.what());
    }
}

std::string to_string(const json& j, int indent) {
    // Replace invalid UTF-8 instead of throwing from dump()
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

std::string get_string(const json& j, const std::string& key,
                       const std::string& default_val) {
    if (!j.is_object()) {
        return default_val;
    }

    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return default_val;
    }

    return it->get<std::string>();
}

int get_int(const json& j, const std::string& key, int default_val) {
    if (!j.is_object()) {
        return default_val;
    }

    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer()) {
        return default_val;
    }

    return it->get<int>();
}

int64_t get_int64(const json& j, const std::string& key, int64_t default_val) {
    if (!j.is_object()) {
        return default_val;
    }

    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer()) {
        return default_val;
    }

    return it->get<int64_t>();
}

bool get_bool(const json& j, const std::string& key, bool default_val) {
    if (!j.is_object()) {
        return default_val;
    }

    auto it = j.find(key);
    if (it == j.end() || !it->is_boolean()) {
        return default_val;
    }

    return it->get<bool>();
}

bool has_key(const json& j, const std::string& key) {
    if (!j.is_object()) {
        return false;
    }

    return j.find(key) != j.end();
}

std::vector<std::string> get_string_array(const json& j, const std::string& key) {
    std::vector<std::string> result;

    if (!j.is_object()) {
        return result;
    }

    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) {
        return result;
    }

    for (const auto& elem : *it) {
        if (elem.is_string()) {
            result.push_back(elem.get<std::string>());
        }
    }

    return result;
}

const json& require_value(const json& j, const std::string& key) {
    if (!j.is_object()) {
        throw errors::ProtocolError("message is not an object");
    }

    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        throw errors::ProtocolError("missing field '" + key + "'");
    }

    return *it;
}

std::string require_string(const json& j, const std::string& key) {
    const json& v = require_value(j, key);
    if (!v.is_string()) {
        throw errors::ProtocolError("field '" + key + "' must be a string");
    }
    return v.get<std::string>();
}

int64_t require_int64(const json& j, const std::string& key) {
    const json& v = require_value(j, key);
    if (!v.is_number_integer()) {
        throw errors::ProtocolError("field '" + key + "' must be an integer");
    }
    return v.get<int64_t>();
}

bool require_bool(const json& j, const std::string& key) {
    const json& v = require_value(j, key);
    if (!v.is_boolean()) {
        throw errors::ProtocolError("field '" + key + "' must be a boolean");
    }
    return v.get<bool>();
}

json parse_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open file: " + path);
    }

    try {
        json j;
        file >> j;
        return j;
    } catch (const json::parse_error& e) {
        throw errors::ProtocolError(path + ": " + e.what());
    }
}

} // namespace json_utils
