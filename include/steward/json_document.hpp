#pragma once

#include "steward/result.hpp"

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace steward {

// Insertion-ordered so rewritten documents keep their key order
using json = nlohmann::ordered_json;

// ============================================================================
// Document IO
// ============================================================================

/**
 * Read a JSON object document.
 *
 * A missing file reads as an empty object. A file that exists but does not
 * parse, or parses to something other than an object, is a PARSE_ERROR:
 * callers must not overwrite it.
 */
Result<json> read_json_document(const std::string& path);

// Serialize with two-space indentation and a trailing newline, atomically
Result<void> write_json_document(const std::string& path, const json& doc);

// ============================================================================
// Field Helpers
// ============================================================================

namespace detail {

inline std::string get_string(const json& j, const std::string& key, const std::string& default_val = "") {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return default_val;
}

inline std::vector<std::string> get_string_array(const json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& item : j[key]) {
            if (item.is_string()) {
                result.push_back(item.get<std::string>());
            }
        }
    }
    return result;
}

inline bool get_bool(const json& j, const std::string& key, bool default_val = false) {
    if (j.contains(key) && j[key].is_boolean()) {
        return j[key].get<bool>();
    }
    return default_val;
}

inline std::map<std::string, std::string> get_string_map(const json& j, const std::string& key) {
    std::map<std::string, std::string> result;
    if (j.contains(key) && j[key].is_object()) {
        for (auto it = j[key].begin(); it != j[key].end(); ++it) {
            if (it.value().is_string()) {
                result[it.key()] = it.value().get<std::string>();
            }
        }
    }
    return result;
}

// Writes key only for new items or when the value differs from what the item
// held, so an unchanged entry is written back exactly as it was read
template<typename T>
bool set_if_changed(json& item, const std::string& key, const T& value, const T& current, bool fresh) {
    if (!fresh && value == current) return false;
    item[key] = value;
    return true;
}

} // namespace detail

} // namespace steward
