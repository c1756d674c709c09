#pragma once

#include <string>
#include <utility>
#include <vector>

namespace steward {

/**
 * Metadata header of an instruction file:
 *
 *   ---
 *   id: code-style
 *   keywords: [style, lint]
 *   ---
 *   body...
 *
 * Values are kept as raw strings; list and boolean interpretation is left
 * to the caller.
 */
struct Frontmatter {
    bool present = false;
    std::vector<std::pair<std::string, std::string>> fields;
    std::string body;

    const std::string* get(const std::string& key) const;
    void set(const std::string& key, const std::string& value);
};

Frontmatter parse_frontmatter(const std::string& content);

// Inverse of parse_frontmatter for a document that had a header
std::string render_frontmatter(const Frontmatter& fm);

// "[a, b]" or "a, b" -> {"a", "b"}
std::vector<std::string> parse_list_value(const std::string& value);
std::string format_list_value(const std::vector<std::string>& items);

} // namespace steward
