#include "steward/frontmatter.hpp"

#include <sstream>

namespace steward {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

bool is_delimiter(const std::string& line) {
    return trim(line) == "---";
}

} // namespace

const std::string* Frontmatter::get(const std::string& key) const {
    for (const auto& [k, v] : fields) {
        if (k == key) return &v;
    }
    return nullptr;
}

void Frontmatter::set(const std::string& key, const std::string& value) {
    for (auto& [k, v] : fields) {
        if (k == key) {
            v = value;
            return;
        }
    }
    fields.emplace_back(key, value);
}

Frontmatter parse_frontmatter(const std::string& content) {
    Frontmatter fm;

    size_t first_end = content.find('\n');
    if (first_end == std::string::npos || !is_delimiter(content.substr(0, first_end))) {
        fm.body = content;
        return fm;
    }

    std::vector<std::pair<std::string, std::string>> fields;
    size_t pos = first_end + 1;
    while (pos <= content.size()) {
        size_t eol = content.find('\n', pos);
        std::string line = content.substr(pos, eol == std::string::npos ? std::string::npos : eol - pos);
        size_t next = eol == std::string::npos ? content.size() + 1 : eol + 1;

        if (is_delimiter(line)) {
            fm.present = true;
            fm.fields = std::move(fields);
            fm.body = next <= content.size() ? content.substr(next) : "";
            return fm;
        }

        auto colon = line.find(':');
        if (colon != std::string::npos) {
            std::string key = trim(line.substr(0, colon));
            std::string value = unquote(trim(line.substr(colon + 1)));
            if (!key.empty()) fields.emplace_back(key, value);
        }
        pos = next;
    }

    // Opening delimiter without a closing one
    fm.body = content;
    return fm;
}

std::string render_frontmatter(const Frontmatter& fm) {
    std::ostringstream out;
    out << "---\n";
    for (const auto& [k, v] : fm.fields) {
        out << k << ": " << v << "\n";
    }
    out << "---\n";
    out << fm.body;
    return out.str();
}

std::vector<std::string> parse_list_value(const std::string& value) {
    std::string inner = trim(value);
    if (inner.size() >= 2 && inner.front() == '[' && inner.back() == ']') {
        inner = inner.substr(1, inner.size() - 2);
    }

    std::vector<std::string> items;
    std::stringstream ss(inner);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = unquote(trim(item));
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

std::string format_list_value(const std::vector<std::string>& items) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += items[i];
    }
    return out + "]";
}

} // namespace steward
