#include "steward/types.hpp"

#include <algorithm>
#include <cctype>

namespace steward {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

} // namespace

std::optional<ResourceKind> parse_resource_kind(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "hook" || lower == "hooks") return ResourceKind::Hook;
    if (lower == "capability" || lower == "capabilities" ||
        lower == "skill" || lower == "skills") return ResourceKind::Capability;
    if (lower == "server" || lower == "servers" || lower == "mcp") return ResourceKind::Server;
    if (lower == "instruction" || lower == "instructions") return ResourceKind::Instruction;
    return std::nullopt;
}

std::string ResourceRecord::summary() const {
    if (hook) {
        std::string s = hook->event;
        if (!hook->matcher.empty()) s += "[" + hook->matcher + "]";
        return s + " " + hook->command;
    }
    if (capability) {
        if (!capability->description.empty()) return capability->description;
        return join(capability->keywords, ", ");
    }
    if (server) {
        if (!server->command.empty()) {
            std::string s = server->command;
            if (!server->args.empty()) s += " " + join(server->args, " ");
            return s;
        }
        return server->url;
    }
    if (instruction) {
        return "priority " + std::to_string(instruction->priority) +
               ": " + join(instruction->keywords, ", ");
    }
    return "";
}

} // namespace steward
