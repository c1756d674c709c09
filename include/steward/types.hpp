#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace steward {

// ============================================================================
// Resource Kinds
// ============================================================================

enum class ResourceKind {
    Hook,
    Capability,
    Server,
    Instruction
};

inline const char* kind_to_string(ResourceKind k) {
    switch (k) {
        case ResourceKind::Hook: return "hook";
        case ResourceKind::Capability: return "capability";
        case ResourceKind::Server: return "server";
        case ResourceKind::Instruction: return "instruction";
        default: return "unknown";
    }
}

// Plural label used in dashboards and reports
inline const char* kind_display_name(ResourceKind k) {
    switch (k) {
        case ResourceKind::Hook: return "Hooks";
        case ResourceKind::Capability: return "Capabilities";
        case ResourceKind::Server: return "Servers";
        case ResourceKind::Instruction: return "Instructions";
        default: return "Unknown";
    }
}

// Accepts singular, plural and the host's own names ("skill", "mcp")
std::optional<ResourceKind> parse_resource_kind(const std::string& s);

inline std::vector<ResourceKind> all_resource_kinds() {
    return {ResourceKind::Hook, ResourceKind::Capability,
            ResourceKind::Server, ResourceKind::Instruction};
}

// ============================================================================
// Derived Status
// ============================================================================

enum class Status {
    Active,            // Hook present in the live store
    Managed,           // enabled and present (Capability, Server, Instruction)
    Registered,        // known to the registry, not currently active
    OrphanedLive,      // Hook in the live store only
    OrphanedRegistry,  // Capability in the registry with nothing on disk
    OrphanedDisk,      // Capability on disk with no registry entry
    NoFrontmatter      // Instruction file without a well-formed header
};

inline const char* status_to_string(Status s) {
    switch (s) {
        case Status::Active: return "active";
        case Status::Managed: return "managed";
        case Status::Registered: return "registered";
        case Status::OrphanedLive: return "orphaned-live";
        case Status::OrphanedRegistry: return "orphaned-registry";
        case Status::OrphanedDisk: return "orphaned-disk";
        case Status::NoFrontmatter: return "no-frontmatter";
        default: return "unknown";
    }
}

// Orphans and malformed items need attention; the rest are consistent
inline bool status_is_consistent(Status s) {
    return s == Status::Active || s == Status::Managed || s == Status::Registered;
}

// ============================================================================
// Kind Attributes
// ============================================================================

struct HookEntry {
    std::string id;
    std::string key;          // stable generated key, assigned at creation
    std::string event;
    std::string matcher;      // empty when the event has no matcher
    std::string command;
    bool async = false;
    std::string description;
};

struct CapabilityEntry {
    std::string id;
    std::string name;
    std::string description;
    std::vector<std::string> keywords;
    std::string path;         // descriptor file (SKILL.md)
    bool enabled = true;
};

struct ServerEntry {
    std::string name;
    std::string description;
    std::string command;
    std::vector<std::string> args;
    std::vector<std::string> tags;
    std::map<std::string, std::string> env;
    std::string url;
    bool enabled = false;
    bool auto_start = false;
};

struct InstructionEntry {
    std::string id;
    std::string name;
    std::vector<std::string> keywords;
    bool enabled = false;
    int priority = 50;
    std::string body;
    std::string file_path;

    bool has_frontmatter = false;
    std::vector<std::string> missing_fields;
    // Header keys steward does not interpret, in file order
    std::vector<std::pair<std::string, std::string>> extra;

    bool well_formed() const { return has_frontmatter && missing_fields.empty(); }
};

// ============================================================================
// Resource Record
// ============================================================================

/**
 * One reconciled resource. Exactly one of the attribute members is set,
 * matching `kind`.
 */
struct ResourceRecord {
    ResourceKind kind = ResourceKind::Hook;
    std::string id;
    Status status = Status::Registered;

    bool in_live = false;
    bool in_registry = false;
    bool enabled = false;

    std::string backing_path;
    bool backing_exists = false;

    std::optional<HookEntry> hook;
    std::optional<CapabilityEntry> capability;
    std::optional<ServerEntry> server;
    std::optional<InstructionEntry> instruction;

    // Short human description of the item, for tables
    std::string summary() const;
};

} // namespace steward
