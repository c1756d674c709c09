#pragma once

#include "steward/config.hpp"
#include "steward/result.hpp"
#include "steward/types.hpp"

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace spdlog {
class logger;
}

namespace steward {

// ============================================================================
// Hook Events
// ============================================================================

const std::vector<std::string>& valid_hook_events();
bool is_valid_hook_event(const std::string& event);

// Events whose trigger groups carry a matcher pattern
bool event_supports_matcher(const std::string& event);

constexpr const char* kDefaultMatcher = "*";

// ============================================================================
// Command Parsing
// ============================================================================

/**
 * Best-effort identifier for a live hook that has no registry entry.
 *
 * Takes the quoted path segment if the command has one, otherwise the final
 * whitespace-delimited token that is not a flag, and returns its basename
 * without extension. Different commands can map to the same id.
 */
std::string derive_hook_id(const std::string& command);

// Script file a command runs, with $HOME, ${HOME}, %USERPROFILE% and a
// leading ~ expanded. nullopt when nothing path-like can be found.
std::optional<std::string> resolve_script_path(const std::string& command, const std::string& home);

// ============================================================================
// Hook Store
// ============================================================================

struct HookSnapshot {
    std::vector<HookEntry> live;        // settings order, ids derived
    std::vector<HookEntry> registry;    // registry order
    std::map<std::string, std::string> script_paths;   // command -> script
    std::set<std::string> existing_scripts;
};

/**
 * Adapter for the host settings document (live) and hook-registry.json.
 *
 * The live document is rewritten with every non-hook key left as it was.
 */
class HookStore {
public:
    explicit HookStore(const Config& config);

    Result<std::vector<HookEntry>> read_live() const;
    Result<std::vector<HookEntry>> read_registry() const;

    // Rewrites items, keeping fields of existing items steward does not
    // know about, and refreshes each item's legacy `managed` flag
    Result<void> write_registry(const std::vector<HookEntry>& entries) const;

    // Add the command under event/matcher. False if it was already there.
    Result<bool> add_to_live(const HookEntry& entry) const;

    // Remove exact command matches (within event when non-empty), pruning
    // trigger groups and event buckets left empty. False if none matched.
    Result<bool> remove_from_live(const std::string& event, const std::string& command) const;

    Result<HookSnapshot> snapshot() const;

    const std::string& home() const { return home_; }

private:
    Config config_;
    std::string home_;
    std::shared_ptr<spdlog::logger> log_;
};

} // namespace steward
