#pragma once

#include "steward/capability_store.hpp"
#include "steward/config.hpp"
#include "steward/hook_store.hpp"
#include "steward/instruction_store.hpp"
#include "steward/result.hpp"
#include "steward/server_store.hpp"
#include "steward/types.hpp"

#include <map>
#include <string>
#include <vector>

namespace steward {

// ============================================================================
// Decision Tables
// ============================================================================

// Only meaningful when in_live || in_registry
Status classify_hook(bool in_live, bool in_registry);
Status classify_capability(bool on_disk, bool in_registry, bool enabled);
Status classify_server(bool enabled);
Status classify_instruction(bool well_formed, bool enabled);

// ============================================================================
// Reconciliation
// ============================================================================
//
// Each function classifies the union of ids in the snapshot exactly once.
// Records come back sorted by id.

/**
 * Live hooks join registry entries by exact command string (and event when
 * the registry entry names one). Unmatched live hooks are keyed by their
 * derived id; when two derive the same id, the later one in the settings
 * document wins.
 */
std::vector<ResourceRecord> reconcile_hooks(const HookSnapshot& snap);

std::vector<ResourceRecord> reconcile_capabilities(const CapabilitySnapshot& snap);
std::vector<ResourceRecord> reconcile_servers(const ServerSnapshot& snap);
std::vector<ResourceRecord> reconcile_instructions(const InstructionSnapshot& snap);

// ============================================================================
// Summary
// ============================================================================

struct StatusSummary {
    ResourceKind kind = ResourceKind::Hook;
    size_t total = 0;
    std::map<Status, size_t> counts;

    size_t count(Status s) const;
    size_t consistent() const;
    size_t needs_attention() const { return total - consistent(); }
};

StatusSummary summarize(ResourceKind kind, const std::vector<ResourceRecord>& records);

struct KindStatus {
    ResourceKind kind = ResourceKind::Hook;
    std::vector<ResourceRecord> records;
    StatusSummary summary;
};

/**
 * Reads one kind's stores through its adapter and reconciles them.
 */
class Reconciler {
public:
    explicit Reconciler(const Config& config);

    Result<KindStatus> status(ResourceKind kind) const;

private:
    Config config_;
};

} // namespace steward
