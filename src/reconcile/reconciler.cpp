#include "steward/reconciler.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <utility>

namespace steward {

// ============================================================================
// Decision Tables
// ============================================================================

Status classify_hook(bool in_live, bool in_registry) {
    if (in_live) return in_registry ? Status::Active : Status::OrphanedLive;
    return Status::Registered;
}

Status classify_capability(bool on_disk, bool in_registry, bool enabled) {
    if (!in_registry) return Status::OrphanedDisk;
    if (!on_disk) return Status::OrphanedRegistry;
    return enabled ? Status::Managed : Status::Registered;
}

Status classify_server(bool enabled) {
    return enabled ? Status::Managed : Status::Registered;
}

Status classify_instruction(bool well_formed, bool enabled) {
    if (!well_formed) return Status::NoFrontmatter;
    return enabled ? Status::Managed : Status::Registered;
}

namespace {

std::vector<ResourceRecord> sorted_values(std::map<std::string, ResourceRecord>& by_id) {
    std::vector<ResourceRecord> out;
    out.reserve(by_id.size());
    for (auto& [id, record] : by_id) {
        out.push_back(std::move(record));
    }
    return out;
}

// id not yet taken in by_id, derived from base
std::string free_id(const std::map<std::string, ResourceRecord>& by_id,
                    const std::string& base, const std::string& event) {
    if (!by_id.count(base)) return base;
    std::string candidate = base + "@" + event;
    for (int n = 2; by_id.count(candidate); ++n) {
        candidate = base + "@" + event + "-" + std::to_string(n);
    }
    return candidate;
}

// Characters outside [A-Za-z0-9._@-] become '-', leading dots are dropped
std::string usable_id(const std::string& derived) {
    std::string id;
    for (char c : derived) {
        bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-' || c == '@';
        if (id.empty() && c == '.') continue;
        id += ok ? c : '-';
    }
    return id;
}

} // namespace

// ============================================================================
// Reconciliation
// ============================================================================

std::vector<ResourceRecord> reconcile_hooks(const HookSnapshot& snap) {
    std::map<std::string, ResourceRecord> by_id;

    auto script_for = [&](const std::string& command) -> std::string {
        auto it = snap.script_paths.find(command);
        return it == snap.script_paths.end() ? "" : it->second;
    };

    for (const auto& reg : snap.registry) {
        ResourceRecord r;
        r.kind = ResourceKind::Hook;
        r.id = reg.id;
        r.in_registry = true;
        r.hook = reg;
        r.backing_path = script_for(reg.command);
        r.backing_exists = !r.backing_path.empty() && snap.existing_scripts.count(r.backing_path) > 0;
        by_id[reg.id] = std::move(r);
    }

    // Unregistered live hooks in settings order. A derived id already taken
    // by the registry or an earlier live hook gets an @event suffix, so every
    // distinct command keeps its own record.
    std::set<std::pair<std::string, std::string>> seen;
    for (const auto& live : snap.live) {
        auto match = std::find_if(snap.registry.begin(), snap.registry.end(), [&](const HookEntry& reg) {
            return reg.command == live.command && (reg.event.empty() || reg.event == live.event);
        });
        if (match != snap.registry.end()) {
            by_id[match->id].in_live = true;
            continue;
        }
        if (!seen.insert({live.event, live.command}).second) continue;

        std::string derived = usable_id(live.id.empty() ? derive_hook_id(live.command) : live.id);
        if (derived.empty()) derived = "hook";

        ResourceRecord r;
        r.kind = ResourceKind::Hook;
        r.id = free_id(by_id, derived, live.event);
        r.in_live = true;
        r.hook = live;
        r.hook->id = r.id;
        r.backing_path = script_for(live.command);
        r.backing_exists = !r.backing_path.empty() && snap.existing_scripts.count(r.backing_path) > 0;
        by_id[r.id] = std::move(r);
    }

    for (auto& [id, r] : by_id) {
        r.enabled = r.in_live;
        r.status = classify_hook(r.in_live, r.in_registry);
    }

    return sorted_values(by_id);
}

std::vector<ResourceRecord> reconcile_capabilities(const CapabilitySnapshot& snap) {
    std::map<std::string, ResourceRecord> by_id;

    for (const auto& reg : snap.registry) {
        ResourceRecord r;
        r.kind = ResourceKind::Capability;
        r.id = reg.id;
        r.in_registry = true;
        r.enabled = reg.enabled;
        r.capability = reg;

        bool recorded = snap.recorded_path_exists.count(reg.id) > 0;
        auto disk = snap.on_disk.find(reg.id);
        r.in_live = recorded || disk != snap.on_disk.end();
        if (recorded) {
            r.backing_path = reg.path;
        } else if (disk != snap.on_disk.end()) {
            r.backing_path = disk->second;
        } else {
            r.backing_path = reg.path;
        }
        r.backing_exists = r.in_live;
        by_id[reg.id] = std::move(r);
    }

    for (const auto& [id, descriptor] : snap.on_disk) {
        if (by_id.count(id)) continue;
        ResourceRecord r;
        r.kind = ResourceKind::Capability;
        r.id = id;
        r.in_live = true;
        r.backing_path = descriptor;
        r.backing_exists = true;

        CapabilityEntry e;
        e.id = id;
        e.name = id;
        e.keywords = default_capability_keywords(id);
        e.path = descriptor;
        e.enabled = false;
        r.capability = e;
        by_id[id] = std::move(r);
    }

    for (auto& [id, r] : by_id) {
        r.status = classify_capability(r.in_live, r.in_registry, r.enabled);
    }

    return sorted_values(by_id);
}

std::vector<ResourceRecord> reconcile_servers(const ServerSnapshot& snap) {
    std::map<std::string, ResourceRecord> by_id;
    for (const auto& s : snap.servers) {
        ResourceRecord r;
        r.kind = ResourceKind::Server;
        r.id = s.name;
        r.in_live = true;
        r.in_registry = true;
        r.enabled = s.enabled;
        r.server = s;
        r.status = classify_server(s.enabled);
        by_id[s.name] = std::move(r);
    }
    return sorted_values(by_id);
}

std::vector<ResourceRecord> reconcile_instructions(const InstructionSnapshot& snap) {
    std::map<std::string, ResourceRecord> by_id;
    for (const auto& ins : snap.instructions) {
        ResourceRecord r;
        r.kind = ResourceKind::Instruction;
        r.id = ins.id;
        r.in_live = true;
        r.in_registry = true;
        r.enabled = ins.enabled;
        r.backing_path = ins.file_path;
        r.backing_exists = true;
        r.instruction = ins;
        r.status = classify_instruction(ins.well_formed(), ins.enabled);
        by_id[ins.id] = std::move(r);
    }
    return sorted_values(by_id);
}

// ============================================================================
// Summary
// ============================================================================

size_t StatusSummary::count(Status s) const {
    auto it = counts.find(s);
    return it == counts.end() ? 0 : it->second;
}

size_t StatusSummary::consistent() const {
    size_t n = 0;
    for (const auto& [status, c] : counts) {
        if (status_is_consistent(status)) n += c;
    }
    return n;
}

StatusSummary summarize(ResourceKind kind, const std::vector<ResourceRecord>& records) {
    StatusSummary summary;
    summary.kind = kind;
    summary.total = records.size();
    for (const auto& r : records) {
        summary.counts[r.status]++;
    }
    return summary;
}

// ============================================================================
// Reconciler
// ============================================================================

Reconciler::Reconciler(const Config& config) : config_(config) {}

Result<KindStatus> Reconciler::status(ResourceKind kind) const {
    KindStatus ks;
    ks.kind = kind;

    switch (kind) {
        case ResourceKind::Hook: {
            auto snap = HookStore(config_).snapshot();
            if (snap.isErr()) return Result<KindStatus>::err(snap.error());
            ks.records = reconcile_hooks(snap.value());
            break;
        }
        case ResourceKind::Capability: {
            auto snap = CapabilityStore(config_).snapshot();
            if (snap.isErr()) return Result<KindStatus>::err(snap.error());
            ks.records = reconcile_capabilities(snap.value());
            break;
        }
        case ResourceKind::Server: {
            auto snap = ServerStore(config_).snapshot();
            if (snap.isErr()) return Result<KindStatus>::err(snap.error());
            ks.records = reconcile_servers(snap.value());
            break;
        }
        case ResourceKind::Instruction: {
            auto snap = InstructionStore(config_).snapshot();
            if (snap.isErr()) return Result<KindStatus>::err(snap.error());
            ks.records = reconcile_instructions(snap.value());
            break;
        }
    }

    ks.summary = summarize(kind, ks.records);
    return Result<KindStatus>::ok(std::move(ks));
}

} // namespace steward
