#include "steward/registrar.hpp"
#include "steward/capability_store.hpp"
#include "steward/frontmatter.hpp"
#include "steward/hook_store.hpp"
#include "steward/instruction_store.hpp"
#include "steward/logging.hpp"
#include "steward/platform.hpp"
#include "steward/process.hpp"
#include "steward/reconciler.hpp"
#include "steward/server_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace steward {

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string kind_label(ResourceKind kind) {
    std::string label = kind_to_string(kind);
    label[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(label[0])));
    return label;
}

OperationResult invalid_id(ResourceKind kind, const std::string& id) {
    return OperationResult::failure(ErrorCode::VALIDATION_ERROR,
        "Invalid " + std::string(kind_to_string(kind)) + " id '" + id +
        "': use letters, digits, '.', '_', '-' or '@'");
}

OperationResult not_found(ResourceKind kind, const std::string& id) {
    return OperationResult::failure(ErrorCode::NOT_FOUND,
        kind_label(kind) + " '" + id + "' not found");
}

template<typename Entry, typename Pred>
typename std::vector<Entry>::iterator find_entry(std::vector<Entry>& entries, Pred pred) {
    return std::find_if(entries.begin(), entries.end(), pred);
}

// Optional description/name from a SKILL.md header
void read_descriptor_metadata(const std::string& descriptor, CapabilityEntry& entry) {
    auto content = read_file(descriptor);
    if (!content) return;
    auto fm = parse_frontmatter(*content);
    if (!fm.present) return;
    if (const std::string* name = fm.get("name")) {
        if (!name->empty()) entry.name = *name;
    }
    if (const std::string* desc = fm.get("description")) {
        entry.description = *desc;
    }
}

} // namespace

bool is_valid_resource_id(const std::string& id) {
    if (id.empty() || id[0] == '.' || id.size() > 128) return false;
    return std::all_of(id.begin(), id.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-' || c == '@';
    });
}

size_t DiscoveryResult::registered_count() const {
    return static_cast<size_t>(std::count_if(items.begin(), items.end(),
                                             [](const DiscoveredItem& i) { return i.registered; }));
}

Registrar::Registrar(const Config& config)
    : config_(config), log_(component_logger(config, "registrar")) {}

bool Registrar::is_owned_path(const std::string& path) const {
    std::error_code ec;
    auto target = fs::weakly_canonical(path, ec);
    if (ec) return false;

    for (const auto& root : {config_.paths.host_root, config_.paths.state_dir}) {
        auto base = fs::weakly_canonical(root, ec);
        if (ec) continue;
        auto rel = target.lexically_relative(base);
        if (!rel.empty() && *rel.begin() != "..") return true;
    }
    return false;
}

// ============================================================================
// Add
// ============================================================================

OperationResult Registrar::add_hook(HookEntry entry) {
    entry.command = trim(entry.command);
    if (entry.command.empty()) {
        return OperationResult::failure(ErrorCode::VALIDATION_ERROR, "Hook command must not be empty");
    }
    if (!is_valid_hook_event(entry.event)) {
        std::string valid;
        for (const auto& e : valid_hook_events()) {
            valid += (valid.empty() ? "" : ", ") + e;
        }
        return OperationResult::failure(ErrorCode::VALIDATION_ERROR,
            "Invalid event '" + entry.event + "'. Valid events: " + valid);
    }
    if (event_supports_matcher(entry.event)) {
        if (entry.matcher.empty()) entry.matcher = kDefaultMatcher;
    } else if (!entry.matcher.empty()) {
        return OperationResult::failure(ErrorCode::VALIDATION_ERROR,
            "Event '" + entry.event + "' does not take a matcher");
    }
    if (entry.id.empty()) entry.id = derive_hook_id(entry.command);
    if (!is_valid_resource_id(entry.id)) return invalid_id(ResourceKind::Hook, entry.id);

    HookStore store(config_);
    auto registry = store.read_registry();
    if (registry.isErr()) return OperationResult::failure(registry.error());
    auto& entries = registry.value();

    for (const auto& e : entries) {
        if (e.id == entry.id) {
            return OperationResult::failure(ErrorCode::DUPLICATE,
                "Hook '" + entry.id + "' already exists in registry (event=" + e.event + ")");
        }
        if (e.command == entry.command && e.event == entry.event) {
            return OperationResult::failure(ErrorCode::DUPLICATE,
                "Command is already registered for " + e.event + " as hook '" + e.id + "'");
        }
    }

    entry.key = generate_uuid();

    auto live = store.add_to_live(entry);
    if (live.isErr()) return OperationResult::failure(live.error());

    entries.push_back(entry);
    auto written = store.write_registry(entries);
    if (written.isErr()) {
        return OperationResult::failure(written.error().code(),
            "Hook added to live settings but registry write failed: " + written.error().message());
    }

    log_->info("added hook {} ({} {})", entry.id, entry.event, entry.command);
    auto result = OperationResult::success("Added hook '" + entry.id + "' to " + entry.event +
                                           (entry.matcher.empty() ? "" : " [" + entry.matcher + "]"));
    auto script = resolve_script_path(entry.command, store.home());
    if (script && !is_regular_file(*script)) {
        result.with_warning("script file not found: " + *script);
    }
    return result;
}

OperationResult Registrar::add_capability(CapabilityEntry entry) {
    if (!is_valid_resource_id(entry.id)) return invalid_id(ResourceKind::Capability, entry.id);

    CapabilityStore store(config_);
    auto registry = store.read_registry();
    if (registry.isErr()) return OperationResult::failure(registry.error());
    auto& entries = registry.value();

    for (const auto& e : entries) {
        if (e.id == entry.id) {
            return OperationResult::failure(ErrorCode::DUPLICATE,
                "Capability '" + entry.id + "' already exists in registry");
        }
    }

    if (entry.name.empty()) entry.name = entry.id;
    if (entry.keywords.empty()) entry.keywords = default_capability_keywords(entry.id);
    if (entry.path.empty()) entry.path = store.descriptor_path(entry.id);

    entries.push_back(entry);
    auto written = store.write_registry(entries);
    if (written.isErr()) return OperationResult::failure(written.error());

    log_->info("added capability {}", entry.id);
    auto result = OperationResult::success("Added capability '" + entry.id + "'");
    if (!is_regular_file(entry.path)) {
        result.with_warning(std::string(kCapabilityDescriptor) + " not found at " + entry.path);
    }
    return result;
}

OperationResult Registrar::add_server(ServerEntry entry) {
    if (!is_valid_resource_id(entry.name)) return invalid_id(ResourceKind::Server, entry.name);
    entry.command = trim(entry.command);
    entry.url = trim(entry.url);
    if (entry.command.empty() && entry.url.empty()) {
        return OperationResult::failure(ErrorCode::VALIDATION_ERROR,
            "Server '" + entry.name + "' needs a command or a url");
    }

    ServerStore store(config_);
    auto servers = store.read();
    if (servers.isErr()) return OperationResult::failure(servers.error());
    auto& entries = servers.value();

    for (const auto& s : entries) {
        if (s.name == entry.name) {
            return OperationResult::failure(ErrorCode::DUPLICATE,
                "Server '" + entry.name + "' already exists");
        }
    }

    entries.push_back(entry);
    auto written = store.write(entries);
    if (written.isErr()) return OperationResult::failure(written.error());

    log_->info("added server {}", entry.name);
    auto result = OperationResult::success("Added server '" + entry.name + "'");
    if (!entry.command.empty()) {
        auto path_var = entry.env.count("PATH") ? entry.env.at("PATH") : get_env("PATH").value_or("");
        if (!find_executable(entry.command, path_var)) {
            result.with_warning("command not found in PATH: " + entry.command);
        }
    }
    return result;
}

OperationResult Registrar::add_instruction(InstructionEntry entry) {
    if (!is_valid_resource_id(entry.id)) return invalid_id(ResourceKind::Instruction, entry.id);
    if (entry.name.empty()) entry.name = entry.id;
    if (entry.keywords.empty()) entry.keywords = {entry.id};

    InstructionStore store(config_);
    auto created = store.create(entry);
    if (created.isErr()) {
        if (created.error().code() == ErrorCode::DUPLICATE) {
            return OperationResult::failure(ErrorCode::DUPLICATE,
                "Instruction '" + entry.id + "' already exists");
        }
        return OperationResult::failure(created.error());
    }

    log_->info("added instruction {}", entry.id);
    return OperationResult::success("Added instruction '" + entry.id + "' (priority " +
                                    std::to_string(entry.priority) + ")");
}

// ============================================================================
// Remove
// ============================================================================

OperationResult Registrar::remove(ResourceKind kind, const std::string& id) {
    if (!is_valid_resource_id(id)) return invalid_id(kind, id);
    switch (kind) {
        case ResourceKind::Hook: return remove_hook(id);
        case ResourceKind::Capability: return remove_capability(id);
        case ResourceKind::Server: return remove_server(id);
        case ResourceKind::Instruction: return remove_instruction(id);
    }
    return not_found(kind, id);
}

OperationResult Registrar::remove_hook(const std::string& id) {
    HookStore store(config_);
    auto snap = store.snapshot();
    if (snap.isErr()) return OperationResult::failure(snap.error());

    auto records = reconcile_hooks(snap.value());
    auto rec = std::find_if(records.begin(), records.end(),
                            [&](const ResourceRecord& r) { return r.id == id; });
    if (rec == records.end()) return not_found(ResourceKind::Hook, id);

    OperationResult result;
    if (rec->backing_exists) {
        if (is_owned_path(rec->backing_path)) {
            auto archived = archive_path(rec->backing_path, config_.paths.archive_dir, "removed-hook-" + id);
            if (archived.isErr()) return OperationResult::failure(archived.error());
            result.archived_path = archived.value();
        } else {
            log_->info("hook {}: leaving {} in place (outside the host root)", id, rec->backing_path);
        }
    }

    if (rec->in_live) {
        auto removed = store.remove_from_live(rec->hook->event, rec->hook->command);
        if (removed.isErr()) return OperationResult::failure(removed.error());
    }

    if (rec->in_registry) {
        auto& entries = snap.value().registry;
        entries.erase(std::remove_if(entries.begin(), entries.end(),
                                     [&](const HookEntry& e) { return e.id == id; }),
                      entries.end());
        auto written = store.write_registry(entries);
        if (written.isErr()) return OperationResult::failure(written.error());
    }

    log_->info("removed hook {}", id);
    result.ok = true;
    result.message = "Removed hook '" + id + "'";
    if (!result.archived_path.empty()) result.message += " (archived to " + result.archived_path + ")";
    return result;
}

OperationResult Registrar::remove_capability(const std::string& id) {
    CapabilityStore store(config_);
    auto snap = store.snapshot();
    if (snap.isErr()) return OperationResult::failure(snap.error());

    auto records = reconcile_capabilities(snap.value());
    auto rec = std::find_if(records.begin(), records.end(),
                            [&](const ResourceRecord& r) { return r.id == id; });
    if (rec == records.end()) return not_found(ResourceKind::Capability, id);

    OperationResult result;
    if (rec->backing_exists) {
        // A conventional capability is archived as a whole directory
        std::string target = rec->backing_path;
        if (rec->backing_path == store.descriptor_path(id)) {
            target = get_parent_directory(rec->backing_path);
        }
        if (is_owned_path(target)) {
            auto archived = archive_path(target, config_.paths.archive_dir, "removed-capability-" + id);
            if (archived.isErr()) return OperationResult::failure(archived.error());
            result.archived_path = archived.value();
        } else {
            log_->info("capability {}: leaving {} in place (outside the host root)", id, target);
        }
    }

    if (rec->in_registry) {
        auto& entries = snap.value().registry;
        entries.erase(std::remove_if(entries.begin(), entries.end(),
                                     [&](const CapabilityEntry& e) { return e.id == id; }),
                      entries.end());
        auto written = store.write_registry(entries);
        if (written.isErr()) return OperationResult::failure(written.error());
    }

    log_->info("removed capability {}", id);
    result.ok = true;
    result.message = "Removed capability '" + id + "'";
    if (!result.archived_path.empty()) result.message += " (archived to " + result.archived_path + ")";
    return result;
}

OperationResult Registrar::remove_server(const std::string& id) {
    ServerStore store(config_);
    auto servers = store.read();
    if (servers.isErr()) return OperationResult::failure(servers.error());
    auto& entries = servers.value();

    auto it = find_entry(entries, [&](const ServerEntry& s) { return s.name == id; });
    if (it == entries.end()) return not_found(ResourceKind::Server, id);

    auto raw = store.entry_json(id);
    if (raw.isErr()) return OperationResult::failure(raw.error());
    auto archived = archive_content(id + ".server.json", raw.value(), config_.paths.archive_dir,
                                    "removed-server-" + id);
    if (archived.isErr()) return OperationResult::failure(archived.error());

    entries.erase(it);
    auto written = store.write(entries);
    if (written.isErr()) return OperationResult::failure(written.error());

    log_->info("removed server {}", id);
    auto result = OperationResult::success("Removed server '" + id + "' (archived to " + archived.value() + ")");
    result.archived_path = archived.value();
    return result;
}

OperationResult Registrar::remove_instruction(const std::string& id) {
    InstructionStore store(config_);
    std::string path = store.path_for(id);
    if (!is_regular_file(path)) return not_found(ResourceKind::Instruction, id);

    auto archived = archive_path(path, config_.paths.archive_dir, "removed-instruction-" + id);
    if (archived.isErr()) return OperationResult::failure(archived.error());

    log_->info("removed instruction {}", id);
    auto result = OperationResult::success("Removed instruction '" + id + "' (archived to " + archived.value() + ")");
    result.archived_path = archived.value();
    return result;
}

// ============================================================================
// Enable / Disable
// ============================================================================

OperationResult Registrar::enable(ResourceKind kind, const std::string& id) {
    if (!is_valid_resource_id(id)) return invalid_id(kind, id);
    switch (kind) {
        case ResourceKind::Hook: return set_hook_enabled(id, true);
        case ResourceKind::Capability: return set_capability_enabled(id, true);
        case ResourceKind::Server: return set_server_enabled(id, true);
        case ResourceKind::Instruction: return set_instruction_enabled(id, true);
    }
    return not_found(kind, id);
}

OperationResult Registrar::disable(ResourceKind kind, const std::string& id) {
    if (!is_valid_resource_id(id)) return invalid_id(kind, id);
    switch (kind) {
        case ResourceKind::Hook: return set_hook_enabled(id, false);
        case ResourceKind::Capability: return set_capability_enabled(id, false);
        case ResourceKind::Server: return set_server_enabled(id, false);
        case ResourceKind::Instruction: return set_instruction_enabled(id, false);
    }
    return not_found(kind, id);
}

OperationResult Registrar::set_hook_enabled(const std::string& id, bool enabled) {
    HookStore store(config_);
    auto registry = store.read_registry();
    if (registry.isErr()) return OperationResult::failure(registry.error());
    auto& entries = registry.value();

    auto it = find_entry(entries, [&](const HookEntry& e) { return e.id == id; });
    if (it == entries.end()) {
        return OperationResult::failure(ErrorCode::NOT_FOUND,
            "Hook '" + id + "' not found in registry (run discover to register live hooks)");
    }
    if (it->event.empty() || it->command.empty()) {
        return OperationResult::failure(ErrorCode::VALIDATION_ERROR,
            "Hook '" + id + "' has no event or command recorded");
    }

    bool changed = false;
    if (enabled) {
        auto added = store.add_to_live(*it);
        if (added.isErr()) return OperationResult::failure(added.error());
        changed = added.value();
    } else {
        auto removed = store.remove_from_live(it->event, it->command);
        if (removed.isErr()) return OperationResult::failure(removed.error());
        changed = removed.value();
    }

    auto written = store.write_registry(entries);
    if (written.isErr()) return OperationResult::failure(written.error());

    const char* verb = enabled ? "enabled" : "disabled";
    if (!changed) return OperationResult::success("Hook '" + id + "' already " + verb);
    log_->info("hook {} {}", id, verb);
    return OperationResult::success("Hook '" + id + "' " + verb);
}

OperationResult Registrar::set_capability_enabled(const std::string& id, bool enabled) {
    CapabilityStore store(config_);
    auto registry = store.read_registry();
    if (registry.isErr()) return OperationResult::failure(registry.error());
    auto& entries = registry.value();

    auto it = find_entry(entries, [&](const CapabilityEntry& e) { return e.id == id; });
    if (it == entries.end()) return not_found(ResourceKind::Capability, id);

    const char* verb = enabled ? "enabled" : "disabled";
    if (it->enabled == enabled) return OperationResult::success("Capability '" + id + "' already " + verb);

    it->enabled = enabled;
    auto written = store.write_registry(entries);
    if (written.isErr()) return OperationResult::failure(written.error());
    log_->info("capability {} {}", id, verb);
    return OperationResult::success("Capability '" + id + "' " + verb);
}

OperationResult Registrar::set_server_enabled(const std::string& id, bool enabled) {
    ServerStore store(config_);
    auto servers = store.read();
    if (servers.isErr()) return OperationResult::failure(servers.error());
    auto& entries = servers.value();

    auto it = find_entry(entries, [&](const ServerEntry& s) { return s.name == id; });
    if (it == entries.end()) return not_found(ResourceKind::Server, id);

    const char* verb = enabled ? "enabled" : "disabled";
    if (it->enabled == enabled) return OperationResult::success("Server '" + id + "' already " + verb);

    it->enabled = enabled;
    auto written = store.write(entries);
    if (written.isErr()) return OperationResult::failure(written.error());
    log_->info("server {} {}", id, verb);
    return OperationResult::success("Server '" + id + "' " + verb);
}

OperationResult Registrar::set_instruction_enabled(const std::string& id, bool enabled) {
    InstructionStore store(config_);
    auto found = store.find(id);
    if (found.isErr()) return OperationResult::failure(found.error());
    if (!found.value()) return not_found(ResourceKind::Instruction, id);

    const char* verb = enabled ? "enabled" : "disabled";
    const auto& entry = *found.value();
    if (entry.has_frontmatter && entry.enabled == enabled &&
        std::find(entry.missing_fields.begin(), entry.missing_fields.end(), "enabled") == entry.missing_fields.end()) {
        return OperationResult::success("Instruction '" + id + "' already " + verb);
    }

    auto set = store.set_field(id, "enabled", enabled ? "true" : "false");
    if (set.isErr()) return OperationResult::failure(set.error());
    return OperationResult::success("Instruction '" + id + "' " + verb);
}

// ============================================================================
// Registration of discovered items
// ============================================================================

OperationResult Registrar::register_live_hook(HookEntry live) {
    HookStore store(config_);
    auto registry = store.read_registry();
    if (registry.isErr()) return OperationResult::failure(registry.error());
    auto& entries = registry.value();

    if (live.id.empty()) live.id = derive_hook_id(live.command);
    for (const auto& e : entries) {
        if (e.id == live.id) {
            return OperationResult::failure(ErrorCode::DUPLICATE,
                "Hook '" + live.id + "' already exists in registry (event=" + e.event + ")");
        }
    }

    live.key = generate_uuid();
    if (live.description.empty()) live.description = "Discovered in live settings";
    entries.push_back(live);

    auto written = store.write_registry(entries);
    if (written.isErr()) return OperationResult::failure(written.error());
    log_->info("registered live hook {} ({})", live.id, live.command);
    return OperationResult::success("Registered hook '" + live.id + "'");
}

OperationResult Registrar::register_disk_capability(const std::string& id, const std::string& descriptor) {
    CapabilityStore store(config_);
    auto registry = store.read_registry();
    if (registry.isErr()) return OperationResult::failure(registry.error());
    auto& entries = registry.value();

    for (const auto& e : entries) {
        if (e.id == id) {
            return OperationResult::failure(ErrorCode::DUPLICATE,
                "Capability '" + id + "' already exists in registry");
        }
    }

    CapabilityEntry entry;
    entry.id = id;
    entry.name = id;
    entry.keywords = default_capability_keywords(id);
    entry.path = descriptor;
    entry.enabled = false;
    read_descriptor_metadata(descriptor, entry);
    entries.push_back(entry);

    auto written = store.write_registry(entries);
    if (written.isErr()) return OperationResult::failure(written.error());
    log_->info("registered capability {} from disk", id);
    return OperationResult::success("Registered capability '" + id + "' (disabled)");
}

DiscoveryResult Registrar::discover(bool apply) {
    DiscoveryResult result;
    result.applied = apply;

    auto hooks = HookStore(config_).snapshot();
    if (hooks.isErr()) {
        result.errors.push_back(hooks.error().message());
    } else {
        for (const auto& rec : reconcile_hooks(hooks.value())) {
            if (rec.status != Status::OrphanedLive) continue;
            DiscoveredItem item;
            item.kind = ResourceKind::Hook;
            item.id = rec.id;
            item.detail = rec.summary();
            if (apply) {
                auto r = register_live_hook(*rec.hook);
                item.registered = r.ok;
                if (!r.ok) item.error = r.message;
            }
            result.items.push_back(std::move(item));
        }
    }

    auto capabilities = CapabilityStore(config_).snapshot();
    if (capabilities.isErr()) {
        result.errors.push_back(capabilities.error().message());
    } else {
        for (const auto& rec : reconcile_capabilities(capabilities.value())) {
            if (rec.status != Status::OrphanedDisk) continue;
            DiscoveredItem item;
            item.kind = ResourceKind::Capability;
            item.id = rec.id;
            item.detail = rec.backing_path;
            if (apply) {
                auto r = register_disk_capability(rec.id, rec.backing_path);
                item.registered = r.ok;
                if (!r.ok) item.error = r.message;
            }
            result.items.push_back(std::move(item));
        }
    }

    if (apply) {
        log_->info("discovery registered {} of {} item(s)", result.registered_count(), result.items.size());
    }
    return result;
}

} // namespace steward
