#include "steward/capability_store.hpp"
#include "steward/json_document.hpp"
#include "steward/logging.hpp"
#include "steward/platform.hpp"

#include <algorithm>
#include <set>

namespace steward {

namespace {

CapabilityEntry entry_from_registry_item(const json& item) {
    CapabilityEntry e;
    e.id = detail::get_string(item, "id");
    e.name = detail::get_string(item, "name", e.id);
    e.description = detail::get_string(item, "description");
    e.keywords = detail::get_string_array(item, "keywords");
    e.path = detail::get_string(item, "path");
    e.enabled = detail::get_bool(item, "enabled", true);
    return e;
}

json patched_item(json item, const CapabilityEntry& e, bool fresh) {
    CapabilityEntry cur = entry_from_registry_item(item);
    detail::set_if_changed(item, "id", e.id, cur.id, fresh);
    detail::set_if_changed(item, "name", e.name, cur.name, fresh);
    detail::set_if_changed(item, "description", e.description, cur.description, fresh);
    detail::set_if_changed(item, "keywords", e.keywords, cur.keywords, fresh);
    detail::set_if_changed(item, "path", e.path, cur.path, fresh);
    detail::set_if_changed(item, "enabled", e.enabled, cur.enabled, fresh);
    return item;
}

} // namespace

std::vector<std::string> default_capability_keywords(const std::string& id) {
    std::string spaced = id;
    std::replace(spaced.begin(), spaced.end(), '-', ' ');
    if (spaced == id) return {id};
    return {spaced, id};
}

CapabilityStore::CapabilityStore(const Config& config)
    : config_(config), log_(component_logger(config, "capabilities")) {}

std::string CapabilityStore::descriptor_path(const std::string& id) const {
    return join_path(join_path(config_.paths.capabilities_dir, id), kCapabilityDescriptor);
}

std::map<std::string, std::string> CapabilityStore::scan_disk() const {
    std::map<std::string, std::string> found;
    for (const auto& name : list_directory(config_.paths.capabilities_dir)) {
        if (name.empty() || name[0] == '.') continue;
        std::string dir = join_path(config_.paths.capabilities_dir, name);
        if (!is_directory(dir)) continue;
        std::string descriptor = join_path(dir, kCapabilityDescriptor);
        if (is_regular_file(descriptor)) {
            found[name] = descriptor;
        }
    }
    return found;
}

Result<std::vector<CapabilityEntry>> CapabilityStore::read_registry() const {
    auto doc = read_json_document(config_.paths.capability_registry);
    if (doc.isErr()) {
        return Result<std::vector<CapabilityEntry>>::err(doc.error());
    }

    std::vector<CapabilityEntry> entries;
    const auto& reg = doc.value();
    if (reg.contains("items") && reg["items"].is_array()) {
        for (const auto& item : reg["items"]) {
            if (!item.is_object()) continue;
            CapabilityEntry e = entry_from_registry_item(item);
            if (e.id.empty()) {
                log_->warn("skipping capability registry item without id");
                continue;
            }
            entries.push_back(std::move(e));
        }
    }

    return Result<std::vector<CapabilityEntry>>::ok(entries);
}

Result<void> CapabilityStore::write_registry(const std::vector<CapabilityEntry>& entries) const {
    auto doc = read_json_document(config_.paths.capability_registry);
    if (doc.isErr()) {
        return Result<void>::err(doc.error());
    }

    auto& reg = doc.value();
    std::set<std::string> kept;
    json items = json::array();
    if (reg.contains("items") && reg["items"].is_array()) {
        for (const auto& item : reg["items"]) {
            std::string id = item.is_object() ? detail::get_string(item, "id") : "";
            if (id.empty()) {
                items.push_back(item);
                continue;
            }
            auto e = std::find_if(entries.begin(), entries.end(),
                                  [&](const CapabilityEntry& c) { return c.id == id; });
            if (e == entries.end()) continue;
            // A repeated id is left as it was
            items.push_back(kept.insert(id).second ? patched_item(item, *e, false) : item);
        }
    }
    for (const auto& e : entries) {
        if (kept.count(e.id)) continue;
        items.push_back(patched_item(json::object(), e, true));
    }

    reg["items"] = std::move(items);
    return write_json_document(config_.paths.capability_registry, reg);
}

Result<CapabilitySnapshot> CapabilityStore::snapshot() const {
    auto registry = read_registry();
    if (registry.isErr()) return Result<CapabilitySnapshot>::err(registry.error());

    CapabilitySnapshot snap;
    snap.registry = std::move(registry.value());
    snap.on_disk = scan_disk();
    for (const auto& e : snap.registry) {
        if (!e.path.empty() && is_regular_file(e.path)) {
            snap.recorded_path_exists.insert(e.id);
        }
    }
    return Result<CapabilitySnapshot>::ok(std::move(snap));
}

} // namespace steward
