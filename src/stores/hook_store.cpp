#include "steward/hook_store.hpp"
#include "steward/json_document.hpp"
#include "steward/logging.hpp"
#include "steward/platform.hpp"

#include <algorithm>
#include <sstream>

namespace steward {

namespace {

std::vector<std::string> split_whitespace(const std::string& s) {
    std::vector<std::string> tokens;
    std::istringstream iss(s);
    std::string tok;
    while (iss >> tok) {
        tokens.push_back(tok);
    }
    return tokens;
}

std::optional<std::string> quoted_segment(const std::string& command) {
    for (char quote : {'"', '\''}) {
        auto open = command.find(quote);
        if (open == std::string::npos) continue;
        auto close = command.find(quote, open + 1);
        if (close == std::string::npos || close == open + 1) continue;
        return command.substr(open + 1, close - open - 1);
    }
    return std::nullopt;
}

std::string strip_quotes(std::string s) {
    while (!s.empty() && (s.front() == '"' || s.front() == '\'')) s.erase(0, 1);
    while (!s.empty() && (s.back() == '"' || s.back() == '\'')) s.pop_back();
    return s;
}

void replace_all(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string expand_home(std::string path, const std::string& home) {
    replace_all(path, "${HOME}", home);
    replace_all(path, "$HOME", home);
    replace_all(path, "%USERPROFILE%", home);
    if (path == "~") return home;
    if (path.rfind("~/", 0) == 0) path = home + path.substr(1);
    return path;
}

bool is_interpreter(const std::string& token) {
    static const char* interpreters[] = {"node", "bash", "sh", "python", "python3", "deno", "bun"};
    std::string name = get_filename(token);
    for (const char* i : interpreters) {
        if (name == i) return true;
    }
    return false;
}

// Matcher as stored in a trigger group; absent means ""
std::string group_matcher(const json& group) {
    return detail::get_string(group, "matcher");
}

HookEntry entry_from_registry_item(const json& item) {
    HookEntry e;
    e.id = detail::get_string(item, "id");
    e.key = detail::get_string(item, "key");
    e.event = detail::get_string(item, "event");
    e.matcher = detail::get_string(item, "matcher");
    e.command = detail::get_string(item, "command");
    e.async = detail::get_bool(item, "async");
    e.description = detail::get_string(item, "description");
    return e;
}

} // namespace

// ============================================================================
// Events
// ============================================================================

const std::vector<std::string>& valid_hook_events() {
    static const std::vector<std::string> events = {
        "SessionStart", "SessionEnd", "UserPromptSubmit", "PreToolUse",
        "PostToolUse", "PreCompact", "Stop", "SubagentStop",
        "Notification", "PermissionRequest",
    };
    return events;
}

bool is_valid_hook_event(const std::string& event) {
    const auto& events = valid_hook_events();
    return std::find(events.begin(), events.end(), event) != events.end();
}

bool event_supports_matcher(const std::string& event) {
    return event == "PreToolUse" || event == "PostToolUse" || event == "PermissionRequest" ||
           event == "PreCompact" || event == "SessionStart";
}

// ============================================================================
// Command Parsing
// ============================================================================

std::string derive_hook_id(const std::string& command) {
    std::string source;
    if (auto quoted = quoted_segment(command)) {
        source = *quoted;
    } else {
        auto tokens = split_whitespace(command);
        for (auto it = tokens.rbegin(); it != tokens.rend(); ++it) {
            if (!it->empty() && (*it)[0] != '-') {
                source = *it;
                break;
            }
        }
        if (source.empty() && !tokens.empty()) source = tokens.back();
    }

    source = strip_quotes(source);
    while (!source.empty() && source.back() == '/') source.pop_back();
    if (source.empty()) return "";

    return get_stem(source);
}

std::optional<std::string> resolve_script_path(const std::string& command, const std::string& home) {
    if (auto quoted = quoted_segment(command)) {
        return expand_home(*quoted, home);
    }

    auto tokens = split_whitespace(command);
    if (tokens.empty()) return std::nullopt;

    if (is_interpreter(tokens[0])) {
        for (size_t i = 1; i < tokens.size(); ++i) {
            if (tokens[i][0] != '-') return expand_home(strip_quotes(tokens[i]), home);
        }
        return std::nullopt;
    }

    if (tokens.size() == 1) return expand_home(strip_quotes(tokens[0]), home);
    return expand_home(strip_quotes(tokens.back()), home);
}

// ============================================================================
// Hook Store
// ============================================================================

HookStore::HookStore(const Config& config)
    : config_(config),
      home_(get_home_directory()),
      log_(component_logger(config, "hooks")) {}

Result<std::vector<HookEntry>> HookStore::read_live() const {
    auto doc = read_json_document(config_.paths.settings_file);
    if (doc.isErr()) {
        return Result<std::vector<HookEntry>>::err(doc.error());
    }

    std::vector<HookEntry> entries;
    const auto& settings = doc.value();
    if (!settings.contains("hooks") || !settings["hooks"].is_object()) {
        return Result<std::vector<HookEntry>>::ok(entries);
    }

    const auto& hooks = settings["hooks"];
    for (auto ev = hooks.begin(); ev != hooks.end(); ++ev) {
        if (!ev.value().is_array()) continue;
        for (const auto& group : ev.value()) {
            if (!group.is_object() || !group.contains("hooks") || !group["hooks"].is_array()) continue;
            std::string matcher = group_matcher(group);
            for (const auto& h : group["hooks"]) {
                if (!h.is_object()) continue;
                std::string type = detail::get_string(h, "type", "command");
                std::string command = detail::get_string(h, "command");
                if (type != "command" || command.empty()) continue;

                HookEntry e;
                e.id = derive_hook_id(command);
                e.event = ev.key();
                e.matcher = matcher;
                e.command = command;
                e.async = detail::get_bool(h, "async");
                entries.push_back(std::move(e));
            }
        }
    }

    return Result<std::vector<HookEntry>>::ok(entries);
}

Result<std::vector<HookEntry>> HookStore::read_registry() const {
    auto doc = read_json_document(config_.paths.hook_registry);
    if (doc.isErr()) {
        return Result<std::vector<HookEntry>>::err(doc.error());
    }

    std::vector<HookEntry> entries;
    const auto& reg = doc.value();
    if (reg.contains("items") && reg["items"].is_array()) {
        for (const auto& item : reg["items"]) {
            if (!item.is_object()) continue;
            auto e = entry_from_registry_item(item);
            if (e.id.empty()) {
                log_->warn("skipping hook registry item without id");
                continue;
            }
            entries.push_back(std::move(e));
        }
    }

    return Result<std::vector<HookEntry>>::ok(entries);
}

Result<void> HookStore::write_registry(const std::vector<HookEntry>& entries) const {
    auto doc = read_json_document(config_.paths.hook_registry);
    if (doc.isErr()) {
        return Result<void>::err(doc.error());
    }

    // Legacy flag: kept for older readers, never read back
    std::set<std::string> live_commands;
    auto live = read_live();
    if (live.isOk()) {
        for (const auto& e : live.value()) live_commands.insert(e.command);
    } else {
        log_->warn("managed flags not refreshed: {}", live.error().message());
    }

    auto patched = [&](json item, const HookEntry& e, bool fresh) {
        HookEntry cur = entry_from_registry_item(item);
        bool changed = false;
        changed |= detail::set_if_changed(item, "id", e.id, cur.id, fresh);
        changed |= detail::set_if_changed(item, "key", e.key, cur.key, fresh);
        changed |= detail::set_if_changed(item, "event", e.event, cur.event, fresh);
        changed |= detail::set_if_changed(item, "matcher", e.matcher, cur.matcher, fresh);
        changed |= detail::set_if_changed(item, "command", e.command, cur.command, fresh);
        changed |= detail::set_if_changed(item, "async", e.async, cur.async, fresh);
        changed |= detail::set_if_changed(item, "description", e.description, cur.description, fresh);
        if (live.isOk() && (changed || item.contains("managed"))) {
            item["managed"] = live_commands.count(e.command) > 0;
        } else if (!item.contains("managed") && changed) {
            item["managed"] = false;
        }
        return item;
    };

    auto& reg = doc.value();
    const bool new_document = reg.empty();
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
                                  [&](const HookEntry& h) { return h.id == id; });
            if (e == entries.end()) continue;
            items.push_back(kept.insert(id).second ? patched(item, *e, false) : item);
        }
    }
    for (const auto& e : entries) {
        if (kept.count(e.id)) continue;
        items.push_back(patched(json::object(), e, true));
    }

    if (new_document) reg["version"] = "1.0";
    reg["items"] = std::move(items);
    return write_json_document(config_.paths.hook_registry, reg);
}

Result<bool> HookStore::add_to_live(const HookEntry& entry) const {
    auto doc = read_json_document(config_.paths.settings_file);
    if (doc.isErr()) {
        return Result<bool>::err(doc.error());
    }

    auto& settings = doc.value();
    if (!settings.contains("hooks") || !settings["hooks"].is_object()) {
        settings["hooks"] = json::object();
    }
    auto& hooks = settings["hooks"];
    if (!hooks.contains(entry.event) || !hooks[entry.event].is_array()) {
        hooks[entry.event] = json::array();
    }
    auto& bucket = hooks[entry.event];

    json command_entry = {{"type", "command"}, {"command", entry.command}};
    if (entry.async) command_entry["async"] = true;

    for (auto& group : bucket) {
        if (!group.is_object() || group_matcher(group) != entry.matcher) continue;
        if (!group.contains("hooks") || !group["hooks"].is_array()) {
            group["hooks"] = json::array();
        }
        for (const auto& h : group["hooks"]) {
            if (detail::get_string(h, "command") == entry.command) {
                return Result<bool>::ok(false);
            }
        }
        group["hooks"].push_back(command_entry);
        auto written = write_json_document(config_.paths.settings_file, settings);
        if (written.isErr()) return Result<bool>::err(written.error());
        log_->info("added '{}' to existing {} group", entry.command, entry.event);
        return Result<bool>::ok(true);
    }

    json group = json::object();
    if (!entry.matcher.empty()) group["matcher"] = entry.matcher;
    group["hooks"] = json::array({command_entry});
    bucket.push_back(std::move(group));

    auto written = write_json_document(config_.paths.settings_file, settings);
    if (written.isErr()) return Result<bool>::err(written.error());
    log_->info("added '{}' to new {} group", entry.command, entry.event);
    return Result<bool>::ok(true);
}

Result<bool> HookStore::remove_from_live(const std::string& event, const std::string& command) const {
    auto doc = read_json_document(config_.paths.settings_file);
    if (doc.isErr()) {
        return Result<bool>::err(doc.error());
    }

    auto& settings = doc.value();
    if (!settings.contains("hooks") || !settings["hooks"].is_object()) {
        return Result<bool>::ok(false);
    }

    auto& hooks = settings["hooks"];
    bool removed = false;
    std::vector<std::string> empty_events;

    for (auto ev = hooks.begin(); ev != hooks.end(); ++ev) {
        if (!event.empty() && ev.key() != event) continue;
        if (!ev.value().is_array()) continue;

        bool removed_here = false;
        json kept_groups = json::array();
        for (auto& group : ev.value()) {
            if (!group.is_object() || !group.contains("hooks") || !group["hooks"].is_array()) {
                kept_groups.push_back(group);
                continue;
            }
            bool removed_from_group = false;
            json kept_hooks = json::array();
            for (const auto& h : group["hooks"]) {
                if (detail::get_string(h, "command") == command) {
                    removed_from_group = true;
                } else {
                    kept_hooks.push_back(h);
                }
            }
            // Only prune groups this removal emptied
            if (removed_from_group && kept_hooks.empty()) {
                removed_here = true;
                continue;
            }
            removed_here = removed_here || removed_from_group;
            group["hooks"] = std::move(kept_hooks);
            kept_groups.push_back(group);
        }

        if (!removed_here) continue;
        removed = true;
        if (kept_groups.empty()) {
            empty_events.push_back(ev.key());
        } else {
            ev.value() = std::move(kept_groups);
        }
    }

    if (!removed) {
        return Result<bool>::ok(false);
    }

    for (const auto& ev : empty_events) {
        hooks.erase(ev);
    }

    auto written = write_json_document(config_.paths.settings_file, settings);
    if (written.isErr()) return Result<bool>::err(written.error());
    log_->info("removed '{}' from live hooks", command);
    return Result<bool>::ok(true);
}

Result<HookSnapshot> HookStore::snapshot() const {
    auto live = read_live();
    if (live.isErr()) return Result<HookSnapshot>::err(live.error());
    auto registry = read_registry();
    if (registry.isErr()) return Result<HookSnapshot>::err(registry.error());

    HookSnapshot snap;
    snap.live = std::move(live.value());
    snap.registry = std::move(registry.value());

    auto note_script = [&](const std::string& command) {
        if (snap.script_paths.count(command)) return;
        auto path = resolve_script_path(command, home_);
        snap.script_paths[command] = path.value_or("");
        if (path && is_regular_file(*path)) {
            snap.existing_scripts.insert(*path);
        }
    };
    for (const auto& e : snap.live) note_script(e.command);
    for (const auto& e : snap.registry) note_script(e.command);

    return Result<HookSnapshot>::ok(std::move(snap));
}

} // namespace steward
