#include "steward/server_store.hpp"
#include "steward/json_document.hpp"
#include "steward/logging.hpp"

#include <algorithm>

namespace steward {

namespace {

ServerEntry entry_from_json(const std::string& name, const json& j) {
    ServerEntry e;
    e.name = name;
    e.description = detail::get_string(j, "description");
    e.command = detail::get_string(j, "command");
    e.args = detail::get_string_array(j, "args");
    e.tags = detail::get_string_array(j, "tags");
    e.env = detail::get_string_map(j, "env");
    e.url = detail::get_string(j, "url");
    e.enabled = detail::get_bool(j, "enabled");
    e.auto_start = detail::get_bool(j, "auto_start");
    return e;
}

} // namespace

ServerStore::ServerStore(const Config& config)
    : config_(config), log_(component_logger(config, "servers")) {}

Result<std::vector<ServerEntry>> ServerStore::read() const {
    auto doc = read_json_document(config_.paths.servers_file);
    if (doc.isErr()) {
        return Result<std::vector<ServerEntry>>::err(doc.error());
    }

    std::vector<ServerEntry> servers;
    const auto& d = doc.value();
    for (auto it = d.begin(); it != d.end(); ++it) {
        if (!it.value().is_object()) {
            log_->warn("skipping server '{}': entry is not an object", it.key());
            continue;
        }
        servers.push_back(entry_from_json(it.key(), it.value()));
    }
    return Result<std::vector<ServerEntry>>::ok(servers);
}

Result<std::optional<ServerEntry>> ServerStore::find(const std::string& name) const {
    auto servers = read();
    if (servers.isErr()) {
        return Result<std::optional<ServerEntry>>::err(servers.error());
    }
    for (const auto& s : servers.value()) {
        if (s.name == name) return Result<std::optional<ServerEntry>>::ok(s);
    }
    return Result<std::optional<ServerEntry>>::ok(std::nullopt);
}

Result<void> ServerStore::write(const std::vector<ServerEntry>& servers) const {
    auto doc = read_json_document(config_.paths.servers_file);
    if (doc.isErr()) {
        return Result<void>::err(doc.error());
    }

    auto patched = [](json item, const ServerEntry& s, bool fresh) {
        ServerEntry cur = entry_from_json(s.name, item);
        detail::set_if_changed(item, "description", s.description, cur.description, fresh);
        detail::set_if_changed(item, "command", s.command, cur.command, fresh);
        detail::set_if_changed(item, "args", s.args, cur.args, fresh);
        detail::set_if_changed(item, "tags", s.tags, cur.tags, fresh);
        detail::set_if_changed(item, "enabled", s.enabled, cur.enabled, fresh);
        detail::set_if_changed(item, "auto_start", s.auto_start, cur.auto_start, fresh);
        detail::set_if_changed(item, "url", s.url, cur.url, fresh);
        detail::set_if_changed(item, "env", s.env, cur.env, fresh);
        return item;
    };
    auto wanted = [&](const std::string& name) {
        return std::find_if(servers.begin(), servers.end(),
                            [&](const ServerEntry& s) { return s.name == name; });
    };

    // Existing keys keep their place. Keys that are not server entries are
    // carried over as they are.
    const auto& previous = doc.value();
    json out = json::object();
    for (auto it = previous.begin(); it != previous.end(); ++it) {
        if (!it.value().is_object()) {
            out[it.key()] = it.value();
            continue;
        }
        auto s = wanted(it.key());
        if (s == servers.end()) continue;
        out[it.key()] = patched(it.value(), *s, false);
    }
    for (const auto& s : servers) {
        if (previous.contains(s.name) && previous[s.name].is_object()) continue;
        out[s.name] = patched(json::object(), s, true);
    }

    return write_json_document(config_.paths.servers_file, out);
}

Result<std::string> ServerStore::entry_json(const std::string& name) const {
    auto doc = read_json_document(config_.paths.servers_file);
    if (doc.isErr()) {
        return Result<std::string>::err(doc.error());
    }
    if (!doc.value().contains(name)) {
        return Result<std::string>::err(Error(ErrorCode::NOT_FOUND, "server '" + name + "' not found"));
    }
    json wrapped = json::object();
    wrapped[name] = doc.value()[name];
    return Result<std::string>::ok(wrapped.dump(2) + "\n");
}

Result<ServerSnapshot> ServerStore::snapshot() const {
    auto servers = read();
    if (servers.isErr()) return Result<ServerSnapshot>::err(servers.error());
    ServerSnapshot snap;
    snap.servers = std::move(servers.value());
    return Result<ServerSnapshot>::ok(std::move(snap));
}

} // namespace steward
