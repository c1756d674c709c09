#pragma once

#include "steward/config.hpp"
#include "steward/result.hpp"
#include "steward/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace spdlog {
class logger;
}

namespace steward {

struct ServerSnapshot {
    std::vector<ServerEntry> servers;   // document order
};

/**
 * Adapter for servers.json, which is both the registry and the live store:
 * `{ name: {description, command, args, tags, enabled, auto_start, url, env} }`.
 *
 * Process lifecycle is layered on top by ProcessSupervisor.
 */
class ServerStore {
public:
    explicit ServerStore(const Config& config);

    Result<std::vector<ServerEntry>> read() const;
    Result<std::optional<ServerEntry>> find(const std::string& name) const;

    // Replaces the server entries with the given list. Entries that did not
    // change, unknown fields and non-server keys are written back untouched;
    // new entries are appended.
    Result<void> write(const std::vector<ServerEntry>& servers) const;

    // Raw JSON text of one entry, for archiving on removal
    Result<std::string> entry_json(const std::string& name) const;

    Result<ServerSnapshot> snapshot() const;

private:
    Config config_;
    std::shared_ptr<spdlog::logger> log_;
};

} // namespace steward
