#pragma once

#include "steward/config.hpp"
#include "steward/result.hpp"
#include "steward/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace spdlog {
class logger;
}

namespace steward {

// Letters, digits, '.', '_', '-', '@'; not starting with '.'
bool is_valid_resource_id(const std::string& id);

struct DiscoveredItem {
    ResourceKind kind = ResourceKind::Hook;
    std::string id;
    std::string detail;
    bool registered = false;
    std::string error;
};

struct DiscoveryResult {
    bool applied = false;
    std::vector<DiscoveredItem> items;
    std::vector<std::string> errors;     // stores that could not be read

    size_t registered_count() const;
};

/**
 * Mutations that keep live stores and registries in agreement.
 *
 * Expected failures (validation, duplicate, not found) come back as
 * OperationResult with ok == false. Removal archives instead of deleting.
 * Operations that touch two files write the live store first and the
 * registry second, with no transaction across them.
 */
class Registrar {
public:
    explicit Registrar(const Config& config);

    OperationResult add_hook(HookEntry entry);
    OperationResult add_capability(CapabilityEntry entry);
    OperationResult add_server(ServerEntry entry);
    OperationResult add_instruction(InstructionEntry entry);

    OperationResult remove(ResourceKind kind, const std::string& id);
    OperationResult enable(ResourceKind kind, const std::string& id);
    OperationResult disable(ResourceKind kind, const std::string& id);

    // Record an already-live hook in the registry without touching the live store
    OperationResult register_live_hook(HookEntry live);

    // Record an on-disk capability as registered but disabled
    OperationResult register_disk_capability(const std::string& id, const std::string& descriptor);

    // Register everything live or on disk that the registries lack.
    // With apply == false only reports what would be registered.
    DiscoveryResult discover(bool apply);

private:
    OperationResult remove_hook(const std::string& id);
    OperationResult remove_capability(const std::string& id);
    OperationResult remove_server(const std::string& id);
    OperationResult remove_instruction(const std::string& id);

    OperationResult set_hook_enabled(const std::string& id, bool enabled);
    OperationResult set_capability_enabled(const std::string& id, bool enabled);
    OperationResult set_server_enabled(const std::string& id, bool enabled);
    OperationResult set_instruction_enabled(const std::string& id, bool enabled);

    // True when path is inside the host root or steward's state dir
    bool is_owned_path(const std::string& path) const;

    Config config_;
    std::shared_ptr<spdlog::logger> log_;
};

} // namespace steward
