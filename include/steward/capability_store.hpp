#pragma once

#include "steward/config.hpp"
#include "steward/result.hpp"
#include "steward/types.hpp"

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace spdlog {
class logger;
}

namespace steward {

constexpr const char* kCapabilityDescriptor = "SKILL.md";

struct CapabilitySnapshot {
    std::vector<CapabilityEntry> registry;
    // id -> descriptor path, for <capabilities_dir>/<id>/SKILL.md on disk
    std::map<std::string, std::string> on_disk;
    // registry ids whose recorded descriptor path exists
    std::set<std::string> recorded_path_exists;
};

// Keywords given to a capability registered without any
std::vector<std::string> default_capability_keywords(const std::string& id);

/**
 * Adapter for capability directories and capability-registry.json.
 */
class CapabilityStore {
public:
    explicit CapabilityStore(const Config& config);

    // Directories under capabilities_dir that contain a descriptor
    std::map<std::string, std::string> scan_disk() const;

    Result<std::vector<CapabilityEntry>> read_registry() const;
    Result<void> write_registry(const std::vector<CapabilityEntry>& entries) const;

    Result<CapabilitySnapshot> snapshot() const;

    // <capabilities_dir>/<id>/SKILL.md
    std::string descriptor_path(const std::string& id) const;

private:
    Config config_;
    std::shared_ptr<spdlog::logger> log_;
};

} // namespace steward
