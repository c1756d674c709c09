#pragma once

#include "steward/result.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace spdlog {
class logger;
}

namespace steward {

// ============================================================================
// Paths
// ============================================================================

/**
 * Every file and directory steward reads or writes.
 *
 * Host paths belong to the host application (its settings document and the
 * directories it scans). State paths belong to steward.
 */
struct Paths {
    // Host application
    std::string host_root;
    std::string settings_file;       // live store for hooks
    std::string hooks_dir;
    std::string capabilities_dir;    // <id>/SKILL.md

    // steward state
    std::string state_dir;
    std::string registries_dir;
    std::string hook_registry;
    std::string capability_registry;
    std::string servers_file;
    std::string instructions_dir;
    std::string process_table;
    std::string archive_dir;
    std::string logs_dir;
    std::string reports_dir;
    std::string config_file;
};

Paths make_paths(const std::string& host_root, const std::string& state_dir);

// ============================================================================
// Config
// ============================================================================

struct Config {
    Paths paths;

    // Supervisor
    int start_grace_ms = 1000;
    int stop_grace_ms = 3000;
    int kill_wait_ms = 1000;

    // External checks
    int check_timeout_ms = 10000;
    int path_check_timeout_ms = 5000;

    // Logging
    size_t log_max_bytes = 1024 * 1024;
    size_t log_max_files = 3;

    // Set by init_logging; components fall back to a null logger
    std::shared_ptr<spdlog::logger> logger;
};

/**
 * Resolve the host root.
 * Priority: explicit override > STEWARD_HOST_ROOT env > ~/.claude
 */
std::string resolve_host_root(const std::optional<std::string>& override_root);

/**
 * Resolve the state directory.
 * Priority: explicit override > STEWARD_STATE_DIR env > <host_root>/steward
 */
std::string resolve_state_dir(const std::optional<std::string>& override_dir,
                              const std::string& host_root);

struct ConfigLoadResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> warnings;
    Config config;
};

/**
 * Build a Config for the given roots, then apply tunables from
 * <state_dir>/config.json when present. A missing file is not an error;
 * unknown keys are reported as warnings.
 */
ConfigLoadResult load_config(const std::string& host_root, const std::string& state_dir);

// Parse the tunables document into config (used by load_config)
ConfigLoadResult apply_config_json(const std::string& json_str, Config config);

// Create the state directory tree
Result<void> ensure_directories(const Config& config);

} // namespace steward
