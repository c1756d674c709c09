#pragma once

#include "steward/config.hpp"
#include "steward/result.hpp"
#include "steward/server_store.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace spdlog {
class logger;
}

namespace steward {

// ============================================================================
// Process Tracking
// ============================================================================

/**
 * One server steward believes is running. Persisted in the process table
 * `{ name: {pid, startedAt} }` so later invocations can find it.
 */
struct ServerProcessRecord {
    std::string name;
    int pid = -1;
    std::string started_at;
};

// Lifecycle of a server within one supervisor call. Nothing but the
// process table survives between invocations; a tracked pid that is no
// longer alive reads as Stopped.
enum class ProcessState {
    Stopped,
    Starting,
    Running,
    Stopping
};

inline const char* process_state_to_string(ProcessState s) {
    switch (s) {
        case ProcessState::Stopped: return "stopped";
        case ProcessState::Starting: return "starting";
        case ProcessState::Running: return "running";
        case ProcessState::Stopping: return "stopping";
        default: return "unknown";
    }
}

Result<std::map<std::string, ServerProcessRecord>> read_process_table(const std::string& path);
Result<void> write_process_table(const std::string& path,
                                 const std::map<std::string, ServerProcessRecord>& table);

// ============================================================================
// Supervisor
// ============================================================================

struct ReloadResult {
    std::vector<std::string> stopped;
    std::vector<std::string> started;
    std::vector<std::string> failures;   // "<name>: <message>"

    bool ok() const { return failures.empty(); }
};

/**
 * Start, stop and reload Server resources as detached subprocesses.
 */
class ProcessSupervisor {
public:
    explicit ProcessSupervisor(const Config& config);

    // Idempotent: a tracked live pid counts as success without spawning
    OperationResult start(const std::string& name);

    // SIGTERM, then SIGKILL after stop_grace_ms
    OperationResult stop(const std::string& name);

    // Stop everything tracked, then start enabled auto_start servers
    ReloadResult reload();

    // Tracked records with live pids; stale entries are dropped
    Result<std::vector<ServerProcessRecord>> running();

    ProcessState state(const std::string& name) const;

private:
    Result<std::map<std::string, ServerProcessRecord>> load_table() const;
    Result<void> save_table(const std::map<std::string, ServerProcessRecord>& table) const;

    Config config_;
    ServerStore servers_;
    std::shared_ptr<spdlog::logger> log_;
};

} // namespace steward
