#pragma once

#include "steward/result.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace steward {

// ============================================================================
// Bounded Commands
// ============================================================================

struct CommandResult {
    bool ok = false;           // process ran to completion (any exit code)
    bool timed_out = false;
    int exit_code = -1;
    std::string output;        // stdout and stderr interleaved
    std::string error;         // why the command could not run
};

/**
 * Run argv[0] (looked up on PATH) and wait at most timeout_ms.
 *
 * On timeout the child is killed with SIGKILL and reaped before returning.
 */
CommandResult run_command(const std::vector<std::string>& argv, int timeout_ms);

// ============================================================================
// Executable Lookup
// ============================================================================

// Resolve a command the way execvp would: names containing '/' are used as
// given, anything else is searched in the colon-separated path_var.
std::optional<std::string> find_executable(const std::string& name, const std::string& path_var);

// ============================================================================
// Detached Processes
// ============================================================================

struct SpawnResult {
    bool ok = false;
    int pid = -1;
    std::string error;
};

/**
 * Spawn a long-lived process in its own session.
 *
 * stdin is a pipe whose write end the child also holds, so the child never
 * sees EOF on stdin once steward exits; stdout and stderr go to /dev/null.
 * The environment is the current environment overlaid with env.
 */
SpawnResult spawn_detached(const std::string& binary,
                           const std::vector<std::string>& args,
                           const std::map<std::string, std::string>& env);

// Exit code of a finished child (128+signal for signals), reaping it.
// nullopt while it runs or when pid is not our child.
std::optional<int> try_reap(int pid);

// True when pid names a process that has not exited. Reaps our own
// zombies first so a dead child is not reported alive.
bool process_alive(int pid);

// Signal pid, or its whole process group when pid leads one
Result<void> send_signal(int pid, int sig, bool whole_group = false);

// Poll until pid is gone or timeout_ms elapses; true if it exited
bool wait_for_exit(int pid, int timeout_ms);

} // namespace steward
