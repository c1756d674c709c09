#pragma once

#include <string>

namespace steward {

// ============================================================================
// External Checks
// ============================================================================
//
// Checks shell out to other tools and are bounded by a timeout. A timeout,
// or a tool that cannot be run, is reported as ToolFailed and never aborts
// the caller.

enum class CheckOutcome {
    Passed,
    NotApplicable,   // nothing to check for this command
    Failed,          // the check ran and rejected the input
    ToolFailed       // the check itself could not complete
};

struct CheckResult {
    CheckOutcome outcome = CheckOutcome::NotApplicable;
    std::string message;
};

constexpr size_t kCheckMessageLimit = 200;

/**
 * Syntax-check the script a hook command runs.
 *
 * node scripts are checked with `node --check`, shell scripts with
 * `bash -n`. Other commands are NotApplicable.
 */
CheckResult check_script_syntax(const std::string& command, const std::string& script, int timeout_ms);

// Whether `command` resolves through the shell's command lookup
CheckResult check_command_available(const std::string& command, int timeout_ms);

} // namespace steward
