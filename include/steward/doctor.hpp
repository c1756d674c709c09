#pragma once

#include "steward/config.hpp"
#include "steward/duplicates.hpp"
#include "steward/reconciler.hpp"
#include "steward/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace spdlog {
class logger;
}

namespace steward {

// ============================================================================
// Issues
// ============================================================================

enum class IssueCode {
    OrphanedLive,          // hook live but unregistered
    StaleRegistry,         // registered hook whose script is gone
    ScriptMissing,         // active hook whose script is gone
    ScriptUnresolvable,    // no script path in the command
    SyntaxError,
    CheckFailed,           // a check tool was missing or timed out
    OrphanedRegistry,      // capability registered, nothing on disk
    OrphanedDisk,          // capability on disk, unregistered
    DisabledOnDisk,
    CommandNotFound,
    MissingCommandAndUrl,
    MissingFrontmatter,
    MissingFields,
    DuplicateId,
    StoreUnreadable
};

const char* issue_code_to_string(IssueCode code);

enum class FixAction {
    None,           // informational, state may be intentional
    Manual,         // needs a person
    Register,       // add the registry entry from live/disk
    RemoveRegistry  // drop the registry entry
};

FixAction fix_action_for(IssueCode code);

inline bool is_auto_fixable(IssueCode code) {
    FixAction a = fix_action_for(code);
    return a == FixAction::Register || a == FixAction::RemoveRegistry;
}

/**
 * One problem found by verification. `problem`, `fix` and `explanation`
 * are generated from `code` by make_issue.
 */
struct Issue {
    ResourceKind kind = ResourceKind::Hook;
    std::string item;
    IssueCode code = IssueCode::StoreUnreadable;
    std::string detail;
    std::string problem;
    std::string fix;
    std::string explanation;
};

Issue make_issue(ResourceKind kind, const std::string& item, IssueCode code, const std::string& detail = "");

// ============================================================================
// Verification
// ============================================================================

struct VerifyResult {
    ResourceKind kind = ResourceKind::Hook;
    std::vector<std::string> healthy;
    std::vector<Issue> issues;
    std::vector<ResourceRecord> records;
};

struct FixOutcome {
    Issue issue;
    bool attempted = false;
    bool fixed = false;
    std::string message;
};

struct DoctorReport {
    std::vector<VerifyResult> kinds;
    std::vector<FixOutcome> fixes;
    std::vector<DuplicateFinding> duplicates;
    bool fix_mode = false;

    size_t healthy_count() const;
    size_t issue_count() const;
    size_t fixable_count() const;
    size_t fixed_count() const;
};

/**
 * Verifies every resource kind and repairs what can be repaired.
 *
 * Only the live-to-registry direction is ever repaired automatically: a
 * registered hook missing from the live store is left alone.
 */
class Doctor {
public:
    explicit Doctor(const Config& config);

    VerifyResult verify(ResourceKind kind) const;

    // Classify records of one kind; used by verify and directly by tests
    VerifyResult verify_records(ResourceKind kind, const std::vector<ResourceRecord>& records) const;

    FixOutcome apply_fix(const Issue& issue, const std::vector<ResourceRecord>& records);

    DoctorReport run(bool fix);

private:
    Config config_;
    std::shared_ptr<spdlog::logger> log_;
};

} // namespace steward
