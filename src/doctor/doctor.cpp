#include "steward/doctor.hpp"
#include "steward/checks.hpp"
#include "steward/logging.hpp"
#include "steward/registrar.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>

namespace steward {

// ============================================================================
// Issues
// ============================================================================

const char* issue_code_to_string(IssueCode code) {
    switch (code) {
        case IssueCode::OrphanedLive: return "orphaned-live";
        case IssueCode::StaleRegistry: return "stale-registry";
        case IssueCode::ScriptMissing: return "script-missing";
        case IssueCode::ScriptUnresolvable: return "script-unresolvable";
        case IssueCode::SyntaxError: return "syntax-error";
        case IssueCode::CheckFailed: return "check-failed";
        case IssueCode::OrphanedRegistry: return "orphaned-registry";
        case IssueCode::OrphanedDisk: return "orphaned-disk";
        case IssueCode::DisabledOnDisk: return "disabled-on-disk";
        case IssueCode::CommandNotFound: return "command-not-found";
        case IssueCode::MissingCommandAndUrl: return "missing-command-and-url";
        case IssueCode::MissingFrontmatter: return "missing-frontmatter";
        case IssueCode::MissingFields: return "missing-fields";
        case IssueCode::DuplicateId: return "duplicate-id";
        case IssueCode::StoreUnreadable: return "store-unreadable";
        default: return "unknown";
    }
}

FixAction fix_action_for(IssueCode code) {
    switch (code) {
        case IssueCode::OrphanedLive:
        case IssueCode::OrphanedDisk:
            return FixAction::Register;
        case IssueCode::StaleRegistry:
        case IssueCode::OrphanedRegistry:
            return FixAction::RemoveRegistry;
        case IssueCode::DisabledOnDisk:
            return FixAction::None;
        default:
            return FixAction::Manual;
    }
}

Issue make_issue(ResourceKind kind, const std::string& item, IssueCode code, const std::string& detail) {
    Issue issue;
    issue.kind = kind;
    issue.item = item;
    issue.code = code;
    issue.detail = detail;

    switch (code) {
        case IssueCode::OrphanedLive:
            issue.problem = "Hook is in live settings but not in the registry";
            issue.fix = "register it (steward doctor --fix)";
            issue.explanation = "Someone added this hook to settings.json by hand. Registering it lets "
                                "steward enable, disable and remove it.";
            break;
        case IssueCode::StaleRegistry:
            issue.problem = "Registered hook points at a script that no longer exists";
            issue.fix = "remove the registry entry (steward doctor --fix)";
            issue.explanation = "The script was moved or deleted. Enabling this hook would push a "
                                "command that fails on every event.";
            break;
        case IssueCode::ScriptMissing:
            issue.problem = "Active hook runs a script that does not exist";
            issue.fix = "restore the script or remove the hook";
            issue.explanation = "The host runs this command on every matching event and it fails "
                                "each time.";
            break;
        case IssueCode::ScriptUnresolvable:
            issue.problem = "No script path could be found in the hook command";
            issue.fix = "check the command by hand";
            issue.explanation = "The command was not verified because steward could not tell which "
                                "file it runs.";
            break;
        case IssueCode::SyntaxError:
            issue.problem = "Hook script has a syntax error";
            issue.fix = "fix the script";
            issue.explanation = "The interpreter rejects the script, so the hook fails whenever it runs.";
            break;
        case IssueCode::CheckFailed:
            issue.problem = "Verification tool could not complete";
            issue.fix = "install the tool or rerun the check";
            issue.explanation = "The checker was missing or timed out. The item itself may be fine.";
            break;
        case IssueCode::OrphanedRegistry:
            issue.problem = "Capability is registered but its files are gone";
            issue.fix = "remove the registry entry (steward doctor --fix)";
            issue.explanation = "The capability directory was deleted or moved. The registry entry "
                                "advertises something the host cannot load.";
            break;
        case IssueCode::OrphanedDisk:
            issue.problem = "Capability exists on disk but is not registered";
            issue.fix = "register it (steward doctor --fix)";
            issue.explanation = "The host can see this capability but steward cannot manage it. It "
                                "is registered disabled.";
            break;
        case IssueCode::DisabledOnDisk:
            issue.problem = "Capability is on disk but disabled";
            issue.fix = "enable it if it should be used";
            issue.explanation = "This may be intentional. Nothing is changed automatically.";
            break;
        case IssueCode::CommandNotFound:
            issue.problem = "Server command is not on PATH";
            issue.fix = "install the command or fix the server entry";
            issue.explanation = "Starting this server would fail before the process is created.";
            break;
        case IssueCode::MissingCommandAndUrl:
            issue.problem = "Server has neither a command nor a url";
            issue.fix = "edit the server entry";
            issue.explanation = "There is no way to reach or start this server.";
            break;
        case IssueCode::MissingFrontmatter:
            issue.problem = "Instruction file has no frontmatter header";
            issue.fix = "add a header with id, name, keywords and enabled";
            issue.explanation = "Without a header the instruction never matches a prompt.";
            break;
        case IssueCode::MissingFields:
            issue.problem = "Instruction header is missing required fields";
            issue.fix = "add the missing fields";
            issue.explanation = "Incomplete headers are treated as if the header were absent.";
            break;
        case IssueCode::DuplicateId:
            issue.problem = "Several instruction files declare the same id";
            issue.fix = "rename one of the files or its id";
            issue.explanation = "Matching cannot tell these instructions apart.";
            break;
        case IssueCode::StoreUnreadable:
            issue.problem = "A backing store could not be read";
            issue.fix = "repair or restore the file";
            issue.explanation = "Nothing of this kind can be verified until the store parses.";
            break;
    }
    return issue;
}

// ============================================================================
// Report
// ============================================================================

size_t DoctorReport::healthy_count() const {
    size_t n = 0;
    for (const auto& k : kinds) n += k.healthy.size();
    return n;
}

size_t DoctorReport::issue_count() const {
    size_t n = 0;
    for (const auto& k : kinds) n += k.issues.size();
    return n;
}

size_t DoctorReport::fixable_count() const {
    size_t n = 0;
    for (const auto& k : kinds) {
        n += static_cast<size_t>(std::count_if(k.issues.begin(), k.issues.end(),
            [](const Issue& i) { return is_auto_fixable(i.code); }));
    }
    return n;
}

size_t DoctorReport::fixed_count() const {
    return static_cast<size_t>(std::count_if(fixes.begin(), fixes.end(),
        [](const FixOutcome& f) { return f.fixed; }));
}

// ============================================================================
// Verification
// ============================================================================

namespace {

// Header id of an instruction: an explicit id that differs from the file
// stem is kept in extra
std::string declared_instruction_id(const InstructionEntry& entry) {
    for (const auto& [key, value] : entry.extra) {
        if (key == "id") return value;
    }
    return entry.id;
}

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

} // namespace

Doctor::Doctor(const Config& config)
    : config_(config), log_(component_logger(config, "doctor")) {}

VerifyResult Doctor::verify(ResourceKind kind) const {
    auto status = Reconciler(config_).status(kind);
    if (status.isErr()) {
        VerifyResult result;
        result.kind = kind;
        result.issues.push_back(make_issue(kind, kind_to_string(kind), IssueCode::StoreUnreadable,
                                           status.error().message()));
        log_->warn("{}: {}", kind_to_string(kind), status.error().message());
        return result;
    }
    return verify_records(kind, status.value().records);
}

VerifyResult Doctor::verify_records(ResourceKind kind, const std::vector<ResourceRecord>& records) const {
    VerifyResult result;
    result.kind = kind;
    result.records = records;

    std::map<std::string, std::vector<std::string>> declared_ids;

    for (const auto& rec : records) {
        size_t before = result.issues.size();
        auto add = [&](IssueCode code, const std::string& detail) {
            result.issues.push_back(make_issue(kind, rec.id, code, detail));
        };

        switch (kind) {
            case ResourceKind::Hook: {
                if (rec.status == Status::OrphanedLive) {
                    add(IssueCode::OrphanedLive, rec.hook ? rec.hook->command : "");
                } else if (rec.status == Status::Registered) {
                    if (!rec.backing_path.empty() && !rec.backing_exists) {
                        add(IssueCode::StaleRegistry, rec.backing_path);
                    }
                    break;
                }

                if (rec.backing_path.empty()) {
                    add(IssueCode::ScriptUnresolvable, rec.hook ? rec.hook->command : "");
                } else if (!rec.backing_exists) {
                    add(IssueCode::ScriptMissing, rec.backing_path);
                } else if (rec.hook) {
                    auto check = check_script_syntax(rec.hook->command, rec.backing_path,
                                                     config_.check_timeout_ms);
                    if (check.outcome == CheckOutcome::Failed) {
                        add(IssueCode::SyntaxError, check.message);
                    } else if (check.outcome == CheckOutcome::ToolFailed) {
                        add(IssueCode::CheckFailed, check.message);
                    }
                }
                break;
            }
            case ResourceKind::Capability:
                if (rec.status == Status::OrphanedRegistry) {
                    add(IssueCode::OrphanedRegistry, rec.backing_path);
                } else if (rec.status == Status::OrphanedDisk) {
                    add(IssueCode::OrphanedDisk, rec.backing_path);
                } else if (rec.status == Status::Registered) {
                    add(IssueCode::DisabledOnDisk, rec.backing_path);
                }
                break;
            case ResourceKind::Server:
                if (!rec.server) break;
                if (rec.server->command.empty() && rec.server->url.empty()) {
                    add(IssueCode::MissingCommandAndUrl, "");
                } else if (rec.server->enabled && !rec.server->command.empty()) {
                    auto check = check_command_available(rec.server->command, config_.path_check_timeout_ms);
                    if (check.outcome == CheckOutcome::Failed) {
                        add(IssueCode::CommandNotFound, rec.server->command);
                    } else if (check.outcome == CheckOutcome::ToolFailed) {
                        add(IssueCode::CheckFailed, check.message);
                    }
                }
                break;
            case ResourceKind::Instruction:
                if (!rec.instruction) break;
                if (!rec.instruction->has_frontmatter) {
                    add(IssueCode::MissingFrontmatter, rec.backing_path);
                } else if (!rec.instruction->missing_fields.empty()) {
                    add(IssueCode::MissingFields, join(rec.instruction->missing_fields, ", "));
                }
                if (rec.instruction->has_frontmatter) {
                    declared_ids[declared_instruction_id(*rec.instruction)].push_back(rec.id);
                }
                break;
        }

        if (result.issues.size() == before) result.healthy.push_back(rec.id);
    }

    for (const auto& [declared, files] : declared_ids) {
        if (files.size() < 2) continue;
        for (const auto& id : files) {
            result.issues.push_back(make_issue(kind, id, IssueCode::DuplicateId,
                                               "id '" + declared + "' also used by " +
                                               std::to_string(files.size() - 1) + " other file(s)"));
            result.healthy.erase(std::remove(result.healthy.begin(), result.healthy.end(), id),
                                 result.healthy.end());
        }
    }

    return result;
}

FixOutcome Doctor::apply_fix(const Issue& issue, const std::vector<ResourceRecord>& records) {
    FixOutcome outcome;
    outcome.issue = issue;

    FixAction action = fix_action_for(issue.code);
    if (action != FixAction::Register && action != FixAction::RemoveRegistry) {
        outcome.message = "not auto-fixable";
        return outcome;
    }

    auto rec = std::find_if(records.begin(), records.end(), [&](const ResourceRecord& r) {
        return r.kind == issue.kind && r.id == issue.item;
    });
    if (rec == records.end()) {
        outcome.message = "item no longer present";
        return outcome;
    }

    outcome.attempted = true;
    Registrar registrar(config_);
    OperationResult r;
    if (action == FixAction::RemoveRegistry) {
        r = registrar.remove(issue.kind, issue.item);
    } else if (issue.kind == ResourceKind::Hook && rec->hook) {
        r = registrar.register_live_hook(*rec->hook);
    } else if (issue.kind == ResourceKind::Capability) {
        r = registrar.register_disk_capability(rec->id, rec->backing_path);
    } else {
        outcome.attempted = false;
        outcome.message = "no automatic fix for this kind";
        return outcome;
    }

    outcome.fixed = r.ok;
    outcome.message = r.message;
    if (r.ok) {
        log_->info("fixed {} {} ({})", kind_to_string(issue.kind), issue.item, issue_code_to_string(issue.code));
    } else {
        log_->warn("could not fix {} {}: {}", kind_to_string(issue.kind), issue.item, r.message);
    }
    return outcome;
}

DoctorReport Doctor::run(bool fix) {
    DoctorReport report;
    report.fix_mode = fix;

    std::vector<ResourceRecord> all_records;
    for (ResourceKind kind : all_resource_kinds()) {
        VerifyResult v = verify(kind);
        if (fix) {
            for (const auto& issue : v.issues) {
                if (!is_auto_fixable(issue.code)) continue;
                report.fixes.push_back(apply_fix(issue, v.records));
            }
        }
        all_records.insert(all_records.end(), v.records.begin(), v.records.end());
        report.kinds.push_back(std::move(v));
    }

    report.duplicates = find_duplicates(all_records);
    log_->info("doctor: {} healthy, {} issue(s), {} fixed",
               report.healthy_count(), report.issue_count(), report.fixed_count());
    return report;
}

} // namespace steward
