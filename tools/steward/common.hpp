/**
 * steward CLI - Common utilities and types
 */

#pragma once

#include <steward/config.hpp>
#include <steward/doctor.hpp>
#include <steward/logging.hpp>
#include <steward/types.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace CLI {
class App;
}

namespace steward::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string root;              // --root
    std::string state;             // --state
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static thread_local WarningCollector collector;
    return collector;
}

inline void init_warning_collector(bool json_mode, bool quiet) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_warning(const std::string& msg) {
    get_warning_collector().add(msg);
}

inline void print_success(const std::string& msg, const GlobalOptions& opts) {
    if (!opts.json && !opts.quiet) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && j.is_object() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

/**
 * Resolve roots, load config.json, create the state tree and start
 * logging. Prints the error and returns nullopt on failure.
 */
inline std::optional<Config> make_config(const GlobalOptions& opts) {
    init_warning_collector(opts.json, opts.quiet);

    std::string host_root = resolve_host_root(
        opts.root.empty() ? std::nullopt : std::make_optional(opts.root));
    std::string state_dir = resolve_state_dir(
        opts.state.empty() ? std::nullopt : std::make_optional(opts.state), host_root);

    auto loaded = load_config(host_root, state_dir);
    for (const auto& w : loaded.warnings) {
        print_warning(w);
    }
    if (!loaded.ok) {
        print_error(loaded.error, opts.json);
        return std::nullopt;
    }

    auto dirs = ensure_directories(loaded.config);
    if (dirs.isErr()) {
        print_error(dirs.error().message(), opts.json);
        return std::nullopt;
    }

    if (!init_logging(loaded.config, opts.verbose)) {
        print_warning("logging disabled: cannot open " + loaded.config.paths.logs_dir);
    }
    return loaded.config;
}

/**
 * Print an OperationResult and map it to an exit code.
 */
inline int report_operation(const OperationResult& r, const GlobalOptions& opts) {
    if (!r.warning.empty()) {
        print_warning(r.warning);
    }
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = r.ok;
        j["message"] = r.message;
        if (!r.ok) j["code"] = error_code_to_string(r.code);
        if (!r.archived_path.empty()) j["archived_path"] = r.archived_path;
        output_json(j);
    } else if (r.ok) {
        // The warning was already printed on its own line
        std::string msg = r.message;
        if (!r.warning.empty()) {
            auto pos = msg.rfind(" [WARNING: ");
            if (pos != std::string::npos) msg.erase(pos);
        }
        print_success(msg, opts);
    } else {
        print_error(r.message, false);
    }
    return r.ok ? 0 : 1;
}

// ============================================================================
// JSON views
// ============================================================================

inline nlohmann::json record_to_json(const ResourceRecord& r) {
    nlohmann::json j;
    j["kind"] = kind_to_string(r.kind);
    j["id"] = r.id;
    j["status"] = status_to_string(r.status);
    j["enabled"] = r.enabled;
    j["in_live"] = r.in_live;
    j["in_registry"] = r.in_registry;
    if (!r.backing_path.empty()) {
        j["path"] = r.backing_path;
        j["path_exists"] = r.backing_exists;
    }
    j["summary"] = r.summary();
    return j;
}

inline nlohmann::json issue_to_json(const Issue& issue) {
    nlohmann::json j;
    j["kind"] = kind_to_string(issue.kind);
    j["item"] = issue.item;
    j["code"] = issue_code_to_string(issue.code);
    j["problem"] = issue.problem;
    j["fix"] = issue.fix;
    j["explanation"] = issue.explanation;
    j["auto_fixable"] = is_auto_fixable(issue.code);
    if (!issue.detail.empty()) j["detail"] = issue.detail;
    return j;
}

inline nlohmann::json activity_to_json(const ActivityStats& a, std::chrono::system_clock::time_point now) {
    nlohmann::json j;
    j["total_files"] = a.total_files;
    j["modified_last_week"] = a.modified_last_week;
    j["modified_last_month"] = a.modified_last_month;
    j["modified_last_year"] = a.modified_last_year;
    if (auto days = a.age_days(now)) {
        j["days_since_modified"] = *days;
        j["last_modified_file"] = a.last_modified_file;
    }
    return j;
}

inline nlohmann::json comparison_to_json(const ProjectComparison& cmp, std::chrono::system_clock::time_point now) {
    nlohmann::json j;
    j["first"] = {{"path", cmp.first_path}, {"activity", activity_to_json(cmp.first_activity, now)},
                  {"organization", cmp.first_org.score}, {"reasons", cmp.first_org.reasons}};
    j["second"] = {{"path", cmp.second_path}, {"activity", activity_to_json(cmp.second_activity, now)},
                   {"organization", cmp.second_org.score}, {"reasons", cmp.second_org.reasons}};
    j["recommended"] = cmp.recommended.empty() ? nlohmann::json(nullptr) : nlohmann::json(cmp.recommended);
    j["reasons"] = cmp.reasons;
    j["advisory"] = true;
    return j;
}

inline nlohmann::json duplicate_to_json(const DuplicateFinding& d, std::chrono::system_clock::time_point now) {
    nlohmann::json j = {{"kind", kind_to_string(d.kind)}, {"type", duplicate_type_to_string(d.type)},
                        {"first", d.first}, {"second", d.second},
                        {"first_path", d.first_path}, {"second_path", d.second_path},
                        {"shared_keywords", d.shared_keywords}, {"reason", d.reason}};
    if (auto cmp = compare_duplicate_pair(d, now)) {
        j["comparison"] = comparison_to_json(*cmp, now);
    }
    return j;
}

// One or two indented lines with the advisory keep recommendation
inline void print_pair_recommendation(const DuplicateFinding& d, std::chrono::system_clock::time_point now,
                                      const std::string& indent) {
    auto cmp = compare_duplicate_pair(d, now);
    if (!cmp) return;
    if (cmp->recommended.empty()) {
        std::cout << indent << "advisory: no clear winner, review by hand" << std::endl;
        return;
    }
    std::cout << indent << "advisory: keep " << cmp->recommended;
    if (!cmp->reasons.empty()) std::cout << " (" << cmp->reasons[0] << ")";
    std::cout << std::endl;
}

// ============================================================================
// Text tables
// ============================================================================

/**
 * Left-aligned columns, two spaces apart, header underlined.
 */
inline void print_table(const std::vector<std::string>& headers,
                        const std::vector<std::vector<std::string>>& rows,
                        const std::string& indent = "") {
    std::vector<size_t> widths(headers.size(), 0);
    for (size_t i = 0; i < headers.size(); ++i) widths[i] = headers[i].size();
    for (const auto& row : rows) {
        for (size_t i = 0; i < row.size() && i < widths.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }

    auto print_row = [&](const std::vector<std::string>& row) {
        std::string line = indent;
        for (size_t i = 0; i < widths.size(); ++i) {
            std::string value = i < row.size() ? row[i] : "";
            line += value;
            if (i + 1 < widths.size()) line += std::string(widths[i] - value.size() + 2, ' ');
        }
        while (!line.empty() && line.back() == ' ') line.pop_back();
        std::cout << line << std::endl;
    };

    print_row(headers);
    std::vector<std::string> rule;
    for (size_t w : widths) rule.push_back(std::string(w, '-'));
    print_row(rule);
    for (const auto& row : rows) print_row(row);
}

inline void print_issue(const Issue& issue) {
    std::cout << "  [" << issue_code_to_string(issue.code) << "] " << issue.item
              << ": " << issue.problem << std::endl;
    if (!issue.detail.empty()) {
        std::cout << "      " << issue.detail << std::endl;
    }
    std::cout << "      fix: " << issue.fix << std::endl;
}

namespace commands {

// list / remove / enable / disable / verify, shared by every kind
void setup_resource_commands(CLI::App* app, ResourceKind kind, GlobalOptions& opts);

} // namespace commands

} // namespace steward::cli
