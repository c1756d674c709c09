/**
 * steward CLI - doctor command
 *
 * Verify every kind, optionally repair what can be repaired, and list
 * likely duplicates.
 */

#include "../common.hpp"

#include <steward/doctor.hpp>

#include <CLI/CLI.hpp>

namespace steward::cli::commands {

namespace {

struct DoctorOptions {
    bool fix = false;
};

int cmd_doctor(const GlobalOptions& opts, const DoctorOptions& doctor_opts) {
    auto config = make_config(opts);
    if (!config) return 1;

    auto report = Doctor(*config).run(doctor_opts.fix);
    auto now = std::chrono::system_clock::now();

    // Issues left once fixes have been applied
    size_t unresolved = 0;
    for (const auto& k : report.kinds) {
        for (const auto& issue : k.issues) {
            if (fix_action_for(issue.code) == FixAction::None) continue;
            bool fixed = std::any_of(report.fixes.begin(), report.fixes.end(), [&](const FixOutcome& f) {
                return f.fixed && f.issue.kind == issue.kind && f.issue.item == issue.item &&
                       f.issue.code == issue.code;
            });
            if (!fixed) ++unresolved;
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["healthy"] = report.healthy_count();
        j["issues"] = nlohmann::json::array();
        for (const auto& k : report.kinds) {
            for (const auto& issue : k.issues) j["issues"].push_back(issue_to_json(issue));
        }
        j["fix_mode"] = report.fix_mode;
        j["fixes"] = nlohmann::json::array();
        for (const auto& f : report.fixes) {
            j["fixes"].push_back({{"kind", kind_to_string(f.issue.kind)}, {"item", f.issue.item},
                                  {"code", issue_code_to_string(f.issue.code)},
                                  {"fixed", f.fixed}, {"message", f.message}});
        }
        j["duplicates"] = nlohmann::json::array();
        for (const auto& d : report.duplicates) {
            j["duplicates"].push_back(duplicate_to_json(d, now));
        }
        j["unresolved"] = unresolved;
        output_json(j);
        return unresolved == 0 ? 0 : 1;
    }

    for (const auto& k : report.kinds) {
        std::cout << kind_display_name(k.kind) << ": " << k.healthy.size() << " healthy, "
                  << k.issues.size() << " issue(s)" << std::endl;
        for (const auto& issue : k.issues) print_issue(issue);
    }

    if (!report.duplicates.empty()) {
        std::cout << std::endl << "Possible duplicates:" << std::endl;
        for (const auto& d : report.duplicates) {
            std::cout << "  " << kind_to_string(d.kind) << " " << d.first << " <-> " << d.second
                      << " (" << duplicate_type_to_string(d.type) << ")" << std::endl;
            print_pair_recommendation(d, now, "    ");
        }
    }

    std::cout << std::endl;
    if (report.fix_mode) {
        for (const auto& f : report.fixes) {
            std::cout << (f.fixed ? "  fixed   " : "  failed  ") << kind_to_string(f.issue.kind) << " "
                      << f.issue.item << ": " << f.message << std::endl;
        }
        std::cout << report.fixed_count() << " of " << report.fixable_count() << " fixable issue(s) fixed"
                  << std::endl;
    } else if (report.fixable_count() > 0) {
        std::cout << report.fixable_count() << " issue(s) can be fixed with 'steward doctor --fix'"
                  << std::endl;
    } else if (report.issue_count() == 0) {
        std::cout << "All resources healthy." << std::endl;
    }

    return unresolved == 0 ? 0 : 1;
}

} // anonymous namespace

void setup_doctor(CLI::App* app, GlobalOptions& opts) {
    static DoctorOptions doctor_opts;

    app->add_flag("--fix", doctor_opts.fix, "Register orphans and drop stale registry entries");
    app->callback([&opts]() {
        std::exit(cmd_doctor(opts, doctor_opts));
    });
}

} // namespace steward::cli::commands
