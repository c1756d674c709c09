/**
 * steward CLI - duplicates command
 */

#include "../common.hpp"

#include <steward/duplicates.hpp>
#include <steward/reconciler.hpp>

#include <CLI/CLI.hpp>

namespace steward::cli::commands {

namespace {

struct DuplicatesOptions {
    bool verbose = false;
    std::vector<std::string> compare;
};

void print_side(const std::string& path, const ActivityStats& a, const OrganizationScore& org,
                std::chrono::system_clock::time_point now) {
    std::cout << path << std::endl;
    std::cout << "  files: " << a.total_files << ", modified this week/month/year: "
              << a.modified_last_week << "/" << a.modified_last_month << "/" << a.modified_last_year
              << std::endl;
    if (auto days = a.age_days(now)) {
        std::cout << "  last modified " << *days << " day(s) ago (" << a.last_modified_file << ")" << std::endl;
    }
    std::cout << "  organization: " << org.score << "/100" << std::endl;
    for (const auto& r : org.reasons) std::cout << "    - " << r << std::endl;
}

int cmd_compare(const GlobalOptions& opts, const std::string& first, const std::string& second) {
    auto now = std::chrono::system_clock::now();
    auto cmp = compare_projects(first, second, now);

    if (opts.json) {
        nlohmann::json j = comparison_to_json(cmp, now);
        output_json(j);
        return 0;
    }

    print_side(cmp.first_path, cmp.first_activity, cmp.first_org, now);
    std::cout << std::endl;
    print_side(cmp.second_path, cmp.second_activity, cmp.second_org, now);
    std::cout << std::endl;
    if (cmp.recommended.empty()) {
        std::cout << "No clear winner; manual review needed." << std::endl;
    } else {
        std::cout << "Keep: " << cmp.recommended << std::endl;
    }
    for (const auto& r : cmp.reasons) std::cout << "  - " << r << std::endl;
    return 0;
}

int cmd_duplicates(const GlobalOptions& opts, const DuplicatesOptions& dup_opts) {
    if (!dup_opts.compare.empty()) {
        init_warning_collector(opts.json, opts.quiet);
        return cmd_compare(opts, dup_opts.compare[0], dup_opts.compare[1]);
    }

    auto config = make_config(opts);
    if (!config) return 1;

    Reconciler reconciler(*config);
    std::vector<ResourceRecord> records;
    for (ResourceKind kind : {ResourceKind::Capability, ResourceKind::Instruction}) {
        auto status = reconciler.status(kind);
        if (status.isErr()) {
            print_error(status.error().message(), opts.json);
            return 1;
        }
        records.insert(records.end(), status.value().records.begin(), status.value().records.end());
    }

    auto findings = find_duplicates(records);
    auto now = std::chrono::system_clock::now();

    if (opts.json) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& d : findings) {
            j.push_back(duplicate_to_json(d, now));
        }
        output_json(j);
        return 0;
    }

    if (findings.empty()) {
        std::cout << "No duplicates found." << std::endl;
        return 0;
    }

    for (const auto& d : findings) {
        std::cout << kind_to_string(d.kind) << ": " << d.first << " <-> " << d.second << "  ("
                  << duplicate_type_to_string(d.type) << ", " << d.reason << ")" << std::endl;
        if (dup_opts.verbose) {
            if (!d.shared_keywords.empty()) {
                std::cout << "    shared:";
                for (const auto& k : d.shared_keywords) std::cout << " " << k;
                std::cout << std::endl;
            }
            std::cout << "    " << d.first_path << std::endl;
            std::cout << "    " << d.second_path << std::endl;
        }
        print_pair_recommendation(d, now, "    ");
    }
    std::cout << std::endl << findings.size() << " possible duplicate pair(s). Recommendations are "
              << "advisory; nothing is removed." << std::endl;
    return 0;
}

} // anonymous namespace

void setup_duplicates(CLI::App* app, GlobalOptions& opts) {
    static DuplicatesOptions dup_opts;

    app->add_flag("--verbose", dup_opts.verbose, "Show shared keywords and paths");
    app->add_option("--compare", dup_opts.compare, "Compare two directories")->expected(2);
    app->callback([&opts]() {
        std::exit(cmd_duplicates(opts, dup_opts));
    });
}

} // namespace steward::cli::commands
