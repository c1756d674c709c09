/**
 * steward CLI - status command
 *
 * One line per kind: registered, healthy and needing attention.
 */

#include "../common.hpp"

#include <steward/reconciler.hpp>

#include <CLI/CLI.hpp>

#include <iomanip>

namespace steward::cli::commands {

namespace {

struct StatusOptions {
    bool verbose = false;
};

int cmd_status(const GlobalOptions& opts, const StatusOptions& status_opts) {
    auto config = make_config(opts);
    if (!config) return 1;

    Reconciler reconciler(*config);
    std::vector<KindStatus> kinds;
    for (ResourceKind kind : all_resource_kinds()) {
        auto status = reconciler.status(kind);
        if (status.isErr()) {
            print_error(std::string(kind_display_name(kind)) + ": " + status.error().message(), opts.json);
            return 1;
        }
        kinds.push_back(status.value());
    }

    if (opts.json) {
        nlohmann::json j;
        for (const auto& k : kinds) {
            nlohmann::json entry;
            entry["total"] = k.summary.total;
            entry["consistent"] = k.summary.consistent();
            entry["needs_attention"] = k.summary.needs_attention();
            nlohmann::json counts = nlohmann::json::object();
            for (const auto& [status, n] : k.summary.counts) counts[status_to_string(status)] = n;
            entry["counts"] = counts;
            if (status_opts.verbose) {
                entry["items"] = nlohmann::json::array();
                for (const auto& r : k.records) entry["items"].push_back(record_to_json(r));
            }
            j[kind_to_string(k.kind)] = entry;
        }
        output_json(j);
        return 0;
    }

    std::cout << "steward status  (" << config->paths.host_root << ")" << std::endl << std::endl;
    for (const auto& k : kinds) {
        std::cout << "  " << std::left << std::setw(14) << kind_display_name(k.kind)
                  << std::right << std::setw(4) << k.summary.total << " registered  "
                  << std::setw(4) << k.summary.consistent() << " healthy  "
                  << std::setw(4) << k.summary.needs_attention() << " issues" << std::endl;
    }

    if (status_opts.verbose) {
        for (const auto& k : kinds) {
            if (k.records.empty()) continue;
            std::cout << std::endl << kind_display_name(k.kind) << ":" << std::endl;
            std::vector<std::vector<std::string>> rows;
            for (const auto& r : k.records) {
                rows.push_back({r.id, status_to_string(r.status), r.summary()});
            }
            print_table({"ID", "STATUS", "DETAILS"}, rows, "  ");
        }
    }

    size_t attention = 0;
    for (const auto& k : kinds) attention += k.summary.needs_attention();
    if (attention > 0) {
        std::cout << std::endl << "Run 'steward doctor' for details." << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_status(CLI::App* app, GlobalOptions& opts) {
    static StatusOptions status_opts;

    app->add_flag("--verbose", status_opts.verbose, "Show every item");
    app->callback([&opts]() {
        std::exit(cmd_status(opts, status_opts));
    });
}

} // namespace steward::cli::commands
