/**
 * steward CLI - discover command
 *
 * Register live hooks and on-disk capabilities the registries lack.
 */

#include "../common.hpp"

#include <steward/registrar.hpp>

#include <CLI/CLI.hpp>

namespace steward::cli::commands {

namespace {

struct DiscoverOptions {
    bool dry_run = false;
};

int cmd_discover(const GlobalOptions& opts, const DiscoverOptions& discover_opts) {
    auto config = make_config(opts);
    if (!config) return 1;

    auto result = Registrar(*config).discover(!discover_opts.dry_run);
    for (const auto& e : result.errors) print_warning(e);

    if (opts.json) {
        nlohmann::json j;
        j["applied"] = result.applied;
        j["items"] = nlohmann::json::array();
        for (const auto& item : result.items) {
            nlohmann::json i = {{"kind", kind_to_string(item.kind)}, {"id", item.id},
                                {"detail", item.detail}, {"registered", item.registered}};
            if (!item.error.empty()) i["error"] = item.error;
            j["items"].push_back(i);
        }
        j["registered"] = result.registered_count();
        output_json(j);
    } else if (result.items.empty()) {
        std::cout << "Nothing to discover." << std::endl;
    } else {
        for (const auto& item : result.items) {
            std::string mark = !result.applied ? "would register" : item.registered ? "registered" : "failed";
            std::cout << "  " << mark << "  " << kind_to_string(item.kind) << " " << item.id
                      << "  " << item.detail << std::endl;
            if (!item.error.empty()) std::cout << "      " << item.error << std::endl;
        }
        if (result.applied) {
            std::cout << result.registered_count() << " of " << result.items.size()
                      << " item(s) registered" << std::endl;
        }
    }

    bool failed = !result.errors.empty() ||
                  (result.applied && result.registered_count() != result.items.size());
    return failed ? 1 : 0;
}

} // anonymous namespace

void setup_discover(CLI::App* app, GlobalOptions& opts) {
    static DiscoverOptions discover_opts;

    app->add_flag("--dry-run", discover_opts.dry_run, "Report without registering");
    app->callback([&opts]() {
        std::exit(cmd_discover(opts, discover_opts));
    });
}

} // namespace steward::cli::commands
